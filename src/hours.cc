#include "rezzy/hours.h"

#include <ostream>

#include "fmt/format.h"

#include "rezzy/clock_time.h"
#include "rezzy/error.h"

namespace rezzy {

bool operating_window::admits(interval const& i) const {
  return i.from_ >= open_ && i.from_ <= last_reservation_ && i.to_ <= close_;
}

std::ostream& operator<<(std::ostream& out, operating_window const& w) {
  return out << format_time(w.open_) << "-" << format_time(w.close_)
             << " (last " << format_time(w.last_reservation_) << ")";
}

void validate(operating_window const& w) {
  if (w.open_ < 0 || w.close_ > kMinutesPerDay) {
    throw validation_error{"operating hours must lie within one day"};
  }
  if (w.close_ <= w.open_) {
    throw validation_error{fmt::format("close {} must be after open {}",
                                       format_time(w.close_),
                                       format_time(w.open_))};
  }
  if (w.last_reservation_ < w.open_ || w.last_reservation_ >= w.close_) {
    throw validation_error{fmt::format(
        "last reservation {} must lie in [{}, {})",
        format_time(w.last_reservation_), format_time(w.open_),
        format_time(w.close_))};
  }
}

void validate(weekly_hours const& h) {
  if (h.day_of_week_ > 6U) {
    throw validation_error{fmt::format(
        "day_of_week must be between 0 and 6, got {}",
        static_cast<int>(h.day_of_week_))};
  }
  validate(h.window_);
}

void validate(special_hours const& h) {
  if (h.date_.is_special()) {
    throw validation_error{"special hours need a valid date"};
  }
  if (h.name_.empty()) {
    throw validation_error{"special hours need a name"};
  }
  if (h.closed_) {
    return;
  }
  if (!h.window_.has_value()) {
    throw validation_error{fmt::format(
        "special hours \"{}\" are open but carry no times", h.name_)};
  }
  validate(*h.window_);
}

}  // namespace rezzy
