#include "rezzy/reservation.h"

#include <ostream>

#include "utl/enumerate.h"

#include "rezzy/clock_time.h"
#include "rezzy/error.h"

namespace rezzy {

void validate(customer const& c) {
  auto const has = [](std::optional<std::string> const& s) {
    return s.has_value() && !s->empty();
  };
  if (!has(c.email_) && !has(c.phone_)) {
    throw validation_error{"either email or phone must be provided"};
  }
}

std::ostream& operator<<(std::ostream& out, reservation const& r) {
  return out << "(#" << r.id_ << ", party=" << r.party_size_ << ", "
             << format_date(r.date_) << " " << r.window() << ", "
             << r.status_ << ")";
}

std::ostream& operator<<(std::ostream& out, assignment_set const& a) {
  out << "#" << a.reservation_id_ << " -> {";
  for (auto const& [i, t] : utl::enumerate(a.tables_)) {
    out << (i == 0U ? "" : ", ") << t;
  }
  return out << "}";
}

}  // namespace rezzy
