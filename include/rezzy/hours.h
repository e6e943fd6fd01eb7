#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "rezzy/interval.h"
#include "rezzy/record.h"
#include "rezzy/types.h"

namespace rezzy {

struct operating_window {
  bool operator==(operating_window const&) const = default;

  // open_ <= start <= last_reservation_ and end <= close_
  bool admits(interval const&) const;

  friend std::ostream& operator<<(std::ostream&, operating_window const&);

  minutes_t open_;
  minutes_t close_;
  minutes_t last_reservation_;
};

// Throws validation_error unless open < close and open <= last < close.
void validate(operating_window const&);

struct weekly_hours : public record {
  weekday_t day_of_week_{0U};
  operating_window window_{};
};

struct special_hours : public record {
  date_t date_;
  std::string name_;
  std::string description_;
  bool closed_{false};
  std::optional<operating_window> window_;  // unset iff closed_
};

void validate(weekly_hours const&);
void validate(special_hours const&);

}  // namespace rezzy
