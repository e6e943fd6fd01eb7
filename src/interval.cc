#include "rezzy/interval.h"

#include <ostream>

#include "rezzy/clock_time.h"

namespace rezzy {

std::ostream& operator<<(std::ostream& out, interval const& i) {
  return out << "[" << format_time(i.from_) << ", " << format_time(i.to_)
             << ")";
}

bool interval::contains(interval const& o) const {
  return o.from_ >= from_ && o.to_ <= to_;
}

bool interval::contains(minutes_t const m) const {
  return m >= from_ && m < to_;
}

bool interval::overlaps(interval const& o) const {
  // 18:00-19:30 vs 19:30-20:30: 18:00 < 20:30 && 19:30 > 19:30 => false
  // 18:00-19:30 vs 19:00-20:00: 18:00 < 20:00 && 19:30 > 19:00 => true
  return from_ < o.to_ && to_ > o.from_;
}

minutes_t interval::size() const { return to_ - from_; }

}  // namespace rezzy
