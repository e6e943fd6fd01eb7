#pragma once

#include <compare>
#include <iosfwd>

#include "rezzy/types.h"

namespace rezzy {

// Half-open [from_, to_) in minutes since midnight.
struct interval {
  auto operator<=>(interval const&) const noexcept = default;
  bool contains(interval const&) const;
  bool contains(minutes_t) const;
  bool overlaps(interval const&) const;
  minutes_t size() const;
  friend std::ostream& operator<<(std::ostream&, interval const&);
  minutes_t from_, to_;
};

}  // namespace rezzy
