#pragma once

#include <optional>

#include "rezzy/hours.h"
#include "rezzy/types.h"

namespace rezzy {

struct repository;

// Effective operating window of a date. A special_hours entry for the date
// replaces the weekly pattern entirely; a weekday without a pattern is
// closed.
struct hours_resolver {
  explicit hours_resolver(repository const&);

  // std::nullopt -> closed
  std::optional<operating_window> resolve(date_t) const;

private:
  repository const& repo_;
};

}  // namespace rezzy
