#include "rezzy/hours_resolver.h"

#include "rezzy/clock_time.h"
#include "rezzy/repository.h"

namespace rezzy {

hours_resolver::hours_resolver(repository const& repo) : repo_{repo} {}

std::optional<operating_window> hours_resolver::resolve(date_t const d) const {
  if (auto const special = repo_.get_special_hours(d); special.has_value()) {
    return special->closed_ ? std::nullopt : special->window_;
  }
  if (auto const weekly = repo_.get_weekly_hours(weekday_of(d));
      weekly.has_value()) {
    return weekly->window_;
  }
  return std::nullopt;
}

}  // namespace rezzy
