#include "rezzy/conflict_checker.h"

#include <algorithm>

#include "rezzy/repository.h"

namespace rezzy {

conflict_checker::conflict_checker(repository const& repo) : repo_{repo} {}

bool conflict_checker::has_conflict(
    table_id_t const table, date_t const date, interval const& window,
    std::optional<reservation_id_t> const excluding) const {
  auto const occupancies = repo_.get_occupancies(table, date);
  return std::any_of(
      begin(occupancies), end(occupancies), [&](occupancy const& o) {
        return o.reservation_id_ != excluding && is_occupying(o.status_) &&
               o.window_.overlaps(window);
      });
}

}  // namespace rezzy
