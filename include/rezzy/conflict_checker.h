#pragma once

#include <optional>

#include "rezzy/interval.h"
#include "rezzy/types.h"

namespace rezzy {

struct repository;

struct conflict_checker {
  explicit conflict_checker(repository const&);

  // True if an occupying (pending / confirmed / seated) reservation other
  // than `excluding` holds the table during the window on that date.
  bool has_conflict(table_id_t, date_t, interval const&,
                    std::optional<reservation_id_t> excluding =
                        std::nullopt) const;

private:
  repository const& repo_;
};

}  // namespace rezzy
