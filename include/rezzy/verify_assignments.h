#pragma once

#include <iosfwd>
#include <vector>

#include "rezzy/config.h"
#include "rezzy/types.h"

namespace rezzy {

struct repository;

struct double_booking {
  friend std::ostream& operator<<(std::ostream&, double_booking const&);
  table_id_t table_;
  date_t date_;
  reservation_id_t first_;
  reservation_id_t second_;
};

// Pairs of occupying reservations sharing a table in overlapping windows.
std::vector<double_booking> find_double_bookings(repository const&);

// Occupying reservations whose table set cannot seat the party under the
// configured policy, or that combine non-shared tables.
std::vector<reservation_id_t> find_capacity_violations(repository const&,
                                                       engine_config const&);

}  // namespace rezzy
