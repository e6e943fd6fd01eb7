#pragma once

#include <map>
#include <string>
#include <vector>

#include "nlohmann/json_fwd.hpp"

#include "rezzy/types.h"

namespace rezzy {

struct memory_repository;

struct floor_plan_ids {
  std::map<std::string, table_id_t> tables_;  // by table number
  std::vector<customer_id_t> customers_;
};

// Loads tables (with chairs), weekly hours, special hours and customers:
//
//   {
//     "tables": [{"number": "1", "min_capacity": 2, "max_capacity": 4,
//                 "shared": false, "location": "window",
//                 "unassigned_chairs": 0}],
//     "weekly_hours": [{"day_of_week": 0, "open": "17:00",
//                       "close": "22:00", "last_reservation": "21:00"}],
//     "special_hours": [{"date": "2024-12-24", "name": "Christmas Eve",
//                        "closed": true}],
//     "customers": [{"name": "Ada", "email": "ada@example.org"}]
//   }
//
// Throws validation_error on malformed input.
floor_plan_ids load_floor_plan(nlohmann::json const&, memory_repository&);
floor_plan_ids load_floor_plan_file(std::string const& path,
                                    memory_repository&);

}  // namespace rezzy
