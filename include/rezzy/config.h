#pragma once

#include <optional>
#include <string>

#include "nlohmann/json_fwd.hpp"

#include "rezzy/table.h"
#include "rezzy/types.h"

namespace rezzy {

struct engine_config {
  // Maximum number of shared tables combined to seat one party.
  unsigned max_combination_size_ = 3U;

  // Maximum number of seats left empty by a candidate, unset = unlimited.
  std::optional<int> max_excess_;

  minutes_t default_duration_ = 90;
  minutes_t slot_granularity_ = 15;
  capacity_source capacity_source_ = capacity_source::kMaxCapacity;

  // Confirm reservations right after a successful assignment.
  bool auto_confirm_ = false;
};

void validate(engine_config const&);

engine_config parse_config(nlohmann::json const&);
engine_config load_config(std::string const& path);

}  // namespace rezzy
