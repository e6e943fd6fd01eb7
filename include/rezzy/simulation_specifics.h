#pragma once

#include <cinttypes>

#include "rezzy/types.h"

namespace rezzy {

struct simulation_specifics {
  unsigned requests_ = 1000U;
  unsigned threads_ = 4U;
  double cancel_prob_ = 0.1;
  date_t first_day_{2024, 6, 3};
  unsigned days_ = 7U;
  int max_party_size_ = 8;
  std::uint32_t seed_ = 0U;
};

}  // namespace rezzy
