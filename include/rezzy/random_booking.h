#pragma once

#include <random>
#include <vector>

#include "rezzy/types.h"

namespace rezzy {

struct booking_request {
  customer_id_t customer_;
  int party_size_;
  date_t date_;
  minutes_t start_;
  minutes_t duration_;
};

booking_request generate_random_request(std::mt19937&,
                                        std::vector<customer_id_t> const&,
                                        date_t first_day, unsigned days,
                                        int max_party_size,
                                        minutes_t granularity);

}  // namespace rezzy
