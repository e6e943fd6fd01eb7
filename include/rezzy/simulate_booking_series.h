#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <vector>

#include "rezzy/simulation_specifics.h"
#include "rezzy/types.h"

namespace rezzy {

struct booking_service;

struct simulation_result {
  friend std::ostream& operator<<(std::ostream&, simulation_result const&);
  unsigned success_{0U};
  unsigned no_availability_{0U};
  unsigned closed_{0U};
  unsigned rejected_{0U};
  unsigned cancelled_{0U};
  unsigned failed_{0U};  // unexpected exceptions
  std::uint64_t duration_ms_{0U};
};

// Fires random booking requests (and some cancellations) at the service
// from a thread pool.
struct simulation {
  simulation(booking_service&, std::vector<customer_id_t>,
             simulation_specifics const&);

  simulation_result simulate();

private:
  void run_request(unsigned i);

  booking_service& service_;
  std::vector<customer_id_t> customers_;
  simulation_specifics specifics_;

  std::atomic<unsigned> success_{0U};
  std::atomic<unsigned> no_availability_{0U};
  std::atomic<unsigned> closed_{0U};
  std::atomic<unsigned> rejected_{0U};
  std::atomic<unsigned> cancelled_{0U};
  std::atomic<unsigned> failed_{0U};
};

}  // namespace rezzy
