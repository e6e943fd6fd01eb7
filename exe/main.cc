#include <iostream>

#include "utl/logging.h"

#include "rezzy/booking_service.h"
#include "rezzy/clock_time.h"
#include "rezzy/config.h"
#include "rezzy/error.h"
#include "rezzy/floor_plan.h"
#include "rezzy/memory_repository.h"
#include "rezzy/simulate_booking_series.h"
#include "rezzy/verify_assignments.h"

using namespace rezzy;

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " FLOOR_PLAN.json [CONFIG.json]\n";
    return 1;
  }

  try {
    auto const config = argc == 3 ? load_config(argv[2]) : engine_config{};

    auto repo = memory_repository{};
    auto const ids = load_floor_plan_file(argv[1], repo);
    if (ids.customers_.empty()) {
      std::cerr << "floor plan contains no customers\n";
      return 1;
    }

    auto service = booking_service{repo, config};

    auto specifics = simulation_specifics{};
    specifics.requests_ = 2000U;
    specifics.threads_ = 8U;
    specifics.cancel_prob_ = 0.15;

    std::cout << "slots on " << format_date(specifics.first_day_)
              << " for 4 guests:";
    for (auto const s : service.check_availability(specifics.first_day_, 4)) {
      std::cout << " " << format_time(s);
    }
    std::cout << "\n";

    auto sim = simulation{service, ids.customers_, specifics};
    auto const result = sim.simulate();
    std::cout << result << "\n";

    auto const double_bookings = find_double_bookings(repo);
    for (auto const& d : double_bookings) {
      std::cout << "DOUBLE BOOKING: " << d << "\n";
    }
    auto const capacity_violations = find_capacity_violations(repo, config);
    for (auto const id : capacity_violations) {
      std::cout << "CAPACITY VIOLATION: reservation " << id << "\n";
    }

    return double_bookings.empty() && capacity_violations.empty() &&
                   result.failed_ == 0U
               ? 0
               : 1;
  } catch (error const& e) {
    uLOG(utl::err) << e.what();
    return 1;
  }
}
