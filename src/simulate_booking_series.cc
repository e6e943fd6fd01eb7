#include "rezzy/simulate_booking_series.h"

#include <exception>
#include <ostream>
#include <random>

#include "boost/asio/post.hpp"
#include "boost/asio/thread_pool.hpp"

#include "utl/logging.h"
#include "utl/timing.h"

#include "rezzy/booking_service.h"
#include "rezzy/error.h"
#include "rezzy/random_booking.h"

namespace rezzy {

std::ostream& operator<<(std::ostream& out, simulation_result const& r) {
  return out << "success=" << r.success_
             << " no_availability=" << r.no_availability_
             << " closed=" << r.closed_ << " rejected=" << r.rejected_
             << " cancelled=" << r.cancelled_ << " failed=" << r.failed_
             << " time=" << r.duration_ms_ << "ms";
}

simulation::simulation(booking_service& service,
                       std::vector<customer_id_t> customers,
                       simulation_specifics const& specifics)
    : service_{service},
      customers_{std::move(customers)},
      specifics_{specifics} {}

simulation_result simulation::simulate() {
  UTL_START_TIMING(simulation);
  {
    auto pool = boost::asio::thread_pool{specifics_.threads_};
    for (auto i = 0U; i != specifics_.requests_; ++i) {
      boost::asio::post(pool, [this, i]() { run_request(i); });
    }
    pool.join();
  }

  auto r = simulation_result{};
  r.success_ = success_;
  r.no_availability_ = no_availability_;
  r.closed_ = closed_;
  r.rejected_ = rejected_;
  r.cancelled_ = cancelled_;
  r.failed_ = failed_;
  r.duration_ms_ = static_cast<std::uint64_t>(UTL_GET_TIMING_MS(simulation));
  return r;
}

void simulation::run_request(unsigned const i) {
  auto rng = std::mt19937{specifics_.seed_ + i};
  auto const req = generate_random_request(
      rng, customers_, specifics_.first_day_, specifics_.days_,
      specifics_.max_party_size_, service_.config().slot_granularity_);

  try {
    auto const booked =
        service_.create_and_assign(req.customer_, req.party_size_, req.date_,
                                   req.start_, req.duration_);
    ++success_;

    if (std::uniform_real_distribution<double>{0.0, 1.0}(rng) <
        specifics_.cancel_prob_) {
      service_.cancel_reservation(booked.reservation_id_);
      ++cancelled_;
    }
  } catch (no_availability_error const&) {
    ++no_availability_;
  } catch (closed_error const&) {
    ++closed_;
  } catch (error const& e) {
    ++rejected_;
    uLOG(utl::warn) << "request " << i << " rejected: " << e.what();
  } catch (std::exception const& e) {
    ++failed_;
    uLOG(utl::err) << "request " << i << " failed: " << e.what();
  }
}

}  // namespace rezzy
