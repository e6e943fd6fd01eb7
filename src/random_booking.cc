#include "rezzy/random_booking.h"

#include <array>

#include "utl/verify.h"

namespace rezzy {

namespace {

// Requests are spread over lunch and dinner, some fall outside the opening
// hours on purpose.
constexpr auto const kEarliestStart = minutes_t{11 * 60};
constexpr auto const kLatestStart = minutes_t{22 * 60};
constexpr auto const kDurations = std::array<minutes_t, 4>{60, 90, 90, 120};

}  // namespace

booking_request generate_random_request(
    std::mt19937& rng, std::vector<customer_id_t> const& customers,
    date_t const first_day, unsigned const days, int const max_party_size,
    minutes_t const granularity) {
  utl::verify(!customers.empty() && days != 0U && max_party_size > 0 &&
                  granularity > 0,
              "generate_random_request: bad parameters");

  auto customer_dist =
      std::uniform_int_distribution<std::size_t>{0U, customers.size() - 1U};
  auto day_dist = std::uniform_int_distribution<unsigned>{0U, days - 1U};
  // small parties are more common than large ones
  auto party_dist = std::binomial_distribution<int>{max_party_size - 1, 0.35};
  auto slot_dist = std::uniform_int_distribution<minutes_t>{
      0, (kLatestStart - kEarliestStart) / granularity};
  auto duration_dist =
      std::uniform_int_distribution<std::size_t>{0U, kDurations.size() - 1U};

  return {.customer_ = customers[customer_dist(rng)],
          .party_size_ = 1 + party_dist(rng),
          .date_ = first_day + boost::gregorian::days{day_dist(rng)},
          .start_ = kEarliestStart + slot_dist(rng) * granularity,
          .duration_ = kDurations[duration_dist(rng)]};
}

}  // namespace rezzy
