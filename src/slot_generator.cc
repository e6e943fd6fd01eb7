#include "rezzy/slot_generator.h"

#include "fmt/format.h"

#include "rezzy/error.h"
#include "rezzy/table_allocator.h"

namespace rezzy {

slot_generator::slot_generator(repository const& repo,
                               engine_config const& config)
    : repo_{repo}, config_{config}, hours_{repo}, conflicts_{repo} {}

void slot_generator::validate_query(int const party_size,
                                    minutes_t const granularity,
                                    minutes_t const duration) {
  if (party_size <= 0) {
    throw validation_error{
        fmt::format("party_size must be positive, got {}", party_size)};
  }
  if (granularity <= 0) {
    throw validation_error{
        fmt::format("granularity must be positive, got {}", granularity)};
  }
  if (duration <= 0 || duration > kMinutesPerDay) {
    throw validation_error{fmt::format("duration must lie in (0, {}], got {}",
                                       kMinutesPerDay, duration)};
  }
}

std::vector<seating> slot_generator::get_seatings() const {
  return rezzy::get_seatings(repo_, config_);
}

std::vector<minutes_t> slot_generator::slots(
    date_t const date, int const party_size,
    std::optional<minutes_t> const granularity,
    std::optional<minutes_t> const duration) const {
  auto ret = std::vector<minutes_t>{};
  for_each_slot(date, party_size,
                granularity.value_or(config_.slot_granularity_),
                duration.value_or(config_.default_duration_),
                [&](minutes_t const start) {
                  ret.emplace_back(start);
                  return true;
                });
  return ret;
}

std::vector<candidate> slot_generator::free_candidates(
    date_t const date, interval const& window, int const party_size) const {
  validate_query(party_size, config_.slot_granularity_, window.size());
  auto const hours = hours_.resolve(date);
  if (!hours.has_value() || !hours->admits(window)) {
    return {};
  }
  return free_candidates(get_seatings(), date, window, party_size, false);
}

std::vector<candidate> slot_generator::free_candidates(
    std::vector<seating> const& seatings, date_t const date,
    interval const& window, int const party_size,
    bool const first_only) const {
  auto ret = std::vector<candidate>{};
  auto matcher = capacity_matcher{seatings, party_size, config_};
  while (auto c = matcher.next()) {
    auto free = true;
    for (auto const t : c->tables_) {
      if (conflicts_.has_conflict(t, date, window)) {
        matcher.exclude(t);
        free = false;
      }
    }
    if (free) {
      ret.emplace_back(std::move(*c));
      if (first_only) {
        break;
      }
    }
  }
  return ret;
}

}  // namespace rezzy
