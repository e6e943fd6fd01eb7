#pragma once

#include <optional>
#include <vector>

#include "rezzy/capacity_matcher.h"
#include "rezzy/config.h"
#include "rezzy/conflict_checker.h"
#include "rezzy/hours_resolver.h"
#include "rezzy/interval.h"
#include "rezzy/table.h"
#include "rezzy/types.h"

namespace rezzy {

struct repository;

// Read-only availability queries. No locks are taken, so results are a
// snapshot that a later assignment may contradict.
struct slot_generator {
  slot_generator(repository const&, engine_config const&);

  // Calls f(start) for every start time open, open + granularity, ... up to
  // the last reservation time at which some candidate is free for
  // [start, start + duration). Stops early once f returns false.
  template <typename F>
  void for_each_slot(date_t const date, int const party_size,
                     minutes_t const granularity, minutes_t const duration,
                     F&& f) const {
    validate_query(party_size, granularity, duration);
    auto const hours = hours_.resolve(date);
    if (!hours.has_value()) {
      return;
    }
    auto const seatings = get_seatings();
    for (auto start = hours->open_; start <= hours->last_reservation_;
         start += granularity) {
      auto const window = interval{start, start + duration};
      if (hours->admits(window) &&
          !free_candidates(seatings, date, window, party_size, true).empty() &&
          !f(start)) {
        return;
      }
    }
  }

  std::vector<minutes_t> slots(
      date_t, int party_size,
      std::optional<minutes_t> granularity = std::nullopt,
      std::optional<minutes_t> duration = std::nullopt) const;

  // Ranked candidates without conflicts for exactly this window. Empty if
  // the window lies outside the operating hours.
  std::vector<candidate> free_candidates(date_t, interval const&,
                                         int party_size) const;

private:
  static void validate_query(int party_size, minutes_t granularity,
                             minutes_t duration);
  std::vector<seating> get_seatings() const;
  std::vector<candidate> free_candidates(std::vector<seating> const&, date_t,
                                         interval const&, int party_size,
                                         bool first_only) const;

  repository const& repo_;
  engine_config const& config_;
  hours_resolver hours_;
  conflict_checker conflicts_;
};

}  // namespace rezzy
