#pragma once

#include <vector>

#include "rezzy/config.h"
#include "rezzy/conflict_checker.h"
#include "rezzy/hours_resolver.h"
#include "rezzy/reservation.h"
#include "rezzy/table.h"

namespace rezzy {

struct repository;
struct table_locks;

// Throws validation_error for a non-positive party size, a duration outside
// (0, one day], an invalid date or a start time outside the day.
void validate_request(reservation const&);

// Seating of every table usable under the configured capacity source.
std::vector<seating> get_seatings(repository const&, engine_config const&);

struct table_allocator {
  table_allocator(repository&, table_locks&, engine_config const&);

  // Finds the best free candidate for the reservation and writes the
  // reservation together with its assignment rows in one step. A persisted
  // reservation (id_ != 0) has its assignments replaced; its own current
  // assignments never count as conflicts.
  //
  // Throws validation_error, closed_error or no_availability_error.
  assignment_set assign(reservation&);

private:
  bool try_commit(reservation&, std::vector<table_id_t> const&,
                  std::vector<table_id_t>& conflicting);

  repository& repo_;
  table_locks& locks_;
  engine_config const& config_;
  hours_resolver hours_;
  conflict_checker conflicts_;
};

}  // namespace rezzy
