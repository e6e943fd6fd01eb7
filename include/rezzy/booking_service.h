#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rezzy/capacity_matcher.h"
#include "rezzy/config.h"
#include "rezzy/hours_resolver.h"
#include "rezzy/reservation.h"
#include "rezzy/reservation_state_machine.h"
#include "rezzy/slot_generator.h"
#include "rezzy/table_allocator.h"
#include "rezzy/table_locks.h"
#include "rezzy/types.h"

namespace rezzy {

struct repository;

struct booking_result {
  reservation_id_t reservation_id_;
  std::vector<table_id_t> tables_;
  status status_;
};

struct availability {
  bool valid_time_;
  std::vector<candidate> candidates_;
};

struct reschedule_request {
  std::optional<date_t> date_;
  std::optional<minutes_t> start_;
  std::optional<minutes_t> duration_;
  std::optional<int> party_size_;
};

// Operations offered to callers such as a transport layer. Every operation
// either succeeds or throws exactly one rezzy::error.
struct booking_service {
  booking_service(repository&, engine_config);

  std::vector<minutes_t> check_availability(
      date_t, int party_size,
      std::optional<minutes_t> duration = std::nullopt) const;

  availability available_tables(
      date_t, minutes_t start, int party_size,
      std::optional<minutes_t> duration = std::nullopt) const;

  booking_result create_and_assign(
      customer_id_t, int party_size, date_t, minutes_t start,
      std::optional<minutes_t> duration = std::nullopt,
      std::string notes = {});

  reservation change_status(reservation_id_t, status);
  reservation cancel_reservation(reservation_id_t);

  // Moves a pending or confirmed reservation. On failure the reservation
  // keeps its previous window and tables.
  booking_result reschedule(reservation_id_t, reschedule_request const&);

  // Removes the reservation together with its table assignments.
  void delete_reservation(reservation_id_t);

  reservation get_reservation(reservation_id_t) const;
  std::vector<table_id_t> get_assigned_tables(reservation_id_t) const;
  std::vector<reservation> find_reservations(reservation_filter const&) const;

  engine_config const& config() const { return config_; }

private:
  repository& repo_;
  engine_config config_;
  table_locks locks_;
  table_allocator allocator_;
  reservation_state_machine state_machine_;
  slot_generator slots_;
  hours_resolver hours_;
};

}  // namespace rezzy
