#pragma once

#include <optional>
#include <vector>

#include "rezzy/hours.h"
#include "rezzy/interval.h"
#include "rezzy/reservation.h"
#include "rezzy/status.h"
#include "rezzy/table.h"
#include "rezzy/types.h"

namespace rezzy {

// A table assignment joined with the window and status of its reservation.
struct occupancy {
  reservation_id_t reservation_id_;
  interval window_;
  status status_;
};

// Storage the engine runs against. Every call is atomic on its own; the
// engine adds per-table locking on top (see table_locks).
struct repository {
  virtual ~repository() = default;

  virtual std::vector<table> get_tables() const = 0;
  virtual std::optional<table> get_table(table_id_t) const = 0;
  virtual std::vector<chair> get_chairs(table_id_t) const = 0;

  virtual std::optional<weekly_hours> get_weekly_hours(weekday_t) const = 0;
  virtual std::optional<special_hours> get_special_hours(date_t) const = 0;

  virtual std::optional<customer> get_customer(customer_id_t) const = 0;

  virtual std::optional<reservation> get_reservation(
      reservation_id_t) const = 0;
  virtual std::vector<table_id_t> get_assigned_tables(
      reservation_id_t) const = 0;
  // All assignments of the table on that date, regardless of status.
  virtual std::vector<occupancy> get_occupancies(table_id_t,
                                                 date_t) const = 0;
  virtual std::vector<reservation> find_reservations(
      reservation_filter const&) const = 0;

  // Inserts the reservation (id_ == 0, id_ is set) or replaces it, and
  // replaces its assignment rows with the given tables. Replacing keeps the
  // stored status and throws invalid_transition_error unless that status is
  // pending or confirmed.
  virtual reservation_id_t commit_allocation(
      reservation&, std::vector<table_id_t> const&) = 0;

  // Throws not_found_error.
  virtual void set_status(reservation_id_t, status) = 0;

  // Removes the reservation and its assignment rows.
  virtual bool remove_reservation(reservation_id_t) = 0;
};

}  // namespace rezzy
