#pragma once

#include "rezzy/reservation.h"
#include "rezzy/status.h"

namespace rezzy {

struct repository;
struct table_locks;

// Applies status transitions while holding the locks of all tables of the
// reservation, so a release (cancelled, no_show, completed) is seen
// atomically by concurrent allocations of those tables.
struct reservation_state_machine {
  reservation_state_machine(repository&, table_locks&);

  // Returns the updated reservation. Throws not_found_error or
  // invalid_transition_error, in which case nothing changed.
  reservation change_status(reservation_id_t, status);

private:
  repository& repo_;
  table_locks& locks_;
};

}  // namespace rezzy
