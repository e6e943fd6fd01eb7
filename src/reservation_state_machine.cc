#include "rezzy/reservation_state_machine.h"

#include "fmt/format.h"

#include "utl/logging.h"

#include "rezzy/error.h"
#include "rezzy/repository.h"
#include "rezzy/table_locks.h"

namespace rezzy {

reservation_state_machine::reservation_state_machine(repository& repo,
                                                     table_locks& locks)
    : repo_{repo}, locks_{locks} {}

reservation reservation_state_machine::change_status(reservation_id_t const id,
                                                     status const to) {
  while (true) {
    auto const tables = repo_.get_assigned_tables(id);
    auto const guard = locks_.lock(tables);
    if (repo_.get_assigned_tables(id) != tables) {
      continue;  // rebooked in between
    }

    auto r = repo_.get_reservation(id);
    if (!r.has_value()) {
      throw not_found_error{fmt::format("reservation {} not found", id)};
    }

    verify_transition(r->status_, to);
    repo_.set_status(id, to);

    uLOG(utl::info) << "reservation " << id << ": " << r->status_ << " -> "
                    << to << (is_occupying(to) ? "" : ", tables released");
    r->status_ = to;
    return *r;
  }
}

}  // namespace rezzy
