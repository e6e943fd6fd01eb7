#include "rezzy/booking_service.h"

#include "fmt/format.h"

#include "utl/logging.h"

#include "rezzy/error.h"
#include "rezzy/repository.h"

namespace rezzy {

booking_service::booking_service(repository& repo, engine_config config)
    : repo_{repo},
      config_{std::move(config)},
      allocator_{repo_, locks_, config_},
      state_machine_{repo_, locks_},
      slots_{repo_, config_},
      hours_{repo_} {
  validate(config_);
}

std::vector<minutes_t> booking_service::check_availability(
    date_t const date, int const party_size,
    std::optional<minutes_t> const duration) const {
  return slots_.slots(date, party_size, std::nullopt, duration);
}

availability booking_service::available_tables(
    date_t const date, minutes_t const start, int const party_size,
    std::optional<minutes_t> const duration) const {
  auto r = reservation{};
  r.party_size_ = party_size;
  r.date_ = date;
  r.start_ = start;
  r.duration_ = duration.value_or(config_.default_duration_);
  validate_request(r);

  auto const window = r.window();
  auto candidates = slots_.free_candidates(date, window, party_size);
  auto const hours = hours_.resolve(date);
  return {.valid_time_ = hours.has_value() && hours->admits(window),
          .candidates_ = std::move(candidates)};
}

booking_result booking_service::create_and_assign(
    customer_id_t const customer, int const party_size, date_t const date,
    minutes_t const start, std::optional<minutes_t> const duration,
    std::string notes) {
  auto r = reservation{};
  r.customer_id_ = customer;
  r.party_size_ = party_size;
  r.date_ = date;
  r.start_ = start;
  r.duration_ = duration.value_or(config_.default_duration_);
  r.notes_ = std::move(notes);
  r.status_ = status::kPending;
  validate_request(r);

  if (!repo_.get_customer(customer).has_value()) {
    throw not_found_error{fmt::format("customer {} not found", customer)};
  }

  auto const assignment = allocator_.assign(r);
  if (config_.auto_confirm_) {
    r = state_machine_.change_status(r.id_, status::kConfirmed);
  }
  return {.reservation_id_ = assignment.reservation_id_,
          .tables_ = assignment.tables_,
          .status_ = r.status_};
}

reservation booking_service::change_status(reservation_id_t const id,
                                           status const to) {
  return state_machine_.change_status(id, to);
}

reservation booking_service::cancel_reservation(reservation_id_t const id) {
  return state_machine_.change_status(id, status::kCancelled);
}

booking_result booking_service::reschedule(reservation_id_t const id,
                                           reschedule_request const& req) {
  auto r = get_reservation(id);
  if (r.status_ != status::kPending && r.status_ != status::kConfirmed) {
    throw invalid_transition_error{
        fmt::format("cannot reschedule {} reservation {}", to_str(r.status_),
                    id)};
  }

  r.date_ = req.date_.value_or(r.date_);
  r.start_ = req.start_.value_or(r.start_);
  r.duration_ = req.duration_.value_or(r.duration_);
  r.party_size_ = req.party_size_.value_or(r.party_size_);

  auto const assignment = allocator_.assign(r);
  uLOG(utl::info) << "rescheduled reservation " << id << " to " << r;
  return {.reservation_id_ = assignment.reservation_id_,
          .tables_ = assignment.tables_,
          .status_ = r.status_};
}

void booking_service::delete_reservation(reservation_id_t const id) {
  while (true) {
    auto const tables = repo_.get_assigned_tables(id);
    auto const guard = locks_.lock(tables);
    if (repo_.get_assigned_tables(id) != tables) {
      continue;
    }
    if (!repo_.remove_reservation(id)) {
      throw not_found_error{fmt::format("reservation {} not found", id)};
    }
    uLOG(utl::info) << "deleted reservation " << id;
    return;
  }
}

reservation booking_service::get_reservation(reservation_id_t const id) const {
  auto r = repo_.get_reservation(id);
  if (!r.has_value()) {
    throw not_found_error{fmt::format("reservation {} not found", id)};
  }
  return *r;
}

std::vector<table_id_t> booking_service::get_assigned_tables(
    reservation_id_t const id) const {
  return repo_.get_assigned_tables(id);
}

std::vector<reservation> booking_service::find_reservations(
    reservation_filter const& f) const {
  return repo_.find_reservations(f);
}

}  // namespace rezzy
