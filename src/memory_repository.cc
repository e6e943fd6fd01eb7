#include "rezzy/memory_repository.h"

#include <algorithm>
#include <mutex>
#include <tuple>

#include "fmt/format.h"

#include "utl/verify.h"

#include "rezzy/error.h"

namespace rezzy {

memory_repository::memory_repository()
    : memory_repository{[]() { return std::chrono::system_clock::now(); }} {}

memory_repository::memory_repository(clock_fn_t now) : now_{std::move(now)} {}

template <typename Entity>
void memory_repository::stamp_new(Entity& e) const {
  e.created_at_ = e.updated_at_ = now_();
}

// Every update of a stored entity goes through here.
template <typename Entity, typename Fn>
void memory_repository::modify(Entity& e, Fn&& fn) const {
  fn(e);
  e.updated_at_ = now_();
}

table_id_t memory_repository::add_table(table t) {
  validate(t);

  auto const lock = std::unique_lock{mutex_};
  if (std::any_of(begin(tables_), end(tables_), [&](auto const& entry) {
        return entry.second.number_ == t.number_;
      })) {
    throw validation_error{
        fmt::format("table number {} already exists", t.number_)};
  }

  t.id_ = next_table_id_++;
  stamp_new(t);
  auto const id = t.id_;
  auto const chairs = t.max_capacity_;
  tables_.emplace(id, std::move(t));
  sync_chairs(id, chairs);
  return id;
}

void memory_repository::update_table(table t) {
  validate(t);

  auto const lock = std::unique_lock{mutex_};
  auto const it = tables_.find(t.id_);
  if (it == end(tables_)) {
    throw not_found_error{fmt::format("table {} not found", t.id_)};
  }
  if (std::any_of(begin(tables_), end(tables_), [&](auto const& entry) {
        return entry.first != t.id_ && entry.second.number_ == t.number_;
      })) {
    throw validation_error{
        fmt::format("table number {} already exists", t.number_)};
  }

  auto const max_changed = it->second.max_capacity_ != t.max_capacity_;
  modify(it->second, [&](table& stored) {
    stored.number_ = std::move(t.number_);
    stored.min_capacity_ = t.min_capacity_;
    stored.max_capacity_ = t.max_capacity_;
    stored.shared_ = t.shared_;
    stored.location_ = std::move(t.location_);
  });
  if (max_changed) {
    sync_chairs(t.id_, t.max_capacity_);
  }
}

bool memory_repository::remove_table(table_id_t const id) {
  auto const lock = std::unique_lock{mutex_};
  auto const table_it = tables_.find(id);
  if (table_it == end(tables_)) {
    return false;
  }
  for (auto const& [key, reservations] : by_table_day_) {
    if (key.first != id) {
      continue;
    }
    for (auto const r_id : reservations) {
      if (is_occupying(reservations_.at(r_id).status_)) {
        throw validation_error{
            fmt::format("table {} still holds active reservation {}",
                        table_it->second.number_, r_id)};
      }
    }
  }
  tables_.erase(table_it);

  std::erase_if(chairs_, [&](auto const& entry) {
    return entry.second.table_id_ == id;
  });

  for (auto it = begin(by_table_day_); it != end(by_table_day_);) {
    if (it->first.first != id) {
      ++it;
      continue;
    }
    for (auto const r_id : it->second) {
      std::erase_if(assignments_[r_id], [&](table_assignment const& a) {
        return a.table_id_ == id;
      });
    }
    it = by_table_day_.erase(it);
  }
  return true;
}

chair_id_t memory_repository::add_chair(table_id_t const table_id,
                                        bool const assigned) {
  auto const lock = std::unique_lock{mutex_};
  if (tables_.find(table_id) == end(tables_)) {
    throw not_found_error{fmt::format("table {} not found", table_id)};
  }
  auto c = chair{};
  c.id_ = next_chair_id_++;
  c.table_id_ = table_id;
  c.assigned_ = assigned;
  stamp_new(c);
  chairs_.emplace(c.id_, c);
  return c.id_;
}

void memory_repository::set_chair_assigned(chair_id_t const id,
                                           bool const assigned) {
  auto const lock = std::unique_lock{mutex_};
  auto const it = chairs_.find(id);
  if (it == end(chairs_)) {
    throw not_found_error{fmt::format("chair {} not found", id)};
  }
  modify(it->second, [&](chair& c) { c.assigned_ = assigned; });
}

// Keeps the oldest chairs when shrinking, adds assigned chairs when growing.
void memory_repository::sync_chairs(table_id_t const table_id,
                                    int const target) {
  auto existing = std::vector<chair_id_t>{};
  for (auto const& [id, c] : chairs_) {
    if (c.table_id_ == table_id) {
      existing.emplace_back(id);
    }
  }

  auto const target_size = static_cast<std::size_t>(target);
  for (auto i = existing.size(); i < target_size; ++i) {
    auto c = chair{};
    c.id_ = next_chair_id_++;
    c.table_id_ = table_id;
    c.assigned_ = true;
    stamp_new(c);
    chairs_.emplace(c.id_, c);
  }
  for (auto i = target_size; i < existing.size(); ++i) {
    chairs_.erase(existing[i]);
  }
}

void memory_repository::set_weekly_hours(weekly_hours h) {
  validate(h);

  auto const lock = std::unique_lock{mutex_};
  auto const it = weekly_hours_.find(h.day_of_week_);
  if (it == end(weekly_hours_)) {
    stamp_new(h);
    weekly_hours_.emplace(h.day_of_week_, h);
  } else {
    modify(it->second,
           [&](weekly_hours& stored) { stored.window_ = h.window_; });
  }
}

bool memory_repository::remove_weekly_hours(weekday_t const day) {
  auto const lock = std::unique_lock{mutex_};
  return weekly_hours_.erase(day) != 0U;
}

void memory_repository::set_special_hours(special_hours h) {
  validate(h);
  if (h.closed_) {
    h.window_ = std::nullopt;
  }

  auto const lock = std::unique_lock{mutex_};
  auto const it = special_hours_.find(h.date_);
  if (it == end(special_hours_)) {
    stamp_new(h);
    special_hours_.emplace(h.date_, std::move(h));
  } else {
    modify(it->second, [&](special_hours& stored) {
      stored.name_ = std::move(h.name_);
      stored.description_ = std::move(h.description_);
      stored.closed_ = h.closed_;
      stored.window_ = h.window_;
    });
  }
}

bool memory_repository::remove_special_hours(date_t const date) {
  auto const lock = std::unique_lock{mutex_};
  return special_hours_.erase(date) != 0U;
}

std::vector<weekly_hours> memory_repository::list_weekly_hours() const {
  auto const lock = std::shared_lock{mutex_};
  auto ret = std::vector<weekly_hours>{};
  for (auto const& [day, h] : weekly_hours_) {
    ret.emplace_back(h);
  }
  return ret;
}

std::vector<special_hours> memory_repository::list_special_hours(
    date_t const from, date_t const to) const {
  auto const lock = std::shared_lock{mutex_};
  auto ret = std::vector<special_hours>{};
  for (auto it = special_hours_.lower_bound(from);
       it != end(special_hours_) && it->first <= to; ++it) {
    ret.emplace_back(it->second);
  }
  return ret;
}

customer_id_t memory_repository::add_customer(customer c) {
  validate(c);

  auto const lock = std::unique_lock{mutex_};
  c.id_ = next_customer_id_++;
  stamp_new(c);
  auto const id = c.id_;
  customers_.emplace(id, std::move(c));
  return id;
}

std::vector<table> memory_repository::get_tables() const {
  auto const lock = std::shared_lock{mutex_};
  auto ret = std::vector<table>{};
  ret.reserve(tables_.size());
  for (auto const& [id, t] : tables_) {
    ret.emplace_back(t);
  }
  return ret;
}

std::optional<table> memory_repository::get_table(table_id_t const id) const {
  auto const lock = std::shared_lock{mutex_};
  auto const it = tables_.find(id);
  return it == end(tables_) ? std::nullopt : std::optional{it->second};
}

std::vector<chair> memory_repository::get_chairs(
    table_id_t const table_id) const {
  auto const lock = std::shared_lock{mutex_};
  auto ret = std::vector<chair>{};
  for (auto const& [id, c] : chairs_) {
    if (c.table_id_ == table_id) {
      ret.emplace_back(c);
    }
  }
  return ret;
}

std::optional<weekly_hours> memory_repository::get_weekly_hours(
    weekday_t const day) const {
  auto const lock = std::shared_lock{mutex_};
  auto const it = weekly_hours_.find(day);
  return it == end(weekly_hours_) ? std::nullopt : std::optional{it->second};
}

std::optional<special_hours> memory_repository::get_special_hours(
    date_t const date) const {
  auto const lock = std::shared_lock{mutex_};
  auto const it = special_hours_.find(date);
  return it == end(special_hours_) ? std::nullopt : std::optional{it->second};
}

std::optional<customer> memory_repository::get_customer(
    customer_id_t const id) const {
  auto const lock = std::shared_lock{mutex_};
  auto const it = customers_.find(id);
  return it == end(customers_) ? std::nullopt : std::optional{it->second};
}

std::optional<reservation> memory_repository::get_reservation(
    reservation_id_t const id) const {
  auto const lock = std::shared_lock{mutex_};
  auto const it = reservations_.find(id);
  return it == end(reservations_) ? std::nullopt : std::optional{it->second};
}

std::vector<table_id_t> memory_repository::assigned_tables(
    reservation_id_t const id) const {
  auto ret = std::vector<table_id_t>{};
  if (auto const it = assignments_.find(id); it != end(assignments_)) {
    for (auto const& a : it->second) {
      ret.emplace_back(a.table_id_);
    }
  }
  std::sort(begin(ret), end(ret));
  return ret;
}

std::vector<table_id_t> memory_repository::get_assigned_tables(
    reservation_id_t const id) const {
  auto const lock = std::shared_lock{mutex_};
  return assigned_tables(id);
}

std::vector<occupancy> memory_repository::get_occupancies(
    table_id_t const table_id, date_t const date) const {
  auto const lock = std::shared_lock{mutex_};
  auto ret = std::vector<occupancy>{};
  auto const it = by_table_day_.find({table_id, date});
  if (it == end(by_table_day_)) {
    return ret;
  }
  for (auto const r_id : it->second) {
    auto const& r = reservations_.at(r_id);
    ret.emplace_back(occupancy{.reservation_id_ = r_id,
                               .window_ = r.window(),
                               .status_ = r.status_});
  }
  return ret;
}

std::vector<reservation> memory_repository::find_reservations(
    reservation_filter const& f) const {
  auto const lock = std::shared_lock{mutex_};

  auto matches = std::vector<reservation>{};
  for (auto const& [id, r] : reservations_) {
    if ((f.from_.has_value() && r.date_ < *f.from_) ||
        (f.to_.has_value() && r.date_ > *f.to_) ||
        (f.customer_.has_value() && r.customer_id_ != *f.customer_) ||
        (!f.status_.empty() && std::find(begin(f.status_), end(f.status_),
                                         r.status_) == end(f.status_))) {
      continue;
    }
    if (f.table_.has_value()) {
      auto const tables = assigned_tables(id);
      if (std::find(begin(tables), end(tables), *f.table_) == end(tables)) {
        continue;
      }
    }
    matches.emplace_back(r);
  }

  std::sort(begin(matches), end(matches),
            [](reservation const& a, reservation const& b) {
              return std::tie(a.date_, a.start_, a.id_) <
                     std::tie(b.date_, b.start_, b.id_);
            });

  if (f.offset_ >= matches.size()) {
    return {};
  }
  auto const first = begin(matches) + static_cast<long>(f.offset_);
  auto const last = f.limit_ >= matches.size() - f.offset_
                        ? end(matches)
                        : first + static_cast<long>(f.limit_);
  return {first, last};
}

void memory_repository::unlink_assignments(reservation_id_t const id) {
  auto const it = assignments_.find(id);
  if (it == end(assignments_)) {
    return;
  }
  auto const& date = reservations_.at(id).date_;
  for (auto const& a : it->second) {
    auto const day_it = by_table_day_.find({a.table_id_, date});
    utl::verify(day_it != end(by_table_day_),
                "assignment index out of sync: reservation {}, table {}", id,
                a.table_id_);
    day_it->second.erase(id);
    if (day_it->second.empty()) {
      by_table_day_.erase(day_it);
    }
  }
  assignments_.erase(it);
}

reservation_id_t memory_repository::commit_allocation(
    reservation& r, std::vector<table_id_t> const& tables) {
  auto const lock = std::unique_lock{mutex_};

  for (auto const t : tables) {
    if (tables_.find(t) == end(tables_)) {
      throw not_found_error{fmt::format("table {} not found", t)};
    }
  }
  auto const unique = std::set<table_id_t>{begin(tables), end(tables)};
  utl::verify(unique.size() == tables.size(),
              "duplicate table in assignment of reservation {}", r.id_);

  if (r.id_ == 0U) {
    r.id_ = next_reservation_id_++;
    stamp_new(r);
    reservations_.emplace(r.id_, r);
  } else {
    auto const it = reservations_.find(r.id_);
    if (it == end(reservations_)) {
      throw not_found_error{fmt::format("reservation {} not found", r.id_)};
    }
    auto const stored_status = it->second.status_;
    if (stored_status != status::kPending &&
        stored_status != status::kConfirmed) {
      throw invalid_transition_error{
          fmt::format("cannot move {} reservation {}", to_str(stored_status),
                      r.id_)};
    }
    unlink_assignments(r.id_);
    // status changes only go through set_status
    modify(it->second, [&](reservation& stored) {
      auto const created_at = stored.created_at_;
      auto const s = stored.status_;
      stored = r;
      stored.created_at_ = created_at;
      stored.status_ = s;
    });
    r = it->second;
  }

  auto& rows = assignments_[r.id_];
  for (auto const t : tables) {
    auto a = table_assignment{};
    a.reservation_id_ = r.id_;
    a.table_id_ = t;
    stamp_new(a);
    rows.emplace_back(a);
    by_table_day_[{t, r.date_}].emplace(r.id_);
  }
  return r.id_;
}

void memory_repository::set_status(reservation_id_t const id,
                                   status const s) {
  auto const lock = std::unique_lock{mutex_};
  auto const it = reservations_.find(id);
  if (it == end(reservations_)) {
    throw not_found_error{fmt::format("reservation {} not found", id)};
  }
  modify(it->second, [&](reservation& r) { r.status_ = s; });
}

bool memory_repository::remove_reservation(reservation_id_t const id) {
  auto const lock = std::unique_lock{mutex_};
  if (reservations_.find(id) == end(reservations_)) {
    return false;
  }
  unlink_assignments(id);
  reservations_.erase(id);
  return true;
}

}  // namespace rezzy
