#include "rezzy/verify_assignments.h"

#include <limits>
#include <map>
#include <ostream>
#include <utility>

#include "utl/enumerate.h"

#include "rezzy/clock_time.h"
#include "rezzy/repository.h"
#include "rezzy/table_allocator.h"

namespace rezzy {

namespace {

std::vector<reservation> occupying_reservations(repository const& repo) {
  auto f = reservation_filter{};
  f.status_ = {status::kPending, status::kConfirmed, status::kSeated};
  f.limit_ = std::numeric_limits<std::size_t>::max();
  return repo.find_reservations(f);
}

}  // namespace

std::ostream& operator<<(std::ostream& out, double_booking const& d) {
  return out << "table " << d.table_ << " on " << format_date(d.date_)
             << ": reservations " << d.first_ << " and " << d.second_;
}

std::vector<double_booking> find_double_bookings(repository const& repo) {
  auto by_table_day =
      std::map<std::pair<table_id_t, date_t>,
               std::vector<std::pair<reservation_id_t, interval>>>{};
  for (auto const& r : occupying_reservations(repo)) {
    for (auto const t : repo.get_assigned_tables(r.id_)) {
      by_table_day[{t, r.date_}].emplace_back(r.id_, r.window());
    }
  }

  auto ret = std::vector<double_booking>{};
  for (auto const& [key, windows] : by_table_day) {
    for (auto const& [i, a] : utl::enumerate(windows)) {
      for (auto j = i + 1U; j < windows.size(); ++j) {
        auto const& b = windows[j];
        if (a.second.overlaps(b.second)) {
          ret.emplace_back(double_booking{.table_ = key.first,
                                          .date_ = key.second,
                                          .first_ = a.first,
                                          .second_ = b.first});
        }
      }
    }
  }
  return ret;
}

std::vector<reservation_id_t> find_capacity_violations(
    repository const& repo, engine_config const& config) {
  auto seatings = std::map<table_id_t, seating>{};
  for (auto const& s : get_seatings(repo, config)) {
    seatings.emplace(s.id_, s);
  }

  auto ret = std::vector<reservation_id_t>{};
  for (auto const& r : occupying_reservations(repo)) {
    auto const tables = repo.get_assigned_tables(r.id_);
    auto min_sum = 0;
    auto max_sum = 0;
    auto valid = !tables.empty() &&
                 tables.size() <= config.max_combination_size_;
    for (auto const t : tables) {
      auto const it = seatings.find(t);
      if (it == end(seatings) || (tables.size() > 1U && !it->second.shared_)) {
        valid = false;
        break;
      }
      min_sum += it->second.min_;
      max_sum += it->second.max_;
    }
    valid = valid && min_sum <= r.party_size_ && r.party_size_ <= max_sum &&
            (!config.max_excess_.has_value() ||
             max_sum - r.party_size_ <= *config.max_excess_);
    if (!valid) {
      ret.emplace_back(r.id_);
    }
  }
  return ret;
}

}  // namespace rezzy
