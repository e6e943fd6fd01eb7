#include "rezzy/table_allocator.h"

#include <optional>
#include <sstream>

#include "fmt/format.h"

#include "utl/logging.h"

#include "rezzy/capacity_matcher.h"
#include "rezzy/clock_time.h"
#include "rezzy/error.h"
#include "rezzy/repository.h"
#include "rezzy/table_locks.h"

namespace rezzy {

void validate_request(reservation const& r) {
  if (r.party_size_ <= 0) {
    throw validation_error{
        fmt::format("party_size must be positive, got {}", r.party_size_)};
  }
  if (r.duration_ <= 0 || r.duration_ > kMinutesPerDay) {
    throw validation_error{
        fmt::format("duration must lie in (0, {}], got {}", kMinutesPerDay,
                    r.duration_)};
  }
  if (r.date_.is_special()) {
    throw validation_error{"reservation date is not a valid date"};
  }
  if (r.start_ < 0 || r.start_ >= kMinutesPerDay) {
    throw validation_error{
        fmt::format("start time out of range: {} minutes", r.start_)};
  }
}

std::vector<seating> get_seatings(repository const& repo,
                                  engine_config const& config) {
  auto ret = std::vector<seating>{};
  for (auto const& t : repo.get_tables()) {
    auto const s =
        get_seating(t,
                    config.capacity_source_ == capacity_source::kAssignedChairs
                        ? repo.get_chairs(t.id_)
                        : std::vector<chair>{},
                    config.capacity_source_);
    if (s.has_value()) {
      ret.emplace_back(*s);
    }
  }
  return ret;
}

table_allocator::table_allocator(repository& repo, table_locks& locks,
                                 engine_config const& config)
    : repo_{repo},
      locks_{locks},
      config_{config},
      hours_{repo},
      conflicts_{repo} {}

assignment_set table_allocator::assign(reservation& r) {
  validate_request(r);

  auto const window = r.window();
  auto const hours = hours_.resolve(r.date_);
  if (!hours.has_value()) {
    throw closed_error{
        fmt::format("restaurant is closed on {}", format_date(r.date_))};
  }
  if (!hours->admits(window)) {
    std::stringstream ss;
    ss << "requested " << window << " is outside operating hours " << *hours
       << " on " << format_date(r.date_);
    throw closed_error{ss.str()};
  }

  auto matcher = capacity_matcher{get_seatings(repo_, config_), r.party_size_,
                                  config_};
  auto conflicting = std::vector<table_id_t>{};
  auto tried = 0U;
  while (auto const c = matcher.next()) {
    ++tried;
    if (try_commit(r, c->tables_, conflicting)) {
      uLOG(utl::info) << "reservation " << r << " -> tables " << *c;
      return {.reservation_id_ = r.id_, .tables_ = c->tables_};
    }
    for (auto const t : conflicting) {
      matcher.exclude(t);
    }
  }

  uLOG(utl::info) << "no availability for " << r << " after " << tried
                  << " candidates";
  throw no_availability_error{fmt::format(
      "no table available for {} guests on {} at {}", r.party_size_,
      format_date(r.date_), format_time(r.start_))};
}

bool table_allocator::try_commit(reservation& r,
                                 std::vector<table_id_t> const& tables,
                                 std::vector<table_id_t>& conflicting) {
  auto const excluding =
      r.id_ == 0U ? std::nullopt : std::optional<reservation_id_t>{r.id_};

  auto const guard = locks_.lock(tables);
  conflicting.clear();
  for (auto const t : tables) {
    if (conflicts_.has_conflict(t, r.date_, r.window(), excluding)) {
      conflicting.emplace_back(t);
    }
  }
  if (!conflicting.empty()) {
    return false;
  }

  repo_.commit_allocation(r, tables);
  return true;
}

}  // namespace rezzy
