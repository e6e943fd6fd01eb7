#include "gtest/gtest.h"

#include <limits>
#include <random>

#include "rezzy/error.h"
#include "rezzy/memory_repository.h"
#include "rezzy/reservation_state_machine.h"
#include "rezzy/slot_generator.h"
#include "rezzy/table_allocator.h"
#include "rezzy/table_locks.h"
#include "rezzy/verify_assignments.h"

#include "restaurant_fixture.h"

using namespace rezzy;
using namespace rezzy::test;

namespace {

struct allocator_test : public ::testing::Test {
  allocator_test() { set_every_day(repo_, "17:00", "22:00", "21:00"); }

  assignment_set assign(int const party_size, char const* start,
                        minutes_t const duration = 90,
                        date_t const date = kMonday) {
    auto r = make_reservation(customer_, party_size, date, start, duration);
    return allocator_.assign(r);
  }

  memory_repository repo_;
  table_locks locks_;
  engine_config config_;
  table_allocator allocator_{repo_, locks_, config_};
  customer_id_t customer_{add_customer(repo_)};
};

}  // namespace

TEST_F(allocator_test, evening_scenario) {
  auto const t = add_table(repo_, "1", 2, 4);

  auto const first = assign(3, "18:00");
  EXPECT_EQ(std::vector<table_id_t>{t}, first.tables_);
  auto const r = repo_.get_reservation(first.reservation_id_);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((interval{at("18:00"), at("19:30")}), r->window());
  EXPECT_EQ(status::kPending, r->status_);

  EXPECT_THROW(assign(3, "19:00", 60), no_availability_error);

  auto const late = assign(3, "20:30", 60);
  EXPECT_EQ(std::vector<table_id_t>{t}, late.tables_);
  EXPECT_TRUE(find_double_bookings(repo_).empty());
}

TEST_F(allocator_test, conflict_falls_through_to_next_candidate) {
  auto const small = add_table(repo_, "1", 2, 4);
  auto const large = add_table(repo_, "2", 2, 6);

  EXPECT_EQ(std::vector<table_id_t>{small}, assign(3, "18:00").tables_);
  EXPECT_EQ(std::vector<table_id_t>{large}, assign(3, "19:00", 60).tables_);
  EXPECT_THROW(assign(2, "18:30"), no_availability_error);
}

TEST_F(allocator_test, combines_shared_tables) {
  auto const t7 = add_table(repo_, "7", 2, 4, true);
  auto const t8 = add_table(repo_, "8", 2, 4, true);
  add_table(repo_, "1", 2, 4);

  auto const a = assign(7, "18:00");
  EXPECT_EQ((std::vector<table_id_t>{t7, t8}), a.tables_);
  EXPECT_EQ((std::vector<table_id_t>{t7, t8}),
            repo_.get_assigned_tables(a.reservation_id_));

  // the non-shared table is free, but cannot be combined
  EXPECT_THROW(assign(5, "18:00"), no_availability_error);
  EXPECT_TRUE(find_capacity_violations(repo_, config_).empty());
}

TEST_F(allocator_test, closed_and_out_of_hours) {
  add_table(repo_, "1", 2, 4);

  EXPECT_THROW(assign(2, "16:45"), closed_error);
  EXPECT_THROW(assign(2, "21:15", 30), closed_error);
  EXPECT_THROW(assign(2, "21:00", 90), closed_error);
  EXPECT_NO_THROW(assign(2, "21:00", 60));

  repo_.remove_weekly_hours(weekday_of(kMonday + boost::gregorian::days{1}));
  EXPECT_THROW(assign(2, "18:00", 90, kMonday + boost::gregorian::days{1}),
               closed_error);

  auto s = special_hours{};
  s.date_ = kMonday + boost::gregorian::days{2};
  s.name_ = "Private event";
  s.closed_ = true;
  repo_.set_special_hours(s);
  EXPECT_THROW(assign(2, "18:00", 90, s.date_), closed_error);
}

TEST_F(allocator_test, validation_before_anything_else) {
  add_table(repo_, "1", 2, 4);

  EXPECT_THROW(assign(0, "18:00"), validation_error);
  EXPECT_THROW(assign(-2, "18:00"), validation_error);
  EXPECT_THROW(assign(2, "18:00", 0), validation_error);

  // invalid input on a closed day is still a validation error
  auto s = special_hours{};
  s.date_ = kMonday;
  s.name_ = "Closed";
  s.closed_ = true;
  repo_.set_special_hours(s);
  EXPECT_THROW(assign(0, "18:00"), validation_error);

  auto r = make_reservation(customer_, 2, date_t{}, "18:00");
  EXPECT_THROW(allocator_.assign(r), validation_error);
  EXPECT_TRUE(repo_.find_reservations({}).empty());
}

TEST_F(allocator_test, duration_longer_than_a_day) {
  add_table(repo_, "1", 2, 4);

  EXPECT_THROW(assign(2, "18:00", std::numeric_limits<minutes_t>::max() - 100),
               validation_error);
  EXPECT_THROW(assign(2, "18:00", kMinutesPerDay + 1), validation_error);
  EXPECT_TRUE(repo_.find_reservations({}).empty());

  EXPECT_NO_THROW(assign(2, "18:00"));
  EXPECT_THROW(assign(2, "18:00"), no_availability_error);
  EXPECT_TRUE(find_double_bookings(repo_).empty());
}

TEST_F(allocator_test, finished_reservation_is_not_moved) {
  auto const t = add_table(repo_, "1", 2, 4);
  auto machine = reservation_state_machine{repo_, locks_};

  auto r = make_reservation(customer_, 2, kMonday, "18:00");
  allocator_.assign(r);
  auto moved = r;
  moved.start_ = at("20:00");

  machine.change_status(r.id_, status::kCancelled);
  EXPECT_THROW(allocator_.assign(moved), invalid_transition_error);

  auto const stored = repo_.get_reservation(r.id_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(at("18:00"), stored->start_);
  EXPECT_EQ(status::kCancelled, stored->status_);
  EXPECT_EQ(std::vector<table_id_t>{t}, repo_.get_assigned_tables(r.id_));
}

TEST_F(allocator_test, failed_assignment_leaves_no_trace) {
  add_table(repo_, "1", 2, 4);
  EXPECT_THROW(assign(9, "18:00"), no_availability_error);
  EXPECT_THROW(assign(2, "23:00"), closed_error);
  EXPECT_TRUE(repo_.find_reservations({}).empty());
}

TEST_F(allocator_test, reassign_ignores_own_assignment) {
  auto const t = add_table(repo_, "1", 2, 4);

  auto r = make_reservation(customer_, 2, kMonday, "18:00");
  allocator_.assign(r);
  auto const id = r.id_;

  r.start_ = at("18:30");
  auto const moved = allocator_.assign(r);
  EXPECT_EQ(id, moved.reservation_id_);
  EXPECT_EQ(std::vector<table_id_t>{t}, moved.tables_);
  EXPECT_EQ(at("18:30"), repo_.get_reservation(id)->start_);
  EXPECT_EQ(1U, repo_.find_reservations({}).size());
}

TEST_F(allocator_test, assigned_chairs_capacity_source) {
  config_.capacity_source_ = capacity_source::kAssignedChairs;
  auto const t = add_table(repo_, "1", 2, 4);
  auto const chairs = repo_.get_chairs(t);
  ASSERT_EQ(4U, chairs.size());
  repo_.set_chair_assigned(chairs[0].id_, false);

  EXPECT_THROW(assign(4, "18:00"), no_availability_error);
  EXPECT_EQ(std::vector<table_id_t>{t}, assign(3, "18:00").tables_);
}

TEST_F(allocator_test, random_allocations_keep_invariants) {
  add_table(repo_, "1", 1, 2);
  add_table(repo_, "2", 2, 4);
  add_table(repo_, "3", 2, 4);
  add_table(repo_, "4", 4, 6);
  add_table(repo_, "5", 2, 4, true);
  add_table(repo_, "6", 2, 4, true);
  add_table(repo_, "7", 2, 6, true);

  auto const slots = slot_generator{repo_, config_};
  auto rng = std::mt19937{42U};
  auto party_dist = std::uniform_int_distribution<int>{1, 12};
  auto start_dist = std::uniform_int_distribution<int>{0, 16};
  auto duration_dist = std::uniform_int_distribution<int>{1, 4};
  auto successes = 0U;

  for (auto i = 0U; i != 300U; ++i) {
    auto r = make_reservation(customer_, party_dist(rng), kMonday, "17:00",
                              duration_dist(rng) * 30);
    r.start_ += start_dist(rng) * 15;

    auto const free =
        slots.free_candidates(kMonday, r.window(), r.party_size_);
    try {
      auto const a = allocator_.assign(r);
      ++successes;
      // the best free candidate at the time of the request wins
      ASSERT_FALSE(free.empty());
      EXPECT_EQ(free.front().tables_, a.tables_);
    } catch (no_availability_error const&) {
      EXPECT_TRUE(free.empty());
    } catch (closed_error const&) {
      EXPECT_TRUE(free.empty());
    }
  }

  EXPECT_GT(successes, 0U);
  EXPECT_TRUE(find_double_bookings(repo_).empty());
  EXPECT_TRUE(find_capacity_violations(repo_, config_).empty());
}
