#include "gtest/gtest.h"

#include <limits>

#include "rezzy/booking_service.h"
#include "rezzy/error.h"
#include "rezzy/memory_repository.h"

#include "restaurant_fixture.h"

using namespace rezzy;
using namespace rezzy::test;

namespace {

struct booking_service_test : public ::testing::Test {
  booking_service_test() {
    set_every_day(repo_, "17:00", "22:00", "21:00");
    t1_ = add_table(repo_, "1", 2, 4);
  }

  memory_repository repo_;
  booking_service service_{repo_, engine_config{}};
  customer_id_t ada_{add_customer(repo_, "Ada")};
  customer_id_t bob_{add_customer(repo_, "Bob")};
  table_id_t t1_{0U};
};

}  // namespace

TEST_F(booking_service_test, create_and_assign) {
  auto const b = service_.create_and_assign(ada_, 3, kMonday, at("18:00"),
                                            std::nullopt, "birthday");
  EXPECT_EQ(std::vector<table_id_t>{t1_}, b.tables_);
  EXPECT_EQ(status::kPending, b.status_);

  auto const r = service_.get_reservation(b.reservation_id_);
  EXPECT_EQ(90, r.duration_);
  EXPECT_EQ("birthday", r.notes_);
  EXPECT_EQ(ada_, r.customer_id_);
  EXPECT_EQ(std::vector<table_id_t>{t1_},
            service_.get_assigned_tables(b.reservation_id_));

  EXPECT_THROW(service_.create_and_assign(bob_, 2, kMonday, at("19:00")),
               no_availability_error);
  EXPECT_THROW(service_.create_and_assign(bob_, 2, kMonday, at("12:00")),
               closed_error);
  EXPECT_THROW(service_.create_and_assign(bob_, 0, kMonday, at("19:00")),
               validation_error);
  EXPECT_THROW(service_.create_and_assign(99U, 2, kMonday, at("20:00")),
               not_found_error);
  EXPECT_THROW(
      service_.create_and_assign(bob_, 2, kMonday, at("18:00"),
                                 std::numeric_limits<minutes_t>::max() - 100),
      validation_error);
  EXPECT_EQ(1U, service_.find_reservations({}).size());
}

TEST_F(booking_service_test, auto_confirm) {
  auto config = engine_config{};
  config.auto_confirm_ = true;
  auto service = booking_service{repo_, config};

  auto const b = service.create_and_assign(ada_, 2, kMonday, at("18:00"));
  EXPECT_EQ(status::kConfirmed, b.status_);
  EXPECT_EQ(status::kConfirmed,
            service.get_reservation(b.reservation_id_).status_);
}

TEST_F(booking_service_test, invalid_config) {
  auto config = engine_config{};
  config.slot_granularity_ = 0;
  EXPECT_THROW((booking_service{repo_, config}), validation_error);
}

TEST_F(booking_service_test, cancel_frees_table) {
  auto const b = service_.create_and_assign(ada_, 3, kMonday, at("18:00"));
  auto const cancelled = service_.cancel_reservation(b.reservation_id_);
  EXPECT_EQ(status::kCancelled, cancelled.status_);

  EXPECT_NO_THROW(service_.create_and_assign(bob_, 2, kMonday, at("18:30")));
  EXPECT_THROW(service_.cancel_reservation(b.reservation_id_),
               invalid_transition_error);
  EXPECT_THROW(service_.cancel_reservation(1234U), not_found_error);
}

TEST_F(booking_service_test, check_availability) {
  EXPECT_EQ(15U, service_.check_availability(kMonday, 2).size());
  EXPECT_EQ(17U, service_.check_availability(kMonday, 2, 60).size());

  service_.create_and_assign(ada_, 2, kMonday, at("17:00"), 240);
  auto const slots = service_.check_availability(kMonday, 2, 60);
  ASSERT_EQ(1U, slots.size());
  EXPECT_EQ(at("21:00"), slots.front());
}

TEST_F(booking_service_test, available_tables) {
  auto const t2 = add_table(repo_, "2", 4, 8);

  auto const a = service_.available_tables(kMonday, at("18:00"), 4);
  EXPECT_TRUE(a.valid_time_);
  ASSERT_EQ(2U, a.candidates_.size());
  EXPECT_EQ(std::vector<table_id_t>{t1_}, a.candidates_[0].tables_);
  EXPECT_EQ(0, a.candidates_[0].excess_);
  EXPECT_EQ(std::vector<table_id_t>{t2}, a.candidates_[1].tables_);
  EXPECT_EQ(4, a.candidates_[1].excess_);

  auto const late = service_.available_tables(kMonday, at("21:30"), 4);
  EXPECT_FALSE(late.valid_time_);
  EXPECT_TRUE(late.candidates_.empty());

  EXPECT_THROW(service_.available_tables(kMonday, -15, 4), validation_error);
  EXPECT_THROW(service_.available_tables(kMonday, kMinutesPerDay, 4),
               validation_error);
  EXPECT_THROW(service_.available_tables(
                   kMonday, at("18:00"), 4,
                   std::numeric_limits<minutes_t>::max() - 100),
               validation_error);
}

TEST_F(booking_service_test, reschedule) {
  auto const first = service_.create_and_assign(ada_, 2, kMonday, at("18:00"));
  auto const second =
      service_.create_and_assign(bob_, 2, kMonday, at("19:30"));
  service_.change_status(first.reservation_id_, status::kConfirmed);

  // overlapping the other reservation, nothing changes
  EXPECT_THROW(service_.reschedule(first.reservation_id_,
                                   {.start_ = at("18:30")}),
               no_availability_error);
  auto const unchanged = service_.get_reservation(first.reservation_id_);
  EXPECT_EQ(at("18:00"), unchanged.start_);
  EXPECT_EQ(status::kConfirmed, unchanged.status_);
  EXPECT_EQ(std::vector<table_id_t>{t1_},
            service_.get_assigned_tables(first.reservation_id_));

  // overlapping only itself
  auto const moved = service_.reschedule(
      first.reservation_id_, {.start_ = at("17:30"), .duration_ = 120});
  EXPECT_EQ(std::vector<table_id_t>{t1_}, moved.tables_);
  EXPECT_EQ(status::kConfirmed, moved.status_);
  auto const r = service_.get_reservation(first.reservation_id_);
  EXPECT_EQ(at("17:30"), r.start_);
  EXPECT_EQ(120, r.duration_);

  // to another day
  auto const tuesday = kMonday + boost::gregorian::days{1};
  service_.reschedule(second.reservation_id_, {.date_ = tuesday});
  EXPECT_EQ(tuesday, service_.get_reservation(second.reservation_id_).date_);
  EXPECT_NO_THROW(service_.create_and_assign(bob_, 2, kMonday, at("19:30")));

  EXPECT_THROW(
      service_.reschedule(first.reservation_id_, {.party_size_ = 0}),
      validation_error);
  EXPECT_THROW(
      service_.reschedule(first.reservation_id_, {.start_ = at("23:00")}),
      closed_error);

  service_.change_status(first.reservation_id_, status::kSeated);
  EXPECT_THROW(
      service_.reschedule(first.reservation_id_, {.start_ = at("20:00")}),
      invalid_transition_error);
  EXPECT_THROW(service_.reschedule(777U, {}), not_found_error);
}

TEST_F(booking_service_test, delete_reservation) {
  auto const b = service_.create_and_assign(ada_, 2, kMonday, at("18:00"));
  service_.delete_reservation(b.reservation_id_);

  EXPECT_THROW(service_.get_reservation(b.reservation_id_), not_found_error);
  EXPECT_TRUE(service_.get_assigned_tables(b.reservation_id_).empty());
  EXPECT_TRUE(repo_.get_occupancies(t1_, kMonday).empty());
  EXPECT_THROW(service_.delete_reservation(b.reservation_id_),
               not_found_error);

  EXPECT_NO_THROW(service_.create_and_assign(bob_, 2, kMonday, at("18:00")));
}

TEST_F(booking_service_test, find_reservations) {
  auto const t2 = add_table(repo_, "2", 2, 4);
  auto const tuesday = kMonday + boost::gregorian::days{1};

  auto const a = service_.create_and_assign(ada_, 2, kMonday, at("20:00"));
  auto const b = service_.create_and_assign(bob_, 2, kMonday, at("18:00"));
  auto const c = service_.create_and_assign(ada_, 2, kMonday, at("18:00"));
  auto const d = service_.create_and_assign(bob_, 2, tuesday, at("17:00"));
  service_.cancel_reservation(d.reservation_id_);

  auto const ids = [](std::vector<reservation> const& v) {
    auto ret = std::vector<reservation_id_t>{};
    for (auto const& r : v) {
      ret.emplace_back(r.id_);
    }
    return ret;
  };

  EXPECT_EQ((std::vector{b.reservation_id_, c.reservation_id_,
                         a.reservation_id_, d.reservation_id_}),
            ids(service_.find_reservations({})));
  EXPECT_EQ((std::vector{c.reservation_id_, a.reservation_id_}),
            ids(service_.find_reservations({.customer_ = ada_})));
  EXPECT_EQ((std::vector{c.reservation_id_}),
            ids(service_.find_reservations({.table_ = t2})));
  EXPECT_EQ((std::vector{d.reservation_id_}),
            ids(service_.find_reservations({.from_ = tuesday})));
  EXPECT_EQ((std::vector{b.reservation_id_, c.reservation_id_,
                         a.reservation_id_}),
            ids(service_.find_reservations({.to_ = kMonday})));
  EXPECT_EQ((std::vector{d.reservation_id_}),
            ids(service_.find_reservations(
                {.status_ = {status::kCancelled, status::kNoShow}})));
  EXPECT_EQ((std::vector{c.reservation_id_, a.reservation_id_}),
            ids(service_.find_reservations({.limit_ = 2U, .offset_ = 1U})));
  EXPECT_TRUE(service_.find_reservations({.offset_ = 4U}).empty());
}
