#pragma once

#include <functional>
#include <map>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "rezzy/repository.h"

namespace rezzy {

struct memory_repository : public repository {
  using clock_fn_t = std::function<timestamp_t()>;

  memory_repository();
  explicit memory_repository(clock_fn_t);

  // Floor plan. add_table creates max_capacity assigned chairs,
  // update_table adds or drops chairs when max_capacity changes.
  // remove_table throws validation_error while the table holds pending,
  // confirmed or seated reservations; rows of finished ones are dropped.
  table_id_t add_table(table);
  void update_table(table);
  bool remove_table(table_id_t);
  chair_id_t add_chair(table_id_t, bool assigned);
  void set_chair_assigned(chair_id_t, bool);

  // Calendar.
  void set_weekly_hours(weekly_hours);
  bool remove_weekly_hours(weekday_t);
  void set_special_hours(special_hours);
  bool remove_special_hours(date_t);
  std::vector<weekly_hours> list_weekly_hours() const;
  std::vector<special_hours> list_special_hours(date_t from, date_t to) const;

  customer_id_t add_customer(customer);

  std::vector<table> get_tables() const override;
  std::optional<table> get_table(table_id_t) const override;
  std::vector<chair> get_chairs(table_id_t) const override;
  std::optional<weekly_hours> get_weekly_hours(weekday_t) const override;
  std::optional<special_hours> get_special_hours(date_t) const override;
  std::optional<customer> get_customer(customer_id_t) const override;
  std::optional<reservation> get_reservation(reservation_id_t) const override;
  std::vector<table_id_t> get_assigned_tables(
      reservation_id_t) const override;
  std::vector<occupancy> get_occupancies(table_id_t, date_t) const override;
  std::vector<reservation> find_reservations(
      reservation_filter const&) const override;

  reservation_id_t commit_allocation(reservation&,
                                     std::vector<table_id_t> const&) override;
  void set_status(reservation_id_t, status) override;
  bool remove_reservation(reservation_id_t) override;

private:
  template <typename Entity>
  void stamp_new(Entity&) const;

  template <typename Entity, typename Fn>
  void modify(Entity&, Fn&&) const;

  void sync_chairs(table_id_t, int target);
  void unlink_assignments(reservation_id_t);
  std::vector<table_id_t> assigned_tables(reservation_id_t) const;

  clock_fn_t now_;
  mutable std::shared_mutex mutex_;

  std::map<table_id_t, table> tables_;
  std::map<chair_id_t, chair> chairs_;
  std::map<weekday_t, weekly_hours> weekly_hours_;
  std::map<date_t, special_hours> special_hours_;
  std::map<customer_id_t, customer> customers_;
  std::map<reservation_id_t, reservation> reservations_;
  std::map<reservation_id_t, std::vector<table_assignment>> assignments_;
  std::map<std::pair<table_id_t, date_t>, std::set<reservation_id_t>>
      by_table_day_;

  table_id_t next_table_id_{1U};
  chair_id_t next_chair_id_{1U};
  customer_id_t next_customer_id_{1U};
  reservation_id_t next_reservation_id_{1U};
};

}  // namespace rezzy
