#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "rezzy/interval.h"
#include "rezzy/record.h"
#include "rezzy/status.h"
#include "rezzy/types.h"

namespace rezzy {

struct customer : public record {
  customer_id_t id_{0U};
  std::string name_;
  std::optional<std::string> email_;
  std::optional<std::string> phone_;
  std::string notes_;
};

// Throws validation_error unless the customer has an email or a phone.
void validate(customer const&);

struct reservation : public record {
  interval window() const { return {start_, start_ + duration_}; }
  friend std::ostream& operator<<(std::ostream&, reservation const&);

  reservation_id_t id_{0U};  // 0 -> not yet persisted
  customer_id_t customer_id_{0U};
  int party_size_{0};
  date_t date_;
  minutes_t start_{0};
  minutes_t duration_{0};
  std::string notes_;
  status status_{status::kPending};
};

// One table_assignment row per table of the set.
struct table_assignment : public record {
  reservation_id_t reservation_id_{0U};
  table_id_t table_id_{0U};
};

struct assignment_set {
  friend std::ostream& operator<<(std::ostream&, assignment_set const&);
  reservation_id_t reservation_id_{0U};
  std::vector<table_id_t> tables_;
};

struct reservation_filter {
  std::optional<date_t> from_;
  std::optional<date_t> to_;  // inclusive
  std::optional<table_id_t> table_;
  std::vector<status> status_;  // empty -> any
  std::optional<customer_id_t> customer_;
  std::size_t limit_{100U};
  std::size_t offset_{0U};
};

}  // namespace rezzy
