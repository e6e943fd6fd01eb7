#pragma once

#include <cinttypes>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "rezzy/record.h"
#include "rezzy/types.h"

namespace rezzy {

enum class capacity_source : std::uint8_t { kMaxCapacity, kAssignedChairs };

struct table : public record {
  friend std::ostream& operator<<(std::ostream&, table const&);
  table_id_t id_{0U};
  std::string number_;
  int min_capacity_{0};
  int max_capacity_{0};
  bool shared_{false};
  std::optional<std::string> location_;
};

struct chair : public record {
  chair_id_t id_{0U};
  table_id_t table_id_{0U};
  bool assigned_{true};
};

// Capacity of a table as seen by the matcher.
struct seating {
  table_id_t id_;
  std::string number_;
  int min_;
  int max_;
  bool shared_;
};

// Throws validation_error for empty numbers or bad capacity bounds.
void validate(table const&);

// std::nullopt if the table cannot seat anybody under the given policy
// (e.g. fewer assigned chairs than its minimum capacity).
std::optional<seating> get_seating(table const&, std::vector<chair> const&,
                                   capacity_source);

// Orders table numbers naturally ("2" < "10"), shorter numbers first.
bool number_less(std::string const&, std::string const&);

}  // namespace rezzy
