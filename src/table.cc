#include "rezzy/table.h"

#include <algorithm>
#include <ostream>

#include "fmt/format.h"

#include "rezzy/error.h"

namespace rezzy {

std::ostream& operator<<(std::ostream& out, table const& t) {
  return out << "table " << t.number_ << " [" << t.min_capacity_ << ".."
             << t.max_capacity_ << (t.shared_ ? ", shared" : "") << "]";
}

void validate(table const& t) {
  if (t.number_.empty()) {
    throw validation_error{"table number must not be empty"};
  }
  if (t.min_capacity_ <= 0) {
    throw validation_error{fmt::format(
        "table {}: min_capacity must be positive, got {}", t.number_,
        t.min_capacity_)};
  }
  if (t.max_capacity_ < t.min_capacity_) {
    throw validation_error{fmt::format(
        "table {}: max_capacity {} is smaller than min_capacity {}",
        t.number_, t.max_capacity_, t.min_capacity_)};
  }
}

std::optional<seating> get_seating(table const& t,
                                   std::vector<chair> const& chairs,
                                   capacity_source const src) {
  auto max = t.max_capacity_;
  if (src == capacity_source::kAssignedChairs) {
    auto const assigned = std::count_if(
        begin(chairs), end(chairs), [](chair const& c) { return c.assigned_; });
    max = std::min(max, static_cast<int>(assigned));
  }
  if (max < t.min_capacity_) {
    return std::nullopt;
  }
  return seating{.id_ = t.id_,
                 .number_ = t.number_,
                 .min_ = t.min_capacity_,
                 .max_ = max,
                 .shared_ = t.shared_};
}

bool number_less(std::string const& a, std::string const& b) {
  return a.size() != b.size() ? a.size() < b.size() : a < b;
}

}  // namespace rezzy
