#include "rezzy/capacity_matcher.h"

#include <algorithm>
#include <ostream>

#include "utl/enumerate.h"

namespace rezzy {

std::ostream& operator<<(std::ostream& out, candidate const& c) {
  out << "{";
  for (auto const& [i, t] : utl::enumerate(c.tables_)) {
    out << (i == 0U ? "" : ", ") << t;
  }
  return out << "} cap=" << c.capacity_ << " excess=" << c.excess_;
}

capacity_matcher::capacity_matcher(std::vector<seating> seatings,
                                   int const party_size,
                                   engine_config const& config,
                                   std::set<table_id_t> exclude)
    : seatings_{std::move(seatings)},
      party_size_{party_size},
      max_size_{config.max_combination_size_},
      max_excess_{config.max_excess_},
      exclude_{std::move(exclude)} {
  std::sort(begin(seatings_), end(seatings_),
            [](seating const& a, seating const& b) {
              return number_less(a.number_, b.number_);
            });
}

void capacity_matcher::exclude(table_id_t const id) { exclude_.emplace(id); }

bool capacity_matcher::admits(int const min_sum, int const max_sum) const {
  return min_sum <= party_size_ && party_size_ <= max_sum &&
         (!max_excess_.has_value() || max_sum - party_size_ <= *max_excess_);
}

bool capacity_matcher::is_excluded(entry const& e) const {
  return std::any_of(begin(e.idx_), end(e.idx_), [&](std::uint32_t const i) {
    return exclude_.contains(seatings_[i].id_);
  });
}

std::optional<candidate> capacity_matcher::next() {
  if (party_size_ <= 0) {
    return std::nullopt;
  }

  while (true) {
    while (pos_ < level_.size()) {
      auto const& e = level_[pos_++];
      if (is_excluded(e)) {
        continue;
      }
      auto c = candidate{.tables_ = {},
                         .capacity_ = e.capacity_,
                         .excess_ = e.excess_};
      for (auto const i : e.idx_) {
        c.tables_.emplace_back(seatings_[i].id_);
      }
      return c;
    }

    if (size_ >= max_size_) {
      return std::nullopt;
    }
    generate(++size_);
    pos_ = 0U;
  }
}

void capacity_matcher::generate(unsigned const size) {
  level_.clear();

  if (size == 1U) {
    for (auto const& [i, s] : utl::enumerate(seatings_)) {
      if (!exclude_.contains(s.id_) && admits(s.min_, s.max_)) {
        level_.emplace_back(entry{.idx_ = {static_cast<std::uint32_t>(i)},
                                  .capacity_ = s.max_,
                                  .excess_ = s.max_ - party_size_});
      }
    }
  } else {
    auto shared = std::vector<std::uint32_t>{};
    for (auto const& [i, s] : utl::enumerate(seatings_)) {
      if (s.shared_ && !exclude_.contains(s.id_)) {
        shared.emplace_back(static_cast<std::uint32_t>(i));
      }
    }
    auto current = std::vector<std::uint32_t>{};
    generate_combinations(shared, size, 0U, current, 0, 0);
  }

  // idx_ follow the table number order of seatings_, so comparing them
  // lexicographically compares the table numbers.
  std::stable_sort(begin(level_), end(level_),
                   [](entry const& a, entry const& b) {
                     return a.excess_ != b.excess_ ? a.excess_ < b.excess_
                                                   : a.idx_ < b.idx_;
                   });
}

void capacity_matcher::generate_combinations(
    std::vector<std::uint32_t> const& shared, unsigned const size,
    std::size_t const first, std::vector<std::uint32_t>& current,
    int const min_sum, int const max_sum) {
  if (current.size() == size) {
    if (admits(min_sum, max_sum)) {
      level_.emplace_back(entry{.idx_ = current,
                                .capacity_ = max_sum,
                                .excess_ = max_sum - party_size_});
    }
    return;
  }

  for (auto i = first; i < shared.size(); ++i) {
    auto const& s = seatings_[shared[i]];
    if (min_sum + s.min_ > party_size_) {
      continue;  // minimum capacities only grow
    }
    current.emplace_back(shared[i]);
    generate_combinations(shared, size, i + 1U, current, min_sum + s.min_,
                          max_sum + s.max_);
    current.pop_back();
  }
}

}  // namespace rezzy
