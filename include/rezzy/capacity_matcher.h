#pragma once

#include <cinttypes>
#include <iosfwd>
#include <optional>
#include <set>
#include <vector>

#include "rezzy/config.h"
#include "rezzy/table.h"
#include "rezzy/types.h"

namespace rezzy {

struct candidate {
  friend std::ostream& operator<<(std::ostream&, candidate const&);
  std::vector<table_id_t> tables_;
  int capacity_;  // sum of max capacities
  int excess_;  // capacity_ - party size
};

// Lazily produces the table sets able to seat a party, best first:
//   1. single tables with min <= party <= max, least excess first
//   2. combinations of shared tables, fewer tables first, then least
//      excess, up to max_combination_size tables
// Ties are broken by table number. Combinations of k tables are only
// enumerated once all candidates with fewer tables were handed out.
struct capacity_matcher {
  capacity_matcher(std::vector<seating>, int party_size, engine_config const&,
                   std::set<table_id_t> exclude = {});

  std::optional<candidate> next();

  // Candidates containing an excluded table are skipped from now on.
  void exclude(table_id_t);

private:
  struct entry {
    std::vector<std::uint32_t> idx_;  // into seatings_
    int capacity_;
    int excess_;
  };

  void generate(unsigned size);
  void generate_combinations(std::vector<std::uint32_t> const& shared,
                             unsigned size, std::size_t first,
                             std::vector<std::uint32_t>& current, int min_sum,
                             int max_sum);
  bool admits(int min_sum, int max_sum) const;
  bool is_excluded(entry const&) const;

  std::vector<seating> seatings_;
  int party_size_;
  unsigned max_size_;
  std::optional<int> max_excess_;
  std::set<table_id_t> exclude_;

  std::vector<entry> level_;
  std::size_t pos_{0U};
  unsigned size_{0U};
};

}  // namespace rezzy
