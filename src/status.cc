#include "rezzy/status.h"

#include <array>
#include <ostream>

#include "fmt/format.h"

#include "rezzy/error.h"

namespace rezzy {

namespace {

constexpr auto const kNames = std::array<std::string_view, kNumStatus>{
    "pending", "confirmed", "seated", "completed", "cancelled", "no_show"};

// kTransitions[from][to]
constexpr auto const kTransitions =
    std::array<std::array<bool, kNumStatus>, kNumStatus>{{
        // pending -> confirmed | cancelled
        {false, true, false, false, true, false},
        // confirmed -> seated | cancelled | no_show
        {false, false, true, false, true, true},
        // seated -> completed | no_show
        {false, false, false, true, false, true},
        // completed, cancelled, no_show are terminal
        {false, false, false, false, false, false},
        {false, false, false, false, false, false},
        {false, false, false, false, false, false},
    }};

constexpr std::size_t idx(status const s) {
  return static_cast<std::size_t>(s);
}

}  // namespace

bool is_occupying(status const s) {
  return s == status::kPending || s == status::kConfirmed ||
         s == status::kSeated;
}

bool is_terminal(status const s) { return !is_occupying(s); }

bool can_transition(status const from, status const to) {
  return kTransitions[idx(from)][idx(to)];
}

void verify_transition(status const from, status const to) {
  if (!can_transition(from, to)) {
    throw invalid_transition_error{fmt::format(
        "invalid status transition {} -> {}", to_str(from), to_str(to))};
  }
}

std::string_view to_str(status const s) { return kNames[idx(s)]; }

status parse_status(std::string_view const s) {
  for (auto i = 0U; i != kNumStatus; ++i) {
    if (kNames[i] == s) {
      return static_cast<status>(i);
    }
  }
  throw validation_error{fmt::format("unknown reservation status \"{}\"", s)};
}

std::ostream& operator<<(std::ostream& out, status const s) {
  return out << to_str(s);
}

}  // namespace rezzy
