#pragma once

#include <cinttypes>
#include <iosfwd>
#include <string_view>

namespace rezzy {

enum class status : std::uint8_t {
  kPending,
  kConfirmed,
  kSeated,
  kCompleted,
  kCancelled,
  kNoShow
};

constexpr auto const kNumStatus = 6U;

// pending, confirmed and seated reservations hold their tables.
bool is_occupying(status);
bool is_terminal(status);
bool can_transition(status from, status to);

// Throws invalid_transition_error if from -> to is not allowed.
void verify_transition(status from, status to);

std::string_view to_str(status);
status parse_status(std::string_view);  // throws validation_error
std::ostream& operator<<(std::ostream&, status);

}  // namespace rezzy
