#pragma once

#include <stdexcept>

namespace rezzy {

struct error : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed input: non-positive party size / duration, bad date or time.
struct validation_error : public error {
  using error::error;
};

// Requested date / time lies outside the effective operating hours.
struct closed_error : public error {
  using error::error;
};

// No candidate table set is free for the requested window.
struct no_availability_error : public error {
  using error::error;
};

struct invalid_transition_error : public error {
  using error::error;
};

struct not_found_error : public error {
  using error::error;
};

}  // namespace rezzy
