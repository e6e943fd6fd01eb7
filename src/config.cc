#include "rezzy/config.h"

#include <fstream>

#include "fmt/format.h"

#include "nlohmann/json.hpp"

#include "rezzy/error.h"

namespace rezzy {

namespace {

template <typename T>
void read(nlohmann::json const& j, char const* key, T& out) {
  auto const it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (nlohmann::json::exception const& e) {
    throw validation_error{
        fmt::format("config key \"{}\": {}", key, e.what())};
  }
}

}  // namespace

void validate(engine_config const& c) {
  if (c.max_combination_size_ == 0U) {
    throw validation_error{"max_combination_size must be at least 1"};
  }
  if (c.max_excess_.has_value() && *c.max_excess_ < 0) {
    throw validation_error{
        fmt::format("max_excess must not be negative, got {}", *c.max_excess_)};
  }
  if (c.default_duration_ <= 0 || c.default_duration_ > kMinutesPerDay) {
    throw validation_error{fmt::format("default_duration out of range: {}",
                                       c.default_duration_)};
  }
  if (c.slot_granularity_ <= 0 || c.slot_granularity_ > kMinutesPerDay) {
    throw validation_error{fmt::format("slot_granularity out of range: {}",
                                       c.slot_granularity_)};
  }
}

engine_config parse_config(nlohmann::json const& j) {
  if (!j.is_object()) {
    throw validation_error{"config must be a JSON object"};
  }

  auto c = engine_config{};
  auto max_combination_size = static_cast<int>(c.max_combination_size_);
  read(j, "max_combination_size", max_combination_size);
  if (max_combination_size < 1) {
    throw validation_error{"max_combination_size must be at least 1"};
  }
  c.max_combination_size_ = static_cast<unsigned>(max_combination_size);
  read(j, "default_duration", c.default_duration_);
  read(j, "slot_granularity", c.slot_granularity_);
  read(j, "auto_confirm", c.auto_confirm_);

  if (auto const it = j.find("max_excess"); it != j.end() && !it->is_null()) {
    auto max_excess = 0;
    read(j, "max_excess", max_excess);
    c.max_excess_ = max_excess;
  }

  auto src = std::string{"max_capacity"};
  read(j, "capacity_source", src);
  if (src == "max_capacity") {
    c.capacity_source_ = capacity_source::kMaxCapacity;
  } else if (src == "assigned_chairs") {
    c.capacity_source_ = capacity_source::kAssignedChairs;
  } else {
    throw validation_error{fmt::format("unknown capacity_source \"{}\"", src)};
  }

  validate(c);
  return c;
}

engine_config load_config(std::string const& path) {
  auto f = std::ifstream{path};
  if (!f) {
    throw not_found_error{fmt::format("cannot open config file {}", path)};
  }
  try {
    return parse_config(nlohmann::json::parse(f));
  } catch (nlohmann::json::parse_error const& e) {
    throw validation_error{fmt::format("config {}: {}", path, e.what())};
  }
}

}  // namespace rezzy
