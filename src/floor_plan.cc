#include "rezzy/floor_plan.h"

#include <fstream>
#include <optional>

#include "fmt/format.h"

#include "nlohmann/json.hpp"

#include "utl/logging.h"

#include "rezzy/clock_time.h"
#include "rezzy/error.h"
#include "rezzy/memory_repository.h"

namespace rezzy {

namespace {

template <typename T>
T get(nlohmann::json const& j, char const* key) {
  auto const it = j.find(key);
  if (it == j.end()) {
    throw validation_error{fmt::format("missing key \"{}\"", key)};
  }
  try {
    return it->template get<T>();
  } catch (nlohmann::json::exception const& e) {
    throw validation_error{fmt::format("key \"{}\": {}", key, e.what())};
  }
}

template <typename T>
std::optional<T> get_opt(nlohmann::json const& j, char const* key) {
  auto const it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return get<T>(j, key);
}

operating_window parse_window(nlohmann::json const& j) {
  return {
      .open_ = parse_time(get<std::string>(j, "open")),
      .close_ = parse_time(get<std::string>(j, "close")),
      .last_reservation_ = parse_time(get<std::string>(j, "last_reservation"))};
}

nlohmann::json const& get_array(nlohmann::json const& j, char const* key) {
  static auto const empty = nlohmann::json::array();
  auto const it = j.find(key);
  if (it == j.end()) {
    return empty;
  }
  if (!it->is_array()) {
    throw validation_error{fmt::format("\"{}\" must be an array", key)};
  }
  return *it;
}

}  // namespace

floor_plan_ids load_floor_plan(nlohmann::json const& j,
                               memory_repository& repo) {
  if (!j.is_object()) {
    throw validation_error{"floor plan must be a JSON object"};
  }

  auto ids = floor_plan_ids{};

  for (auto const& t_json : get_array(j, "tables")) {
    auto t = table{};
    t.number_ = get<std::string>(t_json, "number");
    t.min_capacity_ = get<int>(t_json, "min_capacity");
    t.max_capacity_ = get<int>(t_json, "max_capacity");
    t.shared_ = get_opt<bool>(t_json, "shared").value_or(false);
    t.location_ = get_opt<std::string>(t_json, "location");
    auto const number = t.number_;
    auto const id = repo.add_table(std::move(t));
    ids.tables_.emplace(number, id);

    auto unassigned = get_opt<int>(t_json, "unassigned_chairs").value_or(0);
    for (auto const& c : repo.get_chairs(id)) {
      if (unassigned-- <= 0) {
        break;
      }
      repo.set_chair_assigned(c.id_, false);
    }
  }

  for (auto const& h_json : get_array(j, "weekly_hours")) {
    auto h = weekly_hours{};
    auto const day = get<int>(h_json, "day_of_week");
    if (day < 0 || day > 6) {
      throw validation_error{
          fmt::format("day_of_week must be between 0 and 6, got {}", day)};
    }
    h.day_of_week_ = static_cast<weekday_t>(day);
    h.window_ = parse_window(h_json);
    repo.set_weekly_hours(std::move(h));
  }

  for (auto const& s_json : get_array(j, "special_hours")) {
    auto s = special_hours{};
    s.date_ = parse_date(get<std::string>(s_json, "date"));
    s.name_ = get<std::string>(s_json, "name");
    s.description_ = get_opt<std::string>(s_json, "description").value_or("");
    s.closed_ = get_opt<bool>(s_json, "closed").value_or(false);
    if (!s.closed_) {
      s.window_ = parse_window(s_json);
    }
    repo.set_special_hours(std::move(s));
  }

  for (auto const& c_json : get_array(j, "customers")) {
    auto c = customer{};
    c.name_ = get<std::string>(c_json, "name");
    c.email_ = get_opt<std::string>(c_json, "email");
    c.phone_ = get_opt<std::string>(c_json, "phone");
    c.notes_ = get_opt<std::string>(c_json, "notes").value_or("");
    ids.customers_.emplace_back(repo.add_customer(std::move(c)));
  }

  uLOG(utl::info) << "floor plan: " << ids.tables_.size() << " tables, "
                  << ids.customers_.size() << " customers";
  return ids;
}

floor_plan_ids load_floor_plan_file(std::string const& path,
                                    memory_repository& repo) {
  auto f = std::ifstream{path};
  if (!f) {
    throw not_found_error{fmt::format("cannot open floor plan {}", path)};
  }
  try {
    return load_floor_plan(nlohmann::json::parse(f), repo);
  } catch (nlohmann::json::parse_error const& e) {
    throw validation_error{fmt::format("floor plan {}: {}", path, e.what())};
  }
}

}  // namespace rezzy
