#include "rezzy/clock_time.h"

#include <charconv>
#include <exception>
#include <string>

#include "boost/date_time/gregorian/gregorian.hpp"

#include "fmt/format.h"

#include "rezzy/error.h"

namespace rezzy {

namespace {

int parse_field(std::string_view const s, std::string_view const full) {
  auto value = 0U;
  auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.size() != 2U || ec != std::errc{} || ptr != s.data() + s.size()) {
    throw validation_error{fmt::format("malformed time \"{}\"", full)};
  }
  return static_cast<int>(value);
}

}  // namespace

minutes_t parse_time(std::string_view const s) {
  if (s.size() != 5U && s.size() != 8U) {
    throw validation_error{fmt::format("malformed time \"{}\"", s)};
  }
  if (s[2] != ':' || (s.size() == 8U && s[5] != ':')) {
    throw validation_error{fmt::format("malformed time \"{}\"", s)};
  }
  auto const hours = parse_field(s.substr(0, 2), s);
  auto const minutes = parse_field(s.substr(3, 2), s);
  auto const seconds = s.size() == 8U ? parse_field(s.substr(6, 2), s) : 0;
  if (hours > 23 || minutes > 59 || seconds > 59) {
    throw validation_error{fmt::format("time out of range \"{}\"", s)};
  }
  return static_cast<minutes_t>(hours * 60 + minutes);
}

std::string format_time(minutes_t const m) {
  return fmt::format("{:02}:{:02}", m / 60, m % 60);
}

date_t parse_date(std::string_view const s) {
  try {
    auto const d = boost::gregorian::from_simple_string(std::string{s});
    if (d.is_special()) {
      throw validation_error{fmt::format("malformed date \"{}\"", s)};
    }
    return d;
  } catch (validation_error const&) {
    throw;
  } catch (std::exception const& e) {
    throw validation_error{
        fmt::format("malformed date \"{}\": {}", s, e.what())};
  }
}

std::string format_date(date_t const d) {
  return boost::gregorian::to_iso_extended_string(d);
}

weekday_t weekday_of(date_t const d) {
  // boost counts from Sunday = 0
  return static_cast<weekday_t>((d.day_of_week().as_number() + 6) % 7);
}

}  // namespace rezzy
