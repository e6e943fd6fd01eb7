#pragma once

#include <string>
#include <string_view>

#include "rezzy/types.h"

namespace rezzy {

// "HH:MM" or "HH:MM:SS" -> minutes since midnight
minutes_t parse_time(std::string_view);
std::string format_time(minutes_t);

// "YYYY-MM-DD"
date_t parse_date(std::string_view);
std::string format_date(date_t);

weekday_t weekday_of(date_t);

}  // namespace rezzy
