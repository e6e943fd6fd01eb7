#pragma once

#include <chrono>
#include <cstdint>

#include "boost/date_time/gregorian/gregorian_types.hpp"

namespace rezzy {

using table_id_t = std::uint32_t;
using chair_id_t = std::uint32_t;
using customer_id_t = std::uint32_t;
using reservation_id_t = std::uint32_t;

// minutes since midnight, or a duration in minutes
using minutes_t = std::int32_t;

// 0 = Monday .. 6 = Sunday
using weekday_t = std::uint8_t;

using date_t = boost::gregorian::date;
using timestamp_t = std::chrono::system_clock::time_point;

constexpr auto const kMinutesPerDay = minutes_t{24 * 60};

}  // namespace rezzy
