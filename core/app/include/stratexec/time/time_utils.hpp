#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace stratexec {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that turn epoch milliseconds into the calendar
//         quantities the scheduler needs: a local day number and a local
//         minute-of-day under a fixed UTC offset.
//
// @details
// Sessions are described with fixed offsets (e.g. +480 minutes for
// Shanghai) rather than zone names, so no timezone database is consulted
// and results are identical on every host. The one daylight-saving rule the
// scheduler needs (US Eastern) is computed from the calendar below.
//
// Calendar days are counted from 1970-01-01 (day 0, a Thursday) in the
// proleptic Gregorian calendar.
//
// Thread-safety: Stateless — safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerMinute = 60 * 1000;
constexpr std::int64_t kMinutesPerDay = 24 * 60;
constexpr std::int64_t kMsPerDay = kMinutesPerDay * kMsPerMinute;

// Floor division that rounds towards negative infinity, so timestamps
// before the epoch still map to the correct day.
inline std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// -------------------------------------------------------------------------
// local_day_index
// -------------------------------------------------------------------------
// @brief  Days since 1970-01-01 in the local calendar of the given offset.
//
// @param  epoch_ms           UTC timestamp.
// @param  utc_offset_minutes Local time minus UTC, in minutes.
// -------------------------------------------------------------------------
inline std::int64_t local_day_index(std::int64_t epoch_ms,
                                    int utc_offset_minutes) {
  return floor_div(epoch_ms + utc_offset_minutes * kMsPerMinute, kMsPerDay);
}

// -------------------------------------------------------------------------
// local_minute_of_day
// -------------------------------------------------------------------------
// @brief  Minutes elapsed since local midnight, in [0, 1440).
// -------------------------------------------------------------------------
inline int local_minute_of_day(std::int64_t epoch_ms, int utc_offset_minutes) {
  std::int64_t local_ms = epoch_ms + utc_offset_minutes * kMsPerMinute;
  std::int64_t ms_into_day = local_ms - floor_div(local_ms, kMsPerDay) * kMsPerDay;
  return static_cast<int>(ms_into_day / kMsPerMinute);
}

// -------------------------------------------------------------------------
// parse_hhmm
// -------------------------------------------------------------------------
// @brief  Parses "HH:MM" into minutes after midnight.
//
// @return Minutes in [0, 1440], or std::nullopt for anything else. "24:00"
//         is accepted and means end of day.
// -------------------------------------------------------------------------
inline std::optional<int> parse_hhmm(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 3 != text.size()) {
    return std::nullopt;
  }
  int hours = 0;
  for (std::size_t i = 0; i < colon; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return std::nullopt;
    }
    hours = hours * 10 + (text[i] - '0');
  }
  if (text[colon + 1] < '0' || text[colon + 1] > '9' ||
      text[colon + 2] < '0' || text[colon + 2] > '9') {
    return std::nullopt;
  }
  int minutes = (text[colon + 1] - '0') * 10 + (text[colon + 2] - '0');
  if (minutes >= 60 || hours > 24 || (hours == 24 && minutes != 0)) {
    return std::nullopt;
  }
  return hours * 60 + minutes;
}

// -------------------------------------------------------------------------
// Civil calendar
// -------------------------------------------------------------------------
struct CivilDate {
  int year{1970};
  unsigned month{1};  // 1..12
  unsigned day{1};    // 1..31
};

// Day number of a civil date.
inline std::int64_t days_from_civil(int year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = floor_div(year, 400);
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline CivilDate civil_from_days(std::int64_t days) {
  days += 719468;
  const std::int64_t era = floor_div(days, 146097);
  const auto doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  CivilDate date;
  date.day = doy - (153 * mp + 2) / 5 + 1;
  date.month = mp < 10 ? mp + 3 : mp - 9;
  date.year = static_cast<int>(yoe + era * 400) + (date.month <= 2 ? 1 : 0);
  return date;
}

// 0 = Monday ... 6 = Sunday.
inline int weekday_from_days(std::int64_t days) {
  return static_cast<int>((days + 3) - floor_div(days + 3, 7) * 7);
}

// "YYYY-MM-DD".
inline std::string format_date(std::int64_t days) {
  CivilDate date = civil_from_days(days);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year,
                date.month, date.day);
  return buffer;
}

// Parses "YYYY-MM-DD"; std::nullopt for anything else, including dates that
// do not exist.
inline std::optional<std::int64_t> parse_date(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  int fields[3] = {0, 0, 0};
  const std::size_t starts[3] = {0, 5, 8};
  const std::size_t lengths[3] = {4, 2, 2};
  for (int f = 0; f < 3; ++f) {
    for (std::size_t i = 0; i < lengths[f]; ++i) {
      char c = text[starts[f] + i];
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      fields[f] = fields[f] * 10 + (c - '0');
    }
  }
  if (fields[1] < 1 || fields[1] > 12 || fields[2] < 1) {
    return std::nullopt;
  }
  const std::int64_t days =
      days_from_civil(fields[0], static_cast<unsigned>(fields[1]),
                      static_cast<unsigned>(fields[2]));
  CivilDate check = civil_from_days(days);
  if (check.month != static_cast<unsigned>(fields[1]) ||
      check.day != static_cast<unsigned>(fields[2])) {
    return std::nullopt;
  }
  return days;
}

// -------------------------------------------------------------------------
// us_eastern_offset_minutes
// -------------------------------------------------------------------------
// @brief  UTC offset of US Eastern time at epoch_ms: -240 (EDT) from the
//         second Sunday of March 02:00 EST to the first Sunday of November
//         02:00 EDT, -300 (EST) otherwise.
// -------------------------------------------------------------------------
inline int us_eastern_offset_minutes(std::int64_t epoch_ms) {
  constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;
  const int year = civil_from_days(local_day_index(epoch_ms, -300)).year;

  auto first_sunday = [year](unsigned month) {
    std::int64_t first = days_from_civil(year, month, 1);
    return first + (6 - weekday_from_days(first));
  };
  // 02:00 EST = 07:00 UTC; 02:00 EDT = 06:00 UTC.
  const std::int64_t dst_start =
      (first_sunday(3) + 7) * kMsPerDay + 7 * kMsPerHour;
  const std::int64_t dst_end =
      first_sunday(11) * kMsPerDay + 6 * kMsPerHour;
  return epoch_ms >= dst_start && epoch_ms < dst_end ? -240 : -300;
}

}  // namespace stratexec
