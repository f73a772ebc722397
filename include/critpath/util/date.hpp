#pragma once

#include "critpath/core/error.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <string>
#include <string_view>

namespace critpath {

// Whole calendar days; scheduling never looks at time of day.
using Date = std::chrono::sys_days;

[[nodiscard]] inline auto make_date(int y, unsigned m, unsigned d) -> Date {
  return Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

// 0 = Sunday .. 6 = Saturday
[[nodiscard]] inline auto weekday_index(Date date) noexcept -> unsigned {
  return std::chrono::weekday{date}.c_encoding();
}

[[nodiscard]] inline auto add_days(Date date, int days) noexcept -> Date {
  return date + std::chrono::days{days};
}

// Parses "YYYY-MM-DD".
[[nodiscard]] inline auto parse_date(std::string_view text) -> Result<Date> {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return fail(Error::ParseError);
  }
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  auto parse_part = [](std::string_view part, auto& out) {
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out);
    return ec == std::errc{} && ptr == part.data() + part.size();
  };
  if (!parse_part(text.substr(0, 4), y) || !parse_part(text.substr(5, 2), m) ||
      !parse_part(text.substr(8, 2), d)) {
    return fail(Error::ParseError);
  }
  std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                  std::chrono::day{d}};
  if (!ymd.ok()) {
    return fail(Error::ParseError);
  }
  return ok(Date{ymd});
}

[[nodiscard]] inline auto format_date(Date date) -> std::string {
  return std::format("{:%Y-%m-%d}", date);
}

}  // namespace critpath
