#pragma once
#include <chrono>
#include <epoch_frame/datetime.h>
#include <string>
#include <string_view>

namespace epoch_pipeline {
using SessionDate = std::chrono::year_month_day;

// Inclusive range of trading sessions.
struct DateRange {
  SessionDate first;
  SessionDate last;

  bool operator==(const DateRange &) const = default;
};

// ISO-8601 "YYYY-MM-DD".
std::string ToString(SessionDate date);
std::string ToString(DateRange const &range);

// Parses "YYYY-MM-DD", throws std::invalid_argument on malformed input.
SessionDate ParseSessionDate(std::string_view text);

epoch_frame::DateTime ToDateTime(SessionDate date);
} // namespace epoch_pipeline
