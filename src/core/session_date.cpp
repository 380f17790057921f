#include <epoch_pipeline/core/session_date.h>

#include <charconv>
#include <fmt/format.h>
#include <stdexcept>

namespace epoch_pipeline {

std::string ToString(SessionDate date) {
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()));
}

std::string ToString(DateRange const &range) {
  return fmt::format("[{}, {}]", ToString(range.first), ToString(range.last));
}

namespace {
int ParseField(std::string_view text, std::string_view field, size_t width) {
  if (field.size() != width) {
    throw std::invalid_argument(
        fmt::format("invalid session date '{}', expected YYYY-MM-DD", text));
  }
  int value{};
  auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
  if (ec != std::errc{} || ptr != field.data() + field.size()) {
    throw std::invalid_argument(
        fmt::format("invalid session date '{}', expected YYYY-MM-DD", text));
  }
  return value;
}
} // namespace

SessionDate ParseSessionDate(std::string_view text) {
  // tolerate a trailing time component, e.g. "2020-01-02 00:00:00"
  auto dateText = text.substr(0, text.find_first_of(" T"));
  const auto firstDash = dateText.find('-');
  const auto secondDash = dateText.find('-', firstDash + 1);
  if (firstDash == std::string_view::npos || secondDash == std::string_view::npos) {
    throw std::invalid_argument(
        fmt::format("invalid session date '{}', expected YYYY-MM-DD", text));
  }

  const auto year = ParseField(text, dateText.substr(0, firstDash), 4);
  const auto month = ParseField(
      text, dateText.substr(firstDash + 1, secondDash - firstDash - 1), 2);
  const auto day = ParseField(text, dateText.substr(secondDash + 1), 2);

  SessionDate date{std::chrono::year{year},
                   std::chrono::month{static_cast<unsigned>(month)},
                   std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    throw std::invalid_argument(fmt::format("invalid calendar date '{}'", text));
  }
  return date;
}

epoch_frame::DateTime ToDateTime(SessionDate date) {
  return epoch_frame::DateTime{date.year(), date.month(), date.day()};
}
} // namespace epoch_pipeline
