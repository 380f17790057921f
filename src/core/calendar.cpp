#include <epoch_pipeline/core/calendar.h>
#include <epoch_pipeline/core/errors.h>

#include <algorithm>
#include <fmt/format.h>

namespace epoch_pipeline {

TradingCalendar::TradingCalendar(std::vector<SessionDate> sessions)
    : m_sessions(std::move(sessions)) {
  std::ranges::sort(m_sessions);
  auto [first, last] = std::ranges::unique(m_sessions);
  m_sessions.erase(first, last);
}

TradingCalendar TradingCalendar::BusinessDays(
    SessionDate first, SessionDate last,
    std::vector<SessionDate> const &holidays) {
  if (!first.ok() || !last.ok() || last < first) {
    throw InvalidDateRange(fmt::format("invalid calendar bounds {} .. {}",
                                       ToString(first), ToString(last)));
  }

  std::vector<SessionDate> sessions;
  for (auto day = std::chrono::sys_days{first};
       day <= std::chrono::sys_days{last}; day += std::chrono::days{1}) {
    const std::chrono::weekday weekday{day};
    if (weekday == std::chrono::Saturday || weekday == std::chrono::Sunday) {
      continue;
    }
    SessionDate date{day};
    if (std::ranges::find(holidays, date) != holidays.end()) {
      continue;
    }
    sessions.emplace_back(date);
  }
  return TradingCalendar{std::move(sessions)};
}

SessionDate TradingCalendar::At(size_t index) const {
  if (index >= m_sessions.size()) {
    throw std::out_of_range(fmt::format(
        "session index {} out of range [0, {})", index, m_sessions.size()));
  }
  return m_sessions[index];
}

bool TradingCalendar::IsSession(SessionDate date) const {
  return std::ranges::binary_search(m_sessions, date);
}

size_t TradingCalendar::IndexOf(SessionDate date) const {
  auto it = std::ranges::lower_bound(m_sessions, date);
  if (it == m_sessions.end() || *it != date) {
    throw InvalidDateRange(
        fmt::format("{} is not a trading session", ToString(date)));
  }
  return static_cast<size_t>(std::distance(m_sessions.begin(), it));
}

std::optional<size_t> TradingCalendar::FirstOnOrAfter(SessionDate date) const {
  auto it = std::ranges::lower_bound(m_sessions, date);
  if (it == m_sessions.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(m_sessions.begin(), it));
}

std::optional<size_t> TradingCalendar::LastOnOrBefore(SessionDate date) const {
  auto it = std::ranges::upper_bound(m_sessions, date);
  if (it == m_sessions.begin()) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(m_sessions.begin(), it)) - 1;
}

std::vector<SessionDate> TradingCalendar::Slice(size_t first, size_t last) const {
  if (first > last || last >= m_sessions.size()) {
    throw std::out_of_range(fmt::format("invalid session slice [{}, {}] of {}",
                                        first, last, m_sessions.size()));
  }
  return {m_sessions.begin() + static_cast<std::ptrdiff_t>(first),
          m_sessions.begin() + static_cast<std::ptrdiff_t>(last) + 1};
}

size_t TradingCalendar::Count(DateRange const &range) const {
  return IndexOf(range.last) - IndexOf(range.first) + 1;
}

} // namespace epoch_pipeline
