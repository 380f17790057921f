#pragma once
#include "session_date.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace epoch_pipeline {

// Ordered set of trading sessions. Row i of every panel the engine handles
// corresponds to session i of the calendar slice the run covers.
class TradingCalendar {
public:
  TradingCalendar() = default;
  explicit TradingCalendar(std::vector<SessionDate> sessions);

  // Monday to Friday sessions in [first, last], minus the given holidays.
  static TradingCalendar BusinessDays(SessionDate first, SessionDate last,
                                      std::vector<SessionDate> const &holidays = {});

  [[nodiscard]] const std::vector<SessionDate> &Sessions() const noexcept {
    return m_sessions;
  }
  [[nodiscard]] size_t size() const noexcept { return m_sessions.size(); }
  [[nodiscard]] bool empty() const noexcept { return m_sessions.empty(); }

  [[nodiscard]] SessionDate At(size_t index) const;
  [[nodiscard]] bool IsSession(SessionDate date) const;

  // Throws InvalidDateRange when the date is not a session.
  [[nodiscard]] size_t IndexOf(SessionDate date) const;

  [[nodiscard]] std::optional<size_t> FirstOnOrAfter(SessionDate date) const;
  [[nodiscard]] std::optional<size_t> LastOnOrBefore(SessionDate date) const;

  // Sessions with index in [first, last].
  [[nodiscard]] std::vector<SessionDate> Slice(size_t first, size_t last) const;

  // Number of sessions in the range, both ends included.
  [[nodiscard]] size_t Count(DateRange const &range) const;

private:
  std::vector<SessionDate> m_sessions;
};

} // namespace epoch_pipeline
