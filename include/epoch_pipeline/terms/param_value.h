#pragma once
#include <epoch_pipeline/core/constants.h>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace epoch_pipeline::term {

// Immutable scalar parameter bound to a term at construction.
class ParamValue {
public:
  using T = std::variant<int64_t, double, bool, std::string>;

  ParamValue(int value) : m_value(static_cast<int64_t>(value)) {}
  ParamValue(int64_t value) : m_value(value) {}
  ParamValue(double value) : m_value(value) {}
  ParamValue(bool value) : m_value(value) {}
  ParamValue(std::string value) : m_value(std::move(value)) {}
  ParamValue(const char *value) : m_value(std::string{value}) {}

  [[nodiscard]] epoch_core::ParamType GetType() const;

  [[nodiscard]] int64_t GetInteger() const;
  // Integers are widened to decimals.
  [[nodiscard]] double GetDecimal() const;
  [[nodiscard]] bool GetBoolean() const;
  [[nodiscard]] const std::string &GetString() const;

  [[nodiscard]] const T &GetVariant() const noexcept { return m_value; }
  [[nodiscard]] size_t GetHash() const;
  [[nodiscard]] std::string ToString() const;

  bool operator==(const ParamValue &other) const = default;

private:
  T m_value;
};

// Ordered by name so that construction order never affects identity.
using ParamMap = std::map<std::string, ParamValue>;

std::string ToString(ParamMap const &params);

} // namespace epoch_pipeline::term
