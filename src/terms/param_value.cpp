#include <epoch_pipeline/terms/param_value.h>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace epoch_pipeline::term {

epoch_core::ParamType ParamValue::GetType() const {
  return std::visit(
      []<typename V>(const V &) {
        if constexpr (std::is_same_v<V, int64_t>) {
          return epoch_core::ParamType::Integer;
        } else if constexpr (std::is_same_v<V, double>) {
          return epoch_core::ParamType::Decimal;
        } else if constexpr (std::is_same_v<V, bool>) {
          return epoch_core::ParamType::Boolean;
        } else {
          return epoch_core::ParamType::String;
        }
      },
      m_value);
}

int64_t ParamValue::GetInteger() const {
  if (const auto *value = std::get_if<int64_t>(&m_value)) {
    return *value;
  }
  throw std::runtime_error(fmt::format("parameter {} is not an integer", ToString()));
}

double ParamValue::GetDecimal() const {
  if (const auto *value = std::get_if<double>(&m_value)) {
    return *value;
  }
  if (const auto *value = std::get_if<int64_t>(&m_value)) {
    return static_cast<double>(*value);
  }
  throw std::runtime_error(fmt::format("parameter {} is not a decimal", ToString()));
}

bool ParamValue::GetBoolean() const {
  if (const auto *value = std::get_if<bool>(&m_value)) {
    return *value;
  }
  throw std::runtime_error(fmt::format("parameter {} is not a boolean", ToString()));
}

const std::string &ParamValue::GetString() const {
  if (const auto *value = std::get_if<std::string>(&m_value)) {
    return *value;
  }
  throw std::runtime_error(fmt::format("parameter {} is not a string", ToString()));
}

size_t ParamValue::GetHash() const {
  size_t seed = m_value.index();
  std::visit([&](const auto &value) { boost::hash_combine(seed, value); },
             m_value);
  return seed;
}

std::string ParamValue::ToString() const {
  return std::visit(
      []<typename V>(const V &value) -> std::string {
        if constexpr (std::is_same_v<V, std::string>) {
          return fmt::format("'{}'", value);
        } else {
          return fmt::format("{}", value);
        }
      },
      m_value);
}

std::string ToString(ParamMap const &params) {
  std::string result;
  for (auto const &[name, value] : params) {
    if (!result.empty()) {
      result += ", ";
    }
    result += fmt::format("{}={}", name, value.ToString());
  }
  return result;
}

} // namespace epoch_pipeline::term
