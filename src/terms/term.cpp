#include <epoch_pipeline/terms/term.h>

#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/dataset.h>
#include <epoch_pipeline/terms/registry.h>

#include <algorithm>
#include <boost/container_hash/hash.hpp>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace epoch_pipeline::term {
using epoch_core::ParamType;
using epoch_core::ParamTypeWrapper;
using epoch_core::TermKind;
using epoch_core::TermKindWrapper;

namespace {

ParamValue CoerceParam(const ComputeMetaData &meta, const ParamSpec &spec,
                       const ParamValue &value) {
  const auto type = value.GetType();
  if (type == spec.type) {
    return value;
  }
  if (spec.type == ParamType::Decimal && type == ParamType::Integer) {
    return ParamValue{value.GetDecimal()};
  }
  if (spec.type == ParamType::Integer && type == ParamType::Decimal) {
    const double decimal = value.GetDecimal();
    if (std::trunc(decimal) == decimal) {
      return ParamValue{static_cast<int64_t>(decimal)};
    }
  }
  throw InvalidParameter(fmt::format(
      "{}: parameter '{}' expects {}, got {} ({})", meta.id, spec.id,
      ParamTypeWrapper::ToString(spec.type), ParamTypeWrapper::ToString(type),
      value.ToString()));
}

ParamMap ResolveParams(const ComputeMetaData &meta, ParamMap params) {
  ParamMap resolved;
  for (auto const &spec : meta.params) {
    auto it = params.find(spec.id);
    if (it == params.end()) {
      if (!spec.defaultValue) {
        throw InvalidParameter(fmt::format(
            "{}: missing required parameter '{}'", meta.id, spec.id));
      }
      resolved.emplace(spec.id, *spec.defaultValue);
      continue;
    }
    resolved.emplace(spec.id, CoerceParam(meta, spec, it->second));
    params.erase(it);
  }

  if (!params.empty()) {
    throw InvalidParameter(fmt::format("{}: unknown parameter '{}'", meta.id,
                                       params.begin()->first));
  }
  return resolved;
}

TermKind ResolveKind(const ComputeMetaData &meta,
                     std::optional<TermKind> requested,
                     const std::vector<TermPtr> &inputs) {
  if (requested == TermKind::Null) {
    requested.reset();
  }

  if (meta.kind != TermKind::Null) {
    if (requested && *requested != meta.kind) {
      throw UnsupportedDType(fmt::format(
          "{} produces a {}, cannot build it as a {}", meta.id,
          TermKindWrapper::ToString(meta.kind),
          TermKindWrapper::ToString(*requested)));
    }
    return meta.kind;
  }
  if (requested) {
    return *requested;
  }
  return inputs.empty() ? TermKind::Factor : inputs.front()->GetKind();
}

void ValidateInputs(const ComputeMetaData &meta,
                    const std::vector<TermPtr> &inputs) {
  if (meta.loadable) {
    if (!inputs.empty()) {
      throw TermInputsNotSpecified(fmt::format(
          "{} is loaded from a dataset and takes no inputs, got {}", meta.id,
          inputs.size()));
    }
    return;
  }

  if (inputs.empty()) {
    throw TermInputsNotSpecified(fmt::format(
        "{} requires inputs and declares no default inputs", meta.id));
  }

  const auto required = static_cast<size_t>(std::ranges::count_if(
      meta.inputs, [](InputSlot const &slot) { return !slot.optional; }));
  if (inputs.size() < required || inputs.size() > meta.inputs.size()) {
    throw TermInputsNotSpecified(
        fmt::format("{} expects {} to {} inputs, got {}", meta.id, required,
                    meta.inputs.size(), inputs.size()));
  }

  for (size_t i = 0; i < inputs.size(); ++i) {
    const auto &slot = meta.inputs[i];
    if (!inputs[i]) {
      throw TermInputsNotSpecified(
          fmt::format("{}: input '{}' is null", meta.id, slot.id));
    }
    if (slot.kind != TermKind::Null && inputs[i]->GetKind() != slot.kind) {
      throw UnsupportedDType(fmt::format(
          "{}: input '{}' must be a {}, got a {} ({})", meta.id, slot.id,
          TermKindWrapper::ToString(slot.kind),
          TermKindWrapper::ToString(inputs[i]->GetKind()),
          inputs[i]->ToString()));
    }
  }
}

int64_t ResolveWindowLength(const ComputeMetaData &meta,
                            std::optional<int64_t> requested) {
  int64_t windowLength{};
  if (requested) {
    windowLength = *requested;
  } else if (meta.defaultWindowLength) {
    windowLength = *meta.defaultWindowLength;
  } else {
    throw WindowLengthNotSpecified(
        fmt::format("{} requires a window_length", meta.id));
  }

  if (windowLength < 0) {
    throw InvalidWindowLength(fmt::format(
        "{}: window_length must be non-negative, got {}", meta.id, windowLength));
  }
  if (windowLength < meta.minWindowLength) {
    throw InvalidWindowLength(
        fmt::format("{}: window_length must be at least {}, got {}", meta.id,
                    meta.minWindowLength, windowLength));
  }
  if (meta.loadable && windowLength != 0) {
    throw InvalidWindowLength(fmt::format(
        "{}: loadable terms have no window, got {}", meta.id, windowLength));
  }
  return windowLength;
}

} // namespace

Term::Term(Key, ITermComputePtr compute, TermKind kind, std::vector<TermPtr> inputs,
           int64_t windowLength, TermPtr mask, ParamMap params)
    : m_compute(std::move(compute)), m_kind(kind), m_inputs(std::move(inputs)),
      m_windowLength(windowLength), m_mask(std::move(mask)),
      m_params(std::move(params)), m_hash(ComputeHash()) {}

const std::string &Term::GetComputeId() const noexcept {
  return m_compute->GetMetaData().id;
}

const ParamValue &Term::GetParam(std::string const &name) const {
  auto it = m_params.find(name);
  if (it == m_params.end()) {
    throw std::out_of_range(
        fmt::format("{} has no parameter '{}'", GetComputeId(), name));
  }
  return it->second;
}

size_t Term::ComputeHash() const {
  size_t seed = 0;
  boost::hash_combine(seed, GetComputeId());
  boost::hash_combine(seed, static_cast<int>(m_kind));
  boost::hash_combine(seed, m_windowLength);
  for (auto const &[name, value] : m_params) {
    boost::hash_combine(seed, name);
    boost::hash_combine(seed, value.GetHash());
  }
  boost::hash_combine(seed, m_inputs.size());
  for (auto const &input : m_inputs) {
    boost::hash_combine(seed, input->GetHash());
  }
  boost::hash_combine(seed, m_mask ? m_mask->GetHash() : 0);
  return seed;
}

std::string Term::ToString() const {
  if (auto column = GetColumnRef(*this)) {
    return fmt::format("{}.{}", column->dataset, column->column);
  }

  std::vector<std::string> parts;
  parts.reserve(m_inputs.size() + 3);
  for (auto const &input : m_inputs) {
    parts.emplace_back(input->ToString());
  }
  if (m_windowLength > 0) {
    parts.emplace_back(fmt::format("window_length={}", m_windowLength));
  }
  if (!m_params.empty()) {
    parts.emplace_back(epoch_pipeline::term::ToString(m_params));
  }
  if (m_mask) {
    parts.emplace_back(fmt::format("mask={}", m_mask->ToString()));
  }
  return fmt::format("{}({})", GetComputeId(), fmt::join(parts, ", "));
}

bool Term::operator==(const Term &other) const {
  if (this == &other) {
    return true;
  }
  if (m_hash != other.m_hash || m_kind != other.m_kind ||
      m_windowLength != other.m_windowLength ||
      GetComputeId() != other.GetComputeId() || m_params != other.m_params ||
      m_inputs.size() != other.m_inputs.size()) {
    return false;
  }
  for (size_t i = 0; i < m_inputs.size(); ++i) {
    if (!SameTerm(m_inputs[i], other.m_inputs[i])) {
      return false;
    }
  }
  return SameTerm(m_mask, other.m_mask);
}

bool SameTerm(const TermPtr &lhs, const TermPtr &rhs) {
  if (lhs == rhs) {
    return true;
  }
  return lhs && rhs && *lhs == *rhs;
}

TermPtr MakeTerm(ITermComputePtr compute, TermSpec spec) {
  if (!compute) {
    throw UnknownComputeDefinition(spec.compute);
  }
  const auto &meta = compute->GetMetaData();

  auto inputs = std::move(spec.inputs);
  if (inputs.empty() && !meta.defaultInputs.empty()) {
    for (auto const &column : meta.defaultInputs) {
      inputs.emplace_back(Column(column));
    }
  }
  ValidateInputs(meta, inputs);

  const auto windowLength = ResolveWindowLength(meta, spec.windowLength);

  if (spec.mask) {
    if (!spec.mask->IsFilter()) {
      throw UnsupportedDType(fmt::format(
          "{}: mask must be a Filter, got a {} ({})", meta.id,
          TermKindWrapper::ToString(spec.mask->GetKind()),
          spec.mask->ToString()));
    }
    if (meta.loadable) {
      throw PipelineDefinitionError(
          fmt::format("{}: loadable terms cannot be masked", meta.id));
    }
  }

  auto params = ResolveParams(meta, std::move(spec.params));
  compute->Validate(params, windowLength);

  const auto kind = ResolveKind(meta, spec.kind, inputs);
  return std::make_shared<const Term>(Term::Key{}, std::move(compute), kind,
                                     std::move(inputs), windowLength,
                                     std::move(spec.mask), std::move(params));
}

TermPtr MakeTerm(TermSpec spec) {
  auto compute = ComputeRegistry::GetInstance().Get(spec.compute);
  return MakeTerm(std::move(compute), std::move(spec));
}

} // namespace epoch_pipeline::term
