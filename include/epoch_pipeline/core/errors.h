#pragma once
//
// Exception hierarchy for pipeline definition and evaluation.
// BuildError subclasses are raised before any data is loaded, RunError
// subclasses while a run is in progress.
//

#include "session_date.h"
#include "constants.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace epoch_pipeline {

class PipelineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// Build-time errors
// ============================================================================

class BuildError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class CyclicDependency : public BuildError {
public:
  explicit CyclicDependency(std::vector<std::string> chain);

  // Node names along the cycle, first node repeated at the end.
  [[nodiscard]] const std::vector<std::string> &GetChain() const noexcept {
    return m_chain;
  }

private:
  std::vector<std::string> m_chain;
};

class UnsupportedDType : public BuildError {
public:
  using BuildError::BuildError;
};

class DuplicateOutputName : public BuildError {
public:
  explicit DuplicateOutputName(std::string const &name);

  [[nodiscard]] const std::string &GetName() const noexcept { return m_name; }

private:
  std::string m_name;
};

class InvalidWindowLength : public BuildError {
public:
  using BuildError::BuildError;
};

class WindowLengthNotSpecified : public BuildError {
public:
  using BuildError::BuildError;
};

class TermInputsNotSpecified : public BuildError {
public:
  using BuildError::BuildError;
};

class InvalidParameter : public BuildError {
public:
  using BuildError::BuildError;
};

class UnknownComputeDefinition : public BuildError {
public:
  explicit UnknownComputeDefinition(std::string const &id);
};

class PipelineDefinitionError : public BuildError {
public:
  using BuildError::BuildError;
};

class ConfigurationError : public BuildError {
public:
  using BuildError::BuildError;
};

// ============================================================================
// Run-time errors
// ============================================================================

class RunError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class LoaderFailure : public RunError {
public:
  LoaderFailure(std::string node, DateRange range, std::vector<AssetID> assets,
                std::string const &reason);

  [[nodiscard]] const std::string &GetNode() const noexcept { return m_node; }
  [[nodiscard]] const DateRange &GetDateRange() const noexcept { return m_range; }
  [[nodiscard]] const std::vector<AssetID> &GetAssets() const noexcept {
    return m_assets;
  }

private:
  std::string m_node;
  DateRange m_range;
  std::vector<AssetID> m_assets;
};

class WindowLengthTooLong : public RunError {
public:
  using RunError::RunError;
};

class InvalidDateRange : public RunError {
public:
  using RunError::RunError;
};

class InvalidAssetUniverse : public RunError {
public:
  using RunError::RunError;
};

} // namespace epoch_pipeline
