#include <epoch_pipeline/core/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace epoch_pipeline {

CyclicDependency::CyclicDependency(std::vector<std::string> chain)
    : BuildError(fmt::format("Cyclic dependency detected: {}",
                             fmt::join(chain, " -> "))),
      m_chain(std::move(chain)) {}

DuplicateOutputName::DuplicateOutputName(std::string const &name)
    : BuildError(fmt::format("Duplicate pipeline output name: '{}'", name)),
      m_name(name) {}

UnknownComputeDefinition::UnknownComputeDefinition(std::string const &id)
    : BuildError(fmt::format("Unknown compute definition: '{}'", id)) {}

LoaderFailure::LoaderFailure(std::string node, DateRange range,
                             std::vector<AssetID> assets,
                             std::string const &reason)
    : RunError(fmt::format("Loader failed for node {} over {} (assets: {}): {}",
                           node, ToString(range), fmt::join(assets, ","),
                           reason)),
      m_node(std::move(node)), m_range(range), m_assets(std::move(assets)) {}

} // namespace epoch_pipeline
