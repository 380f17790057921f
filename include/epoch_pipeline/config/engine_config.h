#pragma once
#include <cstddef>
#include <filesystem>
#include <spdlog/common.h>
#include <string>
#include <yaml-cpp/yaml.h>

namespace epoch_pipeline::config {

struct EngineConfig {
  // Evaluate independent branches of the graph concurrently.
  bool parallel{true};
  // Worker limit for parallel runs, 0 leaves it to TBB.
  size_t maxConcurrency{0};
  // Raise WindowLengthTooLong instead of padding lookback that reaches
  // before the first calendar session.
  bool strictLookback{false};
  // Sessions per chunk for chunked runs, 0 evaluates the range at once.
  size_t chunkSize{0};
  std::string logLevel{"info"};

  bool operator==(EngineConfig const &) const = default;
};

// Throws ConfigurationError for unknown level names.
spdlog::level::level_enum ParseLogLevel(std::string const &level);

// Throws ConfigurationError when the file cannot be read or decoded.
EngineConfig LoadEngineConfig(std::filesystem::path const &path);
EngineConfig LoadEngineConfig(YAML::Node const &node);

} // namespace epoch_pipeline::config

namespace YAML {
template <> struct convert<epoch_pipeline::config::EngineConfig> {
  static Node encode(epoch_pipeline::config::EngineConfig const &config);
  static bool decode(Node const &node, epoch_pipeline::config::EngineConfig &config);
};
} // namespace YAML
