#include <epoch_pipeline/config/engine_config.h>

#include <epoch_pipeline/core/errors.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace YAML {

Node convert<epoch_pipeline::config::EngineConfig>::encode(
    epoch_pipeline::config::EngineConfig const &config) {
  Node node;
  node["parallel"] = config.parallel;
  node["max_concurrency"] = config.maxConcurrency;
  node["strict_lookback"] = config.strictLookback;
  node["chunk_size"] = config.chunkSize;
  node["log_level"] = config.logLevel;
  return node;
}

bool convert<epoch_pipeline::config::EngineConfig>::decode(
    Node const &node, epoch_pipeline::config::EngineConfig &config) {
  if (!node.IsMap()) {
    return false;
  }
  const epoch_pipeline::config::EngineConfig defaults;
  config.parallel = node["parallel"].as<bool>(defaults.parallel);
  config.maxConcurrency = node["max_concurrency"].as<size_t>(defaults.maxConcurrency);
  config.strictLookback = node["strict_lookback"].as<bool>(defaults.strictLookback);
  config.chunkSize = node["chunk_size"].as<size_t>(defaults.chunkSize);
  config.logLevel = node["log_level"].as<std::string>(defaults.logLevel);
  return true;
}

} // namespace YAML

namespace epoch_pipeline::config {

spdlog::level::level_enum ParseLogLevel(std::string const &level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    throw ConfigurationError(fmt::format("unknown log level '{}'", level));
  }
  return parsed;
}

EngineConfig LoadEngineConfig(YAML::Node const &node) {
  if (!node || node.IsNull()) {
    return {};
  }
  EngineConfig config;
  try {
    config = node.as<EngineConfig>();
  } catch (YAML::Exception const &e) {
    throw ConfigurationError(fmt::format("invalid engine config: {}", e.what()));
  }
  ParseLogLevel(config.logLevel);
  return config;
}

EngineConfig LoadEngineConfig(std::filesystem::path const &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path.string());
  } catch (YAML::Exception const &e) {
    throw ConfigurationError(
        fmt::format("failed to read engine config {}: {}", path.string(), e.what()));
  }
  SPDLOG_DEBUG("Loaded engine config from {}", path.string());
  return LoadEngineConfig(node);
}

} // namespace epoch_pipeline::config
