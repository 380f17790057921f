//
// Pipeline Runner
// Evaluates a YAML pipeline definition over CSV column files and writes the
// resulting (date, asset) table.
//

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <arrow/compute/initialize.h>
#include <epoch_frame/serialization.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <epoch_pipeline/config/engine_config.h>
#include <epoch_pipeline/config/pipeline_config.h>
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/loader/csv_loader.h>
#include <epoch_pipeline/runtime/engine.h>

namespace fs = std::filesystem;
using namespace epoch_pipeline;

struct RunnerConfig {
  fs::path pipeline;
  fs::path data_dir;
  std::string start_date;
  std::string end_date;
  std::optional<std::string> calendar_start;
  std::vector<AssetID> assets;
  std::optional<fs::path> output;
  std::optional<fs::path> engine_config;
  std::optional<size_t> chunk_size;
  bool plan_only{false};
  bool serial{false};
};

// Sessions loaded before --start when no calendar start is given.
constexpr auto DEFAULT_LOOKBACK_DAYS = std::chrono::days{366};

void PrintUsage(const char *prog_name) {
  std::cout << "Usage: " << prog_name << " --pipeline FILE --data DIR --start YYYY-MM-DD"
            << " --end YYYY-MM-DD --assets A,B,... [options]\n"
            << "Options:\n"
            << "  --pipeline FILE          Pipeline definition (YAML)\n"
            << "  --data DIR               Directory of <dataset>.<column>.csv files\n"
            << "  --start YYYY-MM-DD       First output session\n"
            << "  --end YYYY-MM-DD         Last output session\n"
            << "  --assets A,B,...         Asset universe, in output order\n"
            << "  --calendar-start DATE    First calendar session (default: a year before --start)\n"
            << "  --output FILE            Write the result as CSV (default: stdout)\n"
            << "  --config FILE            Engine configuration (YAML)\n"
            << "  --chunk-size N           Evaluate N sessions at a time\n"
            << "  --serial                 Evaluate nodes one at a time\n"
            << "  --plan                   Print the execution plan as JSON and exit\n"
            << "  --help                   Show this help\n";
}

std::vector<AssetID> SplitAssets(std::string const &list) {
  std::vector<AssetID> assets;
  std::stringstream stream(list);
  std::string asset;
  while (std::getline(stream, asset, ',')) {
    if (!asset.empty()) {
      assets.push_back(asset);
    }
  }
  return assets;
}

RunnerConfig ParseArgs(int argc, char *argv[]) {
  RunnerConfig config;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      exit(0);
    } else if (arg == "--pipeline" && i + 1 < argc) {
      config.pipeline = argv[++i];
    } else if (arg == "--data" && i + 1 < argc) {
      config.data_dir = argv[++i];
    } else if (arg == "--start" && i + 1 < argc) {
      config.start_date = argv[++i];
    } else if (arg == "--end" && i + 1 < argc) {
      config.end_date = argv[++i];
    } else if (arg == "--calendar-start" && i + 1 < argc) {
      config.calendar_start = argv[++i];
    } else if (arg == "--assets" && i + 1 < argc) {
      config.assets = SplitAssets(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      config.output = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      config.engine_config = argv[++i];
    } else if (arg == "--chunk-size" && i + 1 < argc) {
      config.chunk_size = std::stoul(argv[++i]);
    } else if (arg == "--plan") {
      config.plan_only = true;
    } else if (arg == "--serial") {
      config.serial = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      exit(1);
    }
  }

  const bool missing = config.pipeline.empty() ||
                       (!config.plan_only &&
                        (config.data_dir.empty() || config.start_date.empty() ||
                         config.end_date.empty() || config.assets.empty()));
  if (missing) {
    PrintUsage(argv[0]);
    exit(1);
  }
  return config;
}

void PrintResult(runtime::PipelineResult const &result) {
  const auto names = result.GetColumnNames();
  std::unordered_map<std::string, std::vector<int64_t>> labels;
  for (auto const &name : names) {
    if (result.GetKind(name) == epoch_core::TermKind::Classifier) {
      labels.emplace(name, result.GetClassifier(name));
    }
  }

  std::cout << fmt::format("date,asset,{}\n", fmt::join(names, ","));
  for (size_t row = 0; row < result.num_rows(); ++row) {
    std::vector<std::string> cells;
    cells.reserve(names.size());
    for (auto const &name : names) {
      const auto value = result.GetValue(name, row);
      switch (result.GetKind(name)) {
      case epoch_core::TermKind::Filter:
        cells.emplace_back(value != 0.0 ? "true" : "false");
        break;
      case epoch_core::TermKind::Classifier:
        cells.emplace_back(fmt::format("{}", labels.at(name)[row]));
        break;
      default:
        cells.emplace_back(std::isnan(value) ? "" : fmt::format("{}", value));
        break;
      }
    }
    std::cout << fmt::format("{},{},{}\n", ToString(result.GetDates()[row]),
                             result.GetAssets()[row], fmt::join(cells, ","));
  }
}

int Run(RunnerConfig const &runner) {
  auto engineConfig = runner.engine_config
                          ? config::LoadEngineConfig(*runner.engine_config)
                          : config::EngineConfig{};
  if (runner.serial) {
    engineConfig.parallel = false;
  }
  spdlog::set_level(config::ParseLogLevel(engineConfig.logLevel));

  const auto pipeline = config::LoadPipelineConfig(runner.pipeline);
  if (runner.plan_only) {
    std::cout << pipeline.ToExecutionPlan().ToJson() << "\n";
    return 0;
  }

  const auto start = ParseSessionDate(runner.start_date);
  const auto end = ParseSessionDate(runner.end_date);
  const auto calendarStart =
      runner.calendar_start
          ? ParseSessionDate(*runner.calendar_start)
          : SessionDate{std::chrono::sys_days{start} - DEFAULT_LOOKBACK_DAYS};
  auto calendar = TradingCalendar::BusinessDays(calendarStart, end);

  auto loader = std::make_shared<loader::CsvDirectoryLoader>(runner.data_dir, calendar);
  runtime::PipelineEngine engine(loader, std::move(calendar), engineConfig);

  const auto result = engine.RunChunked(pipeline, start, end, runner.assets,
                                        runner.chunk_size.value_or(0));
  auto const &statistics = result.GetStatistics();
  SPDLOG_INFO("Evaluated {} sessions: {} rows, {} nodes, {} loads, peak cache {}",
              statistics.sessions, result.num_rows(), statistics.nodesComputed,
              statistics.loaderRequests, statistics.peakCachedNodes);

  if (!runner.output) {
    PrintResult(result);
    return 0;
  }
  auto status = epoch_frame::write_csv_file(result.ToDataFrame(), runner.output->string());
  if (!status.ok()) {
    throw std::runtime_error("Failed to write " + runner.output->string() + ": " +
                             status.ToString());
  }
  SPDLOG_INFO("Saved {}", runner.output->string());
  return 0;
}

int main(int argc, char *argv[]) {
  try {
    const auto runner = ParseArgs(argc, argv);
    auto arrowComputeStatus = arrow::compute::Initialize();
    if (!arrowComputeStatus.ok()) {
      throw std::runtime_error("arrow compute initialization failed: " +
                               arrowComputeStatus.ToString());
    }
    return Run(runner);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid argument: " << e.what() << "\n";
    return 1;
  } catch (const BuildError &e) {
    std::cerr << "Invalid pipeline: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Run failed: " << e.what() << "\n";
    return 1;
  }
}
