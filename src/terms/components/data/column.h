#pragma once
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/compute.h>
#include <fmt/format.h>

namespace epoch_pipeline::term::components {

// Dataset column. Columns are leaves: the engine fills them from a loader
// and never calls Compute.
class ColumnCompute final : public TermCompute {
public:
  ColumnCompute()
      : TermCompute(ComputeMetaData{
            .id = COLUMN_COMPUTE_ID,
            .kind = epoch_core::TermKind::Null,
            .name = "Dataset Column",
            .defaultWindowLength = 0,
            .params = {{.id = "dataset", .type = epoch_core::ParamType::String},
                       {.id = "column", .type = epoch_core::ParamType::String}},
            .loadable = true,
            .desc = "Raw values of a dataset column, served by a loader"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &) const override {
    throw std::runtime_error("dataset columns are loaded, not computed");
  }

  void Validate(const ParamMap &params, int64_t) const override {
    for (auto const &key : {"dataset", "column"}) {
      if (params.at(key).GetString().empty()) {
        throw InvalidParameter(fmt::format("column: '{}' must not be empty", key));
      }
    }
  }
};

} // namespace epoch_pipeline::term::components
