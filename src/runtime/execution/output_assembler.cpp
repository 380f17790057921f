#include "output_assembler.h"

#include <spdlog/spdlog.h>

namespace epoch_pipeline::runtime {

arma::mat OutputAssembler::RangeRows(size_t index) const {
  auto const &node = m_context.plan.GetNode(index);
  const auto panel = m_context.cache.Get(node.term);
  const auto offset = static_cast<arma::uword>(node.extraRows);
  return panel->rows(offset, panel->n_rows - 1);
}

PipelineResult OutputAssembler::Assemble(RunStatistics statistics) const {
  auto const &plan = m_context.plan;
  auto const &assets = m_context.assets;
  const auto sessions = m_context.RangeLength();

  std::optional<arma::mat> screen;
  if (plan.Screen()) {
    screen = RangeRows(*plan.Screen());
  }

  std::vector<arma::mat> panels;
  std::vector<ResultColumn> columns;
  panels.reserve(plan.Outputs().size());
  columns.reserve(plan.Outputs().size());
  for (auto const &[name, index] : plan.Outputs()) {
    panels.emplace_back(RangeRows(index));
    columns.push_back(ResultColumn{
        .name = name, .kind = plan.GetNode(index).term->GetKind(), .values = {}});
  }

  std::vector<SessionDate> dates;
  std::vector<AssetID> rowAssets;
  for (size_t t = 0; t < sessions; ++t) {
    const auto date = m_context.calendar.At(m_context.startIndex + t);
    for (size_t j = 0; j < assets.size(); ++j) {
      if (screen && (*screen)(t, j) == 0.0) {
        continue;
      }
      dates.push_back(date);
      rowAssets.push_back(assets[j]);
      for (size_t c = 0; c < columns.size(); ++c) {
        columns[c].values.push_back(panels[c](t, j));
      }
    }
  }

  SPDLOG_DEBUG("Assembled {} rows from {} sessions x {} assets", dates.size(),
               sessions, assets.size());
  return PipelineResult(std::move(dates), std::move(rowAssets), std::move(columns),
                        statistics);
}

} // namespace epoch_pipeline::runtime
