#include <epoch_pipeline/terms/dataset.h>

namespace epoch_pipeline::term {

TermPtr Column(std::string const &dataset, std::string const &column,
               epoch_core::TermKind kind) {
  return MakeTerm(TermSpec{
      .compute = COLUMN_COMPUTE_ID,
      .params = {{"dataset", dataset}, {"column", column}},
      .kind = kind});
}

TermPtr Column(ColumnRef const &column) {
  return Column(column.dataset, column.column, column.kind);
}

std::optional<ColumnRef> GetColumnRef(const Term &term) {
  if (term.GetComputeId() != COLUMN_COMPUTE_ID) {
    return std::nullopt;
  }
  return ColumnRef{.dataset = term.GetParam("dataset").GetString(),
                   .column = term.GetParam("column").GetString(),
                   .kind = term.GetKind()};
}

namespace EquityPricing {
TermPtr Open() { return Column(EQUITY_PRICING_DATASET, "open"); }
TermPtr High() { return Column(EQUITY_PRICING_DATASET, "high"); }
TermPtr Low() { return Column(EQUITY_PRICING_DATASET, "low"); }
TermPtr Close() { return Column(EQUITY_PRICING_DATASET, "close"); }
TermPtr Volume() { return Column(EQUITY_PRICING_DATASET, "volume"); }
} // namespace EquityPricing

} // namespace epoch_pipeline::term
