#pragma once
#include "term.h"
#include <optional>

namespace epoch_pipeline::term {

// Loadable leaf term reading one column of a dataset.
TermPtr Column(std::string const &dataset, std::string const &column,
               epoch_core::TermKind kind = epoch_core::TermKind::Factor);
TermPtr Column(ColumnRef const &column);

// Set when the term is a dataset column.
std::optional<ColumnRef> GetColumnRef(const Term &term);

namespace EquityPricing {
TermPtr Open();
TermPtr High();
TermPtr Low();
TermPtr Close();
TermPtr Volume();
} // namespace EquityPricing

} // namespace epoch_pipeline::term
