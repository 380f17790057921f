#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/terms/compute.h>
#include <map>

namespace epoch_pipeline::term::components {

// Partitions the assets with a present value into groups. Without a
// classifier there is a single group; assets with a missing label are left
// out.
inline std::vector<std::vector<arma::uword>>
GroupIndices(const arma::rowvec &values, const arma::rowvec *labels) {
  if (labels == nullptr) {
    return {ValidIndices(values)};
  }

  std::map<double, std::vector<arma::uword>> groups;
  for (arma::uword j = 0; j < values.n_elem; ++j) {
    if (std::isnan(values(j)) || std::isnan((*labels)(j))) {
      continue;
    }
    groups[(*labels)(j)].push_back(j);
  }

  std::vector<std::vector<arma::uword>> result;
  result.reserve(groups.size());
  for (auto &[label, indices] : groups) {
    result.emplace_back(std::move(indices));
  }
  return result;
}

// Today's cross-section and, when the optional groupby input is bound, the
// matching classifier labels.
struct CrossSection {
  arma::rowvec values;
  std::optional<arma::rowvec> labels;

  [[nodiscard]] std::vector<std::vector<arma::uword>> Groups() const {
    return GroupIndices(values, labels ? &*labels : nullptr);
  }
};

inline CrossSection MakeCrossSection(const ComputeWindow &window) {
  CrossSection section{LastRow(window.inputs[0]), std::nullopt};
  if (window.inputs.size() > 1) {
    section.labels = LastRow(window.inputs[1]);
  }
  return section;
}

inline InputSlot GroupBySlot() {
  return InputSlot{.id = "groupby",
                   .kind = epoch_core::TermKind::Classifier,
                   .optional = true};
}

} // namespace epoch_pipeline::term::components
