#pragma once
#include <armadillo>
#include <epoch_frame/dataframe.h>
#include <epoch_pipeline/core/session_date.h>
#include <vector>

namespace epoch_pipeline::loader {

// Panels are sessions x assets matrices, NaN marking missing cells.

// Builds a frame indexed by session date with one float64 column per asset.
epoch_frame::DataFrame PanelToDataFrame(const arma::mat &panel,
                                        const std::vector<SessionDate> &sessions,
                                        const std::vector<AssetID> &assets);

// Extracts the asset columns of a frame. Throws std::runtime_error when an
// asset column is absent; nulls become NaN.
arma::mat PanelFromDataFrame(const epoch_frame::DataFrame &frame,
                             const std::vector<AssetID> &assets);

} // namespace epoch_pipeline::loader
