#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_pipeline/core/session_date.h>
#include <epoch_pipeline/terms/term.h>
#include <memory>
#include <vector>

namespace epoch_pipeline::loader {

// Source of raw dataset columns.
//
// LoadWindow returns one row per trading session in `range` (both ends
// included, indexed by session date) and one column per requested asset,
// named by the asset id. Identical requests must yield identical frames and
// implementations must be safe to call concurrently. Loaders may throw; the
// engine reports the failure as a LoaderFailure.
class ILoader {
public:
  virtual ~ILoader() = default;

  [[nodiscard]] virtual epoch_frame::DataFrame
  LoadWindow(const term::Term &column, const DateRange &range,
             const std::vector<AssetID> &assets) const = 0;
};

using ILoaderPtr = std::shared_ptr<const ILoader>;

} // namespace epoch_pipeline::loader
