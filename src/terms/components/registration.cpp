#include "registration.h"
#include <epoch_pipeline/terms/registry.h>

#include "data/column.h"
#include "technical/ewm.h"
#include "technical/max_drawdown.h"
#include "technical/moving_average.h"
#include "technical/returns.h"
#include "technical/rsi.h"
#include "statistics/correlation.h"
#include "cross_sectional/normalize.h"
#include "cross_sectional/quantiles.h"
#include "cross_sectional/rank.h"
#include "cross_sectional/selection.h"
#include "operators/arithmetic.h"
#include "operators/comparison.h"
#include "operators/logical.h"

namespace epoch_pipeline::term::components {

namespace {
template <typename T, typename... Args>
void Add(ComputeRegistry &registry, Args &&...args) {
  registry.Register(std::make_shared<const T>(std::forward<Args>(args)...));
}
} // namespace

void RegisterBuiltins(ComputeRegistry &registry) {
  // Data
  Add<ColumnCompute>(registry);

  // Technical (time-series over the window, per asset)
  Add<LatestCompute>(registry);
  Add<ReturnsCompute>(registry);
  Add<SimpleMovingAverageCompute>(registry);
  Add<WeightedAverageValueCompute>(registry);
  Add<WeightedAverageValueCompute>(
      registry, "vwap",
      std::vector<ColumnRef>{{EQUITY_PRICING_DATASET, "close"},
                             {EQUITY_PRICING_DATASET, "volume"}});
  Add<RSICompute>(registry);
  Add<MaxDrawdownCompute>(registry);
  Add<EWMACompute>(registry);
  Add<EWMSTDCompute>(registry);

  // Statistics
  Add<RollingPearsonCompute>(registry);
  Add<RollingBetaCompute>(registry);

  // Cross-sectional (across assets, per date)
  Add<RankCompute>(registry);
  Add<ZScoreCompute>(registry);
  Add<DemeanCompute>(registry);
  Add<QuantilesCompute>(registry);
  Add<TopCompute>(registry);
  Add<BottomCompute>(registry);
  Add<PercentileBetweenCompute>(registry);

  // Element-wise operators
  Add<BinaryOpCompute>(registry);
  Add<ScalarOpCompute>(registry);
  Add<MathCompute>(registry);
  Add<CompareCompute>(registry);
  Add<ScalarCompareCompute>(registry);
  Add<ClassifierEqualsCompute>(registry);
  Add<LogicalCompute>(registry);
  Add<NotCompute>(registry);
  Add<IsNaNCompute>(registry);
  Add<NotNaNCompute>(registry);
}

} // namespace epoch_pipeline::term::components
