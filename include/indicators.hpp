#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include <vector>
#include <optional>

namespace signalbt {

/// Simple moving average of the trailing `window` values.
/// Output is aligned 1:1 with input; the first window-1 entries are empty.
std::vector<std::optional<double>> simpleMovingAverage(const std::vector<double>& values, int window);

/// RSI with Wilder smoothing (alpha = 1/window, seeded with the first bar, change of bar 0 taken as 0).
/// Defined from index window-1. 100 when the average loss is zero.
std::vector<std::optional<double>> relativeStrengthIndex(const std::vector<double>& closes, int window);

/// Augment prices with RSI and fast/slow SMA of the close.
/// Returns std::nullopt if any bar has a non-finite close (missing feature).
std::optional<std::vector<FeatureBar>> computeFeatures(const std::vector<PriceBar>& prices,
                                                       const StrategyParams& params);

/// Keep only bars with every indicator defined (order preserved).
std::vector<FeatureBar> dropIncomplete(const std::vector<FeatureBar>& features);

} // namespace signalbt
