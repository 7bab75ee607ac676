#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include <vector>
#include <string>
#include <optional>

namespace signalbt {

/// Signal state at the newest bar, for live checks.
struct LatestSignal {
    bool triggered{false};
    std::string date;       // newest complete bar
    double rsi{0};
    double sma_fast{0};
    double sma_slow{0};
};

/// Evaluate the detector at the newest complete bar of `features`.
/// Incomplete bars are dropped first, exactly as a backtest scan would see the series.
/// Returns std::nullopt if fewer than 2 complete bars remain.
std::optional<LatestSignal> checkLatestSignal(const std::vector<FeatureBar>& features,
                                              const ISignalDetector& detector);

} // namespace signalbt
