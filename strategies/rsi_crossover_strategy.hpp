#pragma once

#include "strategy.hpp"
#include <memory>

namespace signalbt {

/// RSI oversold + fast/slow SMA crossover.
/// Signal at bar i when rsi[i] < rsi_threshold and sma_fast has just crossed above sma_slow:
/// sma_fast[i] > sma_slow[i] and sma_fast[i-1] <= sma_slow[i-1] (equal yesterday counts as not yet crossed).
std::unique_ptr<ISignalDetector> createRsiCrossoverDetector(const StrategyParams& params = StrategyParams{});

} // namespace signalbt
