#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace signalbt {

/// Strategy thresholds and windows. Defaults: RSI(14) < 30, SMA 20/50 crossover, 5-day hold.
struct StrategyParams {
    int rsi_window = 14;
    int sma_fast_window = 20;
    int sma_slow_window = 50;
    double rsi_threshold = 30.0;
    int hold_days = 5;          // trading days between entry and exit
};

/// Returns false and sets error_msg if params are invalid.
bool validateParams(const StrategyParams& params, std::string& error_msg);

/// Bars needed for one complete trade: signal bar, entry bar, hold_days bars (7 by default).
inline std::size_t minBarsForSimulation(const StrategyParams& params) {
    return static_cast<std::size_t>(params.hold_days) + 2u;
}

/// Entry rule evaluated on a feature series.
/// detect() must return false (never fail) for out-of-range indices or incomplete bars.
class ISignalDetector {
public:
    virtual ~ISignalDetector() = default;

    /// True if an entry condition holds at series[index] (uses series[index - 1] too).
    virtual bool detect(const std::vector<FeatureBar>& series, std::size_t index) const = 0;

    virtual std::string name() const = 0;

    /// Parameter summary for report headers, e.g. "rsi<30 sma=20/50 hold=5".
    virtual std::string describe() const { return ""; }
};

} // namespace signalbt
