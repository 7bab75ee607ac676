#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include "results.hpp"
#include "signal_check.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace signalbt {

enum class RunStatus {
    Ok,
    NoData,             // empty price series
    MissingFeature,     // indicators could not be computed (non-finite close)
    InsufficientData    // fewer complete bars than one trade needs
};

const char* statusToString(RunStatus status);

struct EngineResult {
    RunStatus status{RunStatus::NoData};
    std::optional<BacktestSummary> summary;   // set only when status == Ok
    std::size_t bars_used{0};                 // complete bars after cleaning
};

/// Runs one instrument through indicators -> cleaning -> signal scan -> aggregation.
/// Holds no per-run state; a single engine may be shared across instruments.
class BacktestEngine {
public:
    /// Uses the RSI crossover detector built from params.
    explicit BacktestEngine(const StrategyParams& params = StrategyParams{});

    BacktestEngine(std::unique_ptr<ISignalDetector> detector, const StrategyParams& params);

    /// Backtest with the reason for a missing result.
    EngineResult evaluate(const std::vector<PriceBar>& prices, const std::string& instrument) const;

    /// Backtest; std::nullopt means "cannot backtest" (no data, missing feature, too few bars).
    std::optional<BacktestSummary> run(const std::vector<PriceBar>& prices, const std::string& instrument) const;

    /// Signal state at the newest bar; std::nullopt on missing feature or fewer than 2 complete bars.
    std::optional<LatestSignal> checkLatest(const std::vector<PriceBar>& prices) const;

    const StrategyParams& params() const { return params_; }
    const ISignalDetector& detector() const { return *detector_; }

private:
    std::unique_ptr<ISignalDetector> detector_;
    StrategyParams params_;
};

} // namespace signalbt
