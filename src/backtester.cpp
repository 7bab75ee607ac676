#include "backtester.hpp"
#include "indicators.hpp"
#include "simulator.hpp"
#include "rsi_crossover_strategy.hpp"
#include <utility>

namespace signalbt {

const char* statusToString(RunStatus status) {
    switch (status) {
    case RunStatus::Ok: return "ok";
    case RunStatus::NoData: return "no data";
    case RunStatus::MissingFeature: return "missing close price";
    case RunStatus::InsufficientData: return "not enough data after indicator calculation";
    }
    return "unknown";
}

BacktestEngine::BacktestEngine(const StrategyParams& params)
    : detector_(createRsiCrossoverDetector(params))
    , params_(params)
{
}

BacktestEngine::BacktestEngine(std::unique_ptr<ISignalDetector> detector, const StrategyParams& params)
    : detector_(std::move(detector))
    , params_(params)
{
    if (!detector_) detector_ = createRsiCrossoverDetector(params_);
}

EngineResult BacktestEngine::evaluate(const std::vector<PriceBar>& prices, const std::string& instrument) const {
    EngineResult result;
    if (prices.empty()) {
        result.status = RunStatus::NoData;
        return result;
    }

    auto features = computeFeatures(prices, params_);
    if (!features) {
        result.status = RunStatus::MissingFeature;
        return result;
    }

    std::vector<FeatureBar> series = dropIncomplete(*features);
    result.bars_used = series.size();
    if (series.size() < minBarsForSimulation(params_)) {
        result.status = RunStatus::InsufficientData;
        return result;
    }

    result.status = RunStatus::Ok;
    result.summary = aggregateTrades(simulateTrades(series, instrument, *detector_, params_.hold_days));
    return result;
}

std::optional<BacktestSummary> BacktestEngine::run(const std::vector<PriceBar>& prices,
                                                   const std::string& instrument) const {
    return evaluate(prices, instrument).summary;
}

std::optional<LatestSignal> BacktestEngine::checkLatest(const std::vector<PriceBar>& prices) const {
    auto features = computeFeatures(prices, params_);
    if (!features) return std::nullopt;
    return checkLatestSignal(*features, *detector_);
}

} // namespace signalbt
