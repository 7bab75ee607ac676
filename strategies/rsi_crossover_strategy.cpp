#include "rsi_crossover_strategy.hpp"
#include "bar.hpp"
#include <vector>
#include <string>
#include <memory>

namespace signalbt {

class RsiCrossoverDetector : public ISignalDetector {
public:
    explicit RsiCrossoverDetector(const StrategyParams& params)
        : params_(params)
    {}

    bool detect(const std::vector<FeatureBar>& series, std::size_t index) const override {
        if (index == 0 || index >= series.size()) return false;

        const FeatureBar& today = series[index];
        const FeatureBar& yesterday = series[index - 1];
        // Warm-up bars carry no signal
        if (!today.complete() || !yesterday.complete()) return false;

        bool rsi_ok = *today.rsi < params_.rsi_threshold;
        bool cross_ok = (*today.sma_fast > *today.sma_slow)
            && (*yesterday.sma_fast <= *yesterday.sma_slow);
        return rsi_ok && cross_ok;
    }

    std::string name() const override { return "rsi_crossover"; }

    std::string describe() const override {
        std::string threshold = std::to_string(params_.rsi_threshold);
        threshold.erase(threshold.find_last_not_of('0') + 1);
        if (!threshold.empty() && threshold.back() == '.') threshold.pop_back();
        return "rsi" + std::to_string(params_.rsi_window) + "<" + threshold
            + " sma=" + std::to_string(params_.sma_fast_window) + "/" + std::to_string(params_.sma_slow_window)
            + " hold=" + std::to_string(params_.hold_days);
    }

private:
    StrategyParams params_;
};

std::unique_ptr<ISignalDetector> createRsiCrossoverDetector(const StrategyParams& params) {
    return std::make_unique<RsiCrossoverDetector>(params);
}

} // namespace signalbt
