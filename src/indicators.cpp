#include "indicators.hpp"
#include <cmath>
#include <algorithm>
#include <iterator>

namespace signalbt {

std::vector<std::optional<double>> simpleMovingAverage(const std::vector<double>& values, int window) {
    std::vector<std::optional<double>> out(values.size());
    if (window <= 0) return out;
    const std::size_t w = static_cast<std::size_t>(window);
    for (std::size_t i = w - 1; i < values.size(); ++i) {
        double sum = 0;
        for (std::size_t k = 0; k < w; ++k)
            sum += values[i - k];
        out[i] = sum / window;
    }
    return out;
}

std::vector<std::optional<double>> relativeStrengthIndex(const std::vector<double>& closes, int window) {
    std::vector<std::optional<double>> out(closes.size());
    if (window <= 0 || closes.empty()) return out;

    const double alpha = 1.0 / window;
    double avg_up = 0;
    double avg_down = 0;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        double change = (i == 0) ? 0.0 : closes[i] - closes[i - 1];
        double up = std::max(change, 0.0);
        double down = std::max(-change, 0.0);
        if (i == 0) {
            avg_up = up;
            avg_down = down;
        } else {
            avg_up = (1.0 - alpha) * avg_up + alpha * up;
            avg_down = (1.0 - alpha) * avg_down + alpha * down;
        }
        if (i + 1 < static_cast<std::size_t>(window)) continue;

        if (avg_down == 0)
            out[i] = 100.0;
        else
            out[i] = 100.0 - 100.0 / (1.0 + avg_up / avg_down);
    }
    return out;
}

std::optional<std::vector<FeatureBar>> computeFeatures(const std::vector<PriceBar>& prices,
                                                       const StrategyParams& params) {
    std::vector<double> closes;
    closes.reserve(prices.size());
    for (const PriceBar& p : prices) {
        if (!std::isfinite(p.close)) return std::nullopt;
        closes.push_back(p.close);
    }

    auto rsi = relativeStrengthIndex(closes, params.rsi_window);
    auto fast = simpleMovingAverage(closes, params.sma_fast_window);
    auto slow = simpleMovingAverage(closes, params.sma_slow_window);

    std::vector<FeatureBar> out;
    out.reserve(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        FeatureBar f;
        static_cast<PriceBar&>(f) = prices[i];
        f.rsi = rsi[i];
        f.sma_fast = fast[i];
        f.sma_slow = slow[i];
        out.push_back(f);
    }
    return out;
}

std::vector<FeatureBar> dropIncomplete(const std::vector<FeatureBar>& features) {
    std::vector<FeatureBar> out;
    out.reserve(features.size());
    std::copy_if(features.begin(), features.end(), std::back_inserter(out),
                 [](const FeatureBar& f) { return f.complete(); });
    return out;
}

} // namespace signalbt
