#include "signal_check.hpp"
#include "indicators.hpp"

namespace signalbt {

std::optional<LatestSignal> checkLatestSignal(const std::vector<FeatureBar>& features,
                                              const ISignalDetector& detector) {
    std::vector<FeatureBar> cleaned = dropIncomplete(features);
    if (cleaned.size() < 2) return std::nullopt;

    const std::size_t last = cleaned.size() - 1;
    const FeatureBar& latest = cleaned[last];

    LatestSignal s;
    s.triggered = detector.detect(cleaned, last);
    s.date = latest.date;
    s.rsi = *latest.rsi;
    s.sma_fast = *latest.sma_fast;
    s.sma_slow = *latest.sma_slow;
    return s;
}

} // namespace signalbt
