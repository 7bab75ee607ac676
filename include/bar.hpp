#pragma once

#include <string>
#include <optional>

namespace signalbt {

/// Single daily OHLC bar.
struct PriceBar {
    std::string date;       // "YYYY-MM-DD"
    double open{0};
    double high{0};         // optional
    double low{0};          // optional
    double close{0};
    double volume{0};       // optional
};

/// Price bar plus the indicator values the signal needs.
/// Indicators are empty during their warm-up window.
struct FeatureBar : PriceBar {
    std::optional<double> rsi;
    std::optional<double> sma_fast;   // SMA(20) by default
    std::optional<double> sma_slow;   // SMA(50) by default

    bool complete() const { return rsi && sma_fast && sma_slow; }
};

} // namespace signalbt
