#include "simulator.hpp"

namespace signalbt {

TradeRecord makeTradeRecord(const std::string& instrument, const PriceBar& entry, const PriceBar& exit) {
    TradeRecord t;
    t.instrument = instrument;
    t.entry_date = entry.date;
    t.entry_price = entry.open;
    t.exit_date = exit.date;
    t.exit_price = exit.open;
    t.return_pct = (t.entry_price != 0)
        ? ((t.exit_price - t.entry_price) / t.entry_price) * 100.0
        : 0;
    t.outcome = (t.return_pct > 0) ? Outcome::Win : Outcome::Loss;
    return t;
}

std::vector<TradeRecord> simulateTrades(const std::vector<FeatureBar>& series,
                                        const std::string& instrument,
                                        const ISignalDetector& detector,
                                        int hold_days) {
    std::vector<TradeRecord> trades;
    if (hold_days < 1) return trades;
    const std::size_t hold = static_cast<std::size_t>(hold_days);

    // Last signal index is n - (hold + 2), so the exit bar i + 1 + hold is always in range.
    for (std::size_t i = 1; i + hold + 2 <= series.size(); ++i) {
        if (!detector.detect(series, i)) continue;

        // Buy next day's open, sell hold days later at the open
        const FeatureBar& entry = series[i + 1];
        const FeatureBar& exit = series[i + 1 + hold];
        trades.push_back(makeTradeRecord(instrument, entry, exit));
    }
    return trades;
}

} // namespace signalbt
