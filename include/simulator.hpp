#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include <vector>
#include <string>

namespace signalbt {

enum class Outcome { Win, Loss };

inline const char* toString(Outcome o) { return o == Outcome::Win ? "Win" : "Loss"; }

/// One completed long trade: bought at entry bar open, sold at exit bar open.
struct TradeRecord {
    std::string instrument;
    std::string entry_date;
    double entry_price{0};
    std::string exit_date;
    double exit_price{0};
    double return_pct{0};             // (exit - entry) / entry * 100
    Outcome outcome{Outcome::Loss};   // Win iff return_pct > 0
};

/// Build a trade from its entry and exit bars (both priced at open).
/// A zero entry price gives return_pct 0 (a Loss); DataSource never loads such a bar.
TradeRecord makeTradeRecord(const std::string& instrument, const PriceBar& entry, const PriceBar& exit);

/// Scan the series for signals and price a fixed-horizon trade for each.
/// Every index in [1, n - (hold_days + 2)] is evaluated; a signal at i enters at bar i+1 open
/// and exits at bar i+1+hold_days open. Signals are independent: trades may overlap,
/// no position is tracked. Fewer than hold_days + 2 bars yields no trades.
std::vector<TradeRecord> simulateTrades(const std::vector<FeatureBar>& series,
                                        const std::string& instrument,
                                        const ISignalDetector& detector,
                                        int hold_days = 5);

} // namespace signalbt
