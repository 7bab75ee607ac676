#pragma once

#include "simulator.hpp"
#include <vector>

namespace signalbt {

/// Summary statistics over a trade list.
struct BacktestSummary {
    int total_trades{0};
    double win_ratio_pct{0};     // 100 * wins / total; 0 if no trades
    double avg_return_pct{0};    // mean return_pct; 0 if no trades
    std::vector<TradeRecord> trades;

    int winningTrades() const;
};

/// Reduce trades to a summary. No trades is a valid result with zero ratios.
BacktestSummary aggregateTrades(std::vector<TradeRecord> trades);

/// Concatenate the trade lists in input order and aggregate them as one run.
BacktestSummary combineSummaries(const std::vector<BacktestSummary>& summaries);

} // namespace signalbt
