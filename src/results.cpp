#include "results.hpp"
#include <algorithm>
#include <utility>

namespace signalbt {

int BacktestSummary::winningTrades() const {
    return static_cast<int>(std::count_if(trades.begin(), trades.end(),
        [](const TradeRecord& t) { return t.outcome == Outcome::Win; }));
}

BacktestSummary aggregateTrades(std::vector<TradeRecord> trades) {
    BacktestSummary s;
    s.trades = std::move(trades);
    s.total_trades = static_cast<int>(s.trades.size());
    if (s.total_trades == 0) return s;

    int wins = 0;
    double total_return = 0;
    for (const auto& t : s.trades) {
        if (t.outcome == Outcome::Win) ++wins;
        total_return += t.return_pct;
    }
    s.win_ratio_pct = 100.0 * wins / s.total_trades;
    s.avg_return_pct = total_return / s.total_trades;
    return s;
}

BacktestSummary combineSummaries(const std::vector<BacktestSummary>& summaries) {
    std::vector<TradeRecord> all;
    for (const auto& s : summaries)
        all.insert(all.end(), s.trades.begin(), s.trades.end());
    return aggregateTrades(std::move(all));
}

} // namespace signalbt
