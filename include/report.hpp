#pragma once

#include "results.hpp"
#include "signal_check.hpp"
#include <string>
#include <vector>
#include <ostream>
#include <iostream>

namespace signalbt {

/// One line of the multi-instrument table.
struct InstrumentRow {
    std::string instrument;
    std::size_t bars{0};
    BacktestSummary summary;
};

/// "12.34%"
std::string formatPct(double value);

/// Console report for one backtest summary.
class Report {
public:
    /// strategy_name and strategy_params are included in report output (e.g. "rsi_crossover", "rsi14<30 sma=20/50 hold=5").
    Report(const BacktestSummary& summary, const std::string& instrument,
           const std::string& strategy_name = "",
           const std::string& strategy_params = "");

    /// Print total trades, win ratio and average return.
    void printSummary(std::ostream& out = std::cout) const;

    /// Print one row per trade (instrument, dates, prices, return, outcome).
    void printTradeLog(std::ostream& out = std::cout) const;

private:
    void printReportHeader(std::ostream& out) const;

    const BacktestSummary& summary_;
    std::string instrument_;
    std::string strategy_name_;
    std::string strategy_params_;
};

/// Live-mode panel: latest RSI and moving averages, and whether the buy signal fired.
void printLatestSignal(std::ostream& out, const std::string& instrument, const LatestSignal& signal);

/// Per-instrument table followed by the combined line.
void printCombinedTable(std::ostream& out, const std::vector<InstrumentRow>& rows,
                        const BacktestSummary& overall);

} // namespace signalbt
