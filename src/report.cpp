#include "report.hpp"
#include <iomanip>
#include <sstream>

namespace signalbt {

std::string formatPct(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "%";
    return oss.str();
}

Report::Report(const BacktestSummary& summary, const std::string& instrument,
               const std::string& strategy_name, const std::string& strategy_params)
    : summary_(summary), instrument_(instrument)
    , strategy_name_(strategy_name), strategy_params_(strategy_params) {}

void Report::printReportHeader(std::ostream& out) const {
    if (!instrument_.empty()) out << "Instrument: " << instrument_ << "\n";
    if (!strategy_name_.empty()) {
        out << "Strategy: " << strategy_name_;
        if (!strategy_params_.empty()) out << " (" << strategy_params_ << ")";
        out << "\n";
    }
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Backtest Results ==========\n";
    printReportHeader(out);
    out << "Total trades:   " << summary_.total_trades << "\n";
    out << "Winning trades: " << summary_.winningTrades() << "\n";
    out << "Win ratio:      " << formatPct(summary_.win_ratio_pct) << "\n";
    out << "Average return: " << formatPct(summary_.avg_return_pct) << "\n";
    out << "======================================\n\n";
}

void Report::printTradeLog(std::ostream& out) const {
    out << "--- Trade Log ---\n";
    if (summary_.trades.empty()) {
        out << "No trades to display.\n";
        out << "-----------------\n";
        return;
    }
    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::left << std::setw(14) << "Instrument" << std::setw(12) << "Buy Date"
        << std::right << std::setw(11) << "Buy Price" << "  "
        << std::left << std::setw(12) << "Sell Date"
        << std::right << std::setw(11) << "Sell Price" << std::setw(11) << "Return %"
        << "  Status\n";
    out << std::fixed << std::setprecision(2);
    for (const auto& t : summary_.trades) {
        out << std::left << std::setw(14) << t.instrument << std::setw(12) << t.entry_date
            << std::right << std::setw(11) << t.entry_price << "  "
            << std::left << std::setw(12) << t.exit_date
            << std::right << std::setw(11) << t.exit_price << std::setw(11) << t.return_pct
            << "  " << toString(t.outcome) << "\n";
    }
    out.flags(flags);
    out.precision(precision);
    out << "-----------------\n";
}

void printLatestSignal(std::ostream& out, const std::string& instrument, const LatestSignal& signal) {
    const auto flags = out.flags();
    const auto precision = out.precision();
    out << "\n--- Live Signal Summary: " << instrument << " (" << signal.date << ") ---\n";
    out << std::fixed << std::setprecision(2);
    out << "  - Latest RSI: " << signal.rsi << "\n";
    out << "  - Fast MA:    " << signal.sma_fast << "\n";
    out << "  - Slow MA:    " << signal.sma_slow << "\n";
    out << "  - Buy Signal Triggered: " << (signal.triggered ? "Yes" : "No") << "\n";
    out << "---------------------------\n";
    out.flags(flags);
    out.precision(precision);
}

void printCombinedTable(std::ostream& out, const std::vector<InstrumentRow>& rows,
                        const BacktestSummary& overall) {
    out << "\n========== Backtest (all instruments) ==========\n";
    out << std::setw(14) << "Instrument" << std::setw(8) << "Bars" << std::setw(8) << "Trades"
        << std::setw(12) << "Win ratio" << std::setw(12) << "Avg return" << "\n";
    out << std::string(54, '-') << "\n";
    for (const auto& r : rows) {
        out << std::setw(14) << r.instrument << std::setw(8) << r.bars
            << std::setw(8) << r.summary.total_trades
            << std::setw(12) << formatPct(r.summary.win_ratio_pct)
            << std::setw(12) << formatPct(r.summary.avg_return_pct) << "\n";
    }
    out << std::string(54, '-') << "\n";
    out << std::setw(14) << "Combined" << std::setw(8) << "" << std::setw(8) << overall.total_trades
        << std::setw(12) << formatPct(overall.win_ratio_pct)
        << std::setw(12) << formatPct(overall.avg_return_pct) << "\n";
    out << "================================================\n\n";
}

} // namespace signalbt
