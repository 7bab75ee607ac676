#include "backtester.hpp"
#include "report.hpp"
#include "data_source.hpp"
#include "strategy.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <sstream>
#include <vector>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

const char* const DEFAULT_INSTRUMENTS = "RELIANCE.NS,INFY.NS,TCS.NS";
const char* const DEFAULT_LIVE_PERIOD = "6mo";
const char* const DEFAULT_BACKTEST_PERIOD = "2y";

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string mode = "live";
    std::string data_dir = "data";
    std::string instruments = DEFAULT_INSTRUMENTS;
    std::string period;              // empty = mode default
    bool show_trades = false;
    signalbt::StrategyParams strategy;
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

void printUsage(std::ostream& out) {
    out << "Usage: signalbt [--mode live|backtest] [--data-dir DIR] [--instruments A,B,C|all]\n"
        << "                [--period 6mo|1y|2y|max|...] [--rsi-window N] [--fast N] [--slow N]\n"
        << "                [--rsi-threshold X] [--hold N] [--trades]\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing = [&]() { error_msg = "Missing value for " + arg; return false; };

        if (arg == "--mode") { if (!next()) return missing(); cfg.mode = argv[i]; }
        else if (arg == "--data-dir") { if (!next()) return missing(); cfg.data_dir = argv[i]; }
        else if (arg == "--instruments") { if (!next()) return missing(); cfg.instruments = argv[i]; }
        else if (arg == "--period") { if (!next()) return missing(); cfg.period = argv[i]; }
        else if (arg == "--rsi-window") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.strategy.rsi_window, error_msg, "--rsi-window")) return false; }
        else if (arg == "--fast") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.strategy.sma_fast_window, error_msg, "--fast")) return false; }
        else if (arg == "--slow") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.strategy.sma_slow_window, error_msg, "--slow")) return false; }
        else if (arg == "--rsi-threshold") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.strategy.rsi_threshold, error_msg, "--rsi-threshold")) return false; }
        else if (arg == "--hold") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.strategy.hold_days, error_msg, "--hold")) return false; }
        else if (arg == "--trades") { cfg.show_trades = true; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (cfg.mode != "live" && cfg.mode != "backtest") {
        error_msg = "--mode must be 'live' or 'backtest'";
        return false;
    }
    if (cfg.instruments.empty()) { error_msg = "--instruments must not be empty"; return false; }
    return signalbt::validateParams(cfg.strategy, error_msg);
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, ',')) {
        auto start = item.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        auto end = item.find_last_not_of(" \t");
        out.push_back(item.substr(start, end - start + 1));
    }
    return out;
}

std::vector<std::string> resolveInstruments(const Config& cfg) {
    if (cfg.instruments == "all")
        return signalbt::DataSource::listInstrumentsInDir(cfg.data_dir);
    return splitList(cfg.instruments);
}

//-----------------------------------------------------------------------------
// Live mode: check the newest bar of every instrument for a buy signal
//-----------------------------------------------------------------------------
int runLive(const Config& cfg, const std::vector<std::string>& instruments) {
    using namespace signalbt;
    std::cout << "--- Running in LIVE mode ---\n";
    const std::string period = cfg.period.empty() ? DEFAULT_LIVE_PERIOD : cfg.period;
    BacktestEngine engine(cfg.strategy);

    int loaded = 0;
    int checked = 0;
    int triggered = 0;
    for (const std::string& inst : instruments) {
        std::cout << "\n----- Analyzing " << inst << " for Live Signal -----\n";
        auto prices = fetchPriceBars(cfg.data_dir, inst, period);
        if (!prices) continue;
        ++loaded;

        auto signal = engine.checkLatest(*prices);
        if (!signal) {
            std::cout << "  - Could not determine signal due to insufficient data.\n";
            continue;
        }
        ++checked;
        if (signal->triggered) ++triggered;
        printLatestSignal(std::cout, inst, *signal);
    }

    if (loaded == 0) {
        std::cerr << "No instrument data could be loaded from " << cfg.data_dir << "\n";
        return 1;
    }
    std::cout << "\nSignals triggered: " << triggered << " of " << checked << " instruments checked\n";
    std::cout << "\n--- Analysis Complete ---\n";
    return 0;
}

//-----------------------------------------------------------------------------
// Backtest mode: simulate every instrument, then the combined summary
//-----------------------------------------------------------------------------
int runBacktest(const Config& cfg, const std::vector<std::string>& instruments) {
    using namespace signalbt;
    std::cout << "--- Running in BACKTEST mode ---\n";
    const std::string period = cfg.period.empty() ? DEFAULT_BACKTEST_PERIOD : cfg.period;
    BacktestEngine engine(cfg.strategy);
    const std::string strategy_name = engine.detector().name();
    const std::string strategy_params = engine.detector().describe();

    std::vector<InstrumentRow> rows;
    std::vector<BacktestSummary> summaries;
    int loaded = 0;
    for (const std::string& inst : instruments) {
        std::cout << "\n----- Backtesting " << inst << " -----\n";
        auto prices = fetchPriceBars(cfg.data_dir, inst, period);
        if (!prices) continue;
        ++loaded;

        EngineResult result = engine.evaluate(*prices, inst);
        if (!result.summary) {
            std::cerr << "Skipped " << inst << ": " << statusToString(result.status)
                      << " (" << result.bars_used << " complete bars, need "
                      << minBarsForSimulation(engine.params()) << ")\n";
            continue;
        }

        const BacktestSummary& summary = *result.summary;
        if (summary.total_trades == 0)
            std::cout << "No trades were executed for " << inst << " during the backtest period.\n";
        else
            std::cout << "Backtest for " << inst << " generated " << summary.total_trades << " trades.\n";

        Report(summary, inst, strategy_name, strategy_params).printSummary(std::cout);
        rows.push_back({ inst, result.bars_used, summary });
        summaries.push_back(summary);
    }

    if (loaded == 0) {
        std::cerr << "No instrument data could be loaded from " << cfg.data_dir << "\n";
        return 1;
    }
    if (rows.empty()) {
        std::cout << "\nNo instrument had enough data to backtest.\n";
        return 0;
    }

    BacktestSummary overall = combineSummaries(summaries);
    printCombinedTable(std::cout, rows, overall);

    Report report(overall, "", strategy_name, strategy_params);
    if (overall.total_trades == 0) {
        std::cout << "No trades were generated across all instruments.\n";
    } else {
        std::cout << "--- Overall Backtest Summary ---\n";
        report.printSummary(std::cout);
        if (cfg.show_trades) report.printTradeLog(std::cout);
    }
    std::cout << "\n--- Analysis Complete ---\n";
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data dir when running from build/
    if (cfg.data_dir == "data" && !fs::is_directory(cfg.data_dir) && fs::is_directory("../data"))
        cfg.data_dir = "../data";

    std::vector<std::string> instruments = resolveInstruments(cfg);
    if (instruments.empty()) {
        std::cerr << "No instruments to analyze (check --instruments and --data-dir: " << cfg.data_dir << ")\n";
        return 1;
    }

    if (cfg.mode == "backtest")
        return runBacktest(cfg, instruments);
    return runLive(cfg, instruments);
}
