#include "strategy.hpp"

namespace signalbt {

bool validateParams(const StrategyParams& params, std::string& error_msg) {
    if (params.rsi_window < 1) { error_msg = "RSI window must be >= 1"; return false; }
    if (params.sma_fast_window < 1) { error_msg = "fast SMA window must be >= 1"; return false; }
    if (params.sma_slow_window < 1) { error_msg = "slow SMA window must be >= 1"; return false; }
    if (params.sma_fast_window >= params.sma_slow_window) {
        error_msg = "fast SMA window must be shorter than slow SMA window";
        return false;
    }
    if (!(params.rsi_threshold > 0 && params.rsi_threshold < 100)) {
        error_msg = "RSI threshold must be between 0 and 100 (exclusive)";
        return false;
    }
    if (params.hold_days < 1) { error_msg = "hold period must be >= 1 day"; return false; }
    return true;
}

} // namespace signalbt
