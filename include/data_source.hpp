#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>

namespace signalbt {

/// Loads daily bars for one instrument from a CSV file.
/// Expected columns: date (or timestamp/datetime), open, close [, high, low, volume]; header names are case-insensitive.
/// Timestamps are cut to their YYYY-MM-DD part. Bars are sorted by date; repeated dates keep the first row.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from the CSV file. Returns false if the file is missing or a required column is absent (see error()).
    bool load();

    /// Keep only bars within `period` of the newest bar: "5d", "2wk", "6mo", "1y", "ytd" or "max".
    /// Returns false (bars untouched) if the period is not recognised.
    bool restrictToPeriod(const std::string& period);

    /// Instruments available in a data directory: stems of its *.csv files, sorted. Empty if dir missing.
    static std::vector<std::string> listInstrumentsInDir(const std::string& dir);

    /// CSV path for an instrument: <dir>/<instrument>.csv
    static std::string instrumentPath(const std::string& dir, const std::string& instrument);

    const std::vector<PriceBar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const PriceBar& at(std::size_t i) const { return bars_.at(i); }

    /// Reason for the last load() failure.
    const std::string& error() const { return error_; }

private:
    struct Columns {
        int date{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
    };

    std::string filepath_;
    std::vector<PriceBar> bars_;
    std::string error_;

    std::optional<PriceBar> parseLine(const std::string& line, const Columns& cols) const;
};

/// Load an instrument's bars from <dir>/<instrument>.csv restricted to `period`.
/// Returns std::nullopt (reason on stderr) if the file cannot be loaded, has no bars, or the period is invalid.
std::optional<std::vector<PriceBar>> fetchPriceBars(const std::string& dir,
                                                    const std::string& instrument,
                                                    const std::string& period);

} // namespace signalbt
