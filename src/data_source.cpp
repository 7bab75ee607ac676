#include "data_source.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace signalbt {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\"");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

bool isLeapYear(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : days[m - 1];
}

// Days since 1970-01-01 (proleptic Gregorian).
long daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(long z, int& y, int& m, int& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

// Parse the leading "YYYY-MM-DD" of a date or ISO timestamp. Returns false if unparseable.
bool parseDate(const std::string& ts, int& year, int& month, int& day) {
    if (ts.size() < 10 || ts[4] != '-' || ts[7] != '-') return false;
    for (std::size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u})
        if (!std::isdigit(static_cast<unsigned char>(ts[i]))) return false;
    year = std::stoi(ts.substr(0, 4));
    month = std::stoi(ts.substr(5, 2));
    day = std::stoi(ts.substr(8, 2));
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    return true;
}

std::string formatDate(int year, int month, int day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

// Earliest date kept for a yfinance-style period, counted back from `latest`.
// Empty string = keep everything ("max", or a span reaching back before year 1). Returns false if the period is not recognised.
bool periodCutoff(const std::string& period, const std::string& latest, std::string& cutoff) {
    std::string p = trim(period);
    toLower(p);
    cutoff.clear();
    if (p == "max") return true;

    int y, m, d;
    if (!parseDate(latest, y, m, d)) return false;
    if (p == "ytd") {
        cutoff = formatDate(y, 1, 1);
        return true;
    }

    std::size_t digits = 0;
    while (digits < p.size() && std::isdigit(static_cast<unsigned char>(p[digits]))) ++digits;
    if (digits == 0 || digits > 6) return false;
    const int n = std::stoi(p.substr(0, digits));
    const std::string unit = p.substr(digits);
    if (n <= 0) return false;

    if (unit == "d" || unit == "wk") {
        long days = (unit == "d") ? n : 7L * n;
        int cy, cm, cd;
        civilFromDays(daysFromCivil(y, m, d) - days, cy, cm, cd);
        if (cy >= 1) cutoff = formatDate(cy, cm, cd);
        return true;
    }
    if (unit == "mo" || unit == "y") {
        int months = (unit == "mo") ? n : 12 * n;
        int total = y * 12 + (m - 1) - months;
        if (total < 12) return true;
        int cy = total / 12;
        int cm = total % 12 + 1;
        cutoff = formatDate(cy, cm, std::min(d, daysInMonth(cy, cm)));
        return true;
    }
    return false;
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    error_.clear();
    std::ifstream f(filepath_);
    if (!f.is_open()) {
        error_ = "cannot open " + filepath_;
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) {
        error_ = "empty file " + filepath_;
        return false;
    }
    // UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    Columns cols;
    cols.date = findColumn(headers, {"date", "timestamp", "datetime", "time"});
    cols.open = findColumn(headers, {"open", "o"});
    cols.high = findColumn(headers, {"high", "h"});
    cols.low = findColumn(headers, {"low", "l"});
    cols.close = findColumn(headers, {"close", "c", "adj close", "adj_close"});
    cols.volume = findColumn(headers, {"volume", "vol", "v"});

    if (cols.date < 0) { error_ = "missing date column"; return false; }
    if (cols.open < 0) { error_ = "missing open column"; return false; }
    if (cols.close < 0) { error_ = "missing close column"; return false; }

    while (std::getline(f, line)) {
        auto bar = parseLine(line, cols);
        if (!bar) continue;
        bars_.push_back(*bar);
    }

    std::stable_sort(bars_.begin(), bars_.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.date < b.date;
    });
    bars_.erase(std::unique(bars_.begin(), bars_.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.date == b.date;
    }), bars_.end());
    return true;
}

bool DataSource::restrictToPeriod(const std::string& period) {
    if (bars_.empty()) {
        std::string unused;
        return periodCutoff(period, "1970-01-01", unused);
    }
    std::string cutoff;
    if (!periodCutoff(period, bars_.back().date, cutoff)) return false;
    if (cutoff.empty()) return true;

    bars_.erase(bars_.begin(), std::lower_bound(bars_.begin(), bars_.end(), cutoff,
        [](const PriceBar& b, const std::string& c) { return b.date < c; }));
    return true;
}

std::vector<std::string> DataSource::listInstrumentsInDir(const std::string& dir) {
    std::set<std::string> instruments;
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec) return {};

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (ec || !entry.is_regular_file()) continue;
        std::string ext = entry.path().extension().string();
        toLower(ext);
        if (ext != ".csv") continue;
        std::string stem = entry.path().stem().string();
        if (!stem.empty()) instruments.insert(stem);
    }
    return std::vector<std::string>(instruments.begin(), instruments.end());
}

std::string DataSource::instrumentPath(const std::string& dir, const std::string& instrument) {
    return (fs::path(dir) / (instrument + ".csv")).string();
}

std::optional<PriceBar> DataSource::parseLine(const std::string& line, const Columns& cols) const {
    auto parts = split(line, ',');
    auto field = [&parts](int idx) -> const std::string* {
        if (idx < 0 || static_cast<std::size_t>(idx) >= parts.size()) return nullptr;
        return &parts[static_cast<std::size_t>(idx)];
    };

    const std::string* date = field(cols.date);
    const std::string* open = field(cols.open);
    const std::string* close = field(cols.close);
    if (!date || !open || !close) return std::nullopt;

    int y, m, d;
    if (!parseDate(*date, y, m, d)) return std::nullopt;

    PriceBar b;
    b.date = formatDate(y, m, d);
    try {
        b.open = std::stod(*open);
        b.close = std::stod(*close);
        if (const std::string* high = field(cols.high); high && !high->empty()) b.high = std::stod(*high);
        if (const std::string* low = field(cols.low); low && !low->empty()) b.low = std::stod(*low);
        if (const std::string* vol = field(cols.volume); vol && !vol->empty()) b.volume = std::stod(*vol);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    // Trades are priced at the open
    if (!std::isfinite(b.open) || b.open <= 0) return std::nullopt;
    return b;
}

std::optional<std::vector<PriceBar>> fetchPriceBars(const std::string& dir,
                                                    const std::string& instrument,
                                                    const std::string& period) {
    DataSource ds(DataSource::instrumentPath(dir, instrument));
    if (!ds.load()) {
        std::cerr << "Error fetching data for " << instrument << ": " << ds.error() << "\n";
        return std::nullopt;
    }
    if (!ds.restrictToPeriod(period)) {
        std::cerr << "Invalid period \"" << period << "\" for " << instrument << "\n";
        return std::nullopt;
    }
    if (ds.empty()) {
        std::cerr << "No data found for " << instrument << ". It might be delisted or an invalid instrument.\n";
        return std::nullopt;
    }
    return ds.bars();
}

} // namespace signalbt
