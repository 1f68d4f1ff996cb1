#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include "common/Errors.h"
#include "common/Logger.h"

namespace cyclebt {
namespace backtest {

namespace {
// Anything below 1e11 cannot be a millisecond timestamp after 1973.
constexpr long long kSecondsThreshold = 100000000000LL;

void sortByTimestamp(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

double readNumber(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item[long_key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    throw std::runtime_error(std::string("missing field ") + long_key);
}
} // namespace

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    std::size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header row.
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = normalizeTimestamp(std::stoll(row[0]));
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return candles;
    }

    if (!j.is_array()) {
        LOG_ERROR("JSON candle file must hold an array: {}", file_path);
        return candles;
    }

    for (const auto& item : j) {
        try {
            Candle candle;
            const double raw_ts = readNumber(item, "timestamp", "t");
            candle.timestamp = normalizeTimestamp(static_cast<long long>(raw_ts));
            candle.open = readNumber(item, "open", "o");
            candle.high = readNumber(item, "high", "h");
            candle.low = readNumber(item, "low", "l");
            candle.close = readNumber(item, "close", "c");
            candle.volume = readNumber(item, "volume", "v");
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Skipping JSON candle in {}: {}", file_path, e.what());
        }
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadFile(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::filterByRange(const std::vector<Candle>& candles,
                                               TimestampMs start_ms,
                                               TimestampMs end_ms) {
    std::vector<Candle> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        if (start_ms > 0 && c.timestamp < start_ms) continue;
        if (end_ms > 0 && c.timestamp > end_ms) continue;
        out.push_back(c);
    }
    return out;
}

TimestampMs DataHistory::normalizeTimestamp(long long raw) {
    if (raw > 0 && raw < kSecondsThreshold) {
        return raw * 1000;
    }
    return raw;
}

void DataHistory::validateCandle(const std::string& instrument, const Candle& c) {
    auto fail = [&](const std::string& why) {
        throw InvalidBarError(instrument, c.timestamp,
                              "invalid bar for " + instrument + " at " +
                              std::to_string(c.timestamp) + ": " + why);
    };

    if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
        !std::isfinite(c.low) || !std::isfinite(c.close) || !std::isfinite(c.volume)) {
        fail("non-finite field");
    }
    if (c.open <= 0.0 || c.high <= 0.0 || c.low <= 0.0 || c.close <= 0.0) {
        fail("non-positive price");
    }
    if (c.volume < 0.0) {
        fail("negative volume");
    }
    if (c.low > c.high) {
        fail("low > high");
    }
    if (c.open < c.low || c.open > c.high || c.close < c.low || c.close > c.high) {
        fail("open/close outside [low, high]");
    }
}

} // namespace backtest
} // namespace cyclebt
