#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/Types.h"

namespace cyclebt {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // A header row, UTF-8 BOM and quoted cells are tolerated.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // JSON array of objects with long (timestamp/open/...) or short (t/o/...) keys.
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Dispatches on the extension (.json, anything else as CSV).
    static std::vector<Candle> loadFile(const std::string& file_path);

    // Keep candles with start_ms <= timestamp <= end_ms. A bound <= 0 is open.
    static std::vector<Candle> filterByRange(const std::vector<Candle>& candles,
                                             TimestampMs start_ms,
                                             TimestampMs end_ms);

    // Epoch seconds become milliseconds; millisecond values pass through.
    static TimestampMs normalizeTimestamp(long long raw);

    // Throws InvalidBarError for non-finite or non-positive prices, negative
    // volume, low > high, or open/close outside [low, high].
    static void validateCandle(const std::string& instrument, const Candle& candle);
};

} // namespace backtest
} // namespace cyclebt
