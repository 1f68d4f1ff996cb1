#include "backtest/DataHistory.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>

using cyclebt::Candle;
using cyclebt::InvalidBarError;
using cyclebt::backtest::DataHistory;

namespace {
std::filesystem::path writeFile(const std::string& name, const std::string& content) {
    const auto dir = std::filesystem::temp_directory_path() / "cyclebt_test_data";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

bool rejects(const Candle& c) {
    try {
        DataHistory::validateCandle("A", c);
    } catch (const InvalidBarError& e) {
        assert(e.instrument() == "A");
        assert(e.timestamp() == c.timestamp);
        return true;
    }
    return false;
}
}

int main() {
    // CSV with BOM, header, quoted cells, second timestamps and unsorted rows.
    {
        const auto path = writeFile("bars.csv",
            "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n"
            "1700000120,101,103,100,102,5\n"
            "\"1700000000\",100,101,99,100.5,3\n"
            "1700000060,100.5,102,100,101,4\n"
            "garbage,row\n"
            "1700000180,x,1,1,1,1\n");
        const auto candles = DataHistory::loadCSV(path.string());
        assert(candles.size() == 3);
        assert(candles[0].timestamp == 1700000000000LL);
        assert(candles[1].timestamp == 1700000060000LL);
        assert(candles[2].timestamp == 1700000120000LL);
        assert(candles[0].close == 100.5);
        assert(candles[2].volume == 5.0);

        const auto via_dispatch = DataHistory::loadFile(path.string());
        assert(via_dispatch.size() == 3);
    }

    // JSON with long or short keys.
    {
        const auto path = writeFile("bars.json",
            "[{\"t\": 1700000060000, \"o\": 2, \"h\": 3, \"l\": 1, \"c\": 2.5, \"v\": 7},"
            " {\"timestamp\": 1700000000000, \"open\": 1, \"high\": 2, \"low\": 0.5, \"close\": 1.5, \"volume\": 9},"
            " {\"timestamp\": 1700000120000}]");
        const auto candles = DataHistory::loadFile(path.string());
        assert(candles.size() == 2);
        assert(candles[0].timestamp == 1700000000000LL);
        assert(candles[1].close == 2.5);
    }

    {
        assert(DataHistory::loadCSV("/nonexistent/cyclebt/bars.csv").empty());
        assert(DataHistory::normalizeTimestamp(1700000000) == 1700000000000LL);
        assert(DataHistory::normalizeTimestamp(1700000000000LL) == 1700000000000LL);
    }

    // Range filter with open bounds.
    {
        std::vector<Candle> candles;
        for (int i = 1; i <= 5; ++i) {
            candles.emplace_back(1.0, 1.0, 1.0, 1.0, 1.0, i * 1000LL);
        }
        assert(DataHistory::filterByRange(candles, 2000, 4000).size() == 3);
        assert(DataHistory::filterByRange(candles, 0, 2000).size() == 2);
        assert(DataHistory::filterByRange(candles, 4000, 0).size() == 2);
        assert(DataHistory::filterByRange(candles, 0, 0).size() == 5);
    }

    // Bar validation.
    {
        DataHistory::validateCandle("A", Candle(100, 105, 95, 101, 0, 1000));
        assert(rejects(Candle(100, 95, 105, 101, 1, 1000)));       // low > high
        assert(rejects(Candle(0, 105, 95, 101, 1, 1000)));         // non-positive open
        assert(rejects(Candle(100, 105, 95, 101, -1, 1000)));      // negative volume
        assert(rejects(Candle(100, 105, 95, 106, 1, 1000)));       // close above high
        assert(rejects(Candle(94, 105, 95, 101, 1, 1000)));        // open below low
        assert(rejects(Candle(100, std::numeric_limits<double>::quiet_NaN(), 95, 101, 1, 1000)));
        assert(rejects(Candle(100, std::numeric_limits<double>::infinity(), 95, 101, 1, 1000)));
    }

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
