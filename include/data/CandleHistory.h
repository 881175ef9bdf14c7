#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace microtrend {
namespace data {

class CandleHistory {
public:
    // Expected format: timestamp,open,high,low,close,volume
    // Header and malformed rows are skipped; result is sorted by timestamp.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects with long (timestamp/open/...) or short (t/o/h/l/c/v) keys
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Last `count` candles (all of them when count >= size)
    static std::vector<Candle> tail(const std::vector<Candle>& candles, size_t count);
};

} // namespace data
} // namespace microtrend
