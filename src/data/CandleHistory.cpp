#include "data/CandleHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace microtrend {
namespace data {

namespace {
void sortByTime(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

double readNumber(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item[long_key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    return 0.0;
}
}

std::vector<Candle> CandleHistory::loadCSV(const std::string& file_path) {
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

        // UTF-8 BOM on the first cell
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
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // header
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = std::stoll(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            skipped++;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> CandleHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            if (item.contains("timestamp")) candle.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) candle.timestamp = item["t"].get<long long>();

            candle.open = readNumber(item, "open", "o");
            candle.high = readNumber(item, "high", "h");
            candle.low = readNumber(item, "low", "l");
            candle.close = readNumber(item, "close", "c");
            candle.volume = readNumber(item, "volume", "v");
            candles.push_back(candle);
        }
        sortByTime(candles);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> CandleHistory::tail(const std::vector<Candle>& candles, size_t count) {
    if (candles.size() <= count) {
        return candles;
    }
    return std::vector<Candle>(candles.end() - count, candles.end());
}

} // namespace data
} // namespace microtrend
