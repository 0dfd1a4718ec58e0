#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace tradeagent {
namespace backtest {

namespace {
std::optional<long long> parseTimestampCell(const std::string& cell) {
    if (cell.empty()) {
        return std::nullopt;
    }
    // 날짜 형식 (YYYY-MM-DD...)
    if (cell.size() >= 10 && cell[4] == '-' && cell[7] == '-') {
        return utils::parseTimestampMs(cell);
    }
    return std::stoll(cell);
}

std::optional<long long> parseTimestampJson(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<long long>();
    }
    if (value.is_string()) {
        return parseTimestampCell(value.get<std::string>());
    }
    return std::nullopt;
}

double readField(const nlohmann::json& item, const char* key, const char* short_key) {
    if (item.contains(key) && item[key].is_number()) return item[key].get<double>();
    if (item.contains(short_key) && item[short_key].is_number()) return item[short_key].get<double>();
    return 0.0;
}
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);
    
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
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

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;

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
            // Header or malformed row.
            continue;
        }

        try {
            auto timestamp = parseTimestampCell(row[0]);
            if (!timestamp) {
                LOG_WARN("Unparseable timestamp in row: {}", line);
                continue;
            }
            bars.emplace_back(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                              std::stod(row[4]), std::stod(row[5]), *timestamp);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }
    
    bars = normalize(std::move(bars));
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);
    
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
        const nlohmann::json& items = (j.is_object() && j.contains("bars")) ? j["bars"] : j;
        if (!items.is_array()) {
            LOG_ERROR("JSON bar file is not an array: {}", file_path);
            return bars;
        }
        for (const auto& item : items) {
            std::optional<long long> timestamp;
            if (item.contains("timestamp")) timestamp = parseTimestampJson(item["timestamp"]);
            else if (item.contains("t")) timestamp = parseTimestampJson(item["t"]);
            if (!timestamp) {
                continue;
            }

            Bar bar;
            bar.timestamp = *timestamp;
            bar.open = readField(item, "open", "o");
            bar.high = readField(item, "high", "h");
            bar.low = readField(item, "low", "l");
            bar.close = readField(item, "close", "c");
            bar.volume = readField(item, "volume", "v");
            bars.push_back(bar);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
    }

    bars = normalize(std::move(bars));
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::load(const std::string& file_path) {
    std::string lower = file_path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Bar> DataHistory::filterByDate(const std::vector<Bar>& bars,
                                           const std::string& start_date,
                                           const std::string& end_date) {
    std::optional<long long> start;
    std::optional<long long> end;
    if (!start_date.empty()) start = utils::parseTimestampMs(start_date);
    if (!end_date.empty()) end = utils::parseTimestampMs(end_date);
    if (end && end_date.size() == 10) {
        // 종료일 당일 포함
        *end += 24LL * 60 * 60 * 1000 - 1;
    }

    std::vector<Bar> filtered;
    for (const auto& bar : bars) {
        if (start && bar.timestamp < *start) continue;
        if (end && bar.timestamp > *end) continue;
        filtered.push_back(bar);
    }
    return filtered;
}

std::vector<Bar> DataHistory::normalize(std::vector<Bar> bars) {
    // Ensure sorted by timestamp ascending
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<Bar> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        if (bar.close <= 0.0) {
            continue;
        }
        if (!out.empty() && out.back().timestamp == bar.timestamp) {
            out.back() = bar;
            continue;
        }
        out.push_back(bar);
    }
    return out;
}

} // namespace backtest
} // namespace tradeagent
