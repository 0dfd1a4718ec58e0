#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/Types.h"

namespace tradeagent {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // timestamp may be epoch ms or a date (YYYY-MM-DD / RFC3339)
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Load bars from a JSON file: an array (or {"bars": [...]}) with
    // timestamp/open/high/low/close/volume or Alpaca t/o/h/l/c/v keys
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Dispatch on extension (.json, otherwise CSV)
    static std::vector<Bar> load(const std::string& file_path);

    // Filter bars by inclusive date range (YYYY-MM-DD, empty = open ended)
    static std::vector<Bar> filterByDate(const std::vector<Bar>& bars,
                                         const std::string& start_date,
                                         const std::string& end_date);

    // Sort ascending, drop duplicate timestamps and non-positive prices
    static std::vector<Bar> normalize(std::vector<Bar> bars);
};

} // namespace backtest
} // namespace tradeagent
