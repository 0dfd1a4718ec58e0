#include "data/HistoricalDataSource.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include <algorithm>
#include <filesystem>

namespace tradeagent {
namespace data {

HistoricalDataSource::HistoricalDataSource(const std::string& data_dir)
    : data_dir_(data_dir)
{
}

void HistoricalDataSource::setBars(const std::string& symbol, std::vector<Bar> bars) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[symbol] = backtest::DataHistory::normalize(std::move(bars));
}

const std::vector<Bar>* HistoricalDataSource::loadSymbol(const std::string& symbol) {
    auto it = cache_.find(symbol);
    if (it != cache_.end()) {
        return &it->second;
    }

    const std::filesystem::path dir(data_dir_);
    std::error_code ec;
    for (const char* ext : {".csv", ".json"}) {
        const auto path = dir / (symbol + ext);
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        auto bars = backtest::DataHistory::load(path.string());
        if (bars.empty()) {
            LOG_WARN("No usable bars in {}", path.string());
            return nullptr;
        }
        auto inserted = cache_.emplace(symbol, std::move(bars));
        return &inserted.first->second;
    }

    LOG_WARN("No bar file for {} in {}", symbol, data_dir_);
    return nullptr;
}

std::map<std::string, std::vector<Bar>> HistoricalDataSource::getBars(
    const std::vector<std::string>& symbols,
    int lookback_days
) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<Bar>> result;

    for (const auto& symbol : symbols) {
        const auto* bars = loadSymbol(symbol);
        if (!bars || bars->empty()) {
            continue;
        }
        // lookback_days = 최근 거래일(봉) 수
        const size_t count = (lookback_days > 0)
            ? std::min(bars->size(), static_cast<size_t>(lookback_days))
            : bars->size();
        result[symbol] = std::vector<Bar>(bars->end() - static_cast<std::ptrdiff_t>(count), bars->end());
    }
    return result;
}

std::optional<double> HistoricalDataSource::getLatestPrice(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* bars = loadSymbol(symbol);
    if (!bars || bars->empty()) {
        return std::nullopt;
    }
    return bars->back().close;
}

} // namespace data
} // namespace tradeagent
