#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace tradeagent {
namespace core {

// Daily OHLCV bars and latest prices. Bars are returned in ascending timestamp order.
// Symbols the source cannot serve are omitted from the result map.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    virtual std::map<std::string, std::vector<Bar>> getBars(
        const std::vector<std::string>& symbols,
        int lookback_days
    ) = 0;

    virtual std::optional<double> getLatestPrice(const std::string& symbol) = 0;
};

} // namespace core
} // namespace tradeagent
