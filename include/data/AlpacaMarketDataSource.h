#pragma once

#include <memory>

#include "core/contracts/IMarketDataSource.h"
#include "network/IHttpClient.h"

namespace tradeagent {
namespace data {

// Alpaca Market Data API (v2) 일봉 / 최근 체결가
class AlpacaMarketDataSource : public core::IMarketDataSource {
public:
    AlpacaMarketDataSource(std::shared_ptr<network::IHttpClient> http_client, const std::string& feed = "iex");

    // 요청 실패한 종목은 결과에서 제외 (로그만 남김)
    std::map<std::string, std::vector<Bar>> getBars(
        const std::vector<std::string>& symbols,
        int lookback_days
    ) override;

    std::optional<double> getLatestPrice(const std::string& symbol) override;

    // 단일 종목 일봉 (페이지네이션 처리), 실패 시 std::runtime_error
    std::vector<Bar> fetchDailyBars(const std::string& symbol, int lookback_days);

    static std::vector<Bar> parseBars(const nlohmann::json& response);

private:
    std::shared_ptr<network::IHttpClient> http_client_;
    std::string feed_;
};

} // namespace data
} // namespace tradeagent
