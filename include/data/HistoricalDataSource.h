#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IMarketDataSource.h"

namespace tradeagent {
namespace data {

// 디렉토리의 <SYMBOL>.csv / <SYMBOL>.json 봉 파일을 읽는 데이터 소스 (PAPER 모드, 오프라인 실행)
class HistoricalDataSource : public core::IMarketDataSource {
public:
    explicit HistoricalDataSource(const std::string& data_dir);

    std::map<std::string, std::vector<Bar>> getBars(
        const std::vector<std::string>& symbols,
        int lookback_days
    ) override;

    // 마지막 봉의 종가
    std::optional<double> getLatestPrice(const std::string& symbol) override;

    // 테스트/백테스트에서 파일 없이 주입
    void setBars(const std::string& symbol, std::vector<Bar> bars);

private:
    std::string data_dir_;
    std::mutex mutex_;
    std::map<std::string, std::vector<Bar>> cache_;

    const std::vector<Bar>* loadSymbol(const std::string& symbol);
};

} // namespace data
} // namespace tradeagent
