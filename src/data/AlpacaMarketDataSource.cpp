#include "data/AlpacaMarketDataSource.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include <stdexcept>

namespace tradeagent {
namespace data {

namespace {
constexpr long long kDayMs = 24LL * 60 * 60 * 1000;
constexpr int kMaxPages = 20;
}

AlpacaMarketDataSource::AlpacaMarketDataSource(
    std::shared_ptr<network::IHttpClient> http_client,
    const std::string& feed
)
    : http_client_(std::move(http_client))
    , feed_(feed)
{
    if (!http_client_) {
        throw std::invalid_argument("AlpacaMarketDataSource requires an HTTP client");
    }
}

std::vector<Bar> AlpacaMarketDataSource::parseBars(const nlohmann::json& response) {
    std::vector<Bar> bars;
    if (!response.contains("bars") || response["bars"].is_null()) {
        return bars;
    }
    if (!response["bars"].is_array()) {
        throw std::runtime_error("Invalid response format from Alpaca bars API");
    }

    for (const auto& bar_data : response["bars"]) {
        if (!bar_data.contains("o") || !bar_data.contains("h") ||
            !bar_data.contains("l") || !bar_data.contains("c") ||
            !bar_data.contains("v") || !bar_data.contains("t")) {
            continue;
        }
        auto timestamp = utils::parseTimestampMs(bar_data["t"].get<std::string>());
        if (!timestamp) {
            continue;
        }
        bars.emplace_back(bar_data["o"].get<double>(), bar_data["h"].get<double>(),
                          bar_data["l"].get<double>(), bar_data["c"].get<double>(),
                          bar_data["v"].get<double>(), *timestamp);
    }
    return bars;
}

std::vector<Bar> AlpacaMarketDataSource::fetchDailyBars(const std::string& symbol, int lookback_days) {
    // lookback_days 는 거래일 수 - 주말/휴장일을 감안해 달력 기간을 넉넉히 요청
    const int calendar_days = lookback_days * 3 / 2 + 5;
    std::map<std::string, std::string> params;
    params["timeframe"] = "1Day";
    params["start"] = utils::formatIso(nowMs() - calendar_days * kDayMs);
    params["limit"] = "10000";
    params["adjustment"] = "raw";
    params["feed"] = feed_;

    std::vector<Bar> bars;
    for (int page = 0; page < kMaxPages; ++page) {
        auto response = http_client_->get("/v2/stocks/" + symbol + "/bars", params);
        if (!response.isSuccess()) {
            throw std::runtime_error("Bars request for " + symbol + " failed (HTTP " +
                                     std::to_string(response.status_code) + "): " + response.body);
        }

        auto j = response.json();
        auto page_bars = parseBars(j);
        bars.insert(bars.end(), page_bars.begin(), page_bars.end());

        if (!j.contains("next_page_token") || !j["next_page_token"].is_string()) {
            break;
        }
        params["page_token"] = j["next_page_token"].get<std::string>();
    }

    bars = backtest::DataHistory::normalize(std::move(bars));
    if (lookback_days > 0 && bars.size() > static_cast<size_t>(lookback_days)) {
        bars.erase(bars.begin(), bars.end() - lookback_days);
    }
    return bars;
}

std::map<std::string, std::vector<Bar>> AlpacaMarketDataSource::getBars(
    const std::vector<std::string>& symbols,
    int lookback_days
) {
    std::map<std::string, std::vector<Bar>> result;
    for (const auto& symbol : symbols) {
        try {
            auto bars = fetchDailyBars(symbol, lookback_days);
            if (bars.empty()) {
                LOG_WARN("{}: no bars returned", symbol);
                continue;
            }
            result[symbol] = std::move(bars);
        } catch (const std::exception& e) {
            LOG_ERROR("{}: bar fetch failed: {}", symbol, e.what());
        }
    }
    LOG_INFO("Fetched bars for {}/{} symbols", result.size(), symbols.size());
    return result;
}

std::optional<double> AlpacaMarketDataSource::getLatestPrice(const std::string& symbol) {
    try {
        std::map<std::string, std::string> params;
        params["feed"] = feed_;
        auto response = http_client_->get("/v2/stocks/" + symbol + "/trades/latest", params);
        if (!response.isSuccess()) {
            LOG_WARN("{}: latest trade request failed (HTTP {})", symbol, response.status_code);
            return std::nullopt;
        }
        auto j = response.json();
        if (j.contains("trade") && j["trade"].is_object() && j["trade"].contains("p") &&
            j["trade"]["p"].is_number()) {
            const double price = j["trade"]["p"].get<double>();
            if (price > 0.0) {
                return price;
            }
        }
        LOG_WARN("{}: latest trade response has no price", symbol);
    } catch (const std::exception& e) {
        LOG_ERROR("{}: latest price fetch failed: {}", symbol, e.what());
    }
    return std::nullopt;
}

} // namespace data
} // namespace tradeagent
