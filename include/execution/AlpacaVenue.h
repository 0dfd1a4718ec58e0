#pragma once

#include <memory>
#include <optional>

#include "core/contracts/IExecutionVenue.h"
#include "network/IHttpClient.h"

namespace tradeagent {
namespace execution {

// Alpaca Trading API (v2) 주문/계좌 어댑터
class AlpacaVenue : public core::IExecutionVenue {
public:
    explicit AlpacaVenue(std::shared_ptr<network::IHttpClient> http_client);

    core::OrderAck placeOrder(const core::OrderRequest& request) override;
    core::OrderSnapshot getOrder(const std::string& order_id) override;
    core::AccountSnapshot getAccount() override;
    void cancelAllOrders() override;
    bool isLive() const override { return true; }

    // Alpaca 응답은 숫자를 문자열로 내려줌 ("123.45")
    static std::optional<double> readNumber(const nlohmann::json& j, const char* key);
    static core::OrderSnapshot parseOrder(const nlohmann::json& order);

private:
    std::shared_ptr<network::IHttpClient> http_client_;

    static void ensureSuccess(const network::HttpResponse& response, const std::string& what);
};

} // namespace execution
} // namespace tradeagent
