#include "execution/AlpacaVenue.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tradeagent {
namespace execution {

namespace {
std::string formatQuantity(double quantity) {
    std::ostringstream oss;
    if (std::floor(quantity) == quantity) {
        oss << static_cast<long long>(quantity);
    } else {
        oss << std::fixed << std::setprecision(6) << quantity;
    }
    return oss.str();
}
}

AlpacaVenue::AlpacaVenue(std::shared_ptr<network::IHttpClient> http_client)
    : http_client_(std::move(http_client))
{
    if (!http_client_) {
        throw std::invalid_argument("AlpacaVenue requires an HTTP client");
    }
}

void AlpacaVenue::ensureSuccess(const network::HttpResponse& response, const std::string& what) {
    if (response.isSuccess()) {
        return;
    }
    std::string message = response.body;
    if (!response.body.empty()) {
        auto parsed = nlohmann::json::parse(response.body, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message")) {
            message = parsed["message"].get<std::string>();
        }
    }
    throw std::runtime_error(what + " failed (HTTP " + std::to_string(response.status_code) + "): " + message);
}

std::optional<double> AlpacaVenue::readNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = j[key];
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            return std::stod(text);
        } catch (const std::exception& e) {
            LOG_WARN("Unparseable numeric field {}='{}': {}", key, text, e.what());
            return std::nullopt;
        }
    }
    return std::nullopt;
}

core::OrderSnapshot AlpacaVenue::parseOrder(const nlohmann::json& order) {
    core::OrderSnapshot snapshot;
    snapshot.order_id = order.value("id", std::string());

    const double order_qty = readNumber(order, "qty").value_or(0.0);
    const double filled_qty = readNumber(order, "filled_qty").value_or(0.0);
    const auto transition = core::execution::OrderLifecycleStateMachine::transition(
        order.value("status", std::string()), order_qty, filled_qty);

    snapshot.status = transition.status;
    snapshot.terminal = transition.terminal;
    if (transition.filled_qty > 0.0) {
        snapshot.filled_qty = transition.filled_qty;
    }
    snapshot.filled_price = readNumber(order, "filled_avg_price");
    if (order.contains("filled_at") && order["filled_at"].is_string()) {
        snapshot.filled_at_ms = utils::parseTimestampMs(order["filled_at"].get<std::string>());
    }
    return snapshot;
}

core::OrderAck AlpacaVenue::placeOrder(const core::OrderRequest& request) {
    nlohmann::json body;
    body["symbol"] = request.symbol;
    body["qty"] = formatQuantity(request.quantity);
    body["side"] = toString(request.side);
    body["type"] = toString(request.type);
    body["time_in_force"] = "day";
    if (request.type == OrderType::LIMIT && request.limit_price) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << *request.limit_price;
        body["limit_price"] = oss.str();
    }

    auto response = http_client_->post("/v2/orders", body);
    ensureSuccess(response, "Order submission for " + request.symbol);

    auto snapshot = parseOrder(response.json());
    if (snapshot.order_id.empty()) {
        throw std::runtime_error("Order submission for " + request.symbol + " returned no order id");
    }
    LOG_INFO("Alpaca order submitted: {} {} {} ({}), status {}",
             toString(request.side), body["qty"].get<std::string>(), request.symbol,
             snapshot.order_id, toString(snapshot.status));

    core::OrderAck ack;
    ack.order_id = snapshot.order_id;
    ack.status = snapshot.status;
    ack.filled_price = snapshot.filled_price;
    ack.filled_qty = snapshot.filled_qty;
    return ack;
}

core::OrderSnapshot AlpacaVenue::getOrder(const std::string& order_id) {
    auto response = http_client_->get("/v2/orders/" + order_id);
    ensureSuccess(response, "Order lookup " + order_id);
    return parseOrder(response.json());
}

core::AccountSnapshot AlpacaVenue::getAccount() {
    auto response = http_client_->get("/v2/account");
    ensureSuccess(response, "Account lookup");
    auto j = response.json();

    core::AccountSnapshot account;
    account.cash = readNumber(j, "cash").value_or(0.0);
    account.equity = readNumber(j, "equity").value_or(0.0);
    account.buying_power = readNumber(j, "buying_power").value_or(0.0);
    return account;
}

void AlpacaVenue::cancelAllOrders() {
    auto response = http_client_->del("/v2/orders");
    ensureSuccess(response, "Cancel all orders");
    LOG_INFO("Alpaca: all open orders cancelled");
}

} // namespace execution
} // namespace tradeagent
