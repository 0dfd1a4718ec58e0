#include "core/state/PositionStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace tradeagent {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;
}

PositionStoreJson::PositionStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    load();
}

bool PositionStoreJson::load() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!std::filesystem::exists(file_path_)) {
        return false;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Failed to open position store: {}", file_path_.string());
        return false;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const std::exception& e) {
        LOG_ERROR("Position store parse error ({}): {}", file_path_.string(), e.what());
        return false;
    }

    positions_.clear();
    trades_.clear();
    daily_performance_.clear();

    for (const auto& row : raw.value("positions", nlohmann::json::array())) {
        auto position = positionFromJson(row);
        positions_[position.symbol] = position;
    }
    for (const auto& row : raw.value("trades", nlohmann::json::array())) {
        trades_.push_back(tradeFromJson(row));
    }
    for (const auto& row : raw.value("daily_performance", nlohmann::json::array())) {
        daily_performance_.push_back(dailyPerformanceFromJson(row));
    }
    next_trade_seq_ = raw.value("next_trade_seq", static_cast<std::uint64_t>(trades_.size() + 1));

    LOG_INFO("Position store loaded: {} positions, {} trades", positions_.size(), trades_.size());
    return true;
}

bool PositionStoreJson::save() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["saved_at_ms"] = nowMs();
    raw["next_trade_seq"] = next_trade_seq_;
    raw["positions"] = nlohmann::json::array();
    for (const auto& [symbol, position] : positions_) {
        raw["positions"].push_back(toJson(position));
    }
    raw["trades"] = nlohmann::json::array();
    for (const auto& trade : trades_) {
        raw["trades"].push_back(toJson(trade));
    }
    raw["daily_performance"] = nlohmann::json::array();
    for (const auto& row : daily_performance_) {
        raw["daily_performance"].push_back(toJson(row));
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
    }

    ec.clear();
    std::filesystem::rename(tmp_path, file_path_, ec);
    return !ec;
}

void PositionStoreJson::onChanged() {
    if (!save()) {
        LOG_ERROR("Failed to persist position store: {}", file_path_.string());
    }
}

} // namespace core
} // namespace tradeagent
