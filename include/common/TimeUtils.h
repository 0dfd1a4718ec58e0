#pragma once

#include <optional>
#include <string>

namespace tradeagent {
namespace utils {

// "YYYY-MM-DD" 또는 RFC3339 ("2024-03-01T14:30:00.123Z", "+HH:MM" 오프셋) -> epoch ms (UTC)
std::optional<long long> parseTimestampMs(const std::string& value);

// epoch ms -> "YYYY-MM-DD" (UTC)
std::string formatDate(long long epoch_ms);

// epoch ms -> "YYYY-MM-DDTHH:MM:SSZ" (UTC)
std::string formatIso(long long epoch_ms);

} // namespace utils
} // namespace tradeagent
