#include "common/TimeUtils.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tradeagent {
namespace utils {

namespace {
bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string formatUtc(long long epoch_ms, const char* pattern) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm = {};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}
}

std::optional<long long> parseTimestampMs(const std::string& value) {
    if (value.size() < 10) {
        return std::nullopt;
    }

    std::tm tm = {};
    size_t pos = 0;
    if (value.size() >= 19 && (value[10] == 'T' || value[10] == ' ')) {
        std::string normalized = value.substr(0, 19);
        normalized[10] = 'T';
        std::istringstream iss(normalized);
        iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (iss.fail()) {
            return std::nullopt;
        }
        pos = 19;
    } else {
        std::istringstream iss(value.substr(0, 10));
        iss >> std::get_time(&tm, "%Y-%m-%d");
        if (iss.fail()) {
            return std::nullopt;
        }
        pos = 10;
    }

    long long millis = 0;
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < value.size() && isDigit(value[pos])) {
            if (digits < 3) {
                millis = millis * 10 + (value[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits > 0 && digits < 3) {
            millis *= 10;
            ++digits;
        }
    }

    // Z 는 UTC
    long long offset_seconds = 0;
    if (pos < value.size() && (value[pos] == '+' || value[pos] == '-')) {
        const int sign = (value[pos] == '+') ? 1 : -1;
        if (value.size() >= pos + 6 && isDigit(value[pos + 1]) && isDigit(value[pos + 2]) &&
            isDigit(value[pos + 4]) && isDigit(value[pos + 5])) {
            const int hours = (value[pos + 1] - '0') * 10 + (value[pos + 2] - '0');
            const int minutes = (value[pos + 4] - '0') * 10 + (value[pos + 5] - '0');
            offset_seconds = sign * (hours * 3600LL + minutes * 60LL);
        }
    }

    const long long epoch_seconds = static_cast<long long>(timegm(&tm)) - offset_seconds;
    return epoch_seconds * 1000LL + millis;
}

std::string formatDate(long long epoch_ms) {
    return formatUtc(epoch_ms, "%Y-%m-%d");
}

std::string formatIso(long long epoch_ms) {
    return formatUtc(epoch_ms, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace utils
} // namespace tradeagent
