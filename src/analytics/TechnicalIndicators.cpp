#include "analytics/TechnicalIndicators.h"
#include <cmath>

namespace tradeagent {
namespace analytics {

double TechnicalIndicators::calculateMean(const std::vector<double>& values, size_t begin, size_t end) {
    if (end <= begin) return 0.0;
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(end - begin);
}

std::optional<double> TechnicalIndicators::calculateSMA(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return calculateMean(values, values.size() - period, values.size());
}

std::optional<double> TechnicalIndicators::calculateStdDev(const std::vector<double>& values, int period) {
    if (period < 2 || values.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }

    const size_t begin = values.size() - period;
    const double mean = calculateMean(values, begin, values.size());

    double sq_sum = 0.0;
    for (size_t i = begin; i < values.size(); ++i) {
        const double diff = values[i] - mean;
        sq_sum += diff * diff;
    }
    return std::sqrt(sq_sum / static_cast<double>(period - 1));
}

std::optional<double> TechnicalIndicators::calculateRSI(const std::vector<double>& closes, int period) {
    if (period <= 0 || closes.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0) gain_sum += change;
        else loss_sum += -change;
    }

    const double avg_gain = gain_sum / period;
    const double avg_loss = loss_sum / period;

    if (avg_loss < 1e-12) {
        return (avg_gain < 1e-12) ? 50.0 : 100.0;
    }

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::optional<double> TechnicalIndicators::calculateMomentum(const std::vector<double>& closes, int n) {
    if (n <= 0 || closes.size() < static_cast<size_t>(n + 1)) {
        return std::nullopt;
    }
    return closes.back() - closes[closes.size() - 1 - n];
}

std::optional<double> TechnicalIndicators::calculateVolumeRatio(const std::vector<double>& volumes, int period) {
    auto avg = calculateSMA(volumes, period);
    if (!avg || *avg <= 0.0) {
        return std::nullopt;
    }
    return volumes.back() / *avg;
}

std::optional<double> TechnicalIndicators::calculateZScore(const std::vector<double>& values, int period) {
    auto mean = calculateSMA(values, period);
    auto std_dev = calculateStdDev(values, period);
    if (!mean || !std_dev || *std_dev <= 0.0) {
        return std::nullopt;
    }
    return (values.back() - *mean) / *std_dev;
}

std::vector<double> TechnicalIndicators::calculateReturns(const std::vector<double>& closes) {
    std::vector<double> returns;
    if (closes.size() < 2) return returns;

    returns.reserve(closes.size() - 1);
    for (size_t i = 1; i < closes.size(); ++i) {
        const double prev = closes[i - 1];
        returns.push_back(prev != 0.0 ? (closes[i] - prev) / prev : 0.0);
    }
    return returns;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Bar>& bars) {
    std::vector<double> volumes;
    volumes.reserve(bars.size());
    for (const auto& bar : bars) {
        volumes.push_back(bar.volume);
    }
    return volumes;
}

} // namespace analytics
} // namespace tradeagent
