#include "backtest/Backtester.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <optional>

namespace tradeagent {
namespace backtest {

namespace {
struct OpenPosition {
    OrderSide side;
    int quantity;
    size_t entry_index;
    double entry_price;
    double stop_loss;
};

double positionPnl(const OpenPosition& position, double price) {
    return (position.side == OrderSide::BUY)
        ? (price - position.entry_price) * position.quantity
        : (position.entry_price - price) * position.quantity;
}
}

Backtester::Backtester(const engine::BacktestSettings& settings)
    : settings_(settings)
{
}

BacktestResult Backtester::run(
    const std::string& symbol,
    const std::vector<Bar>& bars,
    strategy::IStrategy& strategy
) const {
    BacktestResult result;
    result.strategy_name = strategy.getName();
    result.symbol = symbol;
    result.initial_capital = settings_.initial_capital;

    double capital = settings_.initial_capital;
    double peak_equity = capital;
    std::optional<OpenPosition> position;

    auto closeAt = [&](size_t index, const std::string& reason) {
        BacktestTrade trade;
        trade.symbol = symbol;
        trade.side = position->side;
        trade.quantity = position->quantity;
        trade.entry_index = position->entry_index;
        trade.exit_index = index;
        trade.entry_timestamp = bars[position->entry_index].timestamp;
        trade.exit_timestamp = bars[index].timestamp;
        trade.entry_price = position->entry_price;
        trade.exit_price = bars[index].close;
        trade.stop_loss = position->stop_loss;
        trade.pnl = positionPnl(*position, trade.exit_price);
        const double cost_basis = position->entry_price * position->quantity;
        trade.pnl_percent = (cost_basis > 0.0) ? trade.pnl / cost_basis * 100.0 : 0.0;
        trade.exit_reason = reason;

        capital += trade.pnl;
        result.trades.push_back(trade);
        position.reset();
    };

    const size_t start = static_cast<size_t>(std::max(0, settings_.warmup_bars));
    std::vector<Bar> window;
    window.reserve(bars.size());
    for (size_t i = 0; i < std::min(start, bars.size()); ++i) {
        window.push_back(bars[i]);
    }

    for (size_t i = start; i < bars.size(); ++i) {
        // 미래 봉은 전략에 노출하지 않음
        window.push_back(bars[i]);
        const double close = bars[i].close;
        result.bars_processed++;

        strategy::StrategyOutput signal;
        try {
            signal = strategy.generateSignal(symbol, window);
        } catch (const std::exception& e) {
            LOG_WARN("Backtest signal error at bar {}: {}", i, e.what());
            signal = strategy::StrategyOutput::hold(strategy.getName(), e.what());
        }

        if (!position) {
            if (signal.action == strategy::Action::LONG || signal.action == strategy::Action::SHORT) {
                const OrderSide side = (signal.action == strategy::Action::LONG) ? OrderSide::BUY : OrderSide::SELL;
                const double budget = std::max(0.0, capital) * settings_.position_fraction;
                const int quantity = std::max(1, static_cast<int>(std::floor(budget / close)));
                double stop = signal.stop_loss.value_or(0.0);
                if (stop <= 0.0) {
                    stop = (side == OrderSide::BUY) ? close * (1.0 - settings_.stop_loss_fraction)
                                                    : close * (1.0 + settings_.stop_loss_fraction);
                }
                position = OpenPosition{side, quantity, i, close, stop};
            }
        } else {
            const bool is_long = position->side == OrderSide::BUY;
            const bool stop_hit = is_long ? (close <= position->stop_loss) : (close >= position->stop_loss);
            if (stop_hit) {
                closeAt(i, "stop_loss");
            } else if (signal.action == strategy::Action::CLOSE) {
                closeAt(i, "close_signal");
            } else if ((is_long && signal.action == strategy::Action::SHORT) ||
                       (!is_long && signal.action == strategy::Action::LONG)) {
                closeAt(i, "opposite_signal");
            }
        }

        // 평가 자산 기준 낙폭
        const double equity = capital + (position ? positionPnl(*position, close) : 0.0);
        peak_equity = std::max(peak_equity, equity);
        if (peak_equity > 0.0) {
            result.max_drawdown = std::max(result.max_drawdown, (peak_equity - equity) / peak_equity);
        }
    }

    if (position) {
        closeAt(bars.size() - 1, "end_of_data");
    }

    // ===== 집계 =====
    double win_sum = 0.0;
    double loss_sum = 0.0;
    for (const auto& trade : result.trades) {
        if (trade.pnl > 0.0) {
            result.winning_trades++;
            win_sum += trade.pnl;
        } else {
            result.losing_trades++;
            loss_sum += trade.pnl;
        }
    }
    result.total_trades = static_cast<int>(result.trades.size());
    if (result.total_trades > 0) {
        result.win_rate = static_cast<double>(result.winning_trades) / result.total_trades;
    }
    if (result.winning_trades > 0) result.avg_win = win_sum / result.winning_trades;
    if (result.losing_trades > 0) result.avg_loss = loss_sum / result.losing_trades;
    result.profit_factor = (result.losing_trades > 0 && result.avg_loss != 0.0)
        ? std::abs(result.avg_win / result.avg_loss)
        : 0.0;

    result.final_capital = capital;
    result.total_return = capital - settings_.initial_capital;
    result.total_return_percent = (settings_.initial_capital > 0.0)
        ? result.total_return / settings_.initial_capital * 100.0
        : 0.0;
    return result;
}

void Backtester::logResult(const BacktestResult& result) {
    LOG_INFO("===== Backtest: {} on {} ({} bars) =====", result.strategy_name, result.symbol, result.bars_processed);
    LOG_INFO("Trades {} (win {}, loss {}), win rate {:.1f}%",
             result.total_trades, result.winning_trades, result.losing_trades, result.win_rate * 100.0);
    LOG_INFO("Return {:+.2f} ({:+.2f}%), final capital {:.2f}",
             result.total_return, result.total_return_percent, result.final_capital);
    LOG_INFO("Avg win {:.2f}, avg loss {:.2f}, profit factor {:.2f}, max drawdown {:.2f}%",
             result.avg_win, result.avg_loss, result.profit_factor, result.max_drawdown * 100.0);
}

} // namespace backtest
} // namespace tradeagent
