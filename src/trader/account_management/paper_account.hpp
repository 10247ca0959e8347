#ifndef PAPER_ACCOUNT_HPP
#define PAPER_ACCOUNT_HPP

#include "trader/trading_logic/order_gateway.hpp"
#include <string>
#include <vector>

namespace RegimeTrader {
namespace Core {

struct PaperFill {
    double filled_quantity;
    double fill_price;
    double cash_after;
    double position_after;
    std::string order_tag;

    PaperFill() : filled_quantity(0.0), fill_price(0.0), cash_after(0.0), position_after(0.0), order_tag("") {}
};

/**
 * Single-symbol simulated account. Market orders fill completely at the last
 * marked price; cash may go negative (margin is not enforced).
 */
class PaperAccount : public OrderGateway {
public:
    explicit PaperAccount(double initial_cash);

    // Latest trade price; fills and equity use it
    void mark_price(double last_price);

    double place_order(double signed_quantity, const std::string& order_tag) override;
    double size_order(double target_allocation) const override;

    double get_initial_cash() const { return initial_cash_value; }
    double get_cash() const { return cash_balance; }
    double get_position() const { return position_quantity; }
    double get_last_price() const { return last_marked_price; }
    double get_equity() const;
    const std::vector<PaperFill>& get_fills() const { return fill_history; }

private:
    double initial_cash_value;
    double cash_balance;
    double position_quantity;
    double last_marked_price;
    std::vector<PaperFill> fill_history;
};

} // namespace Core
} // namespace RegimeTrader

#endif // PAPER_ACCOUNT_HPP
