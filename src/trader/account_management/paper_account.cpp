#include "paper_account.hpp"
#include <cmath>
#include <stdexcept>

namespace RegimeTrader {
namespace Core {

PaperAccount::PaperAccount(double initial_cash)
    : initial_cash_value(initial_cash),
      cash_balance(initial_cash),
      position_quantity(0.0),
      last_marked_price(0.0)
{
    if (initial_cash <= 0.0) {
        throw std::runtime_error("Initial cash must be greater than 0");
    }
}

void PaperAccount::mark_price(double last_price) {
    if (!(last_price > 0.0) || !std::isfinite(last_price)) {
        throw std::runtime_error("Marked price must be positive and finite");
    }
    last_marked_price = last_price;
}

double PaperAccount::get_equity() const {
    return cash_balance + position_quantity * last_marked_price;
}

double PaperAccount::place_order(double signed_quantity, const std::string& order_tag) {
    if (last_marked_price <= 0.0) {
        throw std::runtime_error("Cannot fill order '" + order_tag + "' before a price has been marked");
    }
    if (signed_quantity == 0.0) {
        return 0.0;
    }

    cash_balance -= signed_quantity * last_marked_price;
    position_quantity += signed_quantity;

    PaperFill paper_fill;
    paper_fill.filled_quantity = signed_quantity;
    paper_fill.fill_price = last_marked_price;
    paper_fill.cash_after = cash_balance;
    paper_fill.position_after = position_quantity;
    paper_fill.order_tag = order_tag;
    fill_history.push_back(paper_fill);

    return signed_quantity;
}

double PaperAccount::size_order(double target_allocation) const {
    if (last_marked_price <= 0.0) {
        return 0.0;
    }
    double account_equity = get_equity();
    if (account_equity <= 0.0) {
        return 0.0;
    }
    // Whole shares, truncated toward zero
    return std::trunc(target_allocation * account_equity / last_marked_price);
}

} // namespace Core
} // namespace RegimeTrader
