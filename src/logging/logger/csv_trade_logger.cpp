#include "csv_trade_logger.hpp"
#include <iomanip>
#include <sstream>

namespace RegimeTrader {
namespace Logging {

namespace {
    const char* const TRADES_HEADER_ROW = "Timestamp,Symbol,Leg,Intent,Tag,RequestedQty,FilledQty,Price,LegSharesAfter,NetPositionAfter";
}

CSVTradeLogger::CSVTradeLogger(const std::string& log_file_path)
    : CSVFileWriter(log_file_path, TRADES_HEADER_ROW) {}

void CSVTradeLogger::log_order(const std::string& timestamp, const std::string& symbol,
                               const Core::OrderAction& order_action, double leg_shares_after, double net_position_after) {
    std::ostringstream row_stream;
    row_stream << timestamp << ',' << symbol
               << ',' << Core::position_leg_to_string(order_action.position_leg)
               << ',' << Core::order_intent_to_string(order_action.order_intent)
               << ",\"" << order_action.order_tag << '"'
               << std::fixed << std::setprecision(0)
               << ',' << order_action.requested_quantity << ',' << order_action.filled_quantity
               << std::setprecision(4) << ',' << order_action.reference_price
               << std::setprecision(0) << ',' << leg_shares_after << ',' << net_position_after;
    write_row(row_stream.str());
}

} // namespace Logging
} // namespace RegimeTrader
