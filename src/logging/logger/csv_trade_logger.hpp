#ifndef CSV_TRADE_LOGGER_HPP
#define CSV_TRADE_LOGGER_HPP

#include "csv_file_writer.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace RegimeTrader {
namespace Logging {

/**
 * CSV logger for orders sent by the signal engine.
 * One row per order, written to <run folder>/<base>_trades_*.csv
 */
class CSVTradeLogger : public CSVFileWriter {
public:
    explicit CSVTradeLogger(const std::string& log_file_path);

    // Ledger values are taken after the whole bar was evaluated
    void log_order(const std::string& timestamp, const std::string& symbol,
                   const Core::OrderAction& order_action, double leg_shares_after, double net_position_after);
};

} // namespace Logging
} // namespace RegimeTrader

#endif // CSV_TRADE_LOGGER_HPP
