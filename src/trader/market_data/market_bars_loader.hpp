#ifndef MARKET_BARS_LOADER_HPP
#define MARKET_BARS_LOADER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace RegimeTrader {
namespace Core {

/**
 * Reads historical bars from CSV: timestamp,open,high,low,close,volume.
 * Timestamps are epoch seconds or ISO-8601 (UTC). A header row and lines
 * starting with '#' are skipped. Malformed rows throw std::runtime_error
 * naming the line.
 */
class MarketBarsLoader {
public:
    explicit MarketBarsLoader(const std::string& bars_file_path);

    std::vector<Bar> load_bars() const;

    static Bar parse_bar_line(const std::string& bar_line, int line_number);
    static bool is_header_line(const std::string& bar_line);

private:
    std::string file_path;
};

} // namespace Core
} // namespace RegimeTrader

#endif // MARKET_BARS_LOADER_HPP
