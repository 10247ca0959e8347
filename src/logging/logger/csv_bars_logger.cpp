#include "csv_bars_logger.hpp"
#include <iomanip>
#include <sstream>

namespace RegimeTrader {
namespace Logging {

namespace {
    const char* const BARS_HEADER_ROW = "Timestamp,Symbol,Open,High,Low,Close,Volume,Ready,Middle,Upper,Lower,TrendQuality";
}

CSVBarsLogger::CSVBarsLogger(const std::string& log_file_path)
    : CSVFileWriter(log_file_path, BARS_HEADER_ROW) {}

void CSVBarsLogger::log_bar(const std::string& timestamp, const std::string& symbol,
                            const Core::Bar& bar, const BarIndicatorSnapshot& indicator_snapshot) {
    std::ostringstream row_stream;
    row_stream << timestamp << ',' << symbol << std::fixed
               << std::setprecision(2)
               << ',' << bar.open_price << ',' << bar.high_price << ',' << bar.low_price << ',' << bar.close_price
               << std::setprecision(0) << ',' << bar.volume
               << ',' << (indicator_snapshot.indicators_ready ? 1 : 0);

    // Warming bars leave the indicator columns empty
    if (indicator_snapshot.indicators_ready) {
        row_stream << std::setprecision(4)
                   << ',' << indicator_snapshot.middle_band << ',' << indicator_snapshot.upper_band
                   << ',' << indicator_snapshot.lower_band << ',' << indicator_snapshot.trend_quality;
    } else {
        row_stream << ",,,,";
    }
    write_row(row_stream.str());
}

} // namespace Logging
} // namespace RegimeTrader
