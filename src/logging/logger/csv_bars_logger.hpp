#ifndef CSV_BARS_LOGGER_HPP
#define CSV_BARS_LOGGER_HPP

#include "csv_file_writer.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace RegimeTrader {
namespace Logging {

// Channel and trend quality values published for one bar
struct BarIndicatorSnapshot {
    bool indicators_ready;
    double middle_band;
    double upper_band;
    double lower_band;
    double trend_quality;

    BarIndicatorSnapshot() : indicators_ready(false), middle_band(0.0), upper_band(0.0), lower_band(0.0), trend_quality(0.0) {}
};

// One row per consolidated bar: OHLCV plus the indicator values.
class CSVBarsLogger : public CSVFileWriter {
public:
    explicit CSVBarsLogger(const std::string& log_file_path);

    void log_bar(const std::string& timestamp, const std::string& symbol,
                 const Core::Bar& bar, const BarIndicatorSnapshot& indicator_snapshot);
};

} // namespace Logging
} // namespace RegimeTrader

#endif // CSV_BARS_LOGGER_HPP
