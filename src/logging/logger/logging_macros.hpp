#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

// Standard indentation levels
#define LOG_INDENT_L1 "        "            // 8 spaces - Main section level
#define LOG_INDENT_L2 "        |   "        // 8 spaces + |   - Content level

// Section headers and footers
#define LOG_SECTION_HEADER(title) log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() log_message(LOG_INDENT_L1 "+-- ", "")

// Content logging macros
#define LOG_CONTENT(msg) log_message(LOG_INDENT_L2 + std::string(msg), "")

// Specialized macros for common patterns
#define LOG_SIGNAL_ANALYSIS_HEADER(symbol) LOG_SECTION_HEADER("SIGNAL ANALYSIS - " + std::string(symbol))
#define LOG_ORDER_EXECUTION_HEADER() LOG_SECTION_HEADER("ORDER EXECUTION")
#define LOG_POSITION_LEDGER_HEADER() LOG_SECTION_HEADER("POSITION LEDGER")
#define LOG_ORDER_RESULT(msg) LOG_CONTENT("ORDER RESULT: " + std::string(msg))

// Startup-specific macros (no indentation for top-level sections)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// Run banner (no indentation)
#define LOG_RUN_HEADER(title) \
    log_message("", ""); \
    log_message("================================================================================", ""); \
    log_message("                                 " + std::string(title), ""); \
    log_message("================================================================================", ""); \
    log_message("", "")

// Two-column tables: 17 character label, 30 character value
namespace RegimeTrader {
namespace Logging {

constexpr const char* TABLE_BORDER_30 = "+-------------------+--------------------------------+";

inline std::string fit_table_cell(const std::string& cell_text, size_t cell_width) {
    std::string fitted_cell = cell_text.substr(0, cell_width);
    fitted_cell.append(cell_width - fitted_cell.size(), ' ');
    return fitted_cell;
}

inline std::string format_table_row_30(const std::string& label_text, const std::string& value_text) {
    return "| " + fit_table_cell(label_text, 17) + " | " + fit_table_cell(value_text, 30) + " |";
}

} // namespace Logging
} // namespace RegimeTrader

#define TABLE_ROW_30(label, value) LOG_CONTENT(RegimeTrader::Logging::format_table_row_30(label, value))
#define TABLE_SEPARATOR_30() LOG_CONTENT(RegimeTrader::Logging::TABLE_BORDER_30)
#define TABLE_FOOTER_30() TABLE_SEPARATOR_30()
#define TABLE_HEADER_30(title, subtitle) do { \
    TABLE_SEPARATOR_30(); \
    TABLE_ROW_30(title, subtitle); \
    TABLE_SEPARATOR_30(); \
} while(0)

#endif // LOGGING_MACROS_HPP
