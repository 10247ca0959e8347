#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>

namespace RegimeTrader {
namespace Logging {

class StartupLogs {
public:
    static void log_application_header(const std::string& config_path, const std::string& bars_path);
    static void log_configuration(const Config::SystemConfig& config);
    static void log_run_folder(const std::string& run_folder);
    static void log_configuration_error(const std::string& error_message);
};

} // namespace Logging
} // namespace RegimeTrader

#endif // STARTUP_LOGS_HPP
