#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Reads "key,value" lines into cfg; unknown keys are logged and ignored.
bool load_config_from_csv(RegimeTrader::Config::SystemConfig& cfg, const std::string& csv_path);
bool validate_config(const RegimeTrader::Config::SystemConfig& config, std::string& error_message);

// Load + validate; returns 0 on success, 1 on failure
int load_system_config(RegimeTrader::Config::SystemConfig& config, const std::string& csv_path);

#endif // CONFIG_LOADER_HPP
