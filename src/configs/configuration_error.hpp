#ifndef CONFIGURATION_ERROR_HPP
#define CONFIGURATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace RegimeTrader {
namespace Config {

// Raised when an indicator or engine is constructed with parameters it cannot run with.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& error_message)
        : std::runtime_error("Configuration error: " + error_message) {}
};

} // namespace Config
} // namespace RegimeTrader

#endif // CONFIGURATION_ERROR_HPP
