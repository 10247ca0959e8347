#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "configs/system_config.hpp"
#include "csv_bars_logger.hpp"
#include "csv_trade_logger.hpp"

namespace RegimeTrader {
namespace Logging {

constexpr size_t LOG_TAG_WIDTH = 6;

/**
 * Queue backed logger. Producers hand over formatted lines; one writer thread
 * drains them in batches to the console and the run log file. stop() returns
 * after everything enqueued before it has been written.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path);
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start();
    void stop();
    void enqueue(const std::string& formatted_line);

    bool is_running() const { return writer_running.load(); }
    void set_console_output(bool console_enabled) { console_output.store(console_enabled); }
    const std::string& get_file_path() const { return file_path; }

private:
    std::string file_path;
    std::thread writer_thread;
    std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::vector<std::string> pending_lines;
    std::atomic<bool> writer_running{false};
    std::atomic<bool> console_output{true};

    void run_writer_loop();
    void write_batch(const std::vector<std::string>& line_batch, std::ofstream& log_file);
};

// Everything the logging free functions write through. Installed once by main.
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::shared_ptr<CSVBarsLogger> csv_bars_logger;
    std::shared_ptr<CSVTradeLogger> csv_trade_logger;
    std::mutex console_mutex;
    std::string run_folder;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

// "<timestamp> [<tag>]   <message>"
std::string format_log_line(const std::string& message, const std::string& thread_tag);

// Main logging function. Without a running logger the line goes straight to stdout
// (and to log_file_path when one is given).
void log_message(const std::string& message, const std::string& log_file_path);

void set_log_thread_tag(const std::string& thread_tag_value);

// Run folder and file naming: <dir>/run_<DD-HH-MM>_<git hash>/<base>_<DD-HH-MM>_<git hash>.<ext>
std::string get_git_commit_hash();
std::string generate_timestamped_log_filename(const std::string& base_filename);
std::string create_unique_run_folder(const std::string& log_directory);

// Creates the run folder and starts the async logger
std::shared_ptr<AsyncLogger> initialize_application_foundation(const RegimeTrader::Config::SystemConfig& config);
void shutdown_application_foundation();

// CSV logging initialization (requires the run folder)
std::shared_ptr<CSVBarsLogger> initialize_csv_bars_logger(const std::string& base_filename);
std::shared_ptr<CSVTradeLogger> initialize_csv_trade_logger(const std::string& base_filename);

// Context access. get_logging_context throws when none is installed.
LoggingContext* get_logging_context();
LoggingContext* find_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace RegimeTrader

#endif // ASYNC_LOGGER_HPP
