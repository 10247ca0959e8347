#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace RegimeTrader {
namespace Logging {

namespace {
    std::atomic<LoggingContext*> installed_logging_context{nullptr};

    const char* const DEFAULT_THREAD_TAG = "MAIN  ";

    void write_to_stderr(const std::string& error_message) {
        std::cerr << error_message << std::endl;
    }

    void write_to_console(const std::string& log_line) {
        LoggingContext* logging_context_ptr = find_logging_context();
        if (logging_context_ptr) {
            std::lock_guard<std::mutex> console_guard(logging_context_ptr->console_mutex);
            std::cout << log_line << std::flush;
        } else {
            std::cout << log_line << std::flush;
        }
    }

    std::string local_time_stamp() {
        std::time_t now_seconds = std::time(nullptr);
        std::tm local_time_parts;
        localtime_r(&now_seconds, &local_time_parts);
        std::ostringstream stamp_stream;
        stamp_stream << std::put_time(&local_time_parts, TimeUtils::LOG_FILENAME);
        return stamp_stream.str();
    }

    std::string pad_thread_tag(const std::string& tag_value) {
        std::string padded_tag = tag_value.substr(0, LOG_TAG_WIDTH);
        padded_tag.append(LOG_TAG_WIDTH - padded_tag.size(), ' ');
        return padded_tag;
    }
}

// ========================================================================
// CONTEXT
// ========================================================================

LoggingContext* find_logging_context() {
    return installed_logging_context.load();
}

LoggingContext* get_logging_context() {
    LoggingContext* logging_context_ptr = find_logging_context();
    if (!logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized");
    }
    return logging_context_ptr;
}

void set_logging_context(LoggingContext& context) {
    installed_logging_context.store(&context);
}

void clear_logging_context() {
    installed_logging_context.store(nullptr);
}

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_guard(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    return thread_tag_iterator != thread_tags.end() ? thread_tag_iterator->second : std::string(DEFAULT_THREAD_TAG);
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_guard(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = pad_thread_tag(tag_value);
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

// ========================================================================
// LINE FORMATTING
// ========================================================================

std::string format_log_line(const std::string& message, const std::string& thread_tag) {
    std::string timestamp_string;
    try {
        timestamp_string = TimeUtils::get_current_human_readable_time();
    } catch (const std::exception& time_exception_error) {
        write_to_stderr("ERROR: TimeUtils failed: " + std::string(time_exception_error.what()));
        timestamp_string = "ERROR-TIME";
    }
    return timestamp_string + " [" + thread_tag + "]   " + message + "\n";
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* logging_context_ptr = find_logging_context();
        const std::string thread_tag = logging_context_ptr ? logging_context_ptr->get_thread_tag() : std::string(DEFAULT_THREAD_TAG);
        const std::string log_line = format_log_line(message, thread_tag);

        if (logging_context_ptr && logging_context_ptr->async_logger && logging_context_ptr->async_logger->is_running()) {
            logging_context_ptr->async_logger->enqueue(log_line);
            return;
        }

        write_to_console(log_line);
        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (!log_file_stream.is_open()) {
                write_to_stderr("ERROR: Failed to open log file: " + log_file_path);
                return;
            }
            log_file_stream << log_line;
        }
    } catch (const std::exception& logging_exception_error) {
        write_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(logging_exception_error.what()));
        write_to_stderr(message);
    }
}

// ========================================================================
// FILE NAMING
// ========================================================================

std::string get_git_commit_hash() {
    FILE* git_pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!git_pipe) {
        return "unknown";
    }

    std::string commit_hash;
    char read_buffer[64];
    while (fgets(read_buffer, sizeof(read_buffer), git_pipe) != nullptr) {
        commit_hash += read_buffer;
    }
    pclose(git_pipe);

    while (!commit_hash.empty() && (commit_hash.back() == '\n' || commit_hash.back() == '\r')) {
        commit_hash.pop_back();
    }
    return commit_hash.empty() ? "unknown" : commit_hash;
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::filesystem::path base_path(base_filename);
    std::filesystem::path stamped_path = base_path.parent_path() /
        (base_path.stem().string() + "_" + local_time_stamp() + "_" + get_git_commit_hash() + base_path.extension().string());
    return stamped_path.string();
}

std::string create_unique_run_folder(const std::string& log_directory) {
    std::filesystem::path run_folder_path = std::filesystem::path(log_directory) /
        ("run_" + local_time_stamp() + "_" + get_git_commit_hash());

    std::error_code create_error;
    std::filesystem::create_directories(run_folder_path, create_error);
    if (create_error) {
        write_to_stderr("CRITICAL ERROR: Failed to create run folder: " + create_error.message());
        throw std::runtime_error("Failed to create run folder: " + run_folder_path.string());
    }
    return run_folder_path.string();
}

// ========================================================================
// ASYNC LOGGER
// ========================================================================

AsyncLogger::AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

AsyncLogger::~AsyncLogger() {
    stop();
}

void AsyncLogger::start() {
    if (writer_running.exchange(true)) {
        return;
    }
    writer_thread = std::thread(&AsyncLogger::run_writer_loop, this);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_guard(queue_mutex);
        writer_running.store(false);
    }
    queue_condition.notify_all();
    if (writer_thread.joinable()) {
        writer_thread.join();
    }
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_guard(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_condition.notify_one();
}

void AsyncLogger::write_batch(const std::vector<std::string>& line_batch, std::ofstream& log_file) {
    for (const std::string& log_line : line_batch) {
        if (console_output.load()) {
            write_to_console(log_line);
        }
        if (log_file.is_open()) {
            log_file << log_line;
        }
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
}

void AsyncLogger::run_writer_loop() {
    std::ofstream log_file(file_path, std::ios::app);
    if (!log_file.is_open()) {
        write_to_stderr("ERROR: Failed to open log file: " + file_path);
    }

    std::vector<std::string> line_batch;
    bool keep_running = true;
    while (keep_running) {
        {
            std::unique_lock<std::mutex> queue_lock(queue_mutex);
            queue_condition.wait(queue_lock, [this] { return !pending_lines.empty() || !writer_running.load(); });
            line_batch.swap(pending_lines);
            keep_running = writer_running.load();
        }

        try {
            write_batch(line_batch, log_file);
        } catch (const std::exception& writer_exception_error) {
            write_to_stderr("ERROR: Logging writer failure: " + std::string(writer_exception_error.what()));
        }
        line_batch.clear();
    }
}

// ========================================================================
// APPLICATION FOUNDATION
// ========================================================================

std::shared_ptr<AsyncLogger> initialize_application_foundation(const RegimeTrader::Config::SystemConfig& config) {
    LoggingContext* logging_context_ptr = get_logging_context();
    logging_context_ptr->run_folder = create_unique_run_folder(config.logging.log_directory);

    const std::string log_file_name = std::filesystem::path(config.logging.log_file).filename().string();
    auto logger_instance = std::make_shared<AsyncLogger>(
        generate_timestamped_log_filename(logging_context_ptr->run_folder + "/" + log_file_name));
    logger_instance->set_console_output(config.logging.console_output);

    logging_context_ptr->async_logger = logger_instance;
    logger_instance->start();
    set_log_thread_tag(DEFAULT_THREAD_TAG);
    return logger_instance;
}

void shutdown_application_foundation() {
    LoggingContext* logging_context_ptr = find_logging_context();
    if (!logging_context_ptr) {
        return;
    }
    if (logging_context_ptr->csv_trade_logger) {
        logging_context_ptr->csv_trade_logger->flush();
    }
    if (logging_context_ptr->csv_bars_logger) {
        logging_context_ptr->csv_bars_logger->flush();
    }
    if (logging_context_ptr->async_logger) {
        logging_context_ptr->async_logger->stop();
    }
}

namespace {
    std::string run_csv_path(const std::string& base_filename, const std::string& csv_suffix) {
        LoggingContext* logging_context_ptr = get_logging_context();
        if (logging_context_ptr->run_folder.empty()) {
            throw std::runtime_error("Run folder not initialized - call initialize_application_foundation first");
        }
        return generate_timestamped_log_filename(logging_context_ptr->run_folder + "/" +
                                                 std::filesystem::path(base_filename).stem().string() + csv_suffix);
    }
}

std::shared_ptr<CSVBarsLogger> initialize_csv_bars_logger(const std::string& base_filename) {
    auto bars_logger_instance = std::make_shared<CSVBarsLogger>(run_csv_path(base_filename, "_bars.csv"));
    get_logging_context()->csv_bars_logger = bars_logger_instance;
    return bars_logger_instance;
}

std::shared_ptr<CSVTradeLogger> initialize_csv_trade_logger(const std::string& base_filename) {
    auto trade_logger_instance = std::make_shared<CSVTradeLogger>(run_csv_path(base_filename, "_trades.csv"));
    get_logging_context()->csv_trade_logger = trade_logger_instance;
    return trade_logger_instance;
}

} // namespace Logging
} // namespace RegimeTrader
