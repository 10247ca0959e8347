#include "csv_file_writer.hpp"
#include <filesystem>
#include <stdexcept>

namespace RegimeTrader {
namespace Logging {

CSVFileWriter::CSVFileWriter(const std::string& log_file_path, const std::string& header_row)
    : file_path(log_file_path) {
    std::filesystem::path csv_path(file_path);
    if (csv_path.has_parent_path()) {
        std::filesystem::create_directories(csv_path.parent_path());
    }

    file_stream.open(file_path, std::ios::out | std::ios::app);
    if (!file_stream.is_open()) {
        throw std::runtime_error("Failed to open CSV log file: " + file_path);
    }

    if (std::filesystem::file_size(csv_path) == 0) {
        file_stream << header_row << '\n';
        file_stream.flush();
    }
}

void CSVFileWriter::write_row(const std::string& row_text) {
    std::lock_guard<std::mutex> file_guard(file_mutex);
    if (!file_stream.is_open()) {
        throw std::runtime_error("CSV log file is closed: " + file_path);
    }
    file_stream << row_text << '\n';
}

void CSVFileWriter::flush() {
    std::lock_guard<std::mutex> file_guard(file_mutex);
    if (file_stream.is_open()) {
        file_stream.flush();
    }
}

} // namespace Logging
} // namespace RegimeTrader
