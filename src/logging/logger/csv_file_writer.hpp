#ifndef CSV_FILE_WRITER_HPP
#define CSV_FILE_WRITER_HPP

#include <fstream>
#include <mutex>
#include <string>

namespace RegimeTrader {
namespace Logging {

/**
 * Append-only CSV file shared by the run loggers. The header row is written
 * once, when the file is empty. Rows may come from any thread.
 */
class CSVFileWriter {
public:
    CSVFileWriter(const std::string& log_file_path, const std::string& header_row);
    virtual ~CSVFileWriter() = default;

    CSVFileWriter(const CSVFileWriter&) = delete;
    CSVFileWriter& operator=(const CSVFileWriter&) = delete;

    void flush();

    const std::string& get_file_path() const { return file_path; }
    bool is_open() const { return file_stream.is_open(); }

protected:
    // Row text without the trailing newline
    void write_row(const std::string& row_text);

private:
    std::string file_path;
    std::ofstream file_stream;
    std::mutex file_mutex;
};

} // namespace Logging
} // namespace RegimeTrader

#endif // CSV_FILE_WRITER_HPP
