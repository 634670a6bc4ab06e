#pragma once

#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace procsup
{

/**
 * Session log sink.
 *
 * Every line is written as "<seconds since start> <prefix> | <message>" and
 * flushed immediately. Writes from any number of threads are serialized.
 * The most recent lines are also kept in memory for read_logs().
 */
class Output
{
  public:
    static constexpr size_t HISTORY_LINES = 25;

    /// Log to a file (appending), or to stdout when path is "-"
    explicit Output(const std::filesystem::path& logfile_path);

    /// Log to a caller-owned stream; it must outlive this Output
    explicit Output(std::ostream* stream);

    Output(const Output&) = delete;
    Output& operator=(const Output&) = delete;

    void write(const std::string& message, const std::string& prefix = "TEL");

    /// Last HISTORY_LINES lines written, oldest first, joined with '\n'
    std::string read_logs() const;

    /// Where the log goes ("-" for stdout, "<stream>" for a caller stream)
    const std::string& logfile_path() const
    {
        return logfile_path_;
    }

  private:
    std::string logfile_path_;
    std::ofstream file_;
    std::ostream* stream_ = nullptr;
    std::chrono::steady_clock::time_point start_;
    mutable std::mutex mutex_;
    std::deque<std::string> history_;
};

} // namespace procsup
