#include "procsup/output.hpp"

#include "procsup/exceptions.hpp"

#include <cstdio>
#include <iostream>

namespace procsup
{

Output::Output(const std::filesystem::path& logfile_path)
    : logfile_path_(logfile_path.string()), start_(std::chrono::steady_clock::now())
{
    if (logfile_path_ == "-")
    {
        stream_ = &std::cout;
        return;
    }
    file_.open(logfile_path, std::ios::app);
    if (!file_.is_open())
        throw Error("Cannot open log file: " + logfile_path_);
    stream_ = &file_;
}

Output::Output(std::ostream* stream)
    : logfile_path_("<stream>"), stream_(stream), start_(std::chrono::steady_clock::now())
{
    if (stream_ == nullptr)
        throw ValidationError("Output stream must not be null");
}

void Output::write(const std::string& message, const std::string& prefix)
{
    auto end = message.find_last_not_of(" \t\r\n");
    std::string text = end == std::string::npos ? std::string() : message.substr(0, end + 1);

    double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%6.1f", elapsed);
    std::string line = std::string(stamp) + " " + prefix + " | " + text;

    std::lock_guard<std::mutex> lock(mutex_);
    *stream_ << line << '\n';
    stream_->flush();
    history_.push_back(std::move(line));
    while (history_.size() > HISTORY_LINES)
        history_.pop_front();
}

std::string Output::read_logs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string logs;
    for (const auto& line : history_)
    {
        if (!logs.empty())
            logs += '\n';
        logs += line;
    }
    return logs;
}

} // namespace procsup
