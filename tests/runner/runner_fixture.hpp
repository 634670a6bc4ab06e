#pragma once
/// Shared helpers for Runner tests: a throwaway log file and cache directory
/// per test binary, and polling for log lines written by background pumps.

#include "procsup/runner.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace procsup_test
{

struct RunnerFixture
{
    std::filesystem::path dir;
    std::filesystem::path log_path;
    std::unique_ptr<procsup::Runner> runner;

    explicit RunnerFixture(const std::string& name, procsup::Settings settings = {})
    {
        dir = std::filesystem::temp_directory_path() /
              ("procsup_" + name + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        log_path = dir / "session.log";
        settings.log_file = log_path.string();
        settings.cache_dir = (dir / "cache").string();
        runner = std::make_unique<procsup::Runner>(std::make_shared<procsup::Output>(log_path),
                                                   settings);
    }

    ~RunnerFixture()
    {
        runner.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    /// Full log file contents
    std::string log() const
    {
        std::ifstream in(log_path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    bool log_contains(const std::string& needle) const
    {
        return log().find(needle) != std::string::npos;
    }

    /// Output lines are written by pump threads that may lag behind process exit
    bool wait_for_log(const std::string& needle,
                      std::chrono::milliseconds timeout = std::chrono::seconds(10)) const
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (log_contains(needle))
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return log_contains(needle);
    }
};

} // namespace procsup_test
