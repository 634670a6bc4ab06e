#include "procsup/output.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

int main()
{
    using procsup::Output;

    std::cout << "Test: line format and prefix...\n";
    {
        std::ostringstream ss;
        Output out(&ss);
        out.write("hello world  \n");
        out.write("[3] Running: true", "TEL");
        out.write("child line", "007");
        std::istringstream lines(ss.str());
        std::string line;
        std::regex format(R"(^ *\d+\.\d (TEL|007) \| .*$)");
        int count = 0;
        while (std::getline(lines, line))
        {
            assert(std::regex_match(line, format));
            ++count;
        }
        assert(count == 3);
        assert(ss.str().find("TEL | hello world\n") != std::string::npos);
        assert(ss.str().find("007 | child line\n") != std::string::npos);
        std::cout << "  [PASS] \"<secs> <prefix> | <message>\"\n";
    }

    std::cout << "Test: read_logs keeps the most recent lines...\n";
    {
        std::ostringstream ss;
        Output out(&ss);
        for (int i = 0; i < 40; ++i)
            out.write("line " + std::to_string(i));
        auto logs = out.read_logs();
        assert(logs.find("line 14\n") == std::string::npos);
        assert(logs.find("TEL | line 15\n") != std::string::npos);
        assert(logs.size() >= 9 && logs.substr(logs.size() - 9) == "| line 39");
        size_t newlines = 0;
        for (char c : logs)
            newlines += c == '\n';
        assert(newlines == Output::HISTORY_LINES - 1);
        std::cout << "  [PASS] last " << Output::HISTORY_LINES << " lines\n";
    }

    std::cout << "Test: concurrent writers never interleave a line...\n";
    {
        std::ostringstream ss;
        Output out(&ss);
        std::vector<std::thread> writers;
        for (int t = 0; t < 8; ++t)
        {
            writers.emplace_back(
                [&out, t]()
                {
                    for (int i = 0; i < 200; ++i)
                        out.write("writer-" + std::to_string(t) + "-" + std::to_string(i),
                                  "00" + std::to_string(t));
                });
        }
        for (auto& w : writers)
            w.join();

        std::istringstream lines(ss.str());
        std::string line;
        std::regex format(R"(^ *\d+\.\d 00(\d) \| writer-(\d)-\d+$)");
        int count = 0;
        while (std::getline(lines, line))
        {
            std::smatch m;
            assert(std::regex_match(line, m, format));
            assert(m[1] == m[2]);
            ++count;
        }
        assert(count == 1600);
        std::cout << "  [PASS] 1600 intact lines\n";
    }

    std::cout << "Test: unwritable log path throws...\n";
    {
        bool threw = false;
        try
        {
            Output out(std::filesystem::path("/nonexistent/dir/procsup.log"));
        }
        catch (const std::runtime_error&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "  [PASS] Error on open\n";
    }

    std::cout << "\n[OK] output tests passed\n";
    return 0;
}
