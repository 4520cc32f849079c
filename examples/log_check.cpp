// Offline checker for machine_<id>.log files:
//   log_check machine_1.log machine_2.log ...
// Exit 0 when every file is a consistent Lamport trace, 1 otherwise.

#include "event_log.hpp"
#include "trace_check.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: log_check <machine log>...\n";
        return 2;
    }

    int exitCode = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::ifstream in(argv[i]);
        if (!in)
        {
            std::cerr << argv[i] << ": cannot open\n";
            exitCode = 1;
            continue;
        }

        std::vector<scalemodel::EventRecord> trace;
        std::size_t receives = 0;
        std::string line;
        std::size_t lineNo = 0;
        bool parsed = true;
        while (std::getline(in, line))
        {
            ++lineNo;
            if (line.empty())
            {
                continue;
            }
            try
            {
                trace.push_back(scalemodel::parse_record(line));
                if (trace.back().type == scalemodel::EventType::Receive)
                {
                    ++receives;
                }
            }
            catch (const std::runtime_error &e)
            {
                std::cerr << argv[i] << ":" << lineNo << ": " << e.what() << "\n";
                parsed = false;
            }
        }

        const auto violations = scalemodel::check_trace(trace);
        for (const auto &v : violations)
        {
            std::cerr << argv[i] << ": " << v << "\n";
        }

        const bool ok = parsed && violations.empty();
        if (!ok)
        {
            exitCode = 1;
        }

        std::cout << argv[i] << ": " << trace.size() << " records, " << receives << " receives, final L="
                  << (trace.empty() ? 0 : trace.back().logicalClock) << (ok ? ", OK" : ", FAILED") << "\n";
    }
    return exitCode;
}
