#include "slicecp/log.hpp"

#include <cassert>
#include <string>
#include <vector>

int main() {
    std::vector<std::string> lines;
    slicecp::set_log_handler([&lines](slicecp::LogLevel level, const std::string &message) {
        lines.push_back(std::string(slicecp::log_level_name(level)) + " " + message);
    });

    slicecp::log_info("copying");
    slicecp::log_debug("hidden at the default threshold");
    assert(lines.size() == 1);
    assert(lines[0] == "info copying");

    slicecp::set_log_threshold(slicecp::LogLevel::Error);
    slicecp::log_warning("dropped");
    slicecp::log_error("kept");
    assert(lines.size() == 2);
    assert(lines[1] == "error kept");

    slicecp::set_log_threshold(slicecp::LogLevel::Debug);
    slicecp::log_debug("slice plan");
    assert(lines.size() == 3);

    // A handler may log again and replace itself without deadlocking.
    int nested = 0;
    slicecp::set_log_handler([&](slicecp::LogLevel, const std::string &message) {
        lines.push_back(message);
        if (nested++ == 0) {
            slicecp::log_info("from handler");
            slicecp::set_log_handler([&lines](slicecp::LogLevel, const std::string &replaced) {
                lines.push_back("replaced " + replaced);
            });
        }
    });
    slicecp::log_info("outer");
    assert(nested == 2);
    assert(lines[3] == "outer" && lines[4] == "from handler");
    slicecp::log_info("after");
    assert(lines.back() == "replaced after");

    slicecp::set_log_handler(nullptr);
    return 0;
}
