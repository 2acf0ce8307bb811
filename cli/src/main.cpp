#include "slicecp/command_line.hpp"
#include "slicecp/file_system.hpp"
#include "slicecp/log.hpp"
#include "slicecp/orchestrator.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char **argv) {
    const std::string program = argc > 0 ? argv[0] : "slicecp";

    slicecp::CommandLine cmd;
    try {
        cmd = slicecp::parse_command_line(argc, argv);
    } catch (const slicecp::UsageError &err) {
        std::cerr << "error: " << err.what() << "\n" << slicecp::usage(program);
        return EXIT_FAILURE;
    }
    if (cmd.show_help) {
        std::cout << slicecp::usage(program);
        return EXIT_SUCCESS;
    }
    if (cmd.show_version) {
        std::cout << "slicecp " << slicecp::kVersion << std::endl;
        return EXIT_SUCCESS;
    }
    if (cmd.quiet) {
        slicecp::set_log_threshold(slicecp::LogLevel::Error);
    }

    try {
        slicecp::PosixFileSystem fs;
        slicecp::Orchestrator orchestrator(fs, cmd.options);
        slicecp::log_info("copying '" + cmd.source.string() + "' with " + std::to_string(cmd.options.thread_count) +
                          " threads per file");
        return orchestrator.run(cmd.source, cmd.destination).exit_status();
    } catch (const std::exception &err) {
        slicecp::log_error(err.what());
        return EXIT_FAILURE;
    }
}
