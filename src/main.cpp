#include <iostream>
#include <string>
#include <vector>

#include "callbridge/DebugCommands.hpp"
#include "callbridge/Log.hpp"

int main(int argc, char* argv[]) {
    callbridge::log::init_from_env();

    if (argc == 1) {
        callbridge::cli::print_usage();
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    callbridge::cli::CommandResult result = callbridge::cli::execute_command(args);

    if (!result.message.empty()) {
        std::cerr << "callbridge-debug: " << result.message << "\n";
        if (result.exit_code != 0) {
            std::cerr << "Try 'callbridge-debug --help' for more information.\n";
        }
    }
    return result.exit_code;
}
