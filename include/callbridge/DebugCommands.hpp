#ifndef CALLBRIDGE_DEBUG_COMMANDS_HPP
#define CALLBRIDGE_DEBUG_COMMANDS_HPP

#include <string>
#include <vector>

#include "callbridge/BridgeClient.hpp"

namespace callbridge {
namespace cli {

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Options shared by every command, taken from the front of argv.
struct GlobalOptions {
    std::string config_path;
    std::string library_path;
    std::string project_dir = ".";
    std::string log_level;
};

// Main command dispatcher
CommandResult execute_command(const std::vector<std::string>& args);

CommandResult cmd_version(const GlobalOptions& global, const std::vector<std::string>& args);
CommandResult cmd_call(const GlobalOptions& global, const std::vector<std::string>& args);
CommandResult cmd_parse(const GlobalOptions& global, const std::vector<std::string>& args);
CommandResult cmd_stream(const GlobalOptions& global, const std::vector<std::string>& args);

// "key=value" with JSON scalars for value; anything else is taken as a string.
// Throws BridgeError(InvalidArgument) when there is no '='.
NamedArg parse_named_arg(const std::string& text);
Arg parse_arg_value(const std::string& text);

void print_usage();

}  // namespace cli
}  // namespace callbridge

#endif  // CALLBRIDGE_DEBUG_COMMANDS_HPP
