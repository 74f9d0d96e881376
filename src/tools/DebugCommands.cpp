#include "callbridge/DebugCommands.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

#include "callbridge/BridgeConfig.hpp"
#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"
#include "callbridge/callbridge_abi.h"
#include "callbridge/colors.hpp"

using json = nlohmann::json;

namespace callbridge {
namespace cli {

void print_usage() {
    std::cout << "Usage: callbridge-debug [options] <command> [args]\n"
              << "Options:\n"
              << "  -c, --config <file>        callbridge.json to use (default: search upwards)\n"
              << "  -l, --library <file>       Native runtime library (overrides config)\n"
              << "  -p, --project-dir <path>   Directory with source files (default: current directory)\n"
              << "  --log <level>              trace|debug|info|warn|error|off\n"
              << "  -h, --help                 Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  version                              Print runtime and ABI versions\n"
              << "  call <function> [key=value ...]     Call a function and print its result\n"
              << "  parse <function> text=<text>        Parse text against a function\n"
              << "  stream <function> [key=value ...]   Stream a function, printing each chunk\n"
              << "\n"
              << "Call options: --env KEY=VALUE (repeatable), --timeout <ms>\n"
              << "\n"
              << "Examples:\n"
              << "  callbridge-debug -l ./libcallbridge_loopback.so call echo value=42\n"
              << "  callbridge-debug stream count to=5 delay_ms=100\n";
}

Arg parse_arg_value(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return Arg{text};
    if (j.is_null()) return Arg{};
    if (j.is_boolean()) return Arg{j.get<bool>()};
    if (j.is_number_integer()) return Arg{j.get<int64_t>()};
    if (j.is_number_float()) return Arg{j.get<double>()};
    if (j.is_string()) return Arg{j.get<std::string>()};
    // Arrays and objects have no wire form; pass the text through.
    return Arg{text};
}

NamedArg parse_named_arg(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw BridgeError(ErrorKind::InvalidArgument, "expected key=value, got '" + text + "'");
    }
    return NamedArg{text.substr(0, eq), parse_arg_value(text.substr(eq + 1))};
}

// ============================================================================
// Shared plumbing
// ============================================================================

struct CallRequest {
    std::string function_name;
    Args args;
    CallOptions options;
};

static CallRequest parse_call_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, "missing function name");
    }

    CallRequest req;
    req.function_name = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--env") {
            if (i + 1 >= args.size()) throw BridgeError(ErrorKind::InvalidArgument, "--env needs KEY=VALUE");
            const std::string& kv = args[++i];
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw BridgeError(ErrorKind::InvalidArgument, "--env needs KEY=VALUE, got '" + kv + "'");
            }
            req.options.env.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (a == "--timeout") {
            if (i + 1 >= args.size()) throw BridgeError(ErrorKind::InvalidArgument, "--timeout needs milliseconds");
            try {
                req.options.timeout = std::chrono::milliseconds(std::stoll(args[++i]));
            } catch (const std::exception&) {
                throw BridgeError(ErrorKind::InvalidArgument, "--timeout needs milliseconds, got '" + args[i] + "'");
            }
        } else {
            req.args.push_back(parse_named_arg(a));
        }
    }
    return req;
}

static std::unique_ptr<BridgeContext> open_context(const GlobalOptions& global, uint64_t* timeout_ms = nullptr) {
    std::optional<BridgeConfig> config;
    if (!global.config_path.empty()) {
        config = parse_bridge_config(global.config_path);
        if (!config) {
            throw BridgeError(ErrorKind::InvalidArgument, "could not read config " + global.config_path);
        }
    } else {
        config = find_and_parse_bridge_config(global.project_dir);
    }

    BridgeConfig effective = config ? *config : BridgeConfig{};
    if (!global.library_path.empty()) {
        effective.native_library = global.library_path;
    }
    if (!config && effective.root_path.empty()) {
        effective.root_path = global.project_dir;
    }
    if (!global.log_level.empty()) {
        effective.log_level = global.log_level;
    }
    if (effective.native_library.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, "no native library: pass --library or add native_library to "
                                                      "callbridge.json");
    }

    if (timeout_ms) *timeout_ms = effective.call_timeout_ms;
    return BridgeContext::from_config(effective);
}

static void apply_default_timeout(CallOptions& options, uint64_t timeout_ms) {
    if (options.timeout.count() == 0 && timeout_ms > 0) {
        options.timeout = std::chrono::milliseconds(timeout_ms);
    }
}

static std::string paint(const std::string& color, const std::string& text) {
    if (!Color::supports_color(STDOUT_FILENO)) return text;
    return color + text + Color::reset;
}

static void print_arg(const Arg& value) {
    if (auto s = std::get_if<std::string>(&value)) {
        std::cout << *s << std::endl;
    } else {
        std::cout << arg_to_string(value) << std::endl;
    }
}

// ============================================================================
// Commands
// ============================================================================

CommandResult cmd_version(const GlobalOptions& global, const std::vector<std::string>& args) {
    (void)args;
    auto context = open_context(global);
    std::cout << "runtime: " << context->version() << std::endl;
    std::cout << "abi:     " << CALLBRIDGE_ABI_VERSION_MAJOR << "." << CALLBRIDGE_ABI_VERSION_MINOR << "."
              << CALLBRIDGE_ABI_VERSION_PATCH << std::endl;
    return {0, ""};
}

CommandResult cmd_call(const GlobalOptions& global, const std::vector<std::string>& args) {
    CallRequest req = parse_call_args(args);
    uint64_t timeout_ms = 0;
    auto context = open_context(global, &timeout_ms);
    apply_default_timeout(req.options, timeout_ms);

    BridgeClient client(*context);
    print_arg(client.call(req.function_name, req.args, req.options));
    return {0, ""};
}

CommandResult cmd_parse(const GlobalOptions& global, const std::vector<std::string>& args) {
    CallRequest req = parse_call_args(args);
    uint64_t timeout_ms = 0;
    auto context = open_context(global, &timeout_ms);
    apply_default_timeout(req.options, timeout_ms);

    BridgeClient client(*context);
    print_arg(client.parse(req.function_name, req.args, req.options));
    return {0, ""};
}

CommandResult cmd_stream(const GlobalOptions& global, const std::vector<std::string>& args) {
    CallRequest req = parse_call_args(args);
    uint64_t timeout_ms = 0;
    auto context = open_context(global, &timeout_ms);
    apply_default_timeout(req.options, timeout_ms);

    BridgeClient client(*context);
    size_t chunks = 0;
    Arg result = client.stream(req.function_name, req.args, [&chunks](const Arg& chunk) {
        ++chunks;
        std::cout << paint(Color::bright_black, "[chunk " + std::to_string(chunks) + "] ") << arg_to_string(chunk)
                  << std::endl;
    }, req.options);

    std::cout << paint(Color::green, "[final] ");
    print_arg(result);
    return {0, ""};
}

CommandResult execute_command(const std::vector<std::string>& args) {
    GlobalOptions global;

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.empty() || arg[0] != '-') break;

        if (arg == "-h" || arg == "--help") {
            print_usage();
            return {0, ""};
        } else if ((arg == "-c" || arg == "--config") && i + 1 < args.size()) {
            global.config_path = args[++i];
        } else if ((arg == "-l" || arg == "--library") && i + 1 < args.size()) {
            global.library_path = args[++i];
        } else if ((arg == "-p" || arg == "--project-dir") && i + 1 < args.size()) {
            global.project_dir = args[++i];
        } else if (arg == "--log" && i + 1 < args.size()) {
            global.log_level = args[++i];
        } else {
            return {1, "unknown option '" + arg + "'"};
        }
    }

    if (i >= args.size()) {
        return {1, "No command specified"};
    }

    std::string command = args[i];
    std::vector<std::string> sub_args(args.begin() + i + 1, args.end());

    try {
        if (command == "version") {
            return cmd_version(global, sub_args);
        } else if (command == "call") {
            return cmd_call(global, sub_args);
        } else if (command == "parse") {
            return cmd_parse(global, sub_args);
        } else if (command == "stream") {
            return cmd_stream(global, sub_args);
        } else {
            return {1, "Unknown command: " + command};
        }
    } catch (const BridgeError& e) {
        return {e.kind() == ErrorKind::Cancelled ? 130 : 1, e.what()};
    } catch (const std::exception& e) {
        return {1, std::string("Error: ") + e.what()};
    }
}

}  // namespace cli
}  // namespace callbridge
