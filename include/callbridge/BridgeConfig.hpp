#ifndef CALLBRIDGE_BRIDGE_CONFIG_HPP
#define CALLBRIDGE_BRIDGE_CONFIG_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace callbridge {

// Structure to hold parsed callbridge.json data
struct BridgeConfig {
    std::string native_library;
    std::string root_path;
    std::string source_extension = ".baml";
    std::map<std::string, std::string> env;
    std::string log_level;

    // 0 means no deadline
    uint64_t call_timeout_ms = 0;

    // Directory the config file was found in; relative paths resolve against it
    std::string base_dir;

    bool is_valid = false;
};

std::optional<BridgeConfig> parse_bridge_config(const std::string& filepath);
std::optional<BridgeConfig> find_and_parse_bridge_config(const std::string& start_dir = ".");

// Reads every file under root whose name ends in extension, keyed by its path
// relative to root (forward slashes).
std::map<std::string, std::string> load_source_files(const std::string& root, const std::string& extension);

std::string to_json_object(const std::map<std::string, std::string>& values);

}  // namespace callbridge

#endif  // CALLBRIDGE_BRIDGE_CONFIG_HPP
