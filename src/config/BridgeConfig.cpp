#include "callbridge/BridgeConfig.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace callbridge {

static const char* CONFIG_FILE_NAME = "callbridge.json";

static std::string resolve_against(const std::string& base_dir, const std::string& path) {
    if (path.empty()) return path;
    fs::path p(path);
    if (p.is_absolute() || base_dir.empty()) return p.string();
    return (fs::path(base_dir) / p).lexically_normal().string();
}

// Parse callbridge.json with nlohmann/json
std::optional<BridgeConfig> parse_bridge_config(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            CALLBRIDGE_WARN("config", filepath << ": top-level value must be an object");
            return std::nullopt;
        }

        BridgeConfig config;
        config.base_dir = fs::absolute(fs::path(filepath)).parent_path().string();

        config.native_library = resolve_against(config.base_dir, j.value("native_library", ""));
        config.root_path = resolve_against(config.base_dir, j.value("root_path", ""));
        config.source_extension = j.value("source_extension", ".baml");
        config.log_level = j.value("log_level", "");
        config.call_timeout_ms = j.value("call_timeout_ms", static_cast<uint64_t>(0));

        if (j.contains("env") && j["env"].is_object()) {
            for (auto it = j["env"].begin(); it != j["env"].end(); ++it) {
                if (it.value().is_string()) {
                    config.env[it.key()] = it.value().get<std::string>();
                }
            }
        }

        config.is_valid = true;
        return config;

    } catch (const json::parse_error& e) {
        CALLBRIDGE_WARN("config", "failed to parse " << filepath << ": " << e.what());
        return std::nullopt;
    } catch (const json::exception& e) {
        CALLBRIDGE_WARN("config", "invalid value in " << filepath << ": " << e.what());
        return std::nullopt;
    }
}

std::optional<BridgeConfig> find_and_parse_bridge_config(const std::string& start_dir) {
    std::error_code ec;
    fs::path current = fs::absolute(fs::path(start_dir), ec);
    if (ec) return std::nullopt;

    while (true) {
        fs::path config_path = current / CONFIG_FILE_NAME;
        if (fs::exists(config_path, ec)) {
            return parse_bridge_config(config_path.string());
        }
        if (!current.has_parent_path() || current.parent_path() == current) break;
        current = current.parent_path();
    }
    return std::nullopt;
}

std::map<std::string, std::string> load_source_files(const std::string& root, const std::string& extension) {
    std::map<std::string, std::string> files;

    if (!fs::is_directory(root)) {
        throw BridgeError(ErrorKind::InvalidArgument, "directory not found: " + root);
    }

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.size() < extension.size() ||
            name.compare(name.size() - extension.size(), extension.size(), extension) != 0) {
            continue;
        }

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in.is_open()) {
            throw BridgeError(ErrorKind::InvalidArgument, "cannot read " + entry.path().string());
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        std::string relative = fs::relative(entry.path(), root).generic_string();
        files[relative] = buffer.str();
    }

    CALLBRIDGE_DEBUG("config", "loaded " << files.size() << " source file(s) from " << root);
    return files;
}

std::string to_json_object(const std::map<std::string, std::string>& values) {
    json j = json::object();
    for (const auto& kv : values) {
        j[kv.first] = kv.second;
    }
    return j.dump();
}

}  // namespace callbridge
