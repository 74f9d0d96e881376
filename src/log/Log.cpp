#include "callbridge/Log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include "callbridge/colors.hpp"

namespace callbridge {
namespace log {

static std::atomic<int> g_level{static_cast<int>(Level::Warn)};
static std::mutex g_write_mutex;

void set_level(Level lvl) {
    g_level.store(static_cast<int>(lvl));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load();
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off" || name == "none") return Level::Off;
    return std::nullopt;
}

void init_from_env() {
    const char* env = std::getenv("CALLBRIDGE_LOG");
    if (!env) return;
    if (auto lvl = parse_level(env)) {
        set_level(*lvl);
    }
}

static const char* level_tag(Level lvl) {
    switch (lvl) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Off:
            break;
    }
    return "";
}

static const std::string& level_color(Level lvl) {
    switch (lvl) {
        case Level::Trace:
        case Level::Debug:
            return Color::bright_black;
        case Level::Info:
            return Color::cyan;
        case Level::Warn:
            return Color::yellow;
        default:
            return Color::bright_red;
    }
}

void write(Level lvl, const std::string& component, const std::string& message) {
    static const bool use_color = Color::supports_color();

    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (use_color) {
        std::cerr << level_color(lvl) << "[" << level_tag(lvl) << "]" << Color::reset;
    } else {
        std::cerr << "[" << level_tag(lvl) << "]";
    }
    std::cerr << " " << component << ": " << message << std::endl;
}

}  // namespace log
}  // namespace callbridge
