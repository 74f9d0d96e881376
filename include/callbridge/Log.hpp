#pragma once

#include <optional>
#include <sstream>
#include <string>

namespace callbridge {
namespace log {

enum class Level {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

void set_level(Level level);
Level level();
bool enabled(Level level);

std::optional<Level> parse_level(const std::string& name);

// Reads CALLBRIDGE_LOG once; unknown values leave the level unchanged.
void init_from_env();

void write(Level level, const std::string& component, const std::string& message);

}  // namespace log
}  // namespace callbridge

// Streams are only built when the level is enabled.
#define CALLBRIDGE_LOG(lvl, component, expr)                                  \
    do {                                                                      \
        if (::callbridge::log::enabled(lvl)) {                                \
            std::ostringstream callbridge_log_ss_;                            \
            callbridge_log_ss_ << expr;                                       \
            ::callbridge::log::write(lvl, component, callbridge_log_ss_.str()); \
        }                                                                     \
    } while (0)

#define CALLBRIDGE_TRACE(component, expr) CALLBRIDGE_LOG(::callbridge::log::Level::Trace, component, expr)
#define CALLBRIDGE_DEBUG(component, expr) CALLBRIDGE_LOG(::callbridge::log::Level::Debug, component, expr)
#define CALLBRIDGE_INFO(component, expr) CALLBRIDGE_LOG(::callbridge::log::Level::Info, component, expr)
#define CALLBRIDGE_WARN(component, expr) CALLBRIDGE_LOG(::callbridge::log::Level::Warn, component, expr)
#define CALLBRIDGE_ERROR(component, expr) CALLBRIDGE_LOG(::callbridge::log::Level::Error, component, expr)
