#pragma once

#include <string>
#include <string_view>

namespace aseplay::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

void set_level(Level level);
Level level();
Level parse_level(const std::string& name, Level fallback = Level::Info);

void reset_time_origin();
bool enabled(Level level);

// "[LEVEL] +secs: [component] message"; the component bracket is dropped when empty.
std::string format_line(Level level, double seconds, std::string_view component, const std::string& message);

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

void error(std::string_view component, const std::string& message);
void warn(std::string_view component, const std::string& message);
void info(std::string_view component, const std::string& message);
void debug(std::string_view component, const std::string& message);

}
