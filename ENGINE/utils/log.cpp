#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

#include "utils/string_utils.hpp"

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

aseplay::log::Level& global_level() {
    static aseplay::log::Level lvl = aseplay::log::Level::Info;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool env_flag_set(const char* value) {
    return value && (*value == '1' || *value == 'y' || *value == 'Y' || *value == 't' || *value == 'T');
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("ASEPLAY_LOG_LEVEL")) {
        global_level() = aseplay::log::parse_level(v);
    }

    const char* file = std::getenv("ASEPLAY_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        if (env_flag_set(std::getenv("ASEPLAY_LOG_APPEND"))) mode |= std::ios::app; else mode |= std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
}

const char* level_tag(aseplay::log::Level level) {
    switch (level) {
        case aseplay::log::Level::Error: return "ERROR";
        case aseplay::log::Level::Warn:  return "WARN";
        case aseplay::log::Level::Info:  return "INFO";
        case aseplay::log::Level::Debug: return "DEBUG";
        default:                         return "INFO";
    }
}

void log_line_impl(aseplay::log::Level level, std::string_view component, const std::string& message) {
    if (!aseplay::log::enabled(level)) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    const std::string line = aseplay::log::format_line(level, secs, component, message) + '\n';

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostream& os = (level == aseplay::log::Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace aseplay::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

Level parse_level(const std::string& name, Level fallback) {
    const std::string lower = aseplay::strings::to_lower_copy(aseplay::strings::trim_copy(name));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return fallback;
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(log_mutex());
    time_origin() = std::chrono::steady_clock::now();
}

bool enabled(Level level) {
    init_from_env_once();
    return static_cast<int>(level) <= static_cast<int>(global_level());
}

std::string format_line(Level level, double seconds, std::string_view component, const std::string& message) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << '[' << level_tag(level) << "] +" << std::setprecision(3) << seconds << "s: ";
    if (!component.empty()) {
        out << '[' << component << "] ";
    }
    out << message;
    return out.str();
}

void error(const std::string& message) { log_line_impl(Level::Error, {}, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  {}, message); }
void info (const std::string& message) { log_line_impl(Level::Info,  {}, message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, {}, message); }

void error(std::string_view component, const std::string& message) { log_line_impl(Level::Error, component, message); }
void warn (std::string_view component, const std::string& message) { log_line_impl(Level::Warn,  component, message); }
void info (std::string_view component, const std::string& message) { log_line_impl(Level::Info,  component, message); }
void debug(std::string_view component, const std::string& message) { log_line_impl(Level::Debug, component, message); }

}
