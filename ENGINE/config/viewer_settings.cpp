#include "viewer_settings.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/string_utils.hpp"

namespace aseplay::config {

namespace {

int read_int(const nlohmann::json& root, const char* key, int fallback, int min_value) {
    auto it = root.find(key);
    if (it == root.end() || !it->is_number()) {
        return fallback;
    }
    const double number = it->get<double>();
    if (!std::isfinite(number) || std::fabs(number) > static_cast<double>(std::numeric_limits<int>::max())) {
        return fallback;
    }
    return std::max(min_value, static_cast<int>(number));
}

float read_float(const nlohmann::json& root, const char* key, float fallback) {
    auto it = root.find(key);
    if (it == root.end() || !it->is_number()) {
        return fallback;
    }
    const double number = it->get<double>();
    if (!std::isfinite(number) || std::fabs(number) > static_cast<double>(std::numeric_limits<float>::max())) {
        return fallback;
    }
    return static_cast<float>(number);
}

SDL_Color read_color(const nlohmann::json& root, const char* key, SDL_Color fallback) {
    auto it = root.find(key);
    if (it == root.end() || !it->is_string()) {
        return fallback;
    }
    const std::string text = it->get<std::string>();
    const auto parsed = aseplay::strings::parse_hex(text);
    if (!parsed) {
        aseplay::log::warn("ViewerSettings", "ignoring unreadable color '" + text + "' for '" + key + "'");
        return fallback;
    }
    const bool has_alpha = aseplay::strings::trim_copy(text).size() > 7;
    const std::uint64_t rgba = has_alpha ? *parsed : ((*parsed << 8) | 0xFFu);
    return SDL_Color{static_cast<Uint8>((rgba >> 24) & 0xFF), static_cast<Uint8>((rgba >> 16) & 0xFF),
                     static_cast<Uint8>((rgba >> 8) & 0xFF), static_cast<Uint8>(rgba & 0xFF)};
}

}

ViewerSettings settings_from_json(const nlohmann::json& root) {
    ViewerSettings settings;
    if (!root.is_object()) {
        return settings;
    }
    settings.window_width = read_int(root, "window_width", settings.window_width, 1);
    settings.window_height = read_int(root, "window_height", settings.window_height, 1);
    settings.scale = read_int(root, "scale", settings.scale, 1);
    settings.play_speed = read_float(root, "play_speed", settings.play_speed);
    if (auto it = root.find("initial_tag"); it != root.end() && it->is_string()) {
        settings.initial_tag = it->get<std::string>();
    }
    if (auto it = root.find("log_level"); it != root.end() && it->is_string()) {
        settings.log_level = aseplay::log::parse_level(it->get<std::string>(), settings.log_level);
    }
    settings.background = read_color(root, "background", settings.background);
    return settings;
}

ViewerSettings load_viewer_settings(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec) || ec) {
        aseplay::log::info("ViewerSettings", "no settings file at '" + path + "'; using defaults");
        return ViewerSettings{};
    }

    std::ifstream in(path);
    nlohmann::json root;
    try {
        in >> root;
    } catch (const nlohmann::json::parse_error& e) {
        aseplay::log::warn("ViewerSettings", "parse error reading '" + path + "': " + e.what() + "; using defaults");
        return ViewerSettings{};
    }
    return settings_from_json(root);
}

}
