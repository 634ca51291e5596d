#pragma once

#include <string>

#include <SDL.h>
#include <nlohmann/json_fwd.hpp>

#include "utils/log.hpp"

namespace aseplay::config {

struct ViewerSettings {
    int window_width = 640;
    int window_height = 360;
    int scale = 4;
    float play_speed = 1.0f;
    std::string initial_tag;
    aseplay::log::Level log_level = aseplay::log::Level::Info;
    SDL_Color background{32, 32, 40, 255};
};

// Every key is optional; missing or mistyped keys keep their defaults.
ViewerSettings settings_from_json(const nlohmann::json& root);

// Missing file -> defaults. Unparsable file -> defaults plus a warning.
ViewerSettings load_viewer_settings(const std::string& path);

}
