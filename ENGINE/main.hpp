#pragma once

#include <SDL.h>
#include <memory>
#include <string>

#include "animation_update/sheet_player.hpp"
#include "config/viewer_settings.hpp"
#include "sheet/sprite_sheet.hpp"

class ViewerApp {

public:
    ViewerApp(aseplay::SpriteSheet sheet, aseplay::config::ViewerSettings settings, SDL_Renderer* renderer);
    ~ViewerApp();
    ViewerApp(const ViewerApp&) = delete;
    ViewerApp& operator=(const ViewerApp&) = delete;

    bool init();
    void game_loop();

private:
    void handle_key(SDL_Keycode key);
    void play_declared_tag(std::size_t ordinal);
    void draw();

    aseplay::SpriteSheet sheet_;
    aseplay::config::ViewerSettings settings_;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture*  texture_  = nullptr;
    std::unique_ptr<aseplay::SheetPlayer> player_;
    bool paused_ = false;
};
