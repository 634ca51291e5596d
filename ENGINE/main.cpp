#include "main.hpp"

#include <SDL.h>
#include <SDL_image.h>
#include <algorithm>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "animation_update/tag_queries.hpp"
#include "sheet/sheet_file.hpp"
#include "utils/log.hpp"

ViewerApp::ViewerApp(aseplay::SpriteSheet sheet, aseplay::config::ViewerSettings settings, SDL_Renderer* renderer)
: sheet_(std::move(sheet)),
  settings_(std::move(settings)),
  renderer_(renderer) {}

ViewerApp::~ViewerApp() {
        if (texture_) SDL_DestroyTexture(texture_);
}

bool ViewerApp::init() {
        texture_ = IMG_LoadTexture(renderer_, sheet_.image_path.c_str());
        if (!texture_) {
                aseplay::log::error("ViewerApp", "IMG_LoadTexture failed for '" + sheet_.image_path + "': " + IMG_GetError());
                return false;
        }

        player_ = std::make_unique<aseplay::SheetPlayer>(sheet_);
        player_->set_play_speed(settings_.play_speed);
        player_->set_on_loop([this]() {
                aseplay::log::debug("ViewerApp", "loop '" + player_->current_tag()->name + "'");
        });
        player_->set_on_frame_change([this]() {
                if (!aseplay::log::enabled(aseplay::log::Level::Debug)) return;
                std::string touching;
                for (std::string_view name : aseplay::tag_queries::names(player_->touching_tags())) {
                        if (!touching.empty()) touching += ", ";
                        touching += name.empty() ? std::string("<sheet>") : std::string(name);
                }
                aseplay::log::debug("ViewerApp", "frame " + std::to_string(player_->frame_index()) + " touching [" + touching + "]");
        });
        player_->set_on_tag_enter([](const aseplay::Tag& tag) {
                aseplay::log::info("ViewerApp", "entered tag '" + tag.name + "'");
        });
        player_->set_on_tag_exit([](const aseplay::Tag& tag) {
                aseplay::log::info("ViewerApp", "left tag '" + tag.name + "'");
        });

        if (player_->play(settings_.initial_tag) != aseplay::PlayResult::Ok) {
                aseplay::log::warn("ViewerApp", "initial tag unavailable; playing the whole sheet");
                player_->play("");
        }
        return true;
}

void ViewerApp::play_declared_tag(std::size_t ordinal) {
        std::vector<const aseplay::Tag*> declared;
        for (const aseplay::Tag& tag : sheet_.tags()) {
                if (!tag.name.empty()) {
                        declared.push_back(&tag);
                }
        }
        if (ordinal >= declared.size()) {
                aseplay::log::debug("ViewerApp", "no tag bound to key " + std::to_string(ordinal + 1));
                return;
        }
        player_->play(declared[ordinal]->name);
}

void ViewerApp::handle_key(SDL_Keycode key) {
        if (key >= SDLK_1 && key <= SDLK_9) {
                play_declared_tag(static_cast<std::size_t>(key - SDLK_1));
                return;
        }
        switch (key) {
                case SDLK_0:
                        player_->play("");
                        break;
                case SDLK_PLUS:
                case SDLK_EQUALS:
                case SDLK_KP_PLUS:
                        player_->set_play_speed(player_->play_speed() + 0.25f);
                        aseplay::log::info("ViewerApp", "play speed " + std::to_string(player_->play_speed()));
                        break;
                case SDLK_MINUS:
                case SDLK_KP_MINUS:
                        player_->set_play_speed(std::max(0.0f, player_->play_speed() - 0.25f));
                        aseplay::log::info("ViewerApp", "play speed " + std::to_string(player_->play_speed()));
                        break;
                case SDLK_SPACE:
                        paused_ = !paused_;
                        break;
                default:
                        break;
        }
}

void ViewerApp::draw() {
        const SDL_Color bg = settings_.background;
        SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, bg.a);
        SDL_RenderClear(renderer_);

        if (const auto src = player_->frame_rect()) {
                int out_w = 0;
                int out_h = 0;
                SDL_GetRendererOutputSize(renderer_, &out_w, &out_h);
                const SDL_Rect dst{
                        (out_w - src->w * settings_.scale) / 2,
                        (out_h - src->h * settings_.scale) / 2,
                        src->w * settings_.scale,
                        src->h * settings_.scale,
                };
                SDL_RenderCopy(renderer_, texture_, &*src, &dst);
        }
        SDL_RenderPresent(renderer_);
}

void ViewerApp::game_loop() {
        constexpr double TARGET_FPS = 60.0;
        constexpr double TARGET_FRAME_SECONDS = 1.0 / TARGET_FPS;
        const double perf_frequency = static_cast<double>(SDL_GetPerformanceFrequency());
        const double target_counts  = TARGET_FRAME_SECONDS * perf_frequency;

        bool quit = false;
        SDL_Event e;
        Uint64 last_tick = SDL_GetPerformanceCounter();

        aseplay::log::info("ViewerApp", "Loop started.");

        while (!quit) {
                const Uint64 frame_begin = SDL_GetPerformanceCounter();
                const float dt = static_cast<float>(static_cast<double>(frame_begin - last_tick) / perf_frequency);
                last_tick = frame_begin;

                while (SDL_PollEvent(&e)) {
                        if (e.type == SDL_QUIT) {
                                quit = true;
                        } else if (e.type == SDL_KEYDOWN && !e.key.repeat) {
                                if (e.key.keysym.sym == SDLK_ESCAPE) {
                                        quit = true;
                                } else {
                                        handle_key(e.key.keysym.sym);
                                }
                        }
                }

                if (!paused_) {
                        player_->update(dt);
                }
                draw();

                const Uint64 frame_end = SDL_GetPerformanceCounter();
                const double work_counts = static_cast<double>(frame_end - frame_begin);
                if (work_counts < target_counts) {
                        const double remaining_ms = ((target_counts - work_counts) * 1000.0) / perf_frequency;
                        if (remaining_ms >= 1.0) {
                                SDL_Delay(static_cast<Uint32>(remaining_ms));
                        }
                }
        }
        aseplay::log::info("ViewerApp", "Loop finished.");
}

int main(int argc, char* argv[]) {
        if (argc < 2) {
                aseplay::log::error("usage: aseplay_viewer <sheet.json> [settings.json]");
                return 1;
        }

        aseplay::config::ViewerSettings settings =
                aseplay::config::load_viewer_settings(argc > 2 ? argv[2] : "");
        aseplay::log::set_level(settings.log_level);

        aseplay::SpriteSheet sheet;
        try {
                sheet = aseplay::sheet_file::load(argv[1]);
        } catch (const std::exception& e) {
                aseplay::log::error("Main", std::string("Unable to load sprite sheet: ") + e.what());
                return 1;
        }

        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
                aseplay::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }

        if (!(IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG)) {
                aseplay::log::error(std::string("IMG_Init failed: ") + IMG_GetError());
                SDL_Quit();
                return 1;
        }

        SDL_Window* window = SDL_CreateWindow("aseplay", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                              settings.window_width, settings.window_height, SDL_WINDOW_RESIZABLE);
        if (!window) {
                aseplay::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                IMG_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Renderer* renderer =
                SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
                aseplay::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                SDL_DestroyWindow(window);
                IMG_Quit();
                SDL_Quit();
                return 1;
        }
        SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

        int exit_code = 0;
        {
                ViewerApp app(std::move(sheet), settings, renderer);
                if (app.init()) {
                        app.game_loop();
                } else {
                        exit_code = 1;
                }
        }

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        IMG_Quit();
        SDL_Quit();
        aseplay::log::info("Main", "Viewer exited cleanly.");
        return exit_code;
}
