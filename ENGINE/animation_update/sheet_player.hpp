#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <SDL.h>

#include "sheet/sprite_sheet.hpp"

namespace aseplay {

enum class PlayResult {
    Ok,
    TagNotFound,
};

// Two opposite corners of the current frame cell; all -1 when nothing plays.
struct FrameCoords {
    int x0 = -1;
    int y0 = -1;
    int x1 = -1;
    int y1 = -1;
};

/*
 * Playback cursor over one SpriteSheet. The sheet is borrowed, never owned,
 * and may be shared by any number of players. A player is inert between
 * update() calls and does no locking; drive each instance from one thread.
 *
 * Callbacks run synchronously inside play()/update(). They may query the
 * player or call play(), but must not call update() on the same player.
 */
class SheetPlayer {
public:
    using LoopCallback        = std::function<void()>;
    using FrameChangeCallback = std::function<void()>;
    using TagCallback         = std::function<void(const Tag&)>;

    explicit SheetPlayer(const SpriteSheet& sheet);

    PlayResult play(std::string_view tag_name);
    void update(float dt);
    void set_frame(int index_within_tag);

    const SpriteSheet& sheet() const { return *sheet_; }
    const Tag* current_tag() const { return current_tag_; }
    bool is_playing(std::string_view tag_name) const;

    int frame_index() const { return frame_index_; }
    int prev_frame_index() const { return prev_frame_index_; }
    double frame_counter() const { return frame_counter_; }
    int play_direction() const { return play_direction_; }

    float play_speed() const { return play_speed_; }
    void set_play_speed(float speed) { play_speed_ = speed; }

    // Loops finished by the most recent update(). Whole cycles folded out of a
    // very long step are counted here but raise on_loop only once between them.
    std::uint64_t loop_count() const { return loop_count_; }
    bool looped() const { return loop_count_ > 0; }

    const Frame* current_frame() const;
    FrameCoords frame_coords() const;
    std::optional<SDL_Rect> frame_rect() const;
    SDL_FPoint frame_uv() const;
    std::optional<SDL_Rect> slice_bounds(std::string_view slice_name) const;

    std::vector<const Tag*> touching_tags() const;
    bool touching_tag(std::string_view tag_name) const;
    std::vector<const Tag*> hit_tags() const;
    bool hit_tag(std::string_view tag_name) const;
    std::vector<const Tag*> left_tags() const;
    bool left_tag(std::string_view tag_name) const;

    void set_on_loop(LoopCallback cb) { on_loop_ = std::move(cb); }
    void set_on_frame_change(FrameChangeCallback cb) { on_frame_change_ = std::move(cb); }
    void set_on_tag_enter(TagCallback cb) { on_tag_enter_ = std::move(cb); }
    void set_on_tag_exit(TagCallback cb) { on_tag_exit_ = std::move(cb); }

private:
    bool frame_in_range(int index) const;
    double frame_duration(int index) const;
    double cycle_duration(const Tag& tag) const;
    void skip_whole_cycles();
    bool wrap_into_tag(const Tag& tag);
    void notify_tag_transitions();

    const SpriteSheet* sheet_ = nullptr;
    const Tag* current_tag_   = nullptr;
    float play_speed_         = 1.0f;
    int   frame_index_        = 0;
    int   prev_frame_index_   = -1;
    double frame_counter_     = 0.0;
    int   play_direction_     = 1;
    std::uint64_t loop_count_ = 0;

    LoopCallback        on_loop_{};
    FrameChangeCallback on_frame_change_{};
    TagCallback         on_tag_enter_{};
    TagCallback         on_tag_exit_{};
};

}
