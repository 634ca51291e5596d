#include "sheet_player.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "tag_queries.hpp"
#include "utils/log.hpp"

namespace aseplay {

SheetPlayer::SheetPlayer(const SpriteSheet& sheet)
    : sheet_(&sheet) {}

PlayResult SheetPlayer::play(std::string_view tag_name) {
    const Tag* tag = sheet_->find_tag(tag_name);
    if (!tag) {
        aseplay::log::warn("SheetPlayer", "play: tag '" + std::string(tag_name) + "' not found in sheet '" +
                           sheet_->image_path + "'");
        return PlayResult::TagNotFound;
    }
    if (tag == current_tag_) {
        return PlayResult::Ok;
    }

    prev_frame_index_ = current_tag_ ? frame_index_ : -1;
    current_tag_ = tag;
    frame_counter_ = 0.0;
    loop_count_ = 0;
    if (tag->direction == PlayDirection::Reverse) {
        play_direction_ = -1;
        frame_index_ = tag->end;
    } else {
        play_direction_ = 1;
        frame_index_ = tag->start;
    }

    aseplay::log::debug("SheetPlayer", "playing '" + tag->name + "' [" + std::to_string(tag->start) + ", " +
                        std::to_string(tag->end) + "] " + direction_name(tag->direction));
    notify_tag_transitions();
    return PlayResult::Ok;
}

void SheetPlayer::update(float dt) {
    loop_count_ = 0;
    if (!current_tag_ || !frame_in_range(frame_index_)) {
        return;
    }
    const double delta = static_cast<double>(dt) * static_cast<double>(play_speed_);
    if (!std::isfinite(delta)) {
        aseplay::log::warn("SheetPlayer", "ignoring non-finite time step " + std::to_string(dt) + " x " +
                                              std::to_string(play_speed_));
        return;
    }

    // hit/left queries compare against the frame shown before this tick.
    prev_frame_index_ = frame_index_;
    frame_counter_ += delta;
    skip_whole_cycles();

    // Consecutive steps that consumed no time; one full pass over the tag is
    // the most a sheet of zero-length frames may advance per update.
    int idle_steps = 0;

    while (current_tag_ && frame_in_range(frame_index_)) {
        const double duration = frame_duration(frame_index_);
        if (frame_counter_ < duration) {
            break;
        }
        if (duration <= 0.0) {
            if (++idle_steps > current_tag_->span()) {
                break;
            }
        } else {
            idle_steps = 0;
        }

        frame_counter_ -= duration;
        prev_frame_index_ = frame_index_;
        frame_index_ += play_direction_;
        const bool completed_loop = wrap_into_tag(*current_tag_);

        if (frame_index_ != prev_frame_index_ && on_frame_change_) {
            on_frame_change_();
        }
        notify_tag_transitions();
        if (completed_loop) {
            if (loop_count_ < std::numeric_limits<std::uint64_t>::max()) {
                ++loop_count_;
            }
            if (on_loop_) {
                on_loop_();
            }
        }
    }
}

double SheetPlayer::frame_duration(int index) const {
    return std::max(static_cast<double>(sheet_->frames[index].duration), 0.0);
}

double SheetPlayer::cycle_duration(const Tag& tag) const {
    if (tag.span() <= 0 || tag.start < 0 || tag.end >= sheet_->frame_count()) {
        return 0.0;
    }
    double total = 0.0;
    for (int i = tag.start; i <= tag.end; ++i) {
        total += frame_duration(i);
    }
    if (tag.direction != PlayDirection::PingPong) {
        return total;
    }
    if (tag.span() == 1) {
        return 2.0 * total;
    }
    // Out and back visits every frame twice except the two turning frames.
    return 2.0 * total - frame_duration(tag.start) - frame_duration(tag.end);
}

void SheetPlayer::skip_whole_cycles() {
    const double cycle = cycle_duration(*current_tag_);
    if (!(cycle > 0.0) || frame_counter_ < 2.0 * cycle) {
        return;
    }

    // A whole cycle returns the cursor to the same frame and direction, so
    // all but the last are dropped and the last is stepped for notifications.
    const double skipped = std::floor(frame_counter_ / cycle) - 1.0;
    frame_counter_ = std::fmod(frame_counter_, cycle) + cycle;
    constexpr double max_count = static_cast<double>(std::numeric_limits<std::uint64_t>::max());
    loop_count_ = skipped >= max_count ? std::numeric_limits<std::uint64_t>::max()
                                       : static_cast<std::uint64_t>(skipped);
    aseplay::log::debug("SheetPlayer", "skipped " + std::to_string(loop_count_) + " whole cycles of '" +
                                           current_tag_->name + "'");
    if (on_loop_) {
        on_loop_();
    }
}

bool SheetPlayer::wrap_into_tag(const Tag& tag) {
    const int span = tag.span();
    if (span <= 0) {
        frame_index_ = tag.start;
        return false;
    }

    if (tag.direction == PlayDirection::PingPong) {
        if (frame_index_ > tag.end) {
            frame_index_ = std::clamp(tag.end - 1, tag.start, tag.end);
            play_direction_ = -1;
            return false;
        }
        if (frame_index_ < tag.start) {
            frame_index_ = std::clamp(tag.start + 1, tag.start, tag.end);
            play_direction_ = 1;
            return true;
        }
        return false;
    }

    if (frame_index_ > tag.end) {
        frame_index_ = tag.start + (frame_index_ - tag.start) % span;
        return true;
    }
    if (frame_index_ < tag.start) {
        frame_index_ = tag.end - (tag.start - frame_index_ - 1) % span;
        return true;
    }
    return false;
}

void SheetPlayer::notify_tag_transitions() {
    if (on_tag_exit_) {
        for (const Tag* tag : tag_queries::left(*sheet_, frame_index_, prev_frame_index_)) {
            on_tag_exit_(*tag);
        }
    }
    if (on_tag_enter_) {
        for (const Tag* tag : tag_queries::hit(*sheet_, frame_index_, prev_frame_index_)) {
            on_tag_enter_(*tag);
        }
    }
}

void SheetPlayer::set_frame(int index_within_tag) {
    if (!current_tag_) {
        return;
    }
    frame_index_ = std::clamp(current_tag_->start + index_within_tag, current_tag_->start, current_tag_->end);
    frame_counter_ = 0.0;
}

bool SheetPlayer::is_playing(std::string_view tag_name) const {
    return current_tag_ && current_tag_->name == tag_name;
}

bool SheetPlayer::frame_in_range(int index) const {
    return index >= 0 && index < sheet_->frame_count();
}

const Frame* SheetPlayer::current_frame() const {
    if (!current_tag_ || !frame_in_range(frame_index_)) {
        return nullptr;
    }
    return &sheet_->frames[frame_index_];
}

FrameCoords SheetPlayer::frame_coords() const {
    const Frame* frame = current_frame();
    if (!frame) {
        return FrameCoords{};
    }
    return FrameCoords{frame->x, frame->y, frame->x + sheet_->frame_width, frame->y + sheet_->frame_height};
}

std::optional<SDL_Rect> SheetPlayer::frame_rect() const {
    const Frame* frame = current_frame();
    if (!frame) {
        return std::nullopt;
    }
    return SDL_Rect{frame->x, frame->y, sheet_->frame_width, sheet_->frame_height};
}

SDL_FPoint SheetPlayer::frame_uv() const {
    const Frame* frame = current_frame();
    if (!frame) {
        return SDL_FPoint{-1.0f, -1.0f};
    }
    const float u = sheet_->width > 0 ? static_cast<float>(frame->x) / static_cast<float>(sheet_->width) : 0.0f;
    const float v = sheet_->height > 0 ? static_cast<float>(frame->y) / static_cast<float>(sheet_->height) : 0.0f;
    return SDL_FPoint{u, v};
}

std::optional<SDL_Rect> SheetPlayer::slice_bounds(std::string_view slice_name) const {
    if (!current_tag_) {
        return std::nullopt;
    }
    for (const Slice* slice : sheet_->find_slices(slice_name)) {
        if (const SliceKey* key = slice->key_for_frame(frame_index_)) {
            return key->bounds;
        }
    }
    return std::nullopt;
}

std::vector<const Tag*> SheetPlayer::touching_tags() const {
    if (!current_tag_) {
        return {};
    }
    return tag_queries::touching(*sheet_, frame_index_);
}

bool SheetPlayer::touching_tag(std::string_view tag_name) const {
    return current_tag_ && tag_queries::touching(*sheet_, tag_name, frame_index_);
}

std::vector<const Tag*> SheetPlayer::hit_tags() const {
    if (!current_tag_) {
        return {};
    }
    return tag_queries::hit(*sheet_, frame_index_, prev_frame_index_);
}

bool SheetPlayer::hit_tag(std::string_view tag_name) const {
    return current_tag_ && tag_queries::hit(*sheet_, tag_name, frame_index_, prev_frame_index_);
}

std::vector<const Tag*> SheetPlayer::left_tags() const {
    if (!current_tag_) {
        return {};
    }
    return tag_queries::left(*sheet_, frame_index_, prev_frame_index_);
}

bool SheetPlayer::left_tag(std::string_view tag_name) const {
    return current_tag_ && tag_queries::left(*sheet_, tag_name, frame_index_, prev_frame_index_);
}

}
