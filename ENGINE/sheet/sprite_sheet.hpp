#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <SDL.h>

namespace aseplay {

enum class PlayDirection {
    Forward,
    Reverse,
    PingPong,
};

PlayDirection classify_direction(std::string_view value);
const char* direction_name(PlayDirection direction);

struct Frame {
    int x = 0;
    int y = 0;
    float duration = 0.0f; // seconds
};

struct Tag {
    std::string name;
    int start = 0;
    int end = 0;
    PlayDirection direction = PlayDirection::Forward;

    int span() const { return end - start + 1; }
    bool contains(int frame) const { return frame >= start && frame <= end; }
};

struct Layer {
    std::string name;
    int opacity = 255;
    std::string blend_mode = "normal";
};

struct SliceKey {
    int frame = 0;
    SDL_Rect bounds{0, 0, 0, 0};
    std::optional<SDL_Rect> center;
    std::optional<SDL_Point> pivot;
};

struct Slice {
    std::string name;
    std::string data;
    std::uint64_t color = 0;
    std::vector<SliceKey> keys;

    // Key in effect at the given frame: the last key starting at or before it.
    const SliceKey* key_for_frame(int frame) const;
};

/*
 * Decoded sprite sheet. Built once by SheetDecoder and treated as read-only
 * afterwards; players keep plain pointers into |tags| and |frames|, so the
 * sheet must outlive every player bound to it.
 */
class SpriteSheet {
public:
    std::string image_path;
    int width = 0;
    int height = 0;
    int frame_width = 0;
    int frame_height = 0;
    std::vector<Frame> frames;
    std::vector<Layer> layers;
    std::vector<Slice> slices;

    const std::vector<Tag>& tags() const { return tags_; }
    const Tag* find_tag(std::string_view name) const;
    bool has_tag(std::string_view name) const { return find_tag(name) != nullptr; }

    // Inserts the tag, or overwrites the existing tag of the same name in place.
    void set_tag(Tag tag);

    std::vector<const Slice*> find_slices(std::string_view name) const;
    int frame_count() const { return static_cast<int>(frames.size()); }

private:
    std::vector<Tag> tags_;
    std::unordered_map<std::string, std::size_t> tag_lookup_;
};

}
