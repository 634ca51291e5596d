#include "sprite_sheet.hpp"

#include <utility>

#include "utils/string_utils.hpp"

namespace aseplay {

PlayDirection classify_direction(std::string_view value) {
    const std::string lowered = strings::to_lower_copy(strings::trim_copy(value));
    if (lowered == "reverse" || lowered == "backward") {
        return PlayDirection::Reverse;
    }
    if (lowered == "pingpong" || lowered == "pingpong_reverse" || lowered == "ping-pong") {
        return PlayDirection::PingPong;
    }
    return PlayDirection::Forward;
}

const char* direction_name(PlayDirection direction) {
    switch (direction) {
        case PlayDirection::Forward:  return "forward";
        case PlayDirection::Reverse:  return "reverse";
        case PlayDirection::PingPong: return "pingpong";
    }
    return "forward";
}

const SliceKey* Slice::key_for_frame(int frame) const {
    const SliceKey* active = nullptr;
    for (const SliceKey& key : keys) {
        if (key.frame > frame) {
            continue;
        }
        if (!active || key.frame >= active->frame) {
            active = &key;
        }
    }
    return active;
}

const Tag* SpriteSheet::find_tag(std::string_view name) const {
    auto it = tag_lookup_.find(std::string(name));
    if (it == tag_lookup_.end()) {
        return nullptr;
    }
    return &tags_[it->second];
}

void SpriteSheet::set_tag(Tag tag) {
    auto it = tag_lookup_.find(tag.name);
    if (it != tag_lookup_.end()) {
        tags_[it->second] = std::move(tag);
        return;
    }
    tag_lookup_.emplace(tag.name, tags_.size());
    tags_.push_back(std::move(tag));
}

std::vector<const Slice*> SpriteSheet::find_slices(std::string_view name) const {
    std::vector<const Slice*> out;
    for (const Slice& slice : slices) {
        if (slice.name == name) {
            out.push_back(&slice);
        }
    }
    return out;
}

}
