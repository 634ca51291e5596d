#include "tag_queries.hpp"

namespace aseplay::tag_queries {

namespace {

bool entered(const Tag& tag, int frame, int prev_frame) {
    return tag.contains(frame) && !tag.contains(prev_frame);
}

template <typename Pred>
std::vector<const Tag*> collect(const SpriteSheet& sheet, Pred&& pred) {
    std::vector<const Tag*> out;
    for (const Tag& tag : sheet.tags()) {
        if (pred(tag)) {
            out.push_back(&tag);
        }
    }
    return out;
}

}

std::vector<const Tag*> touching(const SpriteSheet& sheet, int frame) {
    return collect(sheet, [frame](const Tag& tag) { return tag.contains(frame); });
}

bool touching(const SpriteSheet& sheet, std::string_view name, int frame) {
    const Tag* tag = sheet.find_tag(name);
    return tag && tag->contains(frame);
}

std::vector<const Tag*> hit(const SpriteSheet& sheet, int frame, int prev_frame) {
    return collect(sheet, [&](const Tag& tag) { return entered(tag, frame, prev_frame); });
}

bool hit(const SpriteSheet& sheet, std::string_view name, int frame, int prev_frame) {
    const Tag* tag = sheet.find_tag(name);
    return tag && entered(*tag, frame, prev_frame);
}

std::vector<const Tag*> left(const SpriteSheet& sheet, int frame, int prev_frame) {
    return collect(sheet, [&](const Tag& tag) { return entered(tag, prev_frame, frame); });
}

bool left(const SpriteSheet& sheet, std::string_view name, int frame, int prev_frame) {
    const Tag* tag = sheet.find_tag(name);
    return tag && entered(*tag, prev_frame, frame);
}

std::vector<std::string_view> names(const std::vector<const Tag*>& tags) {
    std::vector<std::string_view> out;
    out.reserve(tags.size());
    for (const Tag* tag : tags) {
        out.emplace_back(tag->name);
    }
    return out;
}

}
