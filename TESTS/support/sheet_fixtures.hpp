#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sheet/sheet_decoder.hpp"

namespace test_fixtures {

struct TagSpec {
    std::string name;
    int from = 0;
    int to = 0;
    std::string direction = "forward";
};

// Hash-style export with 16x16 cells laid out in one row.
inline nlohmann::json make_sheet_json(const std::vector<int>& durations_ms, const std::vector<TagSpec>& tags = {}) {
    nlohmann::json root = nlohmann::json::object();
    nlohmann::json frames = nlohmann::json::object();
    for (std::size_t i = 0; i < durations_ms.size(); ++i) {
        frames["hero " + std::to_string(i) + ".aseprite"] = {
            {"frame", {{"x", static_cast<int>(i) * 16}, {"y", 0}, {"w", 16}, {"h", 16}}},
            {"rotated", false},
            {"trimmed", false},
            {"spriteSourceSize", {{"x", 0}, {"y", 0}, {"w", 16}, {"h", 16}}},
            {"sourceSize", {{"w", 16}, {"h", 16}}},
            {"duration", durations_ms[i]},
        };
    }
    root["frames"] = frames;

    nlohmann::json tag_list = nlohmann::json::array();
    for (const TagSpec& tag : tags) {
        tag_list.push_back({{"name", tag.name}, {"from", tag.from}, {"to", tag.to}, {"direction", tag.direction}});
    }
    root["meta"] = {
        {"app", "https://www.aseprite.org/"},
        {"image", "hero.png"},
        {"format", "RGBA8888"},
        {"size", {{"w", static_cast<int>(durations_ms.size()) * 16}, {"h", 16}}},
        {"scale", "1"},
        {"frameTags", tag_list},
        {"layers", nlohmann::json::array()},
        {"slices", nlohmann::json::array()},
    };
    return root;
}

inline aseplay::SpriteSheet make_sheet(const std::vector<int>& durations_ms, const std::vector<TagSpec>& tags = {}) {
    return aseplay::SheetDecoder::decode(make_sheet_json(durations_ms, tags));
}

}
