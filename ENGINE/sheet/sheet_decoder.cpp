#include "sheet_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace aseplay {

namespace {

std::optional<long long> parse_integer(std::string_view digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

bool fits_int(double number) {
    if (!std::isfinite(number)) {
        return false;
    }
    const double whole = std::trunc(number);
    return whole >= static_cast<double>(std::numeric_limits<int>::min()) &&
           whole <= static_cast<double>(std::numeric_limits<int>::max());
}

int json_int(const nlohmann::json& value, int fallback) {
    if (!value.is_number()) {
        return fallback;
    }
    const double number = value.get<double>();
    return fits_int(number) ? static_cast<int>(number) : fallback;
}

const nlohmann::json& child(const nlohmann::json& node, const char* key) {
    static const nlohmann::json null_value;
    if (!node.is_object()) {
        return null_value;
    }
    auto it = node.find(key);
    return it == node.end() ? null_value : *it;
}

std::string json_string(const nlohmann::json& node, const char* key, std::string fallback = {}) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

double require_number(const nlohmann::json& node, const char* key, const std::string& context) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number()) {
        throw MalformedDocument(context + ": '" + key + "' is missing or not a number");
    }
    return it->get<double>();
}

int require_int(const nlohmann::json& node, const char* key, const std::string& context) {
    const double number = require_number(node, key, context);
    if (!fits_int(number)) {
        throw MalformedDocument(context + ": '" + key + "' is out of range");
    }
    return static_cast<int>(number);
}

SDL_Rect read_rect(const nlohmann::json& node) {
    SDL_Rect rect{0, 0, 0, 0};
    if (!node.is_object()) {
        return rect;
    }
    rect.x = json_int(child(node, "x"), 0);
    rect.y = json_int(child(node, "y"), 0);
    rect.w = json_int(child(node, "w"), 0);
    rect.h = json_int(child(node, "h"), 0);
    return rect;
}

const nlohmann::json& require_object(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_object()) {
        throw MalformedDocument(std::string("document has no '") + key + "' object");
    }
    return *it;
}

void read_frame(const nlohmann::json& entry, const std::string& name, SpriteSheet& sheet) {
    const std::string context = "frame '" + name + "'";
    if (!entry.is_object()) {
        throw MalformedDocument(context + " is not an object");
    }
    auto rect_it = entry.find("frame");
    if (rect_it == entry.end() || !rect_it->is_object()) {
        throw MalformedDocument(context + " has no 'frame' rectangle");
    }

    Frame frame;
    frame.x = require_int(*rect_it, "x", context);
    frame.y = require_int(*rect_it, "y", context);
    const double seconds = require_number(entry, "duration", context) / 1000.0;
    if (!std::isfinite(seconds) || std::fabs(seconds) > static_cast<double>(std::numeric_limits<float>::max())) {
        throw MalformedDocument(context + ": 'duration' is out of range");
    }
    frame.duration = static_cast<float>(seconds);
    sheet.frames.push_back(frame);

    if (sheet.frames.size() == 1) {
        SDL_Rect source = read_rect(child(entry, "sourceSize"));
        if (source.w <= 0 || source.h <= 0) {
            source = read_rect(*rect_it);
        }
        sheet.frame_width = source.w;
        sheet.frame_height = source.h;
    }
}

void read_frames(const nlohmann::json& frames, SpriteSheet& sheet) {
    if (frames.is_array()) {
        for (std::size_t i = 0; i < frames.size(); ++i) {
            const nlohmann::json& entry = frames[i];
            std::string name = entry.is_object() ? json_string(entry, "filename") : std::string{};
            read_frame(entry, name.empty() ? std::to_string(i) : name, sheet);
        }
        return;
    }

    // Object iteration is lexical; the stable sort keeps that order for ties.
    std::vector<std::pair<long long, std::string>> keys;
    keys.reserve(frames.size());
    for (auto it = frames.begin(); it != frames.end(); ++it) {
        keys.emplace_back(SheetDecoder::frame_ordinal(it.key()).value_or(0), it.key());
    }
    std::stable_sort(keys.begin(), keys.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });
    for (const auto& [ordinal, key] : keys) {
        read_frame(frames.at(key), key, sheet);
    }
}

void read_layers(const nlohmann::json& meta, SpriteSheet& sheet) {
    auto it = meta.find("layers");
    if (it == meta.end() || !it->is_array()) {
        return;
    }
    for (const auto& node : *it) {
        if (!node.is_object()) {
            aseplay::log::debug("SheetDecoder", "skipping non-object layer entry");
            continue;
        }
        Layer layer;
        layer.name = json_string(node, "name");
        layer.opacity = std::clamp(json_int(child(node, "opacity"), 255), 0, 255);
        layer.blend_mode = json_string(node, "blendMode", "normal");
        sheet.layers.push_back(std::move(layer));
    }
}

void read_tags(const nlohmann::json& meta, SpriteSheet& sheet) {
    auto it = meta.find("frameTags");
    if (it == meta.end() || !it->is_array()) {
        return;
    }
    for (const auto& node : *it) {
        if (!node.is_object()) {
            throw MalformedDocument("frame tag entry is not an object");
        }
        Tag tag;
        tag.name = json_string(node, "name");
        const std::string context = "frame tag '" + tag.name + "'";
        tag.start = require_int(node, "from", context);
        tag.end = require_int(node, "to", context);
        tag.direction = classify_direction(json_string(node, "direction", "forward"));
        if (sheet.has_tag(tag.name)) {
            aseplay::log::debug("SheetDecoder", "tag '" + tag.name + "' declared more than once; keeping the last");
        }
        sheet.set_tag(std::move(tag));
    }
}

std::uint64_t read_slice_color(const nlohmann::json& node) {
    auto it = node.find("color");
    if (it == node.end() || !it->is_string()) {
        return 0;
    }
    if (auto parsed = strings::parse_hex(it->get<std::string>())) {
        return *parsed;
    }
    aseplay::log::debug("SheetDecoder", "unreadable slice color '" + it->get<std::string>() + "'");
    return 0;
}

void read_slices(const nlohmann::json& meta, SpriteSheet& sheet) {
    auto it = meta.find("slices");
    if (it == meta.end() || !it->is_array()) {
        return;
    }
    for (const auto& node : *it) {
        if (!node.is_object()) {
            continue;
        }
        Slice slice;
        slice.name = json_string(node, "name");
        slice.data = json_string(node, "data");
        slice.color = read_slice_color(node);

        auto keys_it = node.find("keys");
        if (keys_it != node.end() && keys_it->is_array()) {
            for (const auto& key_node : *keys_it) {
                if (!key_node.is_object()) {
                    continue;
                }
                SliceKey key;
                key.frame = json_int(child(key_node, "frame"), 0);
                key.bounds = read_rect(child(key_node, "bounds"));
                if (key_node.contains("center")) {
                    key.center = read_rect(key_node["center"]);
                }
                if (key_node.contains("pivot") && key_node["pivot"].is_object()) {
                    const auto& pivot = key_node["pivot"];
                    key.pivot = SDL_Point{json_int(child(pivot, "x"), 0),
                                          json_int(child(pivot, "y"), 0)};
                }
                slice.keys.push_back(key);
            }
        }
        sheet.slices.push_back(std::move(slice));
    }
}

}

std::optional<long long> SheetDecoder::frame_ordinal(std::string_view key) {
    const std::size_t space = key.rfind(' ');
    const std::size_t first = (space == std::string_view::npos) ? 0 : space + 1;
    std::size_t last = key.rfind('.');
    if (last == std::string_view::npos || last < first) {
        last = key.size();
    }
    if (auto value = parse_integer(key.substr(first, last - first))) {
        return value;
    }

    std::size_t end = key.size();
    while (end > 0 && !std::isdigit(static_cast<unsigned char>(key[end - 1]))) {
        --end;
    }
    std::size_t begin = end;
    while (begin > 0 && std::isdigit(static_cast<unsigned char>(key[begin - 1]))) {
        --begin;
    }
    return parse_integer(key.substr(begin, end - begin));
}

SpriteSheet SheetDecoder::decode(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw MalformedDocument("document root is not an object");
    }
    auto frames_it = root.find("frames");
    if (frames_it == root.end() || !(frames_it->is_object() || frames_it->is_array())) {
        throw MalformedDocument("document has no 'frames' table");
    }
    const nlohmann::json& meta = require_object(root, "meta");
    auto image_it = meta.find("image");
    if (image_it == meta.end() || !image_it->is_string()) {
        throw MalformedDocument("document has no 'meta.image' reference");
    }

    SpriteSheet sheet;
    sheet.image_path = strings::normalize_separators(image_it->get<std::string>());
    const SDL_Rect size = read_rect(child(meta, "size"));
    sheet.width = size.w;
    sheet.height = size.h;

    read_layers(meta, sheet);
    read_frames(*frames_it, sheet);

    Tag everything;
    everything.end = sheet.frame_count() - 1;
    sheet.set_tag(std::move(everything));

    read_tags(meta, sheet);
    read_slices(meta, sheet);

    aseplay::log::debug("SheetDecoder", "decoded '" + sheet.image_path + "': " +
                        std::to_string(sheet.frames.size()) + " frames, " +
                        std::to_string(sheet.tags().size()) + " tags, " +
                        std::to_string(sheet.slices.size()) + " slices");
    return sheet;
}

SpriteSheet SheetDecoder::decode(std::string_view text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedDocument(std::string("document is not valid JSON: ") + e.what());
    }
    return decode(root);
}

std::optional<SpriteSheet> SheetDecoder::try_decode(std::string_view text, std::string* error) {
    try {
        return decode(text);
    } catch (const MalformedDocument& e) {
        aseplay::log::warn("SheetDecoder", e.what());
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

}
