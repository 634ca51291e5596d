#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "sprite_sheet.hpp"

namespace aseplay {

class MalformedDocument : public std::runtime_error {
public:
    explicit MalformedDocument(const std::string& message)
        : std::runtime_error(message) {}
};

/*
 * Turns the JSON that Aseprite writes next to an exported sprite sheet into a
 * SpriteSheet. Both the "Hash" (frames keyed by file name) and "Array" export
 * layouts are accepted. Decoding never touches the file system.
 */
class SheetDecoder {
public:
    static SpriteSheet decode(std::string_view text);
    static SpriteSheet decode(const nlohmann::json& root);

    static std::optional<SpriteSheet> try_decode(std::string_view text, std::string* error = nullptr);

    // Integer embedded in a frame key, e.g. "walk 12.aseprite" -> 12.
    static std::optional<long long> frame_ordinal(std::string_view key);
};

}
