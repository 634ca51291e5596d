#pragma once

#include <string>

#include "sprite_sheet.hpp"

namespace aseplay::sheet_file {

// Whole file as text. Throws std::runtime_error when the file cannot be read.
std::string read_text(const std::string& path);

/*
 * Reads and decodes the JSON at |json_path|. The sheet's image_path is
 * rebased onto the JSON file's directory so it can be handed straight to an
 * image loader. Throws MalformedDocument or std::runtime_error.
 */
SpriteSheet load(const std::string& json_path);

std::string resolve_image_path(const std::string& json_path, const std::string& image_path);

}
