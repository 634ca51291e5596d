#pragma once

#include <string_view>
#include <vector>

#include "sheet/sprite_sheet.hpp"

namespace aseplay::tag_queries {

// Tags whose [start, end] holds |frame|, in sheet tag order.
std::vector<const Tag*> touching(const SpriteSheet& sheet, int frame);
bool touching(const SpriteSheet& sheet, std::string_view name, int frame);

// Touching |frame| but not |prev_frame|. A prev_frame of -1 touches nothing.
std::vector<const Tag*> hit(const SpriteSheet& sheet, int frame, int prev_frame);
bool hit(const SpriteSheet& sheet, std::string_view name, int frame, int prev_frame);

// Touching |prev_frame| but not |frame|.
std::vector<const Tag*> left(const SpriteSheet& sheet, int frame, int prev_frame);
bool left(const SpriteSheet& sheet, std::string_view name, int frame, int prev_frame);

std::vector<std::string_view> names(const std::vector<const Tag*>& tags);

}
