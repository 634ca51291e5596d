#include "sheet_file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "sheet_decoder.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

namespace aseplay::sheet_file {

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open sprite sheet file at '" << path << "' for reading.";
        throw std::runtime_error(oss.str());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        std::ostringstream oss;
        oss << "Failed while reading sprite sheet file at '" << path << "'.";
        throw std::runtime_error(oss.str());
    }
    return contents.str();
}

std::string resolve_image_path(const std::string& json_path, const std::string& image_path) {
    if (image_path.empty()) {
        return image_path;
    }
    const fs::path image(image_path);
    if (image.is_absolute()) {
        return image.lexically_normal().generic_string();
    }
    const fs::path base = fs::path(json_path).parent_path();
    return (base / image).lexically_normal().generic_string();
}

SpriteSheet load(const std::string& json_path) {
    std::error_code ec;
    if (!fs::exists(json_path, ec) || ec) {
        throw std::runtime_error("Sprite sheet file does not exist: " + json_path);
    }

    const std::string text = read_text(json_path);
    SpriteSheet sheet = SheetDecoder::decode(std::string_view(text));
    sheet.image_path = resolve_image_path(json_path, sheet.image_path);
    aseplay::log::info("SheetFile", "Loaded '" + json_path + "' (" + std::to_string(sheet.frame_count()) +
                       " frames, image '" + sheet.image_path + "')");
    return sheet;
}

}
