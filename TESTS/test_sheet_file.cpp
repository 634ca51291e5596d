#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "sheet/sheet_decoder.hpp"
#include "sheet/sheet_file.hpp"
#include "support/sheet_fixtures.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

TEST_CASE("sheet file loader rebases the image path onto the json directory") {
    aseplay::log::set_level(aseplay::log::Level::Warn);

    const fs::path root = test_root() / "sheet_file";
    std::error_code ec;
    fs::create_directories(root, ec);
    const fs::path json_path = root / "hero.json";

    nlohmann::json doc = test_fixtures::make_sheet_json({100, 100}, {{"walk", 0, 1}});
    doc["meta"]["image"] = "sprites\\hero.png";
    {
        std::ofstream out(json_path);
        REQUIRE(out.is_open());
        out << doc.dump(2);
    }

    const aseplay::SpriteSheet sheet = aseplay::sheet_file::load(json_path.string());
    CHECK(sheet.frame_count() == 2);
    CHECK(sheet.has_tag("walk"));
    CHECK(fs::path(sheet.image_path) == (root / "sprites" / "hero.png").lexically_normal());

    fs::remove(json_path, ec);
    aseplay::log::set_level(aseplay::log::Level::Info);
}

TEST_CASE("image paths resolve relative to the document") {
    CHECK(aseplay::sheet_file::resolve_image_path("assets/hero.json", "hero.png") == "assets/hero.png");
    CHECK(aseplay::sheet_file::resolve_image_path("assets/hero.json", "../art/hero.png") == "art/hero.png");
    CHECK(aseplay::sheet_file::resolve_image_path("hero.json", "hero.png") == "hero.png");
    CHECK(aseplay::sheet_file::resolve_image_path("assets/hero.json", "").empty());
}

TEST_CASE("sheet file loader reports unreadable and malformed files") {
    aseplay::log::set_level(aseplay::log::Level::Error);

    const fs::path root = test_root() / "sheet_file_errors";
    std::error_code ec;
    fs::create_directories(root, ec);

    CHECK_THROWS_AS(aseplay::sheet_file::load((root / "absent.json").string()), std::runtime_error);

    const fs::path broken = root / "broken.json";
    {
        std::ofstream out(broken);
        REQUIRE(out.is_open());
        out << "{\"frames\": {}}";
    }
    CHECK_THROWS_AS(aseplay::sheet_file::load(broken.string()), aseplay::MalformedDocument);

    fs::remove(broken, ec);
    aseplay::log::set_level(aseplay::log::Level::Info);
}
