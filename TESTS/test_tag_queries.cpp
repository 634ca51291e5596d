#include "doctest/doctest.h"

#include <string_view>
#include <vector>

#include "animation_update/tag_queries.hpp"
#include "support/sheet_fixtures.hpp"

namespace tq = aseplay::tag_queries;

TEST_CASE("touching lists every tag holding the frame in sheet order") {
    const auto sheet = test_fixtures::make_sheet({100, 100, 100, 100, 100},
                                                 {{"walk", 0, 2}, {"step", 2, 2}, {"turn", 3, 4}});

    CHECK(tq::names(tq::touching(sheet, 2)) == std::vector<std::string_view>{"", "walk", "step"});
    CHECK(tq::names(tq::touching(sheet, 4)) == std::vector<std::string_view>{"", "turn"});
    CHECK(tq::touching(sheet, 9).empty());
    CHECK(tq::touching(sheet, "step", 2));
    CHECK_FALSE(tq::touching(sheet, "step", 1));
    CHECK_FALSE(tq::touching(sheet, "nope", 1));
}

TEST_CASE("hit and left compare the two frames") {
    const auto sheet = test_fixtures::make_sheet({100, 100, 100, 100, 100},
                                                 {{"walk", 0, 2}, {"turn", 3, 4}});

    CHECK(tq::names(tq::hit(sheet, 3, 2)) == std::vector<std::string_view>{"turn"});
    CHECK(tq::names(tq::left(sheet, 3, 2)) == std::vector<std::string_view>{"walk"});
    CHECK(tq::hit(sheet, 4, 3).empty());
    CHECK(tq::left(sheet, 4, 3).empty());

    CHECK(tq::hit(sheet, "turn", 3, 2));
    CHECK_FALSE(tq::hit(sheet, "turn", 4, 3));
    CHECK(tq::left(sheet, "walk", 3, 2));
    CHECK_FALSE(tq::left(sheet, "walk", 2, 1));
}

TEST_CASE("a missing previous frame enters every touching tag") {
    const auto sheet = test_fixtures::make_sheet({100, 100, 100}, {{"walk", 0, 1}});

    CHECK(tq::names(tq::hit(sheet, 0, -1)) == std::vector<std::string_view>{"", "walk"});
    CHECK(tq::left(sheet, 0, -1).empty());
}

TEST_CASE("queries reflect the frames they are given, not earlier calls") {
    const auto sheet = test_fixtures::make_sheet({100, 100, 100}, {{"end", 2, 2}});

    CHECK(tq::hit(sheet, "end", 2, 1));
    CHECK_FALSE(tq::hit(sheet, "end", 1, 0));
    CHECK(tq::hit(sheet, "end", 2, 1));
}
