// =============================================================================
// Unit tests for MouseEffects
// Click and drag extraction in Output time.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "autoframe/logic/MouseEffects.h"

using namespace AutoFrame;
using Catch::Approx;

TEST_CASE("Clicks are mapped to Output time", "[MouseEffects]")
{
    TimeMapper tm(0, {{"a", 0, 1000}, {"b", 2000, 3000}});
    std::vector<UserEvent> events = {
        ClickEvent{500, {10, 20}, "BUTTON"},
        ClickEvent{1500, {30, 40}, {}},   // cut out
        ClickEvent{2500, {50, 60}, {}},
    };

    auto set = MouseEffects::extract(events, tm);
    REQUIRE(set.clicks.size() == 2);
    REQUIRE(set.clicks[0].timestampMs == 500);
    REQUIRE(set.clicks[0].position.x == Approx(10));
    REQUIRE(set.clicks[1].timestampMs == 1500);
    REQUIRE(set.clicks[1].position.y == Approx(60));
    REQUIRE(set.drags.empty());
}

TEST_CASE("Timeline offset shifts every effect", "[MouseEffects]")
{
    TimeMapper tm(1000, {{"w", 1000, 5000}});
    auto set = MouseEffects::extract({ClickEvent{200, {0, 0}, {}}}, tm);

    REQUIRE(set.clicks.size() == 1);
    REQUIRE(set.clicks[0].timestampMs == 200);
}

TEST_CASE("Mousedown, moves, mouseup form one drag", "[MouseEffects]")
{
    TimeMapper tm(0, {{"w", 0, 10000}});
    std::vector<UserEvent> events = {
        MouseEvent{50, {0, 0}},           // before the drag, not part of it
        MouseDownEvent{100, {10, 10}},
        MouseEvent{150, {20, 15}},
        MouseEvent{200, {30, 20}},
        MouseUpEvent{250, {40, 25}},
        MouseEvent{300, {99, 99}},
    };

    auto set = MouseEffects::extract(events, tm);
    REQUIRE(set.drags.size() == 1);

    const auto& d = set.drags[0];
    REQUIRE(d.startMs == 100);
    REQUIRE(d.endMs == 250);
    REQUIRE(d.start.x == Approx(10));
    REQUIRE(d.end.x == Approx(40));
    REQUIRE(d.end.y == Approx(25));
    REQUIRE(d.path.size() == 4);
    REQUIRE(d.path[1].timestampMs == 150);
}

TEST_CASE("Second mousedown during a drag is ignored", "[MouseEffects]")
{
    TimeMapper tm(0, {{"w", 0, 10000}});
    std::vector<UserEvent> events = {
        MouseDownEvent{100, {0, 0}},
        MouseDownEvent{150, {500, 500}},
        MouseUpEvent{200, {5, 5}},
    };

    auto set = MouseEffects::extract(events, tm);
    REQUIRE(set.drags.size() == 1);
    REQUIRE(set.drags[0].start.x == Approx(0));
    REQUIRE(set.drags[0].path.size() == 2);
}

TEST_CASE("Unterminated drag closes at its last sample", "[MouseEffects]")
{
    TimeMapper tm(0, {{"w", 0, 10000}});
    std::vector<UserEvent> events = {
        MouseDownEvent{100, {0, 0}},
        MouseEvent{180, {8, 6}},
    };

    auto set = MouseEffects::extract(events, tm);
    REQUIRE(set.drags.size() == 1);
    REQUIRE(set.drags[0].endMs == 180);
    REQUIRE(set.drags[0].end.x == Approx(8));
}

TEST_CASE("Mouseup without mousedown is ignored", "[MouseEffects]")
{
    TimeMapper tm(0, {{"w", 0, 10000}});
    auto set = MouseEffects::extract({MouseUpEvent{100, {1, 1}}}, tm);
    REQUIRE(set.drags.empty());
}

TEST_CASE("Events are ordered by timestamp before pairing", "[MouseEffects]")
{
    TimeMapper tm(0, {{"w", 0, 10000}});
    std::vector<UserEvent> events = {
        MouseUpEvent{300, {30, 30}},
        MouseEvent{200, {20, 20}},
        MouseDownEvent{100, {10, 10}},
    };

    auto set = MouseEffects::extract(events, tm);
    REQUIRE(set.drags.size() == 1);
    REQUIRE(set.drags[0].startMs == 100);
    REQUIRE(set.drags[0].endMs == 300);
    REQUIRE(set.drags[0].path.size() == 3);
}
