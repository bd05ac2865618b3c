// =============================================================================
// Unit tests for UserEvent helpers
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "autoframe/common/UserEvent.h"

using namespace AutoFrame;

TEST_CASE("Type names round-trip through the parser", "[UserEvent]")
{
    for (EventType t : {EventType::Click, EventType::Mouse, EventType::MouseDown, EventType::MouseUp,
                        EventType::Url, EventType::KeyDown, EventType::Scroll, EventType::Typing,
                        EventType::Hover})
    {
        auto parsed = parseEventType(eventTypeName(t));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == t);
    }
    REQUIRE_FALSE(parseEventType("Click").has_value());
    REQUIRE_FALSE(parseEventType("").has_value());
}

TEST_CASE("withTimestamp keeps span length", "[UserEvent]")
{
    UserEvent typing = TypingEvent{1000, 1800, {1, 2}, {}};
    UserEvent moved = withTimestamp(typing, 300);

    REQUIRE(eventTimestamp(moved) == 300);
    REQUIRE(std::get<TypingEvent>(moved).endTime == 1100);

    UserEvent hover = HoverEvent{500, 2000, {0, 0}};
    REQUIRE(std::get<HoverEvent>(withTimestamp(hover, 0)).endTime == 1500);

    UserEvent click = ClickEvent{10, {0, 0}, "DIV"};
    UserEvent movedClick = withTimestamp(click, 20);
    REQUIRE(eventTimestamp(movedClick) == 20);
    REQUIRE(std::get<ClickEvent>(movedClick).tagName == "DIV");
}

TEST_CASE("Only pointer-bearing events report a position", "[UserEvent]")
{
    REQUIRE(eventPosition(ClickEvent{0, {3, 4}, {}})->x == 3);
    REQUIRE(eventPosition(ScrollEvent{0, {5, 6}, {}})->y == 6);
    REQUIRE_FALSE(eventPosition(UrlEvent{0, "x"}).has_value());
    REQUIRE_FALSE(eventPosition(KeyDownEvent{}).has_value());
}

TEST_CASE("Hover breakers", "[UserEvent]")
{
    REQUIRE(breaksHover(EventType::Click));
    REQUIRE(breaksHover(EventType::Scroll));
    REQUIRE(breaksHover(EventType::Typing));
    REQUIRE(breaksHover(EventType::Url));
    REQUIRE_FALSE(breaksHover(EventType::Mouse));
    REQUIRE_FALSE(breaksHover(EventType::KeyDown));
    REQUIRE_FALSE(breaksHover(EventType::Hover));
}
