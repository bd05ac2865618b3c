// =============================================================================
// Unit tests for SessionLoader
// Session JSON parsing, rejection of unusable input, window synthesis.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "autoframe/support/SessionLoader.h"

#include <fstream>
#include <string>

using namespace AutoFrame;
using Catch::Approx;

static const char* kSession = R"({
    "inputSize": {"width": 2560, "height": 1440},
    "outputSize": {"width": 1920, "height": 1080},
    "timelineOffsetMs": 250,
    "outputWindows": [
        {"id": "a", "startMs": 0, "endMs": 4000},
        {"id": "b", "startMs": 6000, "endMs": 9000}
    ],
    "events": [
        {"type": "click", "timestamp": 1000, "x": 100, "y": 200, "tagName": "A"},
        {"type": "mouse", "timestamp": 1100, "x": 110, "y": 210},
        {"type": "url", "timestamp": 1200, "url": "https://example.com/"},
        {"type": "keydown", "timestamp": 1300, "key": "s", "code": "KeyS", "ctrlKey": true},
        {"type": "scroll", "timestamp": 1400, "x": 5, "y": 6,
         "targetRect": {"x": 0, "y": 0, "width": 800, "height": 2000}},
        {"type": "typing", "timestamp": 1500, "endTime": 2500, "x": 7, "y": 8,
         "targetRect": {"x": 10, "y": 20, "width": 300, "height": 40}}
    ]
})";

TEST_CASE("Full session is parsed", "[SessionLoader]")
{
    SessionData s;
    REQUIRE(SessionLoader::loadFromString(kSession, s));

    REQUIRE(s.inputSize.width == Approx(2560));
    REQUIRE(s.outputSize.height == Approx(1080));
    REQUIRE(s.timelineOffsetMs == 250);

    REQUIRE(s.outputWindows.size() == 2);
    REQUIRE(s.outputWindows[1].id == "b");
    REQUIRE(s.outputWindows[1].startMs == 6000);

    REQUIRE(s.events.size() == 6);
    REQUIRE(eventType(s.events[0]) == EventType::Click);
    REQUIRE(std::get<ClickEvent>(s.events[0]).tagName == "A");
    REQUIRE(std::get<UrlEvent>(s.events[2]).url == "https://example.com/");

    const auto& key = std::get<KeyDownEvent>(s.events[3]);
    REQUIRE(key.code == "KeyS");
    REQUIRE(key.ctrlKey);
    REQUIRE_FALSE(key.shiftKey);

    const auto& scroll = std::get<ScrollEvent>(s.events[4]);
    REQUIRE(scroll.targetRect.height == Approx(2000));

    const auto& typing = std::get<TypingEvent>(s.events[5]);
    REQUIRE(typing.endTime == 2500);
    REQUIRE(typing.targetRect.width == Approx(300));
}

TEST_CASE("Unusable events are skipped, the rest kept", "[SessionLoader]")
{
    const char* text = R"({
        "inputSize": {"width": 100, "height": 100},
        "outputSize": {"width": 100, "height": 100},
        "outputWindows": [],
        "events": [
            {"type": "teleport", "timestamp": 10},
            {"type": "click", "x": 1, "y": 1},
            42,
            {"type": "click", "timestamp": 20, "x": 1, "y": 1}
        ]
    })";

    SessionData s;
    REQUIRE(SessionLoader::loadFromString(text, s));
    REQUIRE(s.events.size() == 1);
    REQUIRE(eventTimestamp(s.events[0]) == 20);
}

TEST_CASE("Events with out-of-range times are skipped", "[SessionLoader]")
{
    const char* text = R"({
        "inputSize": {"width": 100, "height": 100},
        "outputSize": {"width": 100, "height": 100},
        "events": [
            {"type": "click", "timestamp": 1e300, "x": 1, "y": 1},
            {"type": "click", "timestamp": -1e300, "x": 1, "y": 1},
            {"type": "hover", "timestamp": 10, "endTime": 1e300, "x": 1, "y": 1},
            {"type": "click", "timestamp": 9223372036854775807, "x": 1, "y": 1},
            {"type": "click", "timestamp": 400, "x": 1, "y": 1}
        ]
    })";

    SessionData s;
    REQUIRE(SessionLoader::loadFromString(text, s));
    REQUIRE(s.events.size() == 1);
    REQUIRE(eventTimestamp(s.events[0]) == 400);

    // Synthesized window follows only the surviving events
    REQUIRE(s.outputWindows.size() == 1);
    REQUIRE(s.outputWindows[0].endMs == 401);
}

TEST_CASE("Missing windows → one window covering all events", "[SessionLoader]")
{
    const char* text = R"({
        "inputSize": {"width": 100, "height": 100},
        "outputSize": {"width": 100, "height": 100},
        "timelineOffsetMs": 500,
        "events": [
            {"type": "click", "timestamp": 3000, "x": 1, "y": 1},
            {"type": "click", "timestamp": 1000, "x": 1, "y": 1}
        ]
    })";

    SessionData s;
    REQUIRE(SessionLoader::loadFromString(text, s));
    REQUIRE(s.outputWindows.size() == 1);
    REQUIRE(s.outputWindows[0].id == "full");
    REQUIRE(s.outputWindows[0].startMs == 500);
    REQUIRE(s.outputWindows[0].endMs == 3501);
}

TEST_CASE("Rejected sessions leave the output untouched", "[SessionLoader]")
{
    SessionData s;
    s.timelineOffsetMs = 77;

    SECTION("Corrupt JSON")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString("{nope", s));
    }
    SECTION("Missing input size")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString(R"({"outputSize": {"width": 1, "height": 1}})", s));
    }
    SECTION("Zero-area output size")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString(
            R"({"inputSize": {"width": 1, "height": 1}, "outputSize": {"width": 0, "height": 1}})", s));
    }
    SECTION("Overlapping windows")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString(R"({
            "inputSize": {"width": 1, "height": 1}, "outputSize": {"width": 1, "height": 1},
            "outputWindows": [{"startMs": 0, "endMs": 1000}, {"startMs": 500, "endMs": 2000}]
        })", s));
    }
    SECTION("Out-of-range timeline offset")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString(R"({
            "inputSize": {"width": 1, "height": 1}, "outputSize": {"width": 1, "height": 1},
            "timelineOffsetMs": 1e300
        })", s));
    }
    SECTION("Out-of-range window bound")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString(R"({
            "inputSize": {"width": 1, "height": 1}, "outputSize": {"width": 1, "height": 1},
            "outputWindows": [{"startMs": 0, "endMs": 1e20}]
        })", s));
    }
    SECTION("Window without numeric bounds")
    {
        REQUIRE_FALSE(SessionLoader::loadFromString(R"({
            "inputSize": {"width": 1, "height": 1}, "outputSize": {"width": 1, "height": 1},
            "outputWindows": [{"startMs": "zero", "endMs": 1000}]
        })", s));
    }

    REQUIRE(s.timelineOffsetMs == 77);
}

TEST_CASE("Session is read from a file", "[SessionLoader]")
{
    std::string path = "/tmp/autoframe_test_session.json";
    {
        std::ofstream f(path);
        f << kSession;
    }

    SessionData s;
    REQUIRE(SessionLoader::loadFromFile(path.c_str(), s));
    REQUIRE(s.events.size() == 6);

    REQUIRE_FALSE(SessionLoader::loadFromFile("/tmp/autoframe_nonexistent_session.json", s));
}
