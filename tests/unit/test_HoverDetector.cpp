// =============================================================================
// Unit tests for HoverDetector
// Dwell detection over cursor samples, bounded by disruptive events.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "autoframe/logic/HoverDetector.h"

#include <cstdint>
#include <vector>

using namespace AutoFrame;
using Catch::Approx;

// 1000x1000 input → 100px box
static const Size kInput{1000, 1000};

static std::vector<HoverDetector::Sample> stationary(TimeMs from, TimeMs to, TimeMs step, Point p)
{
    std::vector<HoverDetector::Sample> out;
    for (TimeMs t = from; t <= to; t += step)
        out.push_back({t, p});
    return out;
}

TEST_CASE("Box size is a tenth of the larger input dimension", "[HoverDetector]")
{
    HoverDetector d({1920, 1080});
    REQUIRE(d.boxSize() == Approx(192.0));
    REQUIRE(d.minDurationMs() == 1000);
}

TEST_CASE("Stationary cursor produces one hover spanning the dwell", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto hovers = d.detect(stationary(0, 2000, 100, {500, 500}), {});

    REQUIRE(hovers.size() == 1);
    REQUIRE(hovers[0].timestamp == 0);
    REQUIRE(hovers[0].endTime == 2000);
    REQUIRE(hovers[0].position.x == Approx(500.0));
    REQUIRE(hovers[0].position.y == Approx(500.0));
}

TEST_CASE("Dwell shorter than the minimum is not a hover", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto samples = stationary(0, 800, 100, {500, 500});
    samples.push_back({900, {900, 900}});
    samples.push_back({1900, {100, 100}});

    REQUIRE(d.detect(samples, {}).empty());
}

TEST_CASE("Exactly the minimum dwell qualifies", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto hovers = d.detect({{0, {10, 10}}, {1000, {12, 12}}}, {});

    REQUIRE(hovers.size() == 1);
    REQUIRE(hovers[0].endTime - hovers[0].timestamp == 1000);
    REQUIRE(hovers[0].position.x == Approx(11.0));
}

TEST_CASE("Jitter inside the box is tolerated; centroid is the mean", "[HoverDetector]")
{
    HoverDetector d(kInput);
    std::vector<HoverDetector::Sample> samples;
    for (int i = 0; i <= 20; ++i)
        samples.push_back({i * 100, {(i % 2) ? 560.0 : 500.0, 300.0}});

    auto hovers = d.detect(samples, {});
    REQUIRE(hovers.size() == 1);
    REQUIRE(hovers[0].position.x == Approx((11 * 500.0 + 10 * 560.0) / 21.0));
    REQUIRE(hovers[0].position.y == Approx(300.0));
}

TEST_CASE("Spread equal to the box size still fits", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto hovers = d.detect({{0, {0, 0}}, {600, {100, 100}}, {1200, {50, 50}}}, {});
    REQUIRE(hovers.size() == 1);
}

TEST_CASE("Leaving the box ends the hover at the last valid sample", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto samples = stationary(0, 1500, 100, {500, 500});
    samples.push_back({1600, {900, 900}});

    auto hovers = d.detect(samples, {});
    REQUIRE(hovers.size() == 1);
    REQUIRE(hovers[0].endTime == 1500);
}

TEST_CASE("A boundary splits a long dwell into two hovers", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto hovers = d.detect(stationary(0, 3000, 100, {500, 500}), {1500});

    REQUIRE(hovers.size() == 2);
    REQUIRE(hovers[0].timestamp == 0);
    REQUIRE(hovers[0].endTime == 1400);
    REQUIRE(hovers[1].timestamp == 1500);
    REQUIRE(hovers[1].endTime == 3000);
}

TEST_CASE("No hover when a boundary leaves too little room", "[HoverDetector]")
{
    HoverDetector d(kInput);
    REQUIRE(d.detect(stationary(0, 1500, 100, {500, 500}), {1000}).empty());
}

TEST_CASE("Boundaries are accepted in any order", "[HoverDetector]")
{
    HoverDetector d(kInput);
    auto samples = stationary(0, 6000, 100, {500, 500});

    auto sorted = d.detect(samples, {2000, 4000});
    auto shuffled = d.detect(samples, {4000, 2000});

    REQUIRE(sorted.size() == 3);
    REQUIRE(shuffled.size() == sorted.size());
    for (size_t i = 0; i < sorted.size(); ++i)
    {
        REQUIRE(shuffled[i].timestamp == sorted[i].timestamp);
        REQUIRE(shuffled[i].endTime == sorted[i].endTime);
    }
}

TEST_CASE("Hovers never straddle a boundary", "[HoverDetector]")
{
    HoverDetector d(kInput);
    std::vector<TimeMs> boundaries = {1700, 3300, 5100};
    auto hovers = d.detect(stationary(0, 8000, 50, {200, 200}), boundaries);

    REQUIRE_FALSE(hovers.empty());
    for (const auto& h : hovers)
        for (TimeMs b : boundaries)
            REQUIRE_FALSE((h.timestamp < b && b <= h.endTime));
}

TEST_CASE("Every emitted hover lasts at least the minimum duration", "[HoverDetector]")
{
    HoverDetector d(kInput);

    // Deterministic wandering cursor: long pauses mixed with jumps
    std::vector<HoverDetector::Sample> samples;
    uint32_t seed = 12345;
    Point p{500, 500};
    for (TimeMs t = 0; t < 60000; t += 40)
    {
        seed = seed * 1664525u + 1013904223u;
        if ((seed >> 24) < 8)
            p = {static_cast<double>((seed >> 8) % 1000), static_cast<double>((seed >> 4) % 1000)};
        else
            p = {p.x + static_cast<double>((seed >> 16) % 5) - 2.0, p.y};
        samples.push_back({t, p});
    }

    auto hovers = d.detect(samples, {7000, 21000, 33333});
    REQUIRE_FALSE(hovers.empty());
    for (const auto& h : hovers)
        REQUIRE(h.endTime - h.timestamp >= 1000);
}

TEST_CASE("Custom parameters are honored", "[HoverDetector]")
{
    HoverDetector d(kInput, 0.02, 500); // 20px box, 500ms
    auto samples = stationary(0, 600, 100, {500, 500});
    samples.push_back({700, {530, 500}});

    auto hovers = d.detect(samples, {});
    REQUIRE(hovers.size() == 1);
    REQUIRE(hovers[0].endTime == 600);
}

TEST_CASE("Empty input yields no hovers", "[HoverDetector]")
{
    HoverDetector d(kInput);
    REQUIRE(d.detect({}, {100, 200}).empty());
}
