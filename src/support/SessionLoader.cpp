// =============================================================================
// AutoFrame — SessionLoader
// No-throw JSON parsing; every field is type-checked before use.
// =============================================================================

#include "autoframe/support/SessionLoader.h"
#include "autoframe/support/Log.h"
#include "autoframe/timing/TimeMapper.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

namespace AutoFrame
{

using json = nlohmann::json;

// Millisecond values beyond ~31,000 years are rejected so sums of a few of
// them stay far inside int64.
static constexpr double kMaxAbsTimeMs = 1e15;

// nullopt when the key is missing, not a number, or out of range.
static std::optional<TimeMs> readTime(const json& j, const char* key)
{
    if (!j.contains(key) || !j[key].is_number())
        return std::nullopt;
    double v = j[key].get<double>();
    if (!std::isfinite(v) || std::abs(v) > kMaxAbsTimeMs)
        return std::nullopt;
    return static_cast<TimeMs>(v);
}

static std::optional<Size> readSize(const json& j, const char* key)
{
    if (!j.contains(key) || !j[key].is_object())
        return std::nullopt;
    const json& s = j[key];
    if (!s.contains("width") || !s["width"].is_number() || !s.contains("height") || !s["height"].is_number())
        return std::nullopt;
    Size size{s["width"].get<double>(), s["height"].get<double>()};
    if (size.isEmpty())
        return std::nullopt;
    return size;
}

static double readNumber(const json& j, const char* key, double fallback = 0.0)
{
    if (j.contains(key) && j[key].is_number())
        return j[key].get<double>();
    return fallback;
}

static std::string readString(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return {};
}

static bool readBool(const json& j, const char* key)
{
    return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

static Rect readRect(const json& j, const char* key)
{
    if (!j.contains(key) || !j[key].is_object())
        return {};
    const json& r = j[key];
    return {readNumber(r, "x"), readNumber(r, "y"), readNumber(r, "width"), readNumber(r, "height")};
}

static std::optional<UserEvent> readEvent(const json& e)
{
    if (!e.is_object())
        return std::nullopt;

    auto timestamp = readTime(e, "timestamp");
    if (!timestamp)
        return std::nullopt;

    auto type = parseEventType(readString(e, "type"));
    if (!type)
        return std::nullopt;

    TimeMs ts = *timestamp;
    Point pos{readNumber(e, "x"), readNumber(e, "y")};

    TimeMs endTime = ts;
    if (e.contains("endTime"))
    {
        auto end = readTime(e, "endTime");
        if (!end)
            return std::nullopt;
        endTime = *end;
    }

    switch (*type)
    {
    case EventType::Click:     return UserEvent{ClickEvent{ts, pos, readString(e, "tagName")}};
    case EventType::Mouse:     return UserEvent{MouseEvent{ts, pos}};
    case EventType::MouseDown: return UserEvent{MouseDownEvent{ts, pos}};
    case EventType::MouseUp:   return UserEvent{MouseUpEvent{ts, pos}};
    case EventType::Url:       return UserEvent{UrlEvent{ts, readString(e, "url")}};
    case EventType::KeyDown:
        return UserEvent{KeyDownEvent{ts, readString(e, "key"), readString(e, "code"),
                                      readBool(e, "ctrlKey"), readBool(e, "metaKey"),
                                      readBool(e, "shiftKey"), readBool(e, "altKey"),
                                      readString(e, "tagName")}};
    case EventType::Scroll:    return UserEvent{ScrollEvent{ts, pos, readRect(e, "targetRect")}};
    case EventType::Typing:    return UserEvent{TypingEvent{ts, endTime, pos, readRect(e, "targetRect")}};
    case EventType::Hover:     return UserEvent{HoverEvent{ts, endTime, pos}};
    }
    return std::nullopt;
}

bool SessionLoader::loadFromFile(const char* path, SessionData& out)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        logger()->error("Session: cannot open {}", path);
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return loadFromString(text, out);
}

bool SessionLoader::loadFromString(const std::string& text, SessionData& out)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        logger()->error("Session: not a valid JSON object");
        return false;
    }

    SessionData session;

    auto inputSize = readSize(j, "inputSize");
    auto outputSize = readSize(j, "outputSize");
    if (!inputSize || !outputSize)
    {
        logger()->error("Session: inputSize and outputSize must be present and non-empty");
        return false;
    }
    session.inputSize = *inputSize;
    session.outputSize = *outputSize;

    if (j.contains("timelineOffsetMs"))
    {
        auto offset = readTime(j, "timelineOffsetMs");
        if (!offset)
        {
            logger()->error("Session: timelineOffsetMs must be a number within +/-{}", kMaxAbsTimeMs);
            return false;
        }
        session.timelineOffsetMs = *offset;
    }

    if (j.contains("events") && j["events"].is_array())
    {
        size_t skipped = 0;
        for (const auto& e : j["events"])
        {
            auto event = readEvent(e);
            if (event)
                session.events.push_back(std::move(*event));
            else
                ++skipped;
        }
        if (skipped > 0)
            logger()->warn("Session: skipped {} unusable event entries", skipped);
    }

    if (j.contains("outputWindows") && j["outputWindows"].is_array())
    {
        for (const auto& w : j["outputWindows"])
        {
            std::optional<TimeMs> start, end;
            if (w.is_object())
            {
                start = readTime(w, "startMs");
                end = readTime(w, "endMs");
            }
            if (!start || !end)
            {
                logger()->error("Session: output window needs numeric startMs/endMs within +/-{}",
                                kMaxAbsTimeMs);
                return false;
            }
            OutputWindow win;
            win.id = readString(w, "id");
            win.startMs = *start;
            win.endMs = *end;
            session.outputWindows.push_back(std::move(win));
        }

        if (!TimeMapper::validateWindows(session.outputWindows))
        {
            logger()->error("Session: output windows must be sorted and non-overlapping");
            return false;
        }
    }
    else
    {
        // Uncut recording: one window covering every event
        TimeMs last = 0;
        for (const auto& e : session.events)
            last = std::max(last, eventTimestamp(e));
        OutputWindow win;
        win.id = "full";
        win.startMs = session.timelineOffsetMs;
        win.endMs = last + session.timelineOffsetMs + 1;
        session.outputWindows.push_back(std::move(win));
    }

    out = std::move(session);
    return true;
}

} // namespace AutoFrame
