#pragma once
// =============================================================================
// AutoFrame — User Events
// Interactions captured alongside the screen recording, plus the synthetic
// hover events produced by HoverDetector. Immutable once produced.
// =============================================================================

#include "autoframe/common/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace AutoFrame
{

enum class EventType : uint8_t
{
    Click,
    Mouse,      // cursor position sample
    MouseDown,
    MouseUp,
    Url,        // navigation
    KeyDown,
    Scroll,
    Typing,
    Hover,      // synthetic: cursor dwelled inside a small box
};

struct ClickEvent
{
    static constexpr EventType kType = EventType::Click;
    TimeMs timestamp = 0;
    Point position;
    std::string tagName;
};

struct MouseEvent
{
    static constexpr EventType kType = EventType::Mouse;
    TimeMs timestamp = 0;
    Point position;
};

struct MouseDownEvent
{
    static constexpr EventType kType = EventType::MouseDown;
    TimeMs timestamp = 0;
    Point position;
};

struct MouseUpEvent
{
    static constexpr EventType kType = EventType::MouseUp;
    TimeMs timestamp = 0;
    Point position;
};

struct UrlEvent
{
    static constexpr EventType kType = EventType::Url;
    TimeMs timestamp = 0;
    std::string url;
};

struct KeyDownEvent
{
    static constexpr EventType kType = EventType::KeyDown;
    TimeMs timestamp = 0;
    std::string key;
    std::string code;
    bool ctrlKey = false;
    bool metaKey = false;
    bool shiftKey = false;
    bool altKey = false;
    std::string tagName;
};

// targetRect is in Source space: the scrolled container.
struct ScrollEvent
{
    static constexpr EventType kType = EventType::Scroll;
    TimeMs timestamp = 0;
    Point position;
    Rect targetRect;
};

// targetRect is in Source space: the edited field.
struct TypingEvent
{
    static constexpr EventType kType = EventType::Typing;
    TimeMs timestamp = 0;
    TimeMs endTime = 0;
    Point position;
    Rect targetRect;
};

struct HoverEvent
{
    static constexpr EventType kType = EventType::Hover;
    TimeMs timestamp = 0;
    TimeMs endTime = 0;
    Point position;     // centroid of the dwell samples
};

using UserEvent = std::variant<ClickEvent, MouseEvent, MouseDownEvent, MouseUpEvent,
                               UrlEvent, KeyDownEvent, ScrollEvent, TypingEvent, HoverEvent>;

EventType eventType(const UserEvent& event);
TimeMs eventTimestamp(const UserEvent& event);

// Copy of the event moved to another time axis. Hover/typing end times are
// shifted by the same delta so the span length is preserved.
UserEvent withTimestamp(const UserEvent& event, TimeMs timestamp);

// Cursor position for position-bearing variants, nullopt for url/keydown.
std::optional<Point> eventPosition(const UserEvent& event);

const char* eventTypeName(EventType type);
std::optional<EventType> parseEventType(const std::string& name);

// Events that end a hover: clicks, scrolls, typing, navigation.
bool breaksHover(EventType type);

} // namespace AutoFrame
