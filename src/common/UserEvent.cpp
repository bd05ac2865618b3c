// =============================================================================
// AutoFrame — User Events
// Tag dispatch helpers over the UserEvent variant.
// =============================================================================

#include "autoframe/common/UserEvent.h"

#include <type_traits>

namespace AutoFrame
{

EventType eventType(const UserEvent& event)
{
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::kType; }, event);
}

TimeMs eventTimestamp(const UserEvent& event)
{
    return std::visit([](const auto& e) { return e.timestamp; }, event);
}

UserEvent withTimestamp(const UserEvent& event, TimeMs timestamp)
{
    UserEvent moved = event;
    switch (eventType(event))
    {
    case EventType::Hover:
    {
        auto& h = std::get<HoverEvent>(moved);
        h.endTime += timestamp - h.timestamp;
        h.timestamp = timestamp;
        break;
    }
    case EventType::Typing:
    {
        auto& t = std::get<TypingEvent>(moved);
        t.endTime += timestamp - t.timestamp;
        t.timestamp = timestamp;
        break;
    }
    default:
        std::visit([timestamp](auto& e) { e.timestamp = timestamp; }, moved);
        break;
    }
    return moved;
}

std::optional<Point> eventPosition(const UserEvent& event)
{
    switch (eventType(event))
    {
    case EventType::Click:     return std::get<ClickEvent>(event).position;
    case EventType::Mouse:     return std::get<MouseEvent>(event).position;
    case EventType::MouseDown: return std::get<MouseDownEvent>(event).position;
    case EventType::MouseUp:   return std::get<MouseUpEvent>(event).position;
    case EventType::Scroll:    return std::get<ScrollEvent>(event).position;
    case EventType::Typing:    return std::get<TypingEvent>(event).position;
    case EventType::Hover:     return std::get<HoverEvent>(event).position;
    case EventType::Url:
    case EventType::KeyDown:
        break;
    }
    return std::nullopt;
}

const char* eventTypeName(EventType type)
{
    switch (type)
    {
    case EventType::Click:     return "click";
    case EventType::Mouse:     return "mouse";
    case EventType::MouseDown: return "mousedown";
    case EventType::MouseUp:   return "mouseup";
    case EventType::Url:       return "url";
    case EventType::KeyDown:   return "keydown";
    case EventType::Scroll:    return "scroll";
    case EventType::Typing:    return "typing";
    case EventType::Hover:     return "hover";
    }
    return "unknown";
}

std::optional<EventType> parseEventType(const std::string& name)
{
    static constexpr EventType kAll[] = {
        EventType::Click, EventType::Mouse, EventType::MouseDown, EventType::MouseUp,
        EventType::Url, EventType::KeyDown, EventType::Scroll, EventType::Typing,
        EventType::Hover,
    };
    for (EventType t : kAll)
    {
        if (name == eventTypeName(t))
            return t;
    }
    return std::nullopt;
}

bool breaksHover(EventType type)
{
    switch (type)
    {
    case EventType::Click:
    case EventType::Scroll:
    case EventType::Typing:
    case EventType::Url:
        return true;
    default:
        return false;
    }
}

} // namespace AutoFrame
