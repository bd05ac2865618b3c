// =============================================================================
// AutoFrame — ScheduleWriter
// =============================================================================

#include "autoframe/support/ScheduleWriter.h"

namespace AutoFrame
{

using json = nlohmann::json;

static json pointJson(const Point& p)
{
    return {{"x", p.x}, {"y", p.y}};
}

json rectToJson(const Rect& r)
{
    return {{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

json motionsToJson(const std::vector<ViewportMotion>& motions, const TimeMapper& timeMapper)
{
    json list = json::array();
    for (const auto& m : motions)
    {
        TimeMs end = timeMapper.mapSourceToOutputTime(m.sourceEndTimeMs);

        json jm;
        jm["sourceEndTimeMs"] = m.sourceEndTimeMs;
        jm["durationMs"] = m.durationMs;
        jm["rect"] = rectToJson(m.rect);
        jm["reason"] = m.reason ? eventTypeName(*m.reason) : "end";
        if (end != kNotVisible)
        {
            jm["outputStartMs"] = end - m.durationMs;
            jm["outputEndMs"] = end;
        }
        list.push_back(jm);
    }
    return list;
}

json effectsToJson(const MouseEffectSet& effects)
{
    json clicks = json::array();
    for (const auto& c : effects.clicks)
    {
        json jc = pointJson(c.position);
        jc["outputMs"] = c.timestampMs;
        clicks.push_back(jc);
    }

    json drags = json::array();
    for (const auto& d : effects.drags)
    {
        json path = json::array();
        for (const auto& p : d.path)
        {
            json jp = pointJson(p.position);
            jp["outputMs"] = p.timestampMs;
            path.push_back(jp);
        }

        json jd;
        jd["startMs"] = d.startMs;
        jd["endMs"] = d.endMs;
        jd["start"] = pointJson(d.start);
        jd["end"] = pointJson(d.end);
        jd["path"] = path;
        drags.push_back(jd);
    }

    return {{"clickEffects", clicks}, {"dragEffects", drags}};
}

} // namespace AutoFrame
