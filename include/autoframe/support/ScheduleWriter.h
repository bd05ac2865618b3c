#pragma once
// =============================================================================
// AutoFrame — ScheduleWriter
// JSON rendering of the computed schedule and mouse effects for the CLI.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/ViewportMotion.h"
#include "autoframe/logic/MouseEffects.h"
#include "autoframe/timing/TimeMapper.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace AutoFrame
{

nlohmann::json rectToJson(const Rect& r);

// One object per motion with its Output-time span; the closing motion has
// reason "end".
nlohmann::json motionsToJson(const std::vector<ViewportMotion>& motions, const TimeMapper& timeMapper);

// {"clickEffects": [...], "dragEffects": [...]}, times in Output ms.
nlohmann::json effectsToJson(const MouseEffectSet& effects);

} // namespace AutoFrame
