#pragma once
// =============================================================================
// AutoFrame — SessionLoader
// Reads a recording session (sizes, output windows, event stream) from JSON.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/UserEvent.h"

#include <string>
#include <vector>

namespace AutoFrame
{

struct SessionData
{
    Size inputSize;
    Size outputSize;
    TimeMs timelineOffsetMs = 0;
    std::vector<OutputWindow> outputWindows;
    std::vector<UserEvent> events;     // Source time, file order
};

class SessionLoader
{
public:
    // Returns false (reason logged) when the file is missing or corrupt, a
    // size is missing or empty, the windows are unsorted/overlapping, or the
    // timeline offset or a window bound is not a number within +/-1e15 ms.
    // Unusable event entries (including out-of-range times) are skipped with
    // a warning.
    static bool loadFromFile(const char* path, SessionData& out);
    static bool loadFromString(const std::string& text, SessionData& out);
};

} // namespace AutoFrame
