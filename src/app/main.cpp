// =============================================================================
// AutoFrame — Command-line Entry Point
// Loads settings and a recorded session, computes the camera schedule and
// prints it as JSON. Optionally samples the camera at a fixed frame rate.
//
// Usage: autoframe <session.json> [--config <settings.json>] [--fps N]
//                  [--samples] [--verbose|--trace]
// Exit codes: 0 ok, 1 usage error, 2 unusable session/settings.
// =============================================================================

#include "autoframe/geometry/ViewMapper.h"
#include "autoframe/logic/MouseEffects.h"
#include "autoframe/logic/ViewportMotionScheduler.h"
#include "autoframe/logic/ViewportStateInterpolator.h"
#include "autoframe/support/Log.h"
#include "autoframe/support/ScheduleWriter.h"
#include "autoframe/support/SessionLoader.h"
#include "autoframe/support/SettingsManager.h"
#include "autoframe/timing/TimeMapper.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

using namespace AutoFrame;
using json = nlohmann::json;

static constexpr int kExitOk = 0;
static constexpr int kExitUsage = 1;
static constexpr int kExitInput = 2;

struct CliOptions
{
    std::string sessionPath;
    std::string configPath;
    int fps = 0;            // 0 → from settings
    bool samples = false;
    const char* logLevel = "info";
};

static void printUsage()
{
    std::fprintf(stderr,
                 "usage: autoframe <session.json> [--config <settings.json>] [--fps N]\n"
                 "                 [--samples] [--verbose|--trace]\n");
}

static bool parseArgs(int argc, char** argv, CliOptions& opts)
{
    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc)
            opts.configPath = argv[++i];
        else if (std::strcmp(arg, "--fps") == 0 && i + 1 < argc)
        {
            opts.fps = std::atoi(argv[++i]);
            if (opts.fps < 1 || opts.fps > 240)
                return false;
        }
        else if (std::strcmp(arg, "--samples") == 0)
            opts.samples = true;
        else if (std::strcmp(arg, "--verbose") == 0)
            opts.logLevel = "debug";
        else if (std::strcmp(arg, "--trace") == 0)
            opts.logLevel = "trace";
        else if (arg[0] == '-')
            return false;
        else if (opts.sessionPath.empty())
            opts.sessionPath = arg;
        else
            return false;
    }
    return !opts.sessionPath.empty();
}

int main(int argc, char** argv)
{
    CliOptions opts;
    if (!parseArgs(argc, argv, opts))
    {
        printUsage();
        return kExitUsage;
    }
    setLogLevel(opts.logLevel);

    // ── Settings ──
    SettingsManager settingsManager;
    if (!opts.configPath.empty())
    {
        if (!settingsManager.loadFromFile(opts.configPath.c_str()))
            return kExitInput;
    }
    else
    {
        std::string defaultPath = SettingsManager::getDefaultConfigPath();
        std::error_code ec;
        if (!defaultPath.empty() && std::filesystem::exists(defaultPath, ec))
        {
            if (!settingsManager.loadFromFile(defaultPath.c_str()))
                logger()->warn("Settings: using defaults");
        }
    }
    auto settings = settingsManager.snapshot();

    // ── Session ──
    SessionData session;
    if (!SessionLoader::loadFromFile(opts.sessionPath.c_str(), session))
        return kExitInput;

    TimeMapper timeMapper(session.timelineOffsetMs, session.outputWindows);
    ViewMapper viewMapper(session.inputSize, session.outputSize, settings->paddingFraction);

    logger()->info("Session: {} events, {} windows, output {}ms", session.events.size(),
                   session.outputWindows.size(), timeMapper.getOutputDuration());

    // ── Schedule ──
    ViewportMotionScheduler scheduler(viewMapper, timeMapper, schedulerConfig(*settings));
    std::vector<ViewportMotion> motions = scheduler.calculateZoomSchedule(session.events);
    ViewportStateInterpolator interpolator(motions, session.outputSize, timeMapper);

    json out;
    out["outputDurationMs"] = timeMapper.getOutputDuration();
    out["contentRect"] = rectToJson(viewMapper.contentRect());

    out["motions"] = motionsToJson(motions, timeMapper);

    MouseEffectSet effects = MouseEffects::extract(session.events, timeMapper);
    out.update(effectsToJson(effects));

    if (opts.samples)
    {
        int fps = opts.fps > 0 ? opts.fps : settings->sampleFps;
        json samples = json::array();
        TimeMs duration = timeMapper.getOutputDuration();
        for (int64_t frame = 0;; ++frame)
        {
            TimeMs t = frame * 1000 / fps;
            if (t >= duration)
                break;

            Rect camera = interpolator.stateAt(t);
            json js;
            js["outputMs"] = t;
            js["camera"] = rectToJson(camera);
            js["zoom"] = viewMapper.getZoomScale(camera);
            if (auto rects = viewMapper.resolveRenderRects(camera))
            {
                js["sourceRect"] = rectToJson(rects->sourceRect);
                js["destRect"] = rectToJson(rects->destRect);
            }
            samples.push_back(js);
        }
        out["samples"] = samples;
    }

    std::cout << out.dump(2) << std::endl;
    return kExitOk;
}
