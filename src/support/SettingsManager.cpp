// =============================================================================
// AutoFrame — SettingsManager
// Config persistence and immutable snapshots.
//
// JSON load/save with per-field range validation. Corrupt or wrongly typed
// input never throws: the affected fields keep their defaults.
// =============================================================================

#include "autoframe/support/SettingsManager.h"
#include "autoframe/support/Log.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace AutoFrame
{

using json = nlohmann::json;

// ─── Config Path ─────────────────────────────────────────────────────────────

std::string SettingsManager::getDefaultConfigPath()
{
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0')
        return {};
    return std::string(home) + "/.autoframe/config.json";
}

// ─── Validation ──────────────────────────────────────────────────────────────

SettingsSnapshot SettingsManager::validated(const SettingsSnapshot& s)
{
    const SettingsSnapshot defaults;
    SettingsSnapshot out = s;

    auto keepIf = [](auto& field, auto fallback, bool ok) {
        if (!ok)
            field = fallback;
    };

    keepIf(out.maxZoom, defaults.maxZoom, s.maxZoom > 1.0 && s.maxZoom <= 10.0);
    keepIf(out.paddingFraction, defaults.paddingFraction, s.paddingFraction >= 0.0 && s.paddingFraction <= 0.45);
    keepIf(out.transitionDurationMs, defaults.transitionDurationMs,
           s.transitionDurationMs >= 0 && s.transitionDurationMs <= 5000);
    keepIf(out.endBufferMs, defaults.endBufferMs, s.endBufferMs >= 0 && s.endBufferMs <= 60000);
    keepIf(out.hoverMinDurationMs, defaults.hoverMinDurationMs,
           s.hoverMinDurationMs >= 100 && s.hoverMinDurationMs <= 10000);
    keepIf(out.hoverBoxFraction, defaults.hoverBoxFraction,
           s.hoverBoxFraction >= 0.01 && s.hoverBoxFraction <= 0.5);
    keepIf(out.mustSeePaddingFraction, defaults.mustSeePaddingFraction,
           s.mustSeePaddingFraction >= 0.0 && s.mustSeePaddingFraction <= 1.0);
    keepIf(out.viewportSizeEpsilonPx, defaults.viewportSizeEpsilonPx,
           s.viewportSizeEpsilonPx >= 0.0 && s.viewportSizeEpsilonPx <= 100.0);
    keepIf(out.sampleFps, defaults.sampleFps, s.sampleFps >= 1 && s.sampleFps <= 240);

    return out;
}

// ─── Load ────────────────────────────────────────────────────────────────────

bool SettingsManager::loadFromFile(const char* path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        logger()->warn("Settings: cannot open {}, keeping current settings", path);
        return false;
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        logger()->error("Settings: {} is not a valid JSON object, keeping current settings", path);
        return false;
    }

    SettingsSnapshot settings; // Start from defaults

    auto readInt = [&](const char* key, int64_t& target) {
        if (j.contains(key) && j[key].is_number_integer())
            target = j[key].get<int64_t>();
        else if (j.contains(key))
            logger()->warn("Settings: '{}' must be an integer, using default", key);
    };

    auto readDouble = [&](const char* key, double& target) {
        if (j.contains(key) && j[key].is_number())
            target = j[key].get<double>();
        else if (j.contains(key))
            logger()->warn("Settings: '{}' must be a number, using default", key);
    };

    readDouble("maxZoom", settings.maxZoom);
    readDouble("paddingFraction", settings.paddingFraction);
    readInt("transitionDurationMs", settings.transitionDurationMs);
    readInt("endBufferMs", settings.endBufferMs);
    readInt("hoverMinDurationMs", settings.hoverMinDurationMs);
    readDouble("hoverBoxFraction", settings.hoverBoxFraction);
    readDouble("mustSeePaddingFraction", settings.mustSeePaddingFraction);
    readDouble("viewportSizeEpsilonPx", settings.viewportSizeEpsilonPx);

    int64_t fps = settings.sampleFps;
    readInt("sampleFps", fps);
    settings.sampleFps = (fps >= 1 && fps <= 240) ? static_cast<int>(fps) : SettingsSnapshot{}.sampleFps;

    publish(validated(settings));
    logger()->debug("Settings: loaded {}", path);
    return true;
}

// ─── Save ────────────────────────────────────────────────────────────────────

bool SettingsManager::saveToFile(const char* path) const
{
    auto snap = snapshot();

    json j;
    j["maxZoom"]                = snap->maxZoom;
    j["paddingFraction"]        = snap->paddingFraction;
    j["transitionDurationMs"]   = snap->transitionDurationMs;
    j["endBufferMs"]            = snap->endBufferMs;
    j["hoverMinDurationMs"]     = snap->hoverMinDurationMs;
    j["hoverBoxFraction"]       = snap->hoverBoxFraction;
    j["mustSeePaddingFraction"] = snap->mustSeePaddingFraction;
    j["viewportSizeEpsilonPx"]  = snap->viewportSizeEpsilonPx;
    j["sampleFps"]              = snap->sampleFps;

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path(), ec);
    // ec ignored: directory may already exist; the open below reports real failures

    std::ofstream file(path);
    if (!file.is_open())
    {
        logger()->error("Settings: cannot write {}", path);
        return false;
    }

    file << j.dump(4);
    return file.good();
}

// ─── Snapshot Access ─────────────────────────────────────────────────────────

std::shared_ptr<const SettingsSnapshot> SettingsManager::snapshot() const
{
    return std::atomic_load(&current_);
}

void SettingsManager::applySnapshot(const SettingsSnapshot& newSettings)
{
    publish(validated(newSettings));
}

void SettingsManager::publish(const SettingsSnapshot& settings)
{
    auto snap = std::make_shared<const SettingsSnapshot>(settings);
    std::atomic_store(&current_, snap);
    version_.fetch_add(1, std::memory_order_release);

    for (auto& obs : observers_)
        obs.cb(*snap, obs.userData);
}

uint64_t SettingsManager::version() const
{
    return version_.load(std::memory_order_acquire);
}

void SettingsManager::addObserver(ChangeCallback cb, void* userData)
{
    observers_.push_back({cb, userData});
}

// ─── Scheduler mapping ───────────────────────────────────────────────────────

ViewportMotionScheduler::Config schedulerConfig(const SettingsSnapshot& s)
{
    ViewportMotionScheduler::Config c;
    c.maxZoom = s.maxZoom;
    c.transitionDurationMs = s.transitionDurationMs;
    c.endBufferMs = s.endBufferMs;
    c.hoverMinDurationMs = s.hoverMinDurationMs;
    c.hoverBoxFraction = s.hoverBoxFraction;
    c.mustSeePaddingFraction = s.mustSeePaddingFraction;
    c.viewportSizeEpsilonPx = s.viewportSizeEpsilonPx;
    return c;
}

} // namespace AutoFrame
