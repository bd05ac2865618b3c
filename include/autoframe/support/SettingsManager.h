#pragma once
// =============================================================================
// AutoFrame — SettingsManager
// Loads, validates, saves config.json. Immutable snapshot model: readers hold a
// shared_ptr<const SettingsSnapshot>, writers swap in a new one.
// =============================================================================

#include "autoframe/logic/ViewportMotionScheduler.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace AutoFrame
{

struct SettingsSnapshot
{
    double  maxZoom                 = 2.0;
    double  paddingFraction         = 0.0;
    int64_t transitionDurationMs    = 500;
    int64_t endBufferMs             = 3000;
    int64_t hoverMinDurationMs      = 1000;
    double  hoverBoxFraction        = 0.1;
    double  mustSeePaddingFraction  = 0.1;
    double  viewportSizeEpsilonPx   = 1.0;
    int     sampleFps               = 30;   // CLI sampling rate
};

class SettingsManager
{
public:
    // Load settings from JSON file. Returns false on missing/corrupt file;
    // defaults (or the previous snapshot) remain in effect.
    bool loadFromFile(const char* path);

    // Save current settings to JSON file. Creates parent directories if needed.
    bool saveToFile(const char* path) const;

    std::shared_ptr<const SettingsSnapshot> snapshot() const;

    // Apply a modified snapshot: validates, swaps, bumps version, notifies observers.
    void applySnapshot(const SettingsSnapshot& newSettings);

    // $HOME/.autoframe/config.json (empty when HOME is unset)
    static std::string getDefaultConfigPath();

    // Clamp-free validation: out-of-range fields fall back to their defaults.
    static SettingsSnapshot validated(const SettingsSnapshot& s);

    using ChangeCallback = void(*)(const SettingsSnapshot&, void* userData);
    void addObserver(ChangeCallback cb, void* userData);

    uint64_t version() const;

private:
    void publish(const SettingsSnapshot& settings);

    std::shared_ptr<const SettingsSnapshot> current_ = std::make_shared<SettingsSnapshot>();
    std::atomic<uint64_t> version_{0};

    struct Observer { ChangeCallback cb; void* userData; };
    std::vector<Observer> observers_;
};

// Scheduler tunables from a settings snapshot.
ViewportMotionScheduler::Config schedulerConfig(const SettingsSnapshot& s);

} // namespace AutoFrame
