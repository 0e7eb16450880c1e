#ifndef CAPTURE_POLICY_H
#define CAPTURE_POLICY_H

#include <chrono>

// Projected photo volume for a window split between day and night
struct StorageProjection {
    int day_photos = 0;
    int night_photos = 0;
    long long volume_kb = 0;
    bool within_budget = true;
};

/**
 * Capture cadence table. Day photos average ~3077 KB and night photos
 * ~1000 KB, so a 7 s / 20 s cadence over 178 minutes stays under ~3 GB.
 */
class CapturePolicy {
public:
    static constexpr int DAY_DELAY_S = 7;
    static constexpr int NIGHT_DELAY_S = 20;
    static constexpr long long DAY_PHOTO_KB = 3077;
    static constexpr long long NIGHT_PHOTO_KB = 1000;
    static constexpr long long STORAGE_BUDGET_KB = 3000000;

    static std::chrono::seconds captureDelay(bool is_day) {
        return std::chrono::seconds(is_day ? DAY_DELAY_S : NIGHT_DELAY_S);
    }

    static long long photoVolumeKb(int day_photos, int night_photos);
    // day_fraction in [0, 1] of the window spent over daylight
    static StorageProjection project(std::chrono::seconds window, double day_fraction = 0.5);
};

#endif // CAPTURE_POLICY_H
