#include "CapturePolicy.h"

#include <algorithm>

long long CapturePolicy::photoVolumeKb(int day_photos, int night_photos) {
    return static_cast<long long>(day_photos) * DAY_PHOTO_KB +
           static_cast<long long>(night_photos) * NIGHT_PHOTO_KB;
}

StorageProjection CapturePolicy::project(std::chrono::seconds window, double day_fraction) {
    day_fraction = std::clamp(day_fraction, 0.0, 1.0);
    double window_s = static_cast<double>(window.count());

    StorageProjection projection;
    projection.day_photos = static_cast<int>(window_s * day_fraction / DAY_DELAY_S);
    projection.night_photos = static_cast<int>(window_s * (1.0 - day_fraction) / NIGHT_DELAY_S);
    projection.volume_kb = photoVolumeKb(projection.day_photos, projection.night_photos);
    projection.within_budget = projection.volume_kb <= STORAGE_BUDGET_KB;
    return projection;
}
