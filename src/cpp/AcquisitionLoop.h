#ifndef ACQUISITION_LOOP_H
#define ACQUISITION_LOOP_H

#include <memory>
#include <optional>
#include <string>
#include "Camera.h"
#include "GpsExif.h"
#include "MissionClock.h"
#include "MissionConfig.h"
#include "MissionLog.h"
#include "PositionModel.h"
#include "SensorSuite.h"
#include "StepResult.h"
#include "TelemetryCsv.h"
#include "TelemetrySampler.h"

struct AcquisitionCounters {
    int iterations = 0;
    int day_iterations = 0;
    int night_iterations = 0;
    int photos_captured = 0;
    int rows_written = 0;
    int failed_iterations = 0;     // ended early with a back-off
    int metadata_failures = 0;
    int capture_failures = 0;
};

/**
 * Everything one mission run needs, owned by the loop driver.
 */
struct MissionContext {
    MissionConfig config;
    std::unique_ptr<PositionModel> position_model;
    std::unique_ptr<Camera> camera;
    std::unique_ptr<SensorSuite> sensors;
    std::unique_ptr<MissionClock> clock;
    std::unique_ptr<MissionLog> log;
    std::unique_ptr<TelemetryCsv> csv;

    int photo_number = 0;
    AcquisitionCounters counters;
};

struct IterationOutcome {
    bool completed = false;             // reached the cadence sleep
    std::optional<bool> is_day;
    std::optional<StepError> failure;   // the failure that ended the iteration
};

/**
 * AcquisitionLoop - fixed-duration capture loop
 *
 * Each iteration: locate the sub-point, classify day/night, tag and
 * capture a photo, sample telemetry into the CSV, sleep the cadence.
 * The photo number advances after every iteration, successful or not,
 * and the loop stops once the clock reaches start + run_duration.
 */
class AcquisitionLoop {
private:
    MissionContext context;
    std::unique_ptr<TelemetrySampler> sampler;

    StepResult<SubPoint> locateSpacecraft(const MissionTimePoint& now);
    StepResult<bool> classifyDaylight(const SubPoint& fix, const MissionTimePoint& now);
    StepResult<GpsExifTags> tagPhoto(const SubPoint& fix);
    StepResult<std::string> capturePhoto();
    StepResult<int> storeTelemetry(const TelemetryRecord& record);

    // Logs the failure; sleeps the back-off when the kind calls for it
    void handleFailure(const StepError& failure);
    IterationOutcome abandonIteration(const StepError& failure);

public:
    // Throws std::invalid_argument when a collaborator is missing
    explicit AcquisitionLoop(MissionContext context);

    IterationOutcome runIteration();
    AcquisitionCounters run();

    const MissionContext& getContext() const { return context; }
};

#endif // ACQUISITION_LOOP_H
