#include "AcquisitionLoop.h"
#include "CapturePolicy.h"
#include "DaylightClassifier.h"

#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string formatCoordinate(double degrees) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6) << degrees;
    return out.str();
}

} // namespace

AcquisitionLoop::AcquisitionLoop(MissionContext context) : context(std::move(context)) {
    if (!this->context.position_model || !this->context.camera || !this->context.sensors ||
        !this->context.clock || !this->context.log || !this->context.csv) {
        throw std::invalid_argument("mission context is missing a collaborator");
    }
    sampler = std::make_unique<TelemetrySampler>(*this->context.sensors, *this->context.log);
}

StepResult<SubPoint> AcquisitionLoop::locateSpacecraft(const MissionTimePoint& now) {
    try {
        return StepResult<SubPoint>::ok(context.position_model->subPointAt(now));
    } catch (const std::exception& e) {
        return StepResult<SubPoint>::failed(ErrorKind::Propagation, e.what());
    }
}

StepResult<bool> AcquisitionLoop::classifyDaylight(const SubPoint& fix, const MissionTimePoint& now) {
    try {
        double altitude = DaylightClassifier::sunAltitudeDeg(fix.latitude_deg, fix.longitude_deg, now);
        if (DaylightClassifier::isInTerminatorBand(altitude)) {
            std::ostringstream msg;
            msg << "Sub-point inside the terminator band, sun altitude " << std::setprecision(3) << altitude << " deg";
            context.log->debug(msg.str());
        }
        return StepResult<bool>::ok(DaylightClassifier::isDaylightAltitude(altitude));
    } catch (const std::exception& e) {
        return StepResult<bool>::failed(ErrorKind::Classification, e.what());
    }
}

StepResult<GpsExifTags> AcquisitionLoop::tagPhoto(const SubPoint& fix) {
    Camera& camera = *context.camera;
    try {
        GpsExifTags tags = buildGpsExifTags(fix.latitude_deg, fix.longitude_deg);
        camera.clearExifTags();
        camera.setExifTag("GPS.GPSLatitude", tags.latitude);
        camera.setExifTag("GPS.GPSLatitudeRef", tags.latitude_ref);
        camera.setExifTag("GPS.GPSLongitude", tags.longitude);
        camera.setExifTag("GPS.GPSLongitudeRef", tags.longitude_ref);
        return StepResult<GpsExifTags>::ok(tags);
    } catch (const std::exception& e) {
        // Capture goes ahead untagged
        camera.clearExifTags();
        return StepResult<GpsExifTags>::failed(ErrorKind::Metadata, e.what());
    }
}

StepResult<std::string> AcquisitionLoop::capturePhoto() {
    std::string path = context.config.photoPath(context.photo_number);
    context.log->info("Capturing photo number " + std::to_string(context.photo_number));
    try {
        context.camera->capture(path, context.config.jpeg_quality);
    } catch (const std::exception& e) {
        return StepResult<std::string>::failed(ErrorKind::Capture, e.what());
    }
    context.log->info("captured photo using file " + path);
    return StepResult<std::string>::ok(path);
}

StepResult<int> AcquisitionLoop::storeTelemetry(const TelemetryRecord& record) {
    try {
        context.csv->append(record);
    } catch (const std::exception& e) {
        return StepResult<int>::failed(ErrorKind::Storage, e.what());
    }
    return StepResult<int>::ok(context.csv->getRowsWritten());
}

void AcquisitionLoop::handleFailure(const StepError& failure) {
    context.log->error(std::string(errorKindName(failure.kind)) + ": " + failure.message);
    if (failurePolicyFor(failure.kind) == FailurePolicy::BackOff) {
        context.clock->sleepFor(context.config.failure_backoff);
    }
}

IterationOutcome AcquisitionLoop::abandonIteration(const StepError& failure) {
    ++context.counters.failed_iterations;
    handleFailure(failure);
    IterationOutcome outcome;
    outcome.failure = failure;
    return outcome;
}

IterationOutcome AcquisitionLoop::runIteration() {
    AcquisitionCounters& counters = context.counters;
    ++counters.iterations;
    MissionTimePoint now = context.clock->now();

    StepResult<SubPoint> position = locateSpacecraft(now);
    if (!position) {
        return abandonIteration(position.error());
    }
    const SubPoint& fix = position.value();
    context.log->info("ISS at " + formatUtcTimestamp(now) + " is at Longitude: " +
                      formatCoordinate(fix.longitude_deg) + " Latitude: " + formatCoordinate(fix.latitude_deg));

    StepResult<bool> daylight = classifyDaylight(fix, now);
    if (!daylight) {
        return abandonIteration(daylight.error());
    }
    bool is_day = daylight.value();
    ++(is_day ? counters.day_iterations : counters.night_iterations);
    context.log->info(std::string("ISS is in day = ") + (is_day ? "True" : "False"));

    StepResult<GpsExifTags> tags = tagPhoto(fix);
    if (!tags) {
        ++counters.metadata_failures;
        handleFailure(tags.error());
    }

    StepResult<std::string> photo = capturePhoto();
    if (photo) {
        ++counters.photos_captured;
    } else {
        ++counters.capture_failures;
    }

    // The row is written even when the capture failed
    TelemetryRecord record = sampler->sample(now, is_day, fix.longitude_deg, fix.latitude_deg, context.photo_number);
    StepResult<int> stored = storeTelemetry(record);
    if (stored) {
        ++counters.rows_written;
    }
    if (!photo || !stored) {
        // Both failures are logged, the back-off is slept once
        if (!photo && !stored) {
            context.log->error(std::string(errorKindName(photo.error().kind)) + ": " + photo.error().message);
        }
        IterationOutcome outcome = abandonIteration(stored ? photo.error() : stored.error());
        outcome.is_day = is_day;
        return outcome;
    }

    std::chrono::seconds delay = CapturePolicy::captureDelay(is_day);
    context.log->info("Delay till next photo: " + std::to_string(delay.count()) + " seconds");
    context.clock->sleepFor(delay);

    IterationOutcome outcome;
    outcome.completed = true;
    outcome.is_day = is_day;
    return outcome;
}

AcquisitionCounters AcquisitionLoop::run() {
    MissionTimePoint start = context.clock->now();
    MissionTimePoint deadline = start + context.config.run_duration;

    context.log->info("Starting Space Kludgers data acquisition at " + formatUtcTimestamp(start) +
                      ", running until " + formatUtcTimestamp(deadline));

    StorageProjection projection = CapturePolicy::project(context.config.run_duration);
    std::ostringstream budget;
    budget << "Projected photo volume: " << projection.day_photos << " day + " << projection.night_photos
           << " night photos, " << projection.volume_kb << " KB of " << CapturePolicy::STORAGE_BUDGET_KB << " KB";
    if (projection.within_budget) {
        context.log->info(budget.str());
    } else {
        context.log->warning(budget.str() + " (over budget)");
    }

    MissionTimePoint now = start;
    while (now < deadline) {
        runIteration();
        ++context.photo_number;
        now = context.clock->now();
    }

    const AcquisitionCounters& counters = context.counters;
    std::ostringstream summary;
    summary << "Successfully completed Space Kludgers job at " << formatUtcTimestamp(now)
            << ": " << counters.iterations << " iterations, "
            << counters.photos_captured << " photos, "
            << counters.rows_written << " telemetry rows, "
            << counters.failed_iterations << " failed iterations";
    context.log->info(summary.str());
    return counters;
}
