#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "AcquisitionLoop.h"
#include "TelemetryCsv.h"
#include "test_fakes.h"
#include "test_support.h"

namespace {

// Collaborators stay owned by the context; raw pointers let tests steer them
struct LoopHarness {
    FakeClock* clock = nullptr;
    FakeCamera* camera = nullptr;
    FakeSensors* sensors = nullptr;
    FakePositionModel* position = nullptr;
    MissionContext context;
};

LoopHarness makeHarness(const ScratchDirectory& scratch, MissionTimePoint start, double latitude, double longitude) {
    LoopHarness harness;
    MissionContext& context = harness.context;
    context.config.run_directory = scratch.path();

    auto clock = std::make_unique<FakeClock>(start);
    auto camera = std::make_unique<FakeCamera>();
    auto sensors = std::make_unique<FakeSensors>();
    auto position = std::make_unique<FakePositionModel>();
    position->point = SubPoint{latitude, longitude, 420.0};

    harness.clock = clock.get();
    harness.camera = camera.get();
    harness.sensors = sensors.get();
    harness.position = position.get();

    context.clock = std::move(clock);
    context.camera = std::move(camera);
    context.sensors = std::move(sensors);
    context.position_model = std::move(position);
    context.log = std::make_unique<MissionLog>(context.config.logger_name, context.config.logPath(), false);
    context.csv = std::make_unique<TelemetryCsv>(context.config.csvPath());
    context.csv->create();
    return harness;
}

MissionTimePoint dayStart() { return fromUtc(2020, 6, 21, 10, 30, 0.0); }
MissionTimePoint nightStart() { return fromUtc(2020, 6, 21, 22, 30, 0.0); }

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool allSleepsAre(const FakeClock& clock, int seconds) {
    for (const std::chrono::seconds& sleep : clock.sleeps) {
        if (sleep.count() != seconds) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST(daylight_pass_uses_seven_second_cadence) {
    ScratchDirectory scratch("loop_day");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    FakeClock* clock = h.clock;
    FakeCamera* camera = h.camera;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 1526);
    ASSERT_EQ(counters.day_iterations, 1526);
    ASSERT_EQ(counters.night_iterations, 0);
    ASSERT_EQ(counters.photos_captured, 1526);
    ASSERT_EQ(counters.rows_written, 1526);
    ASSERT_EQ(counters.failed_iterations, 0);
    ASSERT(allSleepsAre(*clock, 7));
    ASSERT_EQ(camera->captured_paths.size(), 1526u);
    ASSERT_EQ(loop.getContext().photo_number, 1526);

    std::vector<std::vector<std::string>> rows = TelemetryCsv::readAll(loop.getContext().config.csvPath());
    ASSERT_EQ(rows.size(), 1527u);
    ASSERT_EQ(rows[1][1], std::string("True"));
    ASSERT_EQ(rows[1526][4], std::string("1525"));
}

TEST(night_pass_uses_twenty_second_cadence) {
    ScratchDirectory scratch("loop_night");
    LoopHarness h = makeHarness(scratch, nightStart(), 0.0, 0.0);
    FakeClock* clock = h.clock;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 534);
    ASSERT_EQ(counters.night_iterations, 534);
    ASSERT_EQ(counters.rows_written, 534);
    ASSERT(allSleepsAre(*clock, 20));
}

TEST(propagation_failure_backs_off) {
    ScratchDirectory scratch("loop_propagation");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    FakeClock* clock = h.clock;
    FakeCamera* camera = h.camera;
    h.position->fail = true;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 2136);
    ASSERT_EQ(counters.failed_iterations, 2136);
    ASSERT_EQ(counters.rows_written, 0);
    ASSERT(camera->captured_paths.empty());
    ASSERT(allSleepsAre(*clock, 5));
    // Photo numbers are consumed by failed iterations too
    ASSERT_EQ(loop.getContext().photo_number, 2136);
    ASSERT(readFile(loop.getContext().config.logPath()).find("ERROR: PropagationError: elements too old") != std::string::npos);
}

TEST(classification_failure_backs_off) {
    ScratchDirectory scratch("loop_classify");
    LoopHarness h = makeHarness(scratch, dayStart(), 95.0, 0.0);
    h.context.config.run_duration = std::chrono::minutes(1);
    FakeClock* clock = h.clock;
    AcquisitionLoop loop(std::move(h.context));

    IterationOutcome outcome = loop.runIteration();
    ASSERT(!outcome.completed);
    ASSERT(outcome.failure.has_value());
    ASSERT(outcome.failure->kind == ErrorKind::Classification);
    ASSERT_EQ(clock->sleeps.size(), 1u);
    ASSERT_EQ(clock->sleeps[0].count(), 5);
}

TEST(capture_failure_writes_row_then_backs_off) {
    ScratchDirectory scratch("loop_capture");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    FakeClock* clock = h.clock;
    h.camera->fail_capture = true;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 2136);
    ASSERT_EQ(counters.capture_failures, 2136);
    ASSERT_EQ(counters.photos_captured, 0);
    ASSERT_EQ(counters.rows_written, 2136);
    ASSERT_EQ(counters.failed_iterations, 2136);
    ASSERT(allSleepsAre(*clock, 5));
    ASSERT_EQ(loop.getContext().photo_number, 2136);
    ASSERT_EQ(TelemetryCsv::readAll(loop.getContext().config.csvPath()).size(), 2137u);
    ASSERT(readFile(loop.getContext().config.logPath()).find("ERROR: CaptureError: camera busy") != std::string::npos);
}

TEST(rejected_tags_still_capture_untagged) {
    ScratchDirectory scratch("loop_metadata");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    h.context.config.run_duration = std::chrono::minutes(1);
    FakeClock* clock = h.clock;
    FakeCamera* camera = h.camera;
    camera->reject_tags = true;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 9);
    ASSERT_EQ(counters.metadata_failures, 9);
    ASSERT_EQ(counters.photos_captured, 9);
    ASSERT_EQ(counters.rows_written, 9);
    ASSERT_EQ(counters.failed_iterations, 0);
    ASSERT(allSleepsAre(*clock, 7));
    ASSERT_EQ(camera->captured_tags.size(), 9u);
    ASSERT(camera->captured_tags[0].empty());
    ASSERT(readFile(loop.getContext().config.logPath()).find("ERROR: MetadataError: exif tag") != std::string::npos);
}

TEST(sensor_failure_writes_zero_rows) {
    ScratchDirectory scratch("loop_sensors");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    h.context.config.run_duration = std::chrono::minutes(1);
    h.sensors->fail_reads = true;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 9);
    ASSERT_EQ(counters.rows_written, 9);
    ASSERT_EQ(counters.photos_captured, 9);

    std::vector<std::vector<std::string>> rows = TelemetryCsv::readAll(loop.getContext().config.csvPath());
    ASSERT_EQ(rows.size(), 10u);
    for (std::size_t r = 1; r < rows.size(); ++r) {
        ASSERT_EQ(rows[r].size(), TelemetryRecord::FIELD_COUNT);
        for (std::size_t i = TelemetryRecord::LEADING_FIELDS; i < rows[r].size(); ++i) {
            ASSERT_EQ(rows[r][i], std::string("0"));
        }
    }
}

TEST(storage_failure_backs_off) {
    ScratchDirectory scratch("loop_storage");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    h.context.config.run_duration = std::chrono::minutes(1);
    h.context.csv = std::make_unique<TelemetryCsv>(scratch.file("no_such_dir/telemetry.csv"));
    FakeClock* clock = h.clock;
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 12);
    ASSERT_EQ(counters.photos_captured, 12);
    ASSERT_EQ(counters.rows_written, 0);
    ASSERT_EQ(counters.failed_iterations, 12);
    ASSERT(allSleepsAre(*clock, 5));
}

TEST(slow_capture_never_ends_run_early) {
    ScratchDirectory scratch("loop_slow");
    LoopHarness h = makeHarness(scratch, dayStart(), 0.0, 0.0);
    FakeClock* clock = h.clock;
    h.camera->clock = clock;
    h.camera->capture_duration = std::chrono::milliseconds(2000);
    AcquisitionLoop loop(std::move(h.context));

    AcquisitionCounters counters = loop.run();
    ASSERT_EQ(counters.iterations, 1187);
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock->current - dayStart());
    ASSERT_EQ(elapsed.count(), 10683);
}

TEST(photos_are_tagged_and_numbered) {
    ScratchDirectory scratch("loop_tags");
    LoopHarness h = makeHarness(scratch, dayStart(), -23.43722222, -74.006);
    h.context.config.run_duration = std::chrono::minutes(1);
    FakeCamera* camera = h.camera;
    AcquisitionLoop loop(std::move(h.context));
    loop.run();

    ASSERT(!camera->captured_paths.empty());
    ASSERT_EQ(camera->captured_paths[0], scratch.file("image_000.jpg"));
    ASSERT_EQ(camera->captured_paths[1], scratch.file("image_001.jpg"));

    std::map<std::string, std::string> tags = camera->captured_tags[0];
    ASSERT_EQ(tags["GPS.GPSLatitude"], std::string("23/1,26/1,140/10"));
    ASSERT_EQ(tags["GPS.GPSLatitudeRef"], std::string("S"));
    ASSERT_EQ(tags["GPS.GPSLongitude"], std::string("74/1,0/1,216/10"));
    ASSERT_EQ(tags["GPS.GPSLongitudeRef"], std::string("W"));

    std::string log = readFile(loop.getContext().config.logPath());
    ASSERT(log.find("is at Longitude: -74.006000 Latitude: -23.437222") != std::string::npos);
    ASSERT(log.find("Capturing photo number 0") != std::string::npos);
    ASSERT(log.find("Successfully completed Space Kludgers job") != std::string::npos);
}

TEST(missing_collaborator_rejected) {
    MissionContext context;
    ASSERT_THROWS(AcquisitionLoop loop(std::move(context)), std::invalid_argument);
}

int main() {
    std::cout << "=== Acquisition Loop Tests ===" << std::endl;
    RUN_TEST(daylight_pass_uses_seven_second_cadence);
    RUN_TEST(night_pass_uses_twenty_second_cadence);
    RUN_TEST(propagation_failure_backs_off);
    RUN_TEST(classification_failure_backs_off);
    RUN_TEST(capture_failure_writes_row_then_backs_off);
    RUN_TEST(rejected_tags_still_capture_untagged);
    RUN_TEST(sensor_failure_writes_zero_rows);
    RUN_TEST(storage_failure_backs_off);
    RUN_TEST(slow_capture_never_ends_run_early);
    RUN_TEST(photos_are_tagged_and_numbered);
    RUN_TEST(missing_collaborator_rejected);
    return reportResults();
}
