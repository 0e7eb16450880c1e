#ifndef TELEMETRY_QUICKLOOK_HPP
#define TELEMETRY_QUICKLOOK_HPP

#include <chrono>
#include <string>
#include "QuicklookSeries.h"

/**
 * Telemetry quicklook viewer
 * Desktop plots of a Space Kludgers CSV log: ground track, environment,
 * attitude, raw IMU and photo storage against the budget. In follow mode
 * the file is re-read while the acquisition loop is still writing it.
 */
class TelemetryQuicklook {
public:
    explicit TelemetryQuicklook(const std::string& csv_path);
    ~TelemetryQuicklook();

    bool Initialize();
    void Run();
    void Shutdown();

    bool ReloadTelemetry();

private:
    void RenderMenuBar();
    void RenderControlPanel();
    void RenderGroundTrack();
    void RenderEnvironmentPlots();
    void RenderOrientationPlot();
    void RenderImuPlots();
    void RenderStorageBudget();

    void PlotSeries(const char* label, const std::vector<float>& x, const std::vector<float>& y);

    struct ViewerConfig {
        float reload_interval_s = 5.0f;
        bool follow_file = true;
    } config;

    std::string csv_path;
    QuicklookSeries series;
    std::string load_status;
    std::chrono::steady_clock::time_point last_reload;
    bool initialized = false;

    // GUI state
    bool show_control_panel = true;
    bool show_ground_track = true;
    bool show_environment = true;
    bool show_orientation = true;
    bool show_imu = true;
    bool show_storage = true;
};

#endif // TELEMETRY_QUICKLOOK_HPP
