#include "telemetry_quicklook.hpp"
#include "CapturePolicy.h"

// ImGui includes
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include "implot.h"

// OpenGL and GLFW
#include <GL/glew.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>

static GLFWwindow* g_window = nullptr;

TelemetryQuicklook::TelemetryQuicklook(const std::string& csv_path) : csv_path(csv_path) {
}

TelemetryQuicklook::~TelemetryQuicklook() {
    Shutdown();
}

bool TelemetryQuicklook::Initialize() {
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW!" << std::endl;
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    g_window = glfwCreateWindow(1600, 1000, "Space Kludgers Telemetry Quicklook", nullptr, nullptr);
    if (!g_window) {
        std::cerr << "Failed to create GLFW window!" << std::endl;
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(g_window);
    glfwSwapInterval(1);

    if (glewInit() != GLEW_OK) {
        std::cerr << "Failed to initialize GLEW!" << std::endl;
        glfwDestroyWindow(g_window);
        g_window = nullptr;
        glfwTerminate();
        return false;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(g_window, true);
    ImGui_ImplOpenGL3_Init("#version 330");
    initialized = true;

    ReloadTelemetry();
    std::cout << "Quicklook initialized, " << load_status << std::endl;
    return true;
}

bool TelemetryQuicklook::ReloadTelemetry() {
    last_reload = std::chrono::steady_clock::now();
    try {
        series = QuicklookSeries::fromFile(csv_path);
    } catch (const std::exception& e) {
        load_status = e.what();
        return false;
    }
    load_status = std::to_string(series.rows) + " rows loaded from " + csv_path;
    return true;
}

void TelemetryQuicklook::Run() {
    while (!glfwWindowShouldClose(g_window)) {
        glfwPollEvents();

        if (config.follow_file) {
            auto elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - last_reload).count();
            if (elapsed >= config.reload_interval_s) {
                ReloadTelemetry();
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        RenderMenuBar();
        if (show_control_panel) RenderControlPanel();
        if (show_ground_track) RenderGroundTrack();
        if (show_environment) RenderEnvironmentPlots();
        if (show_orientation) RenderOrientationPlot();
        if (show_imu) RenderImuPlots();
        if (show_storage) RenderStorageBudget();

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(g_window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(g_window);
    }
}

void TelemetryQuicklook::Shutdown() {
    if (initialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        initialized = false;
    }
    if (g_window) {
        glfwDestroyWindow(g_window);
        g_window = nullptr;
        glfwTerminate();
    }
}

void TelemetryQuicklook::RenderMenuBar() {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Reload", "F5")) {
                ReloadTelemetry();
            }
            ImGui::MenuItem("Follow File", nullptr, &config.follow_file);
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("View")) {
            ImGui::MenuItem("Control Panel", nullptr, &show_control_panel);
            ImGui::MenuItem("Ground Track", nullptr, &show_ground_track);
            ImGui::MenuItem("Environment", nullptr, &show_environment);
            ImGui::MenuItem("Orientation", nullptr, &show_orientation);
            ImGui::MenuItem("Raw IMU", nullptr, &show_imu);
            ImGui::MenuItem("Storage Budget", nullptr, &show_storage);
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }
    if (ImGui::IsKeyPressed(ImGuiKey_F5)) {
        ReloadTelemetry();
    }
}

void TelemetryQuicklook::RenderControlPanel() {
    ImGui::SetNextWindowPos(ImVec2(10, 30), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(380, 220), ImGuiCond_FirstUseEver);
    ImGui::Begin("Control Panel", &show_control_panel);

    ImGui::TextWrapped("File: %s", csv_path.c_str());
    ImGui::TextWrapped("%s", load_status.c_str());
    ImGui::Separator();
    ImGui::Text("Rows: %d", series.rows);
    ImGui::Text("Last photo number: %d", series.last_photo_number);
    ImGui::Text("Elapsed: %.1f min", series.elapsed_minutes);
    ImGui::Text("Sensor dropouts: %d", series.sensor_dropouts);
    if (series.malformed_rows > 0) {
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "Malformed rows: %d", series.malformed_rows);
    }
    ImGui::Separator();
    if (ImGui::Button("Reload")) {
        ReloadTelemetry();
    }
    ImGui::SameLine();
    ImGui::Checkbox("Follow", &config.follow_file);
    ImGui::SliderFloat("Interval (s)", &config.reload_interval_s, 1.0f, 30.0f);

    ImGui::End();
}

void TelemetryQuicklook::PlotSeries(const char* label, const std::vector<float>& x, const std::vector<float>& y) {
    int count = static_cast<int>(std::min(x.size(), y.size()));
    if (count > 0) {
        ImPlot::PlotLine(label, x.data(), y.data(), count);
    }
}

void TelemetryQuicklook::RenderGroundTrack() {
    ImGui::SetNextWindowPos(ImVec2(400, 30), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(700, 420), ImGuiCond_FirstUseEver);
    ImGui::Begin("Ground Track", &show_ground_track);

    if (ImPlot::BeginPlot("Sub-point", ImVec2(-1, -1))) {
        ImPlot::SetupAxes("Longitude (deg)", "Latitude (deg)");
        ImPlot::SetupAxesLimits(-180.0, 180.0, -90.0, 90.0, ImPlotCond_Always);
        if (!series.day_longitude.empty()) {
            ImPlot::PushStyleColor(ImPlotCol_MarkerFill, ImVec4(1.0f, 0.85f, 0.3f, 1.0f));
            ImPlot::PlotScatter("Day", series.day_longitude.data(), series.day_latitude.data(),
                                static_cast<int>(series.day_longitude.size()));
            ImPlot::PopStyleColor();
        }
        if (!series.night_longitude.empty()) {
            ImPlot::PushStyleColor(ImPlotCol_MarkerFill, ImVec4(0.3f, 0.5f, 1.0f, 1.0f));
            ImPlot::PlotScatter("Night", series.night_longitude.data(), series.night_latitude.data(),
                                static_cast<int>(series.night_longitude.size()));
            ImPlot::PopStyleColor();
        }
        ImPlot::EndPlot();
    }
    ImGui::End();
}

void TelemetryQuicklook::RenderEnvironmentPlots() {
    ImGui::SetNextWindowPos(ImVec2(10, 460), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(520, 520), ImGuiCond_FirstUseEver);
    ImGui::Begin("Environment", &show_environment);

    if (ImPlot::BeginPlot("Temperature", ImVec2(-1, 150))) {
        ImPlot::SetupAxes("Time (min)", "deg C", ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        PlotSeries("Temperature", series.sensor_minutes, series.temperature);
        ImPlot::EndPlot();
    }
    if (ImPlot::BeginPlot("Humidity", ImVec2(-1, 150))) {
        ImPlot::SetupAxes("Time (min)", "%", ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        PlotSeries("Humidity", series.sensor_minutes, series.humidity);
        ImPlot::EndPlot();
    }
    if (ImPlot::BeginPlot("Pressure", ImVec2(-1, 150))) {
        ImPlot::SetupAxes("Time (min)", "mbar", ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        PlotSeries("Pressure", series.sensor_minutes, series.pressure);
        ImPlot::EndPlot();
    }
    ImGui::End();
}

void TelemetryQuicklook::RenderOrientationPlot() {
    ImGui::SetNextWindowPos(ImVec2(540, 460), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(560, 260), ImGuiCond_FirstUseEver);
    ImGui::Begin("Orientation", &show_orientation);

    if (ImPlot::BeginPlot("Fused Orientation", ImVec2(-1, -1))) {
        ImPlot::SetupAxes("Time (min)", "deg", ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_None);
        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 360.0, ImPlotCond_Once);
        PlotSeries("Roll", series.sensor_minutes, series.roll_deg);
        PlotSeries("Pitch", series.sensor_minutes, series.pitch_deg);
        PlotSeries("Yaw", series.sensor_minutes, series.yaw_deg);
        ImPlot::EndPlot();
    }
    ImGui::End();
}

void TelemetryQuicklook::RenderImuPlots() {
    ImGui::SetNextWindowPos(ImVec2(540, 730), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(560, 260), ImGuiCond_FirstUseEver);
    ImGui::Begin("Raw IMU", &show_imu);

    if (ImPlot::BeginPlot("Magnitudes", ImVec2(-1, -1))) {
        ImPlot::SetupAxes("Time (min)", "g, rad/s", ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        ImPlot::SetupAxis(ImAxis_Y2, "uT", ImPlotAxisFlags_AuxDefault | ImPlotAxisFlags_AutoFit);
        PlotSeries("Accelerometer (g)", series.sensor_minutes, series.accel_magnitude);
        PlotSeries("Gyroscope (rad/s)", series.sensor_minutes, series.gyro_magnitude);
        ImPlot::SetAxes(ImAxis_X1, ImAxis_Y2);
        PlotSeries("Compass (uT)", series.sensor_minutes, series.compass_magnitude);
        ImPlot::EndPlot();
    }
    ImGui::End();
}

void TelemetryQuicklook::RenderStorageBudget() {
    ImGui::SetNextWindowPos(ImVec2(1110, 30), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(380, 220), ImGuiCond_FirstUseEver);
    ImGui::Begin("Storage Budget", &show_storage);

    ImGui::Text("Day photos:   %d x %lld KB", series.day_photos, CapturePolicy::DAY_PHOTO_KB);
    ImGui::Text("Night photos: %d x %lld KB", series.night_photos, CapturePolicy::NIGHT_PHOTO_KB);
    ImGui::Separator();

    double fraction = static_cast<double>(series.estimated_volume_kb) / CapturePolicy::STORAGE_BUDGET_KB;
    char overlay[64];
    std::snprintf(overlay, sizeof(overlay), "%lld / %lld KB", series.estimated_volume_kb, CapturePolicy::STORAGE_BUDGET_KB);
    if (fraction > 1.0) {
        ImGui::PushStyleColor(ImGuiCol_PlotHistogram, ImVec4(1.0f, 0.3f, 0.3f, 1.0f));
        ImGui::ProgressBar(1.0f, ImVec2(-1, 0), overlay);
        ImGui::PopStyleColor();
    } else {
        ImGui::ProgressBar(static_cast<float>(fraction), ImVec2(-1, 0), overlay);
    }

    StorageProjection projection = CapturePolicy::project(std::chrono::minutes(178));
    ImGui::Text("Planned: %d day + %d night = %lld KB", projection.day_photos,
                projection.night_photos, projection.volume_kb);
    ImGui::End();
}
