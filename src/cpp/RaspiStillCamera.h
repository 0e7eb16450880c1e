#ifndef RASPI_STILL_CAMERA_H
#define RASPI_STILL_CAMERA_H

#include <map>
#include <string>
#include <vector>
#include "Camera.h"

/**
 * Camera driven through the raspistill command line tool, falling back
 * to libcamera-still when the legacy camera stack is not configured.
 */
class RaspiStillCamera : public Camera {
private:
    int width;
    int height;
    std::string program;
    std::string fallback_program;
    bool use_fallback = false;
    std::map<std::string, std::string> exif_tags;

    std::vector<std::string> buildCommand(const std::string& program_name, const std::string& path, int jpeg_quality) const;
    // Exit status of the child, or -1 when it could not be started
    int runCommand(const std::vector<std::string>& command) const;

public:
    // Throws CameraUnavailableError when neither program is on PATH
    RaspiStillCamera(int width, int height,
                     const std::string& program = "raspistill",
                     const std::string& fallback_program = "libcamera-still");

    void setExifTag(const std::string& key, const std::string& value) override;
    void clearExifTags() override;
    void capture(const std::string& path, int jpeg_quality) override;

    const std::string& activeProgram() const { return use_fallback ? fallback_program : program; }

    static bool isOnPath(const std::string& program_name);
};

#endif // RASPI_STILL_CAMERA_H
