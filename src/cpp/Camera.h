#ifndef CAMERA_H
#define CAMERA_H

#include <string>

/**
 * Still camera with pending EXIF tags applied to the next capture.
 * capture() throws CaptureError when no JPEG was written.
 */
class Camera {
public:
    virtual ~Camera() = default;

    virtual void setExifTag(const std::string& key, const std::string& value) = 0;
    virtual void clearExifTags() = 0;
    virtual void capture(const std::string& path, int jpeg_quality) = 0;
};

#endif // CAMERA_H
