#ifndef IIO_DEVICE_H
#define IIO_DEVICE_H

#include <string>
#include "Vector3.h"

/**
 * One Linux Industrial I/O device under /sys/bus/iio/devices.
 * Channel values are (raw + offset) * scale in the driver's units.
 */
class IioDevice {
private:
    std::string device_path;
    std::string device_name;

    bool readAttribute(const std::string& attribute, double& value) const;

public:
    IioDevice() = default;
    IioDevice(const std::string& device_path, const std::string& device_name);

    // Scan root for a device whose name file matches; throws SensorUnavailableError
    static IioDevice find(const std::string& iio_root, const std::string& name);

    // Throws SensorReadError when the raw value is missing or unreadable
    double readChannel(const std::string& channel) const;
    // in_<type>_x/_y/_z
    Vector3 readAxes(const std::string& channel_type) const;

    const std::string& path() const { return device_path; }
    const std::string& name() const { return device_name; }
};

#endif // IIO_DEVICE_H
