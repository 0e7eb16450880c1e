#include "IioDevice.h"
#include "MissionErrors.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

IioDevice::IioDevice(const std::string& device_path, const std::string& device_name)
    : device_path(device_path), device_name(device_name) {
}

IioDevice IioDevice::find(const std::string& iio_root, const std::string& name) {
    std::error_code ec;
    fs::directory_iterator it(iio_root, ec);
    if (ec) {
        throw SensorUnavailableError("cannot list " + iio_root + ": " + ec.message());
    }
    for (const auto& entry : it) {
        std::ifstream name_file(entry.path() / "name");
        std::string device_name;
        if (name_file && std::getline(name_file, device_name) && device_name == name) {
            return IioDevice(entry.path().string(), device_name);
        }
    }
    throw SensorUnavailableError("no IIO device named " + name + " under " + iio_root);
}

bool IioDevice::readAttribute(const std::string& attribute, double& value) const {
    std::ifstream file(device_path + "/" + attribute);
    if (!file) {
        return false;
    }
    file >> value;
    return !file.fail();
}

double IioDevice::readChannel(const std::string& channel) const {
    double raw = 0.0;
    if (!readAttribute("in_" + channel + "_raw", raw)) {
        throw SensorReadError(device_name + ": cannot read in_" + channel + "_raw");
    }

    // Axis channels share in_<type>_scale, e.g. in_accel_scale for in_accel_x
    std::string shared = channel;
    std::size_t axis = channel.find_last_of('_');
    if (axis != std::string::npos) {
        shared = channel.substr(0, axis);
    }

    double scale = 1.0;
    if (!readAttribute("in_" + channel + "_scale", scale) &&
        !readAttribute("in_" + shared + "_scale", scale)) {
        scale = 1.0;
    }
    double offset = 0.0;
    if (!readAttribute("in_" + channel + "_offset", offset) &&
        !readAttribute("in_" + shared + "_offset", offset)) {
        offset = 0.0;
    }
    return (raw + offset) * scale;
}

Vector3 IioDevice::readAxes(const std::string& channel_type) const {
    return Vector3(readChannel(channel_type + "_x"),
                   readChannel(channel_type + "_y"),
                   readChannel(channel_type + "_z"));
}
