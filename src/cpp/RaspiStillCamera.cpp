#include "RaspiStillCamera.h"
#include "MissionErrors.h"

#include <cstdlib>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sysexits.h>
#include <unistd.h>

namespace {

constexpr const char* CAPTURE_TIMEOUT_MS = "500";

bool fileHasContent(const std::string& path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && info.st_size > 0;
}

} // namespace

RaspiStillCamera::RaspiStillCamera(int width, int height, const std::string& program, const std::string& fallback_program)
    : width(width), height(height), program(program), fallback_program(fallback_program) {
    if (!isOnPath(program)) {
        if (fallback_program.empty() || !isOnPath(fallback_program)) {
            throw CameraUnavailableError("neither " + program + " nor " + fallback_program + " found on PATH");
        }
        use_fallback = true;
    }
}

bool RaspiStillCamera::isOnPath(const std::string& program_name) {
    if (program_name.find('/') != std::string::npos) {
        return access(program_name.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + program_name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

void RaspiStillCamera::setExifTag(const std::string& key, const std::string& value) {
    exif_tags[key] = value;
}

void RaspiStillCamera::clearExifTags() {
    exif_tags.clear();
}

std::vector<std::string> RaspiStillCamera::buildCommand(const std::string& program_name, const std::string& path, int jpeg_quality) const {
    std::vector<std::string> command;
    command.push_back(program_name);
    command.push_back("--nopreview");
    command.push_back("--width"); command.push_back(std::to_string(width));
    command.push_back("--height"); command.push_back(std::to_string(height));
    command.push_back("--quality"); command.push_back(std::to_string(jpeg_quality));
    command.push_back("--encoding"); command.push_back("jpg");
    command.push_back("--timeout"); command.push_back(CAPTURE_TIMEOUT_MS);
    command.push_back("--output"); command.push_back(path);
    for (const auto& tag : exif_tags) {
        command.push_back("--exif");
        command.push_back(tag.first + "=" + tag.second);
    }
    if (program_name == fallback_program) {
        command.push_back("--verbose"); command.push_back("0");
    }
    return command;
}

int RaspiStillCamera::runCommand(const std::vector<std::string>& command) const {
    std::vector<char*> args;
    for (const auto& arg : command) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        // Child: replace with the camera program
        execvp(args[0], &args[0]);
        _exit(EXIT_FAILURE);
    }
    if (pid < 0) {
        return -1;
    }
    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        return -1;
    }
    if (!WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

void RaspiStillCamera::capture(const std::string& path, int jpeg_quality) {
    int status = runCommand(buildCommand(activeProgram(), path, jpeg_quality));

    // raspistill exits with EX_SOFTWARE (or 255) when the legacy stack is disabled
    if (!use_fallback && (status == EXIT_FAILURE || status == EX_SOFTWARE || status == 255) &&
        !fallback_program.empty() && isOnPath(fallback_program)) {
        use_fallback = true;
        status = runCommand(buildCommand(fallback_program, path, jpeg_quality));
    }

    if (status != 0) {
        std::ostringstream msg;
        msg << activeProgram() << " exited with status " << status << " writing " << path;
        throw CaptureError(msg.str());
    }
    if (!fileHasContent(path)) {
        throw CaptureError(activeProgram() + " reported success but " + path + " is empty");
    }
}
