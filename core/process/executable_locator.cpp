#include "executable_locator.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "logging/logger.hpp"

#ifndef _WIN32
#include <unistd.h>
#endif

namespace guidelink {
namespace process {

namespace {

#ifdef _WIN32
constexpr char kPathSeparator = ';';
#else
constexpr char kPathSeparator = ':';
#endif

bool is_executable_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

}  // namespace

std::vector<std::string> default_executable_locations() {
#if defined(_WIN32)
    return {"C:\\Program Files (x86)\\PHDGuiding2\\phd2.exe", "C:\\Program Files\\PHDGuiding2\\phd2.exe"};
#elif defined(__APPLE__)
    return {"/Applications/PHD2.app/Contents/MacOS/PHD2"};
#else
    return {"/usr/bin/phd2", "/usr/local/bin/phd2"};
#endif
}

const char *default_executable_name() {
#ifdef _WIN32
    return "phd2.exe";
#else
    return "phd2";
#endif
}

std::optional<std::string> find_on_path(const std::string &name) {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, kPathSeparator)) {
        if (dir.empty()) {
            continue;
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::optional<std::string> locate_executable(const std::optional<std::string> &override_path, std::string &error) {
    if (override_path && !override_path->empty()) {
        if (is_executable_file(*override_path)) {
            return *override_path;
        }
        error = "PHD2 executable not found: " + *override_path;
        return std::nullopt;
    }

    for (const auto &location : default_executable_locations()) {
        if (is_executable_file(location)) {
            LOG_DEBUG("[Process] Found PHD2 at " << location);
            return location;
        }
    }

#ifndef __APPLE__
    auto on_path = find_on_path(default_executable_name());
    if (on_path) {
        LOG_DEBUG("[Process] Found PHD2 on PATH at " << *on_path);
        return on_path;
    }
#endif

    error = "PHD2 executable not found in default locations or PATH";
    return std::nullopt;
}

}  // namespace process
}  // namespace guidelink
