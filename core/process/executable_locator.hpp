#pragma once

#include <optional>
#include <string>
#include <vector>

namespace guidelink {
namespace process {

// Well-known install locations of PHD2 for the current platform, in search order
std::vector<std::string> default_executable_locations();

// Executable file name searched on PATH ("phd2" / "phd2.exe")
const char *default_executable_name();

// Search the PATH environment variable for an executable file named `name`
std::optional<std::string> find_on_path(const std::string &name);

// An override must exist as given; otherwise the defaults and PATH are searched.
// Returns nullopt (with `error` set) if nothing usable is found.
std::optional<std::string> locate_executable(const std::optional<std::string> &override_path, std::string &error);

}  // namespace process
}  // namespace guidelink
