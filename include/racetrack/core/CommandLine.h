#pragma once

#include "racetrack/core/Application.h"

#include <string>
#include <string_view>
#include <vector>

namespace racetrack::core {

struct CommandLineArgs {
    AppConfig config{};
    bool showHelp{false};
    std::vector<std::string> unknown{};
    std::vector<std::string> errors{};

    bool ok() const { return unknown.empty() && errors.empty(); }
};

// argv[0] is the program name and is skipped. Accepts "--opt value" and
// "--opt=value".
CommandLineArgs ParseCommandLine(const std::vector<std::string_view>& argv, AppConfig defaults = {});

std::string Usage(std::string_view program);

} // namespace racetrack::core
