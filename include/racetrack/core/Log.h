#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>

namespace racetrack::logsys {

void init(const std::optional<std::filesystem::path>& logFile); // console, plus file when given

} // namespace racetrack::logsys
