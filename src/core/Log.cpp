#include "racetrack/core/Log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace racetrack::logsys {

void init(const std::optional<std::filesystem::path>& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (logFile) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile->string(), true));
    }
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("racetrack", sinks.begin(), sinks.end()));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::info("Logging started");
}

} // namespace racetrack::logsys
