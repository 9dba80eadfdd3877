#include "racetrack/core/Application.h"
#include "racetrack/core/CommandLine.h"
#include "racetrack/core/Log.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string_view>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string_view> args(argv, argv + argc);
    const auto parsed = racetrack::core::ParseCommandLine(args);
    const std::string_view program = argc > 0 ? argv[0] : "racetrack_editor";

    if (parsed.showHelp) {
        std::cout << racetrack::core::Usage(program);
        return 0;
    }
    if (!parsed.ok()) {
        for (const auto& option : parsed.unknown) {
            std::cerr << "unknown option: " << option << "\n";
        }
        for (const auto& error : parsed.errors) {
            std::cerr << error << "\n";
        }
        std::cerr << racetrack::core::Usage(program);
        return 2;
    }

    try {
        racetrack::logsys::init(parsed.config.logFile);
        racetrack::core::Application app{parsed.config};
        app.run();
    } catch (const std::exception& error) {
        spdlog::critical("Fatal: {}", error.what());
        return 1;
    }
    return 0;
}
