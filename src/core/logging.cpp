#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

std::shared_ptr<spdlog::logger> make_logger(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    console->set_pattern("%^[%l]%$ %v");
    sinks.push_back(console);

    std::string file_error;
    if (!settings.file.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("awsvpnctl", sinks.begin(), sinks.end());

    auto level = spdlog::level::from_str(settings.level);
    // from_str maps unknown names to off; only honour it when asked for
    if (level == spdlog::level::off && settings.level != "off") {
        level = spdlog::level::info;
        logger->set_level(level);
        logger->warn("Unknown log level '{}', using info", settings.level);
    } else {
        logger->set_level(level);
    }

    if (!file_error.empty()) {
        logger->warn("Cannot open log file {}: {}", settings.file, file_error);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> null_logger() {
    return std::make_shared<spdlog::logger>(
        "null", std::make_shared<spdlog::sinks::null_sink_mt>());
}
