#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

struct LogSettings {
    std::string level = "info";
    std::string file;   // optional, empty = stderr only
};

/// Build the process logger: colour stderr sink plus an optional file sink.
/// The logger is not registered with spdlog; callers pass it down explicitly.
std::shared_ptr<spdlog::logger> make_logger(const LogSettings& settings);

/// Logger that discards everything, for components constructed without one
std::shared_ptr<spdlog::logger> null_logger();
