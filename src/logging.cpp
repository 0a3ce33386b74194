// =============================================================================
// logging.cpp - spdlog logger setup
// =============================================================================

#include "cpamm/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cpamm {
namespace logging {

namespace {

std::mutex setup_mutex;

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void setup(std::string_view level) {
    std::lock_guard<std::mutex> lock(setup_mutex);
    spdlog::drop(LOGGER_NAME);
    auto logger = make_logger(parse_level(level));
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> get() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (logger) return logger;

    std::lock_guard<std::mutex> lock(setup_mutex);
    logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = make_logger(spdlog::level::info);
        spdlog::register_logger(logger);
    }
    return logger;
}

} // namespace logging
} // namespace cpamm
