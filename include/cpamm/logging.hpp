#ifndef CPAMM_LOGGING_HPP
#define CPAMM_LOGGING_HPP

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cpamm {
namespace logging {

constexpr const char* LOGGER_NAME = "cpamm";

// trace|debug|info|warn|error|off; anything else maps to info
spdlog::level::level_enum parse_level(std::string_view name);

// (Re)creates the "cpamm" logger on a colored stdout sink
void setup(std::string_view level);

// The "cpamm" logger, created at info level on first use
std::shared_ptr<spdlog::logger> get();

} // namespace logging
} // namespace cpamm

#endif // CPAMM_LOGGING_HPP
