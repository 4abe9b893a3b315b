#ifndef TETHER_CORE_LOGGING_HPP
#define TETHER_CORE_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include <tether/core/type_definitions.hpp>

namespace tether {

struct logging_config
{
    // If this is set, log messages are also written to a rotating log file at
    // this path.
    optional<string> log_file;

    // the minimum level of messages that are actually emitted
    spdlog::level::level_enum level = spdlog::level::info;
};

// Create and register the "tether" logger.
// If the logger has already been registered, this only updates its level.
void
initialize_logging(logging_config const& config);

// Get the "tether" logger.
// If nobody has called initialize_logging(), this registers a logger that
// writes to stdout with the default config.
std::shared_ptr<spdlog::logger>
get_logger();

} // namespace tether

#endif
