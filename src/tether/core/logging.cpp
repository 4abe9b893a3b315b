#include <tether/core/logging.hpp>

#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tether {

void
initialize_logging(logging_config const& config)
{
    auto logger = spdlog::get("tether");
    if (!logger)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    *config.log_file, 262144, 2));
        }
        logger = std::make_shared<spdlog::logger>(
            "tether", begin(sinks), end(sinks));
        spdlog::register_logger(logger);
    }
    logger->set_level(config.level);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("tether");
    if (!logger)
    {
        initialize_logging(logging_config());
        logger = spdlog::get("tether");
    }
    return logger;
}

} // namespace tether
