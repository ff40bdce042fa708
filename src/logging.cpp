#include "navis/logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace navis
{

    Result<void> configure_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off")
        {
            return std::unexpected(NavisError::config("Unknown log level: " + cfg.level));
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!cfg.file.empty())
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
            }
            catch (const spdlog::spdlog_ex &e)
            {
                return std::unexpected(NavisError::io(std::string("Unable to open log file: ") + e.what()));
            }
        }

        auto logger = std::make_shared<spdlog::logger>("navis", sinks.begin(), sinks.end());
        logger->set_level(level);
        spdlog::set_default_logger(logger);
        spdlog::set_level(level);
        return {};
    }

} // namespace navis
