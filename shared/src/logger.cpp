#include "filedepot/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace filedepot
{

    Logger make_logger(const LogConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.console)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (config.file)
        {
            if (config.file->has_parent_path())
            {
                std::filesystem::create_directories(config.file->parent_path());
            }
            if (config.rotate)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file->string(), kLogRotateBytes, kLogRotateFiles));
            }
            else
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string(), false));
            }
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        return Logger(std::move(logger));
    }

} // namespace filedepot
