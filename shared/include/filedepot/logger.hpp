/**
 * FileDepot - Component-tagged logging over spdlog.
 *
 * A Logger is a cheap handle around a shared spdlog logger. Sessions receive
 * one by injection and tag every line with the component that wrote it.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace filedepot
{

    inline constexpr std::size_t kLogRotateBytes = 5 * 1024 * 1024;
    inline constexpr std::size_t kLogRotateFiles = 5;

    struct LogConfig
    {
        std::string name{"filedepot"};
        bool console{false};
        std::optional<std::filesystem::path> file;
        // Rotate the file sink at kLogRotateBytes, keeping kLogRotateFiles backups.
        bool rotate{false};
        bool verbose{false};
    };

    class Logger
    {
    public:
        // Discards everything.
        Logger() = default;

        explicit Logger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

        template <typename... Args>
        void log(spdlog::level::level_enum level, std::string_view component, Args &&...args) const
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}", component, std::string_view(buf.data(), buf.size()));
        }

        template <typename... Args>
        void info(std::string_view component, Args &&...args) const
        {
            log(spdlog::level::info, component, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(std::string_view component, Args &&...args) const
        {
            log(spdlog::level::warn, component, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(std::string_view component, Args &&...args) const
        {
            log(spdlog::level::err, component, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void debug(std::string_view component, Args &&...args) const
        {
            log(spdlog::level::debug, component, std::forward<Args>(args)...);
        }

        void flush() const
        {
            if (logger_)
            {
                logger_->flush();
            }
        }

        const std::shared_ptr<spdlog::logger> &handle() const noexcept { return logger_; }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

    // Console and file sinks as requested; a null sink when neither is.
    Logger make_logger(const LogConfig &config);

} // namespace filedepot
