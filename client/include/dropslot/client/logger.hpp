#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace dropslot::client
{

    /// Optional activity log of the client. Without a path every record is discarded.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        bool enabled() const noexcept { return logger_ != nullptr; }

        template <typename... Args>
        void info(std::string_view area, Args &&...args)
        {
            write(spdlog::level::info, area, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(std::string_view area, Args &&...args)
        {
            write(spdlog::level::warn, area, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(std::string_view area, Args &&...args)
        {
            write(spdlog::level::err, area, std::forward<Args>(args)...);
        }

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, std::string_view area, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer message;
            (spdlog::fmt_lib::format_to(std::back_inserter(message), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "{:<8} {}", area, std::string_view(message.data(), message.size()));
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace dropslot::client
