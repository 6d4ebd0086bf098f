#include "dropslot/client/logger.hpp"

#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>

namespace dropslot::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("dropslot_client", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Logging disabled, cannot open " << path->string() << ": " << ex.what() << std::endl;
        }
    }

} // namespace dropslot::client
