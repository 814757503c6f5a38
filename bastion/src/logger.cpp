/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <bastion/internal/logger.h>

namespace bastion
{
    namespace
    {
        std::mutex logger_mtx;
        std::shared_ptr<spdlog::logger> current_logger;

        std::shared_ptr<spdlog::logger> make_default_logger()
        {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            auto logger = std::make_shared<spdlog::logger>("bastion", console_sink);
            logger->set_level(spdlog::level::info);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
            return logger;
        }
    }

    std::shared_ptr<spdlog::logger> get_logger()
    {
        std::scoped_lock lock(logger_mtx);
        if (!current_logger)
            current_logger = make_default_logger();
        return current_logger;
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger)
    {
        std::scoped_lock lock(logger_mtx);
        current_logger = std::move(logger);
    }
}
