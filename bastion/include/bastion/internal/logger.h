/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace bastion
{
    // returns the process wide "bastion" logger, creating a colour console logger on first use
    std::shared_ptr<spdlog::logger> get_logger();

    // replace the logger used by every BASTION_* macro, nullptr restores the default
    void set_logger(std::shared_ptr<spdlog::logger> logger);
}

#define BASTION_DEBUG(...) ::bastion::get_logger()->debug(__VA_ARGS__)
#define BASTION_TRACE(...) ::bastion::get_logger()->trace(__VA_ARGS__)
#define BASTION_INFO(...) ::bastion::get_logger()->info(__VA_ARGS__)
#define BASTION_WARNING(...) ::bastion::get_logger()->warn(__VA_ARGS__)
#define BASTION_ERROR(...) ::bastion::get_logger()->error(__VA_ARGS__)
#define BASTION_CRITICAL(...) ::bastion::get_logger()->critical(__VA_ARGS__)
