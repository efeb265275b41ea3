#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace canopy
{
    // The "canopy" logger. A logger the host registered under that name takes precedence.
    std::shared_ptr<spdlog::logger> logger();
} // namespace canopy
