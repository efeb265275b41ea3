#include "log.hpp"

#include <mutex>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace canopy
{
    std::shared_ptr<spdlog::logger> logger()
    {
        static std::once_flag flag;

        std::call_once(flag, []
        {
            if (spdlog::get("canopy"))
            {
                return;
            }

            auto created = spdlog::stdout_color_mt("canopy");
            created->set_level(spdlog::level::info);

            spdlog::cfg::load_env_levels();
        });

        if (auto existing = spdlog::get("canopy"); existing)
        {
            return existing;
        }

        return spdlog::default_logger();
    }
} // namespace canopy
