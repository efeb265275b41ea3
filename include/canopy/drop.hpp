#pragma once

#include <vector>
#include <cstdint>
#include <optional>
#include <functional>
#include <filesystem>

namespace canopy
{
    struct point
    {
        double x;
        double y;
    };

    enum class drop_kind : std::uint8_t
    {
        hovered,
        dropped,
        cancelled,
    };

    struct drop_event
    {
        drop_kind kind;
        std::vector<std::filesystem::path> paths;

      public:
        // Only present if the engine reports where the drop happened
        std::optional<point> position;
    };

    // Returning true consumes the event, the engine will not perform its default drop behavior.
    using drop_handler = std::function<bool(const drop_event &)>;
} // namespace canopy
