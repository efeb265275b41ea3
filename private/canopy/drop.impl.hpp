#pragma once

#include <canopy/drop.hpp>

#include <vector>
#include <optional>
#include <filesystem>
#include <string_view>

namespace canopy::drop
{
    [[nodiscard]] std::optional<std::filesystem::path> from_uri(std::string_view uri);
    [[nodiscard]] std::vector<std::filesystem::path> parse_uri_list(std::string_view list);

    // Keeps absolute paths in their original order
    [[nodiscard]] std::vector<std::filesystem::path> normalize(std::vector<std::filesystem::path> paths);
} // namespace canopy::drop
