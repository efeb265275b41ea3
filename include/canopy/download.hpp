#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>

namespace canopy
{
    struct download_request
    {
        std::string url;
        std::filesystem::path destination;
    };

    struct download_result
    {
        std::string url;
        std::optional<std::filesystem::path> path;

      public:
        bool success;
    };

    // Called before the transfer starts. The destination is prefilled with the engine's choice and may be replaced by
    // another absolute path. Returning false cancels the download.
    using download_handler = std::function<bool(download_request &)>;

    // Called once per download that was let through, `path` is only set on success
    using download_finished_handler = std::function<void(const download_result &)>;
} // namespace canopy
