#include "drop.impl.hpp"

#include <canopy/url.hpp>

#include <ranges>
#include <algorithm>

namespace canopy::drop
{
    std::optional<std::filesystem::path> from_uri(std::string_view value)
    {
        static constexpr std::string_view prefix = "file://";

        if (value.size() < prefix.size() || uri::lower(value.substr(0, prefix.size())) != prefix)
        {
            return std::nullopt;
        }

        auto rest = value.substr(prefix.size());

        // Only local files, "file://localhost/..." is accepted as well
        if (!rest.starts_with('/'))
        {
            const auto slash = rest.find('/');

            if (slash == std::string_view::npos || uri::lower(rest.substr(0, slash)) != "localhost")
            {
                return std::nullopt;
            }

            rest = rest.substr(slash);
        }

        auto path = std::filesystem::path{uri::decode(rest)};

#ifdef _WIN32
        // "file:///C:/dir" decodes to "/C:/dir"
        if (auto native = path.generic_string(); native.size() > 2 && native[0] == '/' && native[2] == ':')
        {
            path = std::filesystem::path{native.substr(1)}.make_preferred();
        }
#endif

        return path;
    }

    std::vector<std::filesystem::path> parse_uri_list(std::string_view list)
    {
        std::vector<std::filesystem::path> rtn;

        for (const auto line : std::views::split(list, '\n'))
        {
            auto entry = std::string_view{line.begin(), line.end()};

            while (!entry.empty() && (entry.back() == '\r' || entry.back() == ' '))
            {
                entry.remove_suffix(1);
            }

            if (entry.empty() || entry.starts_with('#'))
            {
                continue;
            }

            if (auto path = from_uri(entry); path)
            {
                rtn.emplace_back(std::move(path.value()));
            }
        }

        return normalize(std::move(rtn));
    }

    std::vector<std::filesystem::path> normalize(std::vector<std::filesystem::path> paths)
    {
        std::erase_if(paths, [](const auto &path) { return path.empty() || !path.is_absolute(); });

        for (auto &path : paths)
        {
            path = path.lexically_normal();
        }

        return paths;
    }
} // namespace canopy::drop
