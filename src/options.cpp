#include "validate.hpp"

#include "log.hpp"

#include <array>
#include <format>
#include <algorithm>

namespace canopy
{
    static constexpr auto reserved = std::to_array<std::string_view>({
        "http",
        "https",
        "file",
        "data",
        "about",
        "blob",
        "javascript",
        "ws",
        "wss",
        "ftp",
    });

    bool reserved_scheme(std::string_view name)
    {
        return std::ranges::find(reserved, uri::lower(name)) != reserved.end();
    }

    result<std::string> validate_scheme(std::string_view name)
    {
        if (!uri::valid_scheme(name))
        {
            return unexpected{error::configuration(std::format("\"{}\" is not a valid scheme name", name))};
        }

        auto normalized = uri::lower(name);

        if (reserved_scheme(normalized))
        {
            return unexpected{error::configuration(std::format("scheme \"{}\" is handled by the engine and cannot be claimed", normalized))};
        }

        return normalized;
    }

    result<> validate_url(std::string_view value)
    {
        auto parsed = url::parse(value);

        if (!parsed)
        {
            return unexpected{parsed.error()};
        }

        if (!parsed->opaque() || !parsed->path().empty())
        {
            return {};
        }

        return unexpected{error::configuration(std::format("\"{}\" is not an absolute url", value))};
    }

    result<> validate_headers(const headers &values)
    {
        static constexpr std::string_view separators = "()<>@,;:\\\"/[]?={} \t";

        auto token = [](std::string_view name)
        {
            return !name.empty() && std::ranges::all_of(name, [](char c)
            {
                const auto value = static_cast<unsigned char>(c);
                return value > 0x20 && value < 0x7f && separators.find(c) == std::string_view::npos;
            });
        };

        for (const auto &[name, value] : values)
        {
            if (!token(name))
            {
                return unexpected{error::configuration(std::format("\"{}\" is not a valid header name", name))};
            }

            if (value.find_first_of("\r\n") != std::string::npos)
            {
                return unexpected{error::configuration(std::format("value of header \"{}\" contains a line break", name))};
            }
        }

        return {};
    }

    result<validated> validate(const options &opts)
    {
        validated rtn;

        for (const auto &[name, handler] : opts.protocols)
        {
            auto scheme = validate_scheme(name);

            if (!scheme)
            {
                return unexpected{scheme.error()};
            }

            const auto empty = std::visit([](const auto &callback) { return !callback; }, handler);

            if (empty)
            {
                return unexpected{error::configuration(std::format("scheme \"{}\" has no handler", scheme.value()))};
            }

            if (rtn.protocols.contains(scheme.value()))
            {
                return unexpected{error::configuration(std::format("scheme \"{}\" is registered more than once", scheme.value()))};
            }

            rtn.protocols.emplace(std::move(scheme.value()), handler);
        }

        if (opts.url)
        {
            if (auto valid = validate_url(opts.url.value()); !valid)
            {
                return unexpected{valid.error()};
            }
        }

        if (opts.url && opts.html)
        {
            logger()->warn("both an initial url and html were given, the url takes precedence");
        }

        if (auto valid = validate_headers(opts.headers); !valid)
        {
            return unexpected{valid.error()};
        }

        if (opts.bounds && (opts.bounds->width < 0 || opts.bounds->height < 0))
        {
            return unexpected{error::configuration("bounds must not have a negative size")};
        }

        return rtn;
    }
} // namespace canopy
