#include "canopy/url.hpp"

#include <format>
#include <charconv>
#include <algorithm>

namespace canopy
{
    url::url(options parts, bool opaque) : m_parts(std::move(parts)), m_opaque(opaque) {}

    std::string url::string() const
    {
        auto rtn = std::format("{}:", m_parts.scheme);

        if (!m_opaque)
        {
            rtn += "//";

            if (m_parts.user)
            {
                rtn += std::format("{}@", m_parts.user.value());
            }

            rtn += m_parts.host;

            if (m_parts.port)
            {
                rtn += std::format(":{}", m_parts.port.value());
            }
        }

        rtn += m_parts.path;

        if (m_parts.query)
        {
            rtn += std::format("?{}", m_parts.query.value());
        }

        if (m_parts.fragment)
        {
            rtn += std::format("#{}", m_parts.fragment.value());
        }

        return rtn;
    }

    const std::string &url::scheme() const
    {
        return m_parts.scheme;
    }

    const std::string &url::host() const
    {
        return m_parts.host;
    }

    const std::string &url::path() const
    {
        return m_parts.path;
    }

    std::optional<std::string> url::user() const
    {
        return m_parts.user;
    }

    std::optional<std::uint16_t> url::port() const
    {
        return m_parts.port;
    }

    std::optional<std::string> url::query() const
    {
        return m_parts.query;
    }

    std::optional<std::string> url::fragment() const
    {
        return m_parts.fragment;
    }

    bool url::opaque() const
    {
        return m_opaque;
    }

    url url::make(const options &parts)
    {
        return {parts, false};
    }

    result<url> url::parse(std::string_view value)
    {
        const auto colon = value.find(':');

        if (colon == std::string_view::npos || !uri::valid_scheme(value.substr(0, colon)))
        {
            return unexpected{error::configuration(std::format("\"{}\" is not an absolute url", value))};
        }

        auto parts         = options{.scheme = uri::lower(value.substr(0, colon))};
        auto rest          = value.substr(colon + 1);
        const auto opaque = !rest.starts_with("//");

        if (const auto hash = rest.find('#'); hash != std::string_view::npos)
        {
            parts.fragment = std::string{rest.substr(hash + 1)};
            rest           = rest.substr(0, hash);
        }

        if (const auto question = rest.find('?'); question != std::string_view::npos)
        {
            parts.query = std::string{rest.substr(question + 1)};
            rest        = rest.substr(0, question);
        }

        if (opaque)
        {
            parts.path = std::string{rest};
            return url{std::move(parts), true};
        }

        rest = rest.substr(2);

        const auto slash = rest.find('/');
        auto authority   = rest.substr(0, slash);
        parts.path       = slash == std::string_view::npos ? std::string{} : std::string{rest.substr(slash)};

        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        {
            parts.user = std::string{authority.substr(0, at)};
            authority  = authority.substr(at + 1);
        }

        auto port_start = authority.rfind(':');

        if (authority.starts_with('['))
        {
            const auto closing = authority.find(']');

            if (closing == std::string_view::npos)
            {
                return unexpected{error::configuration(std::format("\"{}\" has a malformed host", value))};
            }

            port_start = authority.find(':', closing);
        }

        if (port_start != std::string_view::npos)
        {
            const auto digits = authority.substr(port_start + 1);
            std::uint16_t port{};

            const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);

            if (!digits.empty() && (ec != std::errc{} || end != digits.data() + digits.size()))
            {
                return unexpected{error::configuration(std::format("\"{}\" has an invalid port", value))};
            }

            if (!digits.empty())
            {
                parts.port = port;
            }

            authority = authority.substr(0, port_start);
        }

        parts.host = std::string{authority};

        return url{std::move(parts), false};
    }

    namespace uri
    {
        bool valid_scheme(std::string_view scheme)
        {
            auto is_alpha = [](char c)
            {
                return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
            };

            auto is_tail = [&is_alpha](char c)
            {
                return is_alpha(c) || (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
            };

            if (scheme.empty() || !is_alpha(scheme.front()))
            {
                return false;
            }

            return std::ranges::all_of(scheme.substr(1), is_tail);
        }

        std::string decode(std::string_view value)
        {
            auto hex = [](char c) -> int
            {
                if (c >= '0' && c <= '9')
                {
                    return c - '0';
                }

                if (c >= 'a' && c <= 'f')
                {
                    return c - 'a' + 10;
                }

                if (c >= 'A' && c <= 'F')
                {
                    return c - 'A' + 10;
                }

                return -1;
            };

            std::string rtn;
            rtn.reserve(value.size());

            for (std::size_t i = 0; i < value.size(); ++i)
            {
                if (value[i] != '%' || i + 2 >= value.size())
                {
                    rtn += value[i];
                    continue;
                }

                const auto high = hex(value[i + 1]);
                const auto low  = hex(value[i + 2]);

                if (high < 0 || low < 0)
                {
                    rtn += value[i];
                    continue;
                }

                rtn += static_cast<char>((high << 4) | low);
                i += 2;
            }

            return rtn;
        }

        std::string lower(std::string_view value)
        {
            std::string rtn{value};

            std::ranges::transform(rtn, rtn.begin(), [](char c)
            {
                return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
            });

            return rtn;
        }
    } // namespace uri
} // namespace canopy
