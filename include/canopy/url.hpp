#pragma once

#include "error.hpp"

#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

namespace canopy
{
    class url
    {
      public:
        struct options
        {
            std::string scheme;
            std::optional<std::string> user;
            std::string host;
            std::optional<std::uint16_t> port;
            std::string path;
            std::optional<std::string> query;
            std::optional<std::string> fragment;
        };

      private:
        options m_parts;
        bool m_opaque{false};

      private:
        url(options parts, bool opaque);

      public:
        [[nodiscard]] std::string string() const;

      public:
        [[nodiscard]] const std::string &scheme() const;
        [[nodiscard]] const std::string &host() const;
        [[nodiscard]] const std::string &path() const;

      public:
        [[nodiscard]] std::optional<std::string> user() const;
        [[nodiscard]] std::optional<std::uint16_t> port() const;
        [[nodiscard]] std::optional<std::string> query() const;
        [[nodiscard]] std::optional<std::string> fragment() const;

      public:
        // True for urls without an authority part, e.g. "about:blank" or "data:text/html,..."
        [[nodiscard]] bool opaque() const;

      public:
        [[nodiscard]] static url make(const options &parts);
        [[nodiscard]] static result<url> parse(std::string_view value);
    };

    namespace uri
    {
        // Scheme token as defined by RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
        [[nodiscard]] bool valid_scheme(std::string_view scheme);

        [[nodiscard]] std::string decode(std::string_view value);
        [[nodiscard]] std::string lower(std::string_view value);
    } // namespace uri
} // namespace canopy
