#pragma once

#include <canopy/options.hpp>

#include <map>
#include <string>
#include <string_view>

namespace canopy
{
    struct validated
    {
        std::map<std::string, scheme::handler> protocols;
    };

    [[nodiscard]] result<validated> validate(const options &);

    [[nodiscard]] result<std::string> validate_scheme(std::string_view name);
    [[nodiscard]] result<> validate_url(std::string_view value);
    [[nodiscard]] result<> validate_headers(const headers &);

    [[nodiscard]] bool reserved_scheme(std::string_view name);
} // namespace canopy
