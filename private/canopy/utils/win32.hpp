#pragma once

#include "handle.hpp"

#include <string>
#include <string_view>

#include <windows.h>
#include <objbase.h>

namespace canopy::utils
{
    using co_string = handle<LPWSTR, CoTaskMemFree>;

    [[nodiscard]] std::wstring widen(std::string_view value);
    [[nodiscard]] std::string narrow(std::wstring_view value);

    // Takes ownership of a string the callee allocated with CoTaskMemAlloc
    [[nodiscard]] std::string narrow(co_string value);
} // namespace canopy::utils
