#include "utils/win32.hpp"

namespace canopy::utils
{
    std::wstring widen(std::string_view value)
    {
        if (value.empty())
        {
            return {};
        }

        const auto length = static_cast<int>(value.size());
        const auto size   = MultiByteToWideChar(CP_UTF8, 0, value.data(), length, nullptr, 0);

        std::wstring rtn(static_cast<std::size_t>(size), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, value.data(), length, rtn.data(), size);

        return rtn;
    }

    std::string narrow(std::wstring_view value)
    {
        if (value.empty())
        {
            return {};
        }

        const auto length = static_cast<int>(value.size());
        const auto size   = WideCharToMultiByte(CP_UTF8, 0, value.data(), length, nullptr, 0, nullptr, nullptr);

        std::string rtn(static_cast<std::size_t>(size), '\0');
        WideCharToMultiByte(CP_UTF8, 0, value.data(), length, rtn.data(), size, nullptr, nullptr);

        return rtn;
    }

    std::string narrow(co_string value)
    {
        if (!value)
        {
            return {};
        }

        return narrow(std::wstring_view{value.get()});
    }
} // namespace canopy::utils
