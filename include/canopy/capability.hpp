#pragma once

#include <cstdint>
#include <initializer_list>

namespace canopy
{
    enum class capability : std::uint8_t
    {
        transparent,
        devtools,
        devtools_close,
        zoom,
        print,
        file_drop,
        streaming,
        user_agent,
        browsing_data,
        download,
        new_window,
    };

    class capabilities
    {
        std::uint32_t m_mask{0};

      public:
        constexpr capabilities() = default;
        constexpr capabilities(std::initializer_list<capability> values)
        {
            for (const auto value : values)
            {
                m_mask |= bit(value);
            }
        }

      public:
        [[nodiscard]] constexpr bool contains(capability value) const
        {
            return (m_mask & bit(value)) != 0;
        }

      private:
        static constexpr std::uint32_t bit(capability value)
        {
            return std::uint32_t{1} << static_cast<std::uint8_t>(value);
        }
    };
} // namespace canopy
