#pragma once

#include <span>
#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <string_view>

namespace canopy
{
    class stash
    {
        using owning_t  = std::vector<std::uint8_t>;
        using viewing_t = std::span<const std::uint8_t>;

      private:
        std::variant<owning_t, viewing_t> m_data;

      private:
        explicit stash(std::variant<owning_t, viewing_t>);

      public:
        [[nodiscard]] const std::uint8_t *data() const;
        [[nodiscard]] std::size_t size() const;

      public:
        [[nodiscard]] std::string_view str() const;
        [[nodiscard]] bool owning() const;

      public:
        // Returns an owning copy, for stashes that must outlive the memory they view
        [[nodiscard]] stash own() const;

      public:
        [[nodiscard]] static stash from(std::vector<std::uint8_t> data);
        [[nodiscard]] static stash view(std::span<const std::uint8_t> data);

      public:
        [[nodiscard]] static stash from_str(std::string_view data);
        [[nodiscard]] static stash view_str(std::string_view data);

      public:
        [[nodiscard]] static stash empty();
    };
} // namespace canopy
