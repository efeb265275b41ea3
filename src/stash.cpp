#include "canopy/stash/stash.hpp"

namespace canopy
{
    stash::stash(std::variant<owning_t, viewing_t> data) : m_data(std::move(data)) {}

    const std::uint8_t *stash::data() const
    {
        return std::visit([](const auto &data) { return data.data(); }, m_data);
    }

    std::size_t stash::size() const
    {
        return std::visit([](const auto &data) { return data.size(); }, m_data);
    }

    std::string_view stash::str() const
    {
        return {reinterpret_cast<const char *>(data()), size()};
    }

    bool stash::owning() const
    {
        return std::holds_alternative<owning_t>(m_data);
    }

    stash stash::own() const
    {
        const auto *begin = data();
        return from({begin, begin + size()});
    }

    stash stash::from(std::vector<std::uint8_t> data)
    {
        return stash{std::move(data)};
    }

    stash stash::view(std::span<const std::uint8_t> data)
    {
        return stash{data};
    }

    stash stash::from_str(std::string_view data)
    {
        const auto *begin = reinterpret_cast<const std::uint8_t *>(data.data());
        return from({begin, begin + data.size()});
    }

    stash stash::view_str(std::string_view data)
    {
        return view({reinterpret_cast<const std::uint8_t *>(data.data()), data.size()});
    }

    stash stash::empty()
    {
        return from({});
    }
} // namespace canopy
