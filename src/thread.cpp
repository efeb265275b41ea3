#include "thread.hpp"

#include <format>

namespace canopy
{
    thread_guard::thread_guard() : m_owner(std::this_thread::get_id()) {}

    bool thread_guard::owned() const
    {
        return std::this_thread::get_id() == m_owner;
    }

    std::thread::id thread_guard::owner() const
    {
        return m_owner;
    }

    result<> thread_guard::check(std::string_view operation) const
    {
        if (owned())
        {
            return {};
        }

        return unexpected{error::thread_affinity(std::format("{} must be called from the thread that created the webview", operation))};
    }
} // namespace canopy
