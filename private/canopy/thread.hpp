#pragma once

#include <canopy/error.hpp>

#include <thread>
#include <string_view>

namespace canopy
{
    // Proof of execution on the thread that created a webview
    class thread_guard
    {
        std::thread::id m_owner;

      public:
        thread_guard();

      public:
        [[nodiscard]] bool owned() const;
        [[nodiscard]] std::thread::id owner() const;

      public:
        [[nodiscard]] result<> check(std::string_view operation) const;
    };
} // namespace canopy
