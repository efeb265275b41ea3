#pragma once

#include "scheme.impl.hpp"

#include <canopy/error.hpp>

#include <memory>
#include <string>
#include <functional>
#include <string_view>

namespace canopy
{
    class bridge
    {
        struct state;

      private:
        std::shared_ptr<state> m_state;

      public:
        bridge(scheme::poster post, std::function<void(std::string)> handler);

      public:
        ~bridge();

      public:
        // Thread-safe. Messages reach the handler on the owning thread in the order they were received.
        void receive(std::string message);
        void close();

      public:
        [[nodiscard]] std::size_t queued() const;

      public:
        [[nodiscard]] static std::string bootstrap(std::string_view transport);

      public:
        // Completion values arrive as json text, `undefined` and engines that report nothing map to "null"
        [[nodiscard]] static result<std::string> normalize(std::string_view json);
    };
} // namespace canopy
