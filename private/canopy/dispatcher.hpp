#pragma once

#include "scheme.impl.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace canopy
{
    // Routes intercepted requests to the handler registered for their scheme and answers every one of them exactly once.
    // Owned by a single webview and driven from its thread, executors may complete from anywhere.
    class dispatcher
    {
        struct state;

      private:
        std::shared_ptr<state> m_state;

      public:
        dispatcher(std::map<std::string, scheme::handler> handlers, scheme::poster post, scheme::reporter report = {});

      public:
        ~dispatcher();

      public:
        void handle(const std::string &scheme, scheme::request request, std::unique_ptr<scheme::responder> responder);

      public:
        // Cancels every pending request, none of them will reach the engine afterwards
        void shutdown();

      public:
        [[nodiscard]] bool handles(const std::string &scheme) const;
        [[nodiscard]] std::size_t pending() const;
        [[nodiscard]] std::vector<std::string> schemes() const;
    };
} // namespace canopy
