#include "bridge.hpp"

#include "log.hpp"

#include <deque>
#include <format>

#include <glaze/glaze.hpp>

namespace canopy
{
    struct bridge::state
    {
        struct queue
        {
            std::deque<std::string> messages;
            bool scheduled{false};
            bool closed{false};
        };

      public:
        scheme::poster post;
        std::function<void(std::string)> handler;

      public:
        lockpp::lock<queue> queued;
        bool draining{false};

      public:
        void drain();
    };

    void bridge::state::drain()
    {
        if (draining)
        {
            return;
        }

        draining = true;

        while (true)
        {
            std::string message;

            {
                auto locked = queued.write();

                if (locked->closed || locked->messages.empty())
                {
                    locked->scheduled = false;
                    break;
                }

                message = std::move(locked->messages.front());
                locked->messages.pop_front();
            }

            if (!handler)
            {
                logger()->debug("dropping message, no handler is installed");
                continue;
            }

            try
            {
                handler(std::move(message));
            }
            catch (const std::exception &ex)
            {
                logger()->error("message handler raised: {}", ex.what());
            }
            catch (...)
            {
                logger()->error("message handler raised an unknown exception");
            }
        }

        draining = false;
    }

    bridge::bridge(scheme::poster post, std::function<void(std::string)> handler) : m_state(std::make_shared<state>())
    {
        m_state->post    = std::move(post);
        m_state->handler = std::move(handler);
    }

    bridge::~bridge()
    {
        close();
    }

    void bridge::receive(std::string message)
    {
        auto locked = m_state->queued.write();

        if (locked->closed)
        {
            return;
        }

        locked->messages.emplace_back(std::move(message));

        if (locked->scheduled)
        {
            return;
        }

        locked->scheduled = true;
        m_state->post([self = m_state] { self->drain(); });
    }

    void bridge::close()
    {
        auto locked = m_state->queued.write();

        locked->closed = true;
        locked->messages.clear();
    }

    std::size_t bridge::queued() const
    {
        return m_state->queued.read()->messages.size();
    }

    std::string bridge::bootstrap(std::string_view transport)
    {
        static constexpr auto script = R"js(
(function () {
    if (window.ipc && window.ipc.__canopy) {
        return;
    }

    var forward = $transport;

    var ipc = Object.freeze({
        __canopy: true,
        postMessage: function (message) {
            if (typeof message !== "string") {
                throw new TypeError("ipc.postMessage expects a string, got " + typeof message);
            }

            forward(message);
        },
    });

    Object.defineProperty(window, "ipc", {
        value: ipc,
        writable: false,
        enumerable: false,
        configurable: false,
    });
})();
)js";

        auto rtn = std::string{script};
        static constexpr std::string_view placeholder = "$transport";
        rtn.replace(rtn.find(placeholder), placeholder.size(), transport);

        return rtn;
    }

    result<std::string> bridge::normalize(std::string_view json)
    {
        const auto first = json.find_first_not_of(" \t\r\n");

        if (first == std::string_view::npos)
        {
            return "null";
        }

        if (auto invalid = glz::validate_json(json); invalid)
        {
            return unexpected{error::script(std::format("engine returned malformed json: {}", json))};
        }

        return std::string{json};
    }
} // namespace canopy
