#include "dispatcher.hpp"

#include "log.hpp"

#include <format>
#include <utility>

#include <rebind/utils/enum.hpp>

namespace canopy
{
    namespace scheme
    {
        int status_of(error err)
        {
            if (err == error::failed)
            {
                return 500;
            }

            return std::to_underlying(err);
        }

        static response error_response(int status, std::string reason)
        {
            return {
                .data    = stash::from_str(reason),
                .mime    = "text/plain",
                .headers = {},
                .status  = status,
            };
        }

        // pending implementation

        pending::pending(std::uint64_t id, std::unique_ptr<responder> target, poster post, reporter report,
                         std::function<void(std::uint64_t)> release)
            : m_id(id), m_streams(target && target->streams()), m_post(std::move(post)), m_report(std::move(report)), m_release(std::move(release)),
              m_state(state{.current = stage::intercepted, .target = std::move(target)})
        {
        }

        std::uint64_t pending::id() const
        {
            return m_id;
        }

        stage pending::current() const
        {
            return m_state.read()->current;
        }

        bool pending::valid() const
        {
            auto locked = m_state.read();
            return locked->target && (locked->current == stage::invoked || locked->current == stage::streaming);
        }

        void pending::invoke()
        {
            auto locked = m_state.write();

            if (locked->current == stage::intercepted)
            {
                locked->current = stage::invoked;
            }
        }

        void pending::cancel()
        {
            std::unique_ptr<responder> target;

            {
                auto locked = m_state.write();

                if (locked->current == stage::delivered)
                {
                    return;
                }

                locked->current = stage::cancelled;
                target          = std::move(locked->target);
            }

            logger()->debug("[{}] cancelled", m_id);
        }

        void pending::resolve(const response &value)
        {
            auto locked = m_state.write();

            if (locked->current != stage::invoked)
            {
                logger()->debug("[{}] ignoring resolve, request is already answered", m_id);
                return;
            }

            settle(locked.value(), stage::ready, value);
        }

        void pending::reject(error err)
        {
            const auto status = status_of(err);
            auto reason       = std::string{rebind::utils::find_enum_name(err).value_or("failed")};

            auto locked = m_state.write();

            if (locked->current == stage::streaming && m_streams)
            {
                locked->current = stage::ready;
                schedule([](responder &target) { target.finish(); }, true);
                return;
            }

            if (locked->current != stage::invoked && locked->current != stage::streaming)
            {
                return;
            }

            settle(locked.value(), stage::failed, error_response(status, std::move(reason)));
        }

        void pending::fail(int status, std::string reason)
        {
            auto locked = m_state.write();

            if (locked->current == stage::streaming && m_streams)
            {
                logger()->error("[{}] stream aborted: {}", m_id, reason);

                locked->current = stage::ready;
                schedule([](responder &target) { target.finish(); }, true);

                return;
            }

            if (locked->current != stage::intercepted && locked->current != stage::invoked && locked->current != stage::streaming)
            {
                logger()->debug("[{}] ignoring failure after completion: {}", m_id, reason);
                return;
            }

            logger()->error("[{}] answering with {}: {}", m_id, status, reason);
            settle(locked.value(), stage::failed, error_response(status, std::move(reason)));
        }

        void pending::abandon()
        {
            {
                auto locked = m_state.read();

                if (locked->current != stage::invoked && locked->current != stage::streaming)
                {
                    return;
                }
            }

            raise(canopy::error::protocol_handler("request abandoned by handler", 500));
        }

        void pending::raise(canopy::error reason)
        {
            {
                auto locked = m_state.read();

                if (locked->current == stage::delivered || locked->current == stage::cancelled)
                {
                    return;
                }
            }

            fail(500, reason.message());

            if (!m_report)
            {
                return;
            }

            m_post([report = m_report, reason = std::move(reason)] { report(reason); });
        }

        void pending::start(const stream_response &head)
        {
            auto locked = m_state.write();

            if (locked->current != stage::invoked)
            {
                return;
            }

            locked->current = stage::streaming;

            if (!m_streams)
            {
                locked->head = head;
                return;
            }

            schedule([head](responder &target) { target.start(head); }, false);
        }

        void pending::write(stash data)
        {
            auto locked = m_state.write();

            if (locked->current != stage::streaming)
            {
                return;
            }

            if (!m_streams)
            {
                locked->buffer.insert(locked->buffer.end(), data.data(), data.data() + data.size());
                return;
            }

            schedule([data = data.own()](responder &target) { target.write(data); }, false);
        }

        void pending::finish()
        {
            auto locked = m_state.write();

            if (locked->current != stage::streaming)
            {
                return;
            }

            if (m_streams)
            {
                locked->current = stage::ready;
                schedule([](responder &target) { target.finish(); }, true);
                return;
            }

            const auto head = locked->head.value_or(stream_response{});

            auto value = response{
                .data    = stash::from(std::move(locked->buffer)),
                .mime    = head.mime,
                .headers = head.headers,
                .status  = head.status,
            };

            settle(locked.value(), stage::ready, std::move(value));
        }

        void pending::settle(state &locked, stage to, response value)
        {
            locked.current = to;
            locked.head.reset();
            locked.buffer.clear();

            if (!value.data.owning())
            {
                value.data = value.data.own();
            }

            schedule([value = std::move(value)](responder &target) { target.respond(value); }, true);
        }

        void pending::schedule(std::function<void(responder &)> action, bool last)
        {
            auto run = [self = shared_from_this(), action = std::move(action), last]
            {
                std::unique_ptr<responder> owned;
                responder *target{nullptr};

                {
                    auto locked = self->m_state.write();

                    if (!locked->target)
                    {
                        return;
                    }

                    if (last)
                    {
                        owned           = std::move(locked->target);
                        locked->current = stage::delivered;
                    }

                    target = owned ? owned.get() : locked->target.get();
                }

                action(*target);

                if (!last)
                {
                    return;
                }

                logger()->debug("[{}] delivered", self->m_id);
                self->m_release(self->m_id);
            };

            m_post(std::move(run));
        }
    } // namespace scheme

    struct dispatcher::state
    {
        std::map<std::string, scheme::handler> handlers;
        scheme::poster post;
        scheme::reporter report;

      public:
        std::uint64_t counter{0};
        std::map<std::uint64_t, std::shared_ptr<scheme::pending>> pending;

      public:
        bool closed{false};
    };

    dispatcher::dispatcher(std::map<std::string, scheme::handler> handlers, scheme::poster post, scheme::reporter report)
        : m_state(std::make_shared<state>(state{.handlers = std::move(handlers), .post = std::move(post), .report = std::move(report)}))
    {
    }

    dispatcher::~dispatcher()
    {
        shutdown();
    }

    void dispatcher::handle(const std::string &scheme, scheme::request request, std::unique_ptr<scheme::responder> responder)
    {
        if (m_state->closed)
        {
            return;
        }

        auto release = [weak = std::weak_ptr<state>{m_state}](std::uint64_t id)
        {
            if (auto self = weak.lock(); self)
            {
                self->pending.erase(id);
            }
        };

        const auto id = ++m_state->counter;
        auto slot     = std::make_shared<scheme::pending>(id, std::move(responder), m_state->post, m_state->report, std::move(release));

        m_state->pending.emplace(id, slot);
        logger()->debug("[{}] {} {}", id, request.method(), request.url().string());

        auto handler = m_state->handlers.find(scheme);

        if (handler == m_state->handlers.end())
        {
            slot->fail(404, std::format("no handler registered for scheme \"{}\"", scheme));
            return;
        }

        slot->invoke();

        if (const auto *resolver = std::get_if<scheme::sync_resolver>(&handler->second); resolver)
        {
            try
            {
                slot->resolve((*resolver)(request));
            }
            catch (const std::exception &ex)
            {
                slot->raise(canopy::error::protocol_handler(ex.what(), 500));
            }
            catch (...)
            {
                slot->raise(canopy::error::protocol_handler("handler raised an unknown exception", 500));
            }

            return;
        }

        const auto &resolver = std::get<scheme::resolver>(handler->second);
        auto executor        = scheme::executor{std::make_shared<scheme::executor::impl>(slot)};

        try
        {
            resolver(std::move(request), executor);
        }
        catch (const std::exception &ex)
        {
            slot->raise(canopy::error::protocol_handler(ex.what(), 500));
        }
        catch (...)
        {
            slot->raise(canopy::error::protocol_handler("handler raised an unknown exception", 500));
        }
    }

    void dispatcher::shutdown()
    {
        if (m_state->closed)
        {
            return;
        }

        m_state->closed = true;

        auto pending = std::exchange(m_state->pending, {});

        for (const auto &[id, slot] : pending)
        {
            slot->cancel();
        }

        m_state->handlers.clear();
    }

    bool dispatcher::handles(const std::string &scheme) const
    {
        return m_state->handlers.contains(scheme);
    }

    std::size_t dispatcher::pending() const
    {
        return m_state->pending.size();
    }

    std::vector<std::string> dispatcher::schemes() const
    {
        std::vector<std::string> rtn;
        rtn.reserve(m_state->handlers.size());

        for (const auto &[name, handler] : m_state->handlers)
        {
            rtn.emplace_back(name);
        }

        return rtn;
    }
} // namespace canopy
