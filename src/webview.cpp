#include "canopy/webview.hpp"

#include "log.hpp"
#include "bridge.hpp"
#include "engine.hpp"
#include "thread.hpp"
#include "validate.hpp"
#include "dispatcher.hpp"

#include <cmath>
#include <tuple>
#include <format>
#include <functional>

#include <rebind/utils/enum.hpp>

namespace canopy
{
    struct webview::impl
    {
        thread_guard guard;
        std::unique_ptr<engine> backend;

      public:
        std::unique_ptr<dispatcher> protocols;
        std::unique_ptr<bridge> messages;

      public:
        canopy::headers headers;
        drop_handler on_drop;

      public:
        std::function<bool(const std::string &)> on_navigation;
        std::function<void(page_load, const std::string &)> on_load;
        std::function<void(const error &)> on_crash;

      public:
        std::function<bool(const std::string &)> on_new_window;
        download_handler on_download;
        download_finished_handler on_download_finished;
        std::function<void(const error &)> on_protocol_error;

      public:
        [[nodiscard]] bool supported(capability, std::string_view operation) const;

      public:
        void teardown();
    };

    template <typename Callback>
    static void guarded(std::string_view name, Callback &&callback)
    {
        try
        {
            std::invoke(std::forward<Callback>(callback));
        }
        catch (const std::exception &ex)
        {
            logger()->error("{} handler raised: {}", name, ex.what());
        }
        catch (...)
        {
            logger()->error("{} handler raised an unknown exception", name);
        }
    }

    template <typename R, typename Callback>
    static R guarded(std::string_view name, R fallback, Callback &&callback)
    {
        try
        {
            return std::invoke(std::forward<Callback>(callback));
        }
        catch (const std::exception &ex)
        {
            logger()->error("{} handler raised: {}", name, ex.what());
        }
        catch (...)
        {
            logger()->error("{} handler raised an unknown exception", name);
        }

        return fallback;
    }

    bool webview::impl::supported(capability value, std::string_view operation) const
    {
        if (backend->supported().contains(value))
        {
            return true;
        }

        const auto name = rebind::utils::find_enum_name(value).value_or("unknown");
        logger()->warn("{} is not supported by this engine (capability: {}), ignoring", operation, name);

        return false;
    }

    void webview::impl::teardown()
    {
        if (!backend)
        {
            return;
        }

        logger()->debug("tearing down webview");

        if (protocols)
        {
            protocols->shutdown();
        }

        if (messages)
        {
            messages->close();
        }

        backend->detach();
        backend.reset();
    }

    webview::webview(std::shared_ptr<impl> impl) : m_impl(std::move(impl)) {}

    webview::webview(webview &&) noexcept = default;

    webview &webview::operator=(webview &&other) noexcept
    {
        if (this != &other)
        {
            auto previous = webview{std::move(*this)};
            m_impl        = std::move(other.m_impl);
        }

        return *this;
    }

    webview::~webview()
    {
        if (!m_impl || !m_impl->backend)
        {
            return;
        }

        if (m_impl->guard.owned())
        {
            m_impl->teardown();
            return;
        }

        logger()->warn("webview released off its owning thread, deferring teardown to the owning thread");
        m_impl->backend->post([self = m_impl] { self->teardown(); });
    }

    result<> webview::ready(std::string_view operation) const
    {
        if (!m_impl)
        {
            return unexpected{error::engine(std::format("{} called on a moved-from webview", operation))};
        }

        if (auto owned = m_impl->guard.check(operation); !owned)
        {
            return owned;
        }

        if (!m_impl->backend)
        {
            return unexpected{error::engine(std::format("{} called after the webview was destroyed", operation))};
        }

        return {};
    }

    bool webview::alive() const
    {
        return m_impl && m_impl->backend;
    }

    bool webview::supports(capability value) const
    {
        return alive() && m_impl->backend->supported().contains(value);
    }

    result<> webview::navigate(const std::string &url)
    {
        return navigate(url, {});
    }

    result<> webview::navigate(const std::string &url, const headers &extra)
    {
        if (auto ok = ready("navigate"); !ok)
        {
            return ok;
        }

        if (auto ok = validate_url(url); !ok)
        {
            return ok;
        }

        if (auto ok = validate_headers(extra); !ok)
        {
            return ok;
        }

        auto merged = extra;
        merged.insert(m_impl->headers.begin(), m_impl->headers.end());

        return m_impl->backend->navigate(url, merged);
    }

    result<> webview::load_html(const std::string &html)
    {
        if (auto ok = ready("load_html"); !ok)
        {
            return ok;
        }

        return m_impl->backend->load_html(html);
    }

    result<> webview::reload()
    {
        if (auto ok = ready("reload"); !ok)
        {
            return ok;
        }

        return m_impl->backend->reload();
    }

    result<> webview::evaluate(const std::string &code, std::function<void(result<std::string>)> callback)
    {
        if (auto ok = ready("evaluate"); !ok)
        {
            return ok;
        }

        if (!callback)
        {
            return execute(code);
        }

        auto complete = [callback = std::move(callback)](result<std::string> raw)
        {
            if (!raw)
            {
                guarded("evaluation", [&] { callback(unexpected{error::script(raw.error().message(), raw.error().code())}); });
                return;
            }

            guarded("evaluation", [&] { callback(bridge::normalize(raw.value())); });
        };

        m_impl->backend->execute(code, std::move(complete));

        return {};
    }

    result<> webview::execute(const std::string &code)
    {
        if (auto ok = ready("execute"); !ok)
        {
            return ok;
        }

        auto report = [](result<std::string> raw)
        {
            if (!raw)
            {
                logger()->warn("script raised: {}", raw.error().message());
            }
        };

        m_impl->backend->execute(code, std::move(report));

        return {};
    }

    result<> webview::set_visible(bool visible)
    {
        if (auto ok = ready("set_visible"); !ok)
        {
            return ok;
        }

        return m_impl->backend->set_visible(visible);
    }

    result<> webview::resize(const rect &bounds)
    {
        if (auto ok = ready("resize"); !ok)
        {
            return ok;
        }

        if (bounds.width < 0 || bounds.height < 0)
        {
            return unexpected{error::configuration(std::format("invalid size {}x{}", bounds.width, bounds.height))};
        }

        return m_impl->backend->resize(bounds);
    }

    result<> webview::zoom(double factor)
    {
        if (auto ok = ready("zoom"); !ok)
        {
            return ok;
        }

        if (!std::isfinite(factor) || factor <= 0)
        {
            return unexpected{error::configuration(std::format("zoom factor must be positive, got {}", factor))};
        }

        if (!m_impl->supported(capability::zoom, "zoom"))
        {
            return {};
        }

        return m_impl->backend->zoom(factor);
    }

    result<> webview::print()
    {
        if (auto ok = ready("print"); !ok)
        {
            return ok;
        }

        if (!m_impl->supported(capability::print, "print"))
        {
            return {};
        }

        return m_impl->backend->print();
    }

    result<> webview::open_devtools()
    {
        if (auto ok = ready("open_devtools"); !ok)
        {
            return ok;
        }

        if (!m_impl->supported(capability::devtools, "open_devtools"))
        {
            return {};
        }

        return m_impl->backend->open_devtools();
    }

    result<> webview::close_devtools()
    {
        if (auto ok = ready("close_devtools"); !ok)
        {
            return ok;
        }

        if (!m_impl->supported(capability::devtools_close, "close_devtools"))
        {
            return {};
        }

        return m_impl->backend->close_devtools();
    }

    result<bool> webview::devtools_open() const
    {
        if (auto ok = ready("devtools_open"); !ok)
        {
            return unexpected{ok.error()};
        }

        return m_impl->backend->devtools_open();
    }

    result<std::string> webview::url() const
    {
        if (auto ok = ready("url"); !ok)
        {
            return unexpected{ok.error()};
        }

        return m_impl->backend->url();
    }

    result<> webview::clear_browsing_data()
    {
        if (auto ok = ready("clear_browsing_data"); !ok)
        {
            return ok;
        }

        if (!m_impl->supported(capability::browsing_data, "clear_browsing_data"))
        {
            return {};
        }

        return m_impl->backend->clear_browsing_data();
    }

    result<> webview::set_drop_handler(drop_handler handler)
    {
        if (auto ok = ready("set_drop_handler"); !ok)
        {
            return ok;
        }

        if (handler)
        {
            std::ignore = m_impl->supported(capability::file_drop, "set_drop_handler");
        }

        m_impl->on_drop = std::move(handler);

        return {};
    }

    result<> webview::destroy()
    {
        if (!m_impl)
        {
            return {};
        }

        if (auto owned = m_impl->guard.check("destroy"); !owned)
        {
            return owned;
        }

        m_impl->teardown();

        return {};
    }

    result<webview> webview::create(native_window parent, options opts)
    {
        auto config = validate(opts);

        if (!config)
        {
            return unexpected{config.error()};
        }

        if (!parent)
        {
            return unexpected{error::configuration("a parent window is required")};
        }

        auto self = std::make_shared<impl>();

        self->headers       = std::move(opts.headers);
        self->on_drop       = std::move(opts.drop_handler);
        self->on_navigation = std::move(opts.navigation_handler);
        self->on_load       = std::move(opts.load_handler);
        self->on_crash      = std::move(opts.crash_handler);

        self->on_new_window        = std::move(opts.new_window_handler);
        self->on_download          = std::move(opts.download_handler);
        self->on_download_finished = std::move(opts.download_finished_handler);
        self->on_protocol_error    = std::move(opts.protocol_error_handler);

        auto settings = engine::settings{
            .parent      = parent,
            .user_agent  = opts.user_agent,
            .bounds      = opts.bounds,
            .transparent = opts.transparent,
            .devtools    = opts.devtools,
            .incognito   = opts.incognito,
            .autoplay    = opts.autoplay,
            .schemes     = {},
        };

        for (const auto &[name, handler] : config->protocols)
        {
            settings.schemes.emplace_back(name);
        }

        auto weak = std::weak_ptr<impl>{self};

        auto events = engine::events{
            .message =
                [weak](std::string message)
            {
                if (auto target = weak.lock(); target && target->messages)
                {
                    target->messages->receive(std::move(message));
                }
            },
            .request =
                [weak](const std::string &scheme, scheme::request request, std::unique_ptr<scheme::responder> responder)
            {
                if (auto target = weak.lock(); target && target->protocols)
                {
                    target->protocols->handle(scheme, std::move(request), std::move(responder));
                }
            },
            .drop =
                [weak](const drop_event &event)
            {
                auto target = weak.lock();

                if (!target || !target->on_drop)
                {
                    return false;
                }

                return guarded("drop", false, [&] { return target->on_drop(event); });
            },
            .navigation =
                [weak](const std::string &url)
            {
                auto target = weak.lock();

                if (!target || !target->on_navigation)
                {
                    return true;
                }

                return guarded("navigation", true, [&] { return target->on_navigation(url); });
            },
            .load =
                [weak](page_load state, const std::string &url)
            {
                if (auto target = weak.lock(); target && target->on_load)
                {
                    guarded("load", [&] { target->on_load(state, url); });
                }
            },
            .crashed =
                [weak](const error &reason)
            {
                logger()->error("engine terminated: {}", reason.what());

                if (auto target = weak.lock(); target && target->on_crash)
                {
                    guarded("crash", [&] { target->on_crash(reason); });
                }
            },
        };

        if (self->on_new_window)
        {
            events.new_window = [weak](const std::string &url)
            {
                auto target = weak.lock();

                if (!target || !target->on_new_window)
                {
                    return false;
                }

                return guarded("new window", false, [&] { return target->on_new_window(url); });
            };
        }

        if (self->on_download || self->on_download_finished)
        {
            events.download_started = [weak](download_request &request)
            {
                auto target = weak.lock();

                if (!target)
                {
                    return false;
                }

                if (!target->on_download)
                {
                    return true;
                }

                if (!guarded("download", false, [&] { return target->on_download(request); }))
                {
                    logger()->debug("download of {} cancelled by handler", request.url);
                    return false;
                }

                if (!request.destination.is_absolute())
                {
                    logger()->warn("download destination \"{}\" is not absolute, cancelling {}", request.destination.string(), request.url);
                    return false;
                }

                return true;
            };

            events.download_finished = [weak](const download_result &outcome)
            {
                if (auto target = weak.lock(); target && target->on_download_finished)
                {
                    guarded("download finished", [&] { target->on_download_finished(outcome); });
                }
            };
        }

        auto created = engine::create(settings, std::move(events));

        if (!created)
        {
            logger()->error("could not create engine: {}", created.error().what());
            return unexpected{created.error()};
        }

        self->backend = std::move(created.value());

        auto post = [backend = self->backend.get()](scheme::task task)
        {
            backend->post(std::move(task));
        };

        auto report = [weak](const error &reason)
        {
            if (auto target = weak.lock(); target && target->on_protocol_error)
            {
                guarded("protocol error", [&] { target->on_protocol_error(reason); });
            }
        };

        self->protocols = std::make_unique<dispatcher>(std::move(config->protocols), post, std::move(report));
        self->messages  = std::make_unique<bridge>(post, std::move(opts.message_handler));

        if (opts.transparent)
        {
            std::ignore = self->supported(capability::transparent, "transparent");
        }

        if (opts.devtools)
        {
            std::ignore = self->supported(capability::devtools, "devtools");
        }

        if (opts.user_agent)
        {
            std::ignore = self->supported(capability::user_agent, "user_agent");
        }

        if (self->on_drop)
        {
            std::ignore = self->supported(capability::file_drop, "drop_handler");
        }

        if (self->on_new_window)
        {
            std::ignore = self->supported(capability::new_window, "new_window_handler");
        }

        if (self->on_download || self->on_download_finished)
        {
            std::ignore = self->supported(capability::download, "download_handler");
        }

        auto scripts = std::vector<std::string>{bridge::bootstrap(self->backend->transport())};
        scripts.insert(scripts.end(), opts.scripts.begin(), opts.scripts.end());

        for (const auto &script : scripts)
        {
            if (auto added = self->backend->add_script(script); !added)
            {
                self->teardown();
                return unexpected{added.error()};
            }
        }

        auto loaded = result<>{};

        if (opts.url)
        {
            loaded = self->backend->navigate(opts.url.value(), self->headers);
        }
        else if (opts.html)
        {
            loaded = self->backend->load_html(opts.html.value());
        }

        if (!loaded)
        {
            self->teardown();
            return unexpected{loaded.error()};
        }

        return webview{std::move(self)};
    }

    result<> webview::register_scheme(const std::string &name)
    {
        auto scheme = validate_scheme(name);

        if (!scheme)
        {
            return unexpected{scheme.error()};
        }

        return engine::register_scheme(scheme.value());
    }
} // namespace canopy
