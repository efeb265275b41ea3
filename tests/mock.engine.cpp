#include "mock.engine.hpp"

#include <mutex>

namespace canopy::mock
{
    namespace
    {
        std::mutex mutex;
        std::deque<scheme::task> tasks;

        engine *latest{nullptr};
        std::optional<error> failure;
        bool streams{true};
    } // namespace

    class responder : public scheme::responder
    {
        std::shared_ptr<reply> m_reply;
        bool m_streams;

      public:
        responder(std::shared_ptr<reply> target, bool streams) : m_reply(std::move(target)), m_streams(streams) {}

      public:
        ~responder() override
        {
            if (!m_reply->response && !m_reply->finished)
            {
                m_reply->released = true;
            }
        }

      public:
        void respond(const scheme::response &value) override
        {
            m_reply->response = value;
            m_reply->body     = std::string{value.data.str()};
        }

      public:
        [[nodiscard]] bool streams() const override
        {
            return m_streams;
        }

      public:
        void start(const scheme::stream_response &head) override
        {
            m_reply->head = head;
        }

        void write(stash data) override
        {
            m_reply->body += data.str();
        }

        void finish() override
        {
            m_reply->finished = true;
        }
    };

    engine::engine(settings config, events raise) : config(std::move(config)), raise(std::move(raise))
    {
        features = {
            capability::transparent,
            capability::devtools,
            capability::devtools_close,
            capability::zoom,
            capability::print,
            capability::file_drop,
            capability::streaming,
            capability::user_agent,
            capability::browsing_data,
            capability::download,
            capability::new_window,
        };

        streaming = streams;
    }

    engine::~engine()
    {
        if (latest == this)
        {
            latest = nullptr;
        }
    }

    canopy::capabilities engine::supported() const
    {
        return features;
    }

    std::string engine::transport() const
    {
        return "function (message) { window.__mock.push(message); }";
    }

    void engine::post(scheme::task task)
    {
        std::lock_guard lock{mutex};
        tasks.emplace_back(std::move(task));
    }

    void engine::detach()
    {
        detached = true;
        raise    = {};
        evaluations.clear();
    }

    result<> engine::add_script(const std::string &code)
    {
        scripts.emplace_back(code);
        return {};
    }

    result<> engine::navigate(const std::string &url, const headers &extra)
    {
        navigations.emplace_back(url);
        navigation_headers.emplace_back(extra);
        return {};
    }

    result<> engine::load_html(const std::string &content)
    {
        html.emplace_back(content);
        return {};
    }

    result<> engine::reload()
    {
        return {};
    }

    void engine::execute(const std::string &code, std::function<void(result<std::string>)> callback)
    {
        evaluations.push_back({code, std::move(callback)});
    }

    result<> engine::set_visible(bool value)
    {
        visible = value;
        return {};
    }

    result<> engine::resize(const rect &value)
    {
        bounds = value;
        return {};
    }

    result<> engine::zoom(double factor)
    {
        zoom_factor = factor;
        return {};
    }

    result<> engine::print()
    {
        return {};
    }

    result<> engine::open_devtools()
    {
        devtools = true;
        return {};
    }

    result<> engine::close_devtools()
    {
        devtools = false;
        return {};
    }

    bool engine::devtools_open() const
    {
        return devtools;
    }

    std::string engine::url() const
    {
        return navigations.empty() ? "about:blank" : navigations.back();
    }

    result<> engine::clear_browsing_data()
    {
        return {};
    }

    void engine::page_post(std::string message)
    {
        if (raise.message)
        {
            raise.message(std::move(message));
        }
    }

    std::shared_ptr<reply> engine::request(const std::string &target, std::string method, std::string body)
    {
        auto rtn    = std::make_shared<reply>();
        auto parsed = canopy::url::parse(target);

        if (!parsed || !raise.request)
        {
            return rtn;
        }

        auto name = parsed->scheme();
        auto data = std::vector<std::uint8_t>{body.begin(), body.end()};

        auto req = scheme::request{{
            .url     = parsed.value(),
            .method  = std::move(method),
            .headers = {{"Accept", "*/*"}},
            .body    = std::move(data),
        }};

        raise.request(name, std::move(req), std::make_unique<responder>(rtn, streaming));

        return rtn;
    }

    bool engine::drop(drop_event event)
    {
        if (!raise.drop)
        {
            return false;
        }

        return raise.drop(event);
    }

    void engine::complete(result<std::string> value)
    {
        if (evaluations.empty())
        {
            return;
        }

        auto evaluation = std::move(evaluations.front());
        evaluations.pop_front();

        if (evaluation.callback)
        {
            evaluation.callback(std::move(value));
        }
    }

    engine *current()
    {
        return latest;
    }

    void fail_next(std::optional<error> value)
    {
        failure = std::move(value);
    }

    void stream_next(bool value)
    {
        streams = value;
    }

    std::size_t run()
    {
        std::size_t count{0};

        while (true)
        {
            scheme::task task;

            {
                std::lock_guard lock{mutex};

                if (tasks.empty())
                {
                    break;
                }

                task = std::move(tasks.front());
                tasks.pop_front();
            }

            task();
            ++count;
        }

        return count;
    }

    std::size_t queued()
    {
        std::lock_guard lock{mutex};
        return tasks.size();
    }

    std::vector<std::string> &registered_schemes()
    {
        static std::vector<std::string> schemes;
        return schemes;
    }
} // namespace canopy::mock

namespace canopy
{
    result<std::unique_ptr<engine>> engine::create(const settings &config, events raise)
    {
        if (auto failure = std::exchange(mock::failure, std::nullopt); failure)
        {
            return unexpected{std::move(failure.value())};
        }

        auto rtn     = std::make_unique<mock::engine>(config, std::move(raise));
        mock::latest = rtn.get();

        return rtn;
    }

    result<> engine::register_scheme(const std::string &name)
    {
        mock::registered_schemes().emplace_back(name);
        return {};
    }
} // namespace canopy
