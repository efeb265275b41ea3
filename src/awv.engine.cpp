#include "awv.engine.impl.hpp"

#include "log.hpp"

#include <cerrno>
#include <format>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace canopy::awv
{
    // looper_queue implementation

    looper_queue::looper_queue(int read, int write) : m_read(read), m_write(write) {}

    result<looper_queue *> looper_queue::main()
    {
        static looper_queue *instance{nullptr};

        if (instance)
        {
            return instance;
        }

        auto *const looper = ALooper_forThread();

        if (!looper)
        {
            return unexpected{error::thread_affinity("webviews have to be created on a thread with a looper")};
        }

        int fds[2];

        if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0)
        {
            return unexpected{error::engine("could not create task pipe", errno)};
        }

        instance = new looper_queue{fds[0], fds[1]};

        ALooper_addFd(looper, fds[0], ALOOPER_POLL_CALLBACK, ALOOPER_EVENT_INPUT, drain, instance);

        return instance;
    }

    void looper_queue::push(scheme::task task)
    {
        m_tasks.write()->emplace_back(std::move(task));

        static constexpr char wake{1};

        while (::write(m_write, &wake, 1) < 0 && errno == EINTR)
        {
        }
    }

    int looper_queue::drain(int fd, int, void *data)
    {
        auto *const self = static_cast<looper_queue *>(data);

        char buffer[64];

        while (::read(fd, buffer, sizeof(buffer)) > 0)
        {
        }

        while (true)
        {
            scheme::task task;

            {
                auto locked = self->m_tasks.write();

                if (locked->empty())
                {
                    break;
                }

                task = std::move(locked->front());
                locked->pop_front();
            }

            task();
        }

        return 1;
    }

    // engine implementation

    engine::engine(events raise, looper_queue *queue) : m_state(std::make_shared<state>(state{.raise = std::move(raise), .queue = queue})) {}

    engine::~engine()
    {
        detach();

        if (!m_view)
        {
            return;
        }

        auto env = jni::env();

        if (!env)
        {
            logger()->error("could not destroy webview: {}", env.error().what());
            return;
        }

        env.value()->CallVoidMethod(m_view, jni::glue()->destroy);

        if (auto ok = jni::check(env.value(), "destroy"); !ok)
        {
            logger()->error("could not destroy webview: {}", ok.error().what());
        }

        env.value()->DeleteGlobalRef(m_view);
    }

    result<> engine::setup(jobject parent, const settings &config)
    {
        auto env = jni::env();

        if (!env)
        {
            return unexpected{env.error()};
        }

        auto *const java = env.value();
        const auto *const glue = jni::glue();

        auto *const schemes = java->NewObjectArray(static_cast<jsize>(config.schemes.size()), glue->string, nullptr);

        for (jsize i = 0; i < static_cast<jsize>(config.schemes.size()); ++i)
        {
            auto *const name = jni::to_java(java, config.schemes[i]);

            java->SetObjectArrayElement(schemes, i, name);
            java->DeleteLocalRef(name);
        }

        auto *const agent = config.user_agent ? jni::to_java(java, config.user_agent.value()) : nullptr;
        const auto bounds = config.bounds.value_or(rect{0, 0, 0, 0});

        // Owned by the java side from here on, released through CanopyWebView.release
        auto *const owned = new handle{m_state};

        auto *const created = java->CallStaticObjectMethod(glue->view, glue->create, parent, reinterpret_cast<jlong>(owned), config.transparent,
                                                           config.incognito, config.autoplay, agent, config.devtools, schemes, bounds.x,
                                                           bounds.y, bounds.width, bounds.height, !config.bounds.has_value());

        java->DeleteLocalRef(schemes);

        if (agent)
        {
            java->DeleteLocalRef(agent);
        }

        if (auto ok = jni::check(java, "CanopyWebView.create"); !ok || !created)
        {
            delete owned;
            return unexpected{ok ? error::engine("could not create webview") : ok.error()};
        }

        m_view = java->NewGlobalRef(created);
        java->DeleteLocalRef(created);

        return {};
    }

    canopy::capabilities engine::supported() const
    {
        return {
            capability::transparent,
            capability::zoom,
            capability::user_agent,
            capability::browsing_data,
        };
    }

    std::string engine::transport() const
    {
        return "function (message) { window.__canopy.post(message); }";
    }

    void engine::post(scheme::task task)
    {
        m_state->queue->push(std::move(task));
    }

    void engine::detach()
    {
        if (!m_state->raise.message && !m_state->raise.request && !m_view)
        {
            return;
        }

        m_state->raise = {};
        m_state->evaluations.clear();

        if (!m_view)
        {
            return;
        }

        auto env = jni::env();

        if (!env)
        {
            logger()->error("could not release webview: {}", env.error().what());
            return;
        }

        env.value()->CallVoidMethod(m_view, jni::glue()->release);

        if (auto ok = jni::check(env.value(), "release"); !ok)
        {
            logger()->error("could not release webview: {}", ok.error().what());
        }
    }

    // Calls a void method of the java view, converting a thrown exception
    template <typename... Ts>
    static result<> call(jobject view, jmethodID method, std::string_view what, Ts &&...args)
    {
        auto env = jni::env();

        if (!env)
        {
            return unexpected{env.error()};
        }

        env.value()->CallVoidMethod(view, method, std::forward<Ts>(args)...);

        return jni::check(env.value(), what);
    }

    result<> engine::add_script(const std::string &code)
    {
        auto env = jni::env();

        if (!env)
        {
            return unexpected{env.error()};
        }

        auto *const source = jni::to_java(env.value(), code);
        auto rtn           = call(m_view, jni::glue()->add_script, "addScript", source);

        env.value()->DeleteLocalRef(source);

        return rtn;
    }

    result<> engine::navigate(const std::string &url, const headers &extra)
    {
        auto env = jni::env();

        if (!env)
        {
            return unexpected{env.error()};
        }

        auto *const java = env.value();
        auto *const list = java->NewObjectArray(static_cast<jsize>(extra.size() * 2), jni::glue()->string, nullptr);

        jsize index{0};

        for (const auto &[name, value] : extra)
        {
            auto *const java_name  = jni::to_java(java, name);
            auto *const java_value = jni::to_java(java, value);

            java->SetObjectArrayElement(list, index++, java_name);
            java->SetObjectArrayElement(list, index++, java_value);

            java->DeleteLocalRef(java_name);
            java->DeleteLocalRef(java_value);
        }

        auto *const target = jni::to_java(java, url);
        auto rtn           = call(m_view, jni::glue()->navigate, "navigate", target, list);

        java->DeleteLocalRef(target);
        java->DeleteLocalRef(list);

        return rtn;
    }

    result<> engine::load_html(const std::string &html)
    {
        auto env = jni::env();

        if (!env)
        {
            return unexpected{env.error()};
        }

        auto *const content = jni::to_java(env.value(), html);
        auto rtn            = call(m_view, jni::glue()->load_html, "loadHtml", content);

        env.value()->DeleteLocalRef(content);

        return rtn;
    }

    result<> engine::reload()
    {
        return call(m_view, jni::glue()->reload, "reload");
    }

    void engine::execute(const std::string &code, std::function<void(result<std::string>)> callback)
    {
        auto env = jni::env();

        if (!env)
        {
            logger()->error("could not execute script: {}", env.error().what());
            return;
        }

        const auto id = m_state->next_evaluation++;
        m_state->evaluations.emplace(id, std::move(callback));

        auto *const source = jni::to_java(env.value(), code);

        if (auto ok = call(m_view, jni::glue()->evaluate, "evaluate", source, static_cast<jlong>(id)); !ok)
        {
            logger()->error("could not execute script: {}", ok.error().what());
            m_state->evaluations.erase(id);
        }

        env.value()->DeleteLocalRef(source);
    }

    result<> engine::set_visible(bool visible)
    {
        return call(m_view, jni::glue()->set_visible, "setVisible", static_cast<jboolean>(visible));
    }

    result<> engine::resize(const rect &bounds)
    {
        return call(m_view, jni::glue()->set_bounds, "setBounds", static_cast<jint>(bounds.x), static_cast<jint>(bounds.y),
                    static_cast<jint>(bounds.width), static_cast<jint>(bounds.height));
    }

    result<> engine::zoom(double factor)
    {
        return call(m_view, jni::glue()->zoom, "zoom", static_cast<jdouble>(factor));
    }

    result<> engine::print()
    {
        return {};
    }

    result<> engine::open_devtools()
    {
        return {};
    }

    result<> engine::close_devtools()
    {
        return {};
    }

    bool engine::devtools_open() const
    {
        return false;
    }

    std::string engine::url() const
    {
        auto env = jni::env();

        if (!env)
        {
            return "about:blank";
        }

        auto *const value = static_cast<jstring>(env.value()->CallObjectMethod(m_view, jni::glue()->url));

        if (auto ok = jni::check(env.value(), "url"); !ok || !value)
        {
            return "about:blank";
        }

        auto rtn = jni::from_java(env.value(), value);
        env.value()->DeleteLocalRef(value);

        return rtn.empty() ? "about:blank" : rtn;
    }

    result<> engine::clear_browsing_data()
    {
        return call(m_view, jni::glue()->clear_browsing_data, "clearBrowsingData");
    }
} // namespace canopy::awv

namespace canopy
{
    result<std::unique_ptr<engine>> engine::create(const settings &config, events raise)
    {
        if (!jni::glue())
        {
            return unexpected{error::engine("the java glue is not set up, see canopy::android::attach")};
        }

        auto queue = awv::looper_queue::main();

        if (!queue)
        {
            return unexpected{queue.error()};
        }

        auto rtn = std::make_unique<awv::engine>(std::move(raise), queue.value());

        if (auto ok = rtn->setup(static_cast<jobject>(config.parent), config); !ok)
        {
            return unexpected{ok.error()};
        }

        return rtn;
    }

    result<> engine::register_scheme(const std::string &name)
    {
        logger()->debug("scheme \"{}\" is intercepted per webview", name);
        return {};
    }
} // namespace canopy
