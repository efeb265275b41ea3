#include "awv.engine.impl.hpp"

#include "log.hpp"

#include <canopy/android.hpp>

#include <map>
#include <mutex>
#include <atomic>
#include <format>
#include <iterator>
#include <optional>
#include <condition_variable>

namespace canopy::jni
{
    static std::atomic<JavaVM *> vm{nullptr};
    static std::optional<classes> cached;

    result<JNIEnv *> env()
    {
        auto *const machine = vm.load();

        if (!machine)
        {
            return unexpected{error::engine("the java vm is unknown, see canopy::android::attach")};
        }

        JNIEnv *rtn{nullptr};

        if (machine->GetEnv(reinterpret_cast<void **>(&rtn), JNI_VERSION_1_6) == JNI_OK)
        {
            return rtn;
        }

        if (const auto status = machine->AttachCurrentThread(&rtn, nullptr); status != JNI_OK)
        {
            return unexpected{error::engine("could not attach thread to the java vm", status)};
        }

        return rtn;
    }

    const classes *glue()
    {
        return cached ? &cached.value() : nullptr;
    }

    result<> check(JNIEnv *env, std::string_view what)
    {
        if (!env->ExceptionCheck())
        {
            return {};
        }

        env->ExceptionDescribe();
        env->ExceptionClear();

        return unexpected{error::engine(std::format("java exception in {}", what))};
    }

    jstring to_java(JNIEnv *env, const std::string &value)
    {
        const auto *const glue = jni::glue();

        auto *const bytes = env->NewByteArray(static_cast<jsize>(value.size()));
        env->SetByteArrayRegion(bytes, 0, static_cast<jsize>(value.size()), reinterpret_cast<const jbyte *>(value.data()));

        auto *const charset = env->NewStringUTF("UTF-8");
        auto *const rtn     = static_cast<jstring>(env->NewObject(glue->string, glue->string_init, bytes, charset));

        env->DeleteLocalRef(charset);
        env->DeleteLocalRef(bytes);

        return rtn;
    }

    std::string from_java(JNIEnv *env, jstring value)
    {
        if (!value)
        {
            return {};
        }

        const auto *const glue = jni::glue();

        auto *const charset = env->NewStringUTF("UTF-8");
        auto *const bytes   = static_cast<jbyteArray>(env->CallObjectMethod(value, glue->string_bytes, charset));

        env->DeleteLocalRef(charset);

        if (!bytes)
        {
            return {};
        }

        std::string rtn(static_cast<std::size_t>(env->GetArrayLength(bytes)), '\0');
        env->GetByteArrayRegion(bytes, 0, static_cast<jsize>(rtn.size()), reinterpret_cast<jbyte *>(rtn.data()));

        env->DeleteLocalRef(bytes);

        return rtn;
    }
} // namespace canopy::jni

namespace canopy::awv
{
    namespace
    {
        struct waiter
        {
            std::mutex mutex;
            std::condition_variable changed;

          public:
            bool done{false};
            std::optional<scheme::response> response;
        };

        // Hands the response to the engine thread blocked in shouldInterceptRequest
        class responder : public scheme::responder
        {
            std::shared_ptr<waiter> m_waiter;

          public:
            explicit responder(std::shared_ptr<waiter> target) : m_waiter(std::move(target)) {}

          public:
            ~responder() override
            {
                settle(std::nullopt);
            }

          public:
            void respond(const scheme::response &value) override
            {
                settle(value);
            }

          public:
            [[nodiscard]] bool streams() const override
            {
                return false;
            }

          public:
            void start(const scheme::stream_response &) override {}
            void write(stash) override {}
            void finish() override {}

          private:
            void settle(std::optional<scheme::response> value)
            {
                {
                    std::lock_guard lock{m_waiter->mutex};

                    if (m_waiter->done)
                    {
                        return;
                    }

                    m_waiter->done     = true;
                    m_waiter->response = std::move(value);
                }

                m_waiter->changed.notify_all();
            }
        };

        handle &from(jlong value)
        {
            return *reinterpret_cast<handle *>(value);
        }
    } // namespace

    static jlong retain(JNIEnv *, jclass, jlong value)
    {
        return reinterpret_cast<jlong>(new handle{from(value)});
    }

    static void drop(JNIEnv *, jclass, jlong value)
    {
        delete &from(value);
    }

    // Called on the JavaBridge thread
    static void message(JNIEnv *env, jclass, jlong value, jstring content)
    {
        const auto target = from(value);

        target->queue->push(
            [weak = std::weak_ptr<state>{target}, text = jni::from_java(env, content)]() mutable
            {
                auto self = weak.lock();

                if (!self || !self->raise.message)
                {
                    return;
                }

                self->raise.message(std::move(text));
            });
    }

    // Called on the engine's IO thread, which stays blocked until the request was answered on the owning thread
    static jobject intercept(JNIEnv *env, jclass, jlong value, jstring address, jstring method, jobjectArray fields)
    {
        const auto target = from(value);
        auto parsed       = url::parse(jni::from_java(env, address));

        if (!parsed)
        {
            logger()->warn("ignoring malformed scheme request: {}", parsed.error().what());
            return nullptr;
        }

        std::map<std::string, std::string> headers;

        for (jsize i = 0; fields && i + 1 < env->GetArrayLength(fields); i += 2)
        {
            auto *const name    = static_cast<jstring>(env->GetObjectArrayElement(fields, i));
            auto *const content = static_cast<jstring>(env->GetObjectArrayElement(fields, i + 1));

            headers.emplace(jni::from_java(env, name), jni::from_java(env, content));

            env->DeleteLocalRef(name);
            env->DeleteLocalRef(content);
        }

        auto name    = parsed->scheme();
        auto request = scheme::request{{
            .url     = std::move(parsed.value()),
            .method  = jni::from_java(env, method),
            .headers = std::move(headers),
            .body    = {},
        }};

        auto pending = std::make_shared<waiter>();
        auto answer  = std::make_shared<std::unique_ptr<scheme::responder>>(std::make_unique<responder>(pending));

        target->queue->push(
            [weak = std::weak_ptr<state>{target}, name = std::move(name), request = std::move(request), answer]() mutable
            {
                auto self = weak.lock();

                if (!self || !self->raise.request)
                {
                    answer->reset();
                    return;
                }

                self->raise.request(name, std::move(request), std::move(*answer));
            });

        // The queued task may hold the only other reference, dropping ours lets an unrun task release the waiter
        answer.reset();

        std::unique_lock lock{pending->mutex};
        pending->changed.wait(lock, [&pending] { return pending->done; });

        if (!pending->response)
        {
            return nullptr;
        }

        const auto &response = pending->response.value();
        const auto *const glue = jni::glue();

        auto *const mime = jni::to_java(env, response.mime.empty() ? "application/octet-stream" : response.mime);
        auto *const list = env->NewObjectArray(static_cast<jsize>(response.headers.size() * 2), glue->string, nullptr);

        jsize index{0};

        for (const auto &[key, content] : response.headers)
        {
            auto *const java_key     = jni::to_java(env, key);
            auto *const java_content = jni::to_java(env, content);

            env->SetObjectArrayElement(list, index++, java_key);
            env->SetObjectArrayElement(list, index++, java_content);

            env->DeleteLocalRef(java_key);
            env->DeleteLocalRef(java_content);
        }

        auto *const body = env->NewByteArray(static_cast<jsize>(response.data.size()));
        env->SetByteArrayRegion(body, 0, static_cast<jsize>(response.data.size()), reinterpret_cast<const jbyte *>(response.data.data()));

        auto *const rtn = env->NewObject(glue->response, glue->response_init, static_cast<jint>(response.status), mime, list, body);

        env->DeleteLocalRef(mime);
        env->DeleteLocalRef(list);
        env->DeleteLocalRef(body);

        if (auto ok = jni::check(env, "intercept"); !ok)
        {
            logger()->error("could not build scheme response: {}", ok.error().what());
            return nullptr;
        }

        return rtn;
    }

    static jboolean navigation(JNIEnv *env, jclass, jlong value, jstring address)
    {
        const auto &target = from(value);

        if (!target->raise.navigation)
        {
            return JNI_TRUE;
        }

        return target->raise.navigation(jni::from_java(env, address)) ? JNI_TRUE : JNI_FALSE;
    }

    static void load(JNIEnv *env, jclass, jlong value, jboolean finished, jstring address)
    {
        const auto &target = from(value);

        if (!target->raise.load)
        {
            return;
        }

        target->raise.load(finished ? page_load::finished : page_load::started, jni::from_java(env, address));
    }

    static void crashed(JNIEnv *, jclass, jlong value, jboolean crash)
    {
        const auto &target = from(value);

        if (!target->raise.crashed)
        {
            return;
        }

        target->raise.crashed(error::engine(crash ? "render process crashed" : "render process was killed"));
    }

    static void evaluated(JNIEnv *env, jclass, jlong value, jlong id, jstring json)
    {
        const auto &target = from(value);
        auto it            = target->evaluations.find(static_cast<std::uint64_t>(id));

        if (it == target->evaluations.end())
        {
            return;
        }

        auto callback = std::move(it->second);
        target->evaluations.erase(it);

        if (!callback)
        {
            return;
        }

        // evaluateJavascript hands back json text, exceptions are indistinguishable from `null`
        callback(json ? jni::from_java(env, json) : std::string{"null"});
    }

    static result<> bind(JNIEnv *env)
    {
        auto find = [env](const char *name) -> jclass
        {
            auto *const local = env->FindClass(name);

            if (!local)
            {
                return nullptr;
            }

            auto *const rtn = static_cast<jclass>(env->NewGlobalRef(local));
            env->DeleteLocalRef(local);

            return rtn;
        };

        jni::classes rtn{};

        rtn.view     = find("dev/canopy/CanopyWebView");
        rtn.response = find("dev/canopy/Response");
        rtn.string   = find("java/lang/String");

        if (!rtn.view || !rtn.response || !rtn.string)
        {
            static_cast<void>(jni::check(env, "class lookup"));
            return unexpected{error::engine("the canopy java classes are missing, ship the android/ glue with the app")};
        }

        rtn.string_init  = env->GetMethodID(rtn.string, "<init>", "([BLjava/lang/String;)V");
        rtn.string_bytes = env->GetMethodID(rtn.string, "getBytes", "(Ljava/lang/String;)[B");

        rtn.create = env->GetStaticMethodID(rtn.view, "create",
                                            "(Landroid/view/ViewGroup;JZZZLjava/lang/String;Z[Ljava/lang/String;IIIIZ)Ldev/canopy/CanopyWebView;");

        rtn.release             = env->GetMethodID(rtn.view, "release", "()V");
        rtn.destroy             = env->GetMethodID(rtn.view, "destroy", "()V");
        rtn.add_script          = env->GetMethodID(rtn.view, "addScript", "(Ljava/lang/String;)V");
        rtn.navigate            = env->GetMethodID(rtn.view, "navigate", "(Ljava/lang/String;[Ljava/lang/String;)V");
        rtn.load_html           = env->GetMethodID(rtn.view, "loadHtml", "(Ljava/lang/String;)V");
        rtn.reload              = env->GetMethodID(rtn.view, "reload", "()V");
        rtn.evaluate            = env->GetMethodID(rtn.view, "evaluate", "(Ljava/lang/String;J)V");
        rtn.set_visible         = env->GetMethodID(rtn.view, "setVisible", "(Z)V");
        rtn.set_bounds          = env->GetMethodID(rtn.view, "setBounds", "(IIII)V");
        rtn.zoom                = env->GetMethodID(rtn.view, "zoom", "(D)V");
        rtn.url                 = env->GetMethodID(rtn.view, "url", "()Ljava/lang/String;");
        rtn.clear_browsing_data = env->GetMethodID(rtn.view, "clearBrowsingData", "()V");

        rtn.response_init = env->GetMethodID(rtn.response, "<init>", "(ILjava/lang/String;[Ljava/lang/String;[B)V");

        if (auto ok = jni::check(env, "method lookup"); !ok)
        {
            return ok;
        }

        static const JNINativeMethod natives[] = {
            {"nativeRetain", "(J)J", reinterpret_cast<void *>(retain)},
            {"nativeDrop", "(J)V", reinterpret_cast<void *>(drop)},
            {"nativeMessage", "(JLjava/lang/String;)V", reinterpret_cast<void *>(message)},
            {"nativeIntercept", "(JLjava/lang/String;Ljava/lang/String;[Ljava/lang/String;)Ldev/canopy/Response;",
             reinterpret_cast<void *>(intercept)},
            {"nativeNavigation", "(JLjava/lang/String;)Z", reinterpret_cast<void *>(navigation)},
            {"nativeLoad", "(JZLjava/lang/String;)V", reinterpret_cast<void *>(load)},
            {"nativeCrashed", "(JZ)V", reinterpret_cast<void *>(crashed)},
            {"nativeEvaluated", "(JJLjava/lang/String;)V", reinterpret_cast<void *>(evaluated)},
        };

        if (env->RegisterNatives(rtn.view, natives, std::size(natives)) != JNI_OK)
        {
            static_cast<void>(jni::check(env, "RegisterNatives"));
            return unexpected{error::engine("could not register canopy natives")};
        }

        jni::cached = rtn;

        return {};
    }
} // namespace canopy::awv

namespace canopy::android
{
    result<> attach(JavaVM *machine)
    {
        if (!machine)
        {
            return unexpected{error::configuration("no java vm given")};
        }

        jni::vm = machine;

        if (jni::glue())
        {
            return {};
        }

        auto env = jni::env();

        if (!env)
        {
            return unexpected{env.error()};
        }

        return awv::bind(env.value());
    }
} // namespace canopy::android

extern "C" JNIEXPORT jint JNI_OnLoad(JavaVM *vm, void *)
{
    if (auto ok = canopy::android::attach(vm); !ok)
    {
        canopy::logger()->error("could not set up the java glue: {}", ok.error().what());
    }

    return JNI_VERSION_1_6;
}
