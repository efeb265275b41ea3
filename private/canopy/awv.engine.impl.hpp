#pragma once

#include "engine.hpp"

#include <deque>
#include <memory>
#include <cstdint>
#include <unordered_map>

#include <jni.h>
#include <android/looper.h>

#include <lockpp/lock.hpp>

namespace canopy::awv
{
    // Runs tasks on the looper of the thread that created it. Created once and never destroyed.
    class looper_queue
    {
        int m_read;
        int m_write;

      private:
        lockpp::lock<std::deque<scheme::task>> m_tasks;

      private:
        looper_queue(int read, int write);

      public:
        void push(scheme::task);

      public:
        [[nodiscard]] static result<looper_queue *> main();

      private:
        static int drain(int fd, int events, void *data);
    };

    // Everything the Java side reaches through its handle. Only touched on the owning thread.
    struct state
    {
        engine::events raise;
        looper_queue *queue;

      public:
        std::uint64_t next_evaluation{0};
        std::unordered_map<std::uint64_t, std::function<void(result<std::string>)>> evaluations;
    };

    using handle = std::shared_ptr<state>;

    class engine : public canopy::engine
    {
        handle m_state;
        jobject m_view{nullptr};

      public:
        engine(events, looper_queue *);

      public:
        ~engine() override;

      public:
        result<> setup(jobject parent, const settings &);

      public:
        [[nodiscard]] canopy::capabilities supported() const override;
        [[nodiscard]] std::string transport() const override;

      public:
        void post(scheme::task) override;
        void detach() override;

      public:
        result<> add_script(const std::string &code) override;

      public:
        result<> navigate(const std::string &url, const headers &extra) override;
        result<> load_html(const std::string &html) override;
        result<> reload() override;

      public:
        void execute(const std::string &code, std::function<void(result<std::string>)> callback) override;

      public:
        result<> set_visible(bool visible) override;
        result<> resize(const rect &bounds) override;

      public:
        result<> zoom(double factor) override;
        result<> print() override;

      public:
        result<> open_devtools() override;
        result<> close_devtools() override;
        [[nodiscard]] bool devtools_open() const override;

      public:
        [[nodiscard]] std::string url() const override;
        result<> clear_browsing_data() override;
    };
} // namespace canopy::awv

namespace canopy::jni
{
    struct classes
    {
        jclass view;
        jclass response;
        jclass string;

      public:
        jmethodID string_init;
        jmethodID string_bytes;

      public:
        jmethodID create;
        jmethodID release;
        jmethodID destroy;
        jmethodID add_script;
        jmethodID navigate;
        jmethodID load_html;
        jmethodID reload;
        jmethodID evaluate;
        jmethodID set_visible;
        jmethodID set_bounds;
        jmethodID zoom;
        jmethodID url;
        jmethodID clear_browsing_data;

      public:
        jmethodID response_init;
    };

    [[nodiscard]] result<JNIEnv *> env();
    [[nodiscard]] const classes *glue();

    // Clears a pending Java exception and reports it as an engine error
    [[nodiscard]] result<> check(JNIEnv *, std::string_view what);

    [[nodiscard]] jstring to_java(JNIEnv *, const std::string &);
    [[nodiscard]] std::string from_java(JNIEnv *, jstring);
} // namespace canopy::jni
