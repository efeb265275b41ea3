#pragma once

#include <canopy/error.hpp>
#include <canopy/scheme.hpp>

#include <memory>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>

#include <lockpp/lock.hpp>

namespace canopy::scheme
{
    using task     = std::function<void()>;
    using poster   = std::function<void(task)>;
    using reporter = std::function<void(const canopy::error &)>;

    struct request::impl
    {
        canopy::url url;
        std::string method;
        std::map<std::string, std::string> headers;
        std::vector<std::uint8_t> body;
    };

    // Engine side of one intercepted request. Only ever called on the thread owning the webview.
    // Destroying a responder that has not completed must release the native request without touching the page.
    class responder
    {
      public:
        virtual ~responder() = default;

      public:
        virtual void respond(const response &) = 0;

      public:
        // Whether the engine accepts incremental bodies, otherwise streams are buffered and delivered on finish
        [[nodiscard]] virtual bool streams() const = 0;

      public:
        virtual void start(const stream_response &) = 0;
        virtual void write(stash) = 0;
        virtual void finish() = 0;
    };

    enum class stage : std::uint8_t
    {
        intercepted,
        invoked,
        ready,
        failed,
        streaming,
        delivered,
        cancelled,
    };

    class pending : public std::enable_shared_from_this<pending>
    {
        struct state
        {
            stage current{stage::intercepted};
            std::unique_ptr<responder> target;

          public:
            std::optional<stream_response> head;
            std::vector<std::uint8_t> buffer;
        };

      private:
        std::uint64_t m_id;
        bool m_streams;

      private:
        poster m_post;
        reporter m_report;
        std::function<void(std::uint64_t)> m_release;

      private:
        lockpp::lock<state> m_state;

      public:
        pending(std::uint64_t id, std::unique_ptr<responder>, poster, reporter, std::function<void(std::uint64_t)> release);

      public:
        [[nodiscard]] std::uint64_t id() const;
        [[nodiscard]] stage current() const;
        [[nodiscard]] bool valid() const;

      public:
        void invoke();
        void cancel();

      public:
        void resolve(const response &);
        void reject(error);
        void fail(int status, std::string reason);
        void abandon();

      public:
        // Answers with 500 and reports the handler's failure on the owning thread
        void raise(canopy::error reason);

      public:
        void start(const stream_response &);
        void write(stash);
        void finish();

      private:
        void settle(state &, stage, response);
        void schedule(std::function<void(responder &)> action, bool last);
    };

    struct executor::impl
    {
        std::shared_ptr<pending> slot;

      public:
        ~impl();
    };

    [[nodiscard]] int status_of(error);
} // namespace canopy::scheme
