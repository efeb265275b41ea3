#pragma once

#include "url.hpp"
#include "stash/stash.hpp"

#include <memory>
#include <cstdint>

#include <map>
#include <string>
#include <variant>
#include <functional>

namespace canopy::scheme
{
    enum class error : std::int16_t
    {
        not_found = 404,
        invalid   = 400,
        denied    = 401,
        failed    = -1,
    };

    struct response
    {
        stash data{stash::empty()};
        std::string mime;
        std::map<std::string, std::string> headers;

      public:
        int status{200};
    };

    // Initial response for streaming, sent before any data chunks
    struct stream_response
    {
        std::string mime;
        std::map<std::string, std::string> headers;

      public:
        int status{200};
    };

    struct request
    {
        struct impl;

      private:
        std::unique_ptr<impl> m_impl;

      public:
        request(impl);

      public:
        request(const request &);
        request(request &&) noexcept;

      public:
        ~request();

      public:
        [[nodiscard]] canopy::url url() const;
        [[nodiscard]] std::string method() const;

      public:
        [[nodiscard]] stash content() const;
        [[nodiscard]] std::map<std::string, std::string> headers() const;
    };

    // Completes exactly one intercepted request. Copies share the same request, the first completion wins.
    // May be used from any thread, the response is handed to the engine on the thread owning the webview.
    class executor
    {
      public:
        struct impl;

      private:
        std::shared_ptr<impl> m_impl;

      public:
        executor(std::shared_ptr<impl>);

      public:
        executor(const executor &);
        executor(executor &&) noexcept;

      public:
        ~executor();

      public:
        void resolve(const response &) const;
        void reject(error) const;

      public:
        // Start the stream with initial headers (must be called first)
        void start(const stream_response &) const;

        // Write a chunk of data to the stream
        void write(stash data) const;

        // Finish the stream (no more data will be sent)
        void finish() const;

      public:
        // False once the request was answered or the owning webview is gone
        [[nodiscard]] bool valid() const;
    };

    using resolver      = std::function<void(request, executor)>;
    using sync_resolver = std::function<response(const request &)>;

    using handler = std::variant<resolver, sync_resolver>;
} // namespace canopy::scheme
