#pragma once

#include "scheme.impl.hpp"
#include "utils/gtk.hpp"

#include <set>
#include <vector>
#include <memory>
#include <string>
#include <unordered_map>

#include <webkit/webkit.h>

namespace canopy::wkg
{
    using callback = std::function<void(const std::string &, scheme::request, std::unique_ptr<scheme::responder>)>;

    // Routes scheme requests of the shared web context to the webview they originate from
    class handler
    {
        std::set<std::string> m_schemes;
        std::unordered_map<WebKitWebView *, callback> m_callbacks;

      public:
        void add_callback(WebKitWebView *, callback);
        void del_callback(WebKitWebView *);

      public:
        // Registers the scheme on the default web context, once per process
        void claim(const std::string &scheme);

      public:
        static handler &instance();
        static void handle(WebKitURISchemeRequest *, handler *);
    };

    // Write end of a streamed body, drains into the socket whenever it becomes writable
    class pipe_writer : public std::enable_shared_from_this<pipe_writer>
    {
        int m_fd;
        guint m_source{0};

      private:
        std::vector<std::uint8_t> m_pending;
        bool m_closing{false};

      public:
        explicit pipe_writer(int fd);

      public:
        ~pipe_writer();

      public:
        void push(stash data);
        void close();

      private:
        void flush();
        void release();
    };

    class responder : public scheme::responder
    {
        utils::g_object_ptr<WebKitURISchemeRequest> m_request;
        std::shared_ptr<pipe_writer> m_writer;
        bool m_answered{false};

      public:
        explicit responder(utils::g_object_ptr<WebKitURISchemeRequest> request);

      public:
        ~responder() override;

      public:
        void respond(const scheme::response &) override;

      public:
        [[nodiscard]] bool streams() const override;

      public:
        void start(const scheme::stream_response &) override;
        void write(stash data) override;
        void finish() override;

      private:
        void fail(int code, const std::string &reason);
    };
} // namespace canopy::wkg
