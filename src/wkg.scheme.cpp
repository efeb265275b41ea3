#include "wkg.scheme.impl.hpp"

#include "log.hpp"

#include <array>
#include <cerrno>
#include <format>
#include <cstring>

#include <unistd.h>
#include <sys/socket.h>

#include <glib-unix.h>
#include <gio/gunixinputstream.h>

namespace canopy::wkg
{
    static utils::g_object_ptr<WebKitURISchemeResponse> make_response(GInputStream *stream, gint64 length, int status, const std::string &mime,
                                                                       const std::map<std::string, std::string> &headers)
    {
        auto rtn            = utils::g_object_ptr<WebKitURISchemeResponse>{webkit_uri_scheme_response_new(stream, length)};
        auto *const values = soup_message_headers_new(SOUP_MESSAGE_HEADERS_RESPONSE);

        for (const auto &[name, value] : headers)
        {
            soup_message_headers_append(values, name.c_str(), value.c_str());
        }

        webkit_uri_scheme_response_set_content_type(rtn.get(), mime.empty() ? "application/octet-stream" : mime.c_str());
        webkit_uri_scheme_response_set_status(rtn.get(), status, nullptr);
        webkit_uri_scheme_response_set_http_headers(rtn.get(), values);

        return rtn;
    }

    // pipe_writer implementation

    pipe_writer::pipe_writer(int fd) : m_fd(fd) {}

    pipe_writer::~pipe_writer()
    {
        release();
    }

    void pipe_writer::push(stash data)
    {
        if (m_fd < 0 || m_closing)
        {
            return;
        }

        m_pending.insert(m_pending.end(), data.data(), data.data() + data.size());
        flush();
    }

    void pipe_writer::close()
    {
        m_closing = true;
        flush();
    }

    void pipe_writer::flush()
    {
        while (m_fd >= 0 && !m_pending.empty())
        {
            const auto written = ::send(m_fd, m_pending.data(), m_pending.size(), MSG_NOSIGNAL);

            if (written < 0 && errno == EINTR)
            {
                continue;
            }

            if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                if (m_source != 0)
                {
                    return;
                }

                static constexpr auto writable = [](gint, GIOCondition, gpointer data) -> gboolean
                {
                    auto self      = *static_cast<std::shared_ptr<pipe_writer> *>(data);
                    self->m_source = 0;

                    self->flush();

                    return G_SOURCE_REMOVE;
                };

                static constexpr auto destroy = [](gpointer data)
                {
                    delete static_cast<std::shared_ptr<pipe_writer> *>(data);
                };

                m_source = g_unix_fd_add_full(G_PRIORITY_DEFAULT, m_fd, G_IO_OUT, writable, new std::shared_ptr<pipe_writer>{shared_from_this()}, destroy);

                return;
            }

            if (written < 0)
            {
                logger()->debug("stream reader went away: {}", std::strerror(errno));

                m_pending.clear();
                release();

                return;
            }

            m_pending.erase(m_pending.begin(), m_pending.begin() + written);
        }

        if (m_closing && m_pending.empty())
        {
            release();
        }
    }

    void pipe_writer::release()
    {
        if (m_source != 0)
        {
            g_source_remove(std::exchange(m_source, 0));
        }

        if (m_fd >= 0)
        {
            ::close(std::exchange(m_fd, -1));
        }
    }

    // responder implementation

    responder::responder(utils::g_object_ptr<WebKitURISchemeRequest> request) : m_request(std::move(request)) {}

    responder::~responder()
    {
        if (m_writer)
        {
            m_writer->close();
            return;
        }

        if (m_answered)
        {
            return;
        }

        fail(WEBKIT_NETWORK_ERROR_CANCELLED, "request was dropped before it was answered");
    }

    void responder::respond(const scheme::response &value)
    {
        if (std::exchange(m_answered, true))
        {
            return;
        }

        const auto size = static_cast<gssize>(value.data.size());

        auto bytes    = utils::g_bytes_ptr{g_bytes_new(value.data.data(), size)};
        auto stream   = utils::g_object_ptr<GInputStream>{g_memory_input_stream_new_from_bytes(bytes.get())};
        auto response = make_response(stream.get(), size, value.status, value.mime, value.headers);

        webkit_uri_scheme_request_finish_with_response(m_request.get(), response.get());
    }

    bool responder::streams() const
    {
        return true;
    }

    void responder::start(const scheme::stream_response &head)
    {
        if (std::exchange(m_answered, true))
        {
            return;
        }

        std::array<int, 2> fds{};

        if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds.data()) == -1)
        {
            fail(WEBKIT_NETWORK_ERROR_FAILED, std::format("could not create stream: {}", std::strerror(errno)));
            return;
        }

        GError *error{nullptr};

        if (!g_unix_set_fd_nonblocking(fds[1], TRUE, &error))
        {
            auto reason = utils::g_error_ptr{error};

            ::close(fds[0]);
            ::close(fds[1]);

            fail(WEBKIT_NETWORK_ERROR_FAILED, std::format("could not create stream: {}", reason.get()->message));
            return;
        }

        m_writer = std::make_shared<pipe_writer>(fds[1]);

        auto stream   = utils::g_object_ptr<GInputStream>{g_unix_input_stream_new(fds[0], TRUE)};
        auto response = make_response(stream.get(), -1, head.status, head.mime, head.headers);

        webkit_uri_scheme_request_finish_with_response(m_request.get(), response.get());
    }

    void responder::write(stash data)
    {
        if (!m_writer)
        {
            return;
        }

        m_writer->push(std::move(data));
    }

    void responder::finish()
    {
        if (!m_writer)
        {
            return;
        }

        m_writer->close();
        m_writer.reset();
    }

    void responder::fail(int code, const std::string &reason)
    {
        static auto quark = webkit_network_error_quark();

        auto error = utils::g_error_ptr{g_error_new(quark, code, "%s", reason.c_str())};
        webkit_uri_scheme_request_finish_error(m_request.get(), error.get());
    }

    // handler implementation

    handler &handler::instance()
    {
        static handler rtn;
        return rtn;
    }

    void handler::add_callback(WebKitWebView *id, callback value)
    {
        m_callbacks.insert_or_assign(id, std::move(value));
    }

    void handler::del_callback(WebKitWebView *id)
    {
        m_callbacks.erase(id);
    }

    void handler::claim(const std::string &scheme)
    {
        if (m_schemes.contains(scheme))
        {
            return;
        }

        auto *const context  = webkit_web_context_get_default();
        auto *const security = webkit_web_context_get_security_manager(context);

        static constexpr auto route = [](WebKitURISchemeRequest *request, gpointer data)
        {
            handle(request, static_cast<handler *>(data));
        };

        webkit_web_context_register_uri_scheme(context, scheme.c_str(), route, this, nullptr);

        webkit_security_manager_register_uri_scheme_as_secure(security, scheme.c_str());
        webkit_security_manager_register_uri_scheme_as_cors_enabled(security, scheme.c_str());

        m_schemes.emplace(scheme);
        logger()->debug("registered scheme \"{}\" on the default web context", scheme);
    }

    void handler::handle(WebKitURISchemeRequest *raw, handler *state)
    {
        auto request           = utils::g_object_ptr<WebKitURISchemeRequest>::ref(raw);
        auto *const identifier = webkit_uri_scheme_request_get_web_view(request.get());
        auto answer            = std::make_unique<responder>(request);

        auto it = state->m_callbacks.find(identifier);

        if (it == state->m_callbacks.end())
        {
            answer->respond({.data = stash::view_str("not found"), .mime = "text/plain", .status = 404});
            return;
        }

        auto url = canopy::url::parse(webkit_uri_scheme_request_get_uri(request.get()));

        if (!url)
        {
            answer->respond({.data = stash::view_str(url.error().message()), .mime = "text/plain", .status = 400});
            return;
        }

        std::map<std::string, std::string> headers;

        if (auto *const values = webkit_uri_scheme_request_get_http_headers(request.get()); values)
        {
            SoupMessageHeadersIter iter;
            const char *name{};
            const char *value{};

            soup_message_headers_iter_init(&iter, values);

            while (soup_message_headers_iter_next(&iter, &name, &value))
            {
                headers.insert_or_assign(name, value);
            }
        }

        std::vector<std::uint8_t> body;

        if (auto stream = utils::g_object_ptr<GInputStream>{webkit_uri_scheme_request_get_http_body(request.get())}; stream)
        {
            std::array<std::uint8_t, 16384> buffer{};
            gsize read{0};

            while (g_input_stream_read_all(stream.get(), buffer.data(), buffer.size(), &read, nullptr, nullptr) && read > 0)
            {
                body.insert(body.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(read));
            }
        }

        const auto *method = webkit_uri_scheme_request_get_http_method(request.get());
        const auto name    = std::string{webkit_uri_scheme_request_get_scheme(request.get())};

        auto req = scheme::request{{
            .url     = std::move(url.value()),
            .method  = method ? method : "GET",
            .headers = std::move(headers),
            .body    = std::move(body),
        }};

        // The callback may remove itself from the map when the handler destroys its webview
        auto target = it->second;
        target(name, std::move(req), std::move(answer));
    }
} // namespace canopy::wkg
