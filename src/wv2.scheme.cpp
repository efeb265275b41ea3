#include "wv2.scheme.impl.hpp"

#include "log.hpp"
#include "utils/win32.hpp"

#include <array>
#include <cctype>
#include <utility>
#include <format>
#include <algorithm>

#include <shlwapi.h>

namespace canopy::wv2
{
    static std::wstring_view phrase_of(int status)
    {
        switch (status)
        {
        case 200:
            return L"OK";
        case 204:
            return L"No Content";
        case 206:
            return L"Partial Content";
        case 301:
            return L"Moved Permanently";
        case 302:
            return L"Found";
        case 304:
            return L"Not Modified";
        case 400:
            return L"Bad Request";
        case 401:
            return L"Unauthorized";
        case 403:
            return L"Forbidden";
        case 404:
            return L"Not Found";
        case 500:
            return L"Internal Server Error";
        default:
            return status < 400 ? L"OK" : L"Error";
        }
    }

    static bool is_content_type(std::string_view name)
    {
        static constexpr std::string_view expected = "content-type";

        return std::ranges::equal(name, expected, [](char a, char b)
                                  { return std::tolower(static_cast<unsigned char>(a)) == b; });
    }

    responder::responder(ComPtr<ICoreWebView2Environment> environment, ComPtr<ICoreWebView2WebResourceRequestedEventArgs> args,
                         ComPtr<ICoreWebView2Deferral> deferral)
        : m_environment(std::move(environment)), m_args(std::move(args)), m_deferral(std::move(deferral))
    {
    }

    responder::~responder()
    {
        if (m_answered)
        {
            return;
        }

        // Without a response the engine goes on with the request, which fails for a scheme it does not know
        m_deferral->Complete();
    }

    void responder::respond(const scheme::response &value)
    {
        if (std::exchange(m_answered, true))
        {
            return;
        }

        std::wstring headers;

        if (std::ranges::none_of(value.headers, [](const auto &entry) { return is_content_type(entry.first); }))
        {
            headers += std::format(L"Content-Type: {}\r\n", utils::widen(value.mime.empty() ? "application/octet-stream" : value.mime));
        }

        for (const auto &[name, content] : value.headers)
        {
            headers += std::format(L"{}: {}\r\n", utils::widen(name), utils::widen(content));
        }

        ComPtr<IStream> stream;
        stream.Attach(SHCreateMemStream(value.data.data(), static_cast<UINT>(value.data.size())));

        const auto phrase = std::wstring{phrase_of(value.status)};
        ComPtr<ICoreWebView2WebResourceResponse> response;

        if (auto status = m_environment->CreateWebResourceResponse(stream.Get(), value.status, phrase.c_str(), headers.c_str(), &response);
            FAILED(status))
        {
            logger()->error("could not create resource response: {:#x}", static_cast<std::uint32_t>(status));
        }
        else if (status = m_args->put_Response(response.Get()); FAILED(status))
        {
            logger()->error("could not set resource response: {:#x}", static_cast<std::uint32_t>(status));
        }

        m_deferral->Complete();
    }

    bool responder::streams() const
    {
        return false;
    }

    void responder::start(const scheme::stream_response &) {}

    void responder::write(stash) {}

    void responder::finish() {}

    result<scheme::request> make_request(ICoreWebView2WebResourceRequest *native)
    {
        LPWSTR raw{};

        if (auto status = native->get_Uri(&raw); FAILED(status))
        {
            return unexpected{error::engine("could not read request uri", status)};
        }

        auto parsed = canopy::url::parse(utils::narrow(utils::co_string{raw}));

        if (!parsed)
        {
            return unexpected{parsed.error()};
        }

        std::string method{"GET"};

        if (LPWSTR verb{}; SUCCEEDED(native->get_Method(&verb)))
        {
            method = utils::narrow(utils::co_string{verb});
        }

        std::map<std::string, std::string> headers;
        ComPtr<ICoreWebView2HttpRequestHeaders> collection;
        ComPtr<ICoreWebView2HttpHeadersCollectionIterator> iterator;

        if (SUCCEEDED(native->get_Headers(&collection)) && SUCCEEDED(collection->GetIterator(&iterator)))
        {
            BOOL current{FALSE};

            while (SUCCEEDED(iterator->get_HasCurrentHeader(&current)) && current)
            {
                LPWSTR name{};
                LPWSTR value{};

                if (SUCCEEDED(iterator->GetCurrentHeader(&name, &value)))
                {
                    headers.emplace(utils::narrow(utils::co_string{name}), utils::narrow(utils::co_string{value}));
                }

                BOOL next{FALSE};

                if (FAILED(iterator->MoveNext(&next)) || !next)
                {
                    break;
                }
            }
        }

        std::vector<std::uint8_t> body;
        ComPtr<IStream> content;

        if (SUCCEEDED(native->get_Content(&content)) && content)
        {
            std::array<std::uint8_t, 4096> buffer{};

            while (true)
            {
                ULONG read{0};
                const auto status = content->Read(buffer.data(), static_cast<ULONG>(buffer.size()), &read);

                if (FAILED(status) || read == 0)
                {
                    break;
                }

                body.insert(body.end(), buffer.begin(), buffer.begin() + read);
            }
        }

        return scheme::request{{
            .url     = std::move(parsed.value()),
            .method  = std::move(method),
            .headers = std::move(headers),
            .body    = std::move(body),
        }};
    }
} // namespace canopy::wv2
