#pragma once

#include "drop.hpp"
#include "download.hpp"
#include "error.hpp"
#include "scheme.hpp"

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>
#include <string_view>

namespace canopy
{
    // Borrowed platform handle the webview is attached to, never released by canopy:
    //  WebKitGtk: GtkWindow*, GtkFixed* or GtkOverlay*
    //  Qt:        QWidget*
    //  WebView2:  HWND
    //  WebKit:    NSView* (macOS) / UIView* (iOS)
    //  Android:   jobject referring to an android.view.ViewGroup
    using native_window = void *;

    struct rect
    {
        int x;
        int y;
        int width;
        int height;
    };

    enum class page_load : std::uint8_t
    {
        started,
        finished,
    };

    struct protocol
    {
        std::string scheme;
        scheme::handler handler;
    };

    using headers = std::map<std::string, std::string>;

    struct options
    {
        std::optional<std::string> url;
        std::optional<std::string> html;
        std::optional<std::string> user_agent;

      public:
        bool transparent{false};
        bool devtools{false};
        bool incognito{false};
        bool autoplay{false};

      public:
        std::vector<std::string> scripts;
        std::vector<protocol> protocols;
        canopy::headers headers;

      public:
        std::optional<rect> bounds;

      public:
        std::function<void(std::string)> message_handler;
        canopy::drop_handler drop_handler;

      public:
        std::function<bool(const std::string &)> navigation_handler;
        std::function<void(page_load, const std::string &)> load_handler;
        std::function<void(const error &)> crash_handler;

      public:
        // Asked when the page wants a new window (window.open, target="_blank"). Returning true loads the url in this
        // webview, false drops the request. Without a handler the engine's default applies.
        std::function<bool(const std::string &)> new_window_handler;

      public:
        canopy::download_handler download_handler;
        canopy::download_finished_handler download_finished_handler;

      public:
        // Reported on the owning thread whenever a scheme handler raised or abandoned its request (errc::protocol_handler)
        std::function<void(const error &)> protocol_error_handler;
    };
} // namespace canopy
