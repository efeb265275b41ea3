#pragma once

#include "drop.hpp"
#include "error.hpp"
#include "options.hpp"
#include "capability.hpp"

#include <memory>
#include <string>
#include <functional>
#include <string_view>

namespace canopy
{
    // A native rendering surface attached to a borrowed window. Every method must be called from the thread that created
    // the webview, calls from other threads fail with errc::thread_affinity and never reach the engine.
    class webview
    {
        struct impl;

      private:
        std::shared_ptr<impl> m_impl;

      private:
        explicit webview(std::shared_ptr<impl>);

      private:
        [[nodiscard]] result<> ready(std::string_view operation) const;

      public:
        webview(webview &&) noexcept;
        webview &operator=(webview &&) noexcept;

      public:
        ~webview();

      public:
        [[nodiscard]] bool alive() const;
        [[nodiscard]] bool supports(capability) const;

      public:
        [[nodiscard]] result<> navigate(const std::string &url);
        [[nodiscard]] result<> navigate(const std::string &url, const headers &extra);

      public:
        [[nodiscard]] result<> load_html(const std::string &html);
        [[nodiscard]] result<> reload();

      public:
        // The callback receives the JSON text of the completion value ("null" for undefined) or an errc::script error.
        // It is always invoked later on the owning thread, never from within this call.
        [[nodiscard]] result<> evaluate(const std::string &code, std::function<void(result<std::string>)> callback);
        [[nodiscard]] result<> execute(const std::string &code);

      public:
        [[nodiscard]] result<> set_visible(bool visible);
        [[nodiscard]] result<> resize(const rect &bounds);

      public:
        [[nodiscard]] result<> zoom(double factor);
        [[nodiscard]] result<> print();

      public:
        [[nodiscard]] result<> open_devtools();
        [[nodiscard]] result<> close_devtools();
        [[nodiscard]] result<bool> devtools_open() const;

      public:
        [[nodiscard]] result<std::string> url() const;
        [[nodiscard]] result<> clear_browsing_data();

      public:
        // Replaces the active handler, an empty function removes it
        [[nodiscard]] result<> set_drop_handler(drop_handler handler);

      public:
        // Unregisters all hooks and releases the engine. Idempotent, called by the destructor.
        [[nodiscard]] result<> destroy();

      public:
        [[nodiscard]] static result<webview> create(native_window parent, options opts);

      public:
        // Process-wide announcement of a custom scheme. Required by engines that must know their schemes before the
        // runtime starts (Qt WebEngine: call before constructing the QApplication), a no-op elsewhere.
        [[nodiscard]] static result<> register_scheme(const std::string &name);
    };
} // namespace canopy
