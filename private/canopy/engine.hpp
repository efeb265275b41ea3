#pragma once

#include "scheme.impl.hpp"

#include <canopy/drop.hpp>
#include <canopy/error.hpp>
#include <canopy/options.hpp>
#include <canopy/capability.hpp>

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace canopy
{
    // One native webview. Exactly one implementation is compiled in, chosen by the build.
    class engine
    {
      public:
        struct settings
        {
            native_window parent{nullptr};
            std::optional<std::string> user_agent;
            std::optional<rect> bounds;

          public:
            bool transparent{false};
            bool devtools{false};
            bool incognito{false};
            bool autoplay{false};

          public:
            std::vector<std::string> schemes;
        };

        // Raised on the owning thread, except where noted by the implementation
        struct events
        {
            std::function<void(std::string)> message;
            std::function<void(const std::string &, scheme::request, std::unique_ptr<scheme::responder>)> request;

          public:
            std::function<bool(const drop_event &)> drop;
            std::function<bool(const std::string &)> navigation;
            std::function<void(page_load, const std::string &)> load;
            std::function<void(const error &)> crashed;

          public:
            // Left empty when the user installed no handler, engines then keep their default behaviour
            std::function<bool(const std::string &)> new_window;
            std::function<bool(download_request &)> download_started;
            std::function<void(const download_result &)> download_finished;
        };

      public:
        virtual ~engine() = default;

      public:
        [[nodiscard]] virtual canopy::capabilities supported() const = 0;

      public:
        // Expression evaluating to a function that forwards one string to the native message handler
        [[nodiscard]] virtual std::string transport() const = 0;

      public:
        // Queues a task onto the owning thread, never runs it inline. Thread-safe.
        // Queued tasks must run even if the engine is gone by then, they do not reference it.
        virtual void post(scheme::task) = 0;

        // Disconnects every native signal and drops pending evaluations, no event fires afterwards
        virtual void detach() = 0;

      public:
        virtual result<> add_script(const std::string &code) = 0;

      public:
        virtual result<> navigate(const std::string &url, const headers &extra) = 0;
        virtual result<> load_html(const std::string &html) = 0;
        virtual result<> reload() = 0;

      public:
        // Runs `code` as-is through the engine's own evaluation api, unaffected by the page's content security policy.
        // The callback receives the completion value as json text or an errc::script error, it may be empty for
        // fire-and-forget execution.
        virtual void execute(const std::string &code, std::function<void(result<std::string>)> callback) = 0;

      public:
        virtual result<> set_visible(bool visible)  = 0;
        virtual result<> resize(const rect &bounds) = 0;

      public:
        virtual result<> zoom(double factor) = 0;
        virtual result<> print()             = 0;

      public:
        virtual result<> open_devtools()                  = 0;
        virtual result<> close_devtools()                 = 0;
        [[nodiscard]] virtual bool devtools_open() const = 0;

      public:
        [[nodiscard]] virtual std::string url() const = 0;
        virtual result<> clear_browsing_data()        = 0;

      public:
        [[nodiscard]] static result<std::unique_ptr<engine>> create(const settings &, events);

      public:
        static result<> register_scheme(const std::string &name);
    };
} // namespace canopy
