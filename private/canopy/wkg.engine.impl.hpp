#pragma once

#include "engine.hpp"
#include "utils/gtk.hpp"

#include <memory>
#include <vector>
#include <utility>

#include <gtk/gtk.h>
#include <webkit/webkit.h>

namespace canopy::wkg
{
    enum class attachment : std::uint8_t
    {
        window,
        fixed,
        overlay,
    };

    class engine : public canopy::engine
    {
        struct transfer;

      private:
        events m_events;

      private:
        GtkWidget *m_parent;
        attachment m_attachment;

      private:
        utils::g_object_ptr<WebKitWebView> m_view;
        utils::g_object_ptr<GCancellable> m_cancel;
        GtkDropTarget *m_drop{nullptr};

      private:
        // Set while a GtkFixed parent is filled because no bounds were given, cleared by the first resize
        bool m_fill{false};
        guint m_tick{0};
        int m_width{0};
        int m_height{0};

      private:
        std::vector<std::unique_ptr<transfer>> m_transfers;

      private:
        std::vector<std::pair<gpointer, gulong>> m_signals;
        bool m_inspecting{false};
        bool m_detached{false};

      public:
        engine(GtkWidget *parent, attachment, events);

      public:
        ~engine() override;

      public:
        result<> setup(const settings &);

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

      private:
        void connect(gpointer instance, const char *signal, GCallback callback);

      private:
        void place(const rect &bounds);
        void track_parent();

      private:
        void setup_downloads(WebKitNetworkSession *);
        void started(WebKitDownload *);
        bool destination(transfer *, const char *suggested);
        void finished(transfer *);

      private:
        void setup_drop();
        GdkDragAction hovered(GtkDropTarget *, double x, double y);
        bool dropped(drop_kind, const GValue *, double x, double y);
    };
} // namespace canopy::wkg
