#pragma once

#include "engine.hpp"
#include "qt.scheme.impl.hpp"

#include <memory>
#include <vector>

#include <QObject>
#include <QPointer>
#include <QWebChannel>
#include <QWebEngineView>
#include <QWebEnginePage>
#include <QWebEngineProfile>

class QWebEngineDownloadRequest;

namespace canopy::qt
{
    // Exposed to the page through the web channel, forwards ipc messages
    class channel : public QObject
    {
        Q_OBJECT

      private:
        std::function<void(std::string)> m_receive;

      public:
        explicit channel(std::function<void(std::string)> receive);

      public:
        Q_INVOKABLE void post(const QString &message);
    };

    class page : public QWebEnginePage
    {
        std::function<bool(const std::string &)> m_navigation;

      public:
        page(QWebEngineProfile *profile, std::function<bool(const std::string &)> navigation);

      protected:
        bool acceptNavigationRequest(const QUrl &url, NavigationType type, bool main_frame) override;
    };

    class view : public QWebEngineView
    {
        std::function<bool(const drop_event &)> m_drop;
        bool m_fill{true};

      public:
        view(QWidget *parent, std::function<bool(const drop_event &)> drop);

      public:
        void place(const rect &bounds);

      protected:
        bool eventFilter(QObject *watched, QEvent *event) override;

      protected:
        void dragEnterEvent(QDragEnterEvent *event) override;
        void dragMoveEvent(QDragMoveEvent *event) override;
        void dragLeaveEvent(QDragLeaveEvent *event) override;
        void dropEvent(QDropEvent *event) override;

      private:
        bool raise(drop_kind, const QMimeData *, const QPointF &position);
    };

    class engine : public canopy::engine
    {
        events m_events;
        std::shared_ptr<bool> m_alive;

      private:
        std::unique_ptr<QWebEngineProfile> m_profile;
        std::unique_ptr<page> m_page;
        QPointer<view> m_view;

      private:
        std::unique_ptr<channel> m_channel;
        std::unique_ptr<QWebChannel> m_web_channel;
        std::vector<std::unique_ptr<handler>> m_handlers;

      private:
        QPointer<QWebEngineView> m_devtools;
        std::vector<QMetaObject::Connection> m_connections;
        std::size_t m_scripts{0};

      public:
        explicit engine(events);

      public:
        ~engine() override;

      public:
        result<> setup(QWidget *parent, const settings &);

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
        void started(QWebEngineDownloadRequest *);
    };
} // namespace canopy::qt
