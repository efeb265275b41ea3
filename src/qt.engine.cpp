#include "qt.engine.impl.hpp"

#include "log.hpp"
#include "drop.impl.hpp"

#include <atomic>
#include <format>
#include <algorithm>

#include <QDir>
#include <QFile>
#include <QEvent>
#include <QMimeData>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDropEvent>
#include <QCoreApplication>
#include <QWebEngineScript>
#include <QWebEngineSettings>
#include <QWebEngineUrlScheme>
#include <QWebEngineCookieStore>
#include <QWebEngineHttpRequest>
#include <QWebEngineDownloadRequest>
#include <QWebEngineNewWindowRequest>
#include <QWebEngineScriptCollection>

namespace canopy::qt
{
    // channel implementation

    channel::channel(std::function<void(std::string)> receive) : m_receive(std::move(receive)) {}

    void channel::post(const QString &message)
    {
        if (!m_receive)
        {
            return;
        }

        m_receive(message.toStdString());
    }

    // page implementation

    page::page(QWebEngineProfile *profile, std::function<bool(const std::string &)> navigation)
        : QWebEnginePage(profile), m_navigation(std::move(navigation))
    {
    }

    bool page::acceptNavigationRequest(const QUrl &url, NavigationType type, bool main_frame)
    {
        if (!main_frame || !m_navigation)
        {
            return QWebEnginePage::acceptNavigationRequest(url, type, main_frame);
        }

        return m_navigation(url.toString().toStdString());
    }

    // view implementation

    view::view(QWidget *parent, std::function<bool(const drop_event &)> drop) : QWebEngineView(parent), m_drop(std::move(drop))
    {
        setAcceptDrops(true);

        parent->installEventFilter(this);
        setGeometry(parent->rect());
    }

    void view::place(const rect &bounds)
    {
        m_fill = false;
        setGeometry(bounds.x, bounds.y, bounds.width, bounds.height);
    }

    bool view::eventFilter(QObject *watched, QEvent *event)
    {
        if (m_fill && watched == parentWidget() && event->type() == QEvent::Resize)
        {
            setGeometry(parentWidget()->rect());
        }

        return QWebEngineView::eventFilter(watched, event);
    }

    bool view::raise(drop_kind kind, const QMimeData *data, const QPointF &position)
    {
        if (!m_drop)
        {
            return false;
        }

        std::vector<std::filesystem::path> paths;

        if (data && data->hasUrls())
        {
            for (const auto &url : data->urls())
            {
                if (!url.isLocalFile())
                {
                    continue;
                }

                paths.emplace_back(url.toLocalFile().toStdString());
            }
        }

        auto event = drop_event{.kind = kind, .paths = drop::normalize(std::move(paths))};

        if (kind != drop_kind::cancelled)
        {
            event.position = point{position.x(), position.y()};
        }

        return m_drop(event);
    }

    void view::dragEnterEvent(QDragEnterEvent *event)
    {
        if (raise(drop_kind::hovered, event->mimeData(), event->position()))
        {
            event->acceptProposedAction();
            return;
        }

        QWebEngineView::dragEnterEvent(event);
    }

    void view::dragMoveEvent(QDragMoveEvent *event)
    {
        if (raise(drop_kind::hovered, event->mimeData(), event->position()))
        {
            event->acceptProposedAction();
            return;
        }

        QWebEngineView::dragMoveEvent(event);
    }

    void view::dragLeaveEvent(QDragLeaveEvent *event)
    {
        raise(drop_kind::cancelled, nullptr, {});
        QWebEngineView::dragLeaveEvent(event);
    }

    void view::dropEvent(QDropEvent *event)
    {
        if (raise(drop_kind::dropped, event->mimeData(), event->position()))
        {
            event->acceptProposedAction();
            return;
        }

        QWebEngineView::dropEvent(event);
    }

    // engine implementation

    engine::engine(events raise) : m_events(std::move(raise)), m_alive(std::make_shared<bool>(true)) {}

    engine::~engine()
    {
        detach();

        // The page has to go before its profile, the view before its page
        delete m_devtools;
        delete m_view;

        m_page.reset();
        m_web_channel.reset();
        m_channel.reset();
        m_profile.reset();
        m_handlers.clear();
    }

    result<> engine::setup(QWidget *parent, const settings &config)
    {
        static std::atomic<std::size_t> profiles{0};

        if (config.incognito)
        {
            m_profile = std::make_unique<QWebEngineProfile>();
        }
        else
        {
            m_profile = std::make_unique<QWebEngineProfile>(QString::fromStdString(std::format("canopy-{}", profiles++)));
        }

        if (config.user_agent)
        {
            m_profile->setHttpUserAgent(QString::fromStdString(config.user_agent.value()));
        }

        for (const auto &name : config.schemes)
        {
            const auto id = QByteArray::fromStdString(name);

            if (QWebEngineUrlScheme::schemeByName(id).name().isEmpty())
            {
                logger()->warn("scheme \"{}\" was not registered before the application was created, see webview::register_scheme", name);
            }

            auto route = [this](const std::string &target, scheme::request request, std::unique_ptr<scheme::responder> responder)
            {
                if (!m_events.request)
                {
                    return;
                }

                m_events.request(target, std::move(request), std::move(responder));
            };

            auto target = std::make_unique<handler>(name, std::move(route), nullptr);

            m_profile->installUrlSchemeHandler(id, target.get());
            m_handlers.emplace_back(std::move(target));
        }

        m_page = std::make_unique<page>(m_profile.get(), [this](const std::string &url)
                                        {
                                            return !m_events.navigation || m_events.navigation(url);
                                        });

        m_page->settings()->setAttribute(QWebEngineSettings::PlaybackRequiresUserGesture, !config.autoplay);

        if (config.transparent)
        {
            m_page->setBackgroundColor(Qt::transparent);
        }

        m_channel = std::make_unique<channel>([this](std::string message)
                                              {
                                                  if (!m_events.message)
                                                  {
                                                      return;
                                                  }

                                                  m_events.message(std::move(message));
                                              });

        m_web_channel = std::make_unique<QWebChannel>();
        m_web_channel->registerObject(QStringLiteral("canopy"), m_channel.get());
        m_page->setWebChannel(m_web_channel.get());

        QFile loader{QStringLiteral(":/qtwebchannel/qwebchannel.js")};

        if (!loader.open(QIODevice::ReadOnly))
        {
            return unexpected{error::engine("could not load qwebchannel.js")};
        }

        if (auto added = add_script(loader.readAll().toStdString()); !added)
        {
            return added;
        }

        m_connections.emplace_back(QObject::connect(m_page.get(), &QWebEnginePage::loadStarted, [this]()
                                                    {
                                                        if (!m_events.load)
                                                        {
                                                            return;
                                                        }

                                                        m_events.load(page_load::started, url());
                                                    }));

        m_connections.emplace_back(QObject::connect(m_page.get(), &QWebEnginePage::loadFinished, [this](bool)
                                                    {
                                                        if (!m_events.load)
                                                        {
                                                            return;
                                                        }

                                                        m_events.load(page_load::finished, url());
                                                    }));

        m_connections.emplace_back(QObject::connect(m_page.get(), &QWebEnginePage::renderProcessTerminated,
                                                    [this](QWebEnginePage::RenderProcessTerminationStatus status, int code)
                                                    {
                                                        if (status == QWebEnginePage::NormalTerminationStatus || !m_events.crashed)
                                                        {
                                                            return;
                                                        }

                                                        const auto *reason = status == QWebEnginePage::CrashedTerminationStatus
                                                                                 ? "render process crashed"
                                                                                 : "render process was terminated";

                                                        m_events.crashed(error::engine(reason, code));
                                                    }));

        if (m_events.new_window)
        {
            m_connections.emplace_back(QObject::connect(m_page.get(), &QWebEnginePage::newWindowRequested,
                                                        [this](QWebEngineNewWindowRequest &request)
                                                        {
                                                            const auto target = request.requestedUrl().toString().toStdString();

                                                            if (!m_events.new_window || !m_events.new_window(target))
                                                            {
                                                                logger()->debug("new window for \"{}\" was denied", target);
                                                                return;
                                                            }

                                                            m_page->load(request.requestedUrl());
                                                        }));
        }

        if (m_events.download_started)
        {
            m_connections.emplace_back(QObject::connect(m_profile.get(), &QWebEngineProfile::downloadRequested,
                                                        [this](QWebEngineDownloadRequest *download) { started(download); }));
        }

        m_view = new view(parent, [this](const drop_event &event)
                          {
                              return m_events.drop && m_events.drop(event);
                          });

        m_view->setPage(m_page.get());

        if (config.bounds)
        {
            m_view->place(config.bounds.value());
        }

        m_view->show();

        return {};
    }

    canopy::capabilities engine::supported() const
    {
        return {
            capability::transparent,
            capability::devtools,
            capability::devtools_close,
            capability::zoom,
            capability::file_drop,
            capability::streaming,
            capability::user_agent,
            capability::browsing_data,
            capability::download,
            capability::new_window,
        };
    }

    std::string engine::transport() const
    {
        return R"js(
(function () {
    var queue = [];
    var target = null;

    new QWebChannel(qt.webChannelTransport, function (channel) {
        target = channel.objects.canopy;
        queue.splice(0).forEach(function (message) { target.post(message); });
    });

    return function (message) {
        if (target) {
            target.post(message);
            return;
        }

        queue.push(message);
    };
})()
)js";
    }

    void engine::post(scheme::task task)
    {
        auto *const app = QCoreApplication::instance();

        if (!app)
        {
            logger()->error("dropping task, the application is gone");
            return;
        }

        QMetaObject::invokeMethod(app, [task = std::move(task)]() { task(); }, Qt::QueuedConnection);
    }

    void engine::detach()
    {
        if (!m_alive)
        {
            return;
        }

        m_alive.reset();
        m_events = {};

        for (const auto &connection : m_connections)
        {
            QObject::disconnect(connection);
        }

        m_connections.clear();

        if (m_profile)
        {
            m_profile->removeAllUrlSchemeHandlers();
        }

        if (m_web_channel && m_channel)
        {
            m_web_channel->deregisterObject(m_channel.get());
        }

        if (m_view)
        {
            m_view->hide();
        }
    }

    result<> engine::add_script(const std::string &code)
    {
        QWebEngineScript script;

        script.setName(QString::fromStdString(std::format("canopy-{}", m_scripts++)));
        script.setSourceCode(QString::fromStdString(code));
        script.setInjectionPoint(QWebEngineScript::DocumentCreation);
        script.setWorldId(QWebEngineScript::MainWorld);
        script.setRunsOnSubFrames(false);

        m_page->scripts().insert(script);

        return {};
    }

    result<> engine::navigate(const std::string &url, const headers &extra)
    {
        auto request = QWebEngineHttpRequest{QUrl{QString::fromStdString(url)}};

        for (const auto &[name, value] : extra)
        {
            request.setHeader(QByteArray::fromStdString(name), QByteArray::fromStdString(value));
        }

        m_page->load(request);

        return {};
    }

    result<> engine::load_html(const std::string &html)
    {
        m_page->setHtml(QString::fromStdString(html));
        return {};
    }

    result<> engine::reload()
    {
        m_page->triggerAction(QWebEnginePage::Reload);
        return {};
    }

    void engine::execute(const std::string &code, std::function<void(result<std::string>)> callback)
    {
        auto done = [alive = std::weak_ptr<bool>{m_alive}, callback = std::move(callback)](const QVariant &value)
        {
            if (alive.expired() || !callback)
            {
                return;
            }

            // Exceptions are not reported by runJavaScript, they surface as an invalid variant just like `undefined`
            if (!value.isValid())
            {
                callback(std::string{"null"});
                return;
            }

            // Wrapped in an array so scalars serialize too
            auto json = QJsonDocument{QJsonArray{QJsonValue::fromVariant(value)}}.toJson(QJsonDocument::Compact);
            callback(json.mid(1, json.size() - 2).toStdString());
        };

        m_page->runJavaScript(QString::fromStdString(code), QWebEngineScript::MainWorld, done);
    }

    void engine::started(QWebEngineDownloadRequest *download)
    {
        if (download->page() != m_page.get() || !m_events.download_started)
        {
            return;
        }

        const auto folder = QDir{download->downloadDirectory()};
        auto request = download_request{
            .url         = download->url().toString().toStdString(),
            .destination = folder.absoluteFilePath(download->downloadFileName()).toStdString(),
        };

        if (!m_events.download_started(request))
        {
            download->cancel();
            return;
        }

        const auto target = QFileInfo{QString::fromStdString(request.destination.string())};

        download->setDownloadDirectory(target.absolutePath());
        download->setDownloadFileName(target.fileName());

        m_connections.emplace_back(QObject::connect(download, &QWebEngineDownloadRequest::isFinishedChanged,
                                                    [this, download, url = std::move(request.url)]()
                                                    {
                                                        if (!download->isFinished() || !m_events.download_finished)
                                                        {
                                                            return;
                                                        }

                                                        auto outcome = download_result{
                                                            .url     = url,
                                                            .path    = std::nullopt,
                                                            .success = download->state() == QWebEngineDownloadRequest::DownloadCompleted,
                                                        };

                                                        if (outcome.success)
                                                        {
                                                            const auto folder = QDir{download->downloadDirectory()};
                                                            outcome.path      = folder.absoluteFilePath(download->downloadFileName()).toStdString();
                                                        }

                                                        m_events.download_finished(outcome);
                                                    }));

        download->accept();
    }

    result<> engine::set_visible(bool visible)
    {
        m_view->setVisible(visible);
        return {};
    }

    result<> engine::resize(const rect &bounds)
    {
        m_view->place(bounds);
        return {};
    }

    result<> engine::zoom(double factor)
    {
        // Chromium only zooms between 25% and 500%
        m_view->setZoomFactor(std::clamp(factor, 0.25, 5.0));
        return {};
    }

    result<> engine::print()
    {
        return {};
    }

    result<> engine::open_devtools()
    {
        if (!m_devtools)
        {
            m_devtools = new QWebEngineView{};
            m_devtools->setAttribute(Qt::WA_DeleteOnClose);
            m_devtools->setWindowTitle(QStringLiteral("DevTools"));

            m_page->setDevToolsPage(m_devtools->page());
        }

        m_devtools->show();
        m_devtools->raise();

        return {};
    }

    result<> engine::close_devtools()
    {
        if (!m_devtools)
        {
            return {};
        }

        m_page->setDevToolsPage(nullptr);
        m_devtools->close();

        return {};
    }

    bool engine::devtools_open() const
    {
        return m_devtools && m_devtools->isVisible();
    }

    std::string engine::url() const
    {
        const auto current = m_page->url();
        return current.isEmpty() ? "about:blank" : current.toString().toStdString();
    }

    result<> engine::clear_browsing_data()
    {
        m_profile->clearHttpCache();
        m_profile->clearAllVisitedLinks();
        m_profile->cookieStore()->deleteAllCookies();

        return {};
    }
} // namespace canopy::qt

namespace canopy
{
    result<std::unique_ptr<engine>> engine::create(const settings &config, events raise)
    {
        if (!QCoreApplication::instance())
        {
            return unexpected{error::engine("a QApplication has to exist before a webview is created")};
        }

        auto *const parent = static_cast<QWidget *>(config.parent);
        auto rtn           = std::make_unique<qt::engine>(std::move(raise));

        if (auto ok = rtn->setup(parent, config); !ok)
        {
            return unexpected{ok.error()};
        }

        return rtn;
    }

    result<> engine::register_scheme(const std::string &name)
    {
        const auto id = QByteArray::fromStdString(name);

        if (!QWebEngineUrlScheme::schemeByName(id).name().isEmpty())
        {
            return {};
        }

        if (QCoreApplication::instance())
        {
            return unexpected{error::configuration(std::format("scheme \"{}\" has to be registered before the application is created", name))};
        }

        auto entry = QWebEngineUrlScheme{id};

        entry.setSyntax(QWebEngineUrlScheme::Syntax::Host);
        entry.setFlags(QWebEngineUrlScheme::SecureScheme | QWebEngineUrlScheme::CorsEnabled | QWebEngineUrlScheme::FetchApiAllowed);

        QWebEngineUrlScheme::registerScheme(entry);

        return {};
    }
} // namespace canopy
