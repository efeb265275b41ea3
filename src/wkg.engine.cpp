#include "wkg.engine.impl.hpp"

#include "log.hpp"
#include "drop.impl.hpp"
#include "wkg.scheme.impl.hpp"

#include <array>
#include <format>
#include <algorithm>
#include <filesystem>

namespace canopy::wkg
{
    using completion = std::function<void(result<std::string>)>;

    struct engine::transfer
    {
        engine *owner;
        utils::g_object_ptr<WebKitDownload> download;

      public:
        std::string url;
        bool allowed{false};
        bool failed{false};

      public:
        std::vector<gulong> signals;
    };

    engine::engine(GtkWidget *parent, attachment kind, events raise)
        : m_events(std::move(raise)), m_parent(parent), m_attachment(kind), m_cancel(g_cancellable_new())
    {
    }

    engine::~engine()
    {
        detach();
    }

    result<> engine::setup(const settings &config)
    {
        auto ephemeral = utils::g_object_ptr<WebKitNetworkSession>{};

        if (config.incognito)
        {
            ephemeral.reset(webkit_network_session_new_ephemeral());
        }

        auto *const session = ephemeral ? ephemeral.get() : webkit_network_session_get_default();
        auto *const created = g_object_new(WEBKIT_TYPE_WEB_VIEW, "network-session", session, nullptr);

        m_view = utils::g_object_ptr<WebKitWebView>{WEBKIT_WEB_VIEW(g_object_ref_sink(created))};

        auto *const view    = m_view.get();
        auto *const manager = webkit_web_view_get_user_content_manager(view);
        auto *const options = webkit_web_view_get_settings(view);

        webkit_settings_set_enable_developer_extras(options, config.devtools);
        webkit_settings_set_media_playback_requires_user_gesture(options, !config.autoplay);

        if (config.user_agent)
        {
            webkit_settings_set_user_agent(options, config.user_agent->c_str());
        }

        if (config.transparent)
        {
            static constexpr GdkRGBA clear{0, 0, 0, 0};
            webkit_web_view_set_background_color(view, &clear);
        }

        if (!webkit_user_content_manager_register_script_message_handler(manager, "canopy", nullptr))
        {
            return unexpected{error::engine("could not register the script message handler")};
        }

        connect(manager, "script-message-received::canopy",
                G_CALLBACK(+[](WebKitUserContentManager *, JSCValue *value, engine *self)
                           {
                               if (!self->m_events.message)
                               {
                                   return;
                               }

                               auto message = utils::g_string_ptr{jsc_value_to_string(value)};
                               self->m_events.message(message.get());
                           }));

        connect(view, "decide-policy",
                G_CALLBACK(+[](WebKitWebView *, WebKitPolicyDecision *decision, WebKitPolicyDecisionType type, engine *self) -> gboolean
                           {
                               if (type != WEBKIT_POLICY_DECISION_TYPE_NAVIGATION_ACTION || !self->m_events.navigation)
                               {
                                   return FALSE;
                               }

                               auto *const navigation = WEBKIT_NAVIGATION_POLICY_DECISION(decision);
                               auto *const action     = webkit_navigation_policy_decision_get_navigation_action(navigation);
                               const auto *uri        = webkit_uri_request_get_uri(webkit_navigation_action_get_request(action));

                               if (self->m_events.navigation(uri ? uri : ""))
                               {
                                   return FALSE;
                               }

                               logger()->debug("navigation to \"{}\" was denied", uri ? uri : "");
                               webkit_policy_decision_ignore(decision);

                               return TRUE;
                           }));

        connect(view, "load-changed",
                G_CALLBACK(+[](WebKitWebView *view, WebKitLoadEvent event, engine *self)
                           {
                               if (!self->m_events.load)
                               {
                                   return;
                               }

                               const auto *uri = webkit_web_view_get_uri(view);
                               const auto url  = std::string{uri ? uri : ""};

                               if (event == WEBKIT_LOAD_STARTED)
                               {
                                   self->m_events.load(page_load::started, url);
                               }
                               else if (event == WEBKIT_LOAD_FINISHED)
                               {
                                   self->m_events.load(page_load::finished, url);
                               }
                           }));

        connect(view, "web-process-terminated",
                G_CALLBACK(+[](WebKitWebView *, WebKitWebProcessTerminationReason reason, engine *self)
                           {
                               if (!self->m_events.crashed)
                               {
                                   return;
                               }

                               switch (reason)
                               {
                               case WEBKIT_WEB_PROCESS_CRASHED:
                                   self->m_events.crashed(error::engine("web process crashed", reason));
                                   break;
                               case WEBKIT_WEB_PROCESS_EXCEEDED_MEMORY_LIMIT:
                                   self->m_events.crashed(error::engine("web process exceeded its memory limit", reason));
                                   break;
                               default:
                                   self->m_events.crashed(error::engine("web process was terminated", reason));
                                   break;
                               }
                           }));

        connect(webkit_web_view_get_inspector(view), "closed",
                G_CALLBACK(+[](WebKitWebInspector *, engine *self) -> gboolean
                           {
                               self->m_inspecting = false;
                               return FALSE;
                           }));

        if (m_events.new_window)
        {
            connect(view, "create",
                    G_CALLBACK(+[](WebKitWebView *view, WebKitNavigationAction *action, engine *self) -> GtkWidget *
                               {
                                   const auto *uri = webkit_uri_request_get_uri(webkit_navigation_action_get_request(action));

                                   if (!uri || !self->m_events.new_window)
                                   {
                                       return nullptr;
                                   }

                                   if (self->m_events.new_window(uri))
                                   {
                                       webkit_web_view_load_uri(view, uri);
                                   }
                                   else
                                   {
                                       logger()->debug("new window for \"{}\" was denied", uri);
                                   }

                                   return nullptr;
                               }));
        }

        if (m_events.download_started)
        {
            setup_downloads(session);
        }

        auto &router = handler::instance();

        for (const auto &name : config.schemes)
        {
            router.claim(name);
        }

        router.add_callback(view, [this](const std::string &name, scheme::request request, std::unique_ptr<scheme::responder> responder)
                            {
                                if (!m_events.request)
                                {
                                    return;
                                }

                                m_events.request(name, std::move(request), std::move(responder));
                            });

        auto *const widget = GTK_WIDGET(view);

        switch (m_attachment)
        {
        case attachment::window:
            gtk_window_set_child(GTK_WINDOW(m_parent), widget);
            break;
        case attachment::fixed:
            gtk_fixed_put(GTK_FIXED(m_parent), widget, 0, 0);
            break;
        case attachment::overlay:
            gtk_overlay_add_overlay(GTK_OVERLAY(m_parent), widget);
            break;
        }

        if (config.bounds)
        {
            place(config.bounds.value());
        }
        else if (m_attachment == attachment::fixed)
        {
            m_fill = true;
            track_parent();
        }

        setup_drop();
        gtk_widget_set_visible(widget, TRUE);

        return {};
    }

    canopy::capabilities engine::supported() const
    {
        return {
            capability::transparent,
            capability::devtools,
            capability::devtools_close,
            capability::zoom,
            capability::print,
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
        return "function (message) { window.webkit.messageHandlers.canopy.postMessage(message); }";
    }

    void engine::post(scheme::task task)
    {
        static constexpr auto run = [](gpointer data) -> gboolean
        {
            (*static_cast<scheme::task *>(data))();
            return G_SOURCE_REMOVE;
        };

        static constexpr auto destroy = [](gpointer data)
        {
            delete static_cast<scheme::task *>(data);
        };

        g_idle_add_full(G_PRIORITY_DEFAULT, run, new scheme::task{std::move(task)}, destroy);
    }

    void engine::detach()
    {
        if (std::exchange(m_detached, true))
        {
            return;
        }

        m_events = {};
        g_cancellable_cancel(m_cancel.get());

        for (const auto &[instance, id] : m_signals)
        {
            g_signal_handler_disconnect(instance, id);
        }

        m_signals.clear();

        for (const auto &entry : m_transfers)
        {
            for (const auto id : entry->signals)
            {
                g_signal_handler_disconnect(entry->download.get(), id);
            }
        }

        m_transfers.clear();

        if (!m_view)
        {
            return;
        }

        auto *const view   = m_view.get();
        auto *const widget = GTK_WIDGET(view);

        handler::instance().del_callback(view);
        webkit_user_content_manager_unregister_script_message_handler(webkit_web_view_get_user_content_manager(view), "canopy", nullptr);

        if (m_drop)
        {
            gtk_widget_remove_controller(widget, GTK_EVENT_CONTROLLER(std::exchange(m_drop, nullptr)));
        }

        // The parent is borrowed, it might already be gone
        if (gtk_widget_get_parent(widget) != m_parent)
        {
            return;
        }

        if (m_tick)
        {
            gtk_widget_remove_tick_callback(m_parent, std::exchange(m_tick, 0));
        }

        switch (m_attachment)
        {
        case attachment::window:
            gtk_window_set_child(GTK_WINDOW(m_parent), nullptr);
            break;
        case attachment::fixed:
            gtk_fixed_remove(GTK_FIXED(m_parent), widget);
            break;
        case attachment::overlay:
            gtk_overlay_remove_overlay(GTK_OVERLAY(m_parent), widget);
            break;
        }
    }

    result<> engine::add_script(const std::string &code)
    {
        auto *const manager = webkit_web_view_get_user_content_manager(m_view.get());
        auto *const script  = webkit_user_script_new(code.c_str(),
                                                     WEBKIT_USER_CONTENT_INJECT_TOP_FRAME,
                                                     WEBKIT_USER_SCRIPT_INJECT_AT_DOCUMENT_START,
                                                     nullptr,
                                                     nullptr);

        webkit_user_content_manager_add_script(manager, script);
        webkit_user_script_unref(script);

        return {};
    }

    result<> engine::navigate(const std::string &url, const headers &extra)
    {
        if (extra.empty())
        {
            webkit_web_view_load_uri(m_view.get(), url.c_str());
            return {};
        }

        auto request = utils::g_object_ptr<WebKitURIRequest>{webkit_uri_request_new(url.c_str())};

        if (auto *const values = webkit_uri_request_get_http_headers(request.get()); values)
        {
            for (const auto &[name, value] : extra)
            {
                soup_message_headers_replace(values, name.c_str(), value.c_str());
            }
        }
        else
        {
            logger()->warn("\"{}\" does not carry http headers, ignoring {} header(s)", url, extra.size());
        }

        webkit_web_view_load_request(m_view.get(), request.get());

        return {};
    }

    result<> engine::load_html(const std::string &html)
    {
        webkit_web_view_load_html(m_view.get(), html.c_str(), nullptr);
        return {};
    }

    result<> engine::reload()
    {
        webkit_web_view_reload(m_view.get());
        return {};
    }

    void engine::execute(const std::string &code, std::function<void(result<std::string>)> callback)
    {
        static constexpr auto done = [](GObject *source, GAsyncResult *res, gpointer data)
        {
            auto callback = std::unique_ptr<completion>{static_cast<completion *>(data)};

            GError *failure{nullptr};
            auto value = utils::g_object_ptr<JSCValue>{webkit_web_view_evaluate_javascript_finish(WEBKIT_WEB_VIEW(source), res, &failure)};

            if (failure)
            {
                auto reason = utils::g_error_ptr{failure};

                // Cancelled on detach, nobody is listening anymore
                if (g_error_matches(reason.get(), G_IO_ERROR, G_IO_ERROR_CANCELLED))
                {
                    return;
                }

                (*callback)(unexpected{error::script(reason.get()->message, reason.get()->code)});
                return;
            }

            // `undefined` and values json cannot represent serialize to nothing
            auto json = utils::g_string_ptr{jsc_value_to_json(value.get(), 0)};

            if (auto *const exception = jsc_context_get_exception(jsc_value_get_context(value.get())); exception)
            {
                auto message = utils::g_string_ptr{jsc_exception_report(exception)};
                jsc_context_clear_exception(jsc_value_get_context(value.get()));

                (*callback)(unexpected{error::script(message ? message.get() : "could not serialize the completion value")});
                return;
            }

            (*callback)(std::string{json ? json.get() : ""});
        };

        if (!callback)
        {
            webkit_web_view_evaluate_javascript(m_view.get(), code.c_str(), -1, nullptr, nullptr, m_cancel.get(), nullptr, nullptr);
            return;
        }

        auto *data = new completion{std::move(callback)};
        webkit_web_view_evaluate_javascript(m_view.get(), code.c_str(), -1, nullptr, nullptr, m_cancel.get(), done, data);
    }

    result<> engine::set_visible(bool visible)
    {
        gtk_widget_set_visible(GTK_WIDGET(m_view.get()), visible);
        return {};
    }

    result<> engine::resize(const rect &bounds)
    {
        m_fill = false;
        place(bounds);
        return {};
    }

    result<> engine::zoom(double factor)
    {
        webkit_web_view_set_zoom_level(m_view.get(), factor);
        return {};
    }

    result<> engine::print()
    {
        auto operation   = utils::g_object_ptr<WebKitPrintOperation>{webkit_print_operation_new(m_view.get())};
        auto *const root = gtk_widget_get_root(GTK_WIDGET(m_view.get()));

        webkit_print_operation_run_dialog(operation.get(), GTK_IS_WINDOW(root) ? GTK_WINDOW(root) : nullptr);

        return {};
    }

    result<> engine::open_devtools()
    {
        auto *const options = webkit_web_view_get_settings(m_view.get());

        if (!webkit_settings_get_enable_developer_extras(options))
        {
            webkit_settings_set_enable_developer_extras(options, TRUE);
        }

        webkit_web_inspector_show(webkit_web_view_get_inspector(m_view.get()));
        m_inspecting = true;

        return {};
    }

    result<> engine::close_devtools()
    {
        webkit_web_inspector_close(webkit_web_view_get_inspector(m_view.get()));
        m_inspecting = false;

        return {};
    }

    bool engine::devtools_open() const
    {
        return m_inspecting;
    }

    std::string engine::url() const
    {
        const auto *uri = webkit_web_view_get_uri(m_view.get());
        return uri ? uri : "about:blank";
    }

    result<> engine::clear_browsing_data()
    {
        static constexpr auto cleared = [](GObject *source, GAsyncResult *res, gpointer)
        {
            GError *failure{nullptr};

            if (webkit_website_data_manager_clear_finish(WEBKIT_WEBSITE_DATA_MANAGER(source), res, &failure))
            {
                return;
            }

            auto reason = utils::g_error_ptr{failure};
            logger()->error("could not clear browsing data: {}", reason ? reason.get()->message : "unknown error");
        };

        auto *const session = webkit_web_view_get_network_session(m_view.get());
        auto *const data    = webkit_network_session_get_website_data_manager(session);

        webkit_website_data_manager_clear(data, WEBKIT_WEBSITE_DATA_ALL, 0, nullptr, cleared, nullptr);

        return {};
    }

    void engine::connect(gpointer instance, const char *signal, GCallback callback)
    {
        m_signals.emplace_back(instance, g_signal_connect(instance, signal, callback, this));
    }

    void engine::place(const rect &bounds)
    {
        auto *const widget = GTK_WIDGET(m_view.get());
        gtk_widget_set_size_request(widget, bounds.width, bounds.height);

        if (m_attachment == attachment::fixed)
        {
            gtk_fixed_move(GTK_FIXED(m_parent), widget, bounds.x, bounds.y);
            return;
        }

        if (m_attachment == attachment::overlay)
        {
            gtk_widget_set_halign(widget, GTK_ALIGN_START);
            gtk_widget_set_valign(widget, GTK_ALIGN_START);
            gtk_widget_set_margin_start(widget, std::max(bounds.x, 0));
            gtk_widget_set_margin_top(widget, std::max(bounds.y, 0));
        }
    }

    void engine::track_parent()
    {
        static constexpr auto tick = [](GtkWidget *parent, GdkFrameClock *, gpointer data) -> gboolean
        {
            auto *const self = static_cast<engine *>(data);

            if (!self->m_fill)
            {
                self->m_tick = 0;
                return G_SOURCE_REMOVE;
            }

            const auto width  = gtk_widget_get_width(parent);
            const auto height = gtk_widget_get_height(parent);

            if (width == self->m_width && height == self->m_height)
            {
                return G_SOURCE_CONTINUE;
            }

            self->m_width  = width;
            self->m_height = height;
            self->place({0, 0, width, height});

            return G_SOURCE_CONTINUE;
        };

        m_width  = gtk_widget_get_width(m_parent);
        m_height = gtk_widget_get_height(m_parent);

        place({0, 0, m_width, m_height});
        m_tick = gtk_widget_add_tick_callback(m_parent, tick, this, nullptr);
    }

    void engine::setup_downloads(WebKitNetworkSession *session)
    {
        connect(session, "download-started",
                G_CALLBACK(+[](WebKitNetworkSession *, WebKitDownload *download, engine *self)
                           {
                               // The session may be shared with other views
                               if (webkit_download_get_web_view(download) != self->m_view.get())
                               {
                                   return;
                               }

                               self->started(download);
                           }));
    }

    void engine::started(WebKitDownload *download)
    {
        const auto *uri = webkit_uri_request_get_uri(webkit_download_get_request(download));

        auto entry      = std::make_unique<transfer>();
        entry->owner    = this;
        entry->download = utils::g_object_ptr<WebKitDownload>::ref(download);
        entry->url      = uri ? uri : "";

        auto *const data = entry.get();

        entry->signals.emplace_back(g_signal_connect(download, "decide-destination",
                                                     G_CALLBACK(+[](WebKitDownload *, gchar *suggested, transfer *entry) -> gboolean
                                                                { return entry->owner->destination(entry, suggested); }),
                                                     data));

        entry->signals.emplace_back(g_signal_connect(download, "failed",
                                                     G_CALLBACK(+[](WebKitDownload *, GError *reason, transfer *entry)
                                                                {
                                                                    logger()->warn("download of {} failed: {}", entry->url, reason ? reason->message : "unknown error");
                                                                    entry->failed = true;
                                                                }),
                                                     data));

        entry->signals.emplace_back(g_signal_connect(download, "finished",
                                                     G_CALLBACK(+[](WebKitDownload *, transfer *entry) { entry->owner->finished(entry); }), data));

        m_transfers.emplace_back(std::move(entry));
    }

    bool engine::destination(transfer *entry, const char *suggested)
    {
        const auto *folder = g_get_user_special_dir(G_USER_DIRECTORY_DOWNLOAD);
        auto target        = std::filesystem::path{folder ? folder : g_get_home_dir()};

        target /= std::filesystem::path{suggested ? suggested : "download"}.filename();

        auto request = download_request{.url = entry->url, .destination = std::move(target)};

        if (!m_events.download_started || !m_events.download_started(request))
        {
            webkit_download_cancel(entry->download.get());
            return true;
        }

        entry->allowed = true;
        webkit_download_set_destination(entry->download.get(), request.destination.c_str());

        return true;
    }

    void engine::finished(transfer *entry)
    {
        auto it = std::ranges::find_if(m_transfers, [entry](const auto &value) { return value.get() == entry; });

        if (it == m_transfers.end())
        {
            return;
        }

        auto owned = std::move(*it);
        m_transfers.erase(it);

        for (const auto id : owned->signals)
        {
            g_signal_handler_disconnect(owned->download.get(), id);
        }

        if (!owned->allowed || !m_events.download_finished)
        {
            return;
        }

        auto outcome = download_result{.url = owned->url, .path = std::nullopt, .success = !owned->failed};

        if (const auto *path = webkit_download_get_destination(owned->download.get()); path && outcome.success)
        {
            outcome.path = std::filesystem::path{path};
        }

        m_events.download_finished(outcome);
    }

    void engine::setup_drop()
    {
        auto *const target = gtk_drop_target_new(G_TYPE_INVALID, GDK_ACTION_COPY);
        auto types         = std::array<GType, 2>{GDK_TYPE_FILE_LIST, G_TYPE_STRING};

        gtk_drop_target_set_gtypes(target, types.data(), types.size());
        gtk_drop_target_set_preload(target, TRUE);
        gtk_event_controller_set_propagation_phase(GTK_EVENT_CONTROLLER(target), GTK_PHASE_CAPTURE);

        connect(target, "enter",
                G_CALLBACK(+[](GtkDropTarget *target, double x, double y, engine *self) -> GdkDragAction
                           {
                               return self->hovered(target, x, y);
                           }));

        connect(target, "motion",
                G_CALLBACK(+[](GtkDropTarget *target, double x, double y, engine *self) -> GdkDragAction
                           {
                               return self->hovered(target, x, y);
                           }));

        connect(target, "leave",
                G_CALLBACK(+[](GtkDropTarget *, engine *self)
                           {
                               self->dropped(drop_kind::cancelled, nullptr, 0, 0);
                           }));

        connect(target, "drop",
                G_CALLBACK(+[](GtkDropTarget *, const GValue *value, double x, double y, engine *self) -> gboolean
                           {
                               return self->dropped(drop_kind::dropped, value, x, y);
                           }));

        gtk_widget_add_controller(GTK_WIDGET(m_view.get()), GTK_EVENT_CONTROLLER(target));
        m_drop = target;
    }

    GdkDragAction engine::hovered(GtkDropTarget *target, double x, double y)
    {
        if (dropped(drop_kind::hovered, gtk_drop_target_get_value(target), x, y))
        {
            return GDK_ACTION_COPY;
        }

        // Not ours, leave the drag to the engine's own drop handling
        gtk_drop_target_reject(target);

        return static_cast<GdkDragAction>(0);
    }

    bool engine::dropped(drop_kind kind, const GValue *value, double x, double y)
    {
        if (!m_events.drop)
        {
            return false;
        }

        std::vector<std::filesystem::path> paths;

        if (value && G_VALUE_HOLDS(value, GDK_TYPE_FILE_LIST))
        {
            auto *const files = static_cast<GdkFileList *>(g_value_get_boxed(value));
            auto *const list  = gdk_file_list_get_files(files);

            for (auto *it = list; it; it = it->next)
            {
                if (auto path = utils::g_string_ptr{g_file_get_path(G_FILE(it->data))}; path)
                {
                    paths.emplace_back(path.get());
                }
            }

            g_slist_free(list);
            paths = drop::normalize(std::move(paths));
        }
        else if (value && G_VALUE_HOLDS_STRING(value) && g_value_get_string(value))
        {
            paths = drop::parse_uri_list(g_value_get_string(value));
        }

        auto event = drop_event{.kind = kind, .paths = std::move(paths)};

        if (kind != drop_kind::cancelled)
        {
            event.position = point{x, y};
        }

        return m_events.drop(event);
    }
} // namespace canopy::wkg

namespace canopy
{
    result<std::unique_ptr<engine>> engine::create(const settings &config, events raise)
    {
        if (!gtk_is_initialized())
        {
            return unexpected{error::engine("gtk has not been initialized on this thread")};
        }

        auto *const parent = static_cast<GtkWidget *>(config.parent);

        if (!GTK_IS_WIDGET(parent))
        {
            return unexpected{error::configuration("the parent is not a gtk widget")};
        }

        wkg::attachment kind{};

        if (GTK_IS_WINDOW(parent))
        {
            kind = wkg::attachment::window;
        }
        else if (GTK_IS_FIXED(parent))
        {
            kind = wkg::attachment::fixed;
        }
        else if (GTK_IS_OVERLAY(parent))
        {
            kind = wkg::attachment::overlay;
        }
        else
        {
            return unexpected{error::configuration(std::format("unsupported parent widget \"{}\", expected a GtkWindow, GtkFixed or GtkOverlay",
                                                               G_OBJECT_TYPE_NAME(parent)))};
        }

        auto rtn = std::make_unique<wkg::engine>(parent, kind, std::move(raise));

        if (auto ok = rtn->setup(config); !ok)
        {
            return unexpected{ok.error()};
        }

        return rtn;
    }

    result<> engine::register_scheme(const std::string &name)
    {
        logger()->debug("scheme \"{}\" needs no process-wide registration on this engine", name);
        return {};
    }
} // namespace canopy
