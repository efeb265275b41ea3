#include "wv2.engine.impl.hpp"

#include "log.hpp"
#include "utils/win32.hpp"

#include <set>
#include <array>
#include <format>
#include <algorithm>
#include <filesystem>

#include <commctrl.h>
#include <WebView2EnvironmentOptions.h>

#include <lockpp/lock.hpp>

namespace canopy::wv2
{
    using Microsoft::WRL::Make;
    using Microsoft::WRL::Callback;

    static constexpr auto host_class     = L"canopy_host";
    static constexpr auto messages_class = L"canopy_messages";

    static lockpp::lock<std::set<std::string>> registered;

    template <typename T>
    struct pending_result
    {
        bool done{false};
        HRESULT status{E_FAIL};
        ComPtr<T> value;
    };

    static std::filesystem::path to_path(LPWSTR raw)
    {
        const auto owned = utils::co_string{raw};
        return owned ? std::filesystem::path{std::wstring{owned.get()}} : std::filesystem::path{};
    }

    // Runs the message loop until `done` is set, false if the application quit meanwhile
    static bool pump_until(const bool &done)
    {
        MSG msg;

        while (!done)
        {
            const auto status = GetMessageW(&msg, nullptr, 0, 0);

            if (status == 0)
            {
                PostQuitMessage(static_cast<int>(msg.wParam));
                return false;
            }

            if (status < 0)
            {
                return false;
            }

            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }

        return true;
    }

    static LRESULT CALLBACK run_task(HWND window, UINT msg, WPARAM wparam, LPARAM lparam)
    {
        if (msg != WM_APP)
        {
            return DefWindowProcW(window, msg, wparam, lparam);
        }

        auto task = std::unique_ptr<scheme::task>{reinterpret_cast<scheme::task *>(lparam)};

        if (task && *task)
        {
            (*task)();
        }

        return 0;
    }

    static void register_classes()
    {
        static const auto once = []
        {
            auto *const instance = GetModuleHandleW(nullptr);

            WNDCLASSEXW host{};
            host.cbSize        = sizeof(WNDCLASSEXW);
            host.hInstance     = instance;
            host.lpszClassName = host_class;
            host.lpfnWndProc   = DefWindowProcW;

            WNDCLASSEXW messages{};
            messages.cbSize        = sizeof(WNDCLASSEXW);
            messages.hInstance     = instance;
            messages.lpszClassName = messages_class;
            messages.lpfnWndProc   = run_task;

            RegisterClassExW(&host);
            RegisterClassExW(&messages);

            return true;
        }();

        static_cast<void>(once);
    }

    // One message-only window per ui thread. It outlives every engine, so queued tasks always find it.
    static HWND messages_window()
    {
        thread_local HWND window = CreateWindowExW(0, messages_class, nullptr, 0, 0, 0, 0, 0, HWND_MESSAGE, nullptr, GetModuleHandleW(nullptr), nullptr);
        return window;
    }

    // The environment is shared by every webview, custom schemes have to be known before it starts
    static result<ComPtr<ICoreWebView2Environment>> shared_environment(bool autoplay)
    {
        static ComPtr<ICoreWebView2Environment> instance;

        if (instance)
        {
            return instance;
        }

        auto options = Make<CoreWebView2EnvironmentOptions>();

        std::vector<ComPtr<ICoreWebView2CustomSchemeRegistration>> schemes;
        std::vector<ICoreWebView2CustomSchemeRegistration *> entries;

        for (const auto &name : *registered.read())
        {
            static constexpr std::array<LPCWSTR, 1> origins{L"*"};

            const auto wide = utils::widen(name);
            auto entry      = Make<CoreWebView2CustomSchemeRegistration>(wide.c_str());

            entry->SetAllowedOrigins(static_cast<UINT32>(origins.size()), const_cast<LPCWSTR *>(origins.data()));
            entry->put_TreatAsSecure(TRUE);
            entry->put_HasAuthorityComponent(TRUE);

            entries.emplace_back(entry.Get());
            schemes.emplace_back(std::move(entry));
        }

        if (ComPtr<ICoreWebView2EnvironmentOptions4> options4; SUCCEEDED(options.As(&options4)))
        {
            options4->SetCustomSchemeRegistrations(static_cast<UINT32>(entries.size()), entries.data());
        }

        if (autoplay)
        {
            options->put_AdditionalBrowserArguments(L"--autoplay-policy=no-user-gesture-required");
        }

        auto state  = std::make_shared<pending_result<ICoreWebView2Environment>>();
        auto status = CreateCoreWebView2EnvironmentWithOptions(
            nullptr, nullptr, options.Get(),
            Callback<ICoreWebView2CreateCoreWebView2EnvironmentCompletedHandler>(
                [state](HRESULT result, ICoreWebView2Environment *created) -> HRESULT
                {
                    state->status = result;
                    state->value  = created;
                    state->done   = true;

                    return S_OK;
                })
                .Get());

        if (FAILED(status))
        {
            return unexpected{error::engine("could not create webview2 environment, is the runtime installed?", status)};
        }

        if (!pump_until(state->done))
        {
            return unexpected{error::engine("application quit while the webview2 environment was starting")};
        }

        if (FAILED(state->status) || !state->value)
        {
            return unexpected{error::engine("could not create webview2 environment", state->status)};
        }

        instance = state->value;

        return instance;
    }

    engine::engine(HWND parent, events raise) : m_events(std::move(raise)), m_alive(std::make_shared<bool>(true)), m_parent(parent) {}

    engine::~engine()
    {
        detach();

        if (m_controller)
        {
            m_controller->Close();
        }

        m_view.Reset();
        m_controller.Reset();

        if (m_host)
        {
            DestroyWindow(m_host);
        }
    }

    result<> engine::setup(const settings &config)
    {
        register_classes();

        m_messages = messages_window();

        if (!m_messages)
        {
            return unexpected{error::engine("could not create message window", static_cast<std::int64_t>(GetLastError()))};
        }

        auto environment = shared_environment(config.autoplay);

        if (!environment)
        {
            return unexpected{environment.error()};
        }

        m_environment = std::move(environment.value());

        {
            auto known = registered.read();

            for (const auto &name : config.schemes)
            {
                if (known->contains(name))
                {
                    continue;
                }

                logger()->warn("scheme \"{}\" was not registered before the first webview was created, see webview::register_scheme", name);
            }
        }

        RECT area{};
        GetClientRect(m_parent, &area);

        if (config.bounds)
        {
            const auto &bounds = config.bounds.value();

            m_fill = false;
            area   = RECT{bounds.x, bounds.y, bounds.x + bounds.width, bounds.y + bounds.height};
        }

        m_host = CreateWindowExW(0, host_class, nullptr, WS_CHILD | WS_VISIBLE | WS_CLIPCHILDREN, area.left, area.top, area.right - area.left,
                                 area.bottom - area.top, m_parent, nullptr, GetModuleHandleW(nullptr), nullptr);

        if (!m_host)
        {
            return unexpected{error::engine("could not create host window", static_cast<std::int64_t>(GetLastError()))};
        }

        auto state    = std::make_shared<pending_result<ICoreWebView2Controller>>();
        auto complete = Callback<ICoreWebView2CreateCoreWebView2ControllerCompletedHandler>(
            [state](HRESULT result, ICoreWebView2Controller *created) -> HRESULT
            {
                state->status = result;
                state->value  = created;
                state->done   = true;

                return S_OK;
            });

        HRESULT status{E_FAIL};
        ComPtr<ICoreWebView2Environment10> environment10;

        if (config.incognito && SUCCEEDED(m_environment.As(&environment10)))
        {
            ComPtr<ICoreWebView2ControllerOptions> options;

            if (status = environment10->CreateCoreWebView2ControllerOptions(&options); SUCCEEDED(status))
            {
                options->put_IsInPrivateModeEnabled(TRUE);
                status = environment10->CreateCoreWebView2ControllerWithOptions(m_host, options.Get(), complete.Get());
            }
        }
        else
        {
            if (config.incognito)
            {
                logger()->warn("private mode needs a newer webview2 runtime, browsing data will persist");
            }

            status = m_environment->CreateCoreWebView2Controller(m_host, complete.Get());
        }

        if (FAILED(status))
        {
            return unexpected{error::engine("could not create webview2 controller", status)};
        }

        if (!pump_until(state->done))
        {
            return unexpected{error::engine("application quit while the webview was starting")};
        }

        if (FAILED(state->status) || !state->value)
        {
            return unexpected{error::engine("could not create webview2 controller", state->status)};
        }

        m_controller = state->value;

        if (status = m_controller->get_CoreWebView2(&m_view); FAILED(status))
        {
            return unexpected{error::engine("could not get webview2 core", status)};
        }

        ComPtr<ICoreWebView2Settings> preferences;

        if (status = m_view->get_Settings(&preferences); FAILED(status))
        {
            return unexpected{error::engine("could not get webview2 settings", status)};
        }

        preferences->put_AreDevToolsEnabled(config.devtools);
        preferences->put_IsStatusBarEnabled(FALSE);
        preferences->put_IsWebMessageEnabled(TRUE);

        if (config.user_agent)
        {
            ComPtr<ICoreWebView2Settings2> preferences2;

            if (FAILED(preferences.As(&preferences2)))
            {
                return unexpected{error::engine("this webview2 runtime can not change the user agent")};
            }

            preferences2->put_UserAgent(utils::widen(config.user_agent.value()).c_str());
        }

        if (config.transparent)
        {
            if (ComPtr<ICoreWebView2Controller2> controller2; SUCCEEDED(m_controller.As(&controller2)))
            {
                controller2->put_DefaultBackgroundColor(COREWEBVIEW2_COLOR{0, 0, 0, 0});
            }
        }

        for (const auto &name : config.schemes)
        {
            const auto filter = utils::widen(std::format("{}:*", name));

            if (status = m_view->AddWebResourceRequestedFilter(filter.c_str(), COREWEBVIEW2_WEB_RESOURCE_CONTEXT_ALL); FAILED(status))
            {
                return unexpected{error::engine(std::format("could not intercept scheme \"{}\"", name), status)};
            }
        }

        listen();

        if (m_fill)
        {
            SetWindowSubclass(m_parent, track, reinterpret_cast<UINT_PTR>(this), reinterpret_cast<DWORD_PTR>(this));
        }

        fit();
        m_controller->put_IsVisible(TRUE);

        return {};
    }

    void engine::listen()
    {
        EventRegistrationToken token{};

        m_view->add_WebMessageReceived(Callback<ICoreWebView2WebMessageReceivedEventHandler>(
                                           [this](ICoreWebView2 *, ICoreWebView2WebMessageReceivedEventArgs *args) -> HRESULT
                                           {
                                               LPWSTR raw{};

                                               // Anything but a string never reaches the host
                                               if (FAILED(args->TryGetWebMessageAsString(&raw)))
                                               {
                                                   return S_OK;
                                               }

                                               auto message = utils::narrow(utils::co_string{raw});

                                               if (m_events.message)
                                               {
                                                   m_events.message(std::move(message));
                                               }

                                               return S_OK;
                                           })
                                           .Get(),
                                       &token);

        m_revoke.emplace_back([view = m_view, token] { view->remove_WebMessageReceived(token); });

        m_view->add_WebResourceRequested(
            Callback<ICoreWebView2WebResourceRequestedEventHandler>(
                [this](ICoreWebView2 *, ICoreWebView2WebResourceRequestedEventArgs *args) -> HRESULT
                {
                    ComPtr<ICoreWebView2WebResourceRequest> native;
                    ComPtr<ICoreWebView2Deferral> deferral;

                    if (auto status = args->get_Request(&native); FAILED(status))
                    {
                        return status;
                    }

                    if (auto status = args->GetDeferral(&deferral); FAILED(status))
                    {
                        return status;
                    }

                    auto target = std::make_unique<responder>(m_environment, args, std::move(deferral));
                    auto parsed = make_request(native.Get());

                    if (!parsed)
                    {
                        logger()->warn("rejecting malformed scheme request: {}", parsed.error().what());
                        target->respond({.data = stash::from_str(parsed.error().message()), .mime = "text/plain", .status = 400});

                        return S_OK;
                    }

                    if (!m_events.request)
                    {
                        return S_OK;
                    }

                    const auto name = parsed->url().scheme();
                    m_events.request(name, std::move(parsed.value()), std::move(target));

                    return S_OK;
                })
                .Get(),
            &token);

        m_revoke.emplace_back([view = m_view, token] { view->remove_WebResourceRequested(token); });

        m_view->add_NavigationStarting(Callback<ICoreWebView2NavigationStartingEventHandler>(
                                           [this](ICoreWebView2 *, ICoreWebView2NavigationStartingEventArgs *args) -> HRESULT
                                           {
                                               LPWSTR raw{};
                                               args->get_Uri(&raw);

                                               const auto target = utils::narrow(utils::co_string{raw});

                                               if (m_events.navigation && !m_events.navigation(target))
                                               {
                                                   args->put_Cancel(TRUE);
                                                   return S_OK;
                                               }

                                               if (m_events.load)
                                               {
                                                   m_events.load(page_load::started, target);
                                               }

                                               return S_OK;
                                           })
                                           .Get(),
                                       &token);

        m_revoke.emplace_back([view = m_view, token] { view->remove_NavigationStarting(token); });

        m_view->add_NavigationCompleted(Callback<ICoreWebView2NavigationCompletedEventHandler>(
                                            [this](ICoreWebView2 *, ICoreWebView2NavigationCompletedEventArgs *) -> HRESULT
                                            {
                                                // The engine creates its input windows lazily
                                                hook_drops();

                                                if (m_events.load)
                                                {
                                                    m_events.load(page_load::finished, url());
                                                }

                                                return S_OK;
                                            })
                                            .Get(),
                                        &token);

        m_revoke.emplace_back([view = m_view, token] { view->remove_NavigationCompleted(token); });

        m_view->add_ProcessFailed(Callback<ICoreWebView2ProcessFailedEventHandler>(
                                      [this](ICoreWebView2 *, ICoreWebView2ProcessFailedEventArgs *args) -> HRESULT
                                      {
                                          COREWEBVIEW2_PROCESS_FAILED_KIND kind{};
                                          args->get_ProcessFailedKind(&kind);

                                          const char *reason{nullptr};

                                          switch (kind)
                                          {
                                          case COREWEBVIEW2_PROCESS_FAILED_KIND_BROWSER_PROCESS_EXITED:
                                              reason = "browser process exited";
                                              break;
                                          case COREWEBVIEW2_PROCESS_FAILED_KIND_RENDER_PROCESS_EXITED:
                                              reason = "render process exited";
                                              break;
                                          case COREWEBVIEW2_PROCESS_FAILED_KIND_RENDER_PROCESS_UNRESPONSIVE:
                                              reason = "render process is unresponsive";
                                              break;
                                          default:
                                              return S_OK;
                                          }

                                          if (m_events.crashed)
                                          {
                                              m_events.crashed(error::engine(reason, static_cast<std::int64_t>(kind)));
                                          }

                                          return S_OK;
                                      })
                                      .Get(),
                                  &token);

        m_revoke.emplace_back([view = m_view, token] { view->remove_ProcessFailed(token); });

        if (m_events.new_window)
        {
            m_view->add_NewWindowRequested(Callback<ICoreWebView2NewWindowRequestedEventHandler>(
                                               [this](ICoreWebView2 *, ICoreWebView2NewWindowRequestedEventArgs *args) -> HRESULT
                                               {
                                                   LPWSTR raw{};
                                                   args->get_Uri(&raw);

                                                   const auto target = utils::narrow(utils::co_string{raw});

                                                   // Handled without a new window suppresses the popup
                                                   args->put_Handled(TRUE);

                                                   if (!m_events.new_window || !m_events.new_window(target))
                                                   {
                                                       logger()->debug("new window for \"{}\" was denied", target);
                                                       return S_OK;
                                                   }

                                                   return m_view->Navigate(utils::widen(target).c_str());
                                               })
                                               .Get(),
                                           &token);

            m_revoke.emplace_back([view = m_view, token] { view->remove_NewWindowRequested(token); });
        }

        ComPtr<ICoreWebView2_4> view4;

        if (!m_events.download_started)
        {
            return;
        }

        if (FAILED(m_view.As(&view4)))
        {
            logger()->warn("this webview2 runtime does not report downloads");
            return;
        }

        view4->add_DownloadStarting(Callback<ICoreWebView2DownloadStartingEventHandler>(
                                        [this](ICoreWebView2 *, ICoreWebView2DownloadStartingEventArgs *args) -> HRESULT
                                        {
                                            return started(args);
                                        })
                                        .Get(),
                                    &token);

        m_revoke.emplace_back([view4, token] { view4->remove_DownloadStarting(token); });
    }

    HRESULT engine::started(ICoreWebView2DownloadStartingEventArgs *args)
    {
        ComPtr<ICoreWebView2DownloadOperation> operation;

        if (auto status = args->get_DownloadOperation(&operation); FAILED(status))
        {
            return status;
        }

        LPWSTR uri{};
        LPWSTR path{};

        operation->get_Uri(&uri);
        args->get_ResultFilePath(&path);

        auto request = download_request{
            .url         = utils::narrow(utils::co_string{uri}),
            .destination = to_path(path),
        };

        if (!m_events.download_started || !m_events.download_started(request))
        {
            args->put_Cancel(TRUE);
            return S_OK;
        }

        args->put_ResultFilePath(request.destination.wstring().c_str());
        args->put_Handled(TRUE);

        EventRegistrationToken token{};

        operation->add_StateChanged(Callback<ICoreWebView2StateChangedEventHandler>(
                                        [this, url = request.url](ICoreWebView2DownloadOperation *operation, IUnknown *) -> HRESULT
                                        {
                                            COREWEBVIEW2_DOWNLOAD_STATE state{};
                                            operation->get_State(&state);

                                            if (state == COREWEBVIEW2_DOWNLOAD_STATE_IN_PROGRESS || !m_events.download_finished)
                                            {
                                                return S_OK;
                                            }

                                            auto outcome = download_result{
                                                .url     = url,
                                                .path    = std::nullopt,
                                                .success = state == COREWEBVIEW2_DOWNLOAD_STATE_COMPLETED,
                                            };

                                            if (LPWSTR path{}; outcome.success && SUCCEEDED(operation->get_ResultFilePath(&path)))
                                            {
                                                outcome.path = to_path(path);
                                            }

                                            m_events.download_finished(outcome);

                                            return S_OK;
                                        })
                                        .Get(),
                                    &token);

        m_revoke.emplace_back([operation, token] { operation->remove_StateChanged(token); });

        return S_OK;
    }

    void engine::fit()
    {
        if (m_fill)
        {
            RECT area{};
            GetClientRect(m_parent, &area);
            MoveWindow(m_host, 0, 0, area.right - area.left, area.bottom - area.top, TRUE);
        }

        RECT bounds{};
        GetClientRect(m_host, &bounds);

        m_controller->put_Bounds(bounds);
    }

    void engine::hook_drops()
    {
        if (!m_events.drop)
        {
            return;
        }

        static constexpr auto visit = [](HWND window, LPARAM data) -> BOOL
        {
            auto *const self = reinterpret_cast<engine *>(data);

            auto *const current = static_cast<IDropTarget *>(GetPropW(window, L"OleDropTargetInterface"));

            if (!current)
            {
                return TRUE;
            }

            if (std::ranges::any_of(self->m_drops, [window](const auto &drop) { return drop->window() == window; }))
            {
                return TRUE;
            }

            auto original = ComPtr<IDropTarget>{current};
            auto wrapper  = Make<drop_target>(window, original, [self](const drop_event &event)
                                              { return self->m_events.drop && self->m_events.drop(event); });

            RevokeDragDrop(window);

            if (auto status = RegisterDragDrop(window, wrapper.Get()); FAILED(status))
            {
                logger()->warn("could not intercept drops: {:#x}", static_cast<std::uint32_t>(status));
                RegisterDragDrop(window, original.Get());

                return TRUE;
            }

            self->m_drops.emplace_back(std::move(wrapper));

            return TRUE;
        };

        EnumChildWindows(m_host, visit, reinterpret_cast<LPARAM>(this));
    }

    LRESULT CALLBACK engine::track(HWND window, UINT msg, WPARAM wparam, LPARAM lparam, UINT_PTR, DWORD_PTR data)
    {
        if (msg == WM_SIZE)
        {
            auto *const self = reinterpret_cast<engine *>(data);

            if (self->m_fill && self->m_controller)
            {
                self->fit();
            }
        }

        return DefSubclassProc(window, msg, wparam, lparam);
    }

    canopy::capabilities engine::supported() const
    {
        return {
            capability::transparent,
            capability::devtools,
            capability::zoom,
            capability::print,
            capability::file_drop,
            capability::user_agent,
            capability::browsing_data,
            capability::download,
            capability::new_window,
        };
    }

    std::string engine::transport() const
    {
        return "function (message) { window.chrome.webview.postMessage(message); }";
    }

    void engine::post(scheme::task task)
    {
        auto *const pending = new scheme::task{std::move(task)};

        if (PostMessageW(m_messages, WM_APP, 0, reinterpret_cast<LPARAM>(pending)))
        {
            return;
        }

        logger()->error("could not post task: {}", GetLastError());
        delete pending;
    }

    void engine::detach()
    {
        if (!m_alive)
        {
            return;
        }

        m_alive.reset();
        m_events = {};

        for (const auto &revoke : m_revoke)
        {
            revoke();
        }

        m_revoke.clear();

        for (const auto &drop : m_drops)
        {
            drop->restore();
        }

        m_drops.clear();

        RemoveWindowSubclass(m_parent, track, reinterpret_cast<UINT_PTR>(this));
    }

    result<> engine::add_script(const std::string &code)
    {
        if (auto status = m_view->AddScriptToExecuteOnDocumentCreated(utils::widen(code).c_str(), nullptr); FAILED(status))
        {
            return unexpected{error::engine("could not add script", status)};
        }

        return {};
    }

    result<> engine::navigate(const std::string &url, const headers &extra)
    {
        const auto target = utils::widen(url);

        if (extra.empty())
        {
            if (auto status = m_view->Navigate(target.c_str()); FAILED(status))
            {
                return unexpected{error::engine(std::format("could not navigate to {}", url), status)};
            }

            return {};
        }

        ComPtr<ICoreWebView2_2> view2;
        ComPtr<ICoreWebView2Environment2> environment2;

        if (FAILED(m_view.As(&view2)) || FAILED(m_environment.As(&environment2)))
        {
            return unexpected{error::engine("this webview2 runtime can not navigate with headers")};
        }

        std::wstring lines;

        for (const auto &[name, value] : extra)
        {
            lines += utils::widen(std::format("{}: {}\r\n", name, value));
        }

        ComPtr<ICoreWebView2WebResourceRequest> request;

        if (auto status = environment2->CreateWebResourceRequest(target.c_str(), L"GET", nullptr, lines.c_str(), &request); FAILED(status))
        {
            return unexpected{error::engine("could not create navigation request", status)};
        }

        if (auto status = view2->NavigateWithWebResourceRequest(request.Get()); FAILED(status))
        {
            return unexpected{error::engine(std::format("could not navigate to {}", url), status)};
        }

        return {};
    }

    result<> engine::load_html(const std::string &html)
    {
        if (auto status = m_view->NavigateToString(utils::widen(html).c_str()); FAILED(status))
        {
            return unexpected{error::engine("could not load html", status)};
        }

        return {};
    }

    result<> engine::reload()
    {
        if (auto status = m_view->Reload(); FAILED(status))
        {
            return unexpected{error::engine("could not reload", status)};
        }

        return {};
    }

    void engine::execute(const std::string &code, std::function<void(result<std::string>)> callback)
    {
        const auto source = utils::widen(code);
        auto alive        = std::weak_ptr<bool>{m_alive};

        if (ComPtr<ICoreWebView2_21> view21; SUCCEEDED(m_view.As(&view21)))
        {
            auto done = [alive, callback](HRESULT status, ICoreWebView2ExecuteScriptResult *outcome) -> HRESULT
            {
                if (alive.expired() || !callback)
                {
                    return S_OK;
                }

                if (FAILED(status) || !outcome)
                {
                    callback(unexpected{error::script("could not execute script", status)});
                    return S_OK;
                }

                BOOL succeeded{FALSE};
                outcome->get_Succeeded(&succeeded);

                if (succeeded)
                {
                    LPWSTR json{};
                    outcome->get_ResultAsJson(&json);

                    callback(utils::narrow(utils::co_string{json}));
                    return S_OK;
                }

                ComPtr<ICoreWebView2ScriptException> exception;

                if (FAILED(outcome->get_Exception(&exception)) || !exception)
                {
                    callback(unexpected{error::script("script raised an exception")});
                    return S_OK;
                }

                LPWSTR name{};
                LPWSTR message{};

                exception->get_Name(&name);
                exception->get_Message(&message);

                callback(unexpected{error::script(std::format("{}: {}", utils::narrow(utils::co_string{name}), utils::narrow(utils::co_string{message})))});

                return S_OK;
            };

            if (auto status = view21->ExecuteScriptWithResult(source.c_str(), Callback<ICoreWebView2ExecuteScriptWithResultCompletedHandler>(done).Get());
                FAILED(status))
            {
                logger()->error("could not execute script: {:#x}", static_cast<std::uint32_t>(status));
            }

            return;
        }

        // Older runtimes report exceptions as a plain `null`
        auto done = [alive, callback = std::move(callback)](HRESULT status, LPCWSTR json) -> HRESULT
        {
            if (alive.expired() || !callback)
            {
                return S_OK;
            }

            if (FAILED(status))
            {
                callback(unexpected{error::script("could not execute script", status)});
                return S_OK;
            }

            callback(utils::narrow(std::wstring_view{json ? json : L"null"}));

            return S_OK;
        };

        const auto status = m_view->ExecuteScript(source.c_str(), Callback<ICoreWebView2ExecuteScriptCompletedHandler>(done).Get());

        if (SUCCEEDED(status))
        {
            return;
        }

        logger()->error("could not execute script: {:#x}", static_cast<std::uint32_t>(status));
    }

    result<> engine::set_visible(bool visible)
    {
        ShowWindow(m_host, visible ? SW_SHOW : SW_HIDE);
        m_controller->put_IsVisible(visible);

        return {};
    }

    result<> engine::resize(const rect &bounds)
    {
        m_fill = false;

        MoveWindow(m_host, bounds.x, bounds.y, bounds.width, bounds.height, TRUE);
        fit();

        return {};
    }

    result<> engine::zoom(double factor)
    {
        if (auto status = m_controller->put_ZoomFactor(factor); FAILED(status))
        {
            return unexpected{error::engine("could not zoom", status)};
        }

        return {};
    }

    result<> engine::print()
    {
        ComPtr<ICoreWebView2_16> view16;

        if (FAILED(m_view.As(&view16)))
        {
            return unexpected{error::engine("this webview2 runtime can not print")};
        }

        if (auto status = view16->ShowPrintUI(COREWEBVIEW2_PRINT_DIALOG_KIND_BROWSER); FAILED(status))
        {
            return unexpected{error::engine("could not show print dialog", status)};
        }

        return {};
    }

    result<> engine::open_devtools()
    {
        ComPtr<ICoreWebView2Settings> preferences;

        if (SUCCEEDED(m_view->get_Settings(&preferences)))
        {
            preferences->put_AreDevToolsEnabled(TRUE);
        }

        if (auto status = m_view->OpenDevToolsWindow(); FAILED(status))
        {
            return unexpected{error::engine("could not open devtools", status)};
        }

        m_devtools = true;

        return {};
    }

    result<> engine::close_devtools()
    {
        return {};
    }

    bool engine::devtools_open() const
    {
        // WebView2 does not report when its devtools window closes
        return m_devtools;
    }

    std::string engine::url() const
    {
        LPWSTR raw{};

        if (FAILED(m_view->get_Source(&raw)))
        {
            return "about:blank";
        }

        auto rtn = utils::narrow(utils::co_string{raw});

        return rtn.empty() ? "about:blank" : rtn;
    }

    result<> engine::clear_browsing_data()
    {
        ComPtr<ICoreWebView2_13> view13;
        ComPtr<ICoreWebView2Profile> profile;
        ComPtr<ICoreWebView2Profile2> profile2;

        if (FAILED(m_view.As(&view13)) || FAILED(view13->get_Profile(&profile)) || FAILED(profile.As(&profile2)))
        {
            return unexpected{error::engine("this webview2 runtime can not clear browsing data")};
        }

        auto done = Callback<ICoreWebView2ClearBrowsingDataCompletedHandler>(
            [](HRESULT status) -> HRESULT
            {
                if (FAILED(status))
                {
                    logger()->error("could not clear browsing data: {:#x}", static_cast<std::uint32_t>(status));
                }

                return S_OK;
            });

        if (auto status = profile2->ClearBrowsingDataAll(done.Get()); FAILED(status))
        {
            return unexpected{error::engine("could not clear browsing data", status)};
        }

        return {};
    }
} // namespace canopy::wv2

namespace canopy
{
    result<std::unique_ptr<engine>> engine::create(const settings &config, events raise)
    {
        auto *const parent = static_cast<HWND>(config.parent);

        if (!IsWindow(parent))
        {
            return unexpected{error::configuration("parent is not a window")};
        }

        auto rtn = std::make_unique<wv2::engine>(parent, std::move(raise));

        if (auto ok = rtn->setup(config); !ok)
        {
            return unexpected{ok.error()};
        }

        return rtn;
    }

    result<> engine::register_scheme(const std::string &name)
    {
        wv2::registered.write()->emplace(name);
        return {};
    }
} // namespace canopy
