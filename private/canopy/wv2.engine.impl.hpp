#pragma once

#include "engine.hpp"
#include "wv2.drop.impl.hpp"
#include "wv2.scheme.impl.hpp"

#include <memory>
#include <vector>
#include <functional>

#include <windows.h>

#include <wrl.h>
#include <WebView2.h>

namespace canopy::wv2
{
    class engine : public canopy::engine
    {
        events m_events;
        std::shared_ptr<bool> m_alive;

      private:
        HWND m_parent;
        HWND m_host{nullptr};
        HWND m_messages{nullptr};
        bool m_fill{true};

      private:
        ComPtr<ICoreWebView2Environment> m_environment;
        ComPtr<ICoreWebView2Controller> m_controller;
        ComPtr<ICoreWebView2> m_view;

      private:
        std::vector<std::function<void()>> m_revoke;
        std::vector<ComPtr<drop_target>> m_drops;
        bool m_devtools{false};

      public:
        engine(HWND parent, events);

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
        void listen();
        HRESULT started(ICoreWebView2DownloadStartingEventArgs *);
        void fit();
        void hook_drops();

      private:
        static LRESULT CALLBACK track(HWND, UINT, WPARAM, LPARAM, UINT_PTR, DWORD_PTR);
    };
} // namespace canopy::wv2
