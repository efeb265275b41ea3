#pragma once

#include "scheme.impl.hpp"

#include <canopy/error.hpp>

#include <wrl.h>
#include <WebView2.h>

namespace canopy::wv2
{
    using Microsoft::WRL::ComPtr;

    // Answers one deferred WebResourceRequested event. The engine only takes complete bodies.
    class responder : public scheme::responder
    {
        ComPtr<ICoreWebView2Environment> m_environment;
        ComPtr<ICoreWebView2WebResourceRequestedEventArgs> m_args;
        ComPtr<ICoreWebView2Deferral> m_deferral;

      private:
        bool m_answered{false};

      public:
        responder(ComPtr<ICoreWebView2Environment> environment, ComPtr<ICoreWebView2WebResourceRequestedEventArgs> args,
                  ComPtr<ICoreWebView2Deferral> deferral);

      public:
        ~responder() override;

      public:
        void respond(const scheme::response &) override;

      public:
        [[nodiscard]] bool streams() const override;

      public:
        void start(const scheme::stream_response &) override;
        void write(stash data) override;
        void finish() override;
    };

    [[nodiscard]] result<scheme::request> make_request(ICoreWebView2WebResourceRequest *);
} // namespace canopy::wv2
