#pragma once

#include "engine.hpp"
#include "wk.scheme.impl.hpp"

#include <map>
#include <memory>
#include <vector>
#include <functional>

#include <TargetConditionals.h>
#import <WebKit/WebKit.h>

#if TARGET_OS_OSX
#import <AppKit/AppKit.h>
using native_view = NSView;
#else
#import <UIKit/UIKit.h>
using native_view = UIView;
#endif

namespace canopy::wk
{
    class engine;
}

@interface CanopyDelegate : NSObject <WKNavigationDelegate, WKScriptMessageHandler, WKUIDelegate, WKDownloadDelegate>
{
  @public
    canopy::wk::engine *owner;

  @public
    // In-flight downloads by WKDownload, only those the download handler let through carry a destination
    std::map<const void *, canopy::download_request> downloads;
}
@end

#if TARGET_OS_OSX
@interface CanopyWebView : WKWebView
{
  @public
    std::function<bool(const canopy::drop_event &)> drop;
}
@end
#else
@interface CanopyWebView : WKWebView
@end
#endif

namespace canopy::wk
{
    class engine : public canopy::engine
    {
        events m_events;
        std::shared_ptr<bool> m_alive;

      private:
        native_view *m_parent;
        CanopyWebView *m_view{nil};
        CanopyDelegate *m_delegate{nil};

      private:
        std::vector<CanopySchemeHandler *> m_handlers;

      public:
        engine(native_view *parent, events);

      public:
        ~engine() override;

      public:
        result<> setup(const settings &);

      public:
        [[nodiscard]] const events &raise() const;

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
    };
} // namespace canopy::wk
