#pragma once

#include "scheme.impl.hpp"

#include <memory>
#include <string>
#include <functional>
#include <unordered_map>

#import <WebKit/WebKit.h>

namespace canopy::wk
{
    using callback = std::function<void(const std::string &, scheme::request, std::unique_ptr<scheme::responder>)>;

    // WebKit throws when a stopped task is answered, so every task carries this flag
    struct task_state
    {
        bool stopped{false};
    };

    class responder : public scheme::responder
    {
        id<WKURLSchemeTask> m_task;
        std::shared_ptr<task_state> m_state;

      private:
        bool m_answered{false};
        bool m_finished{false};

      public:
        responder(id<WKURLSchemeTask> task, std::shared_ptr<task_state> state);

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

      private:
        [[nodiscard]] bool alive() const;
        void head(int status, const std::string &mime, const std::map<std::string, std::string> &headers);
    };
} // namespace canopy::wk

@interface CanopySchemeHandler : NSObject <WKURLSchemeHandler>
{
  @public
    canopy::wk::callback callback;
    std::unordered_map<void *, std::weak_ptr<canopy::wk::task_state>> tasks;
}
@end
