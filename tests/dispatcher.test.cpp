#include <gtest/gtest.h>

#include "dispatcher.hpp"

#include <deque>
#include <mutex>
#include <thread>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace canopy;

namespace
{
    struct outcome
    {
        int responses{0};
        std::optional<scheme::response> response;

      public:
        std::optional<scheme::stream_response> head;
        std::string streamed;
        bool finished{false};
        bool released{false};
    };

    class recorder : public scheme::responder
    {
        std::shared_ptr<outcome> m_outcome;
        bool m_streams;

      public:
        recorder(std::shared_ptr<outcome> target, bool streams) : m_outcome(std::move(target)), m_streams(streams) {}

      public:
        ~recorder() override
        {
            m_outcome->released = m_outcome->responses == 0 && !m_outcome->finished;
        }

      public:
        void respond(const scheme::response &value) override
        {
            ++m_outcome->responses;
            m_outcome->response = value;
        }

        [[nodiscard]] bool streams() const override
        {
            return m_streams;
        }

        void start(const scheme::stream_response &head) override
        {
            m_outcome->head = head;
        }

        void write(stash data) override
        {
            m_outcome->streamed += data.str();
        }

        void finish() override
        {
            m_outcome->finished = true;
        }
    };

    class dispatcher_test : public ::testing::Test
    {
        std::mutex m_mutex;
        std::deque<scheme::task> m_tasks;

      protected:
        scheme::poster post()
        {
            return [this](scheme::task task)
            {
                std::lock_guard lock{m_mutex};
                m_tasks.emplace_back(std::move(task));
            };
        }

        std::size_t pump()
        {
            std::size_t count{0};

            while (true)
            {
                scheme::task task;

                {
                    std::lock_guard lock{m_mutex};

                    if (m_tasks.empty())
                    {
                        break;
                    }

                    task = std::move(m_tasks.front());
                    m_tasks.pop_front();
                }

                task();
                ++count;
            }

            return count;
        }

        static scheme::request make_request(const std::string &value)
        {
            return scheme::request{{
                .url     = url::parse(value).value(),
                .method  = "GET",
                .headers = {},
                .body    = {},
            }};
        }

        static std::shared_ptr<outcome> send(dispatcher &target, const std::string &value, bool streams = true)
        {
            auto rtn    = std::make_shared<outcome>();
            auto parsed = url::parse(value).value();

            target.handle(parsed.scheme(), make_request(value), std::make_unique<recorder>(rtn, streams));

            return rtn;
        }

        static scheme::response text(std::string body, int status = 200)
        {
            return {.data = stash::from_str(body), .mime = "text/plain", .headers = {}, .status = status};
        }
    };
} // namespace

TEST_F(dispatcher_test, answers_sync_handlers)
{
    dispatcher target{{{"app", scheme::sync_resolver{[](const scheme::request &request)
                                                      {
                                                          return text(request.url().path() == "/ping" ? "pong" : "?");
                                                      }}}},
                      post()};

    auto result = send(target, "app://host/ping");

    EXPECT_EQ(result->responses, 0);
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->status, 200);
    EXPECT_EQ(result->response->data.str(), "pong");
    EXPECT_EQ(target.pending(), 0u);
}

TEST_F(dispatcher_test, routes_each_scheme_to_its_own_handler)
{
    int app{0};
    int io{0};

    dispatcher target{{
                          {"app", scheme::sync_resolver{[&app](const scheme::request &) { ++app; return text("app"); }}},
                          {"io", scheme::sync_resolver{[&io](const scheme::request &) { ++io; return text("io"); }}},
                      },
                      post()};

    auto first  = send(target, "io://host/a");
    auto second = send(target, "io://host/b");
    pump();

    EXPECT_EQ(app, 0);
    EXPECT_EQ(io, 2);
    EXPECT_EQ(first->response->data.str(), "io");
    EXPECT_EQ(second->response->data.str(), "io");
}

TEST_F(dispatcher_test, answers_unregistered_schemes_with_not_found)
{
    dispatcher target{{}, post()};

    auto result = send(target, "other://host/");
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->status, 404);
}

TEST_F(dispatcher_test, throwing_sync_handler_yields_server_error)
{
    dispatcher target{{{"app", scheme::sync_resolver{[](const scheme::request &) -> scheme::response
                                                      {
                                                          throw std::runtime_error{"database offline"};
                                                      }}}},
                      post()};

    auto result = send(target, "app://host/");
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->status, 500);
    EXPECT_EQ(result->response->data.str(), "database offline");
}

TEST_F(dispatcher_test, throwing_async_handler_answers_once)
{
    std::optional<scheme::executor> kept;

    dispatcher target{{{"app", scheme::resolver{[&kept](const scheme::request &, const scheme::executor &executor)
                                                 {
                                                     kept.emplace(executor);
                                                     throw std::runtime_error{"boom"};
                                                 }}}},
                      post()};

    auto result = send(target, "app://host/");

    kept->resolve(text("late"));
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->status, 500);
    EXPECT_EQ(result->response->data.str(), "boom");
    EXPECT_FALSE(kept->valid());
}

TEST_F(dispatcher_test, first_completion_wins)
{
    dispatcher target{{{"app", scheme::resolver{[](const scheme::request &, const scheme::executor &executor)
                                                 {
                                                     executor.resolve(text("first"));
                                                     executor.resolve(text("second"));
                                                     executor.reject(scheme::error::denied);
                                                 }}}},
                      post()};

    auto result = send(target, "app://host/");
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->data.str(), "first");
}

TEST_F(dispatcher_test, rejections_map_to_status_codes)
{
    auto rejecting = [this](scheme::error error)
    {
        dispatcher target{{{"app", scheme::resolver{[error](const scheme::request &, const scheme::executor &executor)
                                                     {
                                                         executor.reject(error);
                                                     }}}},
                          post()};

        auto result = send(target, "app://host/");
        pump();

        return result->response ? result->response->status : 0;
    };

    EXPECT_EQ(rejecting(scheme::error::not_found), 404);
    EXPECT_EQ(rejecting(scheme::error::invalid), 400);
    EXPECT_EQ(rejecting(scheme::error::denied), 401);
    EXPECT_EQ(rejecting(scheme::error::failed), 500);
}

TEST_F(dispatcher_test, abandoned_executor_yields_server_error)
{
    dispatcher target{{{"app", scheme::resolver{[](const scheme::request &, const scheme::executor &) {}}}}, post()};

    auto result = send(target, "app://host/");
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->status, 500);
    EXPECT_EQ(result->response->data.str(), "request abandoned by handler");
}

TEST_F(dispatcher_test, reports_handler_failures)
{
    std::vector<error> reports;

    dispatcher target{{{"app", scheme::sync_resolver{[](const scheme::request &) -> scheme::response
                                                      {
                                                          throw std::runtime_error{"boom"};
                                                      }}},
                       {"io", scheme::resolver{[](const scheme::request &, const scheme::executor &) {}}}},
                      post(), [&reports](const error &reason) { reports.emplace_back(reason); }};

    auto thrown    = send(target, "app://host/");
    auto abandoned = send(target, "io://host/");
    pump();

    EXPECT_EQ(thrown->response->status, 500);
    EXPECT_EQ(abandoned->response->status, 500);

    ASSERT_EQ(reports.size(), 2u);

    EXPECT_EQ(reports[0].kind(), errc::protocol_handler);
    EXPECT_EQ(reports[0].code(), 500);
    EXPECT_EQ(reports[0].message(), "boom");

    EXPECT_EQ(reports[1].kind(), errc::protocol_handler);
    EXPECT_EQ(reports[1].code(), 500);
    EXPECT_EQ(reports[1].message(), "request abandoned by handler");
}

TEST_F(dispatcher_test, completed_requests_report_nothing)
{
    std::vector<error> reports;

    dispatcher target{{{"app", scheme::resolver{[](const scheme::request &, const scheme::executor &executor)
                                                 {
                                                     executor.reject(scheme::error::not_found);
                                                 }}}},
                      post(), [&reports](const error &reason) { reports.emplace_back(reason); }};

    auto result = send(target, "app://host/");
    pump();

    EXPECT_EQ(result->response->status, 404);
    EXPECT_TRUE(reports.empty());
}

TEST_F(dispatcher_test, completes_from_another_thread)
{
    std::optional<scheme::executor> kept;
    dispatcher target{{{"app", scheme::resolver{[&kept](const scheme::request &, const scheme::executor &executor)
                                                 {
                                                     kept.emplace(executor);
                                                 }}}},
                      post()};

    auto result = send(target, "app://host/");

    EXPECT_EQ(pump(), 0u);
    EXPECT_EQ(target.pending(), 1u);

    std::thread{[&kept]
                {
                    auto body = std::string{"from worker"};
                    kept->resolve({.data = stash::view_str(body), .mime = "text/plain", .headers = {}, .status = 200});
                }}
        .join();

    EXPECT_EQ(result->responses, 0);
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_EQ(result->response->data.str(), "from worker");
    EXPECT_EQ(target.pending(), 0u);
}

TEST_F(dispatcher_test, shutdown_drops_pending_requests)
{
    std::optional<scheme::executor> kept;

    auto target = std::make_unique<dispatcher>(std::map<std::string, scheme::handler>{{"app", scheme::resolver{[&kept](const scheme::request &, const scheme::executor &executor)
                                                                                                                {
                                                                                                                    kept.emplace(executor);
                                                                                                                }}}},
                                               post());

    auto result = send(*target, "app://host/");

    EXPECT_TRUE(kept->valid());
    target.reset();
    EXPECT_TRUE(result->released);
    EXPECT_FALSE(kept->valid());

    kept->resolve(text("too late"));
    kept.reset();

    EXPECT_EQ(pump(), 0u);
    EXPECT_EQ(result->responses, 0);
}

TEST_F(dispatcher_test, delivery_queued_before_shutdown_is_discarded)
{
    dispatcher target{{{"app", scheme::sync_resolver{[](const scheme::request &) { return text("never seen"); }}}}, post()};

    auto result = send(target, "app://host/");
    target.shutdown();
    pump();

    EXPECT_EQ(result->responses, 0);
    EXPECT_TRUE(result->released);
}

TEST_F(dispatcher_test, forwards_streams_to_streaming_engines)
{
    dispatcher target{{{"stream", scheme::resolver{[](const scheme::request &, const scheme::executor &executor)
                                                    {
                                                        executor.start({.mime = "text/event-stream", .headers = {}, .status = 200});
                                                        executor.write(stash::from_str("a"));
                                                        executor.write(stash::from_str("b"));
                                                        executor.finish();
                                                        executor.write(stash::from_str("ignored"));
                                                    }}}},
                      post()};

    auto result = send(target, "stream://host/");
    pump();

    ASSERT_TRUE(result->head.has_value());
    EXPECT_EQ(result->head->mime, "text/event-stream");
    EXPECT_EQ(result->streamed, "ab");
    EXPECT_TRUE(result->finished);
    EXPECT_EQ(result->responses, 0);
    EXPECT_EQ(target.pending(), 0u);
}

TEST_F(dispatcher_test, buffers_streams_for_other_engines)
{
    dispatcher target{{{"stream", scheme::resolver{[](const scheme::request &, const scheme::executor &executor)
                                                    {
                                                        executor.start({.mime = "application/json", .headers = {{"X-Chunked", "no"}}, .status = 201});
                                                        executor.write(stash::from_str("[1,"));
                                                        executor.write(stash::from_str("2]"));
                                                        executor.finish();
                                                    }}}},
                      post()};

    auto result = send(target, "stream://host/", false);
    pump();

    ASSERT_EQ(result->responses, 1);
    EXPECT_FALSE(result->head.has_value());
    EXPECT_EQ(result->response->status, 201);
    EXPECT_EQ(result->response->mime, "application/json");
    EXPECT_EQ(result->response->headers.at("X-Chunked"), "no");
    EXPECT_EQ(result->response->data.str(), "[1,2]");
}

TEST_F(dispatcher_test, rejecting_a_started_stream_ends_it)
{
    auto handler = scheme::resolver{[](const scheme::request &, const scheme::executor &executor)
                                    {
                                        executor.start({.mime = "text/plain", .headers = {}, .status = 200});
                                        executor.write(stash::from_str("partial"));
                                        executor.reject(scheme::error::failed);
                                    }};

    dispatcher target{{{"stream", handler}}, post()};

    auto streamed = send(target, "stream://host/", true);
    auto buffered = send(target, "stream://host/", false);
    pump();

    EXPECT_TRUE(streamed->finished);
    EXPECT_EQ(streamed->streamed, "partial");

    ASSERT_EQ(buffered->responses, 1);
    EXPECT_EQ(buffered->response->status, 500);
}

TEST_F(dispatcher_test, exposes_request_details)
{
    std::optional<scheme::request> seen;

    dispatcher target{{{"app", scheme::sync_resolver{[&seen](const scheme::request &request)
                                                      {
                                                          seen.emplace(request);
                                                          return text("ok");
                                                      }}}},
                      post()};

    auto body = std::string{"payload"};
    auto rtn  = std::make_shared<outcome>();

    target.handle("app",
                  scheme::request{{
                      .url     = url::parse("app://host/submit?x=1").value(),
                      .method  = "POST",
                      .headers = {{"Content-Type", "text/plain"}},
                      .body    = {body.begin(), body.end()},
                  }},
                  std::make_unique<recorder>(rtn, true));

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->method(), "POST");
    EXPECT_EQ(seen->url().query(), "x=1");
    EXPECT_EQ(seen->headers().at("Content-Type"), "text/plain");
    EXPECT_EQ(seen->content().str(), "payload");
}
