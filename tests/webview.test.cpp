#include <gtest/gtest.h>

#include "mock.engine.hpp"

#include <canopy/webview.hpp>

#include <cmath>
#include <filesystem>
#include <format>
#include <thread>
#include <optional>
#include <stdexcept>

using namespace canopy;

namespace
{
    class webview_test : public ::testing::Test
    {
        static inline int window{};

      protected:
        static native_window parent()
        {
            return &window;
        }

        static scheme::response text(std::string content)
        {
            return {.data = stash::from_str(content), .mime = "text/plain"};
        }

        static webview make(options opts = {})
        {
            auto rtn = webview::create(parent(), std::move(opts));

            if (!rtn)
            {
                throw std::runtime_error{rtn.error().what()};
            }

            return std::move(rtn.value());
        }

      protected:
        void SetUp() override
        {
            mock::run();
            mock::fail_next(std::nullopt);
            mock::stream_next(true);
        }

        void TearDown() override
        {
            mock::run();
        }
    };
} // namespace

TEST_F(webview_test, installs_bridge_before_user_scripts)
{
    auto view = make({.url = "app://host/index.html", .scripts = {"window.first = 1;", "window.second = 2;"}});
    auto *engine = mock::current();

    ASSERT_NE(engine, nullptr);
    ASSERT_EQ(engine->scripts.size(), 3u);

    EXPECT_NE(engine->scripts[0].find("window.__mock.push(message)"), std::string::npos);
    EXPECT_NE(engine->scripts[0].find("\"ipc\""), std::string::npos);
    EXPECT_EQ(engine->scripts[1], "window.first = 1;");
    EXPECT_EQ(engine->scripts[2], "window.second = 2;");

    EXPECT_EQ(engine->navigations, std::vector<std::string>{"app://host/index.html"});
}

TEST_F(webview_test, passes_settings_to_engine)
{
    auto view = make({
        .user_agent  = "canopy-test",
        .transparent = true,
        .devtools    = true,
        .incognito   = true,
        .protocols   = {{"App", scheme::sync_resolver{[](const scheme::request &) { return text("x"); }}}},
        .bounds      = rect{1, 2, 300, 400},
    });

    const auto &config = mock::current()->config;

    EXPECT_EQ(config.parent, parent());
    EXPECT_EQ(config.user_agent, "canopy-test");
    EXPECT_TRUE(config.transparent);
    EXPECT_TRUE(config.devtools);
    EXPECT_TRUE(config.incognito);
    EXPECT_FALSE(config.autoplay);
    EXPECT_EQ(config.schemes, std::vector<std::string>{"app"});

    ASSERT_TRUE(config.bounds.has_value());
    EXPECT_EQ(config.bounds->width, 300);
}

TEST_F(webview_test, url_takes_precedence_over_html)
{
    auto view = make({.url = "https://example.com/", .html = "<p>unused</p>"});

    EXPECT_EQ(mock::current()->navigations.size(), 1u);
    EXPECT_TRUE(mock::current()->html.empty());
}

TEST_F(webview_test, loads_initial_html)
{
    auto view = make({.html = "<p>hello</p>"});

    EXPECT_TRUE(mock::current()->navigations.empty());
    EXPECT_EQ(mock::current()->html, std::vector<std::string>{"<p>hello</p>"});
}

TEST_F(webview_test, creation_failures_leave_nothing_behind)
{
    auto handler = scheme::sync_resolver{[](const scheme::request &) { return text("x"); }};

    auto duplicate = webview::create(parent(), {.protocols = {{"app", handler}, {"app", handler}}});
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().kind(), errc::configuration);
    EXPECT_EQ(mock::current(), nullptr);

    auto orphan = webview::create(nullptr, {});
    ASSERT_FALSE(orphan.has_value());
    EXPECT_EQ(orphan.error().kind(), errc::configuration);

    mock::fail_next(error::engine("no gpu", 3));

    auto broken = webview::create(parent(), {});
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().kind(), errc::engine);
    EXPECT_EQ(broken.error().code(), 3);
    EXPECT_EQ(mock::current(), nullptr);
}

TEST_F(webview_test, merges_navigation_headers)
{
    auto view = make({.url = "https://example.com/", .headers = {{"Authorization", "Bearer a"}, {"X-App", "1"}}});
    auto *engine = mock::current();

    EXPECT_EQ(engine->navigation_headers.front(), (headers{{"Authorization", "Bearer a"}, {"X-App", "1"}}));

    ASSERT_TRUE(view.navigate("https://example.com/next", {{"X-App", "2"}, {"X-Extra", "3"}}).has_value());
    EXPECT_EQ(engine->navigation_headers.back(), (headers{{"Authorization", "Bearer a"}, {"X-App", "2"}, {"X-Extra", "3"}}));

    EXPECT_EQ(view.url().value(), "https://example.com/next");
}

TEST_F(webview_test, rejects_invalid_navigation)
{
    auto view = make();

    auto relative = view.navigate("index.html");
    ASSERT_FALSE(relative.has_value());
    EXPECT_EQ(relative.error().kind(), errc::configuration);

    auto injected = view.navigate("https://example.com/", {{"X-Bad", "a\nb"}});
    ASSERT_FALSE(injected.has_value());

    EXPECT_TRUE(mock::current()->navigations.empty());
}

TEST_F(webview_test, enforces_thread_affinity)
{
    auto view = make();

    std::optional<result<>> navigated;
    std::optional<result<std::string>> url;
    std::optional<result<>> destroyed;

    std::thread{[&]
                {
                    navigated = view.navigate("https://example.com/");
                    url       = view.url();
                    destroyed = view.destroy();
                }}
        .join();

    ASSERT_FALSE(navigated->has_value());
    EXPECT_EQ(navigated->error().kind(), errc::thread_affinity);
    EXPECT_EQ(url->error().kind(), errc::thread_affinity);
    EXPECT_EQ(destroyed->error().kind(), errc::thread_affinity);

    EXPECT_TRUE(view.alive());
    EXPECT_TRUE(mock::current()->navigations.empty());
}

TEST_F(webview_test, destroy_is_final_and_idempotent)
{
    auto view = make();

    ASSERT_TRUE(view.destroy().has_value());
    EXPECT_FALSE(view.alive());
    EXPECT_EQ(mock::current(), nullptr);

    auto navigated = view.navigate("https://example.com/");
    ASSERT_FALSE(navigated.has_value());
    EXPECT_EQ(navigated.error().kind(), errc::engine);

    EXPECT_FALSE(view.evaluate("1", [](result<std::string>) {}).has_value());
    EXPECT_TRUE(view.destroy().has_value());
}

TEST_F(webview_test, destroy_drops_pending_requests)
{
    std::optional<scheme::executor> kept;

    auto view = make({.protocols = {{"app", scheme::resolver{[&kept](const scheme::request &, const scheme::executor &executor)
                                                             {
                                                                 kept.emplace(executor);
                                                             }}}}});

    auto reply = mock::current()->request("app://host/slow");

    ASSERT_TRUE(kept.has_value());
    EXPECT_TRUE(kept->valid());

    ASSERT_TRUE(view.destroy().has_value());

    EXPECT_TRUE(reply->released);
    EXPECT_FALSE(kept->valid());

    kept->resolve(text("too late"));
    mock::run();

    EXPECT_FALSE(reply->response.has_value());
}

TEST_F(webview_test, events_after_destroy_are_ignored)
{
    auto received = 0;
    auto view     = make({.message_handler = [&received](std::string) { ++received; }});
    auto raise    = mock::current()->raise;

    ASSERT_TRUE(view.destroy().has_value());

    raise.message("late");
    mock::run();

    EXPECT_EQ(received, 0);
}

TEST_F(webview_test, release_off_thread_defers_teardown)
{
    auto view = make();

    std::thread{[released = std::move(view)]() mutable
                {
                    auto local = std::move(released);
                }}
        .join();

    EXPECT_NE(mock::current(), nullptr);
    mock::run();
    EXPECT_EQ(mock::current(), nullptr);
}

TEST_F(webview_test, move_assignment_releases_previous_view)
{
    auto first = make();
    auto *old  = mock::current();

    auto second = make();
    auto *kept  = mock::current();

    EXPECT_NE(old, kept);

    first = std::move(second);

    EXPECT_TRUE(first.alive());
    EXPECT_EQ(mock::current(), kept);

    auto moved = second.navigate("https://example.com/");
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().kind(), errc::engine);
}

TEST_F(webview_test, unsupported_capabilities_are_no_ops)
{
    auto view    = make();
    auto *engine = mock::current();

    engine->features = {};

    EXPECT_FALSE(view.supports(capability::zoom));

    EXPECT_TRUE(view.zoom(2).has_value());
    EXPECT_TRUE(view.print().has_value());
    EXPECT_TRUE(view.open_devtools().has_value());
    EXPECT_TRUE(view.clear_browsing_data().has_value());

    EXPECT_FALSE(engine->zoom_factor.has_value());
    EXPECT_FALSE(engine->devtools);
}

TEST_F(webview_test, forwards_supported_operations)
{
    auto view    = make();
    auto *engine = mock::current();

    ASSERT_TRUE(view.zoom(1.5).has_value());
    EXPECT_EQ(engine->zoom_factor, 1.5);

    ASSERT_TRUE(view.open_devtools().has_value());
    EXPECT_TRUE(view.devtools_open().value());

    ASSERT_TRUE(view.close_devtools().has_value());
    EXPECT_FALSE(view.devtools_open().value());

    ASSERT_TRUE(view.set_visible(false).has_value());
    EXPECT_EQ(engine->visible, false);

    ASSERT_TRUE(view.resize({10, 20, 640, 480}).has_value());
    EXPECT_EQ(engine->bounds->height, 480);

    EXPECT_FALSE(view.resize({0, 0, -5, 10}).has_value());
}

TEST_F(webview_test, rejects_invalid_zoom)
{
    auto view = make();

    for (const auto factor : {0.0, -1.0, std::nan("")})
    {
        auto zoomed = view.zoom(factor);

        ASSERT_FALSE(zoomed.has_value()) << factor;
        EXPECT_EQ(zoomed.error().kind(), errc::configuration);
    }

    EXPECT_FALSE(mock::current()->zoom_factor.has_value());
}

TEST_F(webview_test, drop_handler_can_be_replaced)
{
    auto first  = 0;
    auto second = 0;

    auto view = make({.drop_handler = [&first](const drop_event &)
                      {
                          ++first;
                          return false;
                      }});

    auto *engine = mock::current();
    auto event   = drop_event{.kind = drop_kind::dropped, .paths = {"/tmp/a.txt"}};

    EXPECT_FALSE(engine->drop(event));
    EXPECT_EQ(first, 1);

    ASSERT_TRUE(view.set_drop_handler([&second](const drop_event &dropped)
                                      {
                                          ++second;
                                          return dropped.paths.size() == 1;
                                      })
                    .has_value());

    EXPECT_TRUE(engine->drop(event));
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);

    ASSERT_TRUE(view.set_drop_handler({}).has_value());
    EXPECT_FALSE(engine->drop(event));

    ASSERT_TRUE(view.set_drop_handler([](const drop_event &) -> bool { throw std::runtime_error{"bad drop"}; }).has_value());
    EXPECT_FALSE(engine->drop(event));
}

TEST_F(webview_test, evaluation_completes_asynchronously)
{
    auto view    = make();
    auto *engine = mock::current();

    std::vector<result<std::string>> results;
    auto collect = [&results](result<std::string> value)
    {
        results.emplace_back(std::move(value));
    };

    ASSERT_TRUE(view.evaluate("1 + 1", collect).has_value());
    ASSERT_TRUE(view.evaluate("({b: 1, a: [true]})", collect).has_value());
    ASSERT_TRUE(view.evaluate("void 0", collect).has_value());
    ASSERT_TRUE(view.evaluate("1 +", collect).has_value());
    ASSERT_TRUE(view.evaluate("broken()", collect).has_value());
    ASSERT_TRUE(view.evaluate("garbage", collect).has_value());

    EXPECT_TRUE(results.empty());
    ASSERT_EQ(engine->evaluations.size(), 6u);
    EXPECT_EQ(engine->evaluations.front().code, "1 + 1");

    engine->complete("2");
    engine->complete(R"({"b":1,"a":[true]})");
    engine->complete("");
    engine->complete(unexpected{error::script("SyntaxError: Unexpected end of input")});
    engine->complete(unexpected{error::engine("web process gone", 7)});
    engine->complete("{not json");

    ASSERT_EQ(results.size(), 6u);

    EXPECT_EQ(results[0].value(), "2");
    EXPECT_EQ(results[1].value(), R"({"b":1,"a":[true]})");
    EXPECT_EQ(results[2].value(), "null");

    ASSERT_FALSE(results[3].has_value());
    EXPECT_EQ(results[3].error().kind(), errc::script);
    EXPECT_EQ(results[3].error().message(), "SyntaxError: Unexpected end of input");

    ASSERT_FALSE(results[4].has_value());
    EXPECT_EQ(results[4].error().kind(), errc::script);
    EXPECT_EQ(results[4].error().code(), 7);

    ASSERT_FALSE(results[5].has_value());
    EXPECT_EQ(results[5].error().kind(), errc::script);
}

TEST_F(webview_test, execute_reports_nothing_back)
{
    auto view    = make();
    auto *engine = mock::current();

    ASSERT_TRUE(view.execute("document.body.remove()").has_value());
    ASSERT_EQ(engine->evaluations.size(), 1u);
    EXPECT_EQ(engine->evaluations.front().code, "document.body.remove()");

    engine->complete(unexpected{error::script("TypeError: x is null")});
    EXPECT_TRUE(engine->evaluations.empty());
}

TEST_F(webview_test, delivers_messages_in_order)
{
    std::vector<std::string> received;
    auto view    = make({.message_handler = [&received](std::string message) { received.emplace_back(std::move(message)); }});
    auto *engine = mock::current();

    engine->page_post("m1");
    engine->page_post("m2");
    engine->page_post("m3");

    EXPECT_TRUE(received.empty());

    mock::run();

    EXPECT_EQ(received, (std::vector<std::string>{"m1", "m2", "m3"}));
}

TEST_F(webview_test, answers_custom_scheme_requests)
{
    auto view = make({
        .url       = "app://host/index.html",
        .protocols = {{"app", scheme::sync_resolver{[](const scheme::request &request)
                                                    {
                                                        if (request.url().path() == "/ping")
                                                        {
                                                            return text("pong");
                                                        }

                                                        return scheme::response{.data = stash::from_str("missing"), .status = 404};
                                                    }}}},
    });

    auto *engine = mock::current();

    auto ping    = engine->request("app://host/ping");
    auto missing = engine->request("app://host/other");
    auto unknown = engine->request("other://host/ping");

    EXPECT_FALSE(ping->response.has_value());

    mock::run();

    ASSERT_TRUE(ping->response.has_value());
    EXPECT_EQ(ping->response->status, 200);
    EXPECT_EQ(ping->response->mime, "text/plain");
    EXPECT_EQ(ping->body, "pong");

    EXPECT_EQ(missing->response->status, 404);
    EXPECT_EQ(unknown->response->status, 404);
}

TEST_F(webview_test, streams_or_buffers_responses)
{
    auto stream = scheme::resolver{[](const scheme::request &, const scheme::executor &executor)
                                   {
                                       executor.start({.mime = "text/event-stream"});
                                       executor.write(stash::from_str("a"));
                                       executor.write(stash::from_str("b"));
                                       executor.finish();
                                   }};

    {
        auto view  = make({.protocols = {{"live", stream}}});
        auto reply = mock::current()->request("live://feed");

        mock::run();

        ASSERT_TRUE(reply->head.has_value());
        EXPECT_EQ(reply->head->mime, "text/event-stream");
        EXPECT_EQ(reply->body, "ab");
        EXPECT_TRUE(reply->finished);
    }

    mock::stream_next(false);

    {
        auto view  = make({.protocols = {{"live", stream}}});
        auto reply = mock::current()->request("live://feed");

        mock::run();

        EXPECT_FALSE(reply->head.has_value());
        ASSERT_TRUE(reply->response.has_value());
        EXPECT_EQ(reply->response->mime, "text/event-stream");
        EXPECT_EQ(reply->body, "ab");
    }
}

TEST_F(webview_test, raises_page_events)
{
    std::vector<std::string> loads;
    std::optional<error> crashed;

    auto view = make({
        .navigation_handler = [](const std::string &url) { return !url.starts_with("https://blocked."); },
        .load_handler       = [&loads](page_load state, const std::string &url)
        { loads.emplace_back(std::format("{}:{}", state == page_load::started ? "started" : "finished", url)); },
        .crash_handler = [&crashed](const error &reason) { crashed.emplace(reason); },
    });

    auto &raise = mock::current()->raise;

    EXPECT_TRUE(raise.navigation("https://example.com/"));
    EXPECT_FALSE(raise.navigation("https://blocked.example.com/"));

    raise.load(page_load::started, "https://example.com/");
    raise.load(page_load::finished, "https://example.com/");

    EXPECT_EQ(loads, (std::vector<std::string>{"started:https://example.com/", "finished:https://example.com/"}));

    raise.crashed(error::engine("renderer gone"));

    ASSERT_TRUE(crashed.has_value());
    EXPECT_EQ(crashed->kind(), errc::engine);
}

TEST_F(webview_test, throwing_navigation_handler_allows_navigation)
{
    auto view = make({.navigation_handler = [](const std::string &) -> bool { throw std::runtime_error{"oops"}; }});

    EXPECT_TRUE(mock::current()->raise.navigation("https://example.com/"));
}

TEST_F(webview_test, new_window_requests_reach_the_handler)
{
    std::vector<std::string> asked;

    auto view = make({.new_window_handler = [&asked](const std::string &url)
                      {
                          asked.emplace_back(url);
                          return url.starts_with("https://allowed.");
                      }});

    auto &raise = mock::current()->raise;

    ASSERT_TRUE(raise.new_window);
    EXPECT_TRUE(raise.new_window("https://allowed.example.com/"));
    EXPECT_FALSE(raise.new_window("https://popup.example.com/"));

    EXPECT_EQ(asked, (std::vector<std::string>{"https://allowed.example.com/", "https://popup.example.com/"}));
}

TEST_F(webview_test, engine_defaults_apply_without_handlers)
{
    auto view = make();

    auto &raise = mock::current()->raise;

    EXPECT_FALSE(raise.new_window);
    EXPECT_FALSE(raise.download_started);
    EXPECT_FALSE(raise.download_finished);
}

TEST_F(webview_test, throwing_new_window_handler_drops_the_window)
{
    auto view = make({.new_window_handler = [](const std::string &) -> bool { throw std::runtime_error{"oops"}; }});

    EXPECT_FALSE(mock::current()->raise.new_window("https://example.com/"));
}

TEST_F(webview_test, download_handler_may_redirect_or_cancel)
{
    std::vector<download_result> finished;

    auto view = make({
        .download_handler =
            [](download_request &request)
        {
            if (request.url.ends_with(".exe"))
            {
                return false;
            }

            request.destination = std::filesystem::path{"/srv/downloads"} / request.destination.filename();
            return true;
        },
        .download_finished_handler = [&finished](const download_result &result) { finished.emplace_back(result); },
    });

    auto &raise = mock::current()->raise;

    auto archive = download_request{.url = "https://example.com/a.zip", .destination = "/home/user/Downloads/a.zip"};
    auto binary  = download_request{.url = "https://example.com/setup.exe", .destination = "/home/user/Downloads/setup.exe"};

    ASSERT_TRUE(raise.download_started);
    EXPECT_TRUE(raise.download_started(archive));
    EXPECT_EQ(archive.destination, std::filesystem::path{"/srv/downloads/a.zip"});
    EXPECT_FALSE(raise.download_started(binary));

    raise.download_finished({.url = archive.url, .path = archive.destination, .success = true});

    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished[0].success);
    EXPECT_EQ(finished[0].path, std::filesystem::path{"/srv/downloads/a.zip"});
}

TEST_F(webview_test, relative_download_destination_cancels)
{
    auto view = make({.download_handler = [](download_request &request)
                      {
                          request.destination = "a.zip";
                          return true;
                      }});

    auto request = download_request{.url = "https://example.com/a.zip", .destination = "/tmp/a.zip"};

    EXPECT_FALSE(mock::current()->raise.download_started(request));
}

TEST_F(webview_test, throwing_download_handler_cancels)
{
    auto view = make({.download_handler = [](download_request &) -> bool { throw std::runtime_error{"oops"}; }});

    auto request = download_request{.url = "https://example.com/a.zip", .destination = "/tmp/a.zip"};

    EXPECT_FALSE(mock::current()->raise.download_started(request));
}

TEST_F(webview_test, finished_handler_alone_lets_downloads_through)
{
    std::optional<download_result> finished;

    auto view = make({.download_finished_handler = [&finished](const download_result &result) { finished.emplace(result); }});

    auto &raise  = mock::current()->raise;
    auto request = download_request{.url = "https://example.com/a.zip", .destination = "/tmp/a.zip"};

    EXPECT_TRUE(raise.download_started(request));

    raise.download_finished({.url = request.url, .path = std::nullopt, .success = false});

    ASSERT_TRUE(finished.has_value());
    EXPECT_FALSE(finished->success);
    EXPECT_FALSE(finished->path.has_value());
}

TEST_F(webview_test, reports_failing_scheme_handlers)
{
    std::vector<error> reports;

    auto view = make({
        .protocols              = {{"app", scheme::sync_resolver{[](const scheme::request &) -> scheme::response
                                                                 {
                                                                     throw std::runtime_error{"database offline"};
                                                                 }}}},
        .protocol_error_handler = [&reports](const error &reason) { reports.emplace_back(reason); },
    });

    auto reply = mock::current()->request("app://host/data");
    mock::run();

    ASSERT_TRUE(reply->response.has_value());
    EXPECT_EQ(reply->response->status, 500);

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].kind(), errc::protocol_handler);
    EXPECT_EQ(reports[0].code(), 500);
    EXPECT_EQ(reports[0].message(), "database offline");
}

TEST(webview, registers_schemes_process_wide)
{
    mock::registered_schemes().clear();

    ASSERT_TRUE(webview::register_scheme("App").has_value());
    EXPECT_EQ(mock::registered_schemes(), std::vector<std::string>{"app"});

    auto reserved = webview::register_scheme("https");
    ASSERT_FALSE(reserved.has_value());
    EXPECT_EQ(reserved.error().kind(), errc::configuration);

    EXPECT_FALSE(webview::register_scheme("not a scheme").has_value());
    EXPECT_EQ(mock::registered_schemes().size(), 1u);
}
