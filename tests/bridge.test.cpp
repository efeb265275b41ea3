#include <gtest/gtest.h>

#include "bridge.hpp"

#include <deque>
#include <mutex>
#include <thread>
#include <format>
#include <stdexcept>

using namespace canopy;

namespace
{
    class bridge_test : public ::testing::Test
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

        void pump()
        {
            while (true)
            {
                scheme::task task;

                {
                    std::lock_guard lock{m_mutex};

                    if (m_tasks.empty())
                    {
                        return;
                    }

                    task = std::move(m_tasks.front());
                    m_tasks.pop_front();
                }

                task();
            }
        }
    };
} // namespace

TEST_F(bridge_test, delivers_nothing_inline)
{
    std::vector<std::string> received;
    bridge target{post(), [&received](std::string message) { received.emplace_back(std::move(message)); }};

    target.receive("m1");

    EXPECT_TRUE(received.empty());
    EXPECT_EQ(target.queued(), 1u);

    pump();

    EXPECT_EQ(received, std::vector<std::string>{"m1"});
    EXPECT_EQ(target.queued(), 0u);
}

TEST_F(bridge_test, keeps_page_order)
{
    std::vector<std::string> received;
    bridge target{post(), [&received](std::string message) { received.emplace_back(std::move(message)); }};

    target.receive("m1");
    target.receive("m2");
    target.receive("m3");
    pump();

    EXPECT_EQ(received, (std::vector<std::string>{"m1", "m2", "m3"}));
}

TEST_F(bridge_test, slow_handler_does_not_reorder)
{
    std::vector<std::string> received;
    bridge *self{nullptr};
    bool busy{false};
    bool overlapped{false};

    bridge target{post(), [&](std::string message)
                  {
                      overlapped |= busy;
                      busy = true;

                      if (message == "m1")
                      {
                          self->receive("m2");
                          std::this_thread::sleep_for(std::chrono::milliseconds{20});
                          self->receive("m3");
                      }

                      received.emplace_back(std::move(message));
                      busy = false;
                  }};

    self = &target;

    target.receive("m1");
    pump();

    EXPECT_FALSE(overlapped);
    EXPECT_EQ(received, (std::vector<std::string>{"m1", "m2", "m3"}));
}

TEST_F(bridge_test, keeps_order_across_threads)
{
    std::vector<std::string> received;
    bridge target{post(), [&received](std::string message) { received.emplace_back(std::move(message)); }};

    std::thread{[&target]
                {
                    for (auto i = 0; i < 100; ++i)
                    {
                        target.receive(std::to_string(i));
                    }
                }}
        .join();

    pump();

    ASSERT_EQ(received.size(), 100u);

    for (auto i = 0; i < 100; ++i)
    {
        EXPECT_EQ(received[i], std::to_string(i));
    }
}

TEST_F(bridge_test, throwing_handler_does_not_stop_delivery)
{
    std::vector<std::string> received;
    bridge target{post(), [&received](std::string message)
                  {
                      if (message == "bad")
                      {
                          throw std::runtime_error{"handler failed"};
                      }

                      received.emplace_back(std::move(message));
                  }};

    target.receive("bad");
    target.receive("good");
    pump();

    EXPECT_EQ(received, std::vector<std::string>{"good"});
}

TEST_F(bridge_test, closing_drops_queued_and_later_messages)
{
    std::vector<std::string> received;
    bridge target{post(), [&received](std::string message) { received.emplace_back(std::move(message)); }};

    target.receive("queued");
    target.close();
    target.receive("late");
    pump();

    EXPECT_TRUE(received.empty());
}

TEST(bridge, bootstrap_defines_frozen_surface)
{
    const auto script = bridge::bootstrap("function (m) { native.post(m); }");

    EXPECT_NE(script.find("var forward = function (m) { native.post(m); };"), std::string::npos);
    EXPECT_NE(script.find("Object.freeze"), std::string::npos);
    EXPECT_NE(script.find("postMessage"), std::string::npos);
    EXPECT_NE(script.find("TypeError"), std::string::npos);
    EXPECT_NE(script.find("configurable: false"), std::string::npos);
    EXPECT_EQ(script.find("$transport"), std::string::npos);
}

TEST(bridge, normalize_keeps_completion_values_verbatim)
{
    EXPECT_EQ(bridge::normalize("2").value(), "2");
    EXPECT_EQ(bridge::normalize(R"("pong")").value(), R"("pong")");
    EXPECT_EQ(bridge::normalize(R"({"b":1,"a":[true,null]})").value(), R"({"b":1,"a":[true,null]})");
    EXPECT_EQ(bridge::normalize("null").value(), "null");
}

TEST(bridge, normalize_maps_missing_values_to_null)
{
    EXPECT_EQ(bridge::normalize("").value(), "null");
    EXPECT_EQ(bridge::normalize(" \n").value(), "null");
}

TEST(bridge, normalize_rejects_malformed_json)
{
    for (const auto *value : {"not json", "{\"a\":", "[1,2"})
    {
        auto result = bridge::normalize(value);

        ASSERT_FALSE(result.has_value()) << value;
        EXPECT_EQ(result.error().kind(), errc::script) << value;
    }
}
