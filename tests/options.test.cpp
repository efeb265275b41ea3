#include <gtest/gtest.h>

#include "validate.hpp"

using namespace canopy;

namespace
{
    scheme::handler answer()
    {
        return scheme::sync_resolver{[](const scheme::request &)
                                     {
                                         return scheme::response{.data = stash::from_str("ok"), .mime = "text/plain"};
                                     }};
    }
} // namespace

TEST(options, accepts_defaults)
{
    auto result = validate(options{});

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->protocols.empty());
}

TEST(options, normalizes_scheme_names)
{
    auto result = validate({.protocols = {{"App", answer()}, {"custom-2.x", answer()}}});

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->protocols.contains("app"));
    EXPECT_TRUE(result->protocols.contains("custom-2.x"));
}

TEST(options, rejects_duplicate_schemes)
{
    auto result = validate({.protocols = {{"app", answer()}, {"APP", answer()}}});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), errc::configuration);
}

TEST(options, rejects_malformed_and_reserved_schemes)
{
    for (const auto *name : {"", "1app", "my app", "a_b", "https", "File", "about", "javascript"})
    {
        auto result = validate({.protocols = {{name, answer()}}});

        ASSERT_FALSE(result.has_value()) << name;
        EXPECT_EQ(result.error().kind(), errc::configuration) << name;
    }
}

TEST(options, rejects_schemes_without_handler)
{
    auto result = validate({.protocols = {{"app", scheme::resolver{}}}});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), errc::configuration);
}

TEST(options, validates_initial_url)
{
    EXPECT_TRUE(validate({.url = "https://example.com/"}).has_value());
    EXPECT_TRUE(validate({.url = "app://host/index.html"}).has_value());
    EXPECT_TRUE(validate({.url = "about:blank"}).has_value());

    EXPECT_FALSE(validate({.url = "example.com"}).has_value());
    EXPECT_FALSE(validate({.url = "https://example.com:99999/"}).has_value());
}

TEST(options, url_and_html_together_are_accepted)
{
    EXPECT_TRUE(validate({.url = "https://example.com/", .html = "<p>ignored</p>"}).has_value());
}

TEST(options, validates_headers)
{
    EXPECT_TRUE(validate({.headers = {{"Authorization", "Bearer abc"}, {"X-Trace", ""}}}).has_value());

    EXPECT_FALSE(validate({.headers = {{"Bad Name", "x"}}}).has_value());
    EXPECT_FALSE(validate({.headers = {{"", "x"}}}).has_value());
    EXPECT_FALSE(validate({.headers = {{"X-Inject", "a\r\nSet-Cookie: b"}}}).has_value());
}

TEST(options, rejects_negative_bounds)
{
    EXPECT_TRUE(validate({.bounds = rect{0, 0, 0, 0}}).has_value());
    EXPECT_FALSE(validate({.bounds = rect{0, 0, -1, 10}}).has_value());
}

TEST(options, reserved_schemes_ignore_case)
{
    EXPECT_TRUE(reserved_scheme("HTTP"));
    EXPECT_TRUE(reserved_scheme("blob"));
    EXPECT_FALSE(reserved_scheme("app"));

    EXPECT_EQ(validate_scheme("MyApp").value(), "myapp");
}
