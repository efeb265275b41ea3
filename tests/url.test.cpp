#include <gtest/gtest.h>

#include <canopy/url.hpp>

using namespace canopy;

TEST(url, parses_custom_scheme)
{
    auto parsed = url::parse("app://host/ping");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->scheme(), "app");
    EXPECT_EQ(parsed->host(), "host");
    EXPECT_EQ(parsed->path(), "/ping");
    EXPECT_FALSE(parsed->opaque());
    EXPECT_EQ(parsed->string(), "app://host/ping");
}

TEST(url, parses_every_component)
{
    auto parsed = url::parse("https://user@example.com:8080/a/b?x=1#frag");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->user(), "user");
    EXPECT_EQ(parsed->host(), "example.com");
    EXPECT_EQ(parsed->port(), 8080);
    EXPECT_EQ(parsed->path(), "/a/b");
    EXPECT_EQ(parsed->query(), "x=1");
    EXPECT_EQ(parsed->fragment(), "frag");
    EXPECT_EQ(parsed->string(), "https://user@example.com:8080/a/b?x=1#frag");
}

TEST(url, lowercases_scheme_only)
{
    auto parsed = url::parse("APP://Host/Path");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->scheme(), "app");
    EXPECT_EQ(parsed->host(), "Host");
    EXPECT_EQ(parsed->path(), "/Path");
}

TEST(url, keeps_opaque_urls_intact)
{
    auto blank = url::parse("about:blank");

    ASSERT_TRUE(blank.has_value());
    EXPECT_TRUE(blank->opaque());
    EXPECT_EQ(blank->path(), "blank");
    EXPECT_EQ(blank->string(), "about:blank");
}

TEST(url, handles_ipv6_hosts)
{
    auto parsed = url::parse("http://[::1]:8080/");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host(), "[::1]");
    EXPECT_EQ(parsed->port(), 8080);
    EXPECT_EQ(parsed->path(), "/");
}

TEST(url, rejects_relative_and_malformed_input)
{
    for (const auto *value : {"/relative/path", "no-colon", "1abc:foo", "://missing", "http://host:99999/", "http://[::1/"})
    {
        auto parsed = url::parse(value);

        ASSERT_FALSE(parsed.has_value()) << value;
        EXPECT_EQ(parsed.error().kind(), errc::configuration) << value;
    }
}

TEST(url, make_builds_hierarchical_urls)
{
    auto made = url::make({.scheme = "app", .host = "assets", .path = "/index.html"});

    EXPECT_EQ(made.string(), "app://assets/index.html");
    EXPECT_FALSE(made.opaque());
}

TEST(uri, validates_scheme_tokens)
{
    EXPECT_TRUE(uri::valid_scheme("app"));
    EXPECT_TRUE(uri::valid_scheme("my-app+v1.2"));
    EXPECT_FALSE(uri::valid_scheme(""));
    EXPECT_FALSE(uri::valid_scheme("1app"));
    EXPECT_FALSE(uri::valid_scheme("app_name"));
    EXPECT_FALSE(uri::valid_scheme("app name"));
}

TEST(uri, decodes_percent_escapes)
{
    EXPECT_EQ(uri::decode("a%20b%2Fc"), "a b/c");
    EXPECT_EQ(uri::decode("%zz"), "%zz");
    EXPECT_EQ(uri::decode("100%"), "100%");
    EXPECT_EQ(uri::decode("%4"), "%4");
}
