#include "hb/http/WebhookClient.hpp"
#include <gtest/gtest.h>

using hb::http::WebhookTarget;

TEST(WebhookTargetTest, HostPortAndPath) {
    auto t = WebhookTarget::parse("http://127.0.0.1:8080/events/in?x=1");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->host, "127.0.0.1");
    EXPECT_EQ(t->port, "8080");
    EXPECT_EQ(t->target, "/events/in?x=1");
}

TEST(WebhookTargetTest, Defaults) {
    auto t = WebhookTarget::parse("http://example.com");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->port, "80");
    EXPECT_EQ(t->target, "/");
}

TEST(WebhookTargetTest, SchemeIsCaseInsensitive) {
    EXPECT_TRUE(WebhookTarget::parse("HTTP://example.com/x").has_value());
}

TEST(WebhookTargetTest, QueryWithoutPath) {
    auto t = WebhookTarget::parse("http://h?a=b");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->host, "h");
    EXPECT_EQ(t->target, "/?a=b");
}

TEST(WebhookTargetTest, FragmentIsDropped) {
    auto t = WebhookTarget::parse("http://h/p#frag");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->target, "/p");
}

TEST(WebhookTargetTest, BracketedIpv6) {
    auto t = WebhookTarget::parse("http://[::1]:9000/hook");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->host, "::1");
    EXPECT_EQ(t->port, "9000");
}

TEST(WebhookTargetTest, AuthorityForHostHeader) {
    EXPECT_EQ(WebhookTarget::parse("http://[::1]:9000/hook")->authority(), "[::1]:9000");
    EXPECT_EQ(WebhookTarget::parse("http://[fe80::1]/")->authority(), "[fe80::1]:80");
    EXPECT_EQ(WebhookTarget::parse("http://127.0.0.1:8080/x")->authority(), "127.0.0.1:8080");
    EXPECT_EQ(WebhookTarget::parse("http://example.com")->authority(), "example.com:80");
}

TEST(WebhookTargetTest, RejectsUnsupportedOrMalformed) {
    EXPECT_FALSE(WebhookTarget::parse("https://secure.example/hook").has_value());
    EXPECT_FALSE(WebhookTarget::parse("ftp://x").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://user:pw@host/").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://host:/x").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://host:0/x").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://host:70000/x").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://host:99999999999/x").has_value());
    EXPECT_FALSE(WebhookTarget::parse("http://[::1/x").has_value());
    EXPECT_FALSE(WebhookTarget::parse("not a url").has_value());
}
