/**
 * @file test_url_filters.cpp
 * @brief Tests for URL parsing and request classification.
 */
#include <gtest/gtest.h>
#include <set>
#include <string>

#include "beacon/net/url.hpp"
#include "beacon/net/url_filters.hpp"

using beacon::net::Classification;
using beacon::net::FirstPartyHosts;
using beacon::net::InternalUrls;
using beacon::net::UrlError;
using beacon::net::classify;
using beacon::net::parse_url;

// ---------- parse_url ----------

TEST(Url, Parse_Components) {
  const auto u = parse_url("HTTPS://user:pw@API.Example.com:8443/v1/items?id=3#frag");
  ASSERT_TRUE(u);
  EXPECT_EQ(u->scheme, "https");
  EXPECT_EQ(u->host, "api.example.com");
  ASSERT_TRUE(u->port);
  EXPECT_EQ(*u->port, 8443);
  EXPECT_EQ(u->path, "/v1/items");
  EXPECT_EQ(u->query, "id=3");
}

TEST(Url, Parse_DefaultsAndIpv6) {
  const auto plain = parse_url("http://example.com");
  ASSERT_TRUE(plain);
  EXPECT_FALSE(plain->port);
  EXPECT_EQ(plain->effective_port(), 80);
  EXPECT_TRUE(plain->path.empty());

  const auto v6 = parse_url("https://[::1]:9000/x");
  ASSERT_TRUE(v6);
  EXPECT_EQ(v6->host, "[::1]");
  EXPECT_EQ(v6->effective_port(), 9000);

  const auto custom = parse_url("ftp://files.example.com/a");
  ASSERT_TRUE(custom);
  EXPECT_FALSE(custom->effective_port());
}

TEST(Url, Parse_Rejects) {
  EXPECT_EQ(parse_url("").error(), UrlError::Empty);
  EXPECT_EQ(parse_url("example.com/path").error(), UrlError::MissingScheme);
  EXPECT_EQ(parse_url("1http://example.com").error(), UrlError::MissingScheme);
  EXPECT_EQ(parse_url("file:///etc/hosts").error(), UrlError::MissingHost);
  EXPECT_EQ(parse_url("https://:443/").error(), UrlError::MissingHost);
  EXPECT_EQ(parse_url("https://example.com:99999/").error(), UrlError::InvalidPort);
  EXPECT_EQ(parse_url("https://example.com:80a/").error(), UrlError::InvalidPort);
}

// ---------- FirstPartyHosts ----------

TEST(FirstPartyHosts, ExactAndSubdomainMatch) {
  const FirstPartyHosts hosts(std::set<std::string>{"Example.com", "api.other.io", ""});
  EXPECT_EQ(hosts.hosts().size(), 2u);

  EXPECT_TRUE(hosts.is_first_party("https://example.com/x"));
  EXPECT_TRUE(hosts.is_first_party("https://www.EXAMPLE.com"));
  EXPECT_TRUE(hosts.is_first_party("http://a.b.example.com:8080/"));
  EXPECT_TRUE(hosts.is_first_party("https://api.other.io/v1"));

  EXPECT_FALSE(hosts.is_first_party("https://notexample.com"));      // suffix without dot boundary
  EXPECT_FALSE(hosts.is_first_party("https://example.com.evil.io"));
  EXPECT_FALSE(hosts.is_first_party("https://other.io"));            // parent of a configured host
  EXPECT_FALSE(hosts.is_first_party("not a url"));
  EXPECT_FALSE(hosts.is_first_party("file:///example.com"));
}

TEST(FirstPartyHosts, EmptyMatchesNothing) {
  const FirstPartyHosts none;
  EXPECT_TRUE(none.empty());
  EXPECT_FALSE(none.is_first_party("https://example.com"));
}

// ---------- InternalUrls ----------

TEST(InternalUrls, SameOriginAndPathPrefix) {
  const InternalUrls internal(std::set<std::string>{"https://intake.example.com/api/v2", "::bad::"});
  EXPECT_EQ(internal.size(), 1u);

  EXPECT_TRUE(internal.is_internal("https://intake.example.com/api/v2"));
  EXPECT_TRUE(internal.is_internal("https://intake.example.com/api/v2/rum?batch=1"));
  EXPECT_TRUE(internal.is_internal("https://intake.example.com:443/api/v2/logs"));

  EXPECT_FALSE(internal.is_internal("https://intake.example.com/api/v20"));
  EXPECT_FALSE(internal.is_internal("https://intake.example.com/other"));
  EXPECT_FALSE(internal.is_internal("http://intake.example.com/api/v2"));
  EXPECT_FALSE(internal.is_internal("https://intake.example.com:8443/api/v2"));
  EXPECT_FALSE(internal.is_internal("https://eu.intake.example.com/api/v2"));
  EXPECT_FALSE(internal.is_internal("garbage"));
}

TEST(InternalUrls, BareOriginCoversAllPaths) {
  const InternalUrls internal(std::set<std::string>{"https://intake.example.com"});
  EXPECT_TRUE(internal.is_internal("https://intake.example.com/"));
  EXPECT_TRUE(internal.is_internal("https://intake.example.com/any/path"));
}

// ---------- classify ----------

TEST(Classify, Precedence_InternalOverFirstParty) {
  const InternalUrls internal(std::set<std::string>{"https://intake.example.com"});
  const FirstPartyHosts defaults(std::set<std::string>{"example.com"});

  EXPECT_EQ(classify("https://intake.example.com/v1", internal, defaults), Classification::Internal);
  EXPECT_EQ(classify("https://api.example.com/v1", internal, defaults), Classification::FirstParty);
  EXPECT_EQ(classify("https://cdn.other.net/v1", internal, defaults), Classification::ThirdParty);
  EXPECT_EQ(classify("%%%", internal, defaults), Classification::ThirdParty);
}

TEST(Classify, SessionHosts_AreOredWithDefaults) {
  const InternalUrls internal;
  const FirstPartyHosts defaults(std::set<std::string>{"example.com"});
  const FirstPartyHosts session(std::set<std::string>{"cdn.example.net"});

  EXPECT_EQ(classify("https://img.cdn.example.net/a.png", internal, defaults), Classification::ThirdParty);
  EXPECT_EQ(classify("https://img.cdn.example.net/a.png", internal, defaults, &session), Classification::FirstParty);
  EXPECT_EQ(classify("https://example.com", internal, defaults, &session), Classification::FirstParty);
}
