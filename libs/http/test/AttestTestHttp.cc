// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

#include "http/HttpClient.hh"
#include "http/HttpClientErrors.hh"
#include "http/Options.hh"
#include "utils/Logging.hh"

#include "TestServer.hh"

#define BOOST_TEST_MODULE "attest-http"
#include <boost/test/unit_test.hpp>

using namespace attest::http;
using attest::http::test::TestServer;

struct GlobalFixture
{
  GlobalFixture() = default;
  ~GlobalFixture() = default;

  GlobalFixture(const GlobalFixture &) = delete;
  GlobalFixture &operator=(const GlobalFixture &) = delete;
  GlobalFixture(GlobalFixture &&) = delete;
  GlobalFixture &operator=(GlobalFixture &&) = delete;

  void setup()
  {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("attest-test-http.log", false);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    auto logger{std::make_shared<spdlog::logger>("attest", std::initializer_list<spdlog::sink_ptr>{file_sink, console_sink})};
    logger->flush_on(spdlog::level::critical);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");

#if SPDLOG_VERSION >= 10801
    spdlog::cfg::load_env_levels();
#endif
  }
};

struct Fixture
{
  Fixture() = default;
  ~Fixture() = default;

  Fixture(const Fixture &) = delete;
  Fixture &operator=(const Fixture &) = delete;
  Fixture(Fixture &&) = delete;
  Fixture &operator=(Fixture &&) = delete;

  outcome::std_result<Response> get_sync(std::shared_ptr<HttpClient> http, std::string url)
  {
    boost::asio::io_context ioc;
    outcome::std_result<Response> ret = outcome::failure(HttpClientErrc::InternalError);

    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> { ret = co_await http->get(url); },
      boost::asio::detached);
    ioc.run();
    return ret;
  }
};

BOOST_TEST_GLOBAL_FIXTURE(GlobalFixture);

BOOST_FIXTURE_TEST_SUITE(attest_http_test, Fixture)

BOOST_AUTO_TEST_CASE(http_client_get_plain)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.run();

  auto http = std::make_shared<HttpClient>();
  auto rc = get_sync(http, server.url("/foo"));

  BOOST_REQUIRE(rc.has_value());
  auto [result, content] = rc.value();
  BOOST_CHECK_EQUAL(result, 200);
  BOOST_CHECK_EQUAL(content, "foo\n");

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_not_found)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.run();

  auto http = std::make_shared<HttpClient>();
  auto rc = get_sync(http, server.url("/bar"));

  BOOST_REQUIRE(rc.has_value());
  auto [result, content] = rc.value();
  BOOST_CHECK_EQUAL(result, 404);
  BOOST_CHECK_EQUAL(content, "The resource '/bar' was not found.");

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_bearer_token)
{
  TestServer server;
  server.add("/artifactory/repo/evidence.json", "{}");
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_bearer_token("secret-token");
  http->options().add_header("X-Request-Source", "attest");

  auto rc = get_sync(http, server.url("/artifactory/repo/evidence.json"));
  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(rc.value().first, 200);
  BOOST_CHECK_EQUAL(server.get_last_header("Authorization"), "Bearer secret-token");
  BOOST_CHECK_EQUAL(server.get_last_header("x-request-source"), "attest");

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_bearer_token_stays_on_origin)
{
  TestServer storage;
  storage.add("/blobs/evidence.json", "{}");
  storage.run();

  TestServer server;
  server.run();
  server.add_redirect("/artifactory/repo/evidence.json", storage.url("/blobs/evidence.json"));

  auto http = std::make_shared<HttpClient>();
  http->options().set_bearer_token("secret-token");

  auto rc = get_sync(http, server.url("/artifactory/repo/evidence.json"));
  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(rc.value().first, 200);
  BOOST_CHECK_EQUAL(rc.value().second, "{}");
  BOOST_CHECK_EQUAL(server.get_last_header("Authorization"), "Bearer secret-token");
  BOOST_CHECK_EQUAL(storage.get_last_header("Authorization"), "");
  BOOST_CHECK_EQUAL(storage.get_request_count(), 1);

  server.stop();
  storage.stop();
}

BOOST_AUTO_TEST_CASE(http_client_user_agent)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.run();

  auto http = std::make_shared<HttpClient>();
  auto rc = get_sync(http, server.url("/foo"));
  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(server.get_last_header("User-Agent"), "attest/1.0");

  http->options().set_user_agent("attest-verify/2.1");
  rc = get_sync(http, server.url("/foo"));
  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(server.get_last_header("User-Agent"), "attest-verify/2.1");

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_response_too_large)
{
  TestServer server;
  server.add("/large", std::string(256, 'x'));
  server.add("/small", "ok");
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_max_body_size(16);

  auto rc = get_sync(http, server.url("/large"));
  BOOST_REQUIRE(rc.has_error());
  BOOST_CHECK(rc.error() == HttpClientErrc::ResponseTooLarge);

  rc = get_sync(http, server.url("/small"));
  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(rc.value().second, "ok");

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_redirect)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.add_redirect("/old", "/foo");
  server.run();

  auto http = std::make_shared<HttpClient>();
  auto rc = get_sync(http, server.url("/old"));

  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(rc.value().first, 200);
  BOOST_CHECK_EQUAL(rc.value().second, "foo\n");
  BOOST_CHECK_EQUAL(server.get_request_count(), 2);

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_absolute_redirect)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.run();
  server.add_redirect("/old", server.url("/foo"));

  auto http = std::make_shared<HttpClient>();
  auto rc = get_sync(http, server.url("/old"));

  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(rc.value().second, "foo\n");

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_redirect_disabled)
{
  TestServer server;
  server.add("/foo", "foo\n");
  server.add_redirect("/old", "/foo");
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_follow_redirects(false);
  auto rc = get_sync(http, server.url("/old"));

  BOOST_REQUIRE(rc.has_value());
  BOOST_CHECK_EQUAL(rc.value().first, 302);

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_too_many_redirects)
{
  TestServer server;
  server.add_redirect("/loop", "/loop");
  server.run();

  auto http = std::make_shared<HttpClient>();
  http->options().set_max_redirects(3);
  auto rc = get_sync(http, server.url("/loop"));

  BOOST_REQUIRE(rc.has_error());
  BOOST_CHECK(rc.error() == HttpClientErrc::TooManyRedirects);
  BOOST_CHECK_EQUAL(server.get_request_count(), 4);

  server.stop();
}

BOOST_AUTO_TEST_CASE(http_client_connection_refused)
{
  auto http = std::make_shared<HttpClient>();
  auto rc = get_sync(http, "http://127.0.0.1:1/bar");

  BOOST_REQUIRE(rc.has_error());
  BOOST_CHECK(rc.error() == HttpClientErrc::ConnectionRefused);
}

BOOST_AUTO_TEST_CASE(http_client_malformed_url)
{
  auto http = std::make_shared<HttpClient>();

  auto rc = get_sync(http, "http://[127.0.0.1:1337/bar");
  BOOST_REQUIRE(rc.has_error());
  BOOST_CHECK(rc.error() == HttpClientErrc::MalformedURL);

  rc = get_sync(http, "ftp://127.0.0.1/bar");
  BOOST_REQUIRE(rc.has_error());
  BOOST_CHECK(rc.error() == HttpClientErrc::MalformedURL);
}

BOOST_AUTO_TEST_CASE(http_options)
{
  Options options;
  BOOST_CHECK_EQUAL(options.get_follow_redirects(), true);
  BOOST_CHECK_EQUAL(options.get_max_redirects(), 5);
  BOOST_CHECK(options.get_timeout() == std::chrono::seconds(30));
  BOOST_CHECK(!options.get_proxy().has_value());
  BOOST_CHECK(!options.get_bearer_token().has_value());
  BOOST_CHECK_EQUAL(options.get_user_agent(), "attest/1.0");
  BOOST_CHECK_EQUAL(options.get_max_body_size(), 64U * 1024U * 1024U);

  options.set_bearer_token("abc");
  options.set_timeout(std::chrono::seconds(5));
  options.set_proxy("http://proxy.example:3128");
  options.add_ca_cert("-----BEGIN CERTIFICATE-----");

  BOOST_CHECK_EQUAL(options.get_bearer_token().value(), "abc");
  BOOST_CHECK(options.get_headers().empty());
  BOOST_CHECK(options.get_timeout() == std::chrono::seconds(5));
  BOOST_CHECK_EQUAL(options.get_proxy().value(), "http://proxy.example:3128");
  BOOST_CHECK_EQUAL(options.get_ca_certs().size(), 1U);

  options.set_bearer_token("");
  BOOST_CHECK(!options.get_bearer_token().has_value());
}

BOOST_AUTO_TEST_CASE(http_error_category)
{
  std::error_code ec = HttpClientErrc::NameResolutionFailed;
  BOOST_CHECK_EQUAL(std::string(ec.category().name()), "httpclient");
  BOOST_CHECK_EQUAL(ec.message(), "name resolution failed");
}

BOOST_AUTO_TEST_SUITE_END()
