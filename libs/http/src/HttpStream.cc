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

#include "HttpStream.hh"

#include <utility>

#include <boost/url.hpp>

using namespace attest::http;

namespace beast = boost::beast;
namespace asio = boost::asio;

HttpStream::HttpStream(Options options)
  : options(std::move(options))
{
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(asio::ssl::verify_peer);
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::execute(std::string url)
{
  auto url_rc = parse_url(url);
  if (!url_rc)
    {
      co_return url_rc.as_failure();
    }
  origin_url = url_rc.value();
  target_url = origin_url;

  for (;;)
    {
      if (needs_connection())
        {
          auto rc = co_await open();
          if (!rc)
            {
              co_await close();
              co_return rc.as_failure();
            }
        }

      auto response = co_await round_trip();
      if (!response)
        {
          co_await close();
          co_return response.as_failure();
        }

      if (!response.value().keep_alive())
        {
          co_await close();
        }

      auto redirected = follow_redirect(response.value());
      if (!redirected)
        {
          co_await close();
          co_return redirected.as_failure();
        }

      if (!redirected.value())
        {
          co_await close();
          co_return response;
        }
    }
}

outcome::std_result<boost::urls::url>
HttpStream::parse_url(const std::string &url) const
{
  auto url_rc = boost::urls::parse_uri(url);
  if (!url_rc)
    {
      logger->error("malformed URL '{}' ({})", url, url_rc.error().message());
      return HttpClientErrc::MalformedURL;
    }

  boost::urls::url parsed(url_rc.value());
  if (parsed.scheme() != "http" && parsed.scheme() != "https")
    {
      logger->error("unsupported URL scheme in '{}'", url);
      return HttpClientErrc::MalformedURL;
    }
  if (parsed.port().empty())
    {
      parsed.set_port(parsed.scheme() == "https" ? "443" : "80");
    }
  return parsed;
}

outcome::std_result<std::optional<boost::urls::url>>
HttpStream::get_proxy_url() const
{
  auto proxy = options.get_proxy();
  if (!proxy)
    {
      return std::optional<boost::urls::url>{};
    }

  auto proxy_rc = parse_url(*proxy);
  if (!proxy_rc)
    {
      logger->error("invalid proxy '{}'", *proxy);
      return proxy_rc.as_failure();
    }
  return std::optional<boost::urls::url>{std::move(proxy_rc.value())};
}

bool
HttpStream::needs_connection() const
{
  return !connected_url || !same_origin(*connected_url, target_url);
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::open()
{
  co_await close();

  auto proxy = get_proxy_url();
  if (!proxy)
    {
      co_return proxy.as_failure();
    }

  const bool tls = target_url.scheme() == "https";
  const auto &endpoint = proxy.value() ? *proxy.value() : target_url;

  auto rc = co_await connect(endpoint);
  if (!rc)
    {
      co_return rc.as_failure();
    }

  if (proxy.value() && tls)
    {
      rc = co_await open_tunnel(*proxy.value());
      if (!rc)
        {
          co_return rc.as_failure();
        }
    }

  if (tls)
    {
      rc = co_await start_tls(target_url.host());
    }
  else if (proxy.value() && proxy.value()->scheme() == "https")
    {
      rc = co_await start_tls(proxy.value()->host());
    }
  if (!rc)
    {
      co_return rc.as_failure();
    }

  connected_url = target_url;
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::connect(const boost::urls::url &endpoint)
{
  auto executor = co_await asio::this_coro::executor;
  const std::string host = endpoint.host();
  const std::string port(endpoint.port());

  boost::system::error_code ec;
  asio::ip::tcp::resolver resolver(executor);
  auto results = co_await resolver.async_resolve(host, port, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to resolve '{}' ({})", host, ec.message());
      co_return HttpClientErrc::NameResolutionFailed;
    }

  plain_stream = std::make_unique<plain_stream_t>(executor);
  plain_stream->expires_after(options.get_timeout());
  co_await plain_stream->async_connect(results, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to connect to {}:{} ({})", host, port, ec.message());
      co_return HttpClientErrc::ConnectionRefused;
    }

  logger->debug("connected to {}:{}", host, port);
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::open_tunnel(const boost::urls::url &proxy)
{
  if (proxy.scheme() != "http")
    {
      logger->error("HTTPS tunnels require a plain HTTP proxy");
      co_return HttpClientErrc::MalformedURL;
    }

  const std::string authority = target_url.host() + ":" + std::string(target_url.port());

  request_t req{beast::http::verb::connect, authority, HTTP_VERSION};
  req.set(beast::http::field::host, authority);
  req.set(beast::http::field::user_agent, options.get_user_agent());
  req.keep_alive(true);

  boost::system::error_code ec;
  plain_stream->expires_after(options.get_timeout());
  co_await beast::http::async_write(*plain_stream, req, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to send CONNECT {} to proxy ({})", authority, ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  beast::flat_buffer buffer;
  buffer.max_size(HEADER_BUFFER_SIZE);
  beast::http::response_parser<beast::http::empty_body> parser;
  parser.skip(true);

  co_await beast::http::async_read_header(*plain_stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to read CONNECT response from proxy ({})", ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  if (beast::http::to_status_class(parser.get().result()) != beast::http::status_class::successful)
    {
      logger->error("proxy refused tunnel to {} (HTTP {})", authority, parser.get().result_int());
      co_return HttpClientErrc::CommunicationError;
    }
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::start_tls(const std::string &host)
{
  auto rc = load_ca_certs();
  if (!rc)
    {
      co_return rc.as_failure();
    }

  secure_stream = std::make_unique<secure_stream_t>(std::move(*plain_stream), ctx);
  plain_stream.reset();

  if (!SSL_set_tlsext_host_name(secure_stream->native_handle(), host.c_str()))
    {
      logger->error("failed to set TLS server name {}", host);
      co_return HttpClientErrc::InternalError;
    }
  secure_stream->set_verify_callback(asio::ssl::host_name_verification(host));

  boost::system::error_code ec;
  beast::get_lowest_layer(*secure_stream).expires_after(options.get_timeout());
  co_await secure_stream->async_handshake(asio::ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("TLS handshake with {} failed ({})", host, ec.message());
      co_return HttpClientErrc::CommunicationError;
    }
  co_return outcome::success();
}

boost::asio::awaitable<void>
HttpStream::close()
{
  connected_url.reset();

  boost::system::error_code ec;
  if (secure_stream)
    {
      beast::get_lowest_layer(*secure_stream).expires_after(options.get_timeout());
      co_await secure_stream->async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
      if (ec && ec != asio::ssl::error::stream_truncated && ec != asio::error::eof)
        {
          logger->debug("TLS shutdown failed ({})", ec.message());
        }
      secure_stream.reset();
    }

  if (plain_stream)
    {
      plain_stream->socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      plain_stream->socket().close(ec);
      plain_stream.reset();
    }
}

HttpStream::request_t
HttpStream::build_request() const
{
  std::string target;
  if (options.get_proxy() && target_url.scheme() == "http")
    {
      target = target_url.c_str();
    }
  else
    {
      target = target_url.encoded_resource();
      if (target.empty() || target[0] != '/')
        {
          target.insert(0, "/");
        }
    }

  request_t req{beast::http::verb::get, target, HTTP_VERSION};
  req.set(beast::http::field::host, target_url.host());
  req.set(beast::http::field::user_agent, options.get_user_agent());
  for (const auto &[name, value]: options.get_headers())
    {
      req.set(name, value);
    }

  auto token = options.get_bearer_token();
  if (token && same_origin(target_url, origin_url))
    {
      req.set(beast::http::field::authorization, "Bearer " + *token);
    }
  req.keep_alive(true);
  return req;
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::round_trip()
{
  if (secure_stream)
    {
      co_return co_await round_trip(*secure_stream);
    }
  co_return co_await round_trip(*plain_stream);
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::round_trip(StreamType &stream)
{
  auto request = build_request();
  logger->debug("GET {}", target_url.c_str());

  boost::system::error_code ec;
  beast::get_lowest_layer(stream).expires_after(options.get_timeout());
  co_await beast::http::async_write(stream, request, asio::redirect_error(asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to send request to {} ({})", target_url.host(), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  beast::flat_buffer buffer;
  beast::http::response_parser<beast::http::string_body> parser;
  parser.header_limit(HEADER_BUFFER_SIZE);
  parser.body_limit(options.get_max_body_size());

  co_await beast::http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
  if (ec == beast::http::error::body_limit)
    {
      logger->error("response from {} exceeds {} bytes", target_url.host(), options.get_max_body_size());
      co_return HttpClientErrc::ResponseTooLarge;
    }
  if (ec)
    {
      logger->error("failed to read response from {} ({})", target_url.host(), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  logger->debug("HTTP {} ({} bytes)", parser.get().result_int(), parser.get().body().size());
  co_return parser.release();
}

outcome::std_result<bool>
HttpStream::follow_redirect(const response_t &response)
{
  if (!is_redirect(response.result()) || !options.get_follow_redirects())
    {
      return false;
    }

  if (++redirect_count > options.get_max_redirects())
    {
      logger->error("giving up after {} redirects", options.get_max_redirects());
      return HttpClientErrc::TooManyRedirects;
    }

  const std::string location(response[beast::http::field::location]);
  if (location.empty())
    {
      logger->error("redirect from {} without Location", target_url.c_str());
      return HttpClientErrc::InvalidRedirect;
    }

  auto reference = boost::urls::parse_uri_reference(location);
  if (!reference)
    {
      logger->error("malformed redirect location '{}'", location);
      return HttpClientErrc::InvalidRedirect;
    }

  boost::urls::url resolved;
  auto resolve_rc = boost::urls::resolve(target_url, reference.value(), resolved);
  if (!resolve_rc)
    {
      logger->error("cannot resolve redirect location '{}'", location);
      return HttpClientErrc::InvalidRedirect;
    }

  auto next = parse_url(std::string(resolved.buffer()));
  if (!next)
    {
      return HttpClientErrc::InvalidRedirect;
    }

  logger->info("redirected to {}", next.value().c_str());
  target_url = std::move(next.value());
  return true;
}

outcome::std_result<void>
HttpStream::load_ca_certs()
{
  if (ca_certs_loaded)
    {
      return outcome::success();
    }

  for (const auto &cert: options.get_ca_certs())
    {
      boost::system::error_code ec;
      ctx.add_certificate_authority(asio::buffer(cert.data(), cert.size()), ec);
      if (ec)
        {
          logger->error("invalid CA certificate ({})", ec.message());
          return HttpClientErrc::InvalidCertificate;
        }
    }
  ca_certs_loaded = true;
  return outcome::success();
}

bool
HttpStream::is_redirect(boost::beast::http::status status)
{
  switch (status)
    {
    case beast::http::status::moved_permanently:
    case beast::http::status::found:
    case beast::http::status::see_other:
    case beast::http::status::temporary_redirect:
    case beast::http::status::permanent_redirect:
      return true;
    default:
      return false;
    }
}

bool
HttpStream::same_origin(const boost::urls::url &a, const boost::urls::url &b)
{
  return a.scheme() == b.scheme() && a.host() == b.host() && a.port() == b.port();
}
