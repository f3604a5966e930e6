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

#include "TestServer.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>

using namespace attest::http::test;

TestServer::~TestServer()
{
  stop();
}

void
TestServer::add(const std::string &path, const std::string &body)
{
  documents[path] = body;
}

void
TestServer::add_redirect(const std::string &from, const std::string &to)
{
  redirects[from] = to;
}

void
TestServer::run()
{
  auto endpoint = boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0};
  acceptor.open(endpoint.protocol());
  acceptor.set_option(boost::asio::socket_base::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen(boost::asio::socket_base::max_listen_connections);
  port = acceptor.local_endpoint().port();

  boost::asio::co_spawn(ioc, do_accept(), boost::asio::detached);
  worker = std::thread([this] { ioc.run(); });
}

void
TestServer::stop()
{
  if (worker.joinable())
    {
      ioc.stop();
      worker.join();
    }
}

std::string
TestServer::url(const std::string &path) const
{
  return fmt::format("http://127.0.0.1:{}{}", port, path);
}

std::string
TestServer::get_last_header(const std::string &name) const
{
  std::scoped_lock lock(mutex);
  auto it = last_headers.find(boost::algorithm::to_lower_copy(name));
  return it != last_headers.end() ? it->second : std::string{};
}

int
TestServer::get_request_count() const
{
  std::scoped_lock lock(mutex);
  return request_count;
}

boost::asio::awaitable<void>
TestServer::do_accept()
{
  for (;;)
    {
      boost::system::error_code ec;
      auto socket = co_await acceptor.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec)
        {
          logger->error("accept failed ({})", ec.message());
          co_return;
        }
      boost::asio::co_spawn(ioc, do_session(std::move(socket)), boost::asio::detached);
    }
}

boost::asio::awaitable<void>
TestServer::do_session(boost::asio::ip::tcp::socket socket)
{
  boost::beast::tcp_stream stream(std::move(socket));
  boost::beast::flat_buffer buffer;
  boost::system::error_code ec;

  for (;;)
    {
      request_t req;
      stream.expires_after(std::chrono::seconds(30));
      co_await boost::beast::http::async_read(stream, buffer, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec == boost::beast::http::error::end_of_stream)
        {
          break;
        }
      if (ec)
        {
          logger->debug("session read failed ({})", ec.message());
          co_return;
        }

      auto res = handle_request(req);
      co_await boost::beast::http::async_write(stream, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec)
        {
          logger->error("session write failed ({})", ec.message());
          co_return;
        }
      if (res.need_eof())
        {
          break;
        }
    }

  stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}

TestServer::response_t
TestServer::handle_request(const request_t &req)
{
  std::string target(req.target());
  {
    std::scoped_lock lock(mutex);
    request_count++;
    last_headers.clear();
    for (const auto &field: req)
      {
        last_headers[boost::algorithm::to_lower_copy(std::string(field.name_string()))] = std::string(field.value());
      }
  }

  response_t res;
  res.version(req.version());
  res.keep_alive(req.keep_alive());
  res.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);

  if (auto it = redirects.find(target); it != redirects.end())
    {
      res.result(boost::beast::http::status::found);
      res.set(boost::beast::http::field::location, it->second);
    }
  else if (auto doc = documents.find(target); doc != documents.end())
    {
      res.result(boost::beast::http::status::ok);
      res.set(boost::beast::http::field::content_type, "application/json");
      res.body() = doc->second;
    }
  else
    {
      res.result(boost::beast::http::status::not_found);
      res.set(boost::beast::http::field::content_type, "text/plain");
      res.body() = "The resource '" + target + "' was not found.";
    }
  res.prepare_payload();
  return res;
}
