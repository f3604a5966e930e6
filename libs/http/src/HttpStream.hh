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

#ifndef ATTEST_HTTP_HTTPSTREAM_HH
#define ATTEST_HTTP_HTTPSTREAM_HH

#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/outcome/std_result.hpp>
#include <boost/url/url.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClientErrors.hh"
#include "http/Options.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace attest::http
{
  // Executes one GET request over plain TCP or TLS, optionally tunneled
  // through an HTTP proxy. Redirects are followed on the same stream while
  // the origin stays the same.
  class HttpStream
  {
  public:
    using request_t = boost::beast::http::request<boost::beast::http::empty_body>;
    using response_t = boost::beast::http::response<boost::beast::http::string_body>;
    using plain_stream_t = boost::beast::tcp_stream;
    using secure_stream_t = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    explicit HttpStream(Options options);

    boost::asio::awaitable<outcome::std_result<response_t>> execute(std::string url);

  private:
    outcome::std_result<boost::urls::url> parse_url(const std::string &url) const;
    outcome::std_result<std::optional<boost::urls::url>> get_proxy_url() const;
    bool needs_connection() const;

    boost::asio::awaitable<outcome::std_result<void>> open();
    boost::asio::awaitable<outcome::std_result<void>> connect(const boost::urls::url &endpoint);
    boost::asio::awaitable<outcome::std_result<void>> open_tunnel(const boost::urls::url &proxy);
    boost::asio::awaitable<outcome::std_result<void>> start_tls(const std::string &host);
    boost::asio::awaitable<void> close();

    request_t build_request() const;
    boost::asio::awaitable<outcome::std_result<response_t>> round_trip();
    template<typename StreamType>
    boost::asio::awaitable<outcome::std_result<response_t>> round_trip(StreamType &stream);

    outcome::std_result<bool> follow_redirect(const response_t &response);
    outcome::std_result<void> load_ca_certs();

    static bool is_redirect(boost::beast::http::status status);
    static bool same_origin(const boost::urls::url &a, const boost::urls::url &b);

  private:
    static constexpr std::size_t HEADER_BUFFER_SIZE = 16384;
    static constexpr unsigned HTTP_VERSION = 11;

    Options options;
    boost::asio::ssl::context ctx{boost::asio::ssl::context::tlsv12_client};
    bool ca_certs_loaded{false};
    std::unique_ptr<plain_stream_t> plain_stream;
    std::unique_ptr<secure_stream_t> secure_stream;
    boost::urls::url origin_url;
    boost::urls::url target_url;
    std::optional<boost::urls::url> connected_url;
    int redirect_count{0};
    std::shared_ptr<spdlog::logger> logger{attest::utils::Logging::create("attest:http:stream")};
  };
} // namespace attest::http

#endif // ATTEST_HTTP_HTTPSTREAM_HH
