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

#ifndef ATTEST_HTTP_OPTIONS_HH
#define ATTEST_HTTP_OPTIONS_HH

#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <optional>
#include <string>

namespace attest::http
{
  class Options
  {
  public:
    Options() = default;

    void add_ca_cert(const std::string &cert);
    void add_header(const std::string &name, const std::string &value);
    // Sent as "Authorization: Bearer <token>", only to the origin of the requested URL.
    void set_bearer_token(const std::string &token);
    void set_user_agent(const std::string &user_agent);
    void set_max_body_size(std::uint64_t max_body_size);
    void set_follow_redirects(bool follow_redirects);
    void set_max_redirects(int max_redirects);
    void set_timeout(std::chrono::seconds timeout);
    void set_proxy(const std::string &proxy);

    std::list<std::string> get_ca_certs() const;
    const std::map<std::string, std::string> &get_headers() const;
    std::optional<std::string> get_bearer_token() const;
    std::string get_user_agent() const;
    std::uint64_t get_max_body_size() const;
    bool get_follow_redirects() const;
    int get_max_redirects() const;
    std::chrono::seconds get_timeout() const;
    std::optional<std::string> get_proxy() const;

  private:
    std::list<std::string> ca_certs;
    std::map<std::string, std::string> headers;
    std::optional<std::string> bearer_token;
    std::string user_agent{"attest/1.0"};
    std::uint64_t max_body_size = 64ULL * 1024 * 1024;
    bool follow_redirects = true;
    int max_redirects = 5;
    std::optional<std::string> proxy;
    std::chrono::seconds timeout = std::chrono::seconds(30);
  };

} // namespace attest::http

#endif // ATTEST_HTTP_OPTIONS_HH
