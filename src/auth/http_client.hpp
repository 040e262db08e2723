// SPDX-License-Identifier: Apache-2.0
// http_client.hpp
// Black-box "post a body, await the response" primitive used for the OAuth2
// token endpoint and the account endpoint. Calls block the calling thread and
// therefore only run on TaskBridge::blocking_scheduler(), never on the host
// tick or the network scheduler.
#pragma once

#include "common/url.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace firetick::auth {

struct HttpResponse
{
    bool transport_ok{false}; // false -> no HTTP status (DNS, connect, TLS, timeout)
    long status{0};
    std::string body;
    std::string transport_error;
};

class IHttpClient
{
public:
    virtual ~IHttpClient() = default;
    // application/x-www-form-urlencoded POST; expects a JSON answer.
    virtual HttpResponse post_form(const std::string &url, const url::Params &fields) = 0;
    // application/json POST of a serialized body.
    virtual HttpResponse post_json(const std::string &url, const std::string &body) = 0;
};

// libcurl implementation (one easy handle per request).
class CurlHttpClient : public IHttpClient
{
public:
    explicit CurlHttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(15));
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient &) = delete;
    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    HttpResponse post_form(const std::string &url, const url::Params &fields) override;
    HttpResponse post_json(const std::string &url, const std::string &body) override;

private:
    HttpResponse perform(const std::string &url, const std::string &body, const char *content_type);

    std::chrono::milliseconds m_timeout;
};

std::shared_ptr<IHttpClient> make_curl_client(std::chrono::milliseconds timeout = std::chrono::seconds(15));

} // namespace firetick::auth
