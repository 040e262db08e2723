// SPDX-License-Identifier: Apache-2.0
#include "auth/http_client.hpp"

#include "common/logger.hpp"

#include <curl/curl.h>

#include <mutex>

namespace firetick::auth {

namespace {
size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *out)
{
    out->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

void global_init_once()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}
} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds timeout) : m_timeout(timeout)
{
    global_init_once();
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::post_form(const std::string &url, const url::Params &fields)
{
    return perform(url, url::build_query(fields), "Content-Type: application/x-www-form-urlencoded");
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const std::string &body)
{
    return perform(url, body, "Content-Type: application/json");
}

HttpResponse CurlHttpClient::perform(const std::string &url, const std::string &post_fields, const char *content_type)
{
    HttpResponse resp;
    CURL *curl = curl_easy_init();
    if (!curl) {
        resp.transport_error = "curl_easy_init failed";
        return resp;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_fields.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_fields.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, content_type);
    // GitHub answers form-encoded unless JSON is asked for explicitly.
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        resp.transport_error = curl_easy_strerror(res);
        log::warn("[http] POST {} failed: {}", url, resp.transport_error);
        return resp;
    }
    resp.transport_ok = true;
    resp.status = http_code;
    log::debug("[http] POST {} -> {} ({} bytes)", url, http_code, resp.body.size());
    return resp;
}

std::shared_ptr<IHttpClient> make_curl_client(std::chrono::milliseconds timeout)
{
    return std::make_shared<CurlHttpClient>(timeout);
}

} // namespace firetick::auth
