// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "auth/http_client.hpp"
#include "bridge/bridge_event.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace firetick::test {

// Scripted token and account endpoint: answers queued responses in order and records
// every request it saw.
class FakeHttpClient : public auth::IHttpClient
{
public:
    struct Request
    {
        std::string url;
        url::Params fields;
        std::string body; // JSON posts

        std::string field(const std::string &key) const
        {
            for (const auto &[k, v] : fields)
                if (k == key)
                    return v;
            return {};
        }
    };

    void push_json(long status, std::string body)
    {
        std::scoped_lock lk(m_mutex);
        auth::HttpResponse r;
        r.transport_ok = true;
        r.status = status;
        r.body = std::move(body);
        m_responses.push_back(std::move(r));
    }

    void push_transport_error(std::string what)
    {
        std::scoped_lock lk(m_mutex);
        auth::HttpResponse r;
        r.transport_error = std::move(what);
        m_responses.push_back(std::move(r));
    }

    auth::HttpResponse post_form(const std::string &url, const url::Params &fields) override
    {
        std::scoped_lock lk(m_mutex);
        m_requests.push_back(Request{url, fields});
        if (m_responses.empty()) {
            auth::HttpResponse r;
            r.transport_ok = true;
            r.status = 400;
            r.body = R"({"error":"invalid_grant","error_description":"no scripted response"})";
            return r;
        }
        auto r = std::move(m_responses.front());
        m_responses.pop_front();
        return r;
    }

    auth::HttpResponse post_json(const std::string &url, const std::string &body) override
    {
        std::scoped_lock lk(m_mutex);
        m_requests.push_back(Request{url, {}, body});
        if (m_responses.empty()) {
            auth::HttpResponse r;
            r.transport_ok = true;
            r.status = 400;
            r.body = R"({"error":{"code":400,"message":"no scripted response"}})";
            return r;
        }
        auto r = std::move(m_responses.front());
        m_responses.pop_front();
        return r;
    }

    std::vector<Request> requests() const
    {
        std::scoped_lock lk(m_mutex);
        return m_requests;
    }

private:
    mutable std::mutex m_mutex;
    std::deque<auth::HttpResponse> m_responses;
    std::vector<Request> m_requests;
};

// Calls `poll` (which returns a batch of events) until `done` accepts the
// accumulated events or `timeout` passes. Returns everything collected.
inline std::vector<BridgeEvent> poll_until(const std::function<std::vector<BridgeEvent>()> &poll,
    const std::function<bool(const std::vector<BridgeEvent> &)> &done,
    std::chrono::milliseconds timeout = std::chrono::seconds(3))
{
    std::vector<BridgeEvent> all;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        for (auto &ev : poll())
            all.push_back(std::move(ev));
        if (done(all))
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return all;
}

template <typename T>
inline const T *find_event(const std::vector<BridgeEvent> &evs, const std::function<bool(const T &)> &pred = {})
{
    for (const auto &ev : evs) {
        if (auto *p = std::get_if<T>(&ev)) {
            if (!pred || pred(*p))
                return p;
        }
    }
    return nullptr;
}

inline const RpcResult *result_for(const std::vector<BridgeEvent> &evs, RpcHandle h)
{
    return find_event<RpcResult>(evs, [h](const RpcResult &r) { return r.handle == h; });
}

// Lets spawned coroutines drain before the scheduler goes away.
inline void settle()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
}

} // namespace firetick::test
