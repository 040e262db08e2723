// SPDX-License-Identifier: Apache-2.0
#include "app/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string>

namespace firetick::net {

TickCounters &ticks()
{
    static TickCounters inst;
    return inst;
}

static std::string build_metrics_body()
{
    std::ostringstream oss;
    oss << metrics::render_prometheus();
    auto &t = ticks();
    oss << "# TYPE firetick_host_ticks counter\n";
    oss << "firetick_host_ticks " << t.ticks.load() << "\n";
    oss << "# TYPE firetick_host_events counter\n";
    oss << "firetick_host_events " << t.events.load() << "\n";
    oss << "# TYPE firetick_host_tick_overruns counter\n";
    oss << "firetick_host_tick_overruns " << t.tick_overruns.load() << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // One-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event) {
        co_return;
    }
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!stop.load()) {
        auto st = co_await server.poll(std::chrono::milliseconds(200));
        if (st == coro::poll_status::timeout)
            continue;
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                scheduler->spawn(handle_client(scheduler, std::move(client)));
            }
        } else {
            log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace firetick::net
