// SPDX-License-Identifier: Apache-2.0
#include "auth/redirect_listener.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/url.hpp"

#include <arpa/inet.h>
#include <coro/net/tcp/client.hpp>
#include <coro/poll.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <span>
#include <sstream>
#include <thread>

namespace firetick::auth {

namespace {
constexpr size_t k_max_request_bytes = 8192;

std::string page(std::string_view title, std::string_view message)
{
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>" << title << "</title></head>"
        << "<body><h2>" << title << "</h2><p>" << message << "</p></body></html>\n";
    return oss.str();
}

const char *reason_phrase(int status)
{
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        default:
            return "Error";
    }
}

// libcoro sets SO_REUSEPORT on accept sockets, so a second bind would silently
// share the port. Check with a plain socket first.
void ensure_port_free(uint16_t port)
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        throw ConfigError(std::string("redirect listener: socket() failed: ") + std::strerror(errno));
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    int rc = ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    int err = errno;
    ::close(fd);
    if (rc != 0)
        throw ConfigError(
            "redirect listener: port " + std::to_string(port) + " unavailable: " + std::strerror(err));
}
} // namespace

void RedirectRouter::add(std::shared_ptr<AuthStateMachine> machine)
{
    m_machines.push_back(std::move(machine));
}

RedirectReply RedirectRouter::route_target(std::string_view target) const
{
    auto [path, query] = url::split_target(target);
    (void)path;
    return route(url::parse_query(query));
}

RedirectReply RedirectRouter::route(const std::map<std::string, std::string> &query) const
{
    auto it = query.find("state");
    std::string state = it == query.end() ? std::string() : it->second;

    bool any_pending = false;
    bool any_retired = false;
    for (const auto &m : m_machines) {
        auto match = m->classify(state);
        if (match == NonceMatch::current) {
            auto outcome = m->handle_redirect(query);
            if (outcome.accepted)
                return {200, page("Signed in", "Authentication complete. You can close this window."), ErrorCode::none};
            return {400, page("Sign-in failed", to_string(outcome.error.code)), outcome.error.code};
        }
        if (match == NonceMatch::retired)
            any_retired = true;
        if (m->pending_flow())
            any_pending = true;
    }
    if (any_retired) {
        metrics::auth().redirects_rejected.fetch_add(1, std::memory_order_relaxed);
        log::warn("[redirect] stale flow redirect");
        return {400, page("Sign-in link expired", "Start the sign-in again from the application."), ErrorCode::stale_flow};
    }
    if (!any_pending) {
        metrics::auth().stray_redirects.fetch_add(1, std::memory_order_relaxed);
        log::info("[redirect] stray request, no pending authentication");
        return {200, page("No pending authentication", "There is no sign-in in progress."), ErrorCode::none};
    }
    metrics::auth().redirects_rejected.fetch_add(1, std::memory_order_relaxed);
    log::warn("[redirect] state mismatch");
    return {400, page("Sign-in failed", "State mismatch."), ErrorCode::state_mismatch};
}

RedirectReply RedirectRouter::handle_request(std::string_view request) const
{
    size_t eol = request.find("\r\n");
    std::string_view line = request.substr(0, eol);
    size_t sp1 = line.find(' ');
    size_t sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos)
        return {400, page("Bad request", "Malformed request."), ErrorCode::none};
    std::string_view method = line.substr(0, sp1);
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (method != "GET")
        return {400, page("Bad request", "Only GET is supported."), ErrorCode::none};
    auto [path, query] = url::split_target(target);
    if (path == "/favicon.ico")
        return {404, "not found\n", ErrorCode::none};
    return route(url::parse_query(query));
}

std::string build_http_response(const RedirectReply &reply)
{
    std::ostringstream resp;
    resp << "HTTP/1.1 " << reply.status << ' ' << reason_phrase(reply.status) << "\r\n";
    resp << "Content-Type: text/html; charset=utf-8\r\n";
    resp << "Content-Length: " << reply.body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << reply.body;
    return resp.str();
}

RedirectListener::RedirectListener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<RedirectRouter> router)
    : m_scheduler(std::move(scheduler))
    , m_port(port)
    , m_router(std::move(router))
{
    ensure_port_free(port);
    try {
        m_server = std::make_unique<coro::net::tcp::server>(m_scheduler,
            coro::net::tcp::server::options{
                .address = coro::net::ip_address::from_string("127.0.0.1"),
                .port = port,
            });
    } catch (const std::exception &ex) {
        throw ConfigError("redirect listener: bind " + std::to_string(port) + " failed: " + ex.what());
    }
    log::info("[redirect] listening on http://localhost:{}/", port);
}

RedirectListener::~RedirectListener()
{
    stop();
    while (m_running.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
}

void RedirectListener::start()
{
    if (m_running.exchange(true))
        return;
    m_scheduler->spawn(run());
}

coro::task<void> RedirectListener::run()
{
    co_await m_scheduler->schedule();
    while (!m_stop.load()) {
        auto st = co_await m_server->poll(std::chrono::milliseconds(100));
        if (st == coro::poll_status::timeout)
            continue;
        if (st == coro::poll_status::event) {
            auto client = m_server->accept();
            if (client.socket().is_valid())
                co_await serve_one(std::move(client));
        } else {
            log::error("[redirect] server poll error/closed");
            break;
        }
    }
    m_running.store(false);
    co_return;
}

coro::task<void> RedirectListener::serve_one(coro::net::tcp::client client)
{
    std::string request;
    std::string buf(1024, '\0');
    while (request.find("\r\n\r\n") == std::string::npos && request.size() < k_max_request_bytes) {
        auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(2000));
        if (pol != coro::poll_status::event)
            break;
        auto [rs, span] = client.recv(buf);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok)
            break;
        request.append(span.data(), span.size());
    }
    if (request.empty())
        co_return;
    auto reply = m_router->handle_request(request);
    auto s = build_http_response(reply);
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

} // namespace firetick::auth
