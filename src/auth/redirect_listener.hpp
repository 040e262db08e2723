// SPDX-License-Identifier: Apache-2.0
// redirect_listener.hpp
// Loopback HTTP endpoint that receives the OAuth2 redirect for every provider.
// One port for the process lifetime; requests are routed by their `state`
// nonce to the owning state machine.
#pragma once

#include "auth/auth_state_machine.hpp"

#include <coro/coro.hpp>
#include <coro/net/tcp/server.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace firetick::auth {

struct RedirectReply
{
    int status{200};
    std::string body; // text/html
    ErrorCode code{ErrorCode::none};
};

// Demultiplexes redirects across providers. Thread-safe; the machines carry
// their own locking.
class RedirectRouter
{
public:
    void add(std::shared_ptr<AuthStateMachine> machine);

    // Full request target, e.g. "/?state=...&code=...".
    RedirectReply route_target(std::string_view target) const;
    RedirectReply route(const std::map<std::string, std::string> &query) const;

    // Parses a raw HTTP request head and answers it (400 for non-GET,
    // 404 for /favicon.ico).
    RedirectReply handle_request(std::string_view request) const;

private:
    std::vector<std::shared_ptr<AuthStateMachine>> m_machines;
};

std::string build_http_response(const RedirectReply &reply);

class RedirectListener
{
public:
    // Binds 127.0.0.1:<port> immediately. Throws ConfigError when the port is
    // already in use.
    RedirectListener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<RedirectRouter> router);

    // Waits for the accept loop to leave before the socket goes away.
    ~RedirectListener();

    uint16_t port() const noexcept { return m_port; }

    // Spawns the accept loop on the scheduler; one request at a time.
    void start();
    void stop() noexcept { m_stop.store(true); }

private:
    coro::task<void> run();
    coro::task<void> serve_one(coro::net::tcp::client client);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    uint16_t m_port;
    std::shared_ptr<RedirectRouter> m_router;
    std::unique_ptr<coro::net::tcp::server> m_server;
    std::atomic_bool m_stop{false};
    std::atomic_bool m_running{false};
};

} // namespace firetick::auth
