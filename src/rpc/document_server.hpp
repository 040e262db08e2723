// SPDX-License-Identifier: Apache-2.0
// document_server.hpp
// Local document emulator: speaks the framed DocRequest / DocResponse protocol
// over a DocumentStore. One connection_loop coroutine per client.
#pragma once

#include "rpc/document_store.hpp"
#include "rpc/memory_transport.hpp"

#include <coro/coro.hpp>
#include <coro/net/tcp/server.hpp>

#include <atomic>
#include <memory>

namespace firetick::rpc {

class DocumentServer
{
public:
    // Binds immediately; throws ConfigError when the port cannot be bound.
    DocumentServer(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<DocumentStore> store);

    // Stops and waits for the accept loop and every connection to finish.
    ~DocumentServer();

    // Spawns the accept loop; each accepted client gets its own connection loop.
    void start();
    void stop() noexcept { m_stop.store(true); }

    uint16_t port() const noexcept { return m_port; }
    const std::shared_ptr<DocumentStore> &store() const noexcept { return m_store; }
    BearerPolicy &policy() noexcept { return m_policy; }
    size_t connections() const noexcept { return m_connections.load(); }

private:
    struct Connection;
    coro::task<void> run();
    static coro::task<void> connection_loop(
        DocumentServer *server, std::shared_ptr<Connection> conn, coro::net::tcp::client client);
    void handle(Connection &conn, const v1::DocRequest &req);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    uint16_t m_port;
    std::shared_ptr<DocumentStore> m_store;
    BearerPolicy m_policy;
    std::unique_ptr<coro::net::tcp::server> m_server;
    std::atomic_bool m_stop{false};
    std::atomic<size_t> m_connections{0};
    std::atomic_bool m_running{false};
};

} // namespace firetick::rpc
