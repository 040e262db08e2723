// SPDX-License-Identifier: Apache-2.0
#include "rpc/document_server.hpp"

#include "common/errors.hpp"
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "rpc/document_path.hpp"
#include "rpc/wire.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/poll.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <vector>

namespace firetick::rpc {

struct DocumentServer::Connection
{
    std::mutex mutex;
    std::vector<v1::DocResponse> outbound;
    std::map<uint64_t, uint64_t> watches; // call_id -> store subscription

    void push(v1::DocResponse resp)
    {
        std::scoped_lock lk(mutex);
        outbound.push_back(std::move(resp));
    }

    std::vector<v1::DocResponse> drain()
    {
        std::vector<v1::DocResponse> out;
        std::scoped_lock lk(mutex);
        out.swap(outbound);
        return out;
    }
};

namespace {
v1::DocResponse reply(uint64_t call_id, ErrorCode code, std::string detail = {})
{
    v1::DocResponse r;
    r.set_call_id(call_id);
    r.set_status(to_wire(code));
    r.set_detail(std::move(detail));
    return r;
}

coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}
} // namespace

DocumentServer::DocumentServer(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<DocumentStore> store)
    : m_scheduler(std::move(scheduler))
    , m_port(port)
    , m_store(std::move(store))
{
    try {
        m_server = std::make_unique<coro::net::tcp::server>(m_scheduler,
            coro::net::tcp::server::options{
                .address = coro::net::ip_address::from_string("127.0.0.1"),
                .port = port,
            });
    } catch (const std::exception &ex) {
        throw ConfigError("document server: bind " + std::to_string(port) + " failed: " + ex.what());
    }
}

DocumentServer::~DocumentServer()
{
    stop();
    while (m_running.load() || m_connections.load() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
}

void DocumentServer::start()
{
    if (m_running.exchange(true))
        return;
    m_scheduler->spawn(run());
}

coro::task<void> DocumentServer::run()
{
    co_await m_scheduler->schedule();
    log::info("[docsrv] document emulator on 127.0.0.1:{}", m_port);
    while (!m_stop.load()) {
        auto st = co_await m_server->poll(std::chrono::milliseconds(100));
        if (st == coro::poll_status::timeout)
            continue;
        if (st == coro::poll_status::event) {
            auto client = m_server->accept();
            if (client.socket().is_valid()) {
                m_connections.fetch_add(1);
                m_scheduler->spawn(connection_loop(this, std::make_shared<Connection>(), std::move(client)));
            }
        } else {
            log::error("[docsrv] server poll error/closed");
            break;
        }
    }
    m_running.store(false);
    co_return;
}

void DocumentServer::handle(Connection &conn, const v1::DocRequest &req)
{
    uint64_t id = req.call_id();
    if (!m_policy.accepts(req.authorization())) {
        conn.push(reply(id, ErrorCode::unauthenticated, "credential rejected"));
        return;
    }
    const std::string &db = req.database();
    switch (req.op_case()) {
        case v1::DocRequest::kGet: {
            const auto &path = req.get().path();
            if (!valid_document_path(path)) {
                conn.push(reply(id, ErrorCode::invalid_path, path));
                return;
            }
            auto doc = m_store->get(path);
            if (!doc) {
                conn.push(reply(id, ErrorCode::not_found, path));
                return;
            }
            auto r = reply(id, ErrorCode::none);
            *r.mutable_document() = std::move(*doc);
            conn.push(std::move(r));
            return;
        }
        case v1::DocRequest::kSet: {
            const auto &path = req.set().path();
            if (!valid_document_path(path)) {
                conn.push(reply(id, ErrorCode::invalid_path, path));
                return;
            }
            auto stored = m_store->set(path, req.set().document(), document_name(db, path));
            auto r = reply(id, ErrorCode::none);
            *r.mutable_document() = std::move(stored);
            conn.push(std::move(r));
            return;
        }
        case v1::DocRequest::kDel: {
            const auto &path = req.del().path();
            if (!valid_document_path(path)) {
                conn.push(reply(id, ErrorCode::invalid_path, path));
                return;
            }
            m_store->del(path);
            auto r = reply(id, ErrorCode::none);
            r.set_ack(true);
            conn.push(std::move(r));
            return;
        }
        case v1::DocRequest::kWatchStart: {
            const auto &path = req.watch_start().path();
            if (!valid_document_path(path)) {
                conn.push(reply(id, ErrorCode::invalid_path, path));
                return;
            }
            std::string name = document_name(db, path);
            uint64_t sub = m_store->subscribe(path, [&conn, id, name](const DocumentStore::Change &c) {
                auto r = reply(id, ErrorCode::none);
                auto *ch = r.mutable_change();
                ch->set_path(c.path);
                ch->set_version(c.version);
                ch->set_exists(c.document.has_value());
                if (c.document)
                    *ch->mutable_document() = *c.document;
                conn.push(std::move(r));
            });
            std::scoped_lock lk(conn.mutex);
            conn.watches[id] = sub;
            return;
        }
        case v1::DocRequest::kWatchStop: {
            uint64_t target = req.watch_stop().target_call_id();
            std::optional<uint64_t> sub;
            {
                std::scoped_lock lk(conn.mutex);
                if (auto it = conn.watches.find(target); it != conn.watches.end()) {
                    sub = it->second;
                    conn.watches.erase(it);
                }
            }
            if (sub) {
                m_store->unsubscribe(*sub);
                conn.push([&] {
                    auto end = reply(target, ErrorCode::none);
                    end.set_status(v1::DocResponse::STREAM_END);
                    return end;
                }());
            }
            auto r = reply(id, ErrorCode::none);
            r.set_ack(true);
            conn.push(std::move(r));
            return;
        }
        default:
            conn.push(reply(id, ErrorCode::invalid_path, "empty request"));
            return;
    }
}

coro::task<void> DocumentServer::connection_loop(
    DocumentServer *server, std::shared_ptr<Connection> conn, coro::net::tcp::client client)
{
    co_await server->m_scheduler->schedule();
    log::debug("[docsrv] connection opened");
    netutil::FrameParseState fps;
    while (!server->m_stop.load()) {
        // Flush pending outbound first (responses and watch changes)
        auto pending = conn->drain();
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 64);
            for (auto &msg : pending) {
                std::string out;
                if (!msg.SerializeToString(&out))
                    continue;
                netutil::append_frame(batch, out);
            }
            if (!co_await send_all(client, std::span<const char>(batch.data(), batch.size())))
                break;
        }
        auto pstat = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(5));
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event)
            break;
        std::string tmp(4096, '\0');
        auto [rstatus, span] = client.recv(tmp);
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            log::debug("[docsrv] closed by peer");
            break;
        }
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        std::string payload;
        while (netutil::try_extract(fps, payload)) {
            v1::DocRequest req;
            if (!req.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                fps.corrupt = true;
                break;
            }
            server->handle(*conn, req);
        }
        if (fps.corrupt) {
            log::warn("[docsrv] corrupt frame, dropping connection");
            break;
        }
    }
    std::vector<uint64_t> subs;
    {
        std::scoped_lock lk(conn->mutex);
        for (auto &[id, sub] : conn->watches)
            subs.push_back(sub);
        conn->watches.clear();
    }
    for (auto sub : subs)
        server->m_store->unsubscribe(sub);
    server->m_connections.fetch_sub(1);
    log::debug("[docsrv] connection closed");
    co_return;
}

} // namespace firetick::rpc
