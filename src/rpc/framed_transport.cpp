// SPDX-License-Identifier: Apache-2.0
#include "rpc/framed_transport.hpp"

#include "bridge/task_bridge.hpp"
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "rpc/wire.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/poll.hpp>

#include <optional>
#include <span>
#include <vector>

namespace firetick::rpc {

namespace {
constexpr auto k_call_poll = std::chrono::milliseconds(2);
constexpr auto k_stream_poll = std::chrono::milliseconds(5);
constexpr auto k_reconnect_delay = std::chrono::milliseconds(500);

Error error_of(const v1::DocResponse &resp)
{
    ErrorCode code = from_wire(resp.status());
    if (code == ErrorCode::none)
        return {};
    return make_error(code, resp.detail());
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

std::shared_ptr<FramedDocumentTransport> FramedDocumentTransport::create(std::shared_ptr<coro::io_scheduler> scheduler,
    std::string host, uint16_t port, std::chrono::milliseconds call_timeout)
{
    return std::shared_ptr<FramedDocumentTransport>(
        new FramedDocumentTransport(std::move(scheduler), std::move(host), port, call_timeout));
}

FramedDocumentTransport::FramedDocumentTransport(std::shared_ptr<coro::io_scheduler> scheduler, std::string host,
    uint16_t port, std::chrono::milliseconds call_timeout)
    : m_scheduler(std::move(scheduler))
    , m_host(std::move(host))
    , m_port(port)
    , m_call_timeout(call_timeout)
{
}

FramedDocumentTransport::~FramedDocumentTransport()
{
    stop();
}

void FramedDocumentTransport::start()
{
    if (m_started.exchange(true))
        return;
    m_scheduler->spawn(connection_loop(shared_from_this()));
}

uint64_t FramedDocumentTransport::enqueue(v1::DocRequest &req, bool stream)
{
    uint64_t id = m_next_id.fetch_add(1);
    req.set_call_id(id);
    std::string payload;
    req.SerializeToString(&payload);
    std::scoped_lock lk(m_mutex);
    if (stream)
        m_streams[id];
    else
        m_calls[id];
    netutil::append_frame(m_outbound, payload);
    return id;
}

coro::task<UnaryResult> FramedDocumentTransport::unary(v1::DocRequest req)
{
    co_await m_scheduler->schedule();
    uint64_t id = enqueue(req, false);
    auto deadline = std::chrono::steady_clock::now() + m_call_timeout;
    while (true) {
        {
            std::scoped_lock lk(m_mutex);
            auto it = m_calls.find(id);
            if (it != m_calls.end() && it->second.done) {
                v1::DocResponse resp = std::move(it->second.resp);
                m_calls.erase(it);
                UnaryResult r;
                r.error = error_of(resp);
                if (resp.has_document())
                    r.document = std::move(*resp.mutable_document());
                co_return r;
            }
            if (std::chrono::steady_clock::now() >= deadline || m_stop.load()) {
                m_calls.erase(id);
                co_return UnaryResult{make_error(ErrorCode::transient_rpc_failure, "call timed out"), std::nullopt};
            }
        }
        co_await m_scheduler->yield_for(k_call_poll);
    }
}

coro::task<UnaryResult> FramedDocumentTransport::get(CallContext ctx, std::string path)
{
    v1::DocRequest req;
    req.set_authorization(std::move(ctx.authorization));
    req.set_database(std::move(ctx.database));
    req.mutable_get()->set_path(std::move(path));
    co_return co_await unary(std::move(req));
}

coro::task<UnaryResult> FramedDocumentTransport::set(CallContext ctx, std::string path, Document doc)
{
    v1::DocRequest req;
    req.set_authorization(std::move(ctx.authorization));
    req.set_database(std::move(ctx.database));
    auto *s = req.mutable_set();
    s->set_path(std::move(path));
    *s->mutable_document() = std::move(doc);
    co_return co_await unary(std::move(req));
}

coro::task<UnaryResult> FramedDocumentTransport::del(CallContext ctx, std::string path)
{
    v1::DocRequest req;
    req.set_authorization(std::move(ctx.authorization));
    req.set_database(std::move(ctx.database));
    req.mutable_del()->set_path(std::move(path));
    co_return co_await unary(std::move(req));
}

coro::task<Error> FramedDocumentTransport::watch(
    CallContext ctx, std::string path, std::shared_ptr<WatchControl> ctl, ChangeSink sink)
{
    co_await m_scheduler->schedule();
    v1::DocRequest req;
    req.set_authorization(ctx.authorization);
    req.set_database(ctx.database);
    req.mutable_watch_start()->set_path(path);
    uint64_t id = enqueue(req, true);
    ctl->call_id.store(id);

    Error result;
    std::optional<std::chrono::steady_clock::time_point> stop_deadline;
    while (true) {
        if (m_stop.load())
            break;
        if (ctl->cancelled.load() && !stop_deadline) {
            // Keep reading until the server ends the stream.
            stop_deadline = std::chrono::steady_clock::now() + m_call_timeout;
            if (!ctl->stop_sent.exchange(true)) {
                v1::DocRequest stop;
                stop.set_authorization(ctx.authorization);
                stop.set_database(ctx.database);
                stop.mutable_watch_stop()->set_target_call_id(id);
                uint64_t stop_id = enqueue(stop, false);
                std::scoped_lock lk(m_mutex);
                // The stream's STREAM_END is the acknowledgement that matters.
                m_calls.erase(stop_id);
            }
        }
        if (stop_deadline && std::chrono::steady_clock::now() >= *stop_deadline)
            break;
        std::deque<v1::DocResponse> batch;
        bool closed = false;
        {
            std::scoped_lock lk(m_mutex);
            auto &inbox = m_streams[id];
            batch.swap(inbox.items);
            closed = inbox.closed;
        }
        bool finished = false;
        for (auto &resp : batch) {
            if (resp.status() == v1::DocResponse::STREAM_END) {
                if (ctl->cancelled.load())
                    ctl->stop_acked.store(true);
                else
                    result = make_error(ErrorCode::stream_dropped, "server ended stream");
                finished = true;
                break;
            }
            if (auto err = error_of(resp)) {
                result = std::move(err);
                finished = true;
                break;
            }
            if (!resp.has_change() || ctl->cancelled.load())
                continue;
            auto *ch = resp.mutable_change();
            ChangeNotice n;
            n.version = ch->version();
            if (ch->exists())
                n.document = std::move(*ch->mutable_document());
            sink(std::move(n));
        }
        if (finished)
            break;
        if (closed) {
            result = make_error(ErrorCode::stream_dropped, "connection lost");
            break;
        }
        if (batch.empty())
            co_await m_scheduler->yield_for(k_stream_poll);
    }
    {
        std::scoped_lock lk(m_mutex);
        m_streams.erase(id);
    }
    ctl->ended.store(true);
    log::debug("[rpc] watch {} call={} ended ({})", path, id, to_string(result.code));
    co_return result;
}

coro::task<Error> FramedDocumentTransport::stop_watch(CallContext ctx, std::shared_ptr<WatchControl> ctl)
{
    co_await m_scheduler->schedule();
    ctl->cancelled.store(true);
    auto deadline = std::chrono::steady_clock::now() + m_call_timeout;
    auto expired = [&] { return m_stop.load() || std::chrono::steady_clock::now() >= deadline; };

    // The stream coroutine may not have registered its call id yet.
    while (ctl->call_id.load() == 0 && !ctl->ended.load()) {
        if (expired())
            co_return make_error(ErrorCode::transient_rpc_failure, "watch never opened");
        co_await m_scheduler->yield_for(k_call_poll);
    }

    Error own_ack_error;
    bool sent_here = false;
    uint64_t target = ctl->call_id.load();
    if (target != 0 && !ctl->stop_sent.exchange(true)) {
        v1::DocRequest req;
        req.set_authorization(std::move(ctx.authorization));
        req.set_database(std::move(ctx.database));
        req.mutable_watch_stop()->set_target_call_id(target);
        auto r = co_await unary(std::move(req));
        own_ack_error = std::move(r.error);
        sent_here = true;
    }
    while (!ctl->ended.load()) {
        if (expired())
            co_return make_error(ErrorCode::transient_rpc_failure, "watch stop not acknowledged");
        co_await m_scheduler->yield_for(k_call_poll);
    }
    if (sent_here)
        co_return own_ack_error;
    if (!ctl->stop_acked.load())
        co_return make_error(ErrorCode::transient_rpc_failure, "watch stop not acknowledged");
    co_return Error{};
}

void FramedDocumentTransport::dispatch(v1::DocResponse resp)
{
    std::scoped_lock lk(m_mutex);
    uint64_t id = resp.call_id();
    if (auto it = m_calls.find(id); it != m_calls.end()) {
        it->second.resp = std::move(resp);
        it->second.done = true;
        return;
    }
    if (auto it = m_streams.find(id); it != m_streams.end()) {
        it->second.items.push_back(std::move(resp));
        return;
    }
    // Late message for a finished call or a stopped stream.
}

void FramedDocumentTransport::fail_all(const std::string &why)
{
    std::scoped_lock lk(m_mutex);
    m_outbound.clear();
    for (auto &[id, call] : m_calls) {
        if (call.done)
            continue;
        call.resp.set_call_id(id);
        call.resp.set_status(v1::DocResponse::INTERNAL);
        call.resp.set_detail(why);
        call.done = true;
    }
    for (auto &[id, inbox] : m_streams)
        inbox.closed = true;
}

coro::task<void> FramedDocumentTransport::connection_loop(std::shared_ptr<FramedDocumentTransport> self)
{
    co_await self->m_scheduler->schedule();
    std::optional<coro::net::tcp::client> client;
    netutil::FrameParseState fps;
    auto disconnect = [&](const std::string &why) {
        client.reset();
        self->m_connected.store(false);
        fps = netutil::FrameParseState{};
        self->fail_all(why);
    };

    while (!self->m_stop.load()) {
        if (!client) {
            bool idle;
            {
                std::scoped_lock lk(self->m_mutex);
                idle = self->m_outbound.empty() && self->m_streams.empty() && self->m_calls.empty();
            }
            if (idle) {
                co_await self->m_scheduler->yield_for(std::chrono::milliseconds(10));
                continue;
            }
            client.emplace(self->m_scheduler,
                coro::net::tcp::client::options{
                    .address = coro::net::ip_address::from_string(self->m_host),
                    .port = self->m_port,
                });
            auto cst = co_await client->connect(std::chrono::seconds(2));
            if (cst != coro::net::connect_status::connected) {
                log::warn("[rpc] connect {}:{} failed", self->m_host, self->m_port);
                disconnect("connect failed");
                auto retry_at = std::chrono::steady_clock::now() + k_reconnect_delay;
                while (!self->m_stop.load() && std::chrono::steady_clock::now() < retry_at)
                    co_await self->m_scheduler->yield_for(bridge::k_wait_slice);
                continue;
            }
            self->m_connected.store(true);
            log::info("[rpc] connected to document server {}:{}", self->m_host, self->m_port);
        }

        // Flush pending outbound first
        std::string batch;
        {
            std::scoped_lock lk(self->m_mutex);
            batch.swap(self->m_outbound);
        }
        if (!batch.empty() && !co_await send_all(*client, std::span<const char>(batch.data(), batch.size()))) {
            disconnect("send failed");
            continue;
        }

        auto pstat = co_await client->poll(coro::poll_op::read, std::chrono::milliseconds(5));
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event) {
            disconnect("poll error");
            continue;
        }
        std::string tmp(4096, '\0');
        auto [rstatus, span] = client->recv(tmp);
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            log::warn("[rpc] document server connection closed");
            disconnect("connection closed");
            continue;
        }
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        std::string payload;
        while (netutil::try_extract(fps, payload)) {
            v1::DocResponse resp;
            if (!resp.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                fps.corrupt = true;
                break;
            }
            self->dispatch(std::move(resp));
        }
        if (fps.corrupt) {
            log::error("[rpc] corrupt frame from document server, dropping connection");
            disconnect("corrupt stream");
        }
    }
    self->m_connected.store(false);
    self->fail_all("transport stopped");
    co_return;
}

} // namespace firetick::rpc
