// SPDX-License-Identifier: Apache-2.0
#include "rpc/rpc_session.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "rpc/document_path.hpp"

namespace firetick {

const char *to_string(CallKind k) noexcept
{
    switch (k) {
        case CallKind::get:
            return "Get";
        case CallKind::set:
            return "Set";
        case CallKind::del:
            return "Delete";
        case CallKind::watch_start:
            return "WatchStart";
        case CallKind::watch_stop:
            return "WatchStop";
    }
    return "unknown";
}

} // namespace firetick

namespace firetick::rpc {

RpcSession::RpcSession(std::shared_ptr<bridge::TaskBridge> bridge, std::shared_ptr<IDocumentTransport> transport,
    const auth::TokenStore &tokens, SessionOptions opts)
    : m_bridge(std::move(bridge))
    , m_transport(std::move(transport))
    , m_tokens(tokens)
    , m_opts(std::move(opts))
    , m_database(database_name(m_opts.project_id))
{
}

RpcHandle RpcSession::get(const std::string &path)
{
    return begin(CallKind::get, path, std::nullopt);
}

RpcHandle RpcSession::set(const std::string &path, Document doc)
{
    return begin(CallKind::set, path, std::move(doc));
}

RpcHandle RpcSession::del(const std::string &path)
{
    return begin(CallKind::del, path, std::nullopt);
}

RpcHandle RpcSession::watch(const std::string &path)
{
    if (auto it = m_watches.find(path); it != m_watches.end()) {
        log::debug("[rpc] re-watch {} replaces handle {}", path, it->second.handle);
        auto old_ctl = it->second.ctl;
        m_calls.erase(it->second.handle);
        m_watches.erase(it);
        if (old_ctl) {
            old_ctl->cancelled.store(true);
            if (m_tokens.live())
                m_bridge->submit(stop_task(m_bridge, m_transport, context(), 0, old_ctl));
        }
    }
    RpcHandle h = begin(CallKind::watch_start, path, std::nullopt);
    auto call = m_calls.find(h);
    // Settled calls (bad path, no token) never open a stream.
    if (call != m_calls.end() && !call->second.settled)
        m_watches[path] = WatchSubscription{path, h, 0, false, call->second.ctl};
    metrics::rpc().active_watches.store(m_watches.size(), std::memory_order_relaxed);
    return h;
}

RpcHandle RpcSession::unwatch(const std::string &path)
{
    auto it = m_watches.find(path);
    if (it == m_watches.end())
        return 0;
    auto ctl = it->second.ctl;
    if (ctl)
        ctl->cancelled.store(true);
    m_calls.erase(it->second.handle);
    m_watches.erase(it);
    metrics::rpc().active_watches.store(m_watches.size(), std::memory_order_relaxed);

    RpcHandle h = m_next_handle++;
    PendingCall call;
    call.kind = CallKind::watch_stop;
    call.path = path;
    call.ctl = std::move(ctl);
    auto &ref = m_calls.emplace(h, std::move(call)).first->second;
    metrics::rpc().calls.fetch_add(1, std::memory_order_relaxed);
    if (ref.ctl && m_tokens.live())
        dispatch(h, ref);
    else
        settle(h, ref, Error{}); // stream never opened or already cancelled locally
    return h;
}

RpcHandle RpcSession::begin(CallKind kind, const std::string &path, std::optional<Document> payload)
{
    RpcHandle h = m_next_handle++;
    PendingCall call;
    call.kind = kind;
    call.path = path;
    call.payload = std::move(payload);
    auto &ref = m_calls.emplace(h, std::move(call)).first->second;
    metrics::rpc().calls.fetch_add(1, std::memory_order_relaxed);

    if (!valid_document_path(path)) {
        metrics::rpc().local_rejects.fetch_add(1, std::memory_order_relaxed);
        settle(h, ref, make_error(ErrorCode::invalid_path, path));
        return h;
    }
    if (!m_tokens.live()) {
        metrics::rpc().local_rejects.fetch_add(1, std::memory_order_relaxed);
        settle(h, ref, make_error(ErrorCode::unauthenticated, m_tokens.current() ? "token expired" : "no token"));
        return h;
    }
    dispatch(h, ref);
    return h;
}

CallContext RpcSession::context() const
{
    CallContext ctx;
    ctx.database = m_database;
    if (m_tokens.current())
        ctx.authorization = "Bearer " + m_tokens.current()->access_token;
    return ctx;
}

void RpcSession::dispatch(RpcHandle handle, PendingCall &call)
{
    call.parked_until.reset();
    call.token_version = m_tokens.version();
    auto ctx = context();
    log::debug("[rpc] {} {} handle={}", to_string(call.kind), call.path, handle);
    switch (call.kind) {
        case CallKind::get:
        case CallKind::set:
        case CallKind::del:
            m_bridge->submit(
                unary_task(m_bridge, m_transport, std::move(ctx), handle, call.kind, call.path, call.payload));
            break;
        case CallKind::watch_start: {
            // A resend opens a fresh stream.
            if (call.ctl)
                call.ctl->cancelled.store(true);
            call.ctl = std::make_shared<WatchControl>();
            if (auto w = m_watches.find(call.path); w != m_watches.end() && w->second.handle == handle)
                w->second.ctl = call.ctl;
            m_bridge->submit(watch_task(m_bridge, m_transport, std::move(ctx), handle, call.path, call.ctl));
            break;
        }
        case CallKind::watch_stop:
            m_bridge->submit(stop_task(m_bridge, m_transport, std::move(ctx), handle, call.ctl));
            break;
    }
}

void RpcSession::settle(RpcHandle handle, PendingCall &call, Error err)
{
    call.settled = true;
    m_bridge->post(RpcResult{handle, std::nullopt, std::move(err)});
}

void RpcSession::park(PendingCall &call)
{
    call.parked_until = std::chrono::steady_clock::now() + m_opts.reauth_wait;
}

size_t RpcSession::parked() const
{
    size_t n = 0;
    for (const auto &[h, c] : m_calls) {
        if (c.parked_until)
            ++n;
    }
    return n;
}

const WatchSubscription *RpcSession::subscription(const std::string &path) const
{
    auto it = m_watches.find(path);
    return it == m_watches.end() ? nullptr : &it->second;
}

void RpcSession::accept(BridgeEvent ev, std::vector<BridgeEvent> &out)
{
    if (auto *r = std::get_if<RpcResult>(&ev)) {
        handle_result(std::move(*r), out);
    } else if (auto *c = std::get_if<DocumentChanged>(&ev)) {
        handle_change(std::move(*c), out);
    } else {
        out.push_back(std::move(ev));
    }
}

void RpcSession::handle_result(RpcResult r, std::vector<BridgeEvent> &out)
{
    auto it = m_calls.find(r.handle);
    if (it == m_calls.end()) {
        log::debug("[rpc] dropping result for inactive handle {}", r.handle);
        return;
    }
    PendingCall &call = it->second;
    if (!call.settled && call.kind != CallKind::watch_stop) {
        if (r.error.code == ErrorCode::unauthenticated && call.auth_retries == 0) {
            call.auth_retries = 1;
            metrics::rpc().retries.fetch_add(1, std::memory_order_relaxed);
            if (m_tokens.version() > call.token_version && m_tokens.live()) {
                log::info("[rpc] handle {} rejected, retrying with newer token", r.handle);
                dispatch(r.handle, call);
            } else {
                log::info("[rpc] handle {} rejected, waiting for a newer token", r.handle);
                park(call);
            }
            return;
        }
        if (r.error.code == ErrorCode::transient_rpc_failure && call.transient_retries == 0 && m_tokens.live()) {
            call.transient_retries = 1;
            metrics::rpc().retries.fetch_add(1, std::memory_order_relaxed);
            log::info("[rpc] handle {} transient failure, retrying", r.handle);
            dispatch(r.handle, call);
            return;
        }
    }
    PendingCall done = std::move(call);
    m_calls.erase(it);
    deliver(std::move(r), done, out);
}

void RpcSession::deliver(RpcResult r, const PendingCall &call, std::vector<BridgeEvent> &out)
{
    if (call.kind == CallKind::watch_start) {
        forget_watch(call.path, r.handle);
        if (r.error.code == ErrorCode::stream_dropped)
            metrics::rpc().streams_dropped.fetch_add(1, std::memory_order_relaxed);
    }
    r.kind = call.kind;
    r.path = call.path;
    if (r.error) {
        metrics::rpc().failures.fetch_add(1, std::memory_order_relaxed);
        log::warn("[rpc] {} {} handle={} failed: {} {}", to_string(call.kind), call.path, r.handle,
            to_string(r.error.code), r.error.detail);
    }
    out.push_back(std::move(r));
}

void RpcSession::forget_watch(const std::string &path, RpcHandle handle)
{
    auto it = m_watches.find(path);
    if (it == m_watches.end() || it->second.handle != handle)
        return;
    if (it->second.ctl)
        it->second.ctl->cancelled.store(true);
    m_watches.erase(it);
    metrics::rpc().active_watches.store(m_watches.size(), std::memory_order_relaxed);
}

void RpcSession::handle_change(DocumentChanged ev, std::vector<BridgeEvent> &out)
{
    auto it = m_watches.find(ev.path);
    if (it == m_watches.end() || it->second.handle != ev.handle) {
        metrics::rpc().changes_dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    auto &sub = it->second;
    if (sub.seen_any && ev.version <= sub.last_seen_version) {
        metrics::rpc().changes_dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    sub.seen_any = true;
    sub.last_seen_version = ev.version;
    metrics::rpc().changes_delivered.fetch_add(1, std::memory_order_relaxed);
    out.push_back(std::move(ev));
}

void RpcSession::on_token_updated()
{
    if (!m_tokens.live())
        return;
    for (auto &[h, call] : m_calls) {
        if (call.parked_until && !call.settled)
            dispatch(h, call);
    }
}

void RpcSession::drop_watches(ErrorCode code, std::vector<BridgeEvent> &out)
{
    for (auto &[path, sub] : m_watches) {
        if (sub.ctl)
            sub.ctl->cancelled.store(true);
        m_calls.erase(sub.handle);
        metrics::rpc().streams_dropped.fetch_add(1, std::memory_order_relaxed);
        log::info("[rpc] watch {} handle={} dropped ({})", path, sub.handle, to_string(code));
        out.push_back(RpcResult{sub.handle, std::nullopt, make_error(code, path), CallKind::watch_start, path});
    }
    m_watches.clear();
    metrics::rpc().active_watches.store(0, std::memory_order_relaxed);
}

void RpcSession::expire_parked(std::chrono::steady_clock::time_point now, std::vector<BridgeEvent> &out)
{
    for (auto it = m_calls.begin(); it != m_calls.end();) {
        auto &call = it->second;
        if (!call.parked_until || *call.parked_until > now) {
            ++it;
            continue;
        }
        RpcHandle h = it->first;
        PendingCall done = std::move(call);
        it = m_calls.erase(it);
        deliver(RpcResult{h, std::nullopt, make_error(ErrorCode::unauthenticated, "no valid token within wait")}, done,
            out);
    }
}

coro::task<void> RpcSession::unary_task(std::shared_ptr<bridge::TaskBridge> bridge,
    std::shared_ptr<IDocumentTransport> transport, CallContext ctx, RpcHandle handle, CallKind kind, std::string path,
    std::optional<Document> payload)
{
    co_await bridge->scheduler()->schedule();
    UnaryResult r;
    switch (kind) {
        case CallKind::get:
            r = co_await transport->get(std::move(ctx), std::move(path));
            break;
        case CallKind::set:
            r = co_await transport->set(std::move(ctx), std::move(path), payload ? std::move(*payload) : Document{});
            break;
        default:
            r = co_await transport->del(std::move(ctx), std::move(path));
            break;
    }
    bridge->post(RpcResult{handle, std::move(r.document), std::move(r.error)});
    co_return;
}

coro::task<void> RpcSession::watch_task(std::shared_ptr<bridge::TaskBridge> bridge,
    std::shared_ptr<IDocumentTransport> transport, CallContext ctx, RpcHandle handle, std::string path,
    std::shared_ptr<WatchControl> ctl)
{
    co_await bridge->scheduler()->schedule();
    auto sink = [bridge, handle, path, ctl](ChangeNotice n) {
        if (ctl->cancelled.load())
            return;
        bridge->post(DocumentChanged{path, handle, std::move(n.document), n.version});
    };
    Error err = co_await transport->watch(std::move(ctx), path, ctl, sink);
    if (err && !ctl->cancelled.load())
        bridge->post(RpcResult{handle, std::nullopt, std::move(err)});
    co_return;
}

coro::task<void> RpcSession::stop_task(std::shared_ptr<bridge::TaskBridge> bridge,
    std::shared_ptr<IDocumentTransport> transport, CallContext ctx, RpcHandle handle,
    std::shared_ptr<WatchControl> ctl)
{
    co_await bridge->scheduler()->schedule();
    Error err = co_await transport->stop_watch(std::move(ctx), std::move(ctl));
    if (handle != 0)
        bridge->post(RpcResult{handle, std::nullopt, std::move(err)});
    co_return;
}

} // namespace firetick::rpc
