// SPDX-License-Identifier: Apache-2.0
// rpc_session.hpp
// Host-owned document session: allocates call handles, attaches the live
// access token as bearer, keeps the watch table and filters completions coming
// back through the bridge. Not thread-safe; every method runs on the host tick.
//
// A call issued while the store holds no live token fails Unauthenticated
// without touching the network. A call the server rejects for authorization is
// retried once: immediately when the store already holds a newer token,
// otherwise after parking until the next TokenUpdated or until reauth_wait
// elapses (then it fails Unauthenticated). Transient failures are also retried
// once. Every RpcResult handed to the host carries the call's kind and path.
#pragma once

#include "auth/token.hpp"
#include "bridge/task_bridge.hpp"
#include "rpc/document_transport.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace firetick::rpc {

struct SessionOptions
{
    std::string project_id{"demo-firetick"};
    std::chrono::milliseconds reauth_wait{10000};
};

struct WatchSubscription
{
    std::string path;
    RpcHandle handle{0};
    uint64_t last_seen_version{0};
    bool seen_any{false};
    std::shared_ptr<WatchControl> ctl;
};

class RpcSession
{
public:
    RpcSession(std::shared_ptr<bridge::TaskBridge> bridge, std::shared_ptr<IDocumentTransport> transport,
        const auth::TokenStore &tokens, SessionOptions opts = {});

    RpcHandle get(const std::string &path);
    RpcHandle set(const std::string &path, Document doc);
    RpcHandle del(const std::string &path);

    // Replaces (and stops) an existing subscription on the same path.
    RpcHandle watch(const std::string &path);

    // Handle of the WatchStop call, 0 when `path` had no subscription.
    RpcHandle unwatch(const std::string &path);

    // Routes an RpcResult / DocumentChanged drained from the bridge. Appends
    // what the host should see to `out`; retries and stale events are absorbed.
    void accept(BridgeEvent ev, std::vector<BridgeEvent> &out);

    // A newer token is in the store: resend parked calls.
    void on_token_updated();

    // Ends every watch with `code` (one RpcResult per watch) and clears the table.
    void drop_watches(ErrorCode code, std::vector<BridgeEvent> &out);

    // Fails parked calls whose bounded wait has elapsed.
    void expire_parked(std::chrono::steady_clock::time_point now, std::vector<BridgeEvent> &out);

    const std::string &database() const noexcept { return m_database; }
    const WatchSubscription *subscription(const std::string &path) const;
    size_t active_watches() const noexcept { return m_watches.size(); }
    size_t in_flight() const noexcept { return m_calls.size(); }
    size_t parked() const;

private:
    struct PendingCall
    {
        CallKind kind{CallKind::get};
        std::string path;
        std::optional<Document> payload;
        uint64_t token_version{0};
        int auth_retries{0};
        int transient_retries{0};
        bool settled{false}; // result decided locally, deliver as-is
        std::optional<std::chrono::steady_clock::time_point> parked_until;
        std::shared_ptr<WatchControl> ctl; // watch_start: own stream; watch_stop: stream to stop
    };

    RpcHandle begin(CallKind kind, const std::string &path, std::optional<Document> payload);
    void dispatch(RpcHandle handle, PendingCall &call);
    void settle(RpcHandle handle, PendingCall &call, Error err);
    void park(PendingCall &call);
    void deliver(RpcResult r, const PendingCall &call, std::vector<BridgeEvent> &out);
    void handle_result(RpcResult r, std::vector<BridgeEvent> &out);
    void handle_change(DocumentChanged ev, std::vector<BridgeEvent> &out);
    void forget_watch(const std::string &path, RpcHandle handle);
    CallContext context() const;

    static coro::task<void> unary_task(std::shared_ptr<bridge::TaskBridge> bridge,
        std::shared_ptr<IDocumentTransport> transport, CallContext ctx, RpcHandle handle, CallKind kind,
        std::string path, std::optional<Document> payload);
    static coro::task<void> watch_task(std::shared_ptr<bridge::TaskBridge> bridge,
        std::shared_ptr<IDocumentTransport> transport, CallContext ctx, RpcHandle handle, std::string path,
        std::shared_ptr<WatchControl> ctl);
    static coro::task<void> stop_task(std::shared_ptr<bridge::TaskBridge> bridge,
        std::shared_ptr<IDocumentTransport> transport, CallContext ctx, RpcHandle handle,
        std::shared_ptr<WatchControl> ctl);

    std::shared_ptr<bridge::TaskBridge> m_bridge;
    std::shared_ptr<IDocumentTransport> m_transport;
    const auth::TokenStore &m_tokens;
    SessionOptions m_opts;
    std::string m_database;

    RpcHandle m_next_handle{1};
    std::map<RpcHandle, PendingCall> m_calls;
    std::map<std::string, WatchSubscription> m_watches;
};

} // namespace firetick::rpc
