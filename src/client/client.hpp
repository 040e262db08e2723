// SPDX-License-Identifier: Apache-2.0
// client.hpp
// Host-facing facade. Every call returns immediately; results arrive through
// poll_events(), which the host calls once per tick. Construct, use and destroy
// on the host thread.
#pragma once

#include "auth/auth_state_machine.hpp"
#include "auth/provider_registry.hpp"
#include "auth/redirect_listener.hpp"
#include "auth/token.hpp"
#include "bridge/task_bridge.hpp"
#include "common/config.hpp"
#include "rpc/rpc_session.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace firetick {

// Collaborators; anything left empty is built from the Config.
struct ClientDeps
{
    std::shared_ptr<coro::io_scheduler> scheduler;
    std::shared_ptr<auth::IHttpClient> http;
    std::shared_ptr<rpc::IDocumentTransport> transport;
    auth::UrlOpener opener;
    bool redirect_listener{true};
};

class Client
{
public:
    // Throws ConfigError on invalid provider settings or when the redirect
    // port is already bound.
    explicit Client(const Config &cfg, ClientDeps deps = {});
    ~Client();

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    // Error UnknownProvider when `provider` is not registered.
    auth::FlowStart start_flow(std::string_view provider);

    // Logs out every provider: timers cancelled, in-flight exchanges
    // discarded, token cleared on the next poll.
    void logout();

    // Deletes the account behind the current token at its provider's account
    // endpoint. AccountDeleted and LoggedOut follow on success, AuthFailed
    // (stage account_delete) on failure. Error when nothing is signed in or the
    // provider does not support it.
    Error delete_account();

    // Installs a persisted token for its provider. False for an unknown provider.
    bool resume(auth::Token token);

    std::optional<auth::Identity> current_identity() const;
    const auth::TokenStore &tokens() const noexcept { return m_tokens; }

    RpcHandle get(const std::string &path) { return m_session->get(path); }
    RpcHandle set(const std::string &path, Document doc) { return m_session->set(path, std::move(doc)); }
    RpcHandle del(const std::string &path) { return m_session->del(path); }
    RpcHandle watch(const std::string &path) { return m_session->watch(path); }
    RpcHandle unwatch(const std::string &path) { return m_session->unwatch(path); }

    // Drains the bridge, applies token changes, filters rpc completions and
    // returns the events for this tick in completion order.
    std::vector<BridgeEvent> poll_events();

    std::shared_ptr<auth::AuthStateMachine> machine(std::string_view provider) const;
    const auth::ProviderRegistry &providers() const noexcept { return m_registry; }
    rpc::RpcSession &session() noexcept { return *m_session; }
    const std::shared_ptr<bridge::TaskBridge> &bridge() const noexcept { return m_bridge; }
    std::shared_ptr<auth::RedirectRouter> router() const noexcept { return m_router; }

private:
    void apply(BridgeEvent ev, std::vector<BridgeEvent> &out);
    void drop_session_state(const std::string &provider, std::vector<BridgeEvent> &out);

    auth::ProviderRegistry m_registry;
    std::shared_ptr<bridge::TaskBridge> m_bridge;
    std::shared_ptr<rpc::IDocumentTransport> m_transport;
    std::map<std::string, std::shared_ptr<auth::AuthStateMachine>> m_machines;
    std::shared_ptr<auth::RedirectRouter> m_router;
    std::unique_ptr<auth::RedirectListener> m_listener;
    auth::TokenStore m_tokens;
    std::unique_ptr<rpc::RpcSession> m_session;
};

} // namespace firetick
