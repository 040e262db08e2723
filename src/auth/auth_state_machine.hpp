// SPDX-License-Identifier: Apache-2.0
// auth_state_machine.hpp
// OAuth2 authorization-code + PKCE flow and token lifecycle for one provider.
//
//   Idle -> FlowStarted -> AwaitingRedirect -> ExchangingCode -> Authenticated
//   Authenticated -> Refreshing -> (Authenticated | Idle on rejection)
//   Authenticated -> Expired -> FlowStarted   (no refresh token)
//
// Host-facing calls never block; the token endpoint is contacted from
// coroutines on the bridge's blocking scheduler and every outcome is posted to
// the bridge.
//
// Two epochs guard background results. The flow epoch moves with every
// start_flow() so an exchange for a replaced flow resolves to nothing. The
// session epoch moves with logout() and resume() and also invalidates refresh
// timers and account deletion. Starting a new flow while signed in leaves the
// current token and its refresh timer alone; a failed re-sign-in returns the
// machine to Authenticated.
#pragma once

#include "auth/http_client.hpp"
#include "auth/provider_registry.hpp"
#include "auth/token.hpp"
#include "bridge/task_bridge.hpp"
#include "common/errors.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace firetick::auth {

enum class AuthState
{
    idle,
    flow_started,
    awaiting_redirect,
    exchanging_code,
    authenticated,
    refreshing,
    expired,
};

const char *to_string(AuthState s) noexcept;

struct PendingFlow
{
    std::string provider;
    std::string state_nonce;
    std::string pkce_verifier;
    Clock::time_point created_at{};
};

enum class NonceMatch
{
    current, // equals the pending flow nonce
    retired, // belonged to a superseded, completed or timed out flow
    unknown,
};

struct FlowStart
{
    bool ok{false};
    std::string url;
    Error error;
};

struct RedirectOutcome
{
    bool accepted{false}; // code exchange started
    Error error;
};

// "Open this URL in a browser" collaborator.
using UrlOpener = std::function<void(const std::string &provider, const std::string &url)>;

struct MachineOptions
{
    std::chrono::seconds refresh_margin{60};
    std::chrono::seconds flow_timeout{300};
    size_t retired_nonce_history{16};
};

class AuthStateMachine : public std::enable_shared_from_this<AuthStateMachine>
{
public:
    static std::shared_ptr<AuthStateMachine> create(ProviderConfig cfg, std::shared_ptr<bridge::TaskBridge> bridge,
        std::shared_ptr<IHttpClient> http, MachineOptions opts = {}, UrlOpener opener = {});

    AuthStateMachine(const AuthStateMachine &) = delete;
    AuthStateMachine &operator=(const AuthStateMachine &) = delete;

    const std::string &provider() const noexcept { return m_cfg.id; }
    const ProviderConfig &config() const noexcept { return m_cfg; }

    AuthState state() const;
    std::optional<PendingFlow> pending_flow() const;
    std::optional<Clock::time_point> next_refresh_at() const;

    // New nonce and PKCE pair; replaces (and retires) any pending flow.
    FlowStart start_flow();

    NonceMatch classify(std::string_view nonce) const;

    // `query` is the decoded redirect query string.
    RedirectOutcome handle_redirect(const std::map<std::string, std::string> &query);

    // Arms the refresh timer for `token` at expires_at - refresh_margin,
    // clamped to now. Replaces any earlier timer.
    void schedule_refresh(const Token &token);

    // Installs a persisted token. Posts TokenUpdated when it is still valid and
    // arms the refresh timer (due immediately when already expired).
    void resume(Token token);

    void logout();

    // Asks the provider's account endpoint to delete the signed-in account.
    // Completion posts AccountDeleted followed by LoggedOut, or
    // AuthFailed(AccountDeleteFailed, stage account_delete) with the token kept.
    // Returns an error without contacting the network when nothing is signed in
    // or the provider has no account endpoint.
    Error delete_account();

private:
    AuthStateMachine(ProviderConfig cfg, std::shared_ptr<bridge::TaskBridge> bridge, std::shared_ptr<IHttpClient> http,
        MachineOptions opts, UrlOpener opener);

    std::string begin_flow_locked(Clock::time_point now);
    void retire_locked(std::string nonce);
    void fail_locked(ErrorCode code, std::string detail, AuthStage stage = AuthStage::flow);
    void flow_ended_locked();
    void logout_locked();
    void schedule_refresh_locked(const Token &token);
    void on_refresh_due(uint64_t epoch, uint64_t gen);
    void on_flow_timeout(uint64_t epoch, std::string nonce);

    static coro::task<void> exchange_task(
        std::shared_ptr<AuthStateMachine> self, uint64_t epoch, std::string code, std::string verifier);
    static coro::task<void> refresh_task(std::shared_ptr<AuthStateMachine> self, uint64_t epoch, Token previous);
    static coro::task<void> delete_task(std::shared_ptr<AuthStateMachine> self, uint64_t epoch, Token token);

    const ProviderConfig m_cfg;
    std::shared_ptr<bridge::TaskBridge> m_bridge;
    std::shared_ptr<IHttpClient> m_http;
    const MachineOptions m_opts;
    UrlOpener m_opener;

    mutable std::mutex m_mutex;
    AuthState m_state{AuthState::idle};
    std::optional<PendingFlow> m_pending;
    std::deque<std::string> m_retired;
    std::optional<Token> m_token; // background copy used as the refresh source
    std::optional<Clock::time_point> m_next_refresh;
    uint64_t m_epoch{0}; // session: logout / resume
    uint64_t m_flow_epoch{0};
    uint64_t m_refresh_gen{0};
    bool m_deleting{false};
};

} // namespace firetick::auth
