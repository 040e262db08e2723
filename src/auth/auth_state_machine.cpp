// SPDX-License-Identifier: Apache-2.0
#include "auth/auth_state_machine.hpp"

#include "auth/pkce.hpp"
#include "auth/token_endpoint.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/url.hpp"

#include <algorithm>

namespace firetick::auth {

namespace {
// Retry delay after a refresh that got no HTTP answer at all.
constexpr std::chrono::seconds k_refresh_retry{5};

std::string join_scopes(const std::vector<std::string> &scopes)
{
    std::string out;
    for (const auto &s : scopes) {
        if (!out.empty())
            out.push_back(' ');
        out += s;
    }
    return out;
}
} // namespace

const char *to_string(AuthState s) noexcept
{
    switch (s) {
        case AuthState::idle:
            return "Idle";
        case AuthState::flow_started:
            return "FlowStarted";
        case AuthState::awaiting_redirect:
            return "AwaitingRedirect";
        case AuthState::exchanging_code:
            return "ExchangingCode";
        case AuthState::authenticated:
            return "Authenticated";
        case AuthState::refreshing:
            return "Refreshing";
        case AuthState::expired:
            return "Expired";
    }
    return "unknown";
}

std::shared_ptr<AuthStateMachine> AuthStateMachine::create(ProviderConfig cfg,
    std::shared_ptr<bridge::TaskBridge> bridge, std::shared_ptr<IHttpClient> http, MachineOptions opts,
    UrlOpener opener)
{
    return std::shared_ptr<AuthStateMachine>(
        new AuthStateMachine(std::move(cfg), std::move(bridge), std::move(http), opts, std::move(opener)));
}

AuthStateMachine::AuthStateMachine(ProviderConfig cfg, std::shared_ptr<bridge::TaskBridge> bridge,
    std::shared_ptr<IHttpClient> http, MachineOptions opts, UrlOpener opener)
    : m_cfg(std::move(cfg))
    , m_bridge(std::move(bridge))
    , m_http(std::move(http))
    , m_opts(opts)
    , m_opener(std::move(opener))
{
}

AuthState AuthStateMachine::state() const
{
    std::scoped_lock lk(m_mutex);
    return m_state;
}

std::optional<PendingFlow> AuthStateMachine::pending_flow() const
{
    std::scoped_lock lk(m_mutex);
    return m_pending;
}

std::optional<Clock::time_point> AuthStateMachine::next_refresh_at() const
{
    std::scoped_lock lk(m_mutex);
    return m_next_refresh;
}

void AuthStateMachine::retire_locked(std::string nonce)
{
    m_retired.push_back(std::move(nonce));
    while (m_retired.size() > m_opts.retired_nonce_history)
        m_retired.pop_front();
}

void AuthStateMachine::fail_locked(ErrorCode code, std::string detail, AuthStage stage)
{
    metrics::auth().failures.fetch_add(1, std::memory_order_relaxed);
    log::warn("[auth] {} failed: {} {}", m_cfg.id, to_string(code), detail);
    m_bridge->post(AuthFailed{m_cfg.id, make_error(code, std::move(detail)), stage});
}

void AuthStateMachine::flow_ended_locked()
{
    m_state = m_token ? AuthState::authenticated : AuthState::idle;
}

std::string AuthStateMachine::begin_flow_locked(Clock::time_point now)
{
    if (m_pending)
        retire_locked(m_pending->state_nonce);
    PendingFlow flow;
    flow.provider = m_cfg.id;
    flow.state_nonce = pkce::make_state_nonce();
    flow.pkce_verifier = pkce::make_verifier();
    flow.created_at = now;

    url::Params q{
        {"client_id", m_cfg.client_id},
        {"redirect_uri", m_cfg.redirect_uri()},
        {"response_type", "code"},
        {"scope", join_scopes(m_cfg.scopes)},
        {"state", flow.state_nonce},
        {"code_challenge", pkce::s256_challenge(flow.pkce_verifier)},
        {"code_challenge_method", "S256"},
    };
    std::string url = m_cfg.auth_endpoint;
    url.push_back(url.find('?') == std::string::npos ? '?' : '&');
    url += url::build_query(q);

    m_state = AuthState::flow_started;
    std::string nonce = flow.state_nonce;
    m_pending = std::move(flow);
    metrics::auth().flows_started.fetch_add(1, std::memory_order_relaxed);
    log::info("[auth] {} flow started", m_cfg.id);

    std::weak_ptr<AuthStateMachine> weak = weak_from_this();
    uint64_t epoch = m_flow_epoch;
    m_bridge->schedule_after(
        std::chrono::duration_cast<std::chrono::milliseconds>(m_opts.flow_timeout),
        [weak, epoch, nonce] {
            if (auto self = weak.lock())
                self->on_flow_timeout(epoch, nonce);
        },
        [weak, nonce] {
            auto self = weak.lock();
            return self && self->classify(nonce) == NonceMatch::current;
        });
    return url;
}

FlowStart AuthStateMachine::start_flow()
{
    FlowStart r;
    {
        std::scoped_lock lk(m_mutex);
        // Results of an exchange for the replaced flow are no longer wanted.
        ++m_flow_epoch;
        r.url = begin_flow_locked(Clock::now());
        m_state = AuthState::awaiting_redirect;
    }
    r.ok = true;
    if (m_opener)
        m_opener(m_cfg.id, r.url);
    return r;
}

NonceMatch AuthStateMachine::classify(std::string_view nonce) const
{
    std::scoped_lock lk(m_mutex);
    if (nonce.empty())
        return NonceMatch::unknown;
    if (m_pending && m_pending->state_nonce == nonce)
        return NonceMatch::current;
    if (std::find(m_retired.begin(), m_retired.end(), nonce) != m_retired.end())
        return NonceMatch::retired;
    return NonceMatch::unknown;
}

RedirectOutcome AuthStateMachine::handle_redirect(const std::map<std::string, std::string> &query)
{
    auto param = [&](const char *key) -> std::string {
        auto it = query.find(key);
        return it == query.end() ? std::string() : it->second;
    };
    std::string state = param("state");
    RedirectOutcome out;
    std::scoped_lock lk(m_mutex);

    if (!m_pending || state.empty() || state != m_pending->state_nonce) {
        bool stale = !state.empty() && std::find(m_retired.begin(), m_retired.end(), state) != m_retired.end();
        out.error = make_error(stale ? ErrorCode::stale_flow : ErrorCode::state_mismatch);
        metrics::auth().redirects_rejected.fetch_add(1, std::memory_order_relaxed);
        log::warn("[auth] {} redirect rejected: {}", m_cfg.id, to_string(out.error.code));
        return out;
    }

    PendingFlow flow = std::move(*m_pending);
    m_pending.reset();
    retire_locked(flow.state_nonce);

    if (Clock::now() - flow.created_at > m_opts.flow_timeout) {
        flow_ended_locked();
        out.error = make_error(ErrorCode::stale_flow, "flow timed out");
        metrics::auth().redirects_rejected.fetch_add(1, std::memory_order_relaxed);
        fail_locked(ErrorCode::stale_flow, "flow timed out");
        return out;
    }

    std::string provider_error = param("error");
    std::string code = param("code");
    if (!provider_error.empty() || code.empty()) {
        std::string detail = provider_error.empty() ? std::string("redirect without code") : provider_error;
        std::string desc = param("error_description");
        if (!desc.empty())
            detail += ": " + desc;
        flow_ended_locked();
        out.error = make_error(ErrorCode::auth_exchange_failed, detail);
        metrics::auth().redirects_rejected.fetch_add(1, std::memory_order_relaxed);
        fail_locked(ErrorCode::auth_exchange_failed, detail);
        return out;
    }

    m_state = AuthState::exchanging_code;
    metrics::auth().redirects_accepted.fetch_add(1, std::memory_order_relaxed);
    log::info("[auth] {} redirect accepted, exchanging code", m_cfg.id);
    out.accepted = true;
    m_bridge->submit(
        exchange_task(shared_from_this(), m_flow_epoch, std::move(code), std::move(flow.pkce_verifier)));
    return out;
}

coro::task<void> AuthStateMachine::exchange_task(
    std::shared_ptr<AuthStateMachine> self, uint64_t epoch, std::string code, std::string verifier)
{
    co_await self->m_bridge->blocking_scheduler()->schedule();
    metrics::auth().code_exchanges.fetch_add(1, std::memory_order_relaxed);
    auto resp = self->m_http->post_form(self->m_cfg.token_endpoint, exchange_form(self->m_cfg, code, verifier));
    co_await self->m_bridge->scheduler()->schedule();
    auto grant = parse_token_response(resp, self->m_cfg.id, Clock::now());

    std::scoped_lock lk(self->m_mutex);
    if (epoch != self->m_flow_epoch) {
        metrics::auth().discarded_results.fetch_add(1, std::memory_order_relaxed);
        log::debug("[auth] {} exchange result discarded (superseded)", self->m_cfg.id);
        co_return;
    }
    if (!grant.ok) {
        self->flow_ended_locked();
        self->fail_locked(ErrorCode::auth_exchange_failed, grant.reason);
        co_return;
    }
    log::info("[auth] {} authenticated token={}", self->m_cfg.id, log::fingerprint(grant.token.access_token));
    self->m_state = AuthState::authenticated;
    self->m_token = grant.token;
    self->m_bridge->post(TokenUpdated{grant.token});
    self->schedule_refresh_locked(grant.token);
    co_return;
}

void AuthStateMachine::schedule_refresh(const Token &token)
{
    std::scoped_lock lk(m_mutex);
    m_token = token;
    schedule_refresh_locked(token);
}

void AuthStateMachine::schedule_refresh_locked(const Token &token)
{
    auto now = Clock::now();
    auto due = std::max(now, token.expires_at - m_opts.refresh_margin);
    m_next_refresh = due;
    uint64_t gen = ++m_refresh_gen;
    uint64_t epoch = m_epoch;
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(due - now);
    log::debug("[auth] {} refresh in {} ms", m_cfg.id, delay.count());

    std::weak_ptr<AuthStateMachine> weak = weak_from_this();
    m_bridge->schedule_after(
        delay,
        [weak, epoch, gen] {
            if (auto self = weak.lock())
                self->on_refresh_due(epoch, gen);
        },
        [weak, epoch, gen] {
            auto self = weak.lock();
            if (!self)
                return false;
            std::scoped_lock lk(self->m_mutex);
            return self->m_epoch == epoch && self->m_refresh_gen == gen;
        });
}

void AuthStateMachine::on_refresh_due(uint64_t epoch, uint64_t gen)
{
    std::string restart_url;
    {
        std::scoped_lock lk(m_mutex);
        if (epoch != m_epoch || gen != m_refresh_gen || !m_token)
            return;
        m_next_refresh.reset();
        if (m_token->has_refresh_token()) {
            if (m_state == AuthState::authenticated)
                m_state = AuthState::refreshing;
            m_bridge->submit(refresh_task(shared_from_this(), m_epoch, *m_token));
            return;
        }
        m_token.reset();
        if (m_pending) {
            log::info("[auth] {} token expired, sign-in already pending", m_cfg.id);
            return;
        }
        log::info("[auth] {} token expired without refresh token, restarting flow", m_cfg.id);
        m_state = AuthState::expired;
        ++m_flow_epoch;
        restart_url = begin_flow_locked(Clock::now());
        m_state = AuthState::awaiting_redirect;
        m_bridge->post(AuthUrlReady{m_cfg.id, restart_url});
    }
    if (m_opener)
        m_opener(m_cfg.id, restart_url);
}

coro::task<void> AuthStateMachine::refresh_task(std::shared_ptr<AuthStateMachine> self, uint64_t epoch, Token previous)
{
    co_await self->m_bridge->blocking_scheduler()->schedule();
    metrics::auth().refreshes.fetch_add(1, std::memory_order_relaxed);
    auto resp = self->m_http->post_form(self->m_cfg.token_endpoint, refresh_form(self->m_cfg, previous.refresh_token));
    co_await self->m_bridge->scheduler()->schedule();
    auto now = Clock::now();
    auto grant = parse_token_response(resp, self->m_cfg.id, now, &previous);

    std::scoped_lock lk(self->m_mutex);
    if (epoch != self->m_epoch) {
        metrics::auth().discarded_results.fetch_add(1, std::memory_order_relaxed);
        co_return;
    }
    if (grant.ok) {
        log::info("[auth] {} refreshed token={}", self->m_cfg.id, log::fingerprint(grant.token.access_token));
        if (self->m_state == AuthState::refreshing)
            self->m_state = AuthState::authenticated;
        self->m_token = grant.token;
        self->m_bridge->post(TokenUpdated{grant.token});
        self->schedule_refresh_locked(grant.token);
        co_return;
    }
    if (grant.transient && previous.expires_at > now + k_refresh_retry) {
        log::warn("[auth] {} refresh transport failure ({}), retrying", self->m_cfg.id, grant.reason);
        if (self->m_state == AuthState::refreshing)
            self->m_state = AuthState::authenticated;
        Token retry = previous;
        retry.expires_at = now + k_refresh_retry + self->m_opts.refresh_margin;
        self->schedule_refresh_locked(retry);
        co_return;
    }
    self->m_token.reset();
    if (self->m_state == AuthState::refreshing)
        self->m_state = AuthState::idle;
    self->fail_locked(ErrorCode::auth_exchange_failed, "refresh rejected: " + grant.reason, AuthStage::refresh);
    co_return;
}

void AuthStateMachine::on_flow_timeout(uint64_t epoch, std::string nonce)
{
    std::scoped_lock lk(m_mutex);
    if (epoch != m_flow_epoch || !m_pending || m_pending->state_nonce != nonce)
        return;
    retire_locked(std::move(nonce));
    m_pending.reset();
    flow_ended_locked();
    fail_locked(ErrorCode::stale_flow, "flow timed out");
}

void AuthStateMachine::resume(Token token)
{
    std::scoped_lock lk(m_mutex);
    ++m_epoch;
    ++m_flow_epoch;
    if (m_pending) {
        retire_locked(m_pending->state_nonce);
        m_pending.reset();
    }
    token.provider = m_cfg.id;
    m_state = AuthState::authenticated;
    m_token = token;
    if (!token.expired())
        m_bridge->post(TokenUpdated{token});
    log::info("[auth] {} resumed persisted token (expired={})", m_cfg.id, token.expired());
    schedule_refresh_locked(token);
}

void AuthStateMachine::logout()
{
    std::scoped_lock lk(m_mutex);
    logout_locked();
}

void AuthStateMachine::logout_locked()
{
    ++m_epoch;
    ++m_flow_epoch;
    ++m_refresh_gen;
    m_deleting = false;
    if (m_pending) {
        retire_locked(m_pending->state_nonce);
        m_pending.reset();
    }
    m_token.reset();
    m_next_refresh.reset();
    m_state = AuthState::idle;
    log::info("[auth] {} logged out", m_cfg.id);
    m_bridge->post(LoggedOut{m_cfg.id});
}

Error AuthStateMachine::delete_account()
{
    std::scoped_lock lk(m_mutex);
    if (m_cfg.account_endpoint.empty())
        return make_error(ErrorCode::account_delete_failed, "provider has no account endpoint");
    if (!m_token || m_token->expired())
        return make_error(ErrorCode::unauthenticated, "not signed in");
    if (m_token->id_token.empty())
        return make_error(ErrorCode::account_delete_failed, "token carries no id_token");
    if (m_deleting)
        return {};
    m_deleting = true;
    log::info("[auth] {} deleting account", m_cfg.id);
    m_bridge->submit(delete_task(shared_from_this(), m_epoch, *m_token));
    return {};
}

coro::task<void> AuthStateMachine::delete_task(std::shared_ptr<AuthStateMachine> self, uint64_t epoch, Token token)
{
    co_await self->m_bridge->blocking_scheduler()->schedule();
    auto resp = self->m_http->post_json(self->m_cfg.account_endpoint, account_delete_body(token.id_token));
    co_await self->m_bridge->scheduler()->schedule();
    Error err = parse_account_delete_response(resp);

    std::scoped_lock lk(self->m_mutex);
    if (epoch != self->m_epoch) {
        metrics::auth().discarded_results.fetch_add(1, std::memory_order_relaxed);
        co_return;
    }
    self->m_deleting = false;
    if (err) {
        self->fail_locked(err.code, std::move(err.detail), AuthStage::account_delete);
        co_return;
    }
    log::info("[auth] {} account deleted", self->m_cfg.id);
    self->m_bridge->post(AccountDeleted{self->m_cfg.id});
    self->logout_locked();
    co_return;
}

} // namespace firetick::auth
