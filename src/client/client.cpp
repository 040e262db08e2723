// SPDX-License-Identifier: Apache-2.0
#include "client/client.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "rpc/framed_transport.hpp"
#include "rpc/memory_transport.hpp"

namespace firetick {

namespace {
std::shared_ptr<rpc::IDocumentTransport> make_transport(
    const Config &cfg, const std::shared_ptr<coro::io_scheduler> &scheduler)
{
    if (cfg.document_endpoint.empty() || cfg.document_endpoint == "memory") {
        log::info("[rpc] using in-process document store");
        return std::make_shared<rpc::MemoryDocumentTransport>(scheduler, std::make_shared<rpc::DocumentStore>());
    }
    auto colon = cfg.document_endpoint.rfind(':');
    if (colon == std::string::npos)
        throw ConfigError("document_endpoint must be 'memory' or host:port, got '" + cfg.document_endpoint + "'");
    std::string host = cfg.document_endpoint.substr(0, colon);
    auto parsed = parse_port(cfg.document_endpoint.substr(colon + 1));
    if (!parsed || *parsed == 0)
        throw ConfigError("invalid port in document_endpoint '" + cfg.document_endpoint + "'");
    uint16_t port = *parsed;
    if (host == "localhost")
        host = "127.0.0.1";
    auto t = rpc::FramedDocumentTransport::create(scheduler, host, port);
    t->start();
    log::info("[rpc] using document server {}:{}", host, port);
    return t;
}
} // namespace

Client::Client(const Config &cfg, ClientDeps deps)
    : m_registry(cfg.providers, cfg.redirect_port)
{
    m_bridge = bridge::TaskBridge::create(deps.scheduler);
    auto http = deps.http ? deps.http : auth::make_curl_client();
    m_transport = deps.transport ? deps.transport : make_transport(cfg, m_bridge->scheduler());

    auth::MachineOptions mopts;
    mopts.refresh_margin = std::chrono::seconds(cfg.refresh_margin_seconds);
    mopts.flow_timeout = std::chrono::seconds(cfg.flow_timeout_seconds);
    m_router = std::make_shared<auth::RedirectRouter>();
    for (const auto &id : m_registry.ids()) {
        auto m = auth::AuthStateMachine::create(*m_registry.find(id), m_bridge, http, mopts, deps.opener);
        m_router->add(m);
        m_machines.emplace(id, std::move(m));
    }
    if (deps.redirect_listener) {
        m_listener = std::make_unique<auth::RedirectListener>(m_bridge->scheduler(), cfg.redirect_port, m_router);
        m_listener->start();
    }

    rpc::SessionOptions sopts;
    sopts.project_id = cfg.project_id;
    sopts.reauth_wait = std::chrono::milliseconds(cfg.reauth_wait_ms);
    m_session = std::make_unique<rpc::RpcSession>(m_bridge, m_transport, m_tokens, sopts);
    log::info("[client] ready: {} provider(s), project={}", m_machines.size(), cfg.project_id);
}

Client::~Client()
{
    std::vector<BridgeEvent> discarded;
    m_session->drop_watches(ErrorCode::stream_dropped, discarded);
    m_listener.reset();
    if (auto framed = std::dynamic_pointer_cast<rpc::FramedDocumentTransport>(m_transport))
        framed->stop();
    m_bridge->close();
}

std::shared_ptr<auth::AuthStateMachine> Client::machine(std::string_view provider) const
{
    auto it = m_machines.find(auth::ProviderRegistry::normalize(provider));
    return it == m_machines.end() ? nullptr : it->second;
}

auth::FlowStart Client::start_flow(std::string_view provider)
{
    auto m = machine(provider);
    if (!m) {
        log::warn("[client] start_flow: unknown provider '{}'", provider);
        auth::FlowStart r;
        r.error = make_error(ErrorCode::unknown_provider, std::string(provider));
        return r;
    }
    return m->start_flow();
}

void Client::logout()
{
    for (auto &[id, m] : m_machines)
        m->logout();
}

bool Client::resume(auth::Token token)
{
    auto m = machine(token.provider);
    if (!m)
        return false;
    m->resume(std::move(token));
    return true;
}

Error Client::delete_account()
{
    const auto &cur = m_tokens.current();
    if (!cur)
        return make_error(ErrorCode::unauthenticated, "not signed in");
    auto m = machine(cur->provider);
    if (!m)
        return make_error(ErrorCode::unknown_provider, cur->provider);
    return m->delete_account();
}

std::optional<auth::Identity> Client::current_identity() const
{
    if (!m_tokens.current())
        return std::nullopt;
    return m_tokens.current()->identity;
}

std::vector<BridgeEvent> Client::poll_events()
{
    std::vector<BridgeEvent> out;
    auto events = m_bridge->drain();
    for (auto &ev : events)
        apply(std::move(ev), out);
    if (m_session->parked() > 0)
        m_session->expire_parked(std::chrono::steady_clock::now(), out);
    return out;
}

void Client::drop_session_state(const std::string &provider, std::vector<BridgeEvent> &out)
{
    const auto &cur = m_tokens.current();
    if (!cur || cur->provider != provider)
        return;
    m_session->drop_watches(ErrorCode::stream_dropped, out);
    m_tokens.clear();
}

void Client::apply(BridgeEvent ev, std::vector<BridgeEvent> &out)
{
    if (auto *tu = std::get_if<TokenUpdated>(&ev)) {
        m_tokens.replace(tu->token);
        out.push_back(std::move(ev));
        m_session->on_token_updated();
    } else if (auto *af = std::get_if<AuthFailed>(&ev)) {
        // A failed sign-in attempt or account deletion keeps the current session.
        if (af->stage == AuthStage::refresh)
            drop_session_state(af->provider, out);
        out.push_back(std::move(ev));
    } else if (auto *lo = std::get_if<LoggedOut>(&ev)) {
        drop_session_state(lo->provider, out);
        out.push_back(std::move(ev));
    } else if (std::holds_alternative<RpcResult>(ev) || std::holds_alternative<DocumentChanged>(ev)) {
        m_session->accept(std::move(ev), out);
    } else {
        out.push_back(std::move(ev));
    }
}

} // namespace firetick
