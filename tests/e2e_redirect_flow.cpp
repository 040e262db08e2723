// SPDX-License-Identifier: Apache-2.0
// Browser-side view of sign-in: real HTTP requests against the loopback
// redirect listener, code exchange against a scripted token endpoint, then
// document calls and logout through the Client facade.
#include "client/client.hpp"
#include "common/url.hpp"
#include "test_support.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>

using namespace std::chrono_literals;
using namespace firetick;

namespace {

constexpr uint16_t k_redirect_port = 41085;

coro::task<std::string> http_get(std::shared_ptr<coro::io_scheduler> sched, std::string target)
{
    co_await sched->schedule();
    coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = k_redirect_port}};
    auto st = co_await cli.connect(2s);
    assert(st == coro::net::connect_status::connected);
    std::string req = "GET " + target + " HTTP/1.1\r\nHost: localhost\r\nUser-Agent: e2e\r\n\r\n";
    std::span<const char> rest(req.data(), req.size());
    while (!rest.empty()) {
        co_await cli.poll(coro::poll_op::write);
        auto [ss, r] = cli.send(rest);
        if (ss == coro::net::send_status::ok || ss == coro::net::send_status::would_block)
            rest = r;
        else
            co_return std::string();
    }
    std::string resp;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        co_await cli.poll(coro::poll_op::read, 100ms);
        std::string tmp(1024, '\0');
        auto [rs, span] = cli.recv(tmp);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok)
            break; // closed: response complete
        resp.append(span.data(), span.size());
    }
    co_return resp;
}

int status_of(const std::string &resp)
{
    // "HTTP/1.1 200 OK"
    if (resp.size() < 12)
        return 0;
    return std::stoi(resp.substr(9, 3));
}

std::string state_param(const std::string &auth_url)
{
    auto q = url::parse_query(auth_url.substr(auth_url.find('?') + 1));
    return q.at("state");
}

Config make_config()
{
    return parse_config(R"(
project_id: e2e
redirect_port: 41085
providers:
  google:
    client_id: C
    api_key: K
  github:
    client_id: G
    client_secret: GS
)");
}

} // namespace

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    auto http = std::make_shared<test::FakeHttpClient>();
    std::vector<std::string> opened;
    ClientDeps deps;
    deps.scheduler = sched;
    deps.http = http;
    deps.opener = [&](const std::string &, const std::string &u) { opened.push_back(u); };
    auto client = std::make_unique<Client>(make_config(), deps);
    auto poll = [&] { return client->poll_events(); };

    // A second listener on the same port is a configuration error
    bool threw = false;
    try {
        auth::RedirectListener dup(sched, k_redirect_port, client->router());
    } catch (const ConfigError &) {
        threw = true;
    }
    assert(threw);

    // Nothing pending yet
    auto stray = coro::sync_wait(http_get(sched, "/?code=x&state=y"));
    assert(status_of(stray) == 200);
    assert(stray.find("No pending authentication") != std::string::npos);

    auto early = client->get("users/42");
    auto evs = test::poll_until(poll, [early](const std::vector<BridgeEvent> &all) {
        return test::result_for(all, early) != nullptr;
    });
    assert(test::result_for(evs, early)->error.code == ErrorCode::unauthenticated);

    auto unknown = client->start_flow("myspace");
    assert(!unknown.ok && unknown.error.code == ErrorCode::unknown_provider);

    auto fs = client->start_flow("Google");
    assert(fs.ok);
    assert(opened.size() == 1 && opened[0] == fs.url);
    assert(fs.url.find("client_id=C&redirect_uri=http://localhost:41085/&response_type=code") != std::string::npos);
    auto nonce = state_param(fs.url);

    auto favicon = coro::sync_wait(http_get(sched, "/favicon.ico"));
    assert(status_of(favicon) == 404);

    auto forged = coro::sync_wait(http_get(sched, "/?state=forged&code=abc123"));
    assert(status_of(forged) == 400);
    assert(client->machine("google")->state() == auth::AuthState::awaiting_redirect);

    http->push_json(200, R"({"access_token":"tok1","expires_in":3600})");
    auto ok = coro::sync_wait(http_get(sched, "/?state=" + nonce + "&code=abc123&scope=openid"));
    assert(status_of(ok) == 200);
    assert(ok.find("Signed in") != std::string::npos);

    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<TokenUpdated>(all) != nullptr;
    });
    auto *tu = test::find_event<TokenUpdated>(evs);
    assert(tu && tu->token.provider == "google" && tu->token.access_token == "tok1");
    assert(client->tokens().live());
    assert(client->tokens().current()->access_token == "tok1");
    assert(http->requests().size() == 1);
    assert(http->requests()[0].field("code") == "abc123");
    assert(http->requests()[0].field("redirect_uri") == "http://localhost:41085/");
    assert(!client->current_identity());

    Document user;
    (*user.mutable_fields())["name"].set_string_value("ada");
    auto put = client->set("users/42", user);
    evs = test::poll_until(poll, [put](const std::vector<BridgeEvent> &all) {
        return test::result_for(all, put) != nullptr;
    });
    assert(test::result_for(evs, put)->ok());
    auto fetch = client->get("users/42");
    evs = test::poll_until(poll, [fetch](const std::vector<BridgeEvent> &all) {
        return test::result_for(all, fetch) != nullptr;
    });
    assert(test::result_for(evs, fetch)->ok());
    assert(test::result_for(evs, fetch)->payload->fields().at("name").string_value() == "ada");

    // Browser refresh of the same redirect
    auto replay = coro::sync_wait(http_get(sched, "/?state=" + nonce + "&code=abc123"));
    assert(status_of(replay) == 400);
    assert(replay.find("expired") != std::string::npos);
    assert(http->requests().size() == 1);

    // Flows for two providers at once are routed by nonce
    auto gh = client->start_flow("github");
    auto gh_nonce = state_param(gh.url);
    auto denied = coro::sync_wait(http_get(sched, "/?state=" + gh_nonce + "&error=access_denied"));
    assert(status_of(denied) == 400);
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<AuthFailed>(all) != nullptr;
    });
    auto *af = test::find_event<AuthFailed>(evs);
    assert(af && af->provider == "github");
    // github never held the token, google's stays
    assert(client->tokens().live());

    // Documents through the signed-in session
    Document doc;
    (*doc.mutable_fields())["clicks"].set_integer_value(1);
    auto w = client->watch("players/ada");
    auto s = client->set("players/ada", doc);
    evs = test::poll_until(poll, [s](const std::vector<BridgeEvent> &all) { return test::result_for(all, s) != nullptr; });
    assert(test::result_for(evs, s) && test::result_for(evs, s)->ok());
    evs = test::poll_until(poll, [w](const std::vector<BridgeEvent> &all) {
        return test::find_event<DocumentChanged>(all, [w](const DocumentChanged &c) { return c.handle == w && c.payload; }) != nullptr;
    });
    assert(test::find_event<DocumentChanged>(evs, [](const DocumentChanged &c) { return c.version == 1; }));

    // Signing in to google again and cancelling in the browser keeps the
    // current session: token, refresh timer and watch all survive.
    auto refresh_due = client->machine("google")->next_refresh_at();
    assert(refresh_due);
    auto again = client->start_flow("google");
    assert(again.ok);
    assert(client->tokens().live());
    auto cancelled = coro::sync_wait(http_get(sched, "/?state=" + state_param(again.url) + "&error=access_denied"));
    assert(status_of(cancelled) == 400);
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<AuthFailed>(all, [](const AuthFailed &f) { return f.provider == "google"; }) != nullptr;
    });
    auto *cancel_af = test::find_event<AuthFailed>(evs, [](const AuthFailed &f) { return f.provider == "google"; });
    assert(cancel_af->error.code == ErrorCode::auth_exchange_failed);
    assert(cancel_af->stage == AuthStage::flow);
    assert(!test::result_for(evs, w));
    assert(client->tokens().live());
    assert(client->tokens().current()->access_token == "tok1");
    assert(client->session().active_watches() == 1);
    assert(client->machine("google")->next_refresh_at() == refresh_due);
    assert(client->machine("google")->state() == auth::AuthState::authenticated);

    // Same for a re-sign-in whose code the provider refuses
    auto again2 = client->start_flow("google");
    http->push_json(400, R"({"error":"invalid_grant"})");
    auto refused = coro::sync_wait(http_get(sched, "/?state=" + state_param(again2.url) + "&code=stale"));
    assert(status_of(refused) == 200);
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<AuthFailed>(all) != nullptr;
    });
    assert(test::find_event<AuthFailed>(evs)->stage == AuthStage::flow);
    assert(!test::result_for(evs, w));
    assert(client->tokens().live());
    assert(client->session().active_watches() == 1);
    assert(client->machine("google")->next_refresh_at() == refresh_due);
    auto still = client->get("players/ada");
    evs = test::poll_until(poll, [still](const std::vector<BridgeEvent> &all) {
        return test::result_for(all, still) != nullptr;
    });
    assert(test::result_for(evs, still)->ok());

    // Logout ends the watch, clears the token and later calls fail locally
    client->logout();
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<LoggedOut>(all, [](const LoggedOut &l) { return l.provider == "google"; }) != nullptr;
    });
    auto *dropped = test::result_for(evs, w);
    assert(dropped && dropped->error.code == ErrorCode::stream_dropped);
    assert(!client->tokens().current());
    auto g = client->get("players/ada");
    evs = test::poll_until(poll, [g](const std::vector<BridgeEvent> &all) { return test::result_for(all, g) != nullptr; });
    assert(test::result_for(evs, g)->error.code == ErrorCode::unauthenticated);

    // Refresh rejected by the provider: watches end before the failure is reported
    auth::Token saved;
    saved.provider = "google";
    saved.access_token = "tok2";
    saved.refresh_token = "revoked";
    saved.expires_at = auth::Clock::now() + 61s; // refresh due in about a second
    assert(client->resume(saved));
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<TokenUpdated>(all) != nullptr;
    });
    auto w2 = client->watch("players/ada");
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<AuthFailed>(all) != nullptr;
    }, 5s);
    size_t drop_at = evs.size(), fail_at = evs.size();
    for (size_t i = 0; i < evs.size(); ++i) {
        if (auto *r = std::get_if<RpcResult>(&evs[i]); r && r->handle == w2)
            drop_at = i;
        if (std::holds_alternative<AuthFailed>(evs[i]))
            fail_at = i;
    }
    assert(drop_at < fail_at && fail_at < evs.size());
    assert(std::get<RpcResult>(evs[drop_at]).error.code == ErrorCode::stream_dropped);
    assert(std::get<AuthFailed>(evs[fail_at]).error.code == ErrorCode::auth_exchange_failed);
    assert(std::get<AuthFailed>(evs[fail_at]).stage == AuthStage::refresh);
    assert(!client->tokens().current());
    assert(client->session().active_watches() == 0);

    // Account deletion at the identity service
    assert(client->delete_account().code == ErrorCode::unauthenticated);
    assert(client->machine("github")->delete_account().code == ErrorCode::account_delete_failed);
    auth::Token signed_in;
    signed_in.provider = "google";
    signed_in.access_token = "tok3";
    signed_in.id_token = "idt3";
    signed_in.expires_at = auth::Clock::now() + 1h;
    assert(client->resume(signed_in));
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<TokenUpdated>(all) != nullptr;
    });
    auto w3 = client->watch("players/ada");
    evs = test::poll_until(poll, [w3](const std::vector<BridgeEvent> &all) {
        return test::find_event<DocumentChanged>(all, [w3](const DocumentChanged &c) { return c.handle == w3; }) != nullptr;
    });

    auto sent_before = http->requests().size();
    http->push_json(400, R"({"error":{"code":400,"message":"CREDENTIAL_TOO_OLD_LOGIN_AGAIN"}})");
    assert(!client->delete_account());
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<AuthFailed>(all) != nullptr;
    });
    auto *del_af = test::find_event<AuthFailed>(evs);
    assert(del_af->stage == AuthStage::account_delete);
    assert(del_af->error.code == ErrorCode::account_delete_failed);
    assert(del_af->error.detail == "CREDENTIAL_TOO_OLD_LOGIN_AGAIN");
    assert(client->tokens().live());
    assert(client->session().active_watches() == 1);
    auto reqs = http->requests();
    assert(reqs.size() == sent_before + 1);
    assert(reqs.back().url == "https://identitytoolkit.googleapis.com/v1/accounts:delete?key=K");
    assert(reqs.back().body == R"({"idToken":"idt3"})");

    http->push_json(200, "{}");
    assert(!client->delete_account());
    evs = test::poll_until(poll, [](const std::vector<BridgeEvent> &all) {
        return test::find_event<LoggedOut>(all) != nullptr;
    });
    size_t deleted_at = evs.size(), out_at = evs.size(), w3_at = evs.size();
    for (size_t i = 0; i < evs.size(); ++i) {
        if (std::holds_alternative<AccountDeleted>(evs[i]))
            deleted_at = i;
        if (std::holds_alternative<LoggedOut>(evs[i]))
            out_at = i;
        if (auto *r = std::get_if<RpcResult>(&evs[i]); r && r->handle == w3)
            w3_at = i;
    }
    assert(deleted_at < w3_at && w3_at < out_at && out_at < evs.size());
    assert(std::get<AccountDeleted>(evs[deleted_at]).provider == "google");
    assert(!client->tokens().current());
    assert(client->session().active_watches() == 0);
    assert(client->machine("google")->state() == auth::AuthState::idle);

    client.reset();
    test::settle();
    std::cout << "e2e_redirect_flow OK" << std::endl;
    return 0;
}
