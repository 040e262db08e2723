// SPDX-License-Identifier: Apache-2.0
// YAML config loading and the provider registry built from it.
#include "auth/provider_registry.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using namespace firetick;
    // defaults
    auto empty = parse_config("");
    assert(empty.redirect_port == 8085);
    assert(empty.refresh_margin_seconds == 60);
    assert(empty.reauth_wait_ms == 10000);
    assert(empty.document_endpoint == "memory");
    assert(empty.providers.empty());

    auto cfg = parse_config(R"(
project_id: clicks
redirect_port: 9090
tick_rate: 30
providers:
  Google:
    client_id: C
    client_secret: S
  corp:
    client_id: X
    auth_endpoint: https://sso.example.com/authorize
    token_endpoint: https://sso.example.com/token
    scopes: [openid]
)");
    assert(cfg.project_id == "clicks");
    assert(cfg.redirect_port == 9090);
    assert(cfg.tick_rate == 30);
    assert(cfg.providers.size() == 2);

    auth::ProviderRegistry reg(cfg.providers, cfg.redirect_port);
    assert(reg.size() == 2);
    const auto *g = reg.find("GOOGLE");
    assert(g && g->id == "google");
    assert(g->client_id == "C" && g->client_secret == "S");
    assert(g->auth_endpoint == "https://accounts.google.com/o/oauth2/v2/auth");
    assert(g->token_endpoint == "https://oauth2.googleapis.com/token");
    assert(g->scopes.size() == 3);
    assert(g->redirect_uri() == "http://localhost:9090/");
    const auto *corp = reg.find("corp");
    assert(corp && corp->scopes.size() == 1 && corp->scopes[0] == "openid");
    assert(!reg.contains("github"));

    bool threw = false;
    try {
        parse_config("providers:\n  google:\n    client_secret: only\n");
    } catch (const ConfigError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parse_config("redirect_port: [not, a, port]\n");
    } catch (const ConfigError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        auto c = parse_config("providers:\n  unknownidp:\n    client_id: Z\n");
        auth::ProviderRegistry r(c.providers, c.redirect_port);
    } catch (const ConfigError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        load_config("/nonexistent/firetick.yaml");
    } catch (const ConfigError &) {
        threw = true;
    }
    assert(threw);

    // Account endpoint: google default with the API key, "none" disables it
    auto acct = parse_config(R"(
providers:
  google:
    client_id: C
    api_key: "k&1"
  github:
    client_id: G
  corp:
    client_id: X
    auth_endpoint: https://sso.example.com/authorize
    token_endpoint: https://sso.example.com/token
    account_endpoint: https://sso.example.com/delete?tenant=t
    api_key: K
)");
    auth::ProviderRegistry acct_reg(acct.providers, acct.redirect_port);
    assert(acct_reg.find("google")->account_endpoint ==
        "https://identitytoolkit.googleapis.com/v1/accounts:delete?key=k%261");
    assert(acct_reg.find("github")->account_endpoint.empty());
    assert(acct_reg.find("corp")->account_endpoint == "https://sso.example.com/delete?tenant=t&key=K");
    auto off = parse_config("providers:\n  google:\n    client_id: C\n    account_endpoint: none\n");
    auth::ProviderRegistry off_reg(off.providers, off.redirect_port);
    assert(off_reg.find("google")->account_endpoint.empty());

    // Ports outside 0..65535 never wrap around
    assert(parse_port("8080") == uint16_t{8080});
    assert(parse_port("65535") == uint16_t{65535});
    assert(parse_port("0") == uint16_t{0});
    assert(!parse_port("65536"));
    assert(!parse_port("70000"));
    assert(!parse_port("123456"));
    assert(!parse_port("-1"));
    assert(!parse_port(""));
    assert(!parse_port("12a"));

    std::cout << "unit_config OK" << std::endl;
    return 0;
}
