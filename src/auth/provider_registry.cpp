// SPDX-License-Identifier: Apache-2.0
#include "auth/provider_registry.hpp"

#include "common/errors.hpp"
#include "common/url.hpp"

#include <cctype>

namespace firetick::auth {

namespace {
struct Defaults
{
    const char *auth_endpoint;
    const char *token_endpoint;
    std::vector<std::string> scopes;
    const char *account_endpoint;
};

const Defaults *defaults_for(const std::string &id)
{
    static const Defaults google{
        "https://accounts.google.com/o/oauth2/v2/auth",
        "https://oauth2.googleapis.com/token",
        {"openid", "profile", "email"},
        "https://identitytoolkit.googleapis.com/v1/accounts:delete"};
    static const Defaults github{"https://github.com/login/oauth/authorize",
        "https://github.com/login/oauth/access_token", {"read:user"}, ""};
    if (id == "google")
        return &google;
    if (id == "github")
        return &github;
    return nullptr;
}
} // namespace

std::string ProviderConfig::redirect_uri() const
{
    return "http://localhost:" + std::to_string(redirect_port) + "/";
}

std::string ProviderRegistry::normalize(std::string_view id)
{
    std::string out;
    out.reserve(id.size());
    for (char c : id)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

ProviderRegistry::ProviderRegistry(const std::map<std::string, ProviderSettings> &providers, uint16_t redirect_port)
{
    for (const auto &[raw_id, ps] : providers) {
        ProviderConfig pc;
        pc.id = normalize(raw_id);
        pc.client_id = ps.client_id;
        pc.client_secret = ps.client_secret;
        pc.redirect_port = redirect_port;
        const Defaults *d = defaults_for(pc.id);
        if (ps.auth_endpoint)
            pc.auth_endpoint = *ps.auth_endpoint;
        else if (d)
            pc.auth_endpoint = d->auth_endpoint;
        if (ps.token_endpoint)
            pc.token_endpoint = *ps.token_endpoint;
        else if (d)
            pc.token_endpoint = d->token_endpoint;
        if (ps.scopes)
            pc.scopes = *ps.scopes;
        else if (d)
            pc.scopes = d->scopes;
        if (ps.account_endpoint)
            pc.account_endpoint = *ps.account_endpoint == "none" ? std::string() : *ps.account_endpoint;
        else if (d)
            pc.account_endpoint = d->account_endpoint;
        if (!pc.account_endpoint.empty() && !ps.api_key.empty()) {
            pc.account_endpoint.push_back(pc.account_endpoint.find('?') == std::string::npos ? '?' : '&');
            pc.account_endpoint += "key=" + url::encode_component(ps.api_key);
        }
        if (pc.auth_endpoint.empty() || pc.token_endpoint.empty())
            throw ConfigError("provider '" + raw_id + "' needs auth_endpoint and token_endpoint");
        add(std::move(pc));
    }
}

void ProviderRegistry::add(ProviderConfig cfg)
{
    cfg.id = normalize(cfg.id);
    auto key = cfg.id;
    m_by_id[key] = std::move(cfg);
}

const ProviderConfig *ProviderRegistry::find(std::string_view id) const
{
    auto it = m_by_id.find(normalize(id));
    return it == m_by_id.end() ? nullptr : &it->second;
}

std::vector<std::string> ProviderRegistry::ids() const
{
    std::vector<std::string> out;
    out.reserve(m_by_id.size());
    for (const auto &kv : m_by_id)
        out.push_back(kv.first);
    return out;
}

} // namespace firetick::auth
