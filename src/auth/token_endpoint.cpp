// SPDX-License-Identifier: Apache-2.0
#include "auth/token_endpoint.hpp"

#include "auth/pkce.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>

using json = nlohmann::json;

namespace firetick::auth {

namespace {
constexpr int64_t k_default_expires_in = 3600;

std::optional<int64_t> read_expires_in(const json &j)
{
    auto it = j.find("expires_in");
    if (it == j.end())
        return std::nullopt;
    if (it->is_number_integer())
        return it->get<int64_t>();
    if (it->is_number())
        return static_cast<int64_t>(it->get<double>());
    if (it->is_string()) {
        const auto &s = it->get_ref<const std::string &>();
        char *end = nullptr;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0')
            return static_cast<int64_t>(v);
    }
    return std::nullopt;
}

std::string string_or_empty(const json &j, const char *key)
{
    auto it = j.find(key);
    if (it != j.end() && it->is_string())
        return it->get<std::string>();
    return {};
}

std::string error_reason(const json &j, long status)
{
    std::string err = string_or_empty(j, "error");
    std::string desc = string_or_empty(j, "error_description");
    if (err.empty())
        err = "http_" + std::to_string(status);
    if (!desc.empty())
        err += ": " + desc;
    return err;
}
} // namespace

url::Params exchange_form(const ProviderConfig &p, const std::string &code, const std::string &verifier)
{
    url::Params form{
        {"grant_type", "authorization_code"},
        {"code", code},
        {"code_verifier", verifier},
        {"redirect_uri", p.redirect_uri()},
        {"client_id", p.client_id},
    };
    if (!p.client_secret.empty())
        form.emplace_back("client_secret", p.client_secret);
    return form;
}

url::Params refresh_form(const ProviderConfig &p, const std::string &refresh_token)
{
    url::Params form{
        {"grant_type", "refresh_token"},
        {"refresh_token", refresh_token},
        {"client_id", p.client_id},
    };
    if (!p.client_secret.empty())
        form.emplace_back("client_secret", p.client_secret);
    return form;
}

TokenGrant parse_token_response(
    const HttpResponse &resp, const std::string &provider, Clock::time_point now, const Token *previous)
{
    TokenGrant g;
    if (!resp.transport_ok) {
        g.transient = true;
        g.reason = resp.transport_error.empty() ? "transport failure" : resp.transport_error;
        return g;
    }
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        g.reason = "malformed token response (http " + std::to_string(resp.status) + ")";
        return g;
    }
    // GitHub reports errors with HTTP 200 and an "error" member.
    if (resp.status < 200 || resp.status >= 300 || j.contains("error")) {
        g.reason = error_reason(j, resp.status);
        return g;
    }
    std::string access = string_or_empty(j, "access_token");
    if (access.empty()) {
        g.reason = "token response without access_token";
        return g;
    }
    g.token.provider = provider;
    g.token.access_token = std::move(access);
    g.token.refresh_token = string_or_empty(j, "refresh_token");
    if (g.token.refresh_token.empty() && previous)
        g.token.refresh_token = previous->refresh_token;
    g.token.id_token = string_or_empty(j, "id_token");
    g.token.expires_at = now + std::chrono::seconds(read_expires_in(j).value_or(k_default_expires_in));
    if (!g.token.id_token.empty())
        g.token.identity = decode_identity(g.token.id_token);
    if (!g.token.identity && previous)
        g.token.identity = previous->identity;
    g.ok = true;
    return g;
}

std::string account_delete_body(const std::string &id_token)
{
    return json{{"idToken", id_token}}.dump();
}

Error parse_account_delete_response(const HttpResponse &resp)
{
    if (!resp.transport_ok)
        return make_error(ErrorCode::account_delete_failed,
            resp.transport_error.empty() ? std::string("transport failure") : resp.transport_error);
    if (resp.status >= 200 && resp.status < 300)
        return {};
    std::string detail = "http_" + std::to_string(resp.status);
    json j = json::parse(resp.body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        auto err = j.find("error");
        if (err != j.end() && err->is_object()) {
            std::string message = string_or_empty(*err, "message");
            if (!message.empty())
                detail = std::move(message);
        } else if (err != j.end() && err->is_string()) {
            detail = error_reason(j, resp.status);
        }
    }
    return make_error(ErrorCode::account_delete_failed, detail);
}

std::optional<Identity> decode_identity(std::string_view id_token)
{
    size_t first = id_token.find('.');
    if (first == std::string_view::npos)
        return std::nullopt;
    size_t second = id_token.find('.', first + 1);
    if (second == std::string_view::npos)
        return std::nullopt;
    std::string payload = pkce::base64url_decode(id_token.substr(first + 1, second - first - 1));
    if (payload.empty())
        return std::nullopt;
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    Identity id;
    id.subject = string_or_empty(j, "sub");
    id.email = string_or_empty(j, "email");
    id.display_name = string_or_empty(j, "name");
    auto ev = j.find("email_verified");
    if (ev != j.end()) {
        if (ev->is_boolean())
            id.email_verified = ev->get<bool>();
        else if (ev->is_string())
            id.email_verified = ev->get<std::string>() == "true";
    }
    return id;
}

} // namespace firetick::auth
