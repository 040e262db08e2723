// SPDX-License-Identifier: Apache-2.0
// token_endpoint.hpp
// Request bodies for the OAuth2 token endpoint and the account endpoint, and
// parsing of their JSON answers.
#pragma once

#include "auth/http_client.hpp"
#include "auth/provider_registry.hpp"
#include "auth/token.hpp"
#include "common/errors.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace firetick::auth {

struct TokenGrant
{
    bool ok{false};
    Token token;
    std::string reason; // provider error / transport error when !ok
    bool transient{false}; // transport failure (no HTTP answer)
};

// grant_type=authorization_code with the PKCE verifier.
url::Params exchange_form(const ProviderConfig &p, const std::string &code, const std::string &verifier);

// grant_type=refresh_token.
url::Params refresh_form(const ProviderConfig &p, const std::string &refresh_token);

// Builds a Token from a token endpoint response. `previous` supplies the refresh
// token when a refresh answer omits it.
TokenGrant parse_token_response(const HttpResponse &resp, const std::string &provider, Clock::time_point now,
    const Token *previous = nullptr);

// JSON body of the accounts:delete call: {"idToken": "<id token>"}.
std::string account_delete_body(const std::string &id_token);

// Error (AccountDeleteFailed) unless the answer is a 2xx. The message of a
// {"error":{"message":...}} body becomes the detail.
Error parse_account_delete_response(const HttpResponse &resp);

// Claims from the payload segment of an id_token JWT. The signature is not
// checked. Empty optional when the token is not a decodable JWT.
std::optional<Identity> decode_identity(std::string_view id_token);

} // namespace firetick::auth
