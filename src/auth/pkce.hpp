// SPDX-License-Identifier: Apache-2.0
// PKCE (RFC 7636) and nonce helpers backed by OpenSSL.
#pragma once

#include <string>
#include <string_view>

namespace firetick::auth::pkce {

// base64url without padding.
std::string base64url_encode(std::string_view bytes);
// Accepts padded or unpadded base64url; returns empty on malformed input.
std::string base64url_decode(std::string_view text);

// `n` bytes from the OpenSSL CSPRNG, base64url encoded. Throws
// std::runtime_error if the generator is unavailable.
std::string random_token(size_t n);

// 32 random bytes -> 43 character verifier.
std::string make_verifier();

// BASE64URL(SHA256(verifier)).
std::string s256_challenge(std::string_view verifier);

// Opaque CSRF state nonce.
std::string make_state_nonce();

} // namespace firetick::auth::pkce
