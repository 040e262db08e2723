// SPDX-License-Identifier: Apache-2.0
// token.hpp
// Token value type and the host-owned store that holds the live one.
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace firetick::auth {

using Clock = std::chrono::system_clock;

struct Identity
{
    std::string subject; // "sub" claim / provider user id
    std::string email;
    bool email_verified{false};
    std::string display_name;
};

// Immutable once built: a refresh produces a new Token that supersedes this one.
struct Token
{
    std::string provider;
    std::string access_token;
    std::string refresh_token; // empty when the provider issued none
    std::string id_token; // empty when the provider issued none
    Clock::time_point expires_at{};
    std::optional<Identity> identity;

    bool has_refresh_token() const noexcept { return !refresh_token.empty(); }
    bool expired(Clock::time_point now = Clock::now()) const noexcept { return now >= expires_at; }
};

// Holds at most one live Token. Owned by the host-loop side; only mutated on the
// host thread (event application inside poll / drain). The version increases on
// every replace or clear so a call can tell that a newer credential exists.
class TokenStore
{
public:
    const std::optional<Token> &current() const noexcept { return m_token; }
    uint64_t version() const noexcept { return m_version; }

    // Live == present and not expired.
    bool live(Clock::time_point now = Clock::now()) const noexcept { return m_token && !m_token->expired(now); }

    void replace(Token t)
    {
        m_token = std::move(t);
        ++m_version;
    }

    void clear()
    {
        if (m_token) {
            m_token.reset();
            ++m_version;
        }
    }

private:
    std::optional<Token> m_token;
    uint64_t m_version{0};
};

} // namespace firetick::auth
