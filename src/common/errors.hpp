// SPDX-License-Identifier: Apache-2.0
// Error taxonomy shared by auth, bridge and rpc layers. Failures travel as values
// (inside results and bridge events); only startup misconfiguration throws.
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace firetick {

enum class ErrorCode
{
    none = 0,
    unknown_provider, // operation referenced an unregistered provider id
    state_mismatch, // redirect state did not match the pending flow nonce
    stale_flow, // redirect for a superseded or expired flow
    auth_exchange_failed, // provider rejected code / refresh token exchange
    unauthenticated, // no valid token for an rpc call
    transient_rpc_failure, // network / timeout on a document call
    stream_dropped, // watch stream terminated unexpectedly
    not_found, // Get on a missing document
    invalid_path, // malformed document path
    account_delete_failed, // account endpoint refused or was unreachable
};

inline const char *to_string(ErrorCode c) noexcept
{
    switch (c) {
        case ErrorCode::none:
            return "ok";
        case ErrorCode::unknown_provider:
            return "UnknownProvider";
        case ErrorCode::state_mismatch:
            return "StateMismatch";
        case ErrorCode::stale_flow:
            return "StaleFlow";
        case ErrorCode::auth_exchange_failed:
            return "AuthExchangeFailed";
        case ErrorCode::unauthenticated:
            return "Unauthenticated";
        case ErrorCode::transient_rpc_failure:
            return "TransientRpcFailure";
        case ErrorCode::stream_dropped:
            return "StreamDropped";
        case ErrorCode::not_found:
            return "NotFound";
        case ErrorCode::invalid_path:
            return "InvalidPath";
        case ErrorCode::account_delete_failed:
            return "AccountDeleteFailed";
    }
    return "unknown";
}

struct Error
{
    ErrorCode code{ErrorCode::none};
    std::string detail;

    explicit operator bool() const noexcept { return code != ErrorCode::none; }
};

inline Error make_error(ErrorCode code, std::string detail = {})
{
    return Error{code, std::move(detail)};
}

// Fatal local misconfiguration (config file, redirect port already bound).
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace firetick
