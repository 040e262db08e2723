// SPDX-License-Identifier: Apache-2.0
// bridge_event.hpp
// Completions handed from background work to the host tick. Delivered in FIFO
// order by TaskBridge::drain().
#pragma once

#include "auth/token.hpp"
#include "common/errors.hpp"
#include "document.pb.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace firetick {

using Document = firetick::v1::Document;

// Monotonic per session; 0 is never allocated.
using RpcHandle = uint64_t;

struct TokenUpdated
{
    auth::Token token;
};

enum class CallKind
{
    get,
    set,
    del,
    watch_start,
    watch_stop,
};

const char *to_string(CallKind k) noexcept;

// Which operation an AuthFailed came from. Only a refresh failure invalidates
// the stored credential; a failed sign-in attempt or account deletion leaves
// the current token in place.
enum class AuthStage
{
    flow,
    refresh,
    account_delete,
};

struct AuthFailed
{
    std::string provider;
    Error error;
    AuthStage stage{AuthStage::flow};
};

struct RpcResult
{
    RpcHandle handle{0};
    std::optional<Document> payload; // Get / Set answers
    Error error;
    CallKind kind{CallKind::get}; // operation and path the handle was issued for
    std::string path;

    bool ok() const noexcept { return !error; }
};

struct DocumentChanged
{
    std::string path;
    RpcHandle handle{0};
    std::optional<Document> payload; // nullopt: document deleted / absent
    uint64_t version{0};
};

// A flow was (re)started without a host call; the host should open the URL.
struct AuthUrlReady
{
    std::string provider;
    std::string url;
};

struct LoggedOut
{
    std::string provider;
};

// The identity service removed the account; a LoggedOut for the same provider follows.
struct AccountDeleted
{
    std::string provider;
};

using BridgeEvent =
    std::variant<TokenUpdated, AuthFailed, RpcResult, DocumentChanged, AuthUrlReady, LoggedOut, AccountDeleted>;

const char *event_name(const BridgeEvent &ev) noexcept;

} // namespace firetick
