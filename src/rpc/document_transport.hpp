// SPDX-License-Identifier: Apache-2.0
// document_transport.hpp
// Abstract document RPC channel. Implementations run only on the bridge
// scheduler; every method is a coroutine and never blocks the caller's thread.
#pragma once

#include "bridge/bridge_event.hpp"
#include "common/errors.hpp"

#include <coro/coro.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace firetick::rpc {

struct CallContext
{
    std::string authorization; // "Bearer <access token>"
    std::string database; // projects/<p>/databases/(default)
};

struct UnaryResult
{
    Error error;
    std::optional<Document> document;
};

struct ChangeNotice
{
    std::optional<Document> document; // nullopt: absent / deleted
    uint64_t version{0};
};

// Shared between the session (host) and a running watch stream.
struct WatchControl
{
    std::atomic_bool cancelled{false};
    std::atomic_bool stop_sent{false};
    std::atomic<uint64_t> call_id{0}; // wire id once the stream is open
    std::atomic_bool stop_acked{false}; // peer confirmed the end of a cancelled stream
    std::atomic_bool ended{false}; // watch() has returned
};

using ChangeSink = std::function<void(ChangeNotice)>;

class IDocumentTransport
{
public:
    virtual ~IDocumentTransport() = default;

    virtual coro::task<UnaryResult> get(CallContext ctx, std::string path) = 0;
    virtual coro::task<UnaryResult> set(CallContext ctx, std::string path, Document doc) = 0;
    virtual coro::task<UnaryResult> del(CallContext ctx, std::string path) = 0;

    // Delivers the current snapshot, then every change, to `sink` until the
    // stream is cancelled (returns no error) or ends abnormally.
    virtual coro::task<Error> watch(CallContext ctx, std::string path, std::shared_ptr<WatchControl> ctl, ChangeSink sink) = 0;

    // Cancels the stream and waits until it has ended. OK only once the peer
    // has acknowledged the stop, whichever side sent it.
    virtual coro::task<Error> stop_watch(CallContext ctx, std::shared_ptr<WatchControl> ctl) = 0;
};

} // namespace firetick::rpc
