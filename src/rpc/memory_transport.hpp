// SPDX-License-Identifier: Apache-2.0
// memory_transport.hpp
// In-process document transport over a DocumentStore. Used when no document
// server is configured, and by tests to script credential rejection and
// transient failures.
#pragma once

#include "rpc/document_store.hpp"
#include "rpc/document_transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace firetick::rpc {

// Checks a "Bearer <token>" header against a reject list. Shared by the
// in-process transport and the emulator server.
class BearerPolicy
{
public:
    bool accepts(const std::string &authorization) const;
    void reject(std::string access_token);
    void allow(const std::string &access_token);

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_rejected;
};

class MemoryDocumentTransport : public IDocumentTransport
{
public:
    MemoryDocumentTransport(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<DocumentStore> store);

    coro::task<UnaryResult> get(CallContext ctx, std::string path) override;
    coro::task<UnaryResult> set(CallContext ctx, std::string path, Document doc) override;
    coro::task<UnaryResult> del(CallContext ctx, std::string path) override;
    coro::task<Error> watch(CallContext ctx, std::string path, std::shared_ptr<WatchControl> ctl, ChangeSink sink) override;
    coro::task<Error> stop_watch(CallContext ctx, std::shared_ptr<WatchControl> ctl) override;

    const std::shared_ptr<DocumentStore> &store() const noexcept { return m_store; }
    BearerPolicy &policy() noexcept { return m_policy; }

    // The next `n` calls fail with TransientRpcFailure before touching the store.
    void fail_next(uint32_t n) noexcept { m_fail_next.store(n); }
    // Ends every open watch stream with StreamDropped.
    void drop_streams() noexcept { m_drop_epoch.fetch_add(1); }

private:
    bool take_failure() noexcept;

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::shared_ptr<DocumentStore> m_store;
    BearerPolicy m_policy;
    std::atomic<uint32_t> m_fail_next{0};
    std::atomic<uint64_t> m_drop_epoch{0};
    std::atomic<uint64_t> m_next_stream{1};
};

} // namespace firetick::rpc
