// SPDX-License-Identifier: Apache-2.0
// framed_transport.hpp
// Document transport over one TCP connection carrying length-prefixed
// DocRequest / DocResponse messages. Every unary call and watch stream is
// multiplexed by call_id. Only connection_loop() touches the socket; callers
// exchange messages with it through mutex-protected queues.
#pragma once

#include "rpc/document_transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace firetick::rpc {

class FramedDocumentTransport : public IDocumentTransport,
                                public std::enable_shared_from_this<FramedDocumentTransport>
{
public:
    static std::shared_ptr<FramedDocumentTransport> create(std::shared_ptr<coro::io_scheduler> scheduler,
        std::string host, uint16_t port, std::chrono::milliseconds call_timeout = std::chrono::seconds(10));

    ~FramedDocumentTransport() override;

    // Spawns the connection loop (connects and reconnects on demand).
    void start();
    void stop() noexcept { m_stop.store(true); }
    bool connected() const noexcept { return m_connected.load(); }

    coro::task<UnaryResult> get(CallContext ctx, std::string path) override;
    coro::task<UnaryResult> set(CallContext ctx, std::string path, Document doc) override;
    coro::task<UnaryResult> del(CallContext ctx, std::string path) override;
    coro::task<Error> watch(CallContext ctx, std::string path, std::shared_ptr<WatchControl> ctl, ChangeSink sink) override;
    coro::task<Error> stop_watch(CallContext ctx, std::shared_ptr<WatchControl> ctl) override;

private:
    FramedDocumentTransport(std::shared_ptr<coro::io_scheduler> scheduler, std::string host, uint16_t port,
        std::chrono::milliseconds call_timeout);

    struct PendingCall
    {
        bool done{false};
        v1::DocResponse resp;
    };
    struct StreamInbox
    {
        std::deque<v1::DocResponse> items;
        bool closed{false};
    };

    uint64_t enqueue(v1::DocRequest &req, bool stream);
    coro::task<UnaryResult> unary(v1::DocRequest req);
    void dispatch(v1::DocResponse resp);
    void fail_all(const std::string &why);
    static coro::task<void> connection_loop(std::shared_ptr<FramedDocumentTransport> self);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::string m_host;
    uint16_t m_port;
    std::chrono::milliseconds m_call_timeout;

    std::mutex m_mutex;
    std::string m_outbound; // framed bytes waiting for the connection loop
    std::map<uint64_t, PendingCall> m_calls;
    std::map<uint64_t, StreamInbox> m_streams;
    std::atomic<uint64_t> m_next_id{1};
    std::atomic_bool m_stop{false};
    std::atomic_bool m_connected{false};
    std::atomic_bool m_started{false};
};

} // namespace firetick::rpc
