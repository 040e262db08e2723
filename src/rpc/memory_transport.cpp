// SPDX-License-Identifier: Apache-2.0
#include "rpc/memory_transport.hpp"

#include "common/logger.hpp"
#include "rpc/document_path.hpp"

#include <deque>

namespace firetick::rpc {

namespace {
constexpr std::string_view k_bearer_prefix = "Bearer ";
constexpr auto k_stop_wait = std::chrono::seconds(2);

struct ChangeQueue
{
    std::mutex mutex;
    std::deque<DocumentStore::Change> items;
};
} // namespace

bool BearerPolicy::accepts(const std::string &authorization) const
{
    if (authorization.size() <= k_bearer_prefix.size()
        || authorization.compare(0, k_bearer_prefix.size(), k_bearer_prefix) != 0)
        return false;
    std::scoped_lock lk(m_mutex);
    return m_rejected.count(authorization.substr(k_bearer_prefix.size())) == 0;
}

void BearerPolicy::reject(std::string access_token)
{
    std::scoped_lock lk(m_mutex);
    m_rejected.insert(std::move(access_token));
}

void BearerPolicy::allow(const std::string &access_token)
{
    std::scoped_lock lk(m_mutex);
    m_rejected.erase(access_token);
}

MemoryDocumentTransport::MemoryDocumentTransport(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<DocumentStore> store)
    : m_scheduler(std::move(scheduler))
    , m_store(std::move(store))
{
}

bool MemoryDocumentTransport::take_failure() noexcept
{
    uint32_t n = m_fail_next.load();
    while (n > 0) {
        if (m_fail_next.compare_exchange_weak(n, n - 1))
            return true;
    }
    return false;
}

coro::task<UnaryResult> MemoryDocumentTransport::get(CallContext ctx, std::string path)
{
    co_await m_scheduler->schedule();
    UnaryResult r;
    if (take_failure()) {
        r.error = make_error(ErrorCode::transient_rpc_failure, "injected");
        co_return r;
    }
    if (!m_policy.accepts(ctx.authorization)) {
        r.error = make_error(ErrorCode::unauthenticated, "credential rejected");
        co_return r;
    }
    r.document = m_store->get(path);
    if (!r.document)
        r.error = make_error(ErrorCode::not_found, path);
    co_return r;
}

coro::task<UnaryResult> MemoryDocumentTransport::set(CallContext ctx, std::string path, Document doc)
{
    co_await m_scheduler->schedule();
    UnaryResult r;
    if (take_failure()) {
        r.error = make_error(ErrorCode::transient_rpc_failure, "injected");
        co_return r;
    }
    if (!m_policy.accepts(ctx.authorization)) {
        r.error = make_error(ErrorCode::unauthenticated, "credential rejected");
        co_return r;
    }
    r.document = m_store->set(path, std::move(doc), document_name(ctx.database, path));
    co_return r;
}

coro::task<UnaryResult> MemoryDocumentTransport::del(CallContext ctx, std::string path)
{
    co_await m_scheduler->schedule();
    UnaryResult r;
    if (take_failure()) {
        r.error = make_error(ErrorCode::transient_rpc_failure, "injected");
        co_return r;
    }
    if (!m_policy.accepts(ctx.authorization)) {
        r.error = make_error(ErrorCode::unauthenticated, "credential rejected");
        co_return r;
    }
    m_store->del(path);
    co_return r;
}

coro::task<Error> MemoryDocumentTransport::watch(
    CallContext ctx, std::string path, std::shared_ptr<WatchControl> ctl, ChangeSink sink)
{
    co_await m_scheduler->schedule();
    ctl->call_id.store(m_next_stream.fetch_add(1));
    if (take_failure()) {
        ctl->ended.store(true);
        co_return make_error(ErrorCode::transient_rpc_failure, "injected");
    }
    if (!m_policy.accepts(ctx.authorization)) {
        ctl->ended.store(true);
        co_return make_error(ErrorCode::unauthenticated, "credential rejected");
    }

    auto queue = std::make_shared<ChangeQueue>();
    uint64_t sub = m_store->subscribe(path, [queue](const DocumentStore::Change &c) {
        std::scoped_lock lk(queue->mutex);
        queue->items.push_back(c);
    });
    uint64_t drop_epoch = m_drop_epoch.load();
    log::debug("[rpc] memory watch open {}", path);

    Error result;
    while (true) {
        if (ctl->cancelled.load()) {
            ctl->stop_acked.store(true);
            break;
        }
        if (m_drop_epoch.load() != drop_epoch) {
            result = make_error(ErrorCode::stream_dropped, "stream reset");
            break;
        }
        std::deque<DocumentStore::Change> batch;
        {
            std::scoped_lock lk(queue->mutex);
            batch.swap(queue->items);
        }
        for (auto &c : batch) {
            if (ctl->cancelled.load())
                break;
            sink(ChangeNotice{std::move(c.document), c.version});
        }
        if (batch.empty())
            co_await m_scheduler->yield_for(std::chrono::milliseconds(5));
    }
    m_store->unsubscribe(sub);
    ctl->ended.store(true);
    log::debug("[rpc] memory watch closed {} ({})", path, to_string(result.code));
    co_return result;
}

coro::task<Error> MemoryDocumentTransport::stop_watch(CallContext ctx, std::shared_ptr<WatchControl> ctl)
{
    co_await m_scheduler->schedule();
    (void)ctx;
    ctl->cancelled.store(true);
    ctl->stop_sent.store(true);
    auto deadline = std::chrono::steady_clock::now() + k_stop_wait;
    while (!ctl->ended.load()) {
        if (std::chrono::steady_clock::now() >= deadline)
            co_return make_error(ErrorCode::transient_rpc_failure, "watch stop not acknowledged");
        co_await m_scheduler->yield_for(std::chrono::milliseconds(2));
    }
    co_return Error{};
}

} // namespace firetick::rpc
