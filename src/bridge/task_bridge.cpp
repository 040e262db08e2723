// SPDX-License-Identifier: Apache-2.0
#include "bridge/task_bridge.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/default_executor.hpp>

#include <algorithm>

namespace firetick {

const char *event_name(const BridgeEvent &ev) noexcept
{
    switch (ev.index()) {
        case 0:
            return "TokenUpdated";
        case 1:
            return "AuthFailed";
        case 2:
            return "RpcResult";
        case 3:
            return "DocumentChanged";
        case 4:
            return "AuthUrlReady";
        case 5:
            return "LoggedOut";
        case 6:
            return "AccountDeleted";
        default:
            return "unknown";
    }
}

} // namespace firetick

namespace firetick::bridge {

std::shared_ptr<TaskBridge> TaskBridge::create(std::shared_ptr<coro::io_scheduler> scheduler)
{
    if (!scheduler)
        scheduler = coro::default_executor::io_executor();
    return std::shared_ptr<TaskBridge>(new TaskBridge(std::move(scheduler)));
}

TaskBridge::TaskBridge(std::shared_ptr<coro::io_scheduler> scheduler)
    : m_scheduler(std::move(scheduler))
    , m_blocking(coro::io_scheduler::make_shared())
{
}

TaskBridge::~TaskBridge()
{
    close();
}

bool TaskBridge::submit(coro::task<void> work)
{
    if (closed())
        return false;
    metrics::bridge().submitted.fetch_add(1, std::memory_order_relaxed);
    return m_scheduler->spawn(std::move(work));
}

void TaskBridge::post(BridgeEvent ev)
{
    if (closed()) {
        log::debug("[bridge] closed, dropping {}", event_name(ev));
        return;
    }
    size_t depth;
    {
        std::scoped_lock lk(m_mutex);
        m_queue.push_back(std::move(ev));
        depth = m_queue.size();
    }
    metrics::bridge().posted.fetch_add(1, std::memory_order_relaxed);
    metrics::note_queue_depth(depth);
}

std::vector<BridgeEvent> TaskBridge::drain()
{
    std::vector<BridgeEvent> out;
    {
        std::scoped_lock lk(m_mutex);
        if (m_queue.empty())
            return out;
        out.reserve(m_queue.size());
        std::move(m_queue.begin(), m_queue.end(), std::back_inserter(out));
        m_queue.clear();
    }
    auto &b = metrics::bridge();
    b.drains.fetch_add(1, std::memory_order_relaxed);
    b.drained_events.fetch_add(out.size(), std::memory_order_relaxed);
    metrics::note_queue_depth(0);
    return out;
}

size_t TaskBridge::pending() const
{
    std::scoped_lock lk(m_mutex);
    return m_queue.size();
}

void TaskBridge::close() noexcept
{
    m_closed.store(true, std::memory_order_release);
}

void TaskBridge::schedule_after(
    std::chrono::milliseconds delay, std::function<void()> fn, std::function<bool()> still_wanted)
{
    auto due = std::chrono::steady_clock::now() + std::max(delay, std::chrono::milliseconds(0));
    submit(delayed(shared_from_this(), due, std::move(fn), std::move(still_wanted)));
}

coro::task<void> TaskBridge::delayed(std::shared_ptr<TaskBridge> self, std::chrono::steady_clock::time_point due,
    std::function<void()> fn, std::function<bool()> still_wanted)
{
    co_await self->m_scheduler->schedule();
    while (true) {
        if (self->closed() || (still_wanted && !still_wanted()))
            co_return;
        auto now = std::chrono::steady_clock::now();
        if (now >= due)
            break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(due - now);
        co_await self->m_scheduler->yield_for(std::min(left, k_wait_slice));
    }
    fn();
    co_return;
}

} // namespace firetick::bridge
