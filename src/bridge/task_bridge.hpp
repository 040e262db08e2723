// SPDX-License-Identifier: Apache-2.0
// task_bridge.hpp
// Runs network work on a libcoro io_scheduler and hands completions back to the
// host tick through one ordered queue. The queue mutex is the only point where
// background and host threads meet.
#pragma once

#include "bridge/bridge_event.hpp"

#include <coro/coro.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace firetick::bridge {

class TaskBridge : public std::enable_shared_from_this<TaskBridge>
{
public:
    // Uses the process-wide io executor when no scheduler is supplied.
    static std::shared_ptr<TaskBridge> create(std::shared_ptr<coro::io_scheduler> scheduler = nullptr);

    ~TaskBridge();
    TaskBridge(const TaskBridge &) = delete;
    TaskBridge &operator=(const TaskBridge &) = delete;

    const std::shared_ptr<coro::io_scheduler> &scheduler() const noexcept { return m_scheduler; }

    // Threads for calls that block (libcurl easy handles). A coroutine hops
    // here for the call and back to scheduler() before touching shared state,
    // so sockets, streams and timers never wait behind a slow HTTP peer.
    const std::shared_ptr<coro::io_scheduler> &blocking_scheduler() const noexcept { return m_blocking; }

    // Hands a coroutine to the background scheduler. Never blocks, never runs
    // the work inline. Returns false once the bridge is closed.
    bool submit(coro::task<void> work);

    // Background side: enqueue a completion for the next drain(). Dropped after close().
    void post(BridgeEvent ev);

    // Host side: everything posted since the previous drain, in post order.
    // An empty queue yields an empty vector and touches nothing else.
    std::vector<BridgeEvent> drain();

    // Runs `fn` on the background scheduler once `delay` has elapsed, unless
    // `still_wanted` (checked on every wake) turns false or the bridge closes
    // first. The wait sleeps in short slices so shutdown never waits out a
    // long timer.
    void schedule_after(
        std::chrono::milliseconds delay, std::function<void()> fn, std::function<bool()> still_wanted = {});

    size_t pending() const;

    // Stops accepting work and events; outstanding waits exit at their next slice.
    void close() noexcept;
    bool closed() const noexcept { return m_closed.load(std::memory_order_acquire); }

private:
    explicit TaskBridge(std::shared_ptr<coro::io_scheduler> scheduler);

    static coro::task<void> delayed(std::shared_ptr<TaskBridge> self, std::chrono::steady_clock::time_point due,
        std::function<void()> fn, std::function<bool()> still_wanted);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::shared_ptr<coro::io_scheduler> m_blocking;
    mutable std::mutex m_mutex;
    std::deque<BridgeEvent> m_queue;
    std::atomic_bool m_closed{false};
};

// Slice used by every cancellable background wait.
inline constexpr std::chrono::milliseconds k_wait_slice{50};

} // namespace firetick::bridge
