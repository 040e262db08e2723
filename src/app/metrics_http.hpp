// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format endpoint (GET /metrics) for the demo host.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace firetick::net {

// Host loop counters exported next to the library metrics.
struct TickCounters
{
    std::atomic<uint64_t> ticks{0};
    std::atomic<uint64_t> events{0};
    std::atomic<uint64_t> tick_overruns{0};
};

TickCounters &ticks();

// Runs until `stop` becomes true.
coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, const std::atomic_bool &stop);

} // namespace firetick::net
