// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters (atomics, no dynamic allocation). Written from both the
// host tick and background coroutines; readers tolerate relaxed ordering.
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace firetick::metrics {

struct AuthCounters
{
    std::atomic<uint64_t> flows_started{0};
    std::atomic<uint64_t> redirects_accepted{0};
    std::atomic<uint64_t> redirects_rejected{0};
    std::atomic<uint64_t> stray_redirects{0};
    std::atomic<uint64_t> code_exchanges{0};
    std::atomic<uint64_t> refreshes{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> discarded_results{0}; // completions dropped after logout / supersede
};

struct RpcCounters
{
    std::atomic<uint64_t> calls{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> local_rejects{0}; // Unauthenticated / InvalidPath before sending
    std::atomic<uint64_t> changes_delivered{0};
    std::atomic<uint64_t> changes_dropped{0}; // arrived for a stopped / superseded handle
    std::atomic<uint64_t> active_watches{0};
    std::atomic<uint64_t> streams_dropped{0};
};

struct BridgeCounters
{
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> posted{0};
    std::atomic<uint64_t> drains{0};
    std::atomic<uint64_t> drained_events{0};
    std::atomic<uint64_t> queue_depth{0};
    std::atomic<uint64_t> queue_depth_peak{0};
};

inline AuthCounters &auth()
{
    static AuthCounters inst;
    return inst;
}

inline RpcCounters &rpc()
{
    static RpcCounters inst;
    return inst;
}

inline BridgeCounters &bridge()
{
    static BridgeCounters inst;
    return inst;
}

inline void note_queue_depth(uint64_t depth)
{
    auto &b = bridge();
    b.queue_depth.store(depth, std::memory_order_relaxed);
    uint64_t prev = b.queue_depth_peak.load(std::memory_order_relaxed);
    while (depth > prev && !b.queue_depth_peak.compare_exchange_weak(prev, depth, std::memory_order_relaxed)) {
        // retry
    }
}

// Prometheus text exposition of every counter above.
inline std::string render_prometheus()
{
    std::ostringstream oss;
    auto line = [&](const char *name, const char *type, const std::atomic<uint64_t> &v) {
        oss << "# TYPE " << name << ' ' << type << '\n' << name << ' ' << v.load(std::memory_order_relaxed) << '\n';
    };
    auto &a = auth();
    line("firetick_auth_flows_started", "counter", a.flows_started);
    line("firetick_auth_redirects_accepted", "counter", a.redirects_accepted);
    line("firetick_auth_redirects_rejected", "counter", a.redirects_rejected);
    line("firetick_auth_stray_redirects", "counter", a.stray_redirects);
    line("firetick_auth_code_exchanges", "counter", a.code_exchanges);
    line("firetick_auth_refreshes", "counter", a.refreshes);
    line("firetick_auth_failures", "counter", a.failures);
    line("firetick_auth_discarded_results", "counter", a.discarded_results);
    auto &r = rpc();
    line("firetick_rpc_calls", "counter", r.calls);
    line("firetick_rpc_failures", "counter", r.failures);
    line("firetick_rpc_retries", "counter", r.retries);
    line("firetick_rpc_local_rejects", "counter", r.local_rejects);
    line("firetick_rpc_changes_delivered", "counter", r.changes_delivered);
    line("firetick_rpc_changes_dropped", "counter", r.changes_dropped);
    line("firetick_rpc_active_watches", "gauge", r.active_watches);
    line("firetick_rpc_streams_dropped", "counter", r.streams_dropped);
    auto &b = bridge();
    line("firetick_bridge_submitted", "counter", b.submitted);
    line("firetick_bridge_posted", "counter", b.posted);
    line("firetick_bridge_drains", "counter", b.drains);
    line("firetick_bridge_drained_events", "counter", b.drained_events);
    line("firetick_bridge_queue_depth", "gauge", b.queue_depth);
    line("firetick_bridge_queue_depth_peak", "gauge", b.queue_depth_peak);
    return oss.str();
}

} // namespace firetick::metrics
