// SPDX-License-Identifier: Apache-2.0
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

int main()
{
    using namespace firetick;
    assert(log::detail::format("a {} b {}", 1, "x") == "a 1 b x");
    assert(log::detail::format("{} only", std::string("s"), 2) == "s only 2");
    assert(log::detail::format("{} {}", true) == "true {}");
    assert(log::fingerprint("") == "<none>");
    assert(log::fingerprint("ya29.secret-value") == "ya29..(17)");

    std::mutex mu;
    std::vector<std::string> seen;
    log::set_callback([&](log::level lv, const std::string &msg) {
        std::scoped_lock lk(mu);
        if (lv >= log::level::warn)
            seen.push_back(msg);
    });
    log::set_level("warn");
    assert(!log::enabled(log::level::info));
    log::info("hidden {}", 1);
    log::warn("[auth] {} failed: {}", "google", to_string(ErrorCode::state_mismatch));
    for (int i = 0; i < 200; ++i) {
        {
            std::scoped_lock lk(mu);
            if (!seen.empty())
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    {
        std::scoped_lock lk(mu);
        assert(seen.size() == 1);
        assert(seen[0] == "[auth] google failed: StateMismatch");
    }
    log::set_callback({});

    auto err = make_error(ErrorCode::not_found, "players/x");
    assert(err && err.code == ErrorCode::not_found);
    assert(!Error{});

    metrics::note_queue_depth(7);
    metrics::note_queue_depth(3);
    assert(metrics::bridge().queue_depth.load() == 3);
    assert(metrics::bridge().queue_depth_peak.load() >= 7);
    metrics::rpc().calls.fetch_add(2);
    auto text = metrics::render_prometheus();
    assert(text.find("# TYPE firetick_rpc_calls counter\nfiretick_rpc_calls 2\n") != std::string::npos);
    assert(text.find("# TYPE firetick_rpc_active_watches gauge") != std::string::npos);
    assert(text.find("firetick_bridge_queue_depth 3\n") != std::string::npos);

    std::cout << "unit_logger_metrics OK" << std::endl;
    return 0;
}
