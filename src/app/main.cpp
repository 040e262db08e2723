// SPDX-License-Identifier: Apache-2.0
// firetick demo host: a fixed-tick loop that signs in through one provider,
// watches the player's document and bumps a click counter every few seconds.
#include "app/metrics_http.hpp"
#include "client/client.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "rpc/document_server.hpp"

#include <coro/default_executor.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#ifndef FIRETICK_VERSION
#define FIRETICK_VERSION "dev"
#endif

namespace firetick {
std::atomic_bool g_shutdown{false};
} // namespace firetick

static void handle_signal(int)
{
    firetick::g_shutdown.store(true);
}

namespace {

struct DemoState
{
    std::string player_path;
    int64_t clicks{0};
    std::chrono::steady_clock::time_point next_click{};
    bool watching{false};
};

firetick::Document click_document(int64_t clicks, const std::string &name)
{
    firetick::Document doc;
    (*doc.mutable_fields())["clicks"].set_integer_value(clicks);
    (*doc.mutable_fields())["display_name"].set_string_value(name);
    return doc;
}

void on_event(firetick::Client &client, DemoState &demo, const firetick::BridgeEvent &ev)
{
    using namespace firetick;
    if (auto *tu = std::get_if<TokenUpdated>(&ev)) {
        std::string uid = tu->token.identity && !tu->token.identity->subject.empty() ? tu->token.identity->subject
                                                                                     : std::string("anonymous");
        log::info("[demo] signed in via {} as {}", tu->token.provider, uid);
        std::string path = "players/" + uid;
        if (path != demo.player_path || !demo.watching) {
            demo.player_path = path;
            client.watch(path);
            demo.watching = true;
        }
        demo.next_click = std::chrono::steady_clock::now();
    } else if (auto *af = std::get_if<AuthFailed>(&ev)) {
        log::warn("[demo] auth failed for {}: {} {}", af->provider, to_string(af->error.code), af->error.detail);
        if (af->stage == AuthStage::refresh)
            demo.watching = false;
    } else if (auto *gone = std::get_if<AccountDeleted>(&ev)) {
        log::info("[demo] account deleted at {}", gone->provider);
    } else if (auto *url = std::get_if<AuthUrlReady>(&ev)) {
        log::info("[demo] sign in again with {}: {}", url->provider, url->url);
    } else if (auto *lo = std::get_if<LoggedOut>(&ev)) {
        log::info("[demo] logged out of {}", lo->provider);
        demo.watching = false;
    } else if (auto *dc = std::get_if<DocumentChanged>(&ev)) {
        if (dc->payload) {
            auto it = dc->payload->fields().find("clicks");
            if (it != dc->payload->fields().end())
                demo.clicks = it->second.integer_value();
        }
        log::info("[demo] {} v{} clicks={}", dc->path, dc->version, demo.clicks);
    } else if (auto *rr = std::get_if<RpcResult>(&ev)) {
        if (rr->error) {
            log::warn("[demo] call {} failed: {} {}", rr->handle, to_string(rr->error.code), rr->error.detail);
            if (rr->error.code == ErrorCode::stream_dropped)
                demo.watching = false;
        }
    }
}

} // namespace

int main(int argc, char **argv)
{
    std::string config_path = "config/firetick.yaml";
    std::string provider;
    int duration_override_sec = 0; // 0 means run until signal
    int emulator_port_override = -1;
    uint16_t metrics_port_override = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--provider" && i + 1 < argc) {
            provider = argv[++i];
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                firetick::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--emulator-port" && i + 1 < argc) {
            if (auto p = firetick::parse_port(argv[++i]))
                emulator_port_override = *p;
            else
                firetick::log::warn("Invalid --emulator-port value '{}', ignoring", argv[i]);
        } else if (a == "--metrics-port" && i + 1 < argc) {
            if (auto p = firetick::parse_port(argv[++i]))
                metrics_port_override = *p;
            else
                firetick::log::warn("Invalid --metrics-port value '{}', ignoring", argv[i]);
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    firetick::Config cfg;
    try {
        cfg = firetick::load_config(config_path);
    } catch (const std::exception &ex) {
        firetick::log::error("Failed to load config: {}", ex.what());
        return 1;
    }
    if (emulator_port_override >= 0)
        cfg.emulator_port = static_cast<uint16_t>(emulator_port_override);
    if (metrics_port_override != 0)
        cfg.metrics_port = metrics_port_override;

    // Do not override an explicit external setting.
    if (!cfg.log_level.empty() && std::getenv("FIRETICK_LOG_LEVEL") == nullptr) {
        setenv("FIRETICK_LOG_LEVEL", cfg.log_level.c_str(), 1);
    }
    if (cfg.log_json) {
        setenv("FIRETICK_LOG_JSON", "1", 1);
    }
    firetick::log::init();
    firetick::log::info("firetick demo starting (version: {})", FIRETICK_VERSION);
    firetick::log::info("Tick rate: {} Hz, redirect port {}", cfg.tick_rate, cfg.redirect_port);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto scheduler = coro::default_executor::io_executor();
    std::unique_ptr<firetick::rpc::DocumentServer> emulator;
    try {
        if (cfg.emulator_port != 0) {
            emulator = std::make_unique<firetick::rpc::DocumentServer>(
                scheduler, cfg.emulator_port, std::make_shared<firetick::rpc::DocumentStore>());
            emulator->start();
            if (cfg.document_endpoint == "memory")
                cfg.document_endpoint = "127.0.0.1:" + std::to_string(cfg.emulator_port);
        }
    } catch (const std::exception &ex) {
        firetick::log::error("Failed to start document emulator: {}", ex.what());
        return 1;
    }
    if (cfg.metrics_port != 0) {
        scheduler->spawn(firetick::net::run_metrics_endpoint(scheduler, cfg.metrics_port, firetick::g_shutdown));
    }

    std::unique_ptr<firetick::Client> client;
    try {
        firetick::ClientDeps deps;
        deps.scheduler = scheduler;
        deps.opener = [](const std::string &p, const std::string &url) {
            firetick::log::info("[demo] open this URL to sign in with {}: {}", p, url);
        };
        client = std::make_unique<firetick::Client>(cfg, std::move(deps));
    } catch (const std::exception &ex) {
        firetick::log::error("Startup failed: {}", ex.what());
        return 1;
    }

    if (!provider.empty()) {
        auto r = client->start_flow(provider);
        if (!r.ok) {
            firetick::log::error("Cannot start sign-in: {} {}", to_string(r.error.code), r.error.detail);
            return 1;
        }
    } else {
        firetick::log::info("No --provider given; available: {}", client->providers().size());
    }

    DemoState demo;
    const auto tick = std::chrono::microseconds(1000000 / cfg.tick_rate);
    auto next_tick = std::chrono::steady_clock::now();
    auto run_start = next_tick;
    auto &counters = firetick::net::ticks();
    while (!firetick::g_shutdown.load()) {
        auto events = client->poll_events();
        counters.ticks.fetch_add(1, std::memory_order_relaxed);
        counters.events.fetch_add(events.size(), std::memory_order_relaxed);
        for (const auto &ev : events)
            on_event(*client, demo, ev);

        auto now = std::chrono::steady_clock::now();
        if (demo.watching && client->tokens().live() && now >= demo.next_click) {
            auto id = client->current_identity();
            client->set(demo.player_path, click_document(demo.clicks + 1, id ? id->display_name : std::string()));
            demo.next_click = now + std::chrono::seconds(3);
        }
        if (duration_override_sec > 0
            && std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count() >= duration_override_sec) {
            firetick::log::info("Duration reached ({}s); initiating shutdown", duration_override_sec);
            firetick::g_shutdown.store(true);
        }

        next_tick += tick;
        now = std::chrono::steady_clock::now();
        if (next_tick > now) {
            std::this_thread::sleep_until(next_tick);
        } else {
            counters.tick_overruns.fetch_add(1, std::memory_order_relaxed);
            next_tick = now;
        }
    }
    firetick::log::info("Shutting down");
    client.reset();
    emulator.reset();
    return 0;
}
