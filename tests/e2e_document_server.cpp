// SPDX-License-Identifier: Apache-2.0
// RpcSession over the framed TCP transport against the local document emulator.
#include "rpc/document_server.hpp"
#include "rpc/framed_transport.hpp"
#include "rpc/rpc_session.hpp"
#include "test_support.hpp"

#include <coro/coro.hpp>

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;
using namespace firetick;
using namespace firetick::rpc;

namespace {

constexpr uint16_t k_port = 41090;

Document score(int64_t n)
{
    Document d;
    (*d.mutable_fields())["score"].set_integer_value(n);
    (*d.mutable_fields())["name"].set_string_value("ada");
    return d;
}

void sign_in(auth::TokenStore &tokens, RpcSession &session, const std::string &access)
{
    auth::Token t;
    t.provider = "google";
    t.access_token = access;
    t.expires_at = auth::Clock::now() + 1h;
    tokens.replace(std::move(t));
    session.on_token_updated();
}

coro::task<void> run_watch(std::shared_ptr<FramedDocumentTransport> transport, CallContext ctx,
    std::shared_ptr<WatchControl> ctl, std::atomic_int &notices, std::atomic_bool &ok)
{
    auto err = co_await transport->watch(
        std::move(ctx), "leaderboard/ada", std::move(ctl), [&notices](ChangeNotice) { notices.fetch_add(1); });
    ok.store(!err);
    co_return;
}

} // namespace

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    auto store = std::make_shared<DocumentStore>();
    auto server = std::make_unique<DocumentServer>(sched, k_port, store);
    server->start();

    auto bridge = bridge::TaskBridge::create(sched);
    auto transport = FramedDocumentTransport::create(sched, "127.0.0.1", k_port, 2s);
    transport->start();
    auth::TokenStore tokens;
    SessionOptions opts;
    opts.project_id = "arena";
    RpcSession session(bridge, transport, tokens, opts);

    auto pump = [&](const std::function<bool(const std::vector<BridgeEvent> &)> &done) {
        return test::poll_until(
            [&] {
                std::vector<BridgeEvent> out;
                for (auto &ev : bridge->drain())
                    session.accept(std::move(ev), out);
                return out;
            },
            done, 5s);
    };
    auto wait_result = [&](RpcHandle h) {
        auto evs = pump([h](const std::vector<BridgeEvent> &all) { return test::result_for(all, h) != nullptr; });
        auto *r = test::result_for(evs, h);
        assert(r);
        return *r;
    };

    sign_in(tokens, session, "tok1");

    // Unary calls over the wire
    auto set = wait_result(session.set("leaderboard/ada", score(10)));
    assert(set.ok());
    assert(transport->connected());
    assert(set.payload && set.payload->version() == 1);
    assert(set.payload->name() == "projects/arena/databases/(default)/documents/leaderboard/ada");
    assert(store->get("leaderboard/ada")->fields().at("score").integer_value() == 10);

    auto got = wait_result(session.get("leaderboard/ada"));
    assert(got.ok() && got.payload->fields().at("name").string_value() == "ada");
    assert(wait_result(session.get("leaderboard/bob")).error.code == ErrorCode::not_found);

    // Watch stream: initial snapshot then live changes
    auto w = session.watch("leaderboard/ada");
    auto evs = pump([w](const std::vector<BridgeEvent> &all) {
        return test::find_event<DocumentChanged>(all, [w](const DocumentChanged &c) { return c.handle == w; }) != nullptr;
    });
    assert(test::find_event<DocumentChanged>(evs)->version == 1);
    store->set("leaderboard/ada", score(11), "external");
    evs = pump([w](const std::vector<BridgeEvent> &all) {
        return test::find_event<DocumentChanged>(all, [w](const DocumentChanged &c) { return c.version == 2; }) != nullptr;
    });
    auto *ch = test::find_event<DocumentChanged>(evs, [](const DocumentChanged &c) { return c.version == 2; });
    assert(ch->payload && ch->payload->fields().at("score").integer_value() == 11);

    auto stop = session.unwatch("leaderboard/ada");
    assert(wait_result(stop).ok());
    // The server unsubscribes before it acknowledges
    assert(store->listeners() == 0);

    // Rejected credential: the call waits for the next token and is resent
    server->policy().reject("tok1");
    auto h = session.del("leaderboard/ada");
    pump([&](const std::vector<BridgeEvent> &) { return session.parked() == 1; });
    assert(session.parked() == 1);
    assert(store->get("leaderboard/ada"));
    sign_in(tokens, session, "tok2");
    assert(wait_result(h).ok());
    assert(!store->get("leaderboard/ada"));

    // Stop already sent by the stream itself: stop_watch reports the server's STREAM_END
    {
        CallContext ctx{"Bearer tok2", "projects/arena/databases/(default)"};
        auto ctl = std::make_shared<WatchControl>();
        std::atomic_int notices{0};
        std::atomic_bool watch_ok{false};
        sched->spawn(run_watch(transport, ctx, ctl, notices, watch_ok));
        auto deadline = std::chrono::steady_clock::now() + 3s;
        while ((ctl->call_id.load() == 0 || notices.load() == 0) && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(5ms);
        assert(notices.load() == 1);
        assert(store->listeners() == 1);
        ctl->cancelled.store(true);
        while (!ctl->stop_sent.load() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(5ms);
        assert(ctl->stop_sent.load());
        auto stopped = coro::sync_wait(transport->stop_watch(ctx, ctl));
        assert(!stopped);
        assert(ctl->stop_acked.load());
        assert(ctl->ended.load());
        assert(watch_ok.load());
        assert(store->listeners() == 0);
    }

    // Server going away ends the stream with StreamDropped
    auto w2 = session.watch("leaderboard/ada");
    pump([w2](const std::vector<BridgeEvent> &all) {
        return test::find_event<DocumentChanged>(all, [w2](const DocumentChanged &c) { return c.handle == w2; }) != nullptr;
    });
    server.reset();
    auto dropped = wait_result(w2);
    assert(dropped.error.code == ErrorCode::stream_dropped);
    assert(session.active_watches() == 0);

    // No server: calls time out as transient, retried once, then reported
    auto lost = wait_result(session.get("leaderboard/ada"));
    assert(lost.error.code == ErrorCode::transient_rpc_failure);

    transport->stop();
    bridge->close();
    test::settle();
    std::cout << "e2e_document_server OK" << std::endl;
    return 0;
}
