// SPDX-License-Identifier: Apache-2.0
// Document session over the in-process transport: bearer handling, retries,
// parking after rejection, result tagging, watch table and stale change filtering.
#include "common/metrics.hpp"
#include "rpc/memory_transport.hpp"
#include "rpc/rpc_session.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace firetick;
using namespace firetick::rpc;

namespace {

struct Harness
{
    std::shared_ptr<coro::io_scheduler> sched = coro::io_scheduler::make_shared();
    std::shared_ptr<bridge::TaskBridge> bridge = bridge::TaskBridge::create(sched);
    std::shared_ptr<DocumentStore> store = std::make_shared<DocumentStore>();
    std::shared_ptr<MemoryDocumentTransport> transport = std::make_shared<MemoryDocumentTransport>(sched, store);
    auth::TokenStore tokens;
    std::unique_ptr<RpcSession> session;

    explicit Harness(SessionOptions opts = {})
    {
        session = std::make_unique<RpcSession>(bridge, transport, tokens, opts);
    }

    std::vector<BridgeEvent> pump(const std::function<bool(const std::vector<BridgeEvent> &)> &done,
        std::chrono::milliseconds timeout = std::chrono::seconds(3))
    {
        return test::poll_until(
            [&] {
                std::vector<BridgeEvent> out;
                for (auto &ev : bridge->drain())
                    session->accept(std::move(ev), out);
                return out;
            },
            done, timeout);
    }

    RpcResult wait_result(RpcHandle h)
    {
        auto evs = pump([h](const std::vector<BridgeEvent> &all) { return test::result_for(all, h) != nullptr; });
        auto *r = test::result_for(evs, h);
        assert(r);
        return *r;
    }

    void sign_in(const std::string &access, std::chrono::seconds ttl = std::chrono::seconds(3600))
    {
        auth::Token t;
        t.provider = "google";
        t.access_token = access;
        t.expires_at = auth::Clock::now() + ttl;
        tokens.replace(std::move(t));
        session->on_token_updated();
    }

    ~Harness()
    {
        std::vector<BridgeEvent> ignored;
        session->drop_watches(ErrorCode::stream_dropped, ignored);
        bridge->close();
        test::settle();
    }
};

Document clicks(int64_t n)
{
    Document d;
    (*d.mutable_fields())["clicks"].set_integer_value(n);
    return d;
}

auto change_for(RpcHandle h, uint64_t version)
{
    return [h, version](const std::vector<BridgeEvent> &all) {
        return test::find_event<DocumentChanged>(all, [&](const DocumentChanged &c) {
            return c.handle == h && c.version == version;
        }) != nullptr;
    };
}

void test_local_rejections()
{
    Harness hx;
    auto h = hx.session->get("players/p1");
    auto r = hx.wait_result(h);
    assert(r.error.code == ErrorCode::unauthenticated);
    assert(hx.session->in_flight() == 0);

    hx.sign_in("tok1");
    auto bad = hx.session->get("players");
    auto bad_r = hx.wait_result(bad);
    assert(bad_r.error.code == ErrorCode::invalid_path);
    assert(bad_r.kind == CallKind::get && bad_r.path == "players");
    auto dots = hx.session->set("players/../admin", clicks(1));
    assert(hx.wait_result(dots).error.code == ErrorCode::invalid_path);
    assert(hx.store->size() == 0);

    // watch without a token never registers a subscription
    hx.tokens.clear();
    auto w = hx.session->watch("players/p1");
    assert(hx.wait_result(w).error.code == ErrorCode::unauthenticated);
    assert(!hx.session->subscription("players/p1"));
    assert(hx.session->unwatch("players/p1") == 0);
}

void test_unary_roundtrip()
{
    Harness hx;
    hx.sign_in("tok1");
    assert(hx.session->database() == "projects/demo-firetick/databases/(default)");

    auto s = hx.wait_result(hx.session->set("players/p1", clicks(1)));
    assert(s.ok());
    assert(s.kind == CallKind::set && s.path == "players/p1");
    assert(s.payload && s.payload->version() == 1);
    assert(s.payload->name() == "projects/demo-firetick/databases/(default)/documents/players/p1");

    auto g = hx.wait_result(hx.session->get("players/p1"));
    assert(g.ok() && g.payload);
    assert(g.payload->fields().at("clicks").integer_value() == 1);

    auto missing = hx.wait_result(hx.session->get("players/nobody"));
    assert(missing.error.code == ErrorCode::not_found);
    assert(missing.kind == CallKind::get && missing.path == "players/nobody");
    assert(!missing.payload);

    auto del = hx.wait_result(hx.session->del("players/p1"));
    assert(del.ok() && del.kind == CallKind::del);
    assert(hx.wait_result(hx.session->get("players/p1")).error.code == ErrorCode::not_found);

    // handles are never reused
    auto a = hx.session->get("players/p1");
    auto b = hx.session->get("players/p1");
    assert(b > a);
    hx.wait_result(b);
}

void test_watch_lifecycle()
{
    Harness hx;
    hx.sign_in("tok1");
    hx.wait_result(hx.session->set("rooms/r1", clicks(5)));

    auto w1 = hx.session->watch("rooms/r1");
    assert(hx.session->subscription("rooms/r1")->handle == w1);
    auto initial = hx.pump(change_for(w1, 1));
    auto *snap = test::find_event<DocumentChanged>(initial);
    assert(snap && snap->payload && snap->payload->fields().at("clicks").integer_value() == 5);

    hx.wait_result(hx.session->set("rooms/r1", clicks(6)));
    auto next = hx.pump(change_for(w1, 2));
    assert(test::find_event<DocumentChanged>(next, [](const DocumentChanged &c) { return c.version == 2; }));
    assert(hx.session->subscription("rooms/r1")->last_seen_version == 2);

    // A replayed older version is filtered out
    std::vector<BridgeEvent> out;
    hx.session->accept(DocumentChanged{"rooms/r1", w1, clicks(5), 1}, out);
    assert(out.empty());
    // So is a change tagged with a handle that is not the active one
    hx.session->accept(DocumentChanged{"rooms/r1", w1 + 1000, clicks(9), 9}, out);
    assert(out.empty());

    auto stop = hx.session->unwatch("rooms/r1");
    assert(stop != 0);
    assert(!hx.session->subscription("rooms/r1"));
    auto stopped = hx.wait_result(stop);
    assert(stopped.ok());
    assert(stopped.kind == CallKind::watch_stop && stopped.path == "rooms/r1");

    // Nothing from the old stream after unwatch
    hx.wait_result(hx.session->set("rooms/r1", clicks(7)));
    auto quiet = hx.pump([](const std::vector<BridgeEvent> &) { return false; }, std::chrono::milliseconds(200));
    assert(!test::find_event<DocumentChanged>(quiet));

    auto w2 = hx.session->watch("rooms/r1");
    assert(w2 != w1);
    auto again = hx.pump(change_for(w2, 3));
    assert(!test::find_event<DocumentChanged>(again, [w1](const DocumentChanged &c) { return c.handle == w1; }));

    // Watching the same path again replaces the subscription
    auto w3 = hx.session->watch("rooms/r1");
    assert(hx.session->subscription("rooms/r1")->handle == w3);
    assert(hx.session->active_watches() == 1);
    auto third = hx.pump(change_for(w3, 3));
    assert(!test::find_event<DocumentChanged>(third, [w2](const DocumentChanged &c) { return c.handle == w2; }));

    // Deletion arrives as a change without a document
    hx.wait_result(hx.session->del("rooms/r1"));
    auto gone = hx.pump(change_for(w3, 4));
    auto *del = test::find_event<DocumentChanged>(gone, [](const DocumentChanged &c) { return c.version == 4; });
    assert(del && !del->payload);
}

void test_stream_drop()
{
    Harness hx;
    hx.sign_in("tok1");
    auto w = hx.session->watch("rooms/r2");
    hx.pump(change_for(w, 0));
    hx.transport->drop_streams();
    auto r = hx.wait_result(w);
    assert(r.error.code == ErrorCode::stream_dropped);
    assert(r.kind == CallKind::watch_start && r.path == "rooms/r2");
    assert(!hx.session->subscription("rooms/r2"));

    auto w2 = hx.session->watch("rooms/r2");
    hx.pump(change_for(w2, 0));
    std::vector<BridgeEvent> out;
    hx.session->drop_watches(ErrorCode::stream_dropped, out);
    assert(out.size() == 1);
    assert(std::get<RpcResult>(out[0]).handle == w2);
    assert(std::get<RpcResult>(out[0]).kind == CallKind::watch_start);
    assert(std::get<RpcResult>(out[0]).path == "rooms/r2");
    assert(hx.session->active_watches() == 0);
}

void test_reauth()
{
    Harness hx;
    hx.sign_in("tok1");
    hx.transport->policy().reject("tok1");

    // Rejected, and the store already holds a newer token: resent at once
    auto h = hx.session->get("players/p1");
    hx.sign_in("tok2");
    auto r = hx.wait_result(h);
    assert(r.error.code == ErrorCode::not_found);

    // Rejected with no newer token: parked until the next TokenUpdated
    hx.transport->policy().reject("tok2");
    auto h2 = hx.session->set("players/p1", clicks(3));
    hx.pump([&](const std::vector<BridgeEvent> &) { return hx.session->parked() == 1; });
    assert(hx.session->parked() == 1);
    hx.sign_in("tok3");
    auto r2 = hx.wait_result(h2);
    assert(r2.ok() && r2.payload->version() == 1);

    // The retry happens once
    hx.transport->policy().reject("tok3");
    auto h3 = hx.session->get("players/p1");
    hx.pump([&](const std::vector<BridgeEvent> &) { return hx.session->parked() == 1; });
    hx.transport->policy().reject("tok4");
    hx.sign_in("tok4");
    assert(hx.wait_result(h3).error.code == ErrorCode::unauthenticated);
}

void test_expired_token_fails_at_once()
{
    Harness hx;
    hx.sign_in("old", std::chrono::seconds(-1)); // present but expired
    auto calls = metrics::rpc().local_rejects.load();
    auto h = hx.session->get("players/p1");
    assert(hx.session->parked() == 0);
    auto r = hx.wait_result(h);
    assert(r.error.code == ErrorCode::unauthenticated);
    assert(r.error.detail == "token expired");
    assert(metrics::rpc().local_rejects.load() == calls + 1);
    assert(hx.session->in_flight() == 0);

    auto w = hx.session->watch("players/p1");
    assert(hx.wait_result(w).error.code == ErrorCode::unauthenticated);
    assert(hx.session->active_watches() == 0);

    // A later token does not revive calls that already failed
    hx.sign_in("fresh");
    auto quiet = hx.pump([](const std::vector<BridgeEvent> &) { return false; }, std::chrono::milliseconds(100));
    assert(!test::result_for(quiet, h));
    assert(hx.wait_result(hx.session->get("players/p1")).error.code == ErrorCode::not_found);
}

void test_parked_expiry()
{
    SessionOptions opts;
    opts.reauth_wait = std::chrono::seconds(2);
    Harness hx(opts);
    hx.sign_in("tok1");
    hx.transport->policy().reject("tok1");
    auto h = hx.session->get("players/p1");
    hx.pump([&](const std::vector<BridgeEvent> &) { return hx.session->parked() == 1; });
    assert(hx.session->parked() == 1);
    std::vector<BridgeEvent> out;
    hx.session->expire_parked(std::chrono::steady_clock::now(), out);
    assert(out.empty());
    hx.session->expire_parked(std::chrono::steady_clock::now() + std::chrono::seconds(3), out);
    assert(out.size() == 1);
    assert(std::get<RpcResult>(out[0]).handle == h);
    assert(std::get<RpcResult>(out[0]).error.code == ErrorCode::unauthenticated);
    assert(hx.session->in_flight() == 0);
}

void test_transient_retry()
{
    Harness hx;
    hx.sign_in("tok1");
    hx.transport->fail_next(1);
    assert(hx.wait_result(hx.session->set("players/p1", clicks(1))).ok());
    hx.transport->fail_next(2);
    auto r = hx.wait_result(hx.session->get("players/p1"));
    assert(r.error.code == ErrorCode::transient_rpc_failure);
}

} // namespace

int main()
{
    test_local_rejections();
    test_unary_roundtrip();
    test_watch_lifecycle();
    test_stream_drop();
    test_reauth();
    test_expired_token_fails_at_once();
    test_parked_expiry();
    test_transient_retry();
    std::cout << "unit_rpc_session OK" << std::endl;
    return 0;
}
