// relay_event EventBus tests

#include <catch2/catch.hpp>
#include <relay/event/event_bus.hpp>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace relay_event;
using relay_core::ErrorCode;
using relay_core::Value;

namespace {

struct BusFixture {
    relay_exec::Executor executor{2};
    relay_kernel::CapabilityRegistry registry;
    EventBus bus;
    std::shared_ptr<relay_exec::ExecutionQueue> main_queue;
    std::shared_ptr<relay_exec::ExecutionQueue> side_queue;

    BusFixture() {
        main_queue = relay_exec::ExecutionQueue::create(executor, "main").unwrap();
        side_queue = relay_exec::ExecutionQueue::create(executor, "side").unwrap();
        bus.attach_instance("main", main_queue).unwrap();
        bus.attach_instance("side", side_queue).unwrap();
    }

    ~BusFixture() {
        bus.detach_instance("main");
        bus.detach_instance("side");
        executor.shutdown();
    }

    std::shared_ptr<relay_kernel::ScriptContext> context(const std::string& script, const std::string& instance) {
        relay_kernel::Manifest manifest;
        manifest.name = script;
        manifest.version = "1.0";
        return registry.create_context(script, instance, manifest, {});
    }

    void drain() {
        main_queue->flush().unwrap();
        side_queue->flush().unwrap();
    }
};

} // anonymous namespace

// =============================================================================
// Instances
// =============================================================================

TEST_CASE("EventBus instance attachment", "[event][bus]") {
    BusFixture f;

    REQUIRE(f.bus.is_attached("main"));
    REQUIRE(f.bus.queue("main") == f.main_queue);
    REQUIRE(f.bus.queue("ghost") == nullptr);

    auto dup = f.bus.attach_instance("main", f.main_queue);
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code() == ErrorCode::AlreadyExists);

    REQUIRE(f.bus.attach_instance("nil", nullptr).is_err());
}

// =============================================================================
// Local Delivery
// =============================================================================

TEST_CASE("EventBus delivers in registration order", "[event][bus]") {
    BusFixture f;
    auto a = f.context("a", "main");
    auto b = f.context("b", "main");

    std::vector<std::string> order;
    REQUIRE(f.bus.on(*a, "ping", [&order](const Event&) { order.push_back("a1"); }).is_ok());
    REQUIRE(f.bus.on(*b, "ping", [&order](const Event&) { order.push_back("b1"); }).is_ok());
    REQUIRE(f.bus.on(*a, "ping", [&order](const Event&) { order.push_back("a2"); }).is_ok());

    REQUIRE(f.bus.emit(*b, "ping", Value{{"n", 1}}).is_ok());
    f.drain();

    REQUIRE(order == std::vector<std::string>{"a1", "b1", "a2"});
}

TEST_CASE("EventBus local emit stays in the instance", "[event][bus]") {
    BusFixture f;
    auto sender = f.context("sender", "main");
    auto local = f.context("listener", "main");
    auto remote = f.context("listener", "side");

    int local_hits = 0;
    int remote_hits = 0;
    Event seen;
    REQUIRE(f.bus.on(*local, "chat", [&](const Event& e) { local_hits++; seen = e; }).is_ok());
    REQUIRE(f.bus.on(*remote, "chat", [&](const Event&) { remote_hits++; }).is_ok());

    REQUIRE(f.bus.emit(*sender, "chat", Value("hi")).is_ok());
    f.drain();

    REQUIRE(local_hits == 1);
    REQUIRE(remote_hits == 0);
    REQUIRE(seen.payload == "hi");
    REQUIRE(seen.origin == sender->id());
    REQUIRE(seen.origin_instance == "main");
    REQUIRE(seen.mode == DeliveryMode::Local);
}

TEST_CASE("EventBus delivers with no subscribers", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("lonely", "main");
    REQUIRE(f.bus.emit(*ctx, "nobody-listens", Value()).is_ok());
    f.drain();
    REQUIRE(f.bus.stats().dispatches_posted == 0);
}

TEST_CASE("EventBus callbacks run on the instance queue", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("s", "main");

    bool on_queue = false;
    REQUIRE(f.bus.on(*ctx, "tick", [&](const Event&) { on_queue = f.main_queue->running_in_this_thread(); }).is_ok());
    REQUIRE(f.bus.emit(*ctx, "tick", Value()).is_ok());
    f.drain();

    REQUIRE(on_queue);
}

// =============================================================================
// Broadcast
// =============================================================================

TEST_CASE("EventBus broadcast reaches every instance", "[event][bus]") {
    BusFixture f;
    auto sender = f.context("pinger", "main");
    auto here = f.context("pinger", "main");
    auto there = f.context("pinger", "side");

    std::vector<std::string> hits;
    std::mutex hits_mutex;
    auto record = [&](const std::string& tag) {
        return [&, tag](const Event& e) {
            std::lock_guard lock(hits_mutex);
            hits.push_back(e.mode == DeliveryMode::Broadcast ? tag : "unexpected");
        };
    };
    REQUIRE(f.bus.on(*here, "pong", record("main")).is_ok());
    REQUIRE(f.bus.on(*there, "pong", record("side")).is_ok());

    REQUIRE(f.bus.broadcast(*sender, "pong", Value()).is_ok());
    f.drain();

    std::sort(hits.begin(), hits.end());
    REQUIRE(hits == std::vector<std::string>{"main", "side"});
}

TEST_CASE("EventBus host broadcast", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("greeter", "side");

    ContextId origin{99};
    std::string instance = "unset";
    REQUIRE(f.bus.on(*ctx, "connect", [&](const Event& e) {
        origin = e.origin;
        instance = e.origin_instance;
    }).is_ok());

    f.bus.broadcast_host("connect", Value{{"client", "x"}});
    f.drain();

    REQUIRE_FALSE(origin.is_valid());
    REQUIRE(instance.empty());
}

// =============================================================================
// Context Delivery
// =============================================================================

TEST_CASE("EventBus emit_to targets one context", "[event][bus]") {
    BusFixture f;
    auto a = f.context("a", "main");
    auto b = f.context("b", "main");

    int a_hits = 0;
    int b_hits = 0;
    REQUIRE(f.bus.on(*a, "net.data", [&](const Event&) { a_hits++; }).is_ok());
    REQUIRE(f.bus.on(*b, "net.data", [&](const Event&) { b_hits++; }).is_ok());

    REQUIRE(f.bus.emit_to("main", a->id(), "net.data", Value()).is_ok());
    f.drain();
    REQUIRE(a_hits == 1);
    REQUIRE(b_hits == 0);

    SECTION("guard drops the event") {
        REQUIRE(f.bus.emit_to("main", a->id(), "net.data", Value(), [] { return false; }).is_ok());
        f.drain();
        REQUIRE(a_hits == 1);
        REQUIRE(f.bus.stats().events_dropped == 1);
    }

    SECTION("invalid target") {
        REQUIRE(f.bus.emit_to("main", ContextId{}, "net.data", Value()).is_err());
        REQUIRE(f.bus.emit_to("ghost", a->id(), "net.data", Value()).is_err());
    }
}

// =============================================================================
// Dispatch Snapshot
// =============================================================================

TEST_CASE("EventBus subscription added during dispatch waits for the next event", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("s", "main");

    int first = 0;
    int late = 0;
    bool subscribed = false;
    REQUIRE(f.bus.on(*ctx, "ping", [&](const Event&) {
        first++;
        if (!subscribed) {
            subscribed = true;
            (void)f.bus.on(*ctx, "ping", [&](const Event&) { late++; });
        }
    }).is_ok());

    REQUIRE(f.bus.emit(*ctx, "ping", Value()).is_ok());
    f.drain();
    REQUIRE(first == 1);
    REQUIRE(late == 0);

    REQUIRE(f.bus.emit(*ctx, "ping", Value()).is_ok());
    f.drain();
    REQUIRE(first == 2);
    REQUIRE(late == 1);
}

TEST_CASE("EventBus skips subscriptions removed mid-dispatch", "[event][bus]") {
    BusFixture f;
    auto killer = f.context("killer", "main");
    auto victim = f.context("victim", "main");

    int victim_hits = 0;
    REQUIRE(f.bus.on(*killer, "ping", [&](const Event&) { f.bus.remove_context(victim->id()); }).is_ok());
    REQUIRE(f.bus.on(*victim, "ping", [&](const Event&) { victim_hits++; }).is_ok());

    REQUIRE(f.bus.emit(*killer, "ping", Value()).is_ok());
    f.drain();

    REQUIRE(victim_hits == 0);
    REQUIRE(f.bus.subscriber_count("main", "ping") == 1);
}

TEST_CASE("EventBus off removes a single subscription", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("pinger", "main");

    std::vector<std::string> hits;
    auto first = f.bus.on(*ctx, "ping", [&hits](const Event&) { hits.push_back("first"); });
    auto second = f.bus.on(*ctx, "ping", [&hits](const Event&) { hits.push_back("second"); });
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());

    REQUIRE(f.bus.off("main", first.value()));
    REQUIRE_FALSE(f.bus.off("main", first.value()));
    REQUIRE_FALSE(f.bus.off("ghost", second.value()));
    REQUIRE(f.bus.subscriber_count("main", "ping") == 1);

    REQUIRE(f.bus.emit(*ctx, "ping", Value()).is_ok());
    f.drain();
    REQUIRE(hits == std::vector<std::string>{"second"});

    REQUIRE(f.bus.off("main", second.value()));
    REQUIRE(f.bus.subscriber_count("main", "ping") == 0);
    REQUIRE(f.bus.stats().active_subscriptions == 0);
}

// =============================================================================
// Failure Isolation
// =============================================================================

TEST_CASE("EventBus isolates subscriber failures", "[event][bus]") {
    BusFixture f;
    auto bad = f.context("bad", "main");
    auto good = f.context("good", "main");

    int good_hits = 0;
    REQUIRE(f.bus.on(*bad, "ping", [](const Event&) { throw std::runtime_error("boom"); }).is_ok());
    REQUIRE(f.bus.on(*good, "ping", [&](const Event&) { good_hits++; }).is_ok());

    REQUIRE(f.bus.emit(*good, "ping", Value()).is_ok());
    REQUIRE(f.bus.emit(*good, "ping", Value()).is_ok());
    f.drain();

    REQUIRE(good_hits == 2);
    REQUIRE(f.bus.stats().subscriber_failures == 2);
    REQUIRE(f.bus.subscriber_count("main", "ping") == 2);
}

// =============================================================================
// Unloaded Contexts
// =============================================================================

TEST_CASE("EventBus rejects inactive contexts", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("gone", "main");
    ctx->deactivate();

    REQUIRE(f.bus.on(*ctx, "ping", [](const Event&) {}).is_err());
    REQUIRE(f.bus.emit(*ctx, "ping", Value()).is_err());
    REQUIRE(f.bus.broadcast(*ctx, "ping", Value()).is_err());
}

TEST_CASE("EventBus subscription arguments", "[event][bus]") {
    BusFixture f;
    auto ctx = f.context("s", "main");
    auto orphan = f.context("s", "nowhere");

    REQUIRE(f.bus.on(*ctx, "", [](const Event&) {}).is_err());
    REQUIRE(f.bus.on(*ctx, "ping", nullptr).is_err());
    REQUIRE(f.bus.on(*orphan, "ping", [](const Event&) {}).is_err());

    auto id1 = f.bus.on(*ctx, "ping", [](const Event&) {});
    auto id2 = f.bus.on(*ctx, "ping", [](const Event&) {});
    REQUIRE(id1->is_valid());
    REQUIRE(id1.value() != id2.value());
}
