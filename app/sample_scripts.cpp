/// @file sample_scripts.cpp
/// @brief Scripts shipped with relay_host

#include "sample_scripts.hpp"

#include <relay/core/log.hpp>
#include <relay/host/modules.hpp>

#include <chrono>
#include <stdexcept>

namespace relay_app {

using relay_core::Value;
using relay_event::Event;
using relay_host::DbConnection;
using relay_host::DbModule;
using relay_host::EngineModule;
using relay_host::EventModule;
using relay_host::StoreModule;
using relay_host::WsModule;
using relay_kernel::Manifest;
using relay_kernel::ManifestVar;
using relay_kernel::ScriptContext;

namespace {

Manifest base_manifest(const std::string& name, const std::string& description) {
    Manifest m;
    m.name = name;
    m.version = "1.0.0";
    m.author = "relay";
    m.description = description;
    m.engine = ">= 1.0.0";
    m.backends = {"ts3", "discord"};
    m.autorun = true;
    return m;
}

/// Subscriptions made during setup must succeed or the load fails
void check(const relay_core::Result<relay_event::SubscriptionId>& subscribed) {
    if (!subscribed) {
        throw std::runtime_error(subscribed.error().message());
    }
}

void report(const std::shared_ptr<EngineModule>& engine, const relay_core::Result<void>& result, const char* what) {
    if (!result) {
        engine->log(std::string(what) + " failed: " + result.error().message());
    }
}

// =============================================================================
// ping
// =============================================================================

void setup_ping(ScriptContext& ctx, const Value& config) {
    auto engine = ctx.require<EngineModule>().unwrap();
    auto store = ctx.require<StoreModule>().unwrap();
    auto event = ctx.require<EventModule>().unwrap();
    auto reply = config.value("reply", std::string("pong"));

    check(event->on("ping", [engine, store, event, reply](const Event& e) {
        auto count = store->get_global("pings").value_or(Value(0)).get<std::int64_t>() + 1;
        report(engine, store->set_global("pings", count), "Counting pings");

        Value pong = Value::object();
        pong["from"] = engine->instance_id();
        pong["reply"] = reply;
        pong["count"] = count;
        report(engine, event->broadcast("pong", std::move(pong)), "Broadcasting pong");

        if (e.payload.is_object() && e.payload.contains("from")) {
            engine->log("ping from " + relay_core::value_to_text(e.payload.at("from")));
        }
    }));
}

// =============================================================================
// greeter
// =============================================================================

void setup_greeter(ScriptContext& ctx, const Value& config) {
    auto engine = ctx.require<EngineModule>().unwrap();
    auto store = ctx.require<StoreModule>().unwrap();
    auto event = ctx.require<EventModule>().unwrap();
    auto greeting = config.value("greeting", std::string("Welcome"));

    check(event->on(relay_event::events::kConnect, [engine, store, greeting](const Event& e) {
        auto client = e.payload.is_object() ? e.payload.value("client", std::string("someone")) : std::string("someone");
        report(engine, store->set_instance("last_client", client), "Remembering client");
        engine->log(greeting + ", " + client);
    }));

    check(event->on(relay_event::events::kDisconnect, [engine](const Event& e) {
        engine->log("disconnect: " + relay_core::value_to_text(e.payload));
    }));
}

// =============================================================================
// echo_web
// =============================================================================

void setup_echo_web(ScriptContext& ctx, const Value&) {
    auto engine = ctx.require<EngineModule>().unwrap();
    auto event = ctx.require<EventModule>().unwrap();
    auto ws = ctx.require<WsModule>().unwrap();

    check(event->on(relay_event::events::kWsData, [engine, ws](const Event& e) {
        auto id = e.payload.value("id", std::string());
        auto type = static_cast<relay_net::PeerMessageType>(e.payload.value("type", 2));
        auto data = relay_core::value_bytes(e.payload.value("data", Value()));
        if (!data) {
            engine->log("ws.data without a binary payload");
            return;
        }
        report(engine, ws->write(id, type, std::move(*data)), "Echo");
    }));

    check(event->on(relay_event::events::kWsConnect, [engine](const Event& e) {
        engine->log("peer " + e.payload.value("id", std::string()) + " connected");
    }));
}

// =============================================================================
// audit_db
// =============================================================================

struct AuditState {
    std::shared_ptr<DbConnection> connection;
    bool ready = false;
};

void setup_audit_db(ScriptContext& ctx, const Value& config) {
    auto engine = ctx.require<EngineModule>().unwrap();
    auto event = ctx.require<EventModule>().unwrap();
    auto db = ctx.require<DbModule>().unwrap();
    auto state = std::make_shared<AuditState>();

    Value params = Value::object();
    params["driver"] = config.value("driver", std::string("sqlite3"));

    state->connection = db->connect(params, [engine, state](const relay_core::Error* error) {
        if (error) {
            engine->log("audit database unavailable: " + error->message());
            return;
        }
        auto created = state->connection->exec(
            "CREATE TABLE audit (at INTEGER, event TEXT, payload TEXT)", Value::array(),
            [engine, state](const relay_core::Error* err) {
                if (err) {
                    engine->log("audit table: " + err->message());
                    return;
                }
                state->ready = true;
            });
        report(engine, created, "Creating audit table");
    }).unwrap();

    auto record = [engine, state](const Event& e) {
        if (!state->ready) {
            return;
        }
        Value args = Value::array({
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count(),
            e.name,
            e.payload.dump()});
        report(engine, state->connection->exec("INSERT INTO audit VALUES (?, ?, ?)", std::move(args), nullptr),
            "Recording event");
    };
    check(event->on(relay_event::events::kConnect, record));
    check(event->on(relay_event::events::kDisconnect, record));
}

} // anonymous namespace

void register_sample_scripts(relay_host::ScriptCatalog& catalog) {
    auto add = [&catalog](Manifest manifest, relay_host::SetupFn setup) {
        auto name = manifest.name;
        if (auto r = catalog.register_plugin(std::move(manifest), std::move(setup)); !r) {
            relay_core::host_logger()->error("Script '{}' not registered: {}", name, r.error().message());
        }
    };

    auto ping = base_manifest("ping", "Answers ping broadcasts across instances");
    ping.vars.push_back(ManifestVar{"reply", "Reply text", "string", Value("pong"), {}});
    add(std::move(ping), setup_ping);

    auto greeter = base_manifest("greeter", "Greets clients joining the channel");
    greeter.vars.push_back(ManifestVar{"greeting", "Greeting", "string", Value("Welcome"), {}});
    add(std::move(greeter), setup_greeter);

    auto echo = base_manifest("echo_web", "Echoes websocket frames");
    echo.enable_web = true;
    echo.required_modules = {"ws"};
    add(std::move(echo), setup_echo_web);

    auto audit = base_manifest("audit_db", "Keeps an audit trail of backend events");
    audit.required_modules = {"db"};
    add(std::move(audit), setup_audit_db);
}

} // namespace relay_app
