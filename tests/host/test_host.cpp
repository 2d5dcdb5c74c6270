// relay_host Host and Instance tests

#include <catch2/catch.hpp>
#include <relay/host/host.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace relay_host;
using relay_core::ErrorCode;
using relay_core::Value;
using relay_kernel::Manifest;
using relay_kernel::ScriptContext;

namespace {

/// Notes written by test scripts from their instance queues
class Trace {
public:
    void note(const std::string& entry) {
        std::lock_guard lock(m_mutex);
        m_entries.push_back(entry);
    }

    std::vector<std::string> entries() const {
        std::lock_guard lock(m_mutex);
        return m_entries;
    }

    std::size_t count(const std::string& entry) const {
        std::lock_guard lock(m_mutex);
        return static_cast<std::size_t>(std::count(m_entries.begin(), m_entries.end(), entry));
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_entries;
};

Manifest manifest(const std::string& name, std::vector<std::string> modules = {}) {
    Manifest m;
    m.name = name;
    m.version = "1.0";
    m.required_modules = std::move(modules);
    return m;
}

std::shared_ptr<EventModule> events_of(ScriptContext& ctx) {
    return ctx.require<EventModule>().unwrap();
}

class FakePeer : public relay_net::IPeerTransport {
public:
    relay_core::Result<void> send(relay_net::PeerMessageType, const relay_core::Bytes&) override {
        return relay_core::Ok();
    }
    void close() override {}
    std::string remote_endpoint() const override { return "127.0.0.1:50000"; }
};

struct HostFixture {
    std::shared_ptr<ScriptCatalog> catalog = std::make_shared<ScriptCatalog>();
    std::shared_ptr<Trace> trace = std::make_shared<Trace>();
    HostConfig config;
    std::unique_ptr<Host> host;

    HostFixture() {
        config.exec_workers = 2;
        config.net.io_threads = 1;
        config.log.console_enabled = false;
    }

    Host& start() {
        host = Host::create(config, catalog).unwrap();
        REQUIRE(host->start().is_ok());
        return *host;
    }

    Instance& add(const std::string& id, std::vector<std::string> scripts) {
        InstanceConfig instance;
        instance.id = id;
        instance.scripts = std::move(scripts);
        auto added = host->add_instance(instance);
        REQUIRE(added.is_ok());
        return *added.value();
    }

    void drain() {
        for (const auto& id : host->instance_ids()) {
            REQUIRE(host->instance(id)->flush().is_ok());
        }
    }
};

} // anonymous namespace

// =============================================================================
// Store Sharing
// =============================================================================

TEST_CASE("Host store scopes across instances", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("writer"), [](ScriptContext& ctx, const Value&) {
        auto store = ctx.require<StoreModule>().unwrap();
        store->set_global("greeting", "hello").unwrap();
        store->set("mine", 1).unwrap();
        store->set_instance("here", true).unwrap();
    }).is_ok());
    REQUIRE(f.catalog->register_plugin(manifest("reader"), [trace](ScriptContext& ctx, const Value&) {
        auto store = ctx.require<StoreModule>().unwrap();
        trace->note("global=" + store->get_global("greeting").value_or(Value("none")).get<std::string>());
        trace->note(store->get("mine") ? "script=visible" : "script=hidden");
        trace->note(store->get_instance("here") ? "instance=visible" : "instance=hidden");
    }).is_ok());

    f.start();
    f.add("main", {"writer"});
    f.add("side", {"reader"});

    REQUIRE(f.trace->entries() == std::vector<std::string>{"global=hello", "script=hidden", "instance=hidden"});
    auto mine = f.host->store().get(relay_store::Scope::Script, "writer", "mine");
    REQUIRE(mine.has_value());
    REQUIRE(*mine == 1);
    auto here = f.host->store().get(relay_store::Scope::Instance, "writer@main", "here");
    REQUIRE(here.has_value());
    REQUIRE(*here == true);
}

// =============================================================================
// Events
// =============================================================================

TEST_CASE("Host broadcast reaches the same script on every instance", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("pinger"), [trace](ScriptContext& ctx, const Value&) {
        auto instance = ctx.instance_id();
        (void)events_of(ctx)->on("ping", [trace, instance](const relay_event::Event& e) {
            trace->note(instance + "<-" + e.origin_instance);
        }).unwrap();
    }).is_ok());

    f.start();
    f.add("main", {"pinger"});
    f.add("side", {"pinger"});

    auto ctx = f.host->instance("main")->context("pinger");
    REQUIRE(ctx);
    REQUIRE(events_of(*ctx)->broadcast("ping", Value{{"n", 1}}).is_ok());
    f.drain();

    auto entries = f.trace->entries();
    std::sort(entries.begin(), entries.end());
    REQUIRE(entries == std::vector<std::string>{"main<-main", "side<-main"});
}

TEST_CASE("Backend events arrive as host-origin events", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("greeter"), [trace](ScriptContext& ctx, const Value&) {
        (void)events_of(ctx)->on("connect", [trace](const relay_event::Event& e) {
            trace->note(e.origin.is_valid() ? "script" : "host:" + e.payload["client"].get<std::string>());
        }).unwrap();
    }).is_ok());

    f.start();
    auto& main = f.add("main", {"greeter"});
    f.add("side", {"greeter"});

    REQUIRE(main.dispatch_backend_event("connect", Value{{"client", "alice"}}).is_ok());
    f.drain();
    REQUIRE(f.trace->entries() == std::vector<std::string>{"host:alice"});

    f.host->broadcast_backend_event("connect", Value{{"client", "bob"}});
    f.drain();
    REQUIRE(f.trace->count("host:bob") == 2);
}

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("Scripts see load after setup and unload before teardown", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("lifecycle"), [trace](ScriptContext& ctx, const Value&) {
        trace->note("setup");
        auto events = events_of(ctx);
        (void)events->on("load", [trace](const relay_event::Event&) { trace->note("load"); }).unwrap();
        (void)events->on("unload", [trace](const relay_event::Event&) { trace->note("unload"); }).unwrap();
    }).is_ok());

    f.start();
    auto& main = f.add("main", {"lifecycle"});
    REQUIRE(main.flush().is_ok());
    REQUIRE(main.is_loaded("lifecycle"));

    auto ctx = main.context("lifecycle");
    REQUIRE(main.unload_script("lifecycle").is_ok());
    REQUIRE(main.flush().is_ok());

    REQUIRE(f.trace->entries() == std::vector<std::string>{"setup", "load", "unload"});
    REQUIRE_FALSE(main.is_loaded("lifecycle"));
    REQUIRE_FALSE(ctx->is_active());
    REQUIRE(f.host->bus().subscriber_count("main", "load") == 0);

    REQUIRE(main.unload_script("lifecycle").error().code() == ErrorCode::NotFound);
}

TEST_CASE("Script configuration gets var defaults", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    auto m = manifest("configured");
    relay_kernel::ManifestVar channel;
    channel.name = "channel";
    channel.default_value = "#lobby";
    relay_kernel::ManifestVar greeting;
    greeting.name = "greeting";
    greeting.default_value = "hi";
    m.vars = {channel, greeting};

    REQUIRE(f.catalog->register_plugin(m, [trace](ScriptContext&, const Value& config) {
        trace->note(config["channel"].get<std::string>() + " " + config["greeting"].get<std::string>());
    }).is_ok());

    f.start();
    InstanceConfig instance;
    instance.id = "main";
    instance.scripts = {"configured"};
    instance.script_config = Value{{"configured", {{"channel", "#relay"}}}};
    REQUIRE(f.host->add_instance(instance).is_ok());

    REQUIRE(f.trace->entries() == std::vector<std::string>{"#relay hi"});
}

TEST_CASE("Failed loads create nothing", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("irc", {"net"}), [trace](ScriptContext& ctx, const Value&) {
        trace->note(ctx.require<NetModule>() ? "net" : "no-net");
    }).is_ok());
    REQUIRE(f.catalog->register_plugin(manifest("thrower"), [](ScriptContext&, const Value&) {
        throw std::runtime_error("bad setup");
    }).is_ok());
    REQUIRE(f.catalog->register_plugin(manifest("typo", {"nett"}), nullptr).is_ok());

    auto discord_only = manifest("discordbot");
    discord_only.backends = {"discord"};
    REQUIRE(f.catalog->register_plugin(discord_only, nullptr).is_ok());

    f.start();
    auto& main = f.add("main", {"irc", "thrower", "typo", "discordbot", "missing"});
    REQUIRE(main.loaded_scripts().empty());
    REQUIRE(f.trace->entries().empty());

    auto irc = main.load_script("irc");
    REQUIRE(irc.is_err());
    REQUIRE(irc.error().code() == ErrorCode::PermissionDenied);

    REQUIRE(main.load_script("thrower").is_err());
    REQUIRE(main.load_script("typo").error().code() == ErrorCode::NotFound);
    REQUIRE(main.load_script("discordbot").error().code() == ErrorCode::NotSupported);
    REQUIRE(main.load_script("missing").error().code() == ErrorCode::NotFound);
    REQUIRE(main.loaded_scripts().empty());

    SECTION("granting the module lets it load") {
        f.host.reset();
        f.config.privileges.set("irc", {"net"});
        f.start();
        f.add("main", {"irc"});
        REQUIRE(f.trace->entries() == std::vector<std::string>{"net"});
    }
}

TEST_CASE("Scripts load once per instance", "[host]") {
    HostFixture f;
    REQUIRE(f.catalog->register_plugin(manifest("solo"), nullptr).is_ok());

    f.start();
    auto& main = f.add("main", {"solo"});
    auto again = main.load_script("solo");
    REQUIRE(again.is_err());
    REQUIRE(again.error().code() == ErrorCode::AlreadyExists);

    REQUIRE(f.host->add_instance(main.config()).error().code() == ErrorCode::AlreadyExists);
}

// =============================================================================
// Reload
// =============================================================================

TEST_CASE("Instance reload runs unload then setup again", "[host]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("counter"), [trace](ScriptContext& ctx, const Value&) {
        trace->note("setup");
        auto events = events_of(ctx);
        (void)events->on("unload", [trace](const relay_event::Event&) { trace->note("unload"); }).unwrap();
        auto engine = ctx.require<EngineModule>().unwrap();
        (void)events->on("reload-me", [trace, engine](const relay_event::Event&) {
            trace->note(engine->reload_scripts() ? "reloading" : "refused");
        }).unwrap();
    }).is_ok());

    SECTION("from the host") {
        f.start();
        auto& main = f.add("main", {"counter"});
        REQUIRE(main.reload().is_ok());
        REQUIRE(main.flush().is_ok());
        REQUIRE(main.flush().is_ok());

        REQUIRE(f.trace->entries() == std::vector<std::string>{"setup", "unload", "setup"});
        REQUIRE(main.is_loaded("counter"));
        REQUIRE(f.host->bus().subscriber_count("main", "unload") == 1);
    }

    SECTION("from a script") {
        f.start();
        auto& main = f.add("main", {"counter"});
        REQUIRE(main.dispatch_backend_event("reload-me", Value()).is_ok());
        REQUIRE(main.flush().is_ok());
        REQUIRE(main.flush().is_ok());

        REQUIRE(f.trace->entries() == std::vector<std::string>{"setup", "reloading", "unload", "setup"});
    }

    SECTION("disabled by configuration") {
        f.config.allow_reload = false;
        f.start();
        auto& main = f.add("main", {"counter"});
        REQUIRE(main.dispatch_backend_event("reload-me", Value()).is_ok());
        REQUIRE(main.flush().is_ok());

        REQUIRE(f.trace->entries() == std::vector<std::string>{"setup", "refused"});
    }
}

// =============================================================================
// Engine Module
// =============================================================================

TEST_CASE("Engine module reports and adjusts the instance", "[host]") {
    HostFixture f;
    f.config.bot_id = "radio";
    std::shared_ptr<EngineModule> engine;

    REQUIRE(f.catalog->register_plugin(manifest("info"), [&engine](ScriptContext& ctx, const Value&) {
        engine = ctx.require<EngineModule>().unwrap();
    }).is_ok());

    f.start();
    auto& main = f.add("main", {"info"});
    REQUIRE(engine);
    REQUIRE(engine->instance_id() == "main");
    REQUIRE(engine->bot_id() == "radio");
    REQUIRE(engine->backend() == "ts3");

    REQUIRE(engine->set_instance_log_level(8));
    REQUIRE(main.log_level() == 8);
    REQUIRE_FALSE(engine->set_instance_log_level(12));
    REQUIRE_FALSE(engine->set_bot_log_level(-1));
    REQUIRE(engine->set_bot_log_level(3));
    REQUIRE(f.host->bot_log_level() == 3);
}

// =============================================================================
// Websocket Peers
// =============================================================================

TEST_CASE("Host accepts peers for loaded web scripts", "[host][ws]") {
    HostFixture f;
    auto trace = f.trace;

    auto panel = manifest("panel", {"ws"});
    panel.enable_web = true;
    REQUIRE(f.catalog->register_plugin(panel, [trace](ScriptContext& ctx, const Value&) {
        (void)events_of(ctx)->on("ws.connect", [trace](const relay_event::Event&) { trace->note("ws.connect"); }).unwrap();
    }).is_ok());
    f.config.privileges.set("panel", {"ws"});

    f.start();
    auto& main = f.add("main", {"panel"});

    auto id = f.host->accept_peer("main", "panel", std::make_shared<FakePeer>());
    REQUIRE(id.is_ok());
    REQUIRE(main.flush().is_ok());
    REQUIRE(f.trace->entries() == std::vector<std::string>{"ws.connect"});
    REQUIRE(f.host->sessions().owner_of(*id) == main.context("panel")->id());

    REQUIRE(f.host->accept_peer("ghost", "panel", std::make_shared<FakePeer>()).error().code() == ErrorCode::NotFound);
    REQUIRE(f.host->accept_peer("main", "other", std::make_shared<FakePeer>()).error().code() == ErrorCode::NotFound);

    SECTION("unloading closes the script's peers") {
        REQUIRE(main.unload_script("panel").is_ok());
        REQUIRE(main.flush().is_ok());
        REQUIRE_FALSE(f.host->sessions().state(*id).has_value());
    }
}

TEST_CASE("Host web listener routes by path", "[host][ws]") {
    namespace asio = boost::asio;
    namespace websocket = boost::beast::websocket;
    using tcp = asio::ip::tcp;

    HostFixture f;
    auto trace = f.trace;

    auto panel = manifest("panel", {"ws"});
    panel.enable_web = true;
    REQUIRE(f.catalog->register_plugin(panel, [trace](ScriptContext& ctx, const Value&) {
        (void)events_of(ctx)->on("ws.data", [trace](const relay_event::Event& e) {
            auto data = relay_core::value_bytes(e.payload.at("data"));
            trace->note(std::string(data->begin(), data->end()));
        }).unwrap();
    }).is_ok());
    f.config.privileges.set("panel", {"ws"});
    f.config.web.enabled = true;
    f.config.web.port = 0;

    f.start();
    auto& main = f.add("main", {"panel"});
    REQUIRE(f.host->web_port() != 0);

    asio::io_context io;
    tcp::endpoint endpoint(asio::ip::address_v4::loopback(), f.host->web_port());

    SECTION("known script") {
        websocket::stream<tcp::socket> client(io);
        client.next_layer().connect(endpoint);
        client.handshake("127.0.0.1", "/main/panel");
        client.text(true);
        client.write(asio::buffer(std::string("hello")));

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (f.trace->entries().empty() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            REQUIRE(main.flush().is_ok());
        }
        REQUIRE(f.trace->entries() == std::vector<std::string>{"hello"});
    }

    SECTION("unknown path is closed") {
        websocket::stream<tcp::socket> client(io);
        client.next_layer().connect(endpoint);
        client.handshake("127.0.0.1", "/main/nobody");

        boost::beast::flat_buffer buffer;
        boost::beast::error_code ec;
        client.read(buffer, ec);
        REQUIRE(ec == websocket::error::closed);
    }
}

// =============================================================================
// Connection Modules
// =============================================================================

TEST_CASE("Database module from a script", "[host][database]") {
    HostFixture f;
    auto trace = f.trace;

    REQUIRE(f.catalog->register_plugin(manifest("stats", {"db"}), [trace](ScriptContext& ctx, const Value&) {
        auto db = ctx.require<DbModule>().unwrap();
        auto conn = std::make_shared<std::shared_ptr<DbConnection>>();
        *conn = db->connect(Value{{"driver", "sqlite3"}}, [trace, conn](const relay_core::Error* error) {
            if (error) {
                trace->note("open failed");
                return;
            }
            auto& c = *conn;
            (void)c->exec("CREATE TABLE plays (song TEXT)", Value(), nullptr);
            (void)c->exec("INSERT INTO plays VALUES (?)", Value::array({"intro"}), nullptr);
            (void)c->query("SELECT count(*) AS n FROM plays", Value(),
                [trace](const relay_core::Error* qerror, const Value& rows) {
                    trace->note(qerror ? "query failed" : "rows=" + std::to_string(rows[0]["n"].get<int>()));
                });
        }).unwrap();
    }).is_ok());
    f.config.privileges.set("stats", {"db"});

    f.start();
    auto& main = f.add("main", {"stats"});

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (f.trace->entries().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE(main.flush().is_ok());
    }
    REQUIRE(f.trace->entries() == std::vector<std::string>{"rows=1"});
}

TEST_CASE("Net module rejects bad parameters and reports failed opens", "[host][net]") {
    HostFixture f;
    auto trace = f.trace;
    std::shared_ptr<NetModule> net;

    REQUIRE(f.catalog->register_plugin(manifest("irc", {"net"}), [&net](ScriptContext& ctx, const Value&) {
        net = ctx.require<NetModule>().unwrap();
    }).is_ok());
    f.config.privileges.set("irc", {"net"});

    f.start();
    auto& main = f.add("main", {"irc"});
    REQUIRE(net);

    REQUIRE(net->connect(Value{{"host", "127.0.0.1"}}, nullptr).is_err());
    REQUIRE(net->connect(Value{{"host", "127.0.0.1"}, {"port", "x"}}, nullptr).is_err());

    // Nothing listens on port 1 of the loopback interface
    auto client = net->connect(Value{{"host", "127.0.0.1"}, {"port", 1}},
        [trace](const relay_core::Error* error) { trace->note(error ? "failed" : "open"); });
    REQUIRE(client.is_ok());
    REQUIRE_FALSE(client.value()->id().empty());
    REQUIRE(client.value()->on("bogus", [](const Value&) {}).is_err());
    REQUIRE(client.value()->write("zz", "hex").is_err());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (f.trace->entries().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE(main.flush().is_ok());
    }
    REQUIRE(f.trace->entries() == std::vector<std::string>{"failed"});
}

TEST_CASE("Net client listeners end with the connection", "[host][net]") {
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    HostFixture f;
    auto trace = f.trace;
    std::shared_ptr<NetModule> net;

    REQUIRE(f.catalog->register_plugin(manifest("irc", {"net"}), [&net](ScriptContext& ctx, const Value&) {
        net = ctx.require<NetModule>().unwrap();
    }).is_ok());
    f.config.privileges.set("irc", {"net"});

    f.start();
    auto& main = f.add("main", {"irc"});
    REQUIRE(net);
    auto& bus = f.host->bus();

    asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    Value params{{"host", "127.0.0.1"}, {"port", acceptor.local_endpoint().port()}};

    auto wait_for = [&](const std::string& entry) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (trace->count(entry) == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            REQUIRE(main.flush().is_ok());
        }
        REQUIRE(trace->count(entry) == 1);
        REQUIRE(main.flush().is_ok());
    };

    auto listener_count = [&bus] {
        return bus.subscriber_count("main", "net.data")
            + bus.subscriber_count("main", "net.close")
            + bus.subscriber_count("main", "net.error");
    };

    SECTION("closed by the script") {
        for (int i = 0; i < 50; ++i) {
            auto client = net->connect(params, nullptr);
            REQUIRE(client.is_ok());
            REQUIRE(client.value()->on("data", [](const Value&) {}).is_ok());
            REQUIRE(client.value()->on("error", [](const Value&) {}).is_ok());
            REQUIRE(client.value()->close().is_ok());
            REQUIRE(client.value()->on("data", [](const Value&) {}).is_err());
        }
        REQUIRE(main.flush().is_ok());
        REQUIRE(bus.subscriber_count("main", "net.data") == 0);
        REQUIRE(listener_count() == 0);
    }

    SECTION("closed by the peer") {
        auto client = net->connect(params,
            [trace](const relay_core::Error* error) { trace->note(error ? "failed" : "open"); });
        REQUIRE(client.is_ok());
        REQUIRE(client.value()->on("data", [](const Value&) {}).is_ok());
        REQUIRE(client.value()->on("close", [trace](const Value&) { trace->note("close"); }).is_ok());
        REQUIRE(listener_count() > 0);

        tcp::socket server(io);
        acceptor.accept(server);
        wait_for("open");
        server.close();

        wait_for("close");
        REQUIRE(listener_count() == 0);
        REQUIRE(f.host->sessions().stats().active == 0);
    }

    SECTION("failed open") {
        Value closed_port{{"host", "127.0.0.1"}, {"port", 1}};
        bool subscribed = false;
        REQUIRE(main.queue()->post([&] {
            auto client = net->connect(closed_port,
                [trace](const relay_core::Error* error) { trace->note(error ? "failed" : "open"); });
            subscribed = client && client.value()->on("data", [](const Value&) {}).is_ok();
        }));

        wait_for("failed");
        REQUIRE(subscribed);
        REQUIRE(listener_count() == 0);
    }
}

TEST_CASE("Ws module only touches the script's own peers", "[host][ws]") {
    HostFixture f;
    std::shared_ptr<WsModule> panel_ws;
    std::shared_ptr<WsModule> other_ws;

    auto panel = manifest("panel", {"ws"});
    panel.enable_web = true;
    REQUIRE(f.catalog->register_plugin(panel, [&panel_ws](ScriptContext& ctx, const Value&) {
        panel_ws = ctx.require<WsModule>().unwrap();
    }).is_ok());
    REQUIRE(f.catalog->register_plugin(manifest("other", {"ws"}), [&other_ws](ScriptContext& ctx, const Value&) {
        other_ws = ctx.require<WsModule>().unwrap();
    }).is_ok());
    f.config.privileges.set("panel", {"ws"});
    f.config.privileges.set("other", {"ws"});

    f.start();
    f.add("main", {"panel", "other"});

    auto id = f.host->accept_peer("main", "panel", std::make_shared<FakePeer>());
    REQUIRE(id.is_ok());
    auto text = id->to_string();

    relay_core::Bytes hello{'h', 'i'};
    REQUIRE(panel_ws->write(text, relay_net::PeerMessageType::Text, hello).is_ok());
    REQUIRE(panel_ws->broadcast(relay_net::PeerMessageType::Text, hello) == 1);

    REQUIRE(other_ws->write(text, relay_net::PeerMessageType::Text, hello).error().code() == ErrorCode::NotFound);
    REQUIRE(other_ws->broadcast(relay_net::PeerMessageType::Text, hello) == 0);
    REQUIRE(other_ws->write("abc", relay_net::PeerMessageType::Text, hello).is_err());

    REQUIRE(other_ws->close(text).is_ok());
    REQUIRE(f.host->sessions().state(*id).has_value());
    REQUIRE(panel_ws->close(text).is_ok());
    REQUIRE_FALSE(f.host->sessions().state(*id).has_value());
}
