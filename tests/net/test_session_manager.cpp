// relay_net SessionManager tests

#include <catch2/catch.hpp>
#include <relay/net/session_manager.hpp>

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace relay_net;
using relay_core::Bytes;
using relay_core::ConnectionError;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::Value;

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

std::string to_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

/// Thread-safe log of everything delivered to the test script
class Recorder {
public:
    void event(const relay_event::Event& e) {
        std::lock_guard lock(m_mutex);
        m_events.push_back(e);
    }

    void open(const Error* error) {
        std::lock_guard lock(m_mutex);
        m_opens.push_back(error ? std::optional<Error>(*error) : std::nullopt);
    }

    std::size_t count(const std::string& name) const {
        std::lock_guard lock(m_mutex);
        std::size_t n = 0;
        for (const auto& e : m_events) {
            if (e.name == name) {
                ++n;
            }
        }
        return n;
    }

    std::vector<relay_event::Event> events(const std::string& name) const {
        std::lock_guard lock(m_mutex);
        std::vector<relay_event::Event> result;
        for (const auto& e : m_events) {
            if (e.name == name) {
                result.push_back(e);
            }
        }
        return result;
    }

    /// Concatenated net.data bytes
    std::string received() const {
        std::string text;
        for (const auto& e : events("net.data")) {
            text += to_text(*relay_core::value_bytes(e.payload.at("data")));
        }
        return text;
    }

    std::vector<std::optional<Error>> opens() const {
        std::lock_guard lock(m_mutex);
        return m_opens;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<relay_event::Event> m_events;
    std::vector<std::optional<Error>> m_opens;
};

/// TCP server on the loopback interface; serves one connection unless
/// told to keep accepting
class LoopbackServer {
public:
    using Session = std::function<void(tcp::socket&)>;

    explicit LoopbackServer(Session session, bool keep_accepting = false)
        : m_acceptor(m_io, tcp::endpoint(asio::ip::address_v4::loopback(), 0))
        , m_session(std::move(session))
        , m_keep_accepting(keep_accepting)
    {
        accept_next();
        m_thread = std::thread([this]() { m_io.run(); });
    }

    ~LoopbackServer() {
        m_io.stop();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    std::uint16_t port() const { return m_acceptor.local_endpoint().port(); }

private:
    void accept_next() {
        m_acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            m_session(socket);
            boost::system::error_code ignored;
            socket.close(ignored);
            if (m_keep_accepting) {
                accept_next();
            }
        });
    }

    asio::io_context m_io;
    tcp::acceptor m_acceptor;
    Session m_session;
    bool m_keep_accepting;
    std::thread m_thread;
};

/// Port on the loopback interface with nothing listening
std::uint16_t closed_port() {
    asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

/// Websocket peer double recording what the session manager sends
class FakePeer : public IPeerTransport {
public:
    relay_core::Result<void> send(PeerMessageType type, const Bytes& data) override {
        if (failing) {
            return relay_core::Err(relay_core::Error(ErrorCode::IOError, "broken pipe"));
        }
        std::lock_guard lock(mutex);
        sent.emplace_back(type, to_text(data));
        return relay_core::Ok();
    }

    void close() override { closed = true; }

    std::string remote_endpoint() const override { return "127.0.0.1:40000"; }

    std::size_t sent_count() {
        std::lock_guard lock(mutex);
        return sent.size();
    }

    std::mutex mutex;
    std::vector<std::pair<PeerMessageType, std::string>> sent;
    std::atomic<bool> closed{false};
    std::atomic<bool> failing{false};
};

struct NetFixture {
    relay_exec::Executor executor{2};
    relay_kernel::CapabilityRegistry registry;
    relay_event::EventBus bus;
    std::shared_ptr<relay_exec::ExecutionQueue> queue;
    std::unique_ptr<SessionManager> sessions;
    std::shared_ptr<relay_kernel::ScriptContext> ctx;
    Recorder rec;

    explicit NetFixture(SessionConfig config = {}, std::shared_ptr<DatabaseDriverRegistry> drivers = nullptr) {
        queue = relay_exec::ExecutionQueue::create(executor, "main").unwrap();
        REQUIRE(bus.attach_instance("main", queue).is_ok());
        sessions = std::make_unique<SessionManager>(bus, config, std::move(drivers));
        ctx = context("netter", relay_kernel::PrivilegeSet::full());

        for (const char* name : {"net.data", "net.close", "net.error",
                                 "ws.connect", "ws.data", "ws.disconnect", "ws.error"}) {
            REQUIRE(bus.on(*ctx, name, [this](const relay_event::Event& e) { rec.event(e); }).is_ok());
        }
    }

    ~NetFixture() {
        sessions->shutdown();
        (void)queue->flush();
        bus.detach_instance("main");
        executor.shutdown();
    }

    std::shared_ptr<relay_kernel::ScriptContext> context(const std::string& script,
                                                         relay_kernel::PrivilegeSet privileges) {
        relay_kernel::Manifest manifest;
        manifest.name = script;
        manifest.version = "1.0";
        return registry.create_context(script, "main", manifest, std::move(privileges));
    }

    OpenCallback on_open() {
        return [this](const Error* error) { rec.open(error); };
    }

    bool wait_open(std::size_t n = 1) {
        return wait_until([&] { return rec.opens().size() >= n; });
    }

    /// Post a task that holds the instance queue until the returned promise is set
    std::promise<void> block_queue() {
        std::promise<void> gate;
        auto released = gate.get_future().share();
        queue->post([released]() { released.wait(); });
        return gate;
    }
};

ConnectParams loopback(std::uint16_t port) {
    ConnectParams params;
    params.host = "127.0.0.1";
    params.port = port;
    return params;
}

} // anonymous namespace

// =============================================================================
// Stream Sockets
// =============================================================================

TEST_CASE("Stream socket delivers reads and ordered writes", "[net][session]") {
    constexpr int kMessages = 50;
    std::string expected;
    for (int i = 0; i < kMessages; ++i) {
        expected += "msg" + std::to_string(i) + ";";
    }

    std::mutex server_mutex;
    std::string server_received;
    LoopbackServer server([&](tcp::socket& socket) {
        boost::system::error_code ec;
        asio::write(socket, asio::buffer(std::string("hello\n")), ec);
        std::string buffer(expected.size(), '\0');
        asio::read(socket, asio::buffer(buffer), ec);
        std::lock_guard lock(server_mutex);
        server_received = buffer;
    });

    NetFixture f;
    auto id = f.sessions->open_socket(*f.ctx, loopback(server.port()), f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(f.wait_open());
    REQUIRE_FALSE(f.rec.opens().front().has_value());
    REQUIRE(f.sessions->state(*id) == ConnectionState::Open);
    REQUIRE(f.sessions->owner_of(*id) == f.ctx->id());

    REQUIRE(wait_until([&] { return f.rec.received() == "hello\n"; }));
    auto data = f.rec.events("net.data").front();
    REQUIRE(data.payload["id"] == id->to_string());

    for (int i = 0; i < kMessages; ++i) {
        REQUIRE(f.sessions->write(*id, to_bytes("msg" + std::to_string(i) + ";")).is_ok());
    }

    REQUIRE(wait_until([&] {
        std::lock_guard lock(server_mutex);
        return !server_received.empty();
    }));
    {
        std::lock_guard lock(server_mutex);
        REQUIRE(server_received == expected);
    }

    // Server hung up after its read
    REQUIRE(wait_until([&] { return f.rec.count("net.close") + f.rec.count("net.error") == 1; }));
    REQUIRE_FALSE(f.sessions->state(*id).has_value());
}

TEST_CASE("Refused socket reports exactly one open error", "[net][session]") {
    NetFixture f;
    auto id = f.sessions->open_socket(*f.ctx, loopback(closed_port()), f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(f.wait_open());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(f.queue->flush().is_ok());

    auto opens = f.rec.opens();
    REQUIRE(opens.size() == 1);
    REQUIRE(opens[0].has_value());
    REQUIRE(opens[0]->as<ConnectionError>()->kind == ConnectionError::Kind::ConnectFailed);
    REQUIRE_FALSE(f.sessions->state(*id).has_value());
    REQUIRE(f.sessions->stats().failed == 1);
}

TEST_CASE("Connect timeout fails the open", "[net][session]") {
    // Listener whose accept queue is already full, so further SYNs go unanswered
    asio::io_context io;
    tcp::acceptor acceptor(io);
    tcp::endpoint endpoint(asio::ip::address_v4::loopback(), 0);
    acceptor.open(endpoint.protocol());
    acceptor.bind(endpoint);
    acceptor.listen(0);
    endpoint = acceptor.local_endpoint();

    std::vector<std::unique_ptr<tcp::socket>> fillers;
    for (int i = 0; i < 4; ++i) {
        fillers.push_back(std::make_unique<tcp::socket>(io));
        fillers.back()->async_connect(endpoint, [](const boost::system::error_code&) {});
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    SessionConfig config;
    config.connect_timeout = std::chrono::milliseconds(300);
    NetFixture f(config);

    auto started = std::chrono::steady_clock::now();
    auto id = f.sessions->open_socket(*f.ctx, loopback(endpoint.port()), f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(f.wait_open());
    auto elapsed = std::chrono::steady_clock::now() - started;

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(f.queue->flush().is_ok());

    auto opens = f.rec.opens();
    REQUIRE(opens.size() == 1);
    REQUIRE(opens[0].has_value());
    REQUIRE(opens[0]->as<ConnectionError>()->kind == ConnectionError::Kind::Timeout);
    REQUIRE(opens[0]->code() == ErrorCode::Timeout);
    REQUIRE(elapsed >= std::chrono::milliseconds(250));
    REQUIRE_FALSE(f.sessions->state(*id).has_value());
    REQUIRE(f.sessions->stats().failed == 1);
    REQUIRE(f.rec.count("net.error") == 0);
}

TEST_CASE("Malformed socket parameters fail synchronously", "[net][session]") {
    NetFixture f;
    ConnectParams params;
    params.host = "127.0.0.1";
    params.port = 0;

    auto id = f.sessions->open_socket(*f.ctx, params, f.on_open());
    REQUIRE(id.is_err());
    REQUIRE(id.error().code() == ErrorCode::InvalidArgument);
    REQUIRE(f.queue->flush().is_ok());
    REQUIRE(f.rec.opens().empty());
    REQUIRE(f.sessions->stats().active == 0);
}

TEST_CASE("Close suppresses events already in flight", "[net][session]") {
    LoopbackServer server([](tcp::socket& socket) {
        boost::system::error_code ec;
        char go[2];
        asio::read(socket, asio::buffer(go), ec);
        asio::write(socket, asio::buffer(std::string("late data")), ec);
        char sink[64];
        while (!ec) {
            socket.read_some(asio::buffer(sink), ec);
        }
    });

    NetFixture f;
    auto id = f.sessions->open_socket(*f.ctx, loopback(server.port()), f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(f.wait_open());

    auto gate = f.block_queue();
    REQUIRE(f.sessions->write(*id, to_bytes("go")).is_ok());
    REQUIRE(wait_until([&] { return f.sessions->stats().bytes_read >= 9; }));

    REQUIRE(f.sessions->close(*id).is_ok());
    gate.set_value();
    REQUIRE(f.queue->flush().is_ok());

    REQUIRE(f.rec.count("net.data") == 0);
    REQUIRE(f.rec.count("net.close") == 0);
    REQUIRE(f.rec.count("net.error") == 0);

    SECTION("close is idempotent") {
        REQUIRE(f.sessions->close(*id).is_ok());
        REQUIRE(f.sessions->close(ConnectionId{987654}).is_ok());
    }

    SECTION("writes after close are rejected") {
        auto r = f.sessions->write(*id, to_bytes("again"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

// =============================================================================
// Databases
// =============================================================================

TEST_CASE("SQLite connection runs statements in request order", "[net][session][database]") {
    NetFixture f;
    DbParams params;
    params.driver = "sqlite3";

    auto id = f.sessions->open_database(*f.ctx, params, f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(f.wait_open());
    REQUIRE_FALSE(f.rec.opens().front().has_value());

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto note = [&](const std::string& tag) {
        std::lock_guard lock(order_mutex);
        order.push_back(tag);
    };

    REQUIRE(f.sessions->exec(*id, "CREATE TABLE joins (name TEXT)", Value(),
        [&](const Error* error) { note(error ? "create-failed" : "create"); }).is_ok());
    for (int i = 0; i < 3; ++i) {
        REQUIRE(f.sessions->exec(*id, "INSERT INTO joins VALUES (?)", Value::array({"user" + std::to_string(i)}),
            [&, i](const Error* error) { note(error ? "insert-failed" : "insert" + std::to_string(i)); }).is_ok());
    }

    Value rows;
    REQUIRE(f.sessions->query(*id, "SELECT name FROM joins ORDER BY rowid", Value(),
        [&](const Error* error, const Value& result) {
            rows = result;
            note(error ? "select-failed" : "select");
        }).is_ok());

    REQUIRE(wait_until([&] {
        std::lock_guard lock(order_mutex);
        return order.size() == 5;
    }));
    REQUIRE(f.queue->flush().is_ok());

    REQUIRE(order == std::vector<std::string>{"create", "insert0", "insert1", "insert2", "select"});
    REQUIRE(rows.size() == 3);
    REQUIRE(to_text(*relay_core::value_bytes(rows[2]["name"])) == "user2");

    SECTION("failed statements report through the callback") {
        std::promise<std::string> failed;
        REQUIRE(f.sessions->query(*id, "SELECT * FROM missing", Value(),
            [&](const Error* error, const Value&) { failed.set_value(error ? error->message() : ""); }).is_ok());
        auto message = failed.get_future();
        REQUIRE(message.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        REQUIRE_FALSE(message.get().empty());
    }

    SECTION("raw writes are rejected") {
        auto r = f.sessions->write(*id, to_bytes("x"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("statements after close are rejected") {
        REQUIRE(f.sessions->close(*id).is_ok());
        REQUIRE(f.sessions->exec(*id, "SELECT 1", Value(), nullptr).is_err());
    }
}

TEST_CASE("Unreachable database reports exactly one open error", "[net][session][database]") {
    NetFixture f;
    DbParams params;
    params.driver = "postgres";
    params.host = "127.0.0.1";
    params.port = closed_port();

    auto id = f.sessions->open_database(*f.ctx, params, f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(f.wait_open());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(f.queue->flush().is_ok());

    auto opens = f.rec.opens();
    REQUIRE(opens.size() == 1);
    REQUIRE(opens[0].has_value());
    REQUIRE(opens[0]->is<ConnectionError>());
    REQUIRE(opens[0]->as<ConnectionError>()->kind == ConnectionError::Kind::ConnectFailed);
}

TEST_CASE("Reachable server that is not postgres fails the open", "[net][session][database]") {
    // Reachability check first, then the driver's own connection
    LoopbackServer server([](tcp::socket& socket) {
        boost::system::error_code ec;
        char sink[16];
        socket.read_some(asio::buffer(sink), ec);
    }, true);

    NetFixture f;
    DbParams params;
    params.driver = "postgres";
    params.host = "127.0.0.1";
    params.port = server.port();
    params.username = "relay";

    REQUIRE(f.sessions->open_database(*f.ctx, params, f.on_open()).is_ok());
    REQUIRE(f.wait_open());

    auto opens = f.rec.opens();
    REQUIRE(opens.size() == 1);
    REQUIRE(opens[0].has_value());
    REQUIRE(opens[0]->as<ConnectionError>()->kind == ConnectionError::Kind::ConnectFailed);
    REQUIRE(f.sessions->stats().active == 0);
}

TEST_CASE("Reachable database without a driver fails the open", "[net][session][database]") {
    LoopbackServer server([](tcp::socket& socket) {
        boost::system::error_code ec;
        char sink[16];
        socket.read_some(asio::buffer(sink), ec);
    });

    auto drivers = std::make_shared<DatabaseDriverRegistry>();
    REQUIRE(drivers->register_driver(std::make_shared<SqliteDriver>()).is_ok());

    NetFixture f({}, drivers);
    DbParams params;
    params.driver = "postgres";
    params.host = "127.0.0.1";
    params.port = server.port();

    REQUIRE(f.sessions->open_database(*f.ctx, params, f.on_open()).is_ok());
    REQUIRE(f.wait_open());

    auto opens = f.rec.opens();
    REQUIRE(opens.size() == 1);
    REQUIRE(opens[0].has_value());
    REQUIRE(opens[0]->as<ConnectionError>()->kind == ConnectionError::Kind::DriverUnavailable);
}

TEST_CASE("Releasing the owner drops a pending open callback", "[net][session][database]") {
    NetFixture f;
    DbParams params;
    params.driver = "sqlite3";

    auto gate = f.block_queue();
    auto id = f.sessions->open_database(*f.ctx, params, f.on_open());
    REQUIRE(id.is_ok());
    REQUIRE(wait_until([&] { return f.sessions->stats().opened == 1; }));

    f.sessions->close_all(f.ctx->id());
    gate.set_value();
    REQUIRE(f.queue->flush().is_ok());

    REQUIRE(f.rec.opens().empty());
    REQUIRE(f.sessions->connections_of(f.ctx->id()).empty());
}

// =============================================================================
// Websocket Peers
// =============================================================================

TEST_CASE("Websocket peers need the ws privilege", "[net][session][ws]") {
    NetFixture f;
    auto plain = f.context("plain", relay_kernel::PrivilegeSet{});

    auto r = f.sessions->attach_peer(*plain, std::make_shared<FakePeer>());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code() == ErrorCode::PermissionDenied);
    REQUIRE(f.sessions->attach_peer(*f.ctx, nullptr).is_err());
    REQUIRE(f.sessions->stats().active == 0);
}

TEST_CASE("Websocket peer lifecycle", "[net][session][ws]") {
    NetFixture f;
    auto peer = std::make_shared<FakePeer>();

    auto id = f.sessions->attach_peer(*f.ctx, peer);
    REQUIRE(id.is_ok());
    REQUIRE(f.sessions->state(*id) == ConnectionState::Open);
    REQUIRE(wait_until([&] { return f.rec.count("ws.connect") == 1; }));
    REQUIRE(f.rec.events("ws.connect").front().payload["id"] == id->to_string());

    SECTION("inbound frames become ws.data") {
        REQUIRE(f.sessions->peer_message(*id, PeerMessageType::Text, to_bytes("hi")).is_ok());
        REQUIRE(wait_until([&] { return f.rec.count("ws.data") == 1; }));
        auto e = f.rec.events("ws.data").front();
        REQUIRE(e.payload["type"] == 1);
        REQUIRE(to_text(*relay_core::value_bytes(e.payload["data"])) == "hi");
    }

    SECTION("writes reach the transport") {
        REQUIRE(f.sessions->write(*id, to_bytes("one"), PeerMessageType::Text).is_ok());
        REQUIRE(f.sessions->broadcast_peers(f.ctx->id(), PeerMessageType::Binary, to_bytes("all")) == 1);
        REQUIRE(wait_until([&] { return peer->sent_count() == 2; }));
        std::lock_guard lock(peer->mutex);
        REQUIRE(peer->sent[0] == std::make_pair(PeerMessageType::Text, std::string("one")));
        REQUIRE(peer->sent[1] == std::make_pair(PeerMessageType::Binary, std::string("all")));
    }

    SECTION("send failure becomes ws.error") {
        peer->failing = true;
        REQUIRE(f.sessions->write(*id, to_bytes("x")).is_ok());
        REQUIRE(wait_until([&] { return f.rec.count("ws.error") == 1; }));
        REQUIRE(wait_until([&] { return peer->closed.load(); }));
        REQUIRE_FALSE(f.sessions->state(*id).has_value());
    }

    SECTION("remote close becomes ws.disconnect") {
        f.sessions->peer_closed(*id);
        REQUIRE(wait_until([&] { return f.rec.count("ws.disconnect") == 1; }));
        REQUIRE_FALSE(f.sessions->state(*id).has_value());
        REQUIRE(f.sessions->peer_message(*id, PeerMessageType::Text, to_bytes("x")).is_err());
    }

    SECTION("local close closes the transport silently") {
        REQUIRE(f.sessions->close(*id).is_ok());
        REQUIRE(wait_until([&] { return peer->closed.load(); }));
        f.sessions->peer_closed(*id);
        REQUIRE(f.queue->flush().is_ok());
        REQUIRE(f.rec.count("ws.disconnect") == 0);
    }
}
