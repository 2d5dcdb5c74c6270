// relay_net connection state and parameter tests

#include <catch2/catch.hpp>
#include <relay/net/types.hpp>

using namespace relay_net;
using relay_core::ErrorCode;
using relay_core::Value;

// =============================================================================
// State Machine
// =============================================================================

TEST_CASE("Connection state transitions", "[net][state]") {
    SECTION("connecting resolves once") {
        REQUIRE(is_valid_transition(ConnectionState::Connecting, ConnectionState::Open));
        REQUIRE(is_valid_transition(ConnectionState::Connecting, ConnectionState::Failed));
        REQUIRE_FALSE(is_valid_transition(ConnectionState::Connecting, ConnectionState::Closed));
        REQUIRE_FALSE(is_valid_transition(ConnectionState::Connecting, ConnectionState::Errored));
    }

    SECTION("open ends in closed or errored") {
        REQUIRE(is_valid_transition(ConnectionState::Open, ConnectionState::Closed));
        REQUIRE(is_valid_transition(ConnectionState::Open, ConnectionState::Errored));
        REQUIRE_FALSE(is_valid_transition(ConnectionState::Open, ConnectionState::Connecting));
        REQUIRE_FALSE(is_valid_transition(ConnectionState::Open, ConnectionState::Failed));
    }

    SECTION("terminal states are final") {
        for (auto from : {ConnectionState::Failed, ConnectionState::Closed, ConnectionState::Errored}) {
            REQUIRE(is_terminal(from));
            for (auto to : {ConnectionState::Connecting, ConnectionState::Open, ConnectionState::Failed,
                            ConnectionState::Closed, ConnectionState::Errored}) {
                REQUIRE_FALSE(is_valid_transition(from, to));
            }
        }
        REQUIRE_FALSE(is_terminal(ConnectionState::Open));
    }
}

// =============================================================================
// ConnectParams
// =============================================================================

TEST_CASE("ConnectParams parsing", "[net][params]") {
    SECTION("numeric port") {
        auto p = ConnectParams::from_json(Value{{"host", "example.org"}, {"port", 80}});
        REQUIRE(p.is_ok());
        REQUIRE(p->protocol == "tcp");
        REQUIRE(p->validate().is_ok());
        REQUIRE(p->endpoint() == "example.org:80");
    }

    SECTION("string port") {
        auto p = ConnectParams::from_json(Value{{"host", "h"}, {"port", "6667"}});
        REQUIRE(p.is_ok());
        REQUIRE(p->port == 6667);
    }

    SECTION("malformed port") {
        REQUIRE(ConnectParams::from_json(Value{{"host", "h"}, {"port", "80x"}}).is_err());
        REQUIRE(ConnectParams::from_json(Value{{"host", "h"}, {"port", true}}).is_err());
    }

    SECTION("validation") {
        auto missing_host = ConnectParams::from_json(Value{{"port", 80}});
        REQUIRE(missing_host.is_ok());
        REQUIRE(missing_host->validate().is_err());

        auto zero_port = ConnectParams::from_json(Value{{"host", "h"}, {"port", 0}});
        REQUIRE(zero_port->validate().is_err());

        auto big_port = ConnectParams::from_json(Value{{"host", "h"}, {"port", 70000}});
        REQUIRE(big_port->validate().is_err());

        auto negative = ConnectParams::from_json(Value{{"host", "h"}, {"port", -1}});
        REQUIRE(negative->validate().is_err());

        auto udp = ConnectParams::from_json(Value{{"host", "h"}, {"port", 53}, {"protocol", "udp"}});
        auto r = udp->validate();
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("not an object") {
        REQUIRE(ConnectParams::from_json(Value("example.org:80")).is_err());
    }
}

// =============================================================================
// DbParams
// =============================================================================

TEST_CASE("DbParams parsing", "[net][params]") {
    SECTION("sqlite needs no host") {
        auto p = DbParams::from_json(Value{{"driver", "sqlite3"}});
        REQUIRE(p.is_ok());
        REQUIRE(p->validate().is_ok());
        REQUIRE_FALSE(p->is_remote());
    }

    SECTION("remote drivers need a host") {
        auto p = DbParams::from_json(Value{{"driver", "postgres"}});
        REQUIRE(p->is_remote());
        REQUIRE(p->validate().is_err());
    }

    SECTION("well-known ports") {
        auto pg = DbParams::from_json(Value{{"driver", "postgres"}, {"host", "db"}});
        REQUIRE(pg->effective_port() == 5432);
        REQUIRE(pg->endpoint() == "db:5432");

        auto custom = DbParams::from_json(Value{{"driver", "postgres"}, {"host", "db"}, {"port", 6543}});
        REQUIRE(custom->effective_port() == 6543);
    }

    SECTION("drivers without a client library are rejected") {
        auto p = DbParams::from_json(Value{{"driver", "mysql"}, {"host", "db"}});
        REQUIRE(p.is_ok());
        REQUIRE(p->validate().is_err());
    }

    SECTION("unknown driver") {
        auto p = DbParams::from_json(Value{{"driver", "oracle"}, {"host", "db"}});
        REQUIRE(p.is_ok());
        REQUIRE(p->validate().is_err());
    }

    SECTION("missing driver") {
        auto p = DbParams::from_json(Value::object());
        REQUIRE(p->validate().is_err());
    }
}
