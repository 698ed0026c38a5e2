#include <catch2/catch_test_macros.hpp>

#include "supex/client/connection_registry.hpp"
#include "mocks/mock_runtime_server.hpp"

using namespace supex;
using namespace supex::testing;

using namespace std::chrono_literals;

namespace {

ConnectionConfig base_config(const MockRuntimeServer& server) {
    return ConnectionConfig{}
        .with_host("127.0.0.1")
        .with_port(server.port())
        .with_timeout(2s)
        .with_agent("base-agent");
}

}  // namespace

TEST_CASE("Registry starts empty", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    REQUIRE_FALSE(registry.current_agent().has_value());
    REQUIRE(registry.base_config().agent == "base-agent");
}

TEST_CASE("Registry acquire never connects", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    auto conn = registry.acquire("mcp");

    REQUIRE(conn != nullptr);
    REQUIRE_FALSE(conn->is_connected());
    REQUIRE(server.connection_count() == 0);
    REQUIRE(registry.current_agent() == "mcp");
    REQUIRE(conn->agent() == "mcp");
}

TEST_CASE("Registry returns the same connection for the same agent", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    auto first = registry.acquire("mcp");
    auto second = registry.acquire("mcp");

    REQUIRE(first.get() == second.get());

    REQUIRE(first->send_command("ping").has_value());
    REQUIRE(second->send_command("ping").has_value());
    REQUIRE(server.connection_count() == 1);
}

TEST_CASE("Registry uses the base agent by default", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    auto conn = registry.acquire();
    REQUIRE(conn->agent() == "base-agent");
    REQUIRE(registry.acquire("base-agent").get() == conn.get());
}

TEST_CASE("Registry replaces the connection when the agent changes", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    auto old_conn = registry.acquire("mcp");
    REQUIRE(old_conn->send_command("ping").has_value());
    REQUIRE(old_conn->is_connected());

    auto new_conn = registry.acquire("cli");

    REQUIRE(new_conn.get() != old_conn.get());
    REQUIRE(registry.current_agent() == "cli");
    REQUIRE_FALSE(old_conn->is_connected());
    REQUIRE_FALSE(new_conn->is_connected());

    REQUIRE(new_conn->send_command("ping").has_value());
    REQUIRE(server.last_hello().value()["params"]["agent"] == "cli");
    REQUIRE(server.connection_count() == 2);
}

TEST_CASE("A replaced connection remains usable by its holder", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    auto old_conn = registry.acquire("mcp");
    auto new_conn = registry.acquire("cli");

    REQUIRE(old_conn->send_command("ping").has_value());
    REQUIRE(server.last_hello().value()["params"]["agent"] == "mcp");
}

TEST_CASE("Registry reset disconnects and forgets", "[registry]") {
    MockRuntimeServer server;
    ConnectionRegistry registry(base_config(server));

    auto conn = registry.acquire("mcp");
    REQUIRE(conn->send_command("ping").has_value());

    registry.reset();

    REQUIRE_FALSE(conn->is_connected());
    REQUIRE_FALSE(registry.current_agent().has_value());
    REQUIRE(registry.acquire("mcp").get() != conn.get());

    REQUIRE_NOTHROW(registry.reset());
    REQUIRE_NOTHROW(registry.reset());
}
