#include <catch2/catch_test_macros.hpp>

#include "supex/transport/tcp_socket.hpp"
#include "supex/protocol/line_codec.hpp"
#include "mocks/mock_runtime_server.hpp"
#include "supex/log/logger.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace supex;
using namespace supex::testing;

using namespace std::chrono_literals;

namespace {

/// Port that was just listening and is now closed
std::uint16_t closed_port() {
    MockRuntimeServer server;
    const auto port = server.port();
    server.stop();
    return port;
}

/// Logger that fails on every record
class ThrowingLogger final : public ILogger {
public:
    void log(const LogRecord&) override {
        throw std::runtime_error("log sink unavailable");
    }

    [[nodiscard]] bool should_log(LogLevel) const noexcept override {
        return true;
    }
};

}  // namespace

TEST_CASE("TcpSocket connects with TCP_NODELAY", "[socket]") {
    MockRuntimeServer server;

    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);

    REQUIRE(socket.has_value());
    REQUIRE(socket->is_open());

    int nodelay = 0;
    socklen_t len = sizeof(nodelay);
    REQUIRE(::getsockopt(socket->native_handle(), IPPROTO_TCP, TCP_NODELAY, &nodelay, &len) == 0);
    REQUIRE(nodelay != 0);
}

TEST_CASE("TcpSocket reports a refused connection as a network error", "[socket][error]") {
    const auto port = closed_port();

    auto socket = TcpSocket::connect("127.0.0.1", port, 1s);

    REQUIRE_FALSE(socket.has_value());
    REQUIRE(socket.error().category == TransportError::Category::Network);
    REQUIRE(socket.error().os_error.has_value());
}

TEST_CASE("TcpSocket reports an unresolvable host", "[socket][error]") {
    auto socket = TcpSocket::connect("host.invalid", 9876, 1s);

    REQUIRE_FALSE(socket.has_value());
    REQUIRE(socket.error().category == TransportError::Category::Network);
}

TEST_CASE("TcpSocket send and read round trip with the runtime", "[socket][io]") {
    MockRuntimeServer server;
    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);
    REQUIRE(socket.has_value());

    const Json ping = {{"jsonrpc", "2.0"}, {"method", "ping"}, {"params", Json::object()}, {"id", 1}};
    REQUIRE(socket->send_all(encode_line(ping), 1s).has_value());

    auto frame = read_frame(*socket, 1s);
    REQUIRE(frame.has_value());
    REQUIRE(Json::parse(*frame)["result"]["version"] == "1.0.0");
}

TEST_CASE("TcpSocket read times out when nothing arrives", "[socket][timeout]") {
    MockRuntimeServer server;
    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);
    REQUIRE(socket.has_value());

    char buf[16];
    auto read = socket->read_some(buf, sizeof(buf), 50ms);

    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().category == TransportError::Category::Timeout);
}

TEST_CASE("TcpSocket peek tells idle, pending and closed apart", "[socket][peek]") {
    MockRuntimeServer server;
    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);
    REQUIRE(socket.has_value());

    SECTION("Idle connection would block") {
        REQUIRE(socket->peek() == PeekStatus::WouldBlock);
    }

    SECTION("Unread response is pending and not consumed") {
        const Json ping = {{"jsonrpc", "2.0"}, {"method", "ping"}, {"params", Json::object()}, {"id", 1}};
        REQUIRE(socket->send_all(encode_line(ping), 1s).has_value());

        PeekStatus status = PeekStatus::WouldBlock;
        for (int i = 0; i < 100 && status == PeekStatus::WouldBlock; ++i) {
            std::this_thread::sleep_for(10ms);
            status = socket->peek();
        }
        REQUIRE(status == PeekStatus::DataPending);
        REQUIRE(read_frame(*socket, 1s).has_value());
    }

    SECTION("Server close is visible") {
        // Wait for the server to register the client before dropping it
        for (int i = 0; i < 100 && server.connection_count() == 0; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        server.drop_clients();

        PeekStatus status = PeekStatus::WouldBlock;
        for (int i = 0; i < 100 && status == PeekStatus::WouldBlock; ++i) {
            std::this_thread::sleep_for(10ms);
            status = socket->peek();
        }
        REQUIRE(status == PeekStatus::Closed);
    }
}

TEST_CASE("TcpSocket close is idempotent", "[socket]") {
    MockRuntimeServer server;
    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);
    REQUIRE(socket.has_value());

    REQUIRE(socket->close().has_value());
    REQUIRE_FALSE(socket->is_open());
    REQUIRE(socket->close().has_value());
    REQUIRE(socket->peek() == PeekStatus::Error);
}

TEST_CASE("TcpSocket close reports failure even when logging throws", "[socket][error]") {
    MockRuntimeServer server;
    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);
    REQUIRE(socket.has_value());
    // No other thread may reuse the descriptor number below
    server.stop();

    ::close(socket->native_handle());
    set_logger(std::make_shared<ThrowingLogger>());

    auto closed = socket->close();
    set_logger(nullptr);

    REQUIRE_FALSE(closed.has_value());
    REQUIRE(closed.error().category == TransportError::Category::Network);
    REQUIRE(closed.error().os_error == EBADF);
    REQUIRE_FALSE(socket->is_open());
}

TEST_CASE("TcpSocket send to a reset peer fails without a signal", "[socket][error]") {
    MockRuntimeServer server;
    server.on_tool("drop", [](const Json&) { return PeerResponse::reset(); });

    auto socket = TcpSocket::connect("127.0.0.1", server.port(), 1s);
    REQUIRE(socket.has_value());

    const Json request = {
        {"jsonrpc", "2.0"},
        {"method", "tools/call"},
        {"params", {{"name", "drop"}, {"arguments", Json::object()}}}
    };
    REQUIRE(socket->send_all(encode_line(request), 1s).has_value());

    // Wait for the reset to land
    char buffer[64];
    auto read = socket->read_some(buffer, sizeof(buffer), 1s);
    REQUIRE_FALSE((read.has_value() && *read > 0));

    TransportResult<void> sent;
    const std::string payload(64 * 1024, 'x');
    for (int i = 0; i < 10 && sent.has_value(); ++i) {
        sent = socket->send_all(payload, 1s);
    }

    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().category == TransportError::Category::Network);
}
