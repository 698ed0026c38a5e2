#ifndef SUPEX_TESTS_MOCK_RUNTIME_SERVER_HPP
#define SUPEX_TESTS_MOCK_RUNTIME_SERVER_HPP

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace supex::testing {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// PeerResponse - what the mock runtime does with one request
// ─────────────────────────────────────────────────────────────────────────────

struct PeerResponse {
    enum class Action {
        Reply,   // {"result": payload}
        Error,   // {"error": payload}
        Reset,   // abortive close (RST) without answering
        Close,   // orderly close without answering
        Raw,     // write `raw` verbatim and keep the connection
        Silent   // never answer
    };

    Action action{Action::Reply};
    Json payload;
    std::string raw;
    std::chrono::milliseconds delay{0};

    static PeerResponse reply(Json result) {
        return {Action::Reply, std::move(result), {}, {}};
    }

    static PeerResponse error(std::int64_t code, std::string message, std::optional<Json> data = std::nullopt) {
        Json err = {{"code", code}, {"message", std::move(message)}};
        if (data) {
            err["data"] = std::move(*data);
        }
        return {Action::Error, std::move(err), {}, {}};
    }

    static PeerResponse reset() { return {Action::Reset, {}, {}, {}}; }
    static PeerResponse close() { return {Action::Close, {}, {}, {}}; }
    static PeerResponse raw_bytes(std::string bytes) { return {Action::Raw, {}, std::move(bytes), {}}; }
    static PeerResponse silent() { return {Action::Silent, {}, {}, {}}; }

    PeerResponse& after(std::chrono::milliseconds d) {
        delay = d;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// MockRuntimeServer
// ─────────────────────────────────────────────────────────────────────────────
// Loopback stand-in for the runtime inside the host application. Listens on
// 127.0.0.1 with an ephemeral port, serves each client on its own thread and
// speaks newline-delimited JSON-RPC.
//
// Built-in behavior:
// - hello  -> {"name": "mock-runtime", "version": "1.0.0"}
// - tools/call ping -> {"version": "1.0.0"}
// - others -> error -32601
//
// Usage:
//   MockRuntimeServer server;
//   server.on_tool("get_layers", [](const Json&) {
//       return PeerResponse::reply({{"layers", Json::array()}});
//   });
//
//   Connection conn(ConnectionConfig{}.with_host("127.0.0.1").with_port(server.port()));
//   auto result = conn.send_command("get_layers");
//
//   REQUIRE(server.connection_count() == 1);

class MockRuntimeServer {
public:
    /// Receives the whole request object
    using Handler = std::function<PeerResponse(const Json& request)>;

    MockRuntimeServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("mock server: socket() failed");
        }

        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("mock server: bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        running_ = true;
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~MockRuntimeServer() {
        stop();
    }

    MockRuntimeServer(const MockRuntimeServer&) = delete;
    MockRuntimeServer& operator=(const MockRuntimeServer&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Scripting
    // ─────────────────────────────────────────────────────────────────────────

    /// Handler for a wire-level method (hello, resources/list, ...)
    void on_method(const std::string& method, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        method_handlers_[method] = std::move(handler);
    }

    /// Handler for a tools/call whose params.name is `name`
    void on_tool(const std::string& name, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        tool_handlers_[name] = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::size_t connection_count() const noexcept { return connections_.load(); }

    [[nodiscard]] std::size_t hello_count() const noexcept { return hellos_.load(); }

    /// Every parsed request, in arrival order
    [[nodiscard]] std::vector<Json> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    /// Requests excluding hello handshakes
    [[nodiscard]] std::vector<Json> command_requests() const {
        std::vector<Json> result;
        for (auto& request : requests()) {
            if (request.value("method", "") != "hello") {
                result.push_back(std::move(request));
            }
        }
        return result;
    }

    [[nodiscard]] std::optional<Json> last_hello() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
            if (it->value("method", "") == "hello") {
                return *it;
            }
        }
        return std::nullopt;
    }

    /// Close every open client connection from the server side
    void drop_clients() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int fd : client_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void stop() {
        if (running_.exchange(false) == false) {
            return;
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        drop_clients();
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(client_threads_);
        }
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ::close(listen_fd_);
    }

private:
    void accept_loop() {
        while (running_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            const int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.insert(fd);
            client_threads_.emplace_back([this, fd] { serve(fd); });
            ++connections_;
        }
    }

    void serve(int fd) {
        std::string buffer;
        char chunk[4096];
        bool open = true;

        while (running_ && open) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));

            std::size_t newline;
            while (open && (newline = buffer.find('\n')) != std::string::npos) {
                const std::string line = buffer.substr(0, newline);
                buffer.erase(0, newline + 1);
                open = handle_line(fd, line);
            }
        }

        release(fd);
    }

    /// Returns false once the connection has been closed
    bool handle_line(int fd, const std::string& line) {
        Json request;
        try {
            request = Json::parse(line);
        } catch (const Json::parse_error&) {
            return true;
        }

        const std::string method = request.value("method", "");
        if (method == "hello") {
            ++hellos_;
        }

        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = find_handler(method, request);
        }

        PeerResponse response = handler ? handler(request) : default_response(method, request);
        if (response.delay.count() > 0) {
            std::this_thread::sleep_for(response.delay);
        }

        const Json id = request.contains("id") ? request.at("id") : Json();
        switch (response.action) {
            case PeerResponse::Action::Reply:
                return write_all(fd, Json{{"jsonrpc", "2.0"}, {"result", response.payload}, {"id", id}}.dump() + "\n");
            case PeerResponse::Action::Error:
                return write_all(fd, Json{{"jsonrpc", "2.0"}, {"error", response.payload}, {"id", id}}.dump() + "\n");
            case PeerResponse::Action::Raw:
                return write_all(fd, response.raw);
            case PeerResponse::Action::Reset: {
                linger lg{1, 0};
                ::setsockopt(fd, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
                return false;
            }
            case PeerResponse::Action::Close:
                ::shutdown(fd, SHUT_RDWR);
                return false;
            case PeerResponse::Action::Silent:
                return true;
        }
        return true;
    }

    Handler find_handler(const std::string& method, const Json& request) const {
        if (method == "tools/call") {
            const Json params = request.value("params", Json::object());
            const std::string name = params.is_object() ? params.value("name", "") : "";
            if (auto it = tool_handlers_.find(name); it != tool_handlers_.end()) {
                return it->second;
            }
        }
        if (auto it = method_handlers_.find(method); it != method_handlers_.end()) {
            return it->second;
        }
        return nullptr;
    }

    static PeerResponse default_response(const std::string& method, const Json& request) {
        if (method == "hello") {
            return PeerResponse::reply({{"name", "mock-runtime"}, {"version", "1.0.0"}});
        }
        if (method == "tools/call") {
            const Json params = request.value("params", Json::object());
            if (params.is_object() && params.value("name", "") == "ping") {
                return PeerResponse::reply({{"version", "1.0.0"}});
            }
            return PeerResponse::error(-32601, "Unknown tool");
        }
        return PeerResponse::error(-32601, "Method not found: " + method);
    }

    static bool write_all(int fd, const std::string& data) {
        std::size_t sent = 0;
        while (sent < data.size()) {
            const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<std::size_t>(n);
        }
        return true;
    }

    void release(int fd) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.erase(fd);
        }
        ::close(fd);
    }

    int listen_fd_{-1};
    std::uint16_t port_{0};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> connections_{0};
    std::atomic<std::size_t> hellos_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Handler> method_handlers_;
    std::unordered_map<std::string, Handler> tool_handlers_;
    std::vector<Json> requests_;
    std::set<int> client_fds_;
    std::vector<std::thread> client_threads_;
    std::thread accept_thread_;
};

}  // namespace supex::testing

#endif  // SUPEX_TESTS_MOCK_RUNTIME_SERVER_HPP
