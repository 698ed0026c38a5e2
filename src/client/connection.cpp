#include "supex/client/connection.hpp"
#include "supex/log/logger.hpp"
#include "supex/protocol/line_codec.hpp"

#include <unistd.h>

#include <exception>
#include <format>
#include <thread>

namespace supex {

namespace {

constexpr std::size_t kRawPreviewBytes = 200;

/// Frame text for logs, without the trailing delimiter
std::string_view log_view(std::string_view frame) {
    while (!frame.empty() && (frame.back() == '\n' || frame.back() == '\r')) {
        frame.remove_suffix(1);
    }
    return frame;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Connection::Connection(ConnectionConfig config)
    : config_(std::move(config))
    , retry_policy_(RetryPolicy(config_.retry_policy).with_max_retries(config_.max_retries))
{}

Connection::~Connection() {
    disconnect();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

bool Connection::connect() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return connect_locked();
}

void Connection::disconnect() noexcept {
    std::lock_guard<std::mutex> lock(io_mutex_);
    disconnect_locked();
}

bool Connection::is_healthy() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return is_healthy_locked();
}

bool Connection::connect_locked() {
    disconnect_locked();

    try {
        SUPEX_LOG_DEBUG(std::format("Connecting to {} as agent '{}'", endpoint(), config_.agent));

        auto socket = TcpSocket::connect(config_.host, config_.port, config_.timeout);
        if (!socket) {
            SUPEX_LOG_WARN(std::format("Failed to connect to {}: {}", endpoint(), socket.error().message));
            return false;
        }
        socket_ = std::move(*socket);

        HelloParams hello{
            config_.client_name,
            config_.client_version,
            config_.agent,
            static_cast<std::int64_t>(::getpid()),
            config_.token
        };

        auto response = exchange_locked(encode_line(make_hello_request(hello).to_json()));
        if (!response) {
            SUPEX_LOG_ERROR(std::format("Handshake with {} failed: {}", endpoint(), response.error().message));
            disconnect_locked();
            return false;
        }
        if (response->is_error()) {
            const auto& err = response->error();
            SUPEX_LOG_ERROR(std::format("Handshake rejected by {}: [{}] {}", endpoint(), err.code, err.message));
            disconnect_locked();
            return false;
        }

        identified_ = true;
        last_activity_ = Clock::now();
        server_info_ = response->result();
        SUPEX_LOG_DEBUG(std::format("Identified with {} as agent '{}'", endpoint(), config_.agent));
        return true;
    } catch (const std::exception& e) {
        SUPEX_LOG_ERROR(std::format("Connecting to {} failed: {}", endpoint(), e.what()));
        disconnect_locked();
        return false;
    }
}

void Connection::disconnect_locked() noexcept {
    if (socket_.has_value()) {
        auto closed = socket_->close();
        if (!closed) {
            try {
                SUPEX_LOG_WARN("Error closing socket: " + closed.error().message);
            } catch (const std::exception&) {
                // Teardown continues without the log line
            }
        }
    }
    socket_.reset();
    identified_ = false;
    server_info_.reset();
}

bool Connection::is_healthy_locked() const {
    if (socket_.has_value() == false || identified_ == false) {
        return false;
    }

    const bool idle_check_enabled = config_.max_idle.count() > 0;
    if (idle_check_enabled && last_activity_.has_value()) {
        const auto idle = Clock::now() - *last_activity_;
        if (idle > config_.max_idle) {
            SUPEX_LOG_DEBUG(std::format("Connection idle for {}ms, treating as stale",
                std::chrono::duration_cast<std::chrono::milliseconds>(idle).count()));
            return false;
        }
    }

    // Nothing waiting is the only healthy answer: unsolicited bytes mean the
    // stream is out of step with our requests
    const PeekStatus status = socket_->peek();
    if (status == PeekStatus::WouldBlock) {
        return true;
    }
    SUPEX_LOG_DEBUG(std::format("Health probe reported {}", to_string(status)));
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────────────────────────────

BridgeResult<Json> Connection::send_command(
    const std::string& method,
    const Json& params,
    std::optional<JsonRpcId> id
) {
    std::lock_guard<std::mutex> lock(io_mutex_);

    try {
        if (is_healthy_locked() == false) {
            if (socket_.has_value()) {
                SUPEX_LOG_INFO("Connection unhealthy, reconnecting");
            }
            if (connect_locked() == false) {
                return tl::unexpected(BridgeError::connection(
                    std::format("Not connected to host application at {}", endpoint())));
            }
        }

        const JsonRpcRequest request = make_command_request(method, params, std::move(id));
        const std::string wire = encode_line(request.to_json());

        std::size_t retries = 0;
        while (true) {
            SUPEX_LOG_DEBUG(std::format("Sending {} (attempt {}/{})",
                method, retries + 1, retry_policy_.max_attempts()));

            auto response = exchange_locked(wire);
            if (response) {
                last_activity_ = Clock::now();
                if (response->is_error()) {
                    return tl::unexpected(BridgeError::from_rpc_error(response->error()));
                }
                return response->result();
            }

            const TransportError& err = response.error();
            if (retry_policy_.is_retryable(err.category) == false) {
                disconnect_locked();
                return tl::unexpected(BridgeError::from_transport(err));
            }

            if (retry_policy_.should_retry(err.category, retries) == false) {
                disconnect_locked();
                SUPEX_LOG_ERROR(std::format("{} failed after {} attempts: {}",
                    method, retries + 1, err.message));
                return tl::unexpected(BridgeError::connection(
                    std::format("Connection to {} lost after {} attempts: {}",
                        endpoint(), retries + 1, err.message),
                    err.category));
            }

            SUPEX_LOG_WARN(std::format("{} error on attempt {}/{}: {}",
                to_string(err.category), retries + 1, retry_policy_.max_attempts(), err.message));

            disconnect_locked();
            const auto delay = config_.backoff_policy->next_delay(retries);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            ++retries;

            SUPEX_LOG_INFO(std::format("Reconnecting to {} (retry {}/{})",
                endpoint(), retries, retry_policy_.max_retries()));
            if (connect_locked() == false) {
                return tl::unexpected(BridgeError::connection(
                    std::format("Failed to reconnect to {} after {}", endpoint(), err.message),
                    err.category));
            }
        }
    } catch (...) {
        // Leave nothing half-used behind; the exception reaches the caller unchanged
        disconnect_locked();
        throw;
    }
}

TransportResult<JsonRpcResponse> Connection::exchange_locked(const std::string& wire) {
    if (socket_.has_value() == false) {
        return tl::unexpected(TransportError{TransportError::Category::Network, "Socket is not open"});
    }

    SUPEX_LOG_TRACE(std::format("-> {}", log_view(wire)));
    auto sent = socket_->send_all(wire, config_.timeout);
    if (!sent) {
        return tl::unexpected(sent.error());
    }

    auto frame = read_frame(*socket_, config_.timeout, config_.max_response_bytes);
    if (!frame) {
        return tl::unexpected(frame.error());
    }
    SUPEX_LOG_TRACE(std::format("<- {}", log_view(*frame)));

    auto message = decode_line(*frame);
    if (!message) {
        SUPEX_LOG_ERROR(std::format("{}; raw response: {}",
            message.error().message, std::string_view(*frame).substr(0, kRawPreviewBytes)));
        return tl::unexpected(message.error());
    }

    auto response = JsonRpcResponse::from_json(*message);
    if (!response) {
        return tl::unexpected(TransportError{
            TransportError::Category::Parse,
            "Invalid response: " + response.error().message});
    }
    return std::move(*response);
}

// ─────────────────────────────────────────────────────────────────────────────
// State
// ─────────────────────────────────────────────────────────────────────────────

bool Connection::is_connected() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return socket_.has_value();
}

bool Connection::is_identified() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return identified_;
}

std::optional<Connection::Clock::time_point> Connection::last_activity() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return last_activity_;
}

std::optional<Json> Connection::server_info() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return server_info_;
}

std::string Connection::endpoint() const {
    return std::format("{}:{}", config_.host, config_.port);
}

}  // namespace supex
