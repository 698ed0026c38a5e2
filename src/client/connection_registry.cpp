#include "supex/client/connection_registry.hpp"
#include "supex/log/logger.hpp"

#include <format>
#include <utility>

namespace supex {

ConnectionRegistry::ConnectionRegistry(ConnectionConfig base)
    : base_(std::move(base))
{}

ConnectionRegistry::~ConnectionRegistry() {
    reset();
}

std::shared_ptr<Connection> ConnectionRegistry::acquire(const std::string& agent) {
    std::shared_ptr<Connection> replaced;
    std::shared_ptr<Connection> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && current_->agent() == agent) {
            return current_;
        }

        if (current_) {
            SUPEX_LOG_INFO(std::format("Agent changed from '{}' to '{}', replacing connection",
                current_->agent(), agent));
        }

        ConnectionConfig config = base_;
        config.with_agent(agent);
        replaced = std::exchange(current_, std::make_shared<Connection>(std::move(config)));
        result = current_;
    }

    // Outside the registry lock: this waits for any command still running on it
    if (replaced) {
        replaced->disconnect();
    }
    return result;
}

std::shared_ptr<Connection> ConnectionRegistry::acquire() {
    return acquire(base_.agent);
}

std::optional<std::string> ConnectionRegistry::current_agent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        return std::nullopt;
    }
    return current_->agent();
}

void ConnectionRegistry::reset() noexcept {
    std::shared_ptr<Connection> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = std::move(current_);
    }
    if (released) {
        released->disconnect();
    }
}

}  // namespace supex
