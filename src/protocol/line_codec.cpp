#include "supex/protocol/line_codec.hpp"
#include "supex/log/logger.hpp"

#include <format>

namespace supex {

namespace {

TransportError protocol_error(std::string message) {
    return TransportError{TransportError::Category::Protocol, std::move(message), std::nullopt};
}

}  // namespace

std::string encode_line(const Json& message) {
    std::string line = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

TransportResult<std::string> read_frame(
    IByteSource& source,
    std::chrono::milliseconds timeout,
    std::size_t max_bytes
) {
    std::string data;
    char chunk[kReadChunkSize];
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds{0};
        }

        auto read = source.read_some(chunk, sizeof(chunk), remaining);
        if (!read) {
            const bool timed_out = (read.error().category == TransportError::Category::Timeout);
            if (timed_out && data.empty() == false) {
                return tl::unexpected(protocol_error("Incomplete response: timeout with partial data"));
            }
            if (timed_out) {
                return tl::unexpected(TransportError{
                    TransportError::Category::Timeout,
                    std::format("No response within {}ms", timeout.count()),
                    std::nullopt
                });
            }
            return tl::unexpected(read.error());
        }

        const std::size_t n = *read;
        if (n == 0) {
            if (data.empty()) {
                return tl::unexpected(TransportError{
                    TransportError::Category::Network,
                    "Connection closed by server",
                    std::nullopt
                });
            }
            return tl::unexpected(protocol_error("Incomplete response: connection closed"));
        }

        const std::string_view fresh(chunk, n);
        data.append(fresh);

        if (data.size() > max_bytes) {
            return tl::unexpected(protocol_error(
                std::format("Response exceeds maximum size ({} bytes)", max_bytes)));
        }

        if (fresh.find('\n') != std::string_view::npos) {
            SUPEX_LOG_TRACE(std::format("Received complete response ({} bytes)", data.size()));
            return data;
        }
    }
}

TransportResult<Json> decode_line(std::string_view frame) {
    try {
        return Json::parse(frame);
    } catch (const Json::parse_error& err) {
        return tl::unexpected(TransportError{
            TransportError::Category::Parse,
            std::string("Invalid response: ") + err.what(),
            std::nullopt
        });
    }
}

}  // namespace supex
