#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Line Codec - newline-delimited JSON framing
// ═══════════════════════════════════════════════════════════════════════════
// One message per line: a UTF-8 JSON document followed by a single '\n'.
// There is no length prefix. JSON strings escape raw newlines, so the first
// '\n' on the wire always ends the frame.
//
// Usage:
//   auto bytes = encode_line(request.to_json());
//   socket.send_all(bytes, timeout);
//
//   auto frame = read_frame(socket, timeout, max_bytes);
//   if (frame) {
//       auto message = decode_line(*frame);
//   }

#include "supex/transport.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace supex {

/// Default upper bound on a single inbound frame (10 MiB)
inline constexpr std::size_t kDefaultMaxFrameBytes = 10 * 1024 * 1024;

/// Bytes requested from the source per read
inline constexpr std::size_t kReadChunkSize = 4096;

/// Serialize `message` and append the '\n' delimiter.
/// Invalid UTF-8 inside strings is replaced rather than producing broken JSON.
[[nodiscard]] std::string encode_line(const Json& message);

/// Accumulate bytes from `source` until a chunk containing '\n' arrives and
/// return everything read so far (delimiter included).
///
/// `timeout` bounds the whole frame, not each read.
///
/// Errors:
///   Network  - peer closed before sending anything, or the read failed
///   Timeout  - nothing arrived before the deadline
///   Protocol - peer closed or timed out mid-frame, or the frame grew past
///              `max_bytes` (reported as soon as the limit is crossed)
[[nodiscard]] TransportResult<std::string> read_frame(
    IByteSource& source,
    std::chrono::milliseconds timeout,
    std::size_t max_bytes = kDefaultMaxFrameBytes
);

/// Parse a frame produced by read_frame(). Failures use Category::Parse.
[[nodiscard]] TransportResult<Json> decode_line(std::string_view frame);

}  // namespace supex
