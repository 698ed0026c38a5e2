#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace supex {

using Json = nlohmann::json;

inline constexpr std::string_view kHelloMethod{"hello"};
inline constexpr std::string_view kResourcesListMethod{"resources/list"};
inline constexpr std::string_view kToolsCallMethod{"tools/call"};

struct JsonError {
    enum class Code {
        InvalidResponse
    };

    Code code{Code::InvalidResponse};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

class JsonRpcRequest {
public:
    /// `params` must be an object or array; an absent id is omitted on the wire.
    JsonRpcRequest(std::string method, Json params, std::optional<JsonRpcId> id = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const Json& params() const noexcept;
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    Json params_;
    std::optional<JsonRpcId> id_;
};

struct JsonRpcError {
    std::int64_t code{-1};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& node);
};

/// Inbound message carrying exactly one of `result` / `error`.
class JsonRpcResponse {
public:
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const Json& result() const;
    [[nodiscard]] const JsonRpcError& error() const;
    [[nodiscard]] const Json& id() const noexcept;

    /// `error` wins when both members are present; a missing `result`
    /// becomes an empty object.
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse(std::variant<Json, JsonRpcError> body, Json id);

    std::variant<Json, JsonRpcError> body_;
    Json id_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Handshake
// ─────────────────────────────────────────────────────────────────────────────

struct HelloParams {
    std::string name;
    std::string version;
    std::string agent;
    std::int64_t pid{0};
    std::optional<std::string> token;  // serialized only when set

    [[nodiscard]] Json to_json() const;
};

/// The hello request always uses the string id "hello".
[[nodiscard]] JsonRpcRequest make_hello_request(const HelloParams& params);

/// Build the wire request for a logical command.
///
/// `hello` and `resources/list` are sent as direct calls, as is a `tools/call`
/// whose params already carry `name` and `arguments`. Every other method is
/// wrapped as `tools/call` with params `{name: method, arguments: params}`.
/// Null params become an empty object.
[[nodiscard]] JsonRpcRequest make_command_request(
    const std::string& method,
    const Json& params,
    std::optional<JsonRpcId> id = std::nullopt
);

}  // namespace supex
