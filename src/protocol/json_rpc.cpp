#include "supex/protocol/json_rpc.hpp"

#include <stdexcept>

namespace supex {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};
constexpr std::string_view kDefaultRemoteMessage{"Unknown error from host application"};

bool is_prewrapped_tool_call(const std::string& method, const Json& params) {
    if (method != kToolsCallMethod) {
        return false;
    }
    const bool is_object = params.is_object();
    if (is_object == false) {
        return false;
    }
    return params.contains("name") && params.contains("arguments");
}
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit(
        [&](const auto& id_value) {
            node = id_value;
        },
        value);
    return node;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               Json params,
                               std::optional<JsonRpcId> id)
    : method_(std::move(method)),
      params_(std::move(params)),
      id_(std::move(id)) {
    if (params_.is_null()) {
        params_ = Json::object();
    }
}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const Json& JsonRpcRequest::params() const noexcept {
    return params_;
}

const std::optional<JsonRpcId>& JsonRpcRequest::id() const noexcept {
    return id_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    payload["params"] = params_;
    if (id_.has_value()) {
        payload["id"] = id_->to_json();
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError error;
    error.message = std::string(kDefaultRemoteMessage);
    if (node.is_object() == false) {
        // Some peers send a bare string as the error member
        if (node.is_string() == true) {
            error.message = node.get<std::string>();
        }
        return error;
    }

    if (node.contains("code") && node.at("code").is_number_integer()) {
        error.code = node.at("code").get<std::int64_t>();
    }
    if (node.contains("message") && node.at("message").is_string()) {
        error.message = node.at("message").get<std::string>();
    }
    if (node.contains("data") && (node.at("data").is_null() == false)) {
        error.data = node.at("data");
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(std::variant<Json, JsonRpcError> body, Json id)
    : body_(std::move(body)),
      id_(std::move(id)) {}

bool JsonRpcResponse::is_error() const noexcept {
    return std::holds_alternative<JsonRpcError>(body_);
}

const Json& JsonRpcResponse::result() const {
    if (is_error()) {
        throw std::logic_error("JsonRpcResponse::result() called on an error response");
    }
    return std::get<Json>(body_);
}

const JsonRpcError& JsonRpcResponse::error() const {
    if (is_error() == false) {
        throw std::logic_error("JsonRpcResponse::error() called on a success response");
    }
    return std::get<JsonRpcError>(body_);
}

const Json& JsonRpcResponse::id() const noexcept {
    return id_;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidResponse,
            "response must be a JSON object"});
    }

    Json id = payload.contains("id") ? payload.at("id") : Json{};

    if (payload.contains("error")) {
        return JsonRpcResponse(JsonRpcError::from_json(payload.at("error")), std::move(id));
    }

    Json result = Json::object();
    if (payload.contains("result") && (payload.at("result").is_null() == false)) {
        result = payload.at("result");
    }
    return JsonRpcResponse(std::move(result), std::move(id));
}

// ─────────────────────────────────────────────────────────────────────────────
// Handshake / Command Construction
// ─────────────────────────────────────────────────────────────────────────────

Json HelloParams::to_json() const {
    Json payload = {
        {"name", name},
        {"version", version},
        {"agent", agent},
        {"pid", pid}
    };
    if (token.has_value()) {
        payload["token"] = *token;
    }
    return payload;
}

JsonRpcRequest make_hello_request(const HelloParams& params) {
    return JsonRpcRequest(
        std::string(kHelloMethod),
        params.to_json(),
        JsonRpcId::string(std::string(kHelloMethod)));
}

JsonRpcRequest make_command_request(
    const std::string& method,
    const Json& params,
    std::optional<JsonRpcId> id
) {
    const Json effective_params = params.is_null() ? Json::object() : params;

    const bool is_direct_method = (method == kHelloMethod) || (method == kResourcesListMethod);
    if (is_direct_method || is_prewrapped_tool_call(method, effective_params)) {
        return JsonRpcRequest(method, effective_params, std::move(id));
    }

    Json envelope = {
        {"name", method},
        {"arguments", effective_params}
    };
    return JsonRpcRequest(std::string(kToolsCallMethod), std::move(envelope), std::move(id));
}

}  // namespace supex
