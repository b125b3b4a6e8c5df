#include "toolmux/protocol/json_rpc.hpp"

namespace toolmux {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonResult<RequestId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_unsigned() == true) {
        return RequestId::from_uint64(id_node.get<std::uint64_t>());
    }
    if (id_node.is_number_integer() == true) {
        const auto value = id_node.get<std::int64_t>();
        if (value >= 0) {
            return RequestId::from_uint64(static_cast<std::uint64_t>(value));
        }
    }
    if (id_node.is_string() == true) {
        auto parsed = RequestId::parse(id_node.get<std::string>());
        if (parsed.has_value() == true) {
            return *parsed;
        }
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an unsigned 128-bit integer or its decimal string"});
}

JsonResult<void> check_envelope(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidEnvelope,
            "payload must be a JSON object"});
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

JsonResult<std::optional<Json>> parse_params_field(const Json& payload) {
    const bool has_params_field = payload.contains("params");
    if (has_params_field == false) {
        return std::optional<Json>{};
    }
    const Json& params_node = payload.at("params");
    if (params_node.is_null() == true) {
        return std::optional<Json>{};
    }
    if (is_valid_params_type(params_node) == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "params must be an object or array"});
    }
    return std::optional<Json>{params_node};
}

JsonResult<std::string> parse_method_field(const Json& payload) {
    const Json& method_node = payload.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }
    return method_node.get<std::string>();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Request
// ═══════════════════════════════════════════════════════════════════════════

JsonRpcRequest::JsonRpcRequest(std::string method,
                               RequestId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(id),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const RequestId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_string();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    if (payload.contains("method") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }
    auto method = parse_method_field(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    auto params = parse_params_field(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcRequest(std::move(*method), *parsed_id, std::move(*params));
}

// ═══════════════════════════════════════════════════════════════════════════
// Notification
// ═══════════════════════════════════════════════════════════════════════════

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    if (payload.contains("method") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }
    auto method = parse_method_field(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    auto params = parse_params_field(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcNotification(std::move(*method), std::move(*params));
}

// ═══════════════════════════════════════════════════════════════════════════
// Error object
// ═══════════════════════════════════════════════════════════════════════════

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidEnvelope,
            "error must be an object"});
    }
    const bool has_code = payload.contains("code") && payload.at("code").is_number_integer();
    if (has_code == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "error.code must be an integer"});
    }

    JsonRpcError error;
    error.code = payload.at("code").get<std::int64_t>();
    error.message = payload.value("message", "");
    if (payload.contains("data")) {
        error.data = payload.at("data");
    }
    return error;
}

// ═══════════════════════════════════════════════════════════════════════════
// Response
// ═══════════════════════════════════════════════════════════════════════════

JsonRpcResponse::JsonRpcResponse(std::optional<RequestId> id, Json result)
    : id_(id),
      result_(std::move(result)) {}

JsonRpcResponse::JsonRpcResponse(std::optional<RequestId> id, JsonRpcError error)
    : id_(id),
      error_(std::move(error)) {}

const std::optional<RequestId>& JsonRpcResponse::id() const noexcept {
    return id_;
}

bool JsonRpcResponse::is_error() const noexcept {
    return error_.has_value();
}

const Json& JsonRpcResponse::result() const noexcept {
    return result_;
}

const std::optional<JsonRpcError>& JsonRpcResponse::error() const noexcept {
    return error_;
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    if (id_.has_value()) {
        payload["id"] = id_->to_string();
    } else {
        payload["id"] = nullptr;
    }
    if (error_.has_value()) {
        payload["error"] = error_->to_json();
    } else {
        payload["result"] = result_;
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }

    std::optional<RequestId> id;
    const Json& id_node = payload.at("id");
    if (id_node.is_null() == false) {
        auto parsed_id = parse_id_field(id_node);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        id = *parsed_id;
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidEnvelope,
            "response must carry exactly one of result or error"});
    }

    if (has_error == true) {
        auto error = JsonRpcError::from_json(payload.at("error"));
        if (error.has_value() == false) {
            return tl::unexpected(error.error());
        }
        return JsonRpcResponse(id, std::move(*error));
    }

    if (id.has_value() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "successful response must carry an id"});
    }
    return JsonRpcResponse(id, payload.at("result"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Message classification
// ═══════════════════════════════════════════════════════════════════════════

JsonResult<JsonRpcMessage> parse_message(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidEnvelope,
            "payload must be a JSON object"});
    }

    const bool has_method = payload.contains("method");
    const bool has_id = payload.contains("id");

    if ((has_method == true) && (has_id == true)) {
        auto request = JsonRpcRequest::from_json(payload);
        if (request.has_value() == false) {
            return tl::unexpected(request.error());
        }
        return JsonRpcMessage{std::move(*request)};
    }
    if (has_method == true) {
        auto notification = JsonRpcNotification::from_json(payload);
        if (notification.has_value() == false) {
            return tl::unexpected(notification.error());
        }
        return JsonRpcMessage{std::move(*notification)};
    }
    if (has_id == true) {
        auto response = JsonRpcResponse::from_json(payload);
        if (response.has_value() == false) {
            return tl::unexpected(response.error());
        }
        return JsonRpcMessage{std::move(*response)};
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidEnvelope,
        "envelope has neither method nor id"});
}

Json to_json(const JsonRpcMessage& message) {
    return std::visit([](const auto& m) { return m.to_json(); }, message);
}

std::string_view message_kind(const JsonRpcMessage& message) noexcept {
    switch (message.index()) {
        case 0: return "request";
        case 1: return "notification";
        case 2: return "response";
    }
    return "unknown";
}

}  // namespace toolmux
