#pragma once

#include "toolmux/protocol/request_id.hpp"
#include "toolmux/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace toolmux {

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidEnvelope,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, RequestId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const RequestId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    RequestId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& payload);
};

class JsonRpcResponse {
public:
    /// Successful response
    JsonRpcResponse(std::optional<RequestId> id, Json result);
    /// Error response; the id may be null when the server could not read ours
    JsonRpcResponse(std::optional<RequestId> id, JsonRpcError error);

    [[nodiscard]] const std::optional<RequestId>& id() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const Json& result() const noexcept;
    [[nodiscard]] const std::optional<JsonRpcError>& error() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    std::optional<RequestId> id_;
    Json result_;
    std::optional<JsonRpcError> error_;
};

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcMessage - any envelope read from or written to a transport
// ─────────────────────────────────────────────────────────────────────────────

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification, JsonRpcResponse>;

/// Classify and validate an envelope:
///   method + id         -> request
///   method only         -> notification
///   id + result | error -> response
[[nodiscard]] JsonResult<JsonRpcMessage> parse_message(const Json& payload);

[[nodiscard]] Json to_json(const JsonRpcMessage& message);

/// "request", "notification" or "response"
[[nodiscard]] std::string_view message_kind(const JsonRpcMessage& message) noexcept;

}  // namespace toolmux
