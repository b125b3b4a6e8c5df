#include "toolmux/async/protocol_client.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/bind_cancellation_slot.hpp>
#include <asio/cancellation_signal.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <type_traits>

namespace toolmux::async {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Timeout race
// ─────────────────────────────────────────────────────────────────────────────
// The transport op runs as its own coroutine bound to a cancellation
// signal. Whichever of op and timer finishes first fills the one-slot
// channel; if the timer wins, the op is cancelled.

template <typename T, typename Op>
asio::awaitable<ProtocolResult<T>> run_with_timeout(
    asio::any_io_executor executor,
    Op op,
    std::chrono::milliseconds timeout,
    std::string what
) {
    using Outcome = ProtocolResult<T>;
    using Channel = asio::experimental::channel<void(asio::error_code, std::optional<Outcome>)>;

    auto done = std::make_shared<Channel>(executor, 1);
    auto signal = std::make_shared<asio::cancellation_signal>();
    auto timer = std::make_shared<asio::steady_timer>(executor, timeout);

    asio::co_spawn(
        executor,
        [op = std::move(op), done, signal]() -> asio::awaitable<void> {
            auto result = co_await op();
            if (!result) {
                done->try_send(asio::error_code{}, std::optional<Outcome>(
                    tl::unexpected(ProtocolError::transport(std::move(result.error())))));
            } else if constexpr (std::is_void_v<T>) {
                done->try_send(asio::error_code{}, std::optional<Outcome>(Outcome{}));
            } else {
                done->try_send(asio::error_code{}, std::optional<Outcome>(Outcome(std::move(*result))));
            }
        },
        asio::bind_cancellation_slot(signal->slot(), asio::detached)
    );

    timer->async_wait([done, what](const asio::error_code& ec) {
        if (ec) {
            return;  // cancelled: the op finished first
        }
        done->try_send(asio::error_code{}, std::optional<Outcome>(
            tl::unexpected(ProtocolError::timeout(what + " timed out"))));
    });

    std::optional<Outcome> first;
    try {
        first = co_await done->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        timer->cancel();
        signal->emit(asio::cancellation_type::terminal);
        co_return tl::unexpected(ProtocolError::transport(
            TransportError::io(what + " aborted: " + e.what())));
    }

    timer->cancel();
    if (first->has_value() == false && first->error().kind == ProtocolError::Kind::Timeout) {
        TOOLMUX_LOG_WARN(first->error().message);
        signal->emit(asio::cancellation_type::terminal);
    }
    co_return std::move(*first);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ProtocolClient
// ═══════════════════════════════════════════════════════════════════════════

ProtocolClient::ProtocolClient(std::unique_ptr<ITransport> transport, ProtocolClientConfig config)
    : transport_(std::move(transport))
    , config_(config)
{}

asio::awaitable<ProtocolResult<JsonRpcResponse>> ProtocolClient::async_request(
    std::string method,
    std::optional<Json> params
) {
    auto id = RequestId::random();
    JsonRpcMessage request{JsonRpcRequest(method, id, std::move(params))};
    auto executor = transport_->get_executor();

    TOOLMUX_LOG_DEBUG("request '" + method + "' id=" + id.to_string());

    auto sent = co_await run_with_timeout<void>(
        executor,
        [transport = transport_, request]() { return transport->async_send(request); },
        config_.send_timeout,
        "send '" + method + "'"
    );
    if (!sent) {
        if (sent.error().kind == ProtocolError::Kind::Timeout) {
            abandon(id);
        }
        co_return tl::unexpected(sent.error());
    }

    // One deadline for the whole wait, however many stale replies are skipped
    auto deadline = std::chrono::steady_clock::now() + config_.listen_timeout;
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            abandon(id);
            TOOLMUX_LOG_WARN("response to '" + method + "' timed out");
            co_return tl::unexpected(ProtocolError::timeout("response to '" + method + "' timed out"));
        }

        auto reply = co_await run_with_timeout<JsonRpcMessage>(
            executor,
            [transport = transport_]() { return transport->async_listen(); },
            remaining,
            "response to '" + method + "'"
        );
        if (!reply) {
            if (reply.error().kind == ProtocolError::Kind::Timeout) {
                abandon(id);
            }
            co_return tl::unexpected(reply.error());
        }

        auto* response = std::get_if<JsonRpcResponse>(&*reply);
        if (response != nullptr && response->id().has_value() && *response->id() != id &&
            forget_abandoned(*response->id())) {
            TOOLMUX_LOG_DEBUG("discarding late response " + response->id()->to_string());
            continue;
        }

        co_return expect_response(std::move(*reply), id, method);
    }
}

asio::awaitable<ProtocolResult<void>> ProtocolClient::async_notify(
    std::string method,
    std::optional<Json> params
) {
    JsonRpcMessage notification{JsonRpcNotification(method, std::move(params))};

    co_return co_await run_with_timeout<void>(
        transport_->get_executor(),
        [transport = transport_, notification]() { return transport->async_send(notification); },
        config_.send_timeout,
        "notify '" + method + "'"
    );
}

asio::awaitable<ProtocolResult<InitializeResult>> ProtocolClient::async_initialize(
    Implementation client_info
) {
    auto id = RequestId::random();
    JsonRpcRequest greeting(
        "initialize",
        id,
        Json{
            {"protocolVersion", kMcpProtocolVersion},
            {"capabilities", Json::object()},
            {"clientInfo", client_info.to_json()}
        }
    );

    auto reply = co_await run_with_timeout<JsonRpcMessage>(
        transport_->get_executor(),
        [transport = transport_, greeting]() { return transport->async_init(greeting); },
        config_.init_timeout,
        "initialize"
    );
    if (!reply) {
        co_return tl::unexpected(reply.error());
    }

    auto response = expect_response(std::move(*reply), id, "initialize");
    if (!response) {
        co_return tl::unexpected(response.error());
    }

    InitializeResult result;
    try {
        result = InitializeResult::from_json(response->result());
    } catch (const Json::exception& e) {
        co_return tl::unexpected(ProtocolError::unexpected_message(
            "malformed initialize result: " + std::string(e.what())));
    }

    auto notified = co_await async_notify("notifications/initialized");
    if (!notified) {
        co_return tl::unexpected(notified.error());
    }

    TOOLMUX_LOG_DEBUG("handshake complete with '" + result.server_info.name +
                      "' (protocol " + result.protocol_version + ")");
    co_return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Idle listening
// ─────────────────────────────────────────────────────────────────────────────
// The listen runs as its own coroutine so it can be cancelled from outside.
// Nothing here touches `this` after the first suspension.

asio::awaitable<std::optional<TransportResult<JsonRpcMessage>>> ProtocolClient::async_listen_idle() {
    using Outcome = TransportResult<JsonRpcMessage>;
    using Channel = asio::experimental::channel<void(asio::error_code, std::optional<Outcome>)>;

    auto wait = std::make_shared<IdleWait>();
    idle_wait_ = wait;

    auto transport = transport_;
    auto executor = transport->get_executor();
    auto done = std::make_shared<Channel>(executor, 1);

    asio::co_spawn(
        executor,
        [transport, done]() -> asio::awaitable<void> {
            auto next = co_await transport->async_listen();
            done->try_send(asio::error_code{}, std::optional<Outcome>(std::move(next)));
        },
        asio::bind_cancellation_slot(wait->signal.slot(), asio::detached)
    );

    std::optional<Outcome> next;
    try {
        next = co_await done->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        wait->signal.emit(asio::cancellation_type::terminal);
        co_return Outcome(tl::unexpected(TransportError::io("idle listen aborted: " + std::string(e.what()))));
    }

    // A message that raced the interrupt is still delivered
    if (next->has_value() == false && wait->interrupted) {
        co_return std::nullopt;
    }
    co_return std::move(*next);
}

void ProtocolClient::interrupt_idle() {
    if (auto wait = idle_wait_.lock()) {
        wait->interrupted = true;
        wait->signal.emit(asio::cancellation_type::terminal);
    }
}

bool ProtocolClient::forget_abandoned(const RequestId& id) {
    auto it = std::find(abandoned_.begin(), abandoned_.end(), id);
    if (it == abandoned_.end()) {
        return false;
    }
    abandoned_.erase(it);
    return true;
}

void ProtocolClient::abandon(const RequestId& id) {
    abandoned_.push_back(id);
    if (abandoned_.size() > kMaxAbandoned) {
        abandoned_.pop_front();
    }
}

ProtocolResult<JsonRpcResponse> ProtocolClient::expect_response(
    JsonRpcMessage reply,
    const RequestId& id,
    const std::string& method
) const {
    auto* response = std::get_if<JsonRpcResponse>(&reply);
    if (response == nullptr) {
        return tl::unexpected(ProtocolError::unexpected_message(
            "expected response to '" + method + "', got " + std::string(message_kind(reply))));
    }

    // A null id only appears on errors the server could not attribute
    if (response->id().has_value() && *response->id() != id) {
        return tl::unexpected(ProtocolError::unexpected_message(
            "response id " + response->id()->to_string() + " does not match request " + id.to_string()));
    }

    if (response->is_error()) {
        return tl::unexpected(ProtocolError::server_error(*response->error()));
    }

    return std::move(*response);
}

}  // namespace toolmux::async
