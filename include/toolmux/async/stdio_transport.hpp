#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a tool server and exchanges newline-delimited JSON-RPC over its
// stdin/stdout using asio::posix::stream_descriptor.
//
// - One JSON document per line in both directions
// - Background reader feeds a bounded channel; async_listen pops from it
// - stderr is inherited so server diagnostics reach the user's terminal
// - All operations run on one executor; the transport is not thread-safe

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioTransport is only available on POSIX-compatible systems"
#endif

#include "toolmux/async/async_transport.hpp"
#include "toolmux/json/fast_json.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>  // pid_t

namespace toolmux::async {

enum class StderrHandling {
    Inherit,  // Child writes straight to our stderr
    Discard   // Redirect to /dev/null
};

struct StdioTransportConfig {
    std::string command;
    std::vector<std::string> args;

    /// Extra environment for the child, layered over ours
    std::map<std::string, std::string> env;

    StderrHandling stderr_handling{StderrHandling::Inherit};

    /// Longest accepted line from the child
    std::size_t max_message_size{4 << 20};  // 4 MiB

    /// Messages buffered before the reader stops pulling from the pipe
    std::size_t channel_capacity{16};

    /// Grace period between SIGTERM and SIGKILL when the transport is destroyed
    std::chrono::milliseconds shutdown_grace{100};
};

class StdioTransport : public ITransport {
public:
    StdioTransport(asio::any_io_executor executor, StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // ITransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(JsonRpcMessage message) override;
    [[nodiscard]] asio::awaitable<TransportResult<JsonRpcMessage>> async_listen() override;
    void close() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] bool peer_exited() override;

    // ─────────────────────────────────────────────────────────────────────────
    // Process
    // ─────────────────────────────────────────────────────────────────────────

    /// -1 before start
    [[nodiscard]] pid_t child_pid() const noexcept;

    /// Non-blocking; reaps and records the exit code once the child is gone
    [[nodiscard]] bool is_child_alive();

    /// Set once the child has been reaped (negative: killed by that signal)
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    using MessageChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<Json>)
    >;

    // State shared with the detached reader so it can outlive the transport.
    // The channel carries raw documents; envelopes are validated on receive.
    struct ReaderState {
        std::unique_ptr<asio::posix::stream_descriptor> stdout_stream;
        std::unique_ptr<MessageChannel> channel;
        JsonLineDecoder decoder;
        std::string buffer;
        std::size_t max_message_size{0};
        std::atomic<bool> running{false};
        std::atomic<bool> eof{false};
    };

private:
    TransportResult<void> spawn_process();
    void terminate_process();
    void record_status(int status);

    StdioTransportConfig config_;
    asio::any_io_executor executor_;

    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::shared_ptr<ReaderState> reader_;

    pid_t child_pid_{-1};
    bool child_reaped_{false};
    std::optional<int> exit_code_;
};

[[nodiscard]] inline std::unique_ptr<ITransport> make_stdio_transport(
    asio::any_io_executor executor,
    StdioTransportConfig config
) {
    return std::make_unique<StdioTransport>(std::move(executor), std::move(config));
}

}  // namespace toolmux::async
