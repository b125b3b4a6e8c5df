#include "toolmux/async/stdio_transport.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

extern char** environ;

namespace toolmux::async {

namespace {

std::string errno_message(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

bool set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    return flags != -1 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

// Writing to a pipe whose reader has exited must surface as EPIPE, not
// terminate the whole process.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Read the next non-blank line from the child and decode it. Io errors end
// the reader; anything else is reported and the reader moves on.
asio::awaitable<TransportResult<Json>> read_document(StdioTransport::ReaderState& state) {
    std::string line;
    do {
        std::size_t n = 0;
        try {
            n = co_await asio::async_read_until(
                *state.stdout_stream,
                asio::dynamic_buffer(state.buffer, state.max_message_size),
                '\n',
                asio::use_awaitable
            );
        } catch (const std::system_error& e) {
            if (e.code() == asio::error::not_found) {
                // Line exceeded max_message_size; drop what we have and resync
                state.buffer.clear();
                co_return tl::unexpected(TransportError::serialization("line exceeds maximum message size"));
            }
            if (e.code() == asio::error::eof) {
                state.eof = true;
                co_return tl::unexpected(TransportError::io("server closed stdout"));
            }
            co_return tl::unexpected(TransportError::io("read failed: " + std::string(e.what())));
        }

        line = state.buffer.substr(0, n - 1);
        state.buffer.erase(0, n);
    } while (is_blank_line(line));

    auto document = state.decoder.decode(line);
    if (!document) {
        co_return tl::unexpected(TransportError::serialization(document.error().message));
    }
    co_return std::move(*document);
}

asio::awaitable<void> reader_loop(std::shared_ptr<StdioTransport::ReaderState> state) {
    while (state->running) {
        auto result = co_await read_document(*state);

        bool fatal = !result && result.error().kind == TransportError::Kind::Io;
        if (fatal && !state->running) {
            break;
        }

        if (!result) {
            TOOLMUX_LOG_DEBUG("stdio reader: " + result.error().message);
        } else {
            TOOLMUX_LOG_TRACE("<- " + result->dump());
        }

        try {
            co_await state->channel->async_send(asio::error_code{}, std::move(result), asio::use_awaitable);
        } catch (const std::system_error&) {
            break;  // channel closed by the owner
        }

        if (fatal) {
            break;
        }
    }

    state->running = false;
    state->channel->close();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
{}

StdioTransport::~StdioTransport() {
    // Can't co_await here; tear down synchronously
    if (reader_) {
        reader_->running = false;
        asio::error_code ec;
        if (reader_->stdout_stream) {
            reader_->stdout_stream->close(ec);
        }
        if (reader_->channel) {
            reader_->channel->close();
        }
    }
    close();
    terminate_process();
}

// ═══════════════════════════════════════════════════════════════════════════
// ITransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor StdioTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> StdioTransport::async_start() {
    if (reader_) {
        co_return tl::unexpected(TransportError::io("transport already started"));
    }
    if (config_.command.empty()) {
        co_return tl::unexpected(TransportError::io("no command configured"));
    }

    ignore_sigpipe_once();

    auto spawned = spawn_process();
    if (!spawned) {
        co_return spawned;
    }

    asio::co_spawn(executor_, reader_loop(reader_), asio::detached);

    TOOLMUX_LOG_INFO("spawned '" + config_.command + "' (pid " + std::to_string(child_pid_) + ")");
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<void>> StdioTransport::async_send(JsonRpcMessage message) {
    if (!stdin_stream_ || stdin_stream_->is_open() == false) {
        co_return tl::unexpected(TransportError::io("stdin is closed"));
    }

    std::string data;
    try {
        data = to_json(message).dump();
    } catch (const Json::exception& e) {
        co_return tl::unexpected(TransportError::serialization(e.what()));
    }
    TOOLMUX_LOG_TRACE("-> " + data);
    data.push_back('\n');

    try {
        co_await asio::async_write(*stdin_stream_, asio::buffer(data), asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError::io("write failed: " + std::string(e.what())));
    }

    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<JsonRpcMessage>> StdioTransport::async_listen() {
    if (!reader_) {
        co_return tl::unexpected(TransportError::io("transport not started"));
    }

    // Keep the channel alive even if we are destroyed mid-wait
    auto state = reader_;

    TransportResult<Json> document;
    try {
        document = co_await state->channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError::io("stdout closed: " + std::string(e.what())));
    }

    if (!document) {
        co_return tl::unexpected(document.error());
    }

    auto message = parse_message(*document);
    if (!message) {
        co_return tl::unexpected(TransportError::serialization(message.error().message));
    }
    co_return std::move(*message);
}

void StdioTransport::close() {
    if (stdin_stream_ && stdin_stream_->is_open()) {
        asio::error_code ec;
        stdin_stream_->close(ec);
        TOOLMUX_LOG_DEBUG("closed stdin of '" + config_.command + "'");
    }
}

bool StdioTransport::is_running() const {
    return reader_ && reader_->running;
}

bool StdioTransport::peer_exited() {
    if (child_pid_ <= 0) {
        return false;
    }
    return (reader_ && reader_->eof) || is_child_alive() == false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Process-Specific Methods
// ═══════════════════════════════════════════════════════════════════════════

pid_t StdioTransport::child_pid() const noexcept {
    return child_pid_;
}

bool StdioTransport::is_child_alive() {
    if (child_pid_ <= 0 || child_reaped_) {
        return false;
    }
    int status = 0;
    pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        record_status(status);
        return false;
    }
    return result == 0;
}

std::optional<int> StdioTransport::exit_code() const noexcept {
    return exit_code_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> StdioTransport::spawn_process() {
    // Everything the child needs is allocated before fork(); after fork()
    // only async-signal-safe calls are made.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // Our environment with the overrides applied
    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (config_.env.empty() == false) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view kv(*entry);
            auto key = kv.substr(0, kv.find('='));
            if (config_.env.count(std::string(key)) == 0) {
                env_storage.emplace_back(kv);
            }
        }
        for (const auto& [key, value] : config_.env) {
            env_storage.push_back(key + "=" + value);
        }
        envp.reserve(env_storage.size() + 1);
        for (auto& kv : env_storage) {
            envp.push_back(kv.data());
        }
        envp.push_back(nullptr);
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports execvp failure back to us

    auto close_all = [&] {
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0],
                        &stdout_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
    };

    if (::pipe(stdin_pipe) == -1 || ::pipe(stdout_pipe) == -1 || ::pipe(exec_pipe) == -1) {
        int err = errno;
        close_all();
        return tl::unexpected(TransportError::io(errno_message("failed to create pipes", err)));
    }

    // Other children spawned later must not inherit our ends
    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1], exec_pipe[0], exec_pipe[1]}) {
        if (set_cloexec(fd) == false) {
            int err = errno;
            close_all();
            return tl::unexpected(TransportError::io(errno_message("failed to configure pipes", err)));
        }
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        close_all();
        return tl::unexpected(TransportError::io(errno_message("failed to fork", err)));
    }

    if (pid == 0) {
        // Child - no allocations from here on
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);

        if (config_.stderr_handling == StderrHandling::Discard) {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull != -1) {
                ::dup2(devnull, STDERR_FILENO);
                ::close(devnull);
            }
        }

        if (envp.empty() == false) {
            environ = envp.data();
        }
        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF means execvp succeeded and closed the pipe on exec
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got == -1 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        return tl::unexpected(TransportError::io(
            errno_message(("failed to execute '" + config_.command + "'").c_str(), exec_errno)
        ));
    }

    child_pid_ = pid;
    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdin_pipe[1]);

    reader_ = std::make_shared<ReaderState>();
    reader_->stdout_stream = std::make_unique<asio::posix::stream_descriptor>(executor_, stdout_pipe[0]);
    reader_->channel = std::make_unique<MessageChannel>(executor_, config_.channel_capacity);
    reader_->max_message_size = config_.max_message_size;
    reader_->running = true;

    return {};
}

void StdioTransport::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    }
    child_reaped_ = true;
}

void StdioTransport::terminate_process() {
    if (child_pid_ <= 0 || child_reaped_) {
        return;
    }

    int status = 0;
    pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == 0) {
        ::kill(child_pid_, SIGTERM);
        std::this_thread::sleep_for(config_.shutdown_grace);
        result = ::waitpid(child_pid_, &status, WNOHANG);

        if (result == 0) {
            ::kill(child_pid_, SIGKILL);
            result = ::waitpid(child_pid_, &status, 0);
        }
    }

    if (result == child_pid_) {
        record_status(status);
    }
}

}  // namespace toolmux::async
