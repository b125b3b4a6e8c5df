// ─────────────────────────────────────────────────────────────────────────────
// toolmux - drive tool servers from the command line
// ─────────────────────────────────────────────────────────────────────────────
// Launches the configured tool servers, then lists or calls their tools
// through the same permission-gated path an assistant session uses.
//
// Usage:
//   toolmux --config servers.json --list-tools
//   toolmux -s "fs=npx -y @modelcontextprotocol/server-filesystem /tmp" -i
//   toolmux -s "git=git-mcp --stdio" --call git/status --tool-args '{}'
//   toolmux --call fs_read --tool-args '{"path":"/etc/hostname"}'
//
// Features:
//   - Any number of stdio tool servers, started concurrently
//   - Allowlist patterns (fs_*, @git, @git/read_*) and per-session trust
//   - Confirmation prompts for untrusted tools
//   - Interactive REPL mode

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "toolmux/async/run_sync.hpp"
#include "toolmux/client/tool_manager.hpp"
#include "toolmux/config/app_config.hpp"
#include "toolmux/events/server_messenger.hpp"
#include "toolmux/log/logger.hpp"
#include "toolmux/log/spdlog_logger.hpp"
#include "toolmux/tools/native_tools.hpp"
#include "toolmux/tools/tool_use_state.hpp"

#include <asio/io_context.hpp>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace toolmux;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* magenta = "\033[35m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_result(const ToolUse& use, const ToolResult& result) {
    auto name = ToolUseState::display_name(use);
    if (result.is_error()) {
        std::cout << color::c(color::red) << "✗ " << name << color::c(color::reset) << "\n";
    } else {
        std::cout << color::c(color::green) << "✓ " << name << color::c(color::reset) << "\n";
    }
    std::cout << result.text() << "\n";
}

void print_confirmation_prompt(const QueuedTool& tool) {
    std::cout << color::c(color::magenta) << "Allow " << color::c(color::bold)
              << ToolUseState::display_name(tool.use) << color::c(color::reset)
              << color::c(color::magenta) << " to run?" << color::c(color::reset) << "\n"
              << color::c(color::dim) << tool.use.arguments.dump(2) << color::c(color::reset) << "\n"
              << "Enter " << color::c(color::bold) << "y" << color::c(color::reset) << " to run, "
              << color::c(color::bold) << "n" << color::c(color::reset) << " to deny, or "
              << color::c(color::bold) << "t" << color::c(color::reset) << " to trust for this session\n";
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════

void render_event(const UpdateEventMessage& event) {
    std::cout << color::c(color::dim) << "[" << server_name_of(event) << "] " << color::c(color::reset);

    if (const auto* tools = std::get_if<ListToolsResultEvent>(&event)) {
        std::cout << tools->tools.size() << " tool(s) loaded\n";
    } else if (const auto* prompts = std::get_if<ListPromptsResultEvent>(&event)) {
        std::cout << prompts->prompts.size() << " prompt(s) available\n";
    } else if (const auto* resources = std::get_if<ListResourcesResultEvent>(&event)) {
        std::cout << resources->resources.size() << " resource(s) available\n";
    } else if (const auto* templates = std::get_if<ResourceTemplatesListResultEvent>(&event)) {
        std::cout << templates->templates.size() << " resource template(s) available\n";
    } else if (const auto* oauth = std::get_if<OauthLinkEvent>(&event)) {
        std::cout << "authorize at " << color::c(color::cyan) << oauth->link << color::c(color::reset) << "\n";
    } else if (std::holds_alternative<InitStartEvent>(event)) {
        std::cout << "starting\n";
    } else if (std::holds_alternative<DeinitEvent>(event)) {
        std::cout << color::c(color::yellow) << "stopped" << color::c(color::reset) << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

/// "server/tool" -> MCP tool; anything without the delimiter -> native
ToolUse make_tool_use(const std::string& target, Json arguments) {
    static std::size_t counter = 0;
    ToolUse use;
    use.id = "cli-" + std::to_string(++counter);
    use.arguments = std::move(arguments);

    auto slash = target.find(kServerToolDelimiter);
    if (slash == std::string::npos) {
        use.name = target;
    } else {
        use.server_name = target.substr(0, slash);
        use.name = target.substr(slash + 1);
    }
    return use;
}

std::optional<Json> parse_arguments(const std::string& text) {
    if (trim(text).empty()) {
        return Json::object();
    }
    Json args = Json::parse(text, nullptr, false);
    if (args.is_discarded() || args.is_object() == false) {
        print_error("Tool arguments must be a JSON object");
        return std::nullopt;
    }
    return args;
}

int cmd_servers(const ToolManager& manager) {
    print_header("Servers");
    auto names = manager.server_names();
    if (names.empty()) {
        std::cout << color::c(color::dim) << "(no servers configured)" << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& name : names) {
        auto state = manager.state(name).value_or(ConnectionState::Uninitialized);
        const char* state_color = state == ConnectionState::Ready ? color::green : color::red;
        std::cout << color::c(color::bold) << "• " << name << color::c(color::reset) << "  "
                  << color::c(state_color) << to_string(state) << color::c(color::reset);
        auto reason = manager.last_error(name);
        if (state != ConnectionState::Ready && reason.empty() == false) {
            std::cout << color::c(color::dim) << "  " << reason << color::c(color::reset);
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_tools(const ToolManager& manager, const INativeToolExecutor& native, ChatSession& session) {
    auto print_tool = [&](const ToolSpec& tool, std::optional<std::string_view> server, bool trusted) {
        auto label = session.permissions().display_label(tool.name, server, trusted);
        std::cout << color::c(color::bold) << color::c(color::yellow) << "• "
                  << ToolPermissions::permission_key(tool.name, server) << color::c(color::reset)
                  << "  " << color::c(color::dim) << label << color::c(color::reset);
        if (tool.description.empty() == false) {
            std::cout << "\n  " << color::c(color::dim) << tool.description << color::c(color::reset);
        }
        std::cout << "\n";
    };

    print_header("Built-in");
    for (const auto& tool : native.specs()) {
        print_tool(tool, std::nullopt, native.trusted_by_default(tool.name));
    }

    for (const auto& name : manager.server_names()) {
        print_header(name);
        auto tools = manager.tools(name);
        if (tools.empty()) {
            std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
        }
        for (const auto& tool : tools) {
            print_tool(tool, name, false);
        }
    }
    return 0;
}

int cmd_allowed(ChatSession& session) {
    auto& permissions = session.permissions();
    print_header("Permissions");
    if (permissions.is_trust_all()) {
        std::cout << color::c(color::yellow) << "all tools trusted" << color::c(color::reset) << "\n";
    }
    if (permissions.entries().empty()) {
        std::cout << color::c(color::dim) << "(no overrides)" << color::c(color::reset) << "\n";
    }
    for (const auto& [pattern, intent] : permissions.entries()) {
        std::cout << "• " << pattern << "  " << to_string(intent) << "\n";
    }
    return 0;
}

// Runs every tool use to completion, asking on stdin when needed
class StdinConfirmationSource final : public IConfirmationSource {
public:
    asio::awaitable<Confirmation> async_confirm(const QueuedTool& tool) override {
        print_confirmation_prompt(tool);
        while (true) {
            std::cout << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                co_return Confirmation::Reject;
            }
            line = trim(line);
            if (line == "y") co_return Confirmation::Accept;
            if (line == "n") co_return Confirmation::Reject;
            if (line == "t") co_return Confirmation::Trust;
        }
    }
};

int cmd_call_once(asio::io_context& io, ChatSession& session, const std::string& target, const std::string& args_text) {
    auto args = parse_arguments(args_text);
    if (!args) {
        return 1;
    }

    StdinConfirmationSource confirmations;
    auto use = make_tool_use(target, std::move(*args));
    auto results = async::run_sync(io, session.tool_use().async_run_turn({use}, confirmations));
    if (!results) {
        print_error(results.error().message);
        return 1;
    }

    for (const auto& result : *results) {
        print_result(use, result);
    }
    return (results->empty() || results->front().is_error()) ? 1 : 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive REPL
// ═══════════════════════════════════════════════════════════════════════════

void print_repl_help() {
    std::cout << "\n" << color::c(color::bold) << "Available commands:" << color::c(color::reset) << "\n";
    std::cout << "  servers                       Show servers and their state\n";
    std::cout << "  tools                         List tools with their permission\n";
    std::cout << "  call <server/tool|tool> [json] Run a tool\n";
    std::cout << "  y | n | t                     Answer a pending confirmation\n";
    std::cout << "  trust <pattern>               Run matching tools without asking\n";
    std::cout << "  untrust <pattern>             Always ask for matching tools\n";
    std::cout << "  block <pattern>               Never run matching tools\n";
    std::cout << "  reset [pattern]               Drop one override, or all of them\n";
    std::cout << "  trustall                      Trust every tool\n";
    std::cout << "  allowed                       Show permission overrides\n";
    std::cout << "  refresh <server>              Re-fetch a server's tool list\n";
    std::cout << "  help                          Show this help\n";
    std::cout << "  quit                          Exit\n\n";
}

// Show what happened and, if a tool is waiting, ask about it
void report_turn(ChatSession& session, std::size_t& printed) {
    auto& state = session.tool_use();
    const auto& queue = state.queue();
    const auto& results = state.results();
    for (; printed < results.size() && printed < queue.size(); ++printed) {
        print_result(queue[printed].use, results[printed]);
    }

    if (const auto* pending = state.pending_tool()) {
        print_confirmation_prompt(*pending);
        return;
    }
    if (state.phase() == ToolUsePhase::PromptUser) {
        (void)state.take_results();
        printed = 0;
    }
}

int run_repl(asio::io_context& io, ToolManager& manager, const INativeToolExecutor& native,
             ChatSession& session) {
    std::cout << color::c(color::bold) << "toolmux" << color::c(color::reset)
              << " - " << manager.server_names().size() << " server(s)\n";
    std::cout << "Type 'help' for available commands, 'quit' to exit.\n\n";

    std::size_t printed = 0;
    std::string line;
    while (true) {
        std::cout << color::c(color::cyan) << "toolmux> " << color::c(color::reset) << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        line = trim(line);
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;
        std::string rest;
        std::getline(iss, rest);
        rest = trim(rest);

        auto& state = session.tool_use();
        bool pending = state.phase() == ToolUsePhase::PendingConfirmation;

        if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            break;
        } else if (pending && (cmd == "y" || cmd == "n" || cmd == "t")) {
            auto answer = cmd == "y" ? Confirmation::Accept
                        : cmd == "n" ? Confirmation::Reject
                                     : Confirmation::Trust;
            async::run_sync(io, state.async_confirm(answer));
            report_turn(session, printed);
        } else if (pending) {
            print_error("A tool is waiting for confirmation; answer y, n or t");
        } else if (cmd == "help" || cmd == "?") {
            print_repl_help();
        } else if (cmd == "servers") {
            cmd_servers(manager);
        } else if (cmd == "tools") {
            cmd_tools(manager, native, session);
        } else if (cmd == "allowed") {
            cmd_allowed(session);
        } else if (cmd == "call") {
            std::istringstream call_args(rest);
            std::string target;
            call_args >> target;
            if (target.empty()) {
                print_error("Usage: call <server/tool|tool> [json_args]");
                continue;
            }
            std::string json_text;
            std::getline(call_args, json_text);
            auto args = parse_arguments(json_text);
            if (!args) continue;

            auto proposed = state.propose({make_tool_use(target, std::move(*args))});
            if (!proposed) {
                print_error(proposed.error().message);
                continue;
            }
            async::run_sync(io, state.async_advance());
            report_turn(session, printed);
        } else if (cmd == "trust" || cmd == "untrust" || cmd == "block") {
            if (rest.empty()) {
                print_error("Usage: " + cmd + " <pattern>");
                continue;
            }
            if (cmd == "trust") {
                session.permissions().trust(rest);
            } else if (cmd == "untrust") {
                session.permissions().untrust(rest);
            } else {
                session.permissions().block(rest);
            }
            print_success(rest + " is now " + std::string(to_string(*session.permissions().intent(rest))));
        } else if (cmd == "reset") {
            if (rest.empty()) {
                session.permissions().reset();
                print_success("All permissions reset to defaults");
            } else if (session.permissions().reset_tool(rest)) {
                print_success(rest + " reset to default");
            } else {
                print_error("No override for " + rest);
            }
        } else if (cmd == "trustall") {
            session.permissions().trust_all();
            std::cout << color::c(color::yellow) << "All tools are now trusted. They will run without confirmation."
                      << color::c(color::reset) << "\n";
        } else if (cmd == "refresh") {
            if (rest.empty()) {
                print_error("Usage: refresh <server>");
                continue;
            }
            auto tools = async::run_sync(io, manager.async_refresh_tools(rest));
            if (!tools) {
                print_error(tools.error().message);
            } else {
                print_success(rest + ": " + std::to_string(tools->size()) + " tool(s)");
            }
        } else {
            print_error("Unknown command: " + cmd + ". Type 'help' for available commands.");
        }
    }

    std::cout << "\nGoodbye!\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Parse "name=command arg arg" into a server entry
std::optional<ServerConfig> parse_server_option(const std::string& spec, std::chrono::milliseconds timeout) {
    auto eq = spec.find('=');
    if (eq == std::string::npos) {
        return std::nullopt;
    }

    ServerConfig server;
    server.name = trim(spec.substr(0, eq));
    server.timeout = timeout;

    std::istringstream words(spec.substr(eq + 1));
    std::string word;
    while (words >> word) {
        if (server.command.empty()) {
            server.command = word;
        } else {
            server.args.push_back(word);
        }
    }
    return server;
}

bool install_logger(const cxxopts::ParseResult& result) {
    LogLevel level = result.count("verbose") ? LogLevel::Debug : LogLevel::Warn;
    if (result.count("log-level")) {
        auto parsed = parse_log_level(result["log-level"].as<std::string>());
        if (parsed.has_value() == false) {
            print_error("--log-level must be one of trace, debug, info, warn, error, off");
            return false;
        }
        level = *parsed;
    }

    if (result.count("log-file")) {
        auto file = open_log_file(result["log-file"].as<std::string>(), level);
        if (file) {
            set_logger(std::move(*file));
            return true;
        }
        print_error(file.error());
    }
    set_logger(std::make_unique<ConsoleLogger>(level, color::enabled));
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("toolmux", "Run and call tool servers");

    options.add_options()
        ("config", "JSON config file (mcpServers, allowedTools, ...)", cxxopts::value<std::string>())
        ("s,server", "Tool server as name=command args (can be repeated)", cxxopts::value<std::vector<std::string>>())
        ("allow", "Trusted tool pattern, e.g. fs_* or @git/read_* (can be repeated)", cxxopts::value<std::vector<std::string>>())

        ("list-tools", "List tools from every server")
        ("call", "Call a tool: server/tool, or a built-in tool name", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("i,interactive", "Start interactive REPL mode")

        ("timeout", "Per-request timeout in milliseconds", cxxopts::value<long>())
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable verbose logging")
        ("log-level", "trace, debug, info, warn, error or off (overrides --verbose)", cxxopts::value<std::string>())
        ("log-file", "Write logs to this file instead of stderr", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    toolmux --config servers.json --list-tools\n";
            std::cout << "    toolmux -s 'git=git-mcp --stdio' --allow '@git/read_*' -i\n";
            std::cout << "    toolmux -s 'git=git-mcp --stdio' --call git/status\n";
            std::cout << "    toolmux --call fs_read --tool-args '{\"path\":\"/etc/hostname\"}'\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        if (install_logger(result) == false) {
            return 1;
        }

        AppConfig config;
        if (result.count("config")) {
            auto loaded = load_config(result["config"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().message);
                return 1;
            }
            config = std::move(*loaded);
        }

        if (result.count("timeout")) {
            auto ms = result["timeout"].as<long>();
            if (ms <= 0) {
                print_error("--timeout must be positive");
                return 1;
            }
            config.request_timeout = std::chrono::milliseconds(ms);
            for (auto& server : config.servers) {
                server.timeout = config.request_timeout;
            }
        }

        if (result.count("server")) {
            for (const auto& spec : result["server"].as<std::vector<std::string>>()) {
                auto server = parse_server_option(spec, config.request_timeout);
                if (!server) {
                    print_error("Expected name=command for --server, got '" + spec + "'");
                    return 1;
                }
                auto added = config.add_server(std::move(*server));
                if (!added) {
                    print_error(added.error().message);
                    return 1;
                }
            }
        }

        if (result.count("allow")) {
            for (const auto& pattern : result["allow"].as<std::vector<std::string>>()) {
                config.allowed_tools.insert(pattern);
            }
        }

        asio::io_context io;
        auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), config.event_channel_capacity);

        ToolManagerConfig manager_config;
        manager_config.servers = config.servers;
        manager_config.init_timeout = config.init_timeout;

        ToolManager manager(io.get_executor(), std::move(manager_config), builder.factory());
        BuiltinToolExecutor native;
        ChatSession session(manager, native, ToolPermissions(config.allowed_tools));

        bool interactive = result.count("interactive") > 0;

        // The event channel is bounded; keep it drained while servers run
        asio::co_spawn(io, [&receiver, interactive]() -> asio::awaitable<void> {
            while (auto event = co_await receiver.async_receive()) {
                if (interactive) {
                    render_event(*event);
                }
            }
        }, asio::detached);

        async::run_sync(io, manager.async_init());

        int exit_code = 0;
        if (interactive) {
            exit_code = run_repl(io, manager, native, session);
        } else if (result.count("call")) {
            exit_code = cmd_call_once(io, session, result["call"].as<std::string>(),
                                      result["tool-args"].as<std::string>());
        } else if (result.count("list-tools")) {
            exit_code = cmd_tools(manager, native, session);
        } else {
            exit_code = cmd_servers(manager);
        }

        manager.shutdown();
        io.restart();
        io.poll();
        receiver.close();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
