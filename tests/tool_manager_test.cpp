#include <catch2/catch_test_macros.hpp>

#include "mocks/mock_transport.hpp"
#include "toolmux/async/run_sync.hpp"
#include "toolmux/client/tool_manager.hpp"
#include "toolmux/events/server_messenger.hpp"

#include <asio/io_context.hpp>

using namespace toolmux;
using namespace toolmux::testing;
using toolmux::async::run_sync;
using namespace std::chrono_literals;

namespace {

ServerConfig server(std::string name, std::chrono::milliseconds timeout = 5s) {
    ServerConfig config;
    config.name = std::move(name);
    config.command = "mock-server";
    config.timeout = timeout;
    return config;
}

std::shared_ptr<MockServer> server_with_tools(std::vector<std::string> names) {
    auto mock = std::make_shared<MockServer>();
    for (auto& name : names) {
        mock->tools.push_back(ToolSpec{std::move(name), "test tool"});
    }
    return mock;
}

// Delivers anything still queued (detached deinit events)
void settle(asio::io_context& io) {
    io.restart();
    io.poll();
}

std::vector<UpdateEventMessage> drain(UpdateEventReceiver& receiver) {
    std::vector<UpdateEventMessage> events;
    while (auto event = receiver.try_receive()) {
        events.push_back(std::move(*event));
    }
    return events;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Initialization
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolManager brings every server up and caches tools", "[manager][init]") {
    asio::io_context io;
    auto git = server_with_tools({"status", "log"});
    auto fs = server_with_tools({"read_file"});

    ToolManagerConfig config;
    config.servers = {server("git"), server("fs")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", git}, {"fs", fs}}));

    run_sync(io, manager.async_init());

    REQUIRE(manager.state("git") == ConnectionState::Ready);
    REQUIRE(manager.state("fs") == ConnectionState::Ready);
    REQUIRE(manager.tools("git").size() == 2);
    REQUIRE(manager.find_tool("fs", "read_file").has_value());
    REQUIRE_FALSE(manager.find_tool("fs", "status").has_value());
    REQUIRE(manager.server_names() == std::vector<std::string>{"fs", "git"});

    REQUIRE(git->sent_methods() == std::vector<std::string>{"initialize", "notifications/initialized", "tools/list"});
    REQUIRE(git->sent[0]["params"]["clientInfo"]["name"] == "toolmux");
}

TEST_CASE("ToolManager publishes lifecycle and catalog events", "[manager][events]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto git = server_with_tools({"status"});
    git->capabilities = Json{{"tools", Json::object()}, {"prompts", Json::object()}};
    git->on("prompts/list", [](const Json&) {
        return Json{{"prompts", Json::array({Json{{"name", "commit_message"}}})}};
    });

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"git", git}}));

    run_sync(io, manager.async_init());

    auto events = drain(receiver);
    REQUIRE(events.size() == 3);
    REQUIRE(std::holds_alternative<InitStartEvent>(events[0]));
    REQUIRE(std::get<ListToolsResultEvent>(events[1]).tools.size() == 1);
    REQUIRE(std::get<ListPromptsResultEvent>(events[2]).prompts[0].name == "commit_message");
    for (const auto& event : events) {
        REQUIRE(server_name_of(event) == "git");
    }
}

TEST_CASE("ToolManager only lists what the server advertises", "[manager][init]") {
    asio::io_context io;
    auto plain = server_with_tools({"a"});
    auto rich = server_with_tools({"b"});
    rich->capabilities = Json{{"tools", Json::object()}, {"resources", Json::object()}};
    rich->on("resources/list", [](const Json&) {
        return Json{{"resources", Json::array({Json{{"uri", "file:///a"}, {"name", "a"}}})}};
    });
    rich->on("resources/templates/list", [](const Json&) {
        return Json{{"resourceTemplates", Json::array()}};
    });

    ToolManagerConfig config;
    config.servers = {server("plain"), server("rich")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"plain", plain}, {"rich", rich}}));

    run_sync(io, manager.async_init());

    REQUIRE(plain->count("prompts/list") == 0);
    REQUIRE(plain->count("resources/list") == 0);
    REQUIRE(rich->count("prompts/list") == 0);
    REQUIRE(rich->count("resources/list") == 1);
    REQUIRE(rich->count("resources/templates/list") == 1);
}

TEST_CASE("ToolManager follows tools/list pagination", "[manager][init]") {
    asio::io_context io;
    auto paged = std::make_shared<MockServer>();
    paged->on("tools/list", [](const Json& params) {
        if (params.contains("cursor") == false) {
            return Json{{"tools", Json::array({Json{{"name", "one"}}})}, {"nextCursor", "page-2"}};
        }
        REQUIRE(params["cursor"] == "page-2");
        return Json{{"tools", Json::array({Json{{"name", "two"}}})}};
    });

    ToolManagerConfig config;
    config.servers = {server("paged")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"paged", paged}}));

    run_sync(io, manager.async_init());

    auto tools = manager.tools("paged");
    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0].name == "one");
    REQUIRE(tools[1].name == "two");
    REQUIRE(paged->count("tools/list") == 2);
}

TEST_CASE("A server that fails to start does not block the others", "[manager][init][error]") {
    asio::io_context io;
    auto good = server_with_tools({"status"});
    auto broken = std::make_shared<MockServer>();
    broken->start_error = TransportError::io("failed to spawn 'nope': No such file or directory");
    auto rude = std::make_shared<MockServer>();
    rude->fail("initialize", -32603, "not today");

    ToolManagerConfig config;
    config.servers = {server("good"), server("broken"), server("rude")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"good", good}, {"broken", broken}, {"rude", rude}}));

    run_sync(io, manager.async_init());

    REQUIRE(manager.state("good") == ConnectionState::Ready);
    REQUIRE(manager.state("broken") == ConnectionState::Failed);
    REQUIRE(manager.last_error("broken").find("failed to start") != std::string::npos);
    REQUIRE(manager.state("rude") == ConnectionState::Failed);
    REQUIRE(manager.last_error("rude").find("not today") != std::string::npos);
    REQUIRE(manager.tools("broken").empty());
}

TEST_CASE("A server without a transport is marked Failed", "[manager][init]") {
    asio::io_context io;
    auto good = server_with_tools({"one"});

    ToolManagerConfig config;
    config.servers = {server("good"), server("orphan")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"good", good}}));

    run_sync(io, manager.async_init());

    REQUIRE(manager.state("good") == ConnectionState::Ready);
    REQUIRE(manager.state("orphan") == ConnectionState::Failed);
    REQUIRE(manager.last_error("orphan") == "no transport");
}

TEST_CASE("Duplicate server names keep the first entry", "[manager][config]") {
    asio::io_context io;
    auto first = server_with_tools({"one"});

    ToolManagerConfig config;
    auto duplicate = server("git");
    duplicate.command = "other";
    config.servers = {server("git"), duplicate};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", first}}));

    REQUIRE(manager.server_names().size() == 1);
    run_sync(io, manager.async_init());
    REQUIRE(manager.tools("git").size() == 1);
}

TEST_CASE("ToolManager with no servers initializes immediately", "[manager][init]") {
    asio::io_context io;
    ToolManager manager(io.get_executor(), ToolManagerConfig{});

    REQUIRE_NOTHROW(run_sync(io, manager.async_init()));
    REQUIRE(manager.server_names().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolManager routes tool calls by server", "[manager][call]") {
    asio::io_context io;
    auto git = server_with_tools({"status"});
    git->on("tools/call", [](const Json& params) {
        return Json{
            {"content", Json::array({Json{{"type", "text"}, {"text", "on " + params["arguments"]["branch"].get<std::string>()}}})}
        };
    });

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());

    auto result = run_sync(io, manager.async_call_tool("git", "status", Json{{"branch", "main"}}));

    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->is_error);
    REQUIRE(result->content[0]["text"] == "on main");
    REQUIRE(git->sent.back()["params"]["name"] == "status");
}

TEST_CASE("A tool result with isError is still a completed call", "[manager][call]") {
    asio::io_context io;
    auto git = server_with_tools({"status"});
    git->on("tools/call", [](const Json&) {
        return Json{{"content", Json::array({Json{{"type", "text"}, {"text", "not a repository"}}})}, {"isError", true}};
    });

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());

    auto result = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
    REQUIRE(result.has_value());
    REQUIRE(result->is_error);
    REQUIRE(manager.state("git") == ConnectionState::Ready);
}

TEST_CASE("Requests to an unknown server fail", "[manager][error]") {
    asio::io_context io;
    ToolManager manager(io.get_executor(), ToolManagerConfig{});

    auto result = run_sync(io, manager.async_request("ghost", "tools/list"));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == RegistryError::Kind::UnknownServer);
    REQUIRE(result.error().message == "unknown server 'ghost'");
}

TEST_CASE("Requests to a failed server fail fast", "[manager][error]") {
    asio::io_context io;
    auto broken = std::make_shared<MockServer>();
    broken->start_error = TransportError::io("spawn failed");

    ToolManagerConfig config;
    config.servers = {server("broken")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"broken", broken}}));
    run_sync(io, manager.async_init());

    auto result = run_sync(io, manager.async_call_tool("broken", "anything", Json::object()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == RegistryError::Kind::ServerUnavailable);
    REQUIRE(broken->sent.empty());
}

TEST_CASE("Server errors and timeouts leave the connection usable", "[manager][error]") {
    asio::io_context io;
    auto git = server_with_tools({"status"});

    ToolManagerConfig config;
    config.servers = {server("git", 200ms)};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());

    SECTION("JSON-RPC error") {
        git->fail("tools/call", -32602, "bad arguments");
        auto result = run_sync(io, manager.async_call_tool("git", "status", Json::object()));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RegistryError::Kind::Protocol);
        REQUIRE(result.error().cause->kind == ProtocolError::Kind::ServerError);
        REQUIRE(manager.state("git") == ConnectionState::Ready);
    }

    SECTION("timeout") {
        git->silent = true;
        auto result = run_sync(io, manager.async_call_tool("git", "status", Json::object()));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().cause->kind == ProtocolError::Kind::Timeout);
        REQUIRE(manager.state("git") == ConnectionState::Ready);
        REQUIRE_FALSE(git->closed);
    }
}

TEST_CASE("A late response to a timed-out call does not answer the next one", "[manager][timeout]") {
    asio::io_context io;
    auto git = server_with_tools({"status"});
    int calls = 0;
    git->on("tools/call", [&calls](const Json&) {
        return Json{{"content", Json::array({Json{{"type", "text"}, {"text", "call " + std::to_string(++calls)}}})}};
    });

    ToolManagerConfig config;
    config.servers = {server("git", 200ms)};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());

    SECTION("arriving with the next reply") {
        git->delayed.insert("tools/call");
        auto first = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
        REQUIRE_FALSE(first.has_value());
        REQUIRE(first.error().cause->kind == ProtocolError::Kind::Timeout);

        git->delayed.clear();
        auto second = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
        REQUIRE(second.has_value());
        REQUIRE(second->content[0]["text"] == "call 2");

        auto third = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
        REQUIRE(third.has_value());
        REQUIRE(third->content[0]["text"] == "call 3");
    }

    SECTION("arriving while idle") {
        git->silent = true;
        auto first = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
        REQUIRE_FALSE(first.has_value());
        REQUIRE(first.error().cause->kind == ProtocolError::Kind::Timeout);

        git->silent = false;
        git->push_raw(Json{
            {"jsonrpc", "2.0"},
            {"id", git->sent.back()["id"]},
            {"result", {{"content", Json::array({Json{{"type", "text"}, {"text", "stale"}}})}}}
        });
        settle(io);
        REQUIRE(git->unsolicited.empty());

        auto second = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
        REQUIRE(second.has_value());
        REQUIRE(second->content[0]["text"] == "call 1");
    }

    REQUIRE(manager.state("git") == ConnectionState::Ready);
}

TEST_CASE("A server that exits mid-call is deinitialized", "[manager][lifecycle]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto git = server_with_tools({"status"});

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());
    (void)drain(receiver);

    git->unanswered.insert("tools/call");
    git->exited = true;

    auto result = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
    settle(io);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().cause->kind == ProtocolError::Kind::Transport);
    REQUIRE(manager.state("git") == ConnectionState::Deinitialized);

    auto events = drain(receiver);
    REQUIRE(events.size() == 1);
    REQUIRE(std::holds_alternative<DeinitEvent>(events[0]));
    REQUIRE(server_name_of(events[0]) == "git");

    auto again = run_sync(io, manager.async_call_tool("git", "status", Json::object()));
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().kind == RegistryError::Kind::ServerUnavailable);
}

TEST_CASE("An I/O failure with the server still running marks it failed", "[manager][lifecycle]") {
    asio::io_context io;
    auto git = server_with_tools({"status"});

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, {}, mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());

    git->unanswered.insert("tools/call");

    auto result = run_sync(io, manager.async_call_tool("git", "status", Json::object()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(manager.state("git") == ConnectionState::Failed);
    REQUIRE(git->closed);
    REQUIRE(manager.last_error("git").find("I/O error") != std::string::npos);
}

TEST_CASE("async_refresh_tools re-fetches and republishes", "[manager][call]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto git = server_with_tools({"status"});

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());
    (void)drain(receiver);

    git->tools.push_back(ToolSpec{"diff", "Show diff"});
    auto refreshed = run_sync(io, manager.async_refresh_tools("git"));

    REQUIRE(refreshed.has_value());
    REQUIRE(refreshed->size() == 2);
    REQUIRE(manager.find_tool("git", "diff").has_value());

    auto events = drain(receiver);
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ListToolsResultEvent>(events[0]).tools.size() == 2);
}

TEST_CASE("tools/list_changed while idle re-lists and republishes", "[manager][notify]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto git = server_with_tools({"status"});

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());
    (void)drain(receiver);

    // Anything else is ignored
    git->notify("notifications/message");
    settle(io);
    REQUIRE(drain(receiver).empty());
    REQUIRE(git->count("tools/list") == 1);

    git->tools.push_back(ToolSpec{"diff", "Show diff"});
    git->notify("notifications/tools/list_changed");
    settle(io);

    REQUIRE(git->count("tools/list") == 2);
    REQUIRE(manager.find_tool("git", "diff").has_value());

    auto events = drain(receiver);
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ListToolsResultEvent>(events[0]).tools.size() == 2);

    // Requests still go through once the watcher is listening again
    auto called = run_sync(io, manager.async_request("git", "tools/list"));
    REQUIRE(called.has_value());
    REQUIRE(manager.state("git") == ConnectionState::Ready);
}

TEST_CASE("prompts/list_changed while idle republishes prompts", "[manager][notify]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto git = server_with_tools({"status"});
    git->capabilities = Json{{"tools", Json::object()}, {"prompts", Json::object()}};
    Json prompts = Json::array({Json{{"name", "commit_message"}}});
    git->on("prompts/list", [&prompts](const Json&) { return Json{{"prompts", prompts}}; });

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());
    (void)drain(receiver);

    prompts.push_back(Json{{"name", "review"}});
    git->notify("notifications/prompts/list_changed");
    settle(io);

    auto events = drain(receiver);
    REQUIRE(events.size() == 1);
    const auto& listed = std::get<ListPromptsResultEvent>(events[0]);
    REQUIRE(listed.server_name == "git");
    REQUIRE(listed.prompts.size() == 2);
    REQUIRE(listed.prompts[1].name == "review");
    REQUIRE(git->count("tools/list") == 1);
}

TEST_CASE("A server that closes stdout while idle is noticed", "[manager][notify][lifecycle]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto git = server_with_tools({"status"});

    ToolManagerConfig config;
    config.servers = {server("git")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"git", git}}));
    run_sync(io, manager.async_init());
    (void)drain(receiver);

    git->exited = true;
    git->closed = true;
    git->notify_listener();
    settle(io);

    REQUIRE(manager.state("git") == ConnectionState::Deinitialized);
    auto events = drain(receiver);
    REQUIRE(events.size() == 1);
    REQUIRE(std::holds_alternative<DeinitEvent>(events[0]));
}

// ═══════════════════════════════════════════════════════════════════════════
// Shutdown and serialization
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("shutdown closes every server and emits deinit events", "[manager][lifecycle]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 32);
    auto a = server_with_tools({"x"});
    auto b = server_with_tools({"y"});

    ToolManagerConfig config;
    config.servers = {server("a"), server("b")};
    ToolManager manager(io.get_executor(), config, builder.factory(), mock_transports({{"a", a}, {"b", b}}));
    run_sync(io, manager.async_init());
    (void)drain(receiver);

    manager.shutdown();
    settle(io);

    REQUIRE(manager.state("a") == ConnectionState::Deinitialized);
    REQUIRE(manager.state("b") == ConnectionState::Deinitialized);
    REQUIRE(a->closed);
    REQUIRE(b->closed);
    REQUIRE(drain(receiver).size() == 2);

    SECTION("shutdown twice emits nothing more") {
        manager.shutdown();
        settle(io);
        REQUIRE(drain(receiver).empty());
    }
}

TEST_CASE("ConnectionLock admits one holder at a time", "[manager][lock]") {
    asio::io_context io;
    ConnectionLock lock(io.get_executor());
    std::vector<std::string> order;

    auto holder = [&](std::string name) -> asio::awaitable<void> {
        auto guard = co_await lock.async_acquire();
        order.push_back(name + " in");
        asio::steady_timer pause(io, 20ms);
        co_await pause.async_wait(asio::use_awaitable);
        order.push_back(name + " out");
    };

    asio::co_spawn(io, holder("a"), asio::detached);
    asio::co_spawn(io, holder("b"), asio::detached);
    io.run();

    REQUIRE(order == std::vector<std::string>{"a in", "a out", "b in", "b out"});
    REQUIRE_FALSE(lock.is_locked());
}
