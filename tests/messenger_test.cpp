#include <catch2/catch_test_macros.hpp>

#include "toolmux/async/run_sync.hpp"
#include "toolmux/events/server_messenger.hpp"

#include <asio/io_context.hpp>

using namespace toolmux;
using toolmux::async::run_sync;

namespace {

std::vector<ToolSpec> two_tools() {
    return {ToolSpec{"status", "Show status"}, ToolSpec{"log", "Show log"}};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Event helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Events expose their server and kind", "[events]") {
    UpdateEventMessage tools = ListToolsResultEvent{"git", two_tools()};
    UpdateEventMessage init = InitStartEvent{"fs"};
    UpdateEventMessage deinit = DeinitEvent{"db"};
    UpdateEventMessage oauth = OauthLinkEvent{"cloud", "https://example.com/auth"};

    REQUIRE(server_name_of(tools) == "git");
    REQUIRE(server_name_of(init) == "fs");
    REQUIRE(event_kind(tools) == "list_tools");
    REQUIRE(event_kind(init) == "init_start");
    REQUIRE(event_kind(deinit) == "deinit");
    REQUIRE(event_kind(oauth) != event_kind(tools));
}

// ═══════════════════════════════════════════════════════════════════════════
// ServerMessenger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerMessenger tags events with its server name", "[events][messenger]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 8);
    auto git = builder.build_with_name("git");

    auto sent = run_sync(io, git.async_send_tools_list_result(two_tools()));
    REQUIRE(sent.has_value());

    auto event = receiver.try_receive();
    REQUIRE(event.has_value());
    const auto* listing = std::get_if<ListToolsResultEvent>(&*event);
    REQUIRE(listing != nullptr);
    REQUIRE(listing->server_name == "git");
    REQUIRE(listing->tools.size() == 2);
    REQUIRE(listing->tools[1].name == "log");
}

TEST_CASE("Events from one messenger arrive in order", "[events][messenger]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 8);
    auto fs = builder.build_with_name("fs");

    REQUIRE(run_sync(io, fs.async_send_init_msg()).has_value());
    REQUIRE(run_sync(io, fs.async_send_tools_list_result({})).has_value());
    REQUIRE(run_sync(io, fs.async_send_prompts_list_result({PromptSpec{"summarize"}})).has_value());
    REQUIRE(run_sync(io, fs.async_send_resources_list_result({})).has_value());
    REQUIRE(run_sync(io, fs.async_send_resource_templates_list_result({})).has_value());

    std::vector<std::string> kinds;
    while (auto event = receiver.try_receive()) {
        REQUIRE(server_name_of(*event) == "fs");
        kinds.emplace_back(event_kind(*event));
    }
    REQUIRE(kinds.size() == 5);
    REQUIRE(kinds.front() == "init_start");
    REQUIRE(kinds[1] == "list_tools");
}

TEST_CASE("Messengers from one builder share the receiver", "[events][messenger]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 8);
    auto factory = builder.factory();

    auto a = factory("a");
    auto b = factory("b");
    REQUIRE(run_sync(io, a->async_send_init_msg()).has_value());
    REQUIRE(run_sync(io, b->async_send_init_msg()).has_value());

    auto first = receiver.try_receive();
    auto second = receiver.try_receive();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(server_name_of(*first) == "a");
    REQUIRE(server_name_of(*second) == "b");
    REQUIRE_FALSE(receiver.try_receive().has_value());
}

TEST_CASE("duplicate() publishes under the same name", "[events][messenger]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 4);
    auto original = builder.build_with_name("git");
    auto copy = original.duplicate();

    REQUIRE(run_sync(io, copy->async_send_oauth_link("https://example.com/login")).has_value());

    auto event = receiver.try_receive();
    REQUIRE(event.has_value());
    const auto* oauth = std::get_if<OauthLinkEvent>(&*event);
    REQUIRE(oauth != nullptr);
    REQUIRE(oauth->server_name == "git");
    REQUIRE(oauth->link == "https://example.com/login");
}

TEST_CASE("send_deinit_msg delivers from synchronous code", "[events][messenger]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 4);
    auto git = builder.build_with_name("git");

    git.send_deinit_msg();
    REQUIRE_FALSE(receiver.try_receive().has_value());  // not delivered until the context runs

    io.poll();
    auto event = receiver.try_receive();
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<DeinitEvent>(*event));
    REQUIRE(server_name_of(*event) == "git");
}

TEST_CASE("Producers wait for capacity instead of dropping", "[events][messenger]") {
    asio::io_context io;
    auto created = ServerMessengerBuilder::create(io.get_executor(), 1);
    auto& receiver = created.first;
    auto git = created.second.build_with_name("git");

    REQUIRE(run_sync(io, git.async_send_init_msg()).has_value());

    // Second send blocks until the receiver makes room
    auto consume = [&]() -> asio::awaitable<std::vector<std::string>> {
        std::vector<std::string> kinds;
        for (int i = 0; i < 2; ++i) {
            auto event = co_await receiver.async_receive();
            if (event) {
                kinds.emplace_back(event_kind(*event));
            }
        }
        co_return kinds;
    };

    asio::co_spawn(io, git.async_send_tools_list_result(two_tools()), asio::detached);
    auto kinds = run_sync(io, consume());

    REQUIRE(kinds == std::vector<std::string>{"init_start", "list_tools"});
}

TEST_CASE("Sending after the receiver closes fails", "[events][messenger]") {
    asio::io_context io;
    auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 4);
    auto git = builder.build_with_name("git");

    receiver.close();
    REQUIRE_FALSE(receiver.is_open());

    auto sent = run_sync(io, git.async_send_init_msg());
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().kind == MessengerError::Kind::Closed);

    // Deinit is best-effort and simply dropped
    git.send_deinit_msg();
    io.restart();
    io.poll();

    auto next = run_sync(io, receiver.async_receive());
    REQUIRE_FALSE(next.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// NullMessenger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("NullMessenger accepts everything", "[events][messenger]") {
    asio::io_context io;
    NullMessenger messenger;

    REQUIRE(run_sync(io, messenger.async_send_init_msg()).has_value());
    REQUIRE(run_sync(io, messenger.async_send_tools_list_result(two_tools())).has_value());
    REQUIRE(run_sync(io, messenger.async_send_oauth_link("x")).has_value());
    REQUIRE_NOTHROW(messenger.send_deinit_msg());
    REQUIRE(messenger.duplicate() != nullptr);
}
