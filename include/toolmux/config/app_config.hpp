#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Application Configuration
// ═══════════════════════════════════════════════════════════════════════════
// JSON file describing the tool servers to launch and the initial trust
// settings:
//
//   {
//     "mcpServers": {
//       "git": { "command": "git-mcp", "args": ["--stdio"],
//                "env": {"TOKEN": "${GIT_TOKEN}"}, "timeout": 120000 }
//     },
//     "allowedTools": ["fs_read", "@git/read_*"],
//     "requestTimeoutMs": 120000,
//     "initTimeoutMs": 30000,
//     "eventChannelCapacity": 64
//   }

#include "toolmux/client/server_connection.hpp"
#include "toolmux/permissions/permission_resolver.hpp"
#include "toolmux/transport.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

struct ConfigError {
    enum class Kind {
        FileNotFound,
        ParseError,
        InvalidValue
    };

    Kind kind{Kind::InvalidValue};
    std::string message;

    [[nodiscard]] static ConfigError file_not_found(const std::filesystem::path& path) {
        return {Kind::FileNotFound, "config file not found: " + path.string()};
    }

    [[nodiscard]] static ConfigError parse_error(std::string msg) {
        return {Kind::ParseError, std::move(msg)};
    }

    [[nodiscard]] static ConfigError invalid_value(std::string msg) {
        return {Kind::InvalidValue, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError::Kind kind) noexcept {
    switch (kind) {
        case ConfigError::Kind::FileNotFound: return "FileNotFound";
        case ConfigError::Kind::ParseError:   return "ParseError";
        case ConfigError::Kind::InvalidValue: return "InvalidValue";
    }
    return "Unknown";
}

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

struct AppConfig {
    std::vector<ServerConfig> servers;
    ToolAllowlist allowed_tools;
    std::chrono::milliseconds request_timeout{120'000};
    std::chrono::milliseconds init_timeout{120'000};
    std::size_t event_channel_capacity{64};

    [[nodiscard]] static ConfigResult<AppConfig> from_json(const Json& j);

    /// Add (or replace) a server; validates the name
    ConfigResult<void> add_server(ServerConfig server);
};

[[nodiscard]] ConfigResult<AppConfig> load_config(const std::filesystem::path& path);

/// Replace ${NAME} with the value of environment variable NAME (empty if unset)
[[nodiscard]] std::string expand_env_vars(std::string_view value);

/// Non-empty and free of the server/tool delimiter
[[nodiscard]] ConfigResult<void> validate_server_name(std::string_view name);

}  // namespace toolmux
