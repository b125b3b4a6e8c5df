#include "toolmux/config/app_config.hpp"
#include "toolmux/log/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace toolmux {

namespace {

ConfigResult<std::chrono::milliseconds> read_millis(const Json& j, const char* key, std::chrono::milliseconds fallback) {
    if (j.contains(key) == false) {
        return fallback;
    }
    // Zero would time out every request; values past INT64_MAX arrive as
    // unsigned and would wrap negative
    const auto& value = j[key];
    bool positive = value.is_number_unsigned()
        ? value.get<std::uint64_t>() > 0 && value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
        : value.is_number_integer() && value.get<std::int64_t>() > 0;
    if (positive == false) {
        return tl::unexpected(ConfigError::invalid_value(std::string("'") + key + "' must be a positive integer"));
    }
    return std::chrono::milliseconds(value.get<std::int64_t>());
}

ConfigResult<ServerConfig> read_server(const std::string& name, const Json& entry, std::chrono::milliseconds default_timeout) {
    auto where = [&name](const char* field) { return "mcpServers." + name + "." + field; };

    if (entry.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_value("mcpServers." + name + " must be an object"));
    }

    ServerConfig server;
    server.name = name;
    server.timeout = default_timeout;

    if (entry.contains("command") == false || entry["command"].is_string() == false ||
        entry["command"].get<std::string>().empty()) {
        return tl::unexpected(ConfigError::invalid_value(where("command") + " must be a non-empty string"));
    }
    server.command = entry["command"].get<std::string>();

    if (entry.contains("args")) {
        if (entry["args"].is_array() == false) {
            return tl::unexpected(ConfigError::invalid_value(where("args") + " must be an array of strings"));
        }
        for (const auto& arg : entry["args"]) {
            if (arg.is_string() == false) {
                return tl::unexpected(ConfigError::invalid_value(where("args") + " must be an array of strings"));
            }
            server.args.push_back(arg.get<std::string>());
        }
    }

    if (entry.contains("env")) {
        if (entry["env"].is_object() == false) {
            return tl::unexpected(ConfigError::invalid_value(where("env") + " must be an object"));
        }
        for (const auto& [key, value] : entry["env"].items()) {
            if (value.is_string() == false) {
                return tl::unexpected(ConfigError::invalid_value(where("env") + "." + key + " must be a string"));
            }
            server.env[key] = expand_env_vars(value.get<std::string>());
        }
    }

    auto timeout = read_millis(entry, "timeout", default_timeout);
    if (!timeout) {
        return tl::unexpected(ConfigError::invalid_value(where("timeout") + " must be a positive integer"));
    }
    server.timeout = *timeout;

    return server;
}

}  // namespace

std::string expand_env_vars(std::string_view value) {
    std::string out;
    out.reserve(value.size());

    std::size_t pos = 0;
    while (pos < value.size()) {
        auto open = value.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(value.substr(pos));
            break;
        }
        auto close = value.find('}', open + 2);
        if (close == std::string_view::npos) {
            out.append(value.substr(pos));
            break;
        }

        out.append(value.substr(pos, open - pos));
        std::string name(value.substr(open + 2, close - open - 2));
        if (const char* env = std::getenv(name.c_str())) {
            out.append(env);
        }
        pos = close + 1;
    }
    return out;
}

ConfigResult<void> validate_server_name(std::string_view name) {
    if (name.empty()) {
        return tl::unexpected(ConfigError::invalid_value("server name must not be empty"));
    }
    if (name.find(kServerToolDelimiter) != std::string_view::npos) {
        return tl::unexpected(ConfigError::invalid_value(
            "server name '" + std::string(name) + "' must not contain '" + kServerToolDelimiter + "'"));
    }
    return {};
}

ConfigResult<void> AppConfig::add_server(ServerConfig server) {
    auto valid = validate_server_name(server.name);
    if (!valid) {
        return valid;
    }
    if (server.command.empty()) {
        return tl::unexpected(ConfigError::invalid_value("server '" + server.name + "' has no command"));
    }

    for (auto& existing : servers) {
        if (existing.name == server.name) {
            existing = std::move(server);
            return {};
        }
    }
    servers.push_back(std::move(server));
    return {};
}

ConfigResult<AppConfig> AppConfig::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_value("config root must be an object"));
    }

    AppConfig config;

    auto request_timeout = read_millis(j, "requestTimeoutMs", config.request_timeout);
    if (!request_timeout) {
        return tl::unexpected(request_timeout.error());
    }
    config.request_timeout = *request_timeout;

    auto init_timeout = read_millis(j, "initTimeoutMs", config.init_timeout);
    if (!init_timeout) {
        return tl::unexpected(init_timeout.error());
    }
    config.init_timeout = *init_timeout;

    if (j.contains("eventChannelCapacity")) {
        const auto& capacity = j["eventChannelCapacity"];
        if (capacity.is_number_unsigned() == false || capacity.get<std::size_t>() == 0) {
            return tl::unexpected(ConfigError::invalid_value("'eventChannelCapacity' must be a positive integer"));
        }
        config.event_channel_capacity = capacity.get<std::size_t>();
    }

    if (j.contains("allowedTools")) {
        if (j["allowedTools"].is_array() == false) {
            return tl::unexpected(ConfigError::invalid_value("'allowedTools' must be an array of strings"));
        }
        for (const auto& pattern : j["allowedTools"]) {
            if (pattern.is_string() == false) {
                return tl::unexpected(ConfigError::invalid_value("'allowedTools' must be an array of strings"));
            }
            config.allowed_tools.insert(pattern.get<std::string>());
        }
    }

    if (j.contains("mcpServers")) {
        if (j["mcpServers"].is_object() == false) {
            return tl::unexpected(ConfigError::invalid_value("'mcpServers' must be an object"));
        }
        for (const auto& [name, entry] : j["mcpServers"].items()) {
            auto valid = validate_server_name(name);
            if (!valid) {
                return tl::unexpected(valid.error());
            }
            auto server = read_server(name, entry, config.request_timeout);
            if (!server) {
                return tl::unexpected(server.error());
            }
            config.servers.push_back(std::move(*server));
        }
    }

    return config;
}

ConfigResult<AppConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) == false) {
        return tl::unexpected(ConfigError::file_not_found(path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return tl::unexpected(ConfigError::file_not_found(path));
    }

    Json j = Json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return tl::unexpected(ConfigError::parse_error("invalid JSON in " + path.string()));
    }

    auto config = AppConfig::from_json(j);
    if (config) {
        TOOLMUX_LOG_INFO("loaded " + std::to_string(config->servers.size()) + " server(s) from " + path.string());
    }
    return config;
}

}  // namespace toolmux
