#include "toolmux/tools/native_tools.hpp"
#include "toolmux/log/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace toolmux {

namespace {

ToolOutcome<std::string> required_string(const Json& args, const char* key) {
    if (args.is_object() == false || args.contains(key) == false) {
        return tl::unexpected(ToolError::invalid_arguments(std::string("missing '") + key + "'"));
    }
    if (args[key].is_string() == false) {
        return tl::unexpected(ToolError::invalid_arguments(std::string("'") + key + "' must be a string"));
    }
    return args[key].get<std::string>();
}

ToolOutcome<std::int64_t> optional_line(const Json& args, const char* key, std::int64_t fallback) {
    if (args.contains(key) == false || args[key].is_null()) {
        return fallback;
    }
    if (args[key].is_number_integer() == false) {
        return tl::unexpected(ToolError::invalid_arguments(std::string("'") + key + "' must be an integer"));
    }
    return args[key].get<std::int64_t>();
}

// 1-based index into [1, count]; negative counts from the end
std::int64_t resolve_line(std::int64_t line, std::int64_t count) {
    if (line < 0) {
        line = count + line + 1;
    }
    return std::clamp<std::int64_t>(line, 1, std::max<std::int64_t>(count, 1));
}

}  // namespace

bool BuiltinToolExecutor::has_tool(std::string_view name) const {
    return name == kFsRead || name == kFsWrite;
}

std::vector<ToolSpec> BuiltinToolExecutor::specs() const {
    return {
        ToolSpec{
            std::string(kFsRead),
            "Read lines from a file",
            Json{
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}}},
                    {"start_line", {{"type", "integer"}}},
                    {"end_line", {{"type", "integer"}}}
                }},
                {"required", Json::array({"path"})}
            }
        },
        ToolSpec{
            std::string(kFsWrite),
            "Create or overwrite a file",
            Json{
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}}},
                    {"content", {{"type", "string"}}}
                }},
                {"required", Json::array({"path", "content"})}
            }
        }
    };
}

bool BuiltinToolExecutor::trusted_by_default(std::string_view name) const {
    return name == kFsRead;
}

asio::awaitable<ToolOutcome<std::vector<ToolResultBlock>>> BuiltinToolExecutor::async_invoke(const ToolUse& use) {
    TOOLMUX_LOG_DEBUG("native tool " + use.name + " " + use.arguments.dump());

    if (use.name == kFsRead) {
        co_return fs_read(use.arguments);
    }
    if (use.name == kFsWrite) {
        co_return fs_write(use.arguments);
    }
    co_return tl::unexpected(ToolError::unknown_tool("unknown native tool '" + use.name + "'"));
}

ToolOutcome<std::vector<ToolResultBlock>> BuiltinToolExecutor::fs_read(const Json& args) {
    auto path = required_string(args, "path");
    if (!path) {
        return tl::unexpected(path.error());
    }
    auto start = optional_line(args, "start_line", 1);
    if (!start) {
        return tl::unexpected(start.error());
    }
    auto end = optional_line(args, "end_line", -1);
    if (!end) {
        return tl::unexpected(end.error());
    }

    std::error_code ec;
    if (std::filesystem::is_directory(*path, ec)) {
        return tl::unexpected(ToolError::invalid_arguments("'" + *path + "' is a directory"));
    }

    std::ifstream file(*path);
    if (!file.is_open()) {
        return tl::unexpected(ToolError::invocation("cannot open '" + *path + "'"));
    }

    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        lines.push_back(std::move(line));
    }

    auto count = static_cast<std::int64_t>(lines.size());
    if (count == 0) {
        return std::vector<ToolResultBlock>{ToolResultBlock{std::string{}}};
    }

    auto first = resolve_line(*start, count);
    auto last = resolve_line(*end, count);
    if (first > last) {
        return tl::unexpected(ToolError::invalid_arguments(
            "start_line " + std::to_string(*start) + " is after end_line " + std::to_string(*end)));
    }

    std::ostringstream out;
    for (auto i = first; i <= last; ++i) {
        out << lines[static_cast<std::size_t>(i - 1)];
        if (i != last) {
            out << '\n';
        }
    }
    return std::vector<ToolResultBlock>{ToolResultBlock{out.str()}};
}

ToolOutcome<std::vector<ToolResultBlock>> BuiltinToolExecutor::fs_write(const Json& args) {
    auto path = required_string(args, "path");
    if (!path) {
        return tl::unexpected(path.error());
    }
    auto content = required_string(args, "content");
    if (!content) {
        return tl::unexpected(content.error());
    }

    std::filesystem::path target(*path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return tl::unexpected(ToolError::invocation(
                "cannot create '" + target.parent_path().string() + "': " + ec.message()));
        }
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return tl::unexpected(ToolError::invocation("cannot open '" + *path + "' for writing"));
    }
    file << *content;
    if (!file) {
        return tl::unexpected(ToolError::invocation("write to '" + *path + "' failed"));
    }

    return std::vector<ToolResultBlock>{ToolResultBlock{
        "wrote " + std::to_string(content->size()) + " bytes to " + *path}};
}

}  // namespace toolmux
