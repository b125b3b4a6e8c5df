#include "toolmux/permissions/tool_permissions.hpp"
#include "toolmux/log/logger.hpp"

namespace toolmux {

ToolPermissions::ToolPermissions(const ToolAllowlist& allowed) {
    for (const auto& pattern : allowed) {
        entries_.emplace(pattern, TrustIntent::Trusted);
    }
}

void ToolPermissions::trust(std::string pattern) {
    entries_[std::move(pattern)] = TrustIntent::Trusted;
}

void ToolPermissions::untrust(std::string pattern) {
    entries_[std::move(pattern)] = TrustIntent::Untrusted;
}

void ToolPermissions::block(std::string pattern) {
    entries_[std::move(pattern)] = TrustIntent::Blocked;
}

void ToolPermissions::reset() noexcept {
    entries_.clear();
    trust_all_ = false;
}

bool ToolPermissions::reset_tool(std::string_view pattern) {
    auto it = entries_.find(pattern);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::optional<TrustIntent> ToolPermissions::intent(std::string_view pattern) const {
    auto it = entries_.find(pattern);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ToolAllowlist ToolPermissions::allowlist() const {
    ToolAllowlist patterns;
    for (const auto& [pattern, intent] : entries_) {
        if (intent == TrustIntent::Trusted) {
            patterns.insert(pattern);
        }
    }
    return patterns;
}

ToolAllowlist ToolPermissions::blocklist() const {
    ToolAllowlist patterns;
    for (const auto& [pattern, intent] : entries_) {
        if (intent == TrustIntent::Blocked) {
            patterns.insert(pattern);
        }
    }
    return patterns;
}

PermissionDecision ToolPermissions::evaluate(
    std::string_view tool_name,
    std::optional<std::string_view> server_name,
    bool trusted_by_default
) const {
    auto decision = [&] {
        if (is_tool_in_allowlist(blocklist(), tool_name, server_name)) {
            return PermissionDecision::Deny;
        }
        if (has_untrusted_entry(tool_name, server_name)) {
            return PermissionDecision::Ask;
        }
        if (trust_all_ || is_tool_in_allowlist(allowlist(), tool_name, server_name)) {
            return PermissionDecision::Allow;
        }
        return trusted_by_default ? PermissionDecision::Allow : PermissionDecision::Ask;
    }();

    TOOLMUX_LOG_DEBUG("permission for '" + permission_key(tool_name, server_name) + "': " +
                      std::string(to_string(decision)));
    return decision;
}

std::string ToolPermissions::display_label(
    std::string_view tool_name,
    std::optional<std::string_view> server_name,
    bool trusted_by_default
) const {
    switch (evaluate(tool_name, server_name, trusted_by_default)) {
        case PermissionDecision::Deny:
            return std::string(to_string(TrustIntent::Blocked));
        case PermissionDecision::Ask:
            if (has_untrusted_entry(tool_name, server_name)) {
                return std::string(to_string(TrustIntent::Untrusted));
            }
            return "* " + std::string(to_string(TrustIntent::Untrusted));
        case PermissionDecision::Allow:
            if (trust_all_ || is_tool_in_allowlist(allowlist(), tool_name, server_name)) {
                return std::string(to_string(TrustIntent::Trusted));
            }
            return "* " + std::string(to_string(TrustIntent::Trusted));
    }
    return "unknown";
}

std::string ToolPermissions::permission_key(
    std::string_view tool_name,
    std::optional<std::string_view> server_name
) {
    if (!server_name) {
        return std::string(tool_name);
    }
    return qualified_tool_name(*server_name, tool_name);
}

bool ToolPermissions::has_untrusted_entry(
    std::string_view tool_name,
    std::optional<std::string_view> server_name
) const {
    // An entry for exactly this tool outranks one for its whole server
    auto exact = intent(permission_key(tool_name, server_name));
    if (exact == TrustIntent::Untrusted) {
        return true;
    }
    if (exact == TrustIntent::Trusted) {
        return false;
    }
    if (server_name) {
        auto server_wide = intent(std::string(1, kMcpPatternPrefix) + std::string(*server_name));
        return server_wide == TrustIntent::Untrusted;
    }
    return false;
}

}  // namespace toolmux
