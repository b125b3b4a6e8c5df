#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// ToolPermissions - session trust overrides
// ─────────────────────────────────────────────────────────────────────────────
// Maps a pattern (same syntax as the allowlist: "fs_write", "@git",
// "@git/read_*") to a trust intent. Tools with no matching entry fall back
// to their own default. Mutated between turns only.

#include "toolmux/permissions/permission_resolver.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace toolmux {

enum class TrustIntent : std::uint8_t {
    Trusted,    // Runs without asking
    Untrusted,  // Always asks, even if the tool is trusted by default
    Blocked     // Never runs
};

[[nodiscard]] constexpr std::string_view to_string(TrustIntent intent) noexcept {
    switch (intent) {
        case TrustIntent::Trusted:   return "trusted";
        case TrustIntent::Untrusted: return "not trusted";
        case TrustIntent::Blocked:   return "blocked";
    }
    return "unknown";
}

enum class PermissionDecision : std::uint8_t {
    Allow,
    Ask,
    Deny
};

[[nodiscard]] constexpr std::string_view to_string(PermissionDecision decision) noexcept {
    switch (decision) {
        case PermissionDecision::Allow: return "allow";
        case PermissionDecision::Ask:   return "ask";
        case PermissionDecision::Deny:  return "deny";
    }
    return "unknown";
}

class ToolPermissions {
public:
    ToolPermissions() = default;

    /// Seed from a flat allowlist; every pattern becomes Trusted
    explicit ToolPermissions(const ToolAllowlist& allowed);

    void trust(std::string pattern);
    void untrust(std::string pattern);
    void block(std::string pattern);

    /// Every tool without an explicit Untrusted/Blocked entry is allowed
    void trust_all() noexcept { trust_all_ = true; }

    /// Forget every override, including trust_all
    void reset() noexcept;

    /// Forget one override; false if there was none
    bool reset_tool(std::string_view pattern);

    [[nodiscard]] std::optional<TrustIntent> intent(std::string_view pattern) const;
    [[nodiscard]] bool is_trust_all() const noexcept { return trust_all_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty() && !trust_all_; }

    [[nodiscard]] ToolAllowlist allowlist() const;
    [[nodiscard]] ToolAllowlist blocklist() const;

    [[nodiscard]] const std::map<std::string, TrustIntent, std::less<>>& entries() const noexcept {
        return entries_;
    }

    /// Deny on a block match; Ask on an explicit Untrusted entry for the tool
    /// or its server; Allow on trust-all or an allowlist match; else the
    /// tool's own default. A Trusted entry for "@server/tool" cancels an
    /// Untrusted "@server".
    [[nodiscard]] PermissionDecision evaluate(
        std::string_view tool_name,
        std::optional<std::string_view> server_name,
        bool trusted_by_default
    ) const;

    /// "trusted", "not trusted", "blocked"; "* " prefix when it is the default
    [[nodiscard]] std::string display_label(
        std::string_view tool_name,
        std::optional<std::string_view> server_name,
        bool trusted_by_default = false
    ) const;

    /// The key an override for exactly this tool is stored under
    [[nodiscard]] static std::string permission_key(
        std::string_view tool_name,
        std::optional<std::string_view> server_name
    );

private:
    [[nodiscard]] bool has_untrusted_entry(std::string_view tool_name, std::optional<std::string_view> server_name) const;

    std::map<std::string, TrustIntent, std::less<>> entries_;
    bool trust_all_{false};
};

}  // namespace toolmux
