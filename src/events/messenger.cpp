#include "toolmux/events/messenger.hpp"

namespace toolmux {

const std::string& server_name_of(const UpdateEventMessage& event) noexcept {
    return std::visit([](const auto& e) -> const std::string& { return e.server_name; }, event);
}

std::string_view event_kind(const UpdateEventMessage& event) noexcept {
    struct Visitor {
        std::string_view operator()(const ListToolsResultEvent&) const { return "list_tools"; }
        std::string_view operator()(const ListPromptsResultEvent&) const { return "list_prompts"; }
        std::string_view operator()(const ListResourcesResultEvent&) const { return "list_resources"; }
        std::string_view operator()(const ResourceTemplatesListResultEvent&) const { return "list_resource_templates"; }
        std::string_view operator()(const OauthLinkEvent&) const { return "oauth_link"; }
        std::string_view operator()(const InitStartEvent&) const { return "init_start"; }
        std::string_view operator()(const DeinitEvent&) const { return "deinit"; }
    };
    return std::visit(Visitor{}, event);
}

}  // namespace toolmux
