#include "toolmux/tools/tool_types.hpp"

namespace toolmux {

std::string ToolResult::text() const {
    std::string out;
    for (const auto& block : content) {
        if (out.empty() == false) {
            out.push_back('\n');
        }
        if (const auto* text = std::get_if<std::string>(&block)) {
            out += *text;
        } else {
            out += std::get<Json>(block).dump();
        }
    }
    return out;
}

}  // namespace toolmux
