#include "toolmux/json/fast_json.hpp"

namespace toolmux {

namespace {

tl::unexpected<JsonParseError> parse_error(simdjson::error_code code) {
    return tl::unexpected(JsonParseError{std::string(simdjson::error_message(code))});
}

}  // namespace

bool is_blank_line(std::string_view line) noexcept {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

ParseResult JsonLineDecoder::decode(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    // simdjson reads past the end of its input, so the line is copied into padded storage
    simdjson::padded_string padded(line);
    auto document = parser_.iterate(padded);
    if (document.error() != simdjson::SUCCESS) {
        return parse_error(document.error());
    }

    try {
        auto doc = std::move(document).value();
        auto root = doc.get_value();
        if (root.error() != simdjson::SUCCESS) {
            return parse_error(root.error());
        }
        auto converted = convert(root.value(), 0);
        if (!converted) {
            return converted;
        }
        // Trailing garbage after the first document is an error, not a second message
        if (doc.at_end() == false) {
            return tl::unexpected(JsonParseError{"trailing content after JSON document"});
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError{e.what()});
    }
}

ParseResult JsonLineDecoder::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError{
            "maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"});
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return parse_error(type.error());
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto object = value.get_object();
            if (object.error() != simdjson::SUCCESS) {
                return parse_error(object.error());
            }
            nlohmann::json out = nlohmann::json::object();
            for (auto field : object.value()) {
                auto key = field.unescaped_key();
                if (key.error() != simdjson::SUCCESS) {
                    return parse_error(key.error());
                }
                std::string name(key.value());
                auto member = field.value();
                if (member.error() != simdjson::SUCCESS) {
                    return parse_error(member.error());
                }
                auto converted = convert(member.value(), depth + 1);
                if (!converted) {
                    return converted;
                }
                out[std::move(name)] = std::move(*converted);
            }
            return out;
        }

        case simdjson::ondemand::json_type::array: {
            auto array = value.get_array();
            if (array.error() != simdjson::SUCCESS) {
                return parse_error(array.error());
            }
            nlohmann::json out = nlohmann::json::array();
            for (auto element : array.value()) {
                if (element.error() != simdjson::SUCCESS) {
                    return parse_error(element.error());
                }
                auto converted = convert(element.value(), depth + 1);
                if (!converted) {
                    return converted;
                }
                out.push_back(std::move(*converted));
            }
            return out;
        }

        case simdjson::ondemand::json_type::string: {
            auto text = value.get_string();
            if (text.error() != simdjson::SUCCESS) {
                return parse_error(text.error());
            }
            return nlohmann::json(std::string(text.value()));
        }

        case simdjson::ondemand::json_type::number: {
            // Large ids arrive as unsigned integers, so check that before signed and double
            auto number_type = value.get_number_type();
            if (number_type.error() != simdjson::SUCCESS) {
                return parse_error(number_type.error());
            }
            switch (number_type.value()) {
                case simdjson::ondemand::number_type::unsigned_integer: {
                    auto n = value.get_uint64();
                    if (n.error() != simdjson::SUCCESS) {
                        return parse_error(n.error());
                    }
                    return nlohmann::json(n.value());
                }
                case simdjson::ondemand::number_type::signed_integer: {
                    auto n = value.get_int64();
                    if (n.error() != simdjson::SUCCESS) {
                        return parse_error(n.error());
                    }
                    return nlohmann::json(n.value());
                }
                default: {
                    auto n = value.get_double();
                    if (n.error() != simdjson::SUCCESS) {
                        return parse_error(n.error());
                    }
                    return nlohmann::json(n.value());
                }
            }
        }

        case simdjson::ondemand::json_type::boolean: {
            auto flag = value.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return parse_error(flag.error());
            }
            return nlohmann::json(flag.value());
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);

        default:
            break;
    }

    return tl::unexpected(JsonParseError{"unknown JSON type"});
}

}  // namespace toolmux
