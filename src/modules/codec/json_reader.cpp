// modules/codec/json_reader.cpp
#include "modules/codec/json_reader.h"
#include <algorithm>
#include <limits>

namespace stagecraft {

JsonObjectReader::JsonObjectReader(const nlohmann::json& value,
                                   std::string path,
                                   DecodeMode mode,
                                   std::initializer_list<std::string_view> known_fields)
    : value_(value), path_(std::move(path)) {
    if (!value_.is_object()) {
        throw type_mismatch(path_, "object", value_);
    }
    if (mode != DecodeMode::STRICT) return;

    for (auto it = value_.begin(); it != value_.end(); ++it) {
        const std::string& key = it.key();
        bool known = std::find(known_fields.begin(), known_fields.end(), key) != known_fields.end();
        if (!known) {
            throw DecodeError(DecodeErrorCode::UNKNOWN_FIELD, path_,
                              "unknown field \"" + key + "\" at " + path_);
        }
    }
}

std::string JsonObjectReader::field_path(std::string_view name) const {
    return path_ + "." + std::string(name);
}

const nlohmann::json* JsonObjectReader::find(std::string_view name) const {
    auto it = value_.find(std::string(name));
    if (it == value_.end() || it->is_null()) return nullptr;
    return &(*it);
}

std::string JsonObjectReader::get_string(std::string_view name) const {
    const nlohmann::json* v = find(name);
    if (v == nullptr) return {};
    if (!v->is_string()) throw type_mismatch(field_path(name), "string", *v);
    return v->get<std::string>();
}

int64_t JsonObjectReader::get_int(std::string_view name) const {
    const nlohmann::json* v = find(name);
    if (v == nullptr) return 0;
    if (!v->is_number_integer()) throw type_mismatch(field_path(name), "integer", *v);
    if (v->is_number_unsigned() &&
        v->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw DecodeError(DecodeErrorCode::TYPE_MISMATCH, field_path(name),
                          "integer out of range at " + field_path(name) + ": " + v->dump());
    }
    return v->get<int64_t>();
}

bool JsonObjectReader::get_bool(std::string_view name) const {
    return get_optional_bool(name).value_or(false);
}

std::optional<bool> JsonObjectReader::get_optional_bool(std::string_view name) const {
    const nlohmann::json* v = find(name);
    if (v == nullptr) return std::nullopt;
    if (!v->is_boolean()) throw type_mismatch(field_path(name), "boolean", *v);
    return v->get<bool>();
}

StringMap JsonObjectReader::get_string_map(std::string_view name) const {
    StringMap out;
    const nlohmann::json* v = find(name);
    if (v == nullptr) return out;
    std::string base = field_path(name);
    if (!v->is_object()) throw type_mismatch(base, "object", *v);
    for (auto it = v->begin(); it != v->end(); ++it) {
        if (!it->is_string()) {
            throw type_mismatch(base + "." + it.key(), "string", *it);
        }
        out.emplace(it.key(), it->get<std::string>());
    }
    return out;
}

std::vector<std::string> JsonObjectReader::get_string_list(std::string_view name) const {
    std::vector<std::string> out;
    for_each_element(name, [&out](const nlohmann::json& item, const std::string& item_path) {
        if (!item.is_string()) throw type_mismatch(item_path, "string", item);
        out.push_back(item.get<std::string>());
    });
    return out;
}

nlohmann::json JsonObjectReader::get_raw(std::string_view name) const {
    auto it = value_.find(std::string(name));
    if (it == value_.end()) return nullptr;
    return *it;
}

DecodeError JsonObjectReader::type_mismatch(const std::string& path,
                                            std::string_view expected,
                                            const nlohmann::json& actual) {
    return DecodeError(DecodeErrorCode::TYPE_MISMATCH, path,
                       "expected " + std::string(expected) + " at " + path +
                       ", got " + actual.type_name());
}

nlohmann::json parse_single_value(std::string_view payload) {
    // The lexer stops at a NUL byte, which would hide anything after it.
    auto nul = payload.find('\0');
    if (nul != std::string_view::npos) {
        throw DecodeError(DecodeErrorCode::TRAILING_CONTENT, "$",
                          "NUL byte in JSON payload at byte " + std::to_string(nul));
    }
    try {
        return nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::parse_error& e) {
        // Anything after a complete value is reported as "...; expected end of input".
        // A truncated document reads "unexpected end of input; expected ..." instead.
        std::string what = e.what();
        if (what.find("; expected end of input") != std::string::npos) {
            throw DecodeError(DecodeErrorCode::TRAILING_CONTENT, "$",
                              "trailing content after JSON value at byte " + std::to_string(e.byte));
        }
        throw DecodeError(DecodeErrorCode::SYNTAX, "$", std::string("invalid JSON: ") + e.what());
    }
}

} // namespace stagecraft
