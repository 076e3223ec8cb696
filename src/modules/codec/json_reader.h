// modules/codec/json_reader.h
#ifndef STAGECRAFT_MODULES_CODEC_JSON_READER_H
#define STAGECRAFT_MODULES_CODEC_JSON_READER_H

#include "core/types/errors.h"
#include "core/types/resource.h"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace stagecraft {

enum class DecodeMode : uint8_t {
    LENIENT, // unknown fields ignored
    STRICT   // unknown fields rejected
};

// Field access over one JSON object with Go-style zero values:
// an absent or null field reads as "", 0, false, {} ...
// Any other type mismatch throws DecodeError(TYPE_MISMATCH) naming the path.
class JsonObjectReader {
public:
    JsonObjectReader(const nlohmann::json& value,
                     std::string path,
                     DecodeMode mode,
                     std::initializer_list<std::string_view> known_fields);

    const std::string& path() const { return path_; }
    std::string field_path(std::string_view name) const;

    // nullptr when the field is absent or null
    const nlohmann::json* find(std::string_view name) const;

    std::string get_string(std::string_view name) const;
    int64_t get_int(std::string_view name) const;
    bool get_bool(std::string_view name) const;
    std::optional<bool> get_optional_bool(std::string_view name) const;
    StringMap get_string_map(std::string_view name) const;
    std::vector<std::string> get_string_list(std::string_view name) const;
    // Opaque payload, copied verbatim (null when absent).
    nlohmann::json get_raw(std::string_view name) const;

    // Invoke fn(element, element_path) for each element of an array field.
    template<typename Fn>
    void for_each_element(std::string_view name, Fn&& fn) const {
        const nlohmann::json* arr = find(name);
        if (arr == nullptr) return;
        std::string base = field_path(name);
        if (!arr->is_array()) {
            throw type_mismatch(base, "array", *arr);
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            fn((*arr)[i], base + "[" + std::to_string(i) + "]");
        }
    }

    static DecodeError type_mismatch(const std::string& path, std::string_view expected, const nlohmann::json& actual);

private:
    const nlohmann::json& value_;
    std::string path_;
};

// Parse exactly one JSON value from payload. Whitespace may follow it, nothing else.
// Throws DecodeError(SYNTAX) or DecodeError(TRAILING_CONTENT).
nlohmann::json parse_single_value(std::string_view payload);

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_CODEC_JSON_READER_H
