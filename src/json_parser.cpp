#include "json_parser.hpp"
#include <format>

namespace mfa::json {

parsing_error::parsing_error(const std::string& msg)
    : std::runtime_error(msg) {}

output_error::output_error(const std::string& msg)
    : std::runtime_error(msg) {}

json_parser::json_parser(std::string_view json_str) {
    auto* tok = json_tokener_new();
    if (!tok) {
        throw std::bad_alloc{};
    }

    // json-c wants a null-terminated buffer even when a length is given.
    const std::string temp_json_for_c_api(json_str);

    m_obj = json_tokener_parse_ex(
        tok,
        temp_json_for_c_api.c_str(),
        static_cast<int>(temp_json_for_c_api.size())
    );

    if (json_tokener_get_error(tok) != json_tokener_success || m_obj == nullptr) {
        std::string err = json_tokener_error_desc(json_tokener_get_error(tok));
        json_tokener_free(tok);
        if (m_obj) {
            json_object_put(m_obj);
        }
        // Payloads may carry user identifiers, so only the position-free error is reported.
        throw parsing_error(std::format("JSON parsing error: {}", err));
    }

    json_tokener_free(tok);
}

json_parser::~json_parser() noexcept {
    if (m_obj) {
        json_object_put(m_obj);
    }
}

bool json_parser::has_key(std::string_view key) const noexcept {
    return json_object_object_get_ex(m_obj, std::string(key).c_str(), nullptr);
}

string_map json_parser::get_map() const {
    string_map fields;

    if (!m_obj || !json_object_is_type(m_obj, json_type_object)) {
        return fields;
    }

    json_object_object_foreach(m_obj, key, val) {
        if (!val || json_object_is_type(val, json_type_object) || json_object_is_type(val, json_type_array)) {
            continue;
        }
        if (const char* val_ptr = json_object_get_string(val)) {
            fields.try_emplace(key, val_ptr);
        } else {
            fields.try_emplace(key, "");
        }
    }
    return fields;
}

} // namespace mfa::json
