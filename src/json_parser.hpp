#ifndef MFA_JSON_PARSER_HPP
#define MFA_JSON_PARSER_HPP

#include <json-c/json.h>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <functional> // For std::less
#include <memory>     // For std::unique_ptr
#include <new>        // For std::bad_alloc

namespace mfa::json {

class parsing_error : public std::runtime_error {
public:
    explicit parsing_error(const std::string& msg);
};

class output_error : public std::runtime_error {
public:
    explicit output_error(const std::string& msg);
};

using string_map = std::map<std::string, std::string, std::less<>>;

class json_parser {
public:
    explicit json_parser(std::string_view json_str);
    ~json_parser() noexcept;

    json_parser(const json_parser&) = delete;
    json_parser& operator=(const json_parser&) = delete;

    /**
     * @brief Builds a JSON object string from any map-like container of strings.
     * @tparam MapType A type that can be iterated over yielding key-value pairs of strings.
     * @param data The map-like container.
     * @return A JSON object as a std::string.
     */
    template<typename MapType>
    [[nodiscard]] static std::string build(const MapType& data) {
        auto obj_ptr = new_object();
        add_strings(obj_ptr.get(), data);
        return serialize(obj_ptr.get());
    }

    /**
     * @brief Builds a JSON object from `data` plus one nested object of strings under `nested_key`.
     */
    template<typename MapType, typename NestedMapType>
    [[nodiscard]] static std::string build(const MapType& data, std::string_view nested_key, const NestedMapType& nested) {
        auto obj_ptr = new_object();
        add_strings(obj_ptr.get(), data);

        auto nested_ptr = new_object();
        add_strings(nested_ptr.get(), nested);
        const std::string key{nested_key};
        if (json_object_object_add(obj_ptr.get(), key.c_str(), nested_ptr.get()) != 0) {
            throw output_error("json build: failed to add nested object: " + key);
        }
        nested_ptr.release(); // now owned by the parent object

        return serialize(obj_ptr.get());
    }

    [[nodiscard]] bool has_key(std::string_view key) const noexcept;

    /// @brief The top-level scalar members as strings; nested objects and arrays are skipped.
    [[nodiscard]] string_map get_map() const;

private:
    using object_ptr = std::unique_ptr<json_object, decltype(&json_object_put)>;

    [[nodiscard]] static object_ptr new_object() {
        auto* obj = json_object_new_object();
        if (!obj) {
            throw std::bad_alloc{};
        }
        return object_ptr(obj, &json_object_put);
    }

    template<typename MapType>
    static void add_strings(json_object* obj, const MapType& data) {
        for (const auto& [key, value] : data) {
            auto* j_value = json_object_new_string(std::string(value).c_str());
            if (!j_value) {
                throw output_error("json build: failed to create json string for key: " + std::string(key));
            }
            if (json_object_object_add(obj, std::string(key).c_str(), j_value) != 0) {
                json_object_put(j_value);
                throw output_error("json build: failed to add key to json object: " + std::string(key));
            }
        }
    }

    [[nodiscard]] static std::string serialize(json_object* obj) {
        const char* json_str = json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        if (!json_str) {
            throw output_error("json build: failed to convert json object to string");
        }
        return std::string{json_str};
    }

    struct json_object* m_obj;
};

} // namespace mfa::json

#endif // MFA_JSON_PARSER_HPP
