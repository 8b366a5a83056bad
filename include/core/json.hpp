#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace promptshield {

/**
 * @brief Thin read-only wrapper around glz::json_t
 *
 * Used at the boundaries where untrusted JSON enters the shield: request
 * bodies, backend completions, classifier verdicts and persisted event
 * lines. Const operator[] returns copies so lookups on missing keys are
 * safe and never insert.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] size_t size() const { return data_.size(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access (returns copy, null on miss) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        const auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// Typed lookup that returns nullopt when the key is missing or has another type.
    [[nodiscard]] std::optional<std::string> get_string(std::string_view key) const {
        const auto v = (*this)[key];
        if (!v.is_string()) return std::nullopt;
        return v.get<std::string>();
    }

    [[nodiscard]] std::optional<double> get_number(std::string_view key) const {
        const auto v = (*this)[key];
        if (!v.is_number()) return std::nullopt;
        const double d = v.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        return d;
    }

    // ===== Iteration =====

    template <typename Fn>
    void for_each_element(Fn&& fn) const {
        if (!data_.is_array()) return;
        for (const auto& elem : data_.get_array()) {
            fn(JsonValue(elem));
        }
    }

    template <typename Fn>
    void for_each_member(Fn&& fn) const {
        if (!data_.is_object()) return;
        for (const auto& [key, val] : data_.get_object()) {
            fn(key, JsonValue(val));
        }
    }

    // ===== Parsing =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        const auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    /// Non-throwing parse for hot paths (log scanning)
    [[nodiscard]] static std::optional<JsonValue> try_parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        if (glz::read_json(result, buffer)) return std::nullopt;
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace promptshield
