#pragma once

#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sqlgate {

/**
 * @brief Thin read-only wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies, missing keys
 * yield null. Used to navigate JSON-RPC requests and tool arguments.
 */
class JsonValue {
public:
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        double d = data_.get<double>();
        return d == std::floor(d) && std::isfinite(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
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
            // json_t stores all numbers as double; out-of-range casts are undefined
            const auto v = as_integer<T>();
            if (!v) {
                throw std::out_of_range("JSON number does not fit the target integer type");
            }
            return *v;
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /**
     * @brief Integral value if this is a whole number representable as T
     */
    template <typename T>
        requires std::is_integral_v<T>
    [[nodiscard]] std::optional<T> as_integer() const {
        if (!is_number_integer()) return std::nullopt;
        const double d = data_.get<double>();
        // max() + 1 is a power of two, so the bound is exact as a double
        constexpr double lo = static_cast<double>(std::numeric_limits<T>::min());
        constexpr double hi = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
        if (d < lo || d >= hi) return std::nullopt;
        return static_cast<T>(d);
    }

    // value() with default (nlohmann-compatible: node.value("key", default))
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        if (!data_.is_object()) return default_value;
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it == obj.end()) return default_value;
        return JsonValue(it->second).get<T>();
    }

    /**
     * @brief Serialize a scalar (string, number, bool, null) back to JSON text
     *
     * Used to echo JSON-RPC request ids. Containers serialize as null.
     */
    [[nodiscard]] std::string scalar_to_json() const {
        if (is_string()) {
            return utils::json_string(data_.get<std::string>());
        }
        if (const auto i = as_integer<int64_t>()) {
            return std::format("{}", *i);
        }
        if (is_number()) {
            return std::format("{}", data_.get<double>());
        }
        if (is_boolean()) {
            return data_.get<bool>() ? "true" : "false";
        }
        return "null";
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    // ===== Raw Access =====

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace sqlgate
