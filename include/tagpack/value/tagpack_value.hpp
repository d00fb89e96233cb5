#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tagpack/core/tagpack_types.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace Tagpack {

/**
 * @brief Owned byte string, encoded as MessagePack bin.
 */
using Binary = std::vector<std::byte>;

/**
 * @brief An owned extension value.
 */
struct Ext {
    int8_t type{0};
    Binary data;

    [[nodiscard]] bool operator==(const Ext&) const = default;
};

/**
 * @brief Owned, dynamically typed MessagePack value.
 *
 * Integers are normalized on construction: a non-negative value is always
 * stored as UInt and a negative one as Int, so Value(5) == Value(5u).
 * Maps are ordered sequences of pairs and may hold repeated keys.
 */
class Value {
   public:
    using Array = std::vector<Value>;
    using Map = std::vector<std::pair<Value, Value>>;
    using Storage = std::variant<Nil, bool, int64_t, uint64_t, float, double,
                                 std::string, Binary, Array, Map, Ext>;

    Value() = default;
    // cppcheck-suppress noExplicitConstructor
    Value(Nil) noexcept {}
    // cppcheck-suppress noExplicitConstructor
    Value(bool v) noexcept : data_(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    // cppcheck-suppress noExplicitConstructor
    Value(T v) noexcept {
        if constexpr (std::is_signed_v<T>) {
            if (v < 0) {
                data_ = static_cast<int64_t>(v);
                return;
            }
        }
        data_ = static_cast<uint64_t>(v);
    }

    // cppcheck-suppress noExplicitConstructor
    Value(float v) noexcept : data_(v) {}
    // cppcheck-suppress noExplicitConstructor
    Value(double v) noexcept : data_(v) {}
    // cppcheck-suppress noExplicitConstructor
    Value(std::string v) : data_(std::move(v)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(std::string_view v) : data_(std::string{v}) {}
    // cppcheck-suppress noExplicitConstructor
    Value(const char* v) : data_(std::string{v}) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Binary v) : data_(std::move(v)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Array v) : data_(std::move(v)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Map v) : data_(std::move(v)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Ext v) : data_(std::move(v)) {}

    [[nodiscard]] bool is_nil() const noexcept { return holds<Nil>(); }
    [[nodiscard]] bool is_bool() const noexcept { return holds<bool>(); }
    [[nodiscard]] bool is_int() const noexcept {
        return holds<int64_t>() || holds<uint64_t>();
    }
    [[nodiscard]] bool is_f32() const noexcept { return holds<float>(); }
    [[nodiscard]] bool is_f64() const noexcept { return holds<double>(); }
    [[nodiscard]] bool is_str() const noexcept { return holds<std::string>(); }
    [[nodiscard]] bool is_bin() const noexcept { return holds<Binary>(); }
    [[nodiscard]] bool is_array() const noexcept { return holds<Array>(); }
    [[nodiscard]] bool is_map() const noexcept { return holds<Map>(); }
    [[nodiscard]] bool is_ext() const noexcept { return holds<Ext>(); }

    [[nodiscard]] std::optional<bool> as_bool() const noexcept {
        if (const auto* b = std::get_if<bool>(&data_)) {
            return *b;
        }
        return std::nullopt;
    }

    /**
     * @brief The integer as int64_t, if it is an integer that fits.
     */
    [[nodiscard]] std::optional<int64_t> as_int() const noexcept {
        if (const auto* i = std::get_if<int64_t>(&data_)) {
            return *i;
        }
        if (const auto* u = std::get_if<uint64_t>(&data_);
            u != nullptr && *u <= static_cast<uint64_t>(
                                      std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(*u);
        }
        return std::nullopt;
    }

    /**
     * @brief The integer as uint64_t, if it is a non-negative integer.
     */
    [[nodiscard]] std::optional<uint64_t> as_uint() const noexcept {
        if (const auto* u = std::get_if<uint64_t>(&data_)) {
            return *u;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<float> as_f32() const noexcept {
        if (const auto* f = std::get_if<float>(&data_)) {
            return *f;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> as_f64() const noexcept {
        if (const auto* d = std::get_if<double>(&data_)) {
            return *d;
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::string* as_str() const noexcept {
        return std::get_if<std::string>(&data_);
    }
    [[nodiscard]] const Binary* as_bin() const noexcept {
        return std::get_if<Binary>(&data_);
    }
    [[nodiscard]] const Array* as_array() const noexcept {
        return std::get_if<Array>(&data_);
    }
    [[nodiscard]] const Map* as_map() const noexcept {
        return std::get_if<Map>(&data_);
    }
    [[nodiscard]] const Ext* as_ext() const noexcept {
        return std::get_if<Ext>(&data_);
    }

    /**
     * @brief Looks up a key in a map value.
     *
     * Scans every entry and returns the last one whose key equals `key`.
     *
     * @return The value, or nullptr if absent or if this is not a map.
     */
    [[nodiscard]] const Value* find(const Value& key) const noexcept {
        const auto* map = as_map();
        if (map == nullptr) {
            return nullptr;
        }
        const Value* found = nullptr;
        for (const auto& [k, v] : *map) {
            if (k == key) {
                found = &v;
            }
        }
        return found;
    }

    /**
     * @brief The element at a position of an array value.
     *
     * @return The element, or nullptr if out of range or if this is not an
     * array.
     */
    [[nodiscard]] const Value* at(std::size_t index) const noexcept {
        const auto* array = as_array();
        if (array == nullptr || index >= array->size()) {
            return nullptr;
        }
        return &(*array)[index];
    }

    [[nodiscard]] const Storage& get() const noexcept { return data_; }

    [[nodiscard]] bool operator==(const Value& other) const = default;

   private:
    template <typename T>
    [[nodiscard]] bool holds() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    Storage data_;
};

}  // namespace Tagpack
