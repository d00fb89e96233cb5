#pragma once

#include <concepts>
#include <optional>
#include <tagpack/core/tagpack_types.hpp>
#include <type_traits>
#include <utility>

namespace Tagpack::schema {

/**
 * @brief Presence policy: the key must appear in every encoded map.
 */
struct Required {
    static constexpr bool optional = false;
};

/**
 * @brief Presence policy: the key is omitted when the field holds no value,
 * and a missing key decodes to std::nullopt.
 */
struct Optional {
    static constexpr bool optional = true;
};

template <typename P>
concept Presence = std::same_as<P, Required> || std::same_as<P, Optional>;

/**
 * @brief A tagged member of a named struct.
 *
 * Optional fields store std::optional<Type>. A Required field of type
 * std::optional<T> is different: its key is always written, and a "no value"
 * is written as nil.
 *
 * @tparam Id Wire tag of the field.
 * @tparam P Presence policy (Required or Optional).
 * @tparam Type The field's value type.
 */
template <Tag Id, Presence P, typename Type>
class Field {
   public:
    static constexpr Tag tag = Id;
    static constexpr bool optional = P::optional;
    using ValueType = Type;
    using StorageType =
        std::conditional_t<P::optional, std::optional<Type>, Type>;

    constexpr Field() = default;

    template <typename U>
        requires(!std::same_as<std::remove_cvref_t<U>, Field> &&
                 std::constructible_from<StorageType, U &&>)
    // cppcheck-suppress noExplicitConstructor
    constexpr Field(U&& value) : value_(std::forward<U>(value)) {}

    [[nodiscard]] constexpr const StorageType& get() const noexcept {
        return value_;
    }

    [[nodiscard]] constexpr StorageType& get() noexcept { return value_; }

    constexpr void set(Type value) { value_ = std::move(value); }

    constexpr void clear() noexcept
        requires P::optional
    {
        value_.reset();
    }

    /**
     * @brief Whether the field contributes a key/value pair when encoded.
     */
    [[nodiscard]] constexpr bool has_value() const noexcept {
        if constexpr (P::optional) {
            return value_.has_value();
        } else {
            return true;
        }
    }

    [[nodiscard]] constexpr bool operator==(const Field&) const = default;

   private:
    StorageType value_{};
};

/**
 * @brief A member whose tagged fields are spliced into the enclosing map.
 *
 * @tparam Inner A tagged named struct.
 */
template <typename Inner>
class Flatten {
   public:
    using InnerType = Inner;

    constexpr Flatten() = default;

    template <typename U>
        requires(!std::same_as<std::remove_cvref_t<U>, Flatten> &&
                 std::constructible_from<Inner, U &&>)
    // cppcheck-suppress noExplicitConstructor
    constexpr Flatten(U&& value) : value_(std::forward<U>(value)) {}

    [[nodiscard]] constexpr const Inner& get() const noexcept {
        return value_;
    }

    [[nodiscard]] constexpr Inner& get() noexcept { return value_; }

    constexpr void set(Inner value) { value_ = std::move(value); }

    [[nodiscard]] constexpr bool operator==(const Flatten&) const = default;

   private:
    Inner value_{};
};

template <typename T>
struct is_field : std::false_type {};

template <Tag Id, typename P, typename T>
struct is_field<Field<Id, P, T>> : std::true_type {};

template <typename T>
inline constexpr bool is_field_v = is_field<T>::value;

template <typename T>
struct is_flatten : std::false_type {};

template <typename T>
struct is_flatten<Flatten<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_flatten_v = is_flatten<T>::value;

}  // namespace Tagpack::schema
