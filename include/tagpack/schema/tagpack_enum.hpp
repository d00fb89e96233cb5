#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/schema/tagpack_descriptor.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace Tagpack::schema {

/**
 * @brief Payload form of an enum variant.
 */
enum class Payload : uint8_t {
    Unit,        ///< No payload; encoded as the bare tag.
    EmptyTuple,  ///< Zero-element payload; encoded as the bare tag.
    Newtype,     ///< One value; encoded as [tag, value].
};

template <Tag Id>
struct UnitVariant {
    static constexpr Tag tag = Id;
    static constexpr Payload payload = Payload::Unit;

    [[nodiscard]] constexpr bool operator==(const UnitVariant&) const noexcept =
        default;
};

template <Tag Id>
struct EmptyTupleVariant {
    static constexpr Tag tag = Id;
    static constexpr Payload payload = Payload::EmptyTuple;

    [[nodiscard]] constexpr bool operator==(
        const EmptyTupleVariant&) const noexcept = default;
};

template <Tag Id, typename Type>
    requires Encodable<Type>
struct NewtypeVariant {
    static constexpr Tag tag = Id;
    static constexpr Payload payload = Payload::Newtype;
    using ValueType = Type;

    Type value{};

    [[nodiscard]] constexpr bool operator==(const NewtypeVariant&) const =
        default;
};

template <typename T>
concept EnumVariant = requires {
    { T::tag } -> std::convertible_to<Tag>;
    { T::payload } -> std::convertible_to<Payload>;
} && std::default_initializable<T>;

namespace detail {

template <typename T, typename... Ts>
inline constexpr bool is_one_of_v = (std::is_same_v<T, Ts> || ...);

template <typename... Ts>
struct distinct_types : std::true_type {};

template <typename T, typename... Ts>
struct distinct_types<T, Ts...>
    : std::bool_constant<!is_one_of_v<T, Ts...> &&
                         distinct_types<Ts...>::value> {};

}  // namespace detail

/**
 * @brief A tagged enum: the active variant is written as its tag, or as
 * [tag, value] for newtype variants.
 *
 * Variant tags must be unique.
 *
 * @tparam Variants UnitVariant, EmptyTupleVariant or NewtypeVariant types.
 */
template <typename... Variants>
    requires(sizeof...(Variants) > 0 && (EnumVariant<Variants> && ...) &&
             AllUnique(std::array<Tag, sizeof...(Variants)>{Variants::tag...}))
class Enum {
   public:
    static constexpr Shape tagpack_shape = Shape::Enum;
    using VariantType = std::variant<Variants...>;

    constexpr Enum() = default;

    template <typename V>
        requires detail::is_one_of_v<std::remove_cvref_t<V>, Variants...>
    // cppcheck-suppress noExplicitConstructor
    constexpr Enum(V&& v) : value_(std::forward<V>(v)) {}

    [[nodiscard]] constexpr const VariantType& get() const noexcept {
        return value_;
    }

    [[nodiscard]] constexpr VariantType& get() noexcept { return value_; }

    template <typename V>
    [[nodiscard]] constexpr bool holds() const noexcept {
        return std::holds_alternative<V>(value_);
    }

    template <typename V>
    [[nodiscard]] constexpr const V* get_if() const noexcept {
        return std::get_if<V>(&value_);
    }

    [[nodiscard]] constexpr bool operator==(const Enum&) const = default;

   private:
    VariantType value_;
};

/**
 * @brief An untagged enum: the active alternative is written alone. Decoding
 * tries each alternative in declaration order and keeps the first that
 * succeeds, so order matters when encodings overlap.
 *
 * @tparam Types Distinct payload types.
 */
template <typename... Types>
    requires(sizeof...(Types) > 0 && (Encodable<Types> && ...) &&
             detail::distinct_types<Types...>::value)
class Untagged {
   public:
    static constexpr Shape tagpack_shape = Shape::UntaggedEnum;
    using VariantType = std::variant<Types...>;

    constexpr Untagged() = default;

    template <typename V>
        requires detail::is_one_of_v<std::remove_cvref_t<V>, Types...>
    // cppcheck-suppress noExplicitConstructor
    constexpr Untagged(V&& v) : value_(std::forward<V>(v)) {}

    [[nodiscard]] constexpr const VariantType& get() const noexcept {
        return value_;
    }

    [[nodiscard]] constexpr VariantType& get() noexcept { return value_; }

    template <typename V>
    [[nodiscard]] constexpr bool holds() const noexcept {
        return std::holds_alternative<V>(value_);
    }

    template <typename V>
    [[nodiscard]] constexpr const V* get_if() const noexcept {
        return std::get_if<V>(&value_);
    }

    [[nodiscard]] constexpr bool operator==(const Untagged&) const = default;

   private:
    VariantType value_;
};

}  // namespace Tagpack::schema
