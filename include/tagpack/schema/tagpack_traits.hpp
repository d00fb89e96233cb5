#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/value/tagpack_value.hpp>
#include <type_traits>
#include <vector>

namespace Tagpack::schema {

/**
 * @brief The kind of a schema type, selecting its wire layout.
 */
enum class Shape : uint8_t {
    NamedStruct,     ///< Map of tag -> field value.
    UntaggedStruct,  ///< Array of field values in declaration order.
    NewtypeStruct,   ///< The single inner value, with no wrapper.
    TupleStruct,     ///< Array of two or more positional values.
    Enum,            ///< Bare tag, or [tag, payload].
    UntaggedEnum,    ///< The active variant's payload alone.
};

/**
 * @brief A type that declares its own schema shape.
 */
template <typename T>
concept HasShape = requires {
    { T::tagpack_shape } -> std::convertible_to<Shape>;
};

template <typename T, Shape S>
inline constexpr bool is_shape_v = [] {
    if constexpr (HasShape<T>) {
        return T::tagpack_shape == S;
    } else {
        return false;
    }
}();

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

/**
 * @brief std::vector<T> encoded as an array. Binary is excluded: it is a
 * byte string, not an array of integers.
 */
template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>>
    : std::bool_constant<!std::is_same_v<T, std::byte>> {};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

/**
 * @brief Owning pointers encoded as their pointee.
 */
template <typename T>
struct is_box : std::false_type {};

template <typename T>
struct is_box<std::unique_ptr<T>> : std::true_type {};

template <typename T>
struct is_box<std::shared_ptr<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_box_v = is_box<T>::value;

/**
 * @brief Types that map to a single MessagePack token or to a Value.
 */
template <typename T>
concept Leaf = std::same_as<T, Nil> || std::same_as<T, bool> ||
               std::integral<T> || std::same_as<T, float> ||
               std::same_as<T, double> || std::same_as<T, std::string> ||
               std::same_as<T, Binary> || std::same_as<T, Value>;

/**
 * @brief Types the transcoder accepts at any position of a schema.
 *
 * Checked one level deep; nested element types are checked when the
 * transcoder instantiates them.
 */
template <typename T>
concept Encodable = Leaf<T> || is_optional_v<T> || is_vector_v<T> ||
                    is_box_v<T> || HasShape<T>;

}  // namespace Tagpack::schema
