#pragma once

#include <array>
#include <cstddef>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/schema/tagpack_field.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Tagpack::schema {

/**
 * @brief Compile-time description of one member of a named struct.
 */
struct FieldInfo {
    Tag tag{0};          ///< Wire tag; 0 for flatten members.
    bool optional{false};
    bool flatten{false};

    [[nodiscard]] constexpr bool operator==(const FieldInfo&) const noexcept =
        default;
};

/**
 * @brief The tuple of member references returned by T::get_fields().
 */
template <typename T>
using fields_tuple_t = decltype(std::declval<T&>().get_fields());

template <typename T>
inline constexpr std::size_t field_count_v =
    std::tuple_size_v<fields_tuple_t<T>>;

/**
 * @brief The declared (unqualified) type of the I-th member of T.
 */
template <typename T, std::size_t I>
using member_t =
    std::remove_cvref_t<std::tuple_element_t<I, fields_tuple_t<T>>>;

namespace detail {

template <typename F>
[[nodiscard]] constexpr FieldInfo describe_member() {
    if constexpr (is_flatten_v<F>) {
        return {0, false, true};
    } else {
        return {F::tag, F::optional, false};
    }
}

template <typename T>
[[nodiscard]] constexpr std::size_t tag_count();

template <typename F>
[[nodiscard]] constexpr std::size_t tags_in_member() {
    if constexpr (is_flatten_v<F>) {
        return tag_count<typename F::InnerType>();
    } else {
        return 1;
    }
}

template <typename T>
[[nodiscard]] constexpr std::size_t tag_count() {
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (std::size_t{0} + ... + tags_in_member<member_t<T, I>>());
    }(std::make_index_sequence<field_count_v<T>>{});
}

}  // namespace detail

/**
 * @brief Describes the direct members of a named struct, in declaration
 * order.
 */
template <typename T>
[[nodiscard]] constexpr std::array<FieldInfo, field_count_v<T>> Describe() {
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return std::array<FieldInfo, sizeof...(I)>{
            detail::describe_member<member_t<T, I>>()...};
    }(std::make_index_sequence<field_count_v<T>>{});
}

/**
 * @brief Every tag a named struct occupies in its map, including the tags of
 * flattened members at their splice position.
 */
template <typename T>
[[nodiscard]] constexpr std::array<Tag, detail::tag_count<T>()> CollectTags();

namespace detail {

template <typename F, std::size_t N>
constexpr void append_tags(std::array<Tag, N>& out, std::size_t& n) {
    if constexpr (is_flatten_v<F>) {
        for (Tag t : CollectTags<typename F::InnerType>()) {
            out[n++] = t;
        }
    } else {
        out[n++] = F::tag;
    }
}

}  // namespace detail

template <typename T>
[[nodiscard]] constexpr std::array<Tag, detail::tag_count<T>()> CollectTags() {
    std::array<Tag, detail::tag_count<T>()> out{};
    std::size_t n = 0;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (detail::append_tags<member_t<T, I>>(out, n), ...);
    }(std::make_index_sequence<field_count_v<T>>{});
    return out;
}

/**
 * @brief True if no tag appears twice.
 */
template <std::size_t N>
[[nodiscard]] constexpr bool AllUnique(const std::array<Tag, N>& tags) {
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = i + 1; j < N; ++j) {
            if (tags[i] == tags[j]) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace Tagpack::schema
