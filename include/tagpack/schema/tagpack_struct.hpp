#pragma once

#include <concepts>
#include <cstddef>
#include <tagpack/schema/tagpack_descriptor.hpp>
#include <tagpack/schema/tagpack_field.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <tuple>
#include <type_traits>
#include <utility>

#define TAGPACK_DETAIL_SHAPE(shape, ...)                                  \
    static constexpr ::Tagpack::schema::Shape tagpack_shape =             \
        ::Tagpack::schema::Shape::shape;                                  \
    constexpr auto get_fields() const { return std::tie(__VA_ARGS__); }   \
    constexpr auto get_fields() { return std::tie(__VA_ARGS__); }

/**
 * @brief Declares a named struct encoded as a map from tag to value. Every
 * listed member must be a Field<> or a Flatten<>.
 */
#define TAGPACK_FIELDS(...) TAGPACK_DETAIL_SHAPE(NamedStruct, __VA_ARGS__)

/**
 * @brief Declares a named struct encoded as an array of its members' values,
 * without tags.
 */
#define TAGPACK_UNTAGGED_FIELDS(...) \
    TAGPACK_DETAIL_SHAPE(UntaggedStruct, __VA_ARGS__)

/**
 * @brief Declares a single-member wrapper encoded exactly as its member.
 */
#define TAGPACK_NEWTYPE(member) TAGPACK_DETAIL_SHAPE(NewtypeStruct, member)

/**
 * @brief Declares a positional struct of two or more members, encoded as an
 * array.
 */
#define TAGPACK_TUPLE(...) TAGPACK_DETAIL_SHAPE(TupleStruct, __VA_ARGS__)

namespace Tagpack::schema {

/**
 * @brief Concept to detect a struct declared with one of the TAGPACK_
 * macros.
 */
template <typename T>
concept HasFieldsInterface = HasShape<T> && std::default_initializable<T> &&
                             requires(T& t, const T& ct) {
                                 t.get_fields();
                                 ct.get_fields();
                             };

namespace detail {

template <typename T>
constexpr bool all_named_members();

template <typename F>
constexpr bool is_named_member() {
    if constexpr (is_field_v<F>) {
        return Encodable<typename F::ValueType>;
    } else if constexpr (is_flatten_v<F>) {
        using Inner = typename F::InnerType;
        if constexpr (HasFieldsInterface<Inner> &&
                      is_shape_v<Inner, Shape::NamedStruct>) {
            return all_named_members<Inner>();
        } else {
            return false;
        }
    } else {
        return false;
    }
}

template <typename T>
constexpr bool all_named_members() {
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (true && ... && is_named_member<member_t<T, I>>());
    }(std::make_index_sequence<field_count_v<T>>{});
}

template <typename T>
constexpr bool all_encodable_members() {
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return (true && ... && Encodable<member_t<T, I>>);
    }(std::make_index_sequence<field_count_v<T>>{});
}

}  // namespace detail

/**
 * @brief A named struct with tags: members are Field<> or Flatten<> (over
 * another tagged named struct), and every tag, flattened ones included, is
 * unique.
 */
template <typename T>
concept TaggedStruct = HasFieldsInterface<T> &&
                       is_shape_v<T, Shape::NamedStruct> &&
                       detail::all_named_members<T>() &&
                       AllUnique(CollectTags<T>());

/**
 * @brief A named struct encoded positionally.
 */
template <typename T>
concept UntaggedStruct = HasFieldsInterface<T> &&
                         is_shape_v<T, Shape::UntaggedStruct> &&
                         detail::all_encodable_members<T>();

/**
 * @brief A transparent single-member wrapper.
 */
template <typename T>
concept NewtypeStruct =
    HasFieldsInterface<T> && is_shape_v<T, Shape::NewtypeStruct> &&
    field_count_v<T> == 1 && detail::all_encodable_members<T>();

/**
 * @brief A positional struct. Arity below two is not representable.
 */
template <typename T>
concept TupleStruct =
    HasFieldsInterface<T> && is_shape_v<T, Shape::TupleStruct> &&
    field_count_v<T> >= 2 && detail::all_encodable_members<T>();

/**
 * @brief Any well-formed struct schema.
 */
template <typename T>
concept Struct =
    TaggedStruct<T> || UntaggedStruct<T> || NewtypeStruct<T> || TupleStruct<T>;

}  // namespace Tagpack::schema
