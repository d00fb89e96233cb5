#pragma once

#include <cstddef>
#include <string>
#include <tagpack/codec/tagpack_writer.hpp>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/schema/tagpack_descriptor.hpp>
#include <tagpack/schema/tagpack_enum.hpp>
#include <tagpack/schema/tagpack_field.hpp>
#include <tagpack/schema/tagpack_struct.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <tagpack/value/tagpack_value.hpp>
#include <tagpack/value/tagpack_value_codec.hpp>
#include <tuple>
#include <type_traits>
#include <variant>

namespace Tagpack::serdes {

/**
 * @brief Schema-directed encoder.
 *
 * Walks a value together with its type and writes:
 * - Tagged named structs as a map of (tag, value) pairs. Optional fields
 *   holding no value are left out; flattened members splice their pairs into
 *   the same map at their own position.
 * - Untagged named structs and tuples as an array of member values.
 * - Newtype structs as their single member.
 * - Enum unit and empty-tuple variants as the bare tag, newtype variants as
 *   [tag, value].
 * - Untagged enums as the active alternative alone.
 *
 * Encoding a well-formed value cannot fail.
 */
struct Serializer {
    template <typename T>
    static void Serialize(const T& value, codec::Writer& writer) {
        static_assert(schema::Encodable<T>,
                      "type cannot be encoded; declare it with a TAGPACK_ "
                      "macro, Enum or Untagged");

        if constexpr (std::is_same_v<T, Nil>) {
            writer.write_nil();
        } else if constexpr (std::is_same_v<T, bool>) {
            writer.write_bool(value);
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            writer.write_int(static_cast<int64_t>(value));
        } else if constexpr (std::is_integral_v<T>) {
            writer.write_uint(static_cast<uint64_t>(value));
        } else if constexpr (std::is_same_v<T, float>) {
            writer.write_f32(value);
        } else if constexpr (std::is_same_v<T, double>) {
            writer.write_f64(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writer.write_str(value);
        } else if constexpr (std::is_same_v<T, Binary>) {
            writer.write_bin(value);
        } else if constexpr (std::is_same_v<T, Value>) {
            WriteValue(value, writer);
        } else if constexpr (schema::is_optional_v<T>) {
            if (value.has_value()) {
                Serialize(*value, writer);
            } else {
                writer.write_nil();
            }
        } else if constexpr (schema::is_vector_v<T>) {
            writer.write_array_header(value.size());
            for (const auto& element : value) {
                Serialize(element, writer);
            }
        } else if constexpr (schema::is_box_v<T>) {
            // A null box has no pointee to encode.
            if (value) {
                Serialize(*value, writer);
            } else {
                writer.write_nil();
            }
        } else if constexpr (schema::is_shape_v<T, schema::Shape::NamedStruct>) {
            static_assert(schema::TaggedStruct<T>,
                          "tagged struct members must be Field<> or "
                          "Flatten<> with unique tags");
            writer.write_map_header(count_present(value));
            serialize_pairs(value, writer);
        } else if constexpr (schema::is_shape_v<T, schema::Shape::UntaggedStruct> ||
                             schema::is_shape_v<T, schema::Shape::TupleStruct>) {
            static_assert(schema::UntaggedStruct<T> || schema::TupleStruct<T>,
                          "ill-formed positional struct");
            writer.write_array_header(schema::field_count_v<T>);
            std::apply(
                [&writer](const auto&... members) {
                    (Serialize(members, writer), ...);
                },
                value.get_fields());
        } else if constexpr (schema::is_shape_v<T, schema::Shape::NewtypeStruct>) {
            static_assert(schema::NewtypeStruct<T>, "ill-formed newtype struct");
            Serialize(std::get<0>(value.get_fields()), writer);
        } else if constexpr (schema::is_shape_v<T, schema::Shape::Enum>) {
            std::visit(
                [&writer](const auto& variant) {
                    using V = std::decay_t<decltype(variant)>;
                    if constexpr (V::payload == schema::Payload::Newtype) {
                        writer.write_array_header(2);
                        writer.write_uint(V::tag);
                        Serialize(variant.value, writer);
                    } else {
                        writer.write_uint(V::tag);
                    }
                },
                value.get());
        } else {
            static_assert(schema::is_shape_v<T, schema::Shape::UntaggedEnum>);
            std::visit(
                [&writer](const auto& alternative) {
                    Serialize(alternative, writer);
                },
                value.get());
        }
    }

   private:
    /**
     * @brief Number of map entries a tagged struct writes, counting the
     * entries of flattened members.
     */
    template <typename T>
    [[nodiscard]] static std::size_t count_present(const T& value) noexcept {
        std::size_t count = 0;
        std::apply(
            [&count](const auto&... members) {
                ((count += count_member(members)), ...);
            },
            value.get_fields());
        return count;
    }

    template <typename M>
    [[nodiscard]] static std::size_t count_member(const M& member) noexcept {
        if constexpr (schema::is_flatten_v<M>) {
            return count_present(member.get());
        } else {
            return member.has_value() ? 1 : 0;
        }
    }

    template <typename T>
    static void serialize_pairs(const T& value, codec::Writer& writer) {
        std::apply(
            [&writer](const auto&... members) {
                (serialize_member(members, writer), ...);
            },
            value.get_fields());
    }

    template <typename M>
    static void serialize_member(const M& member, codec::Writer& writer) {
        if constexpr (schema::is_flatten_v<M>) {
            serialize_pairs(member.get(), writer);
        } else if constexpr (M::optional) {
            if (member.get().has_value()) {
                writer.write_uint(M::tag);
                Serialize(*member.get(), writer);
            }
        } else {
            writer.write_uint(M::tag);
            Serialize(member.get(), writer);
        }
    }
};

}  // namespace Tagpack::serdes
