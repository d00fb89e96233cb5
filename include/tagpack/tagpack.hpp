#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <tagpack/codec/tagpack_reader.hpp>
#include <tagpack/codec/tagpack_writer.hpp>
#include <tagpack/core/tagpack_options.hpp>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/schema/tagpack_enum.hpp>
#include <tagpack/schema/tagpack_field.hpp>
#include <tagpack/schema/tagpack_struct.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <tagpack/serdes/tagpack_deserializer.hpp>
#include <tagpack/serdes/tagpack_serializer.hpp>
#include <tagpack/tagpack_detail.hpp>
#include <tagpack/value/tagpack_value.hpp>
#include <utility>
#include <vector>

/**
 * @brief The public API for Tagpack.
 *
 * This section contains all the interfaces for encoding and decoding typed
 * values, and transitively provides the types for declaring schemas (Field,
 * Flatten, Enum, Untagged and the TAGPACK_ macros) and the Value tree.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b Serialize: Encodes a value as MessagePack. Never fails.
 * - @b Deserialize: Decodes a value; every failure is InvalidInput.
 * - @b TryDeserialize: Decodes a value if the input has its shape, leaving
 *   the reader untouched otherwise.
 * - @b DeserializeAny: Decodes any well-formed input into a Value.
 * - @b Index: Looks up a key in a map Value, last match wins.
 * - @b ToValue / @b FromValue: Convert between typed values and Values.
 */

namespace Tagpack {

using schema::EmptyTupleVariant;
using schema::Enum;
using schema::Field;
using schema::Flatten;
using schema::NewtypeVariant;
using schema::Optional;
using schema::Required;
using schema::Untagged;
using schema::UnitVariant;

/**
 * @brief Encodes a value.
 *
 * @tparam T A leaf type, container, or declared schema type.
 * @param value The value to encode.
 * @return The MessagePack bytes.
 */
template <schema::Encodable T>
[[nodiscard]] std::vector<std::byte> Serialize(const T& value) {
    return detail::Serialize(value);
}

/**
 * @brief Encodes a value, appending to an existing writer.
 */
template <schema::Encodable T>
void Serialize(const T& value, codec::Writer& writer) {
    serdes::Serializer::Serialize(value, writer);
}

/**
 * @brief Decodes a value from the start of a buffer.
 *
 * Trailing bytes after the value are ignored.
 *
 * @tparam Options Decode configuration; rejects duplicate keys by default.
 * @tparam T The type to decode.
 * @param input The bytes to read.
 * @param out Output parameter for the decoded value.
 * @return std::nullopt on success, or an InvalidInput Error.
 */
template <DecodeOptions Options = DefaultDecodeOptions, schema::Encodable T>
[[nodiscard]] std::optional<Error> Deserialize(std::span<const std::byte> input,
                                               T& out) {
    return detail::Deserialize<Options>(input, out);
}

/**
 * @brief Decodes a value from the start of a buffer.
 *
 * @return The decoded value, or an InvalidInput Error.
 */
template <schema::Encodable T, DecodeOptions Options = DefaultDecodeOptions>
[[nodiscard]] std::expected<T, Error> Deserialize(
    std::span<const std::byte> input) {
    T out{};
    if (auto err = detail::Deserialize<Options>(input, out); err.has_value()) {
        return std::unexpected(*err);
    }
    return out;
}

/**
 * @brief Decodes a T at the reader's position if the input has T's shape.
 *
 * @param reader Advanced past the value on success only.
 * @return The value; std::nullopt if the input holds a different shape; an
 * InvalidInput Error if the input is malformed.
 */
template <schema::Encodable T, DecodeOptions Options = DefaultDecodeOptions>
[[nodiscard]] std::expected<std::optional<T>, Error> TryDeserialize(
    codec::Reader& reader) {
    return serdes::Deserializer<Options>::template TryDeserialize<T>(reader);
}

/**
 * @brief Decodes any well-formed input into a Value.
 *
 * Fails only on malformed input.
 */
[[nodiscard]] inline std::expected<Value, Error> DeserializeAny(
    std::span<const std::byte> input) {
    return detail::DeserializeAny(input);
}

/**
 * @brief Looks up a key in a map Value.
 *
 * @return The value of the last entry whose key equals `key`, or nullptr if
 * there is none or `value` is not a map.
 */
[[nodiscard]] inline const Value* Index(const Value& value, const Value& key) {
    return value.find(key);
}

/**
 * @brief Converts a typed value into its Value tree.
 */
template <schema::Encodable T>
[[nodiscard]] Value ToValue(const T& value) {
    const auto bytes = detail::Serialize(value);
    codec::Reader reader{bytes};
    // Encoder output is well-formed, so value() does not throw.
    return ReadValue(reader).value();
}

/**
 * @brief Decodes a typed value from a Value tree.
 */
template <schema::Encodable T, DecodeOptions Options = DefaultDecodeOptions>
[[nodiscard]] std::expected<T, Error> FromValue(const Value& value) {
    const auto bytes = detail::Serialize(value);
    return Deserialize<T, Options>(bytes);
}

}  // namespace Tagpack
