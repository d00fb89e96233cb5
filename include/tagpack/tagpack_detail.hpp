#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <tagpack/codec/tagpack_reader.hpp>
#include <tagpack/codec/tagpack_writer.hpp>
#include <tagpack/core/tagpack_options.hpp>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <tagpack/serdes/tagpack_deserializer.hpp>
#include <tagpack/serdes/tagpack_serializer.hpp>
#include <tagpack/value/tagpack_value.hpp>
#include <tagpack/value/tagpack_value_codec.hpp>
#include <utility>
#include <vector>

namespace Tagpack::detail {

/**
 * @brief implementation of Serialize. Encodes into a fresh buffer.
 */
template <schema::Encodable T>
[[nodiscard]] std::vector<std::byte> Serialize(const T& value) {
    codec::Writer writer;
    serdes::Serializer::Serialize(value, writer);
    return std::move(writer).take();
}

/**
 * @brief implementation of Deserialize.
 *
 * Decodes the first value in the input; bytes after it are not examined.
 * Every failure is reported as InvalidInput, keeping the specific message
 * and tag.
 */
template <DecodeOptions Options, schema::Encodable T>
[[nodiscard]] std::optional<Error> Deserialize(std::span<const std::byte> input,
                                               T& out) {
    codec::Reader reader{input};
    if (auto err = serdes::Deserializer<Options>::Deserialize(reader, out);
        err.has_value()) {
        return err->as_invalid_input();
    }
    return std::nullopt;
}

/**
 * @brief implementation of DeserializeAny.
 */
[[nodiscard]] inline std::expected<Value, Error> DeserializeAny(
    std::span<const std::byte> input) {
    codec::Reader reader{input};
    return ReadValue(reader);
}

}  // namespace Tagpack::detail
