#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <tagpack/core/tagpack_types.hpp>
#include <variant>

namespace Tagpack::codec {

/**
 * @brief Alternatives of a Token that are not plain arithmetic types.
 *
 * Payload views borrow from the buffer the token was read from; that buffer
 * must outlive the token.
 */
namespace token {

/**
 * @brief A borrowed string payload. Bytes are not checked for UTF-8.
 */
struct Str {
    std::span<const std::byte> data;

    [[nodiscard]] std::string_view view() const noexcept {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }

    [[nodiscard]] bool operator==(const Str& other) const noexcept {
        return std::ranges::equal(data, other.data);
    }
};

/**
 * @brief A borrowed binary payload.
 */
struct Bin {
    std::span<const std::byte> data;

    [[nodiscard]] bool operator==(const Bin& other) const noexcept {
        return std::ranges::equal(data, other.data);
    }
};

/**
 * @brief Array header; followed by `length` encoded elements.
 */
struct Array {
    uint32_t length;

    [[nodiscard]] constexpr bool operator==(const Array&) const noexcept =
        default;
};

/**
 * @brief Map header; followed by `length` encoded key/value pairs.
 */
struct Map {
    uint32_t length;

    [[nodiscard]] constexpr bool operator==(const Map&) const noexcept =
        default;
};

/**
 * @brief Extension header together with its borrowed payload. The header
 * length is data.size().
 */
struct Ext {
    int8_t type;
    std::span<const std::byte> data;

    [[nodiscard]] bool operator==(const Ext& other) const noexcept {
        return type == other.type && std::ranges::equal(data, other.data);
    }
};

}  // namespace token

/**
 * @brief One primitive unit of a MessagePack stream.
 *
 * Readers produce uint64_t for every non-negative integer and int64_t for
 * every negative one, whatever the wire width.
 */
using Token = std::variant<Nil, bool, int64_t, uint64_t, float, double,
                           token::Str, token::Bin, token::Array, token::Map,
                           token::Ext>;

}  // namespace Tagpack::codec
