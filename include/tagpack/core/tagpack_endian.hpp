#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <span>
#include <type_traits>

namespace Tagpack {

/**
 * @brief Converts a value to/from Big Endian (network) byte order.
 *
 * @tparam T The type of the value to convert.
 * @param value The value to convert.
 * @return The converted value.
 */
template <typename T>
    requires std::integral<T> || std::floating_point<T>
[[nodiscard]] constexpr T BigEndian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else if constexpr (std::integral<T>) {
        return std::byteswap(value);
    } else {
        auto bits = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
        std::ranges::reverse(bits);
        return std::bit_cast<T>(bits);
    }
}

/**
 * @brief Loads a big endian value from the first sizeof(T) bytes of a span.
 *
 * The caller guarantees bytes.size() >= sizeof(T).
 */
template <typename T>
    requires std::integral<T> || std::floating_point<T>
[[nodiscard]] inline T LoadBigEndian(std::span<const std::byte> bytes) noexcept {
    T value{};
    std::memcpy(&value, bytes.data(), sizeof(T));
    return BigEndian(value);
}

}  // namespace Tagpack
