#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace Tagpack {

/**
 * @brief Checks that a byte sequence is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 */
[[nodiscard]] constexpr bool IsValidUtf8(
    std::span<const std::byte> bytes) noexcept {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<uint8_t>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xbf;
        if (lead >= 0xc2 && lead <= 0xdf) {
            len = 2;
        } else if (lead >= 0xe0 && lead <= 0xef) {
            len = 3;
            if (lead == 0xe0) {
                lo = 0xa0;
            } else if (lead == 0xed) {
                hi = 0x9f;
            }
        } else if (lead >= 0xf0 && lead <= 0xf4) {
            len = 4;
            if (lead == 0xf0) {
                lo = 0x90;
            } else if (lead == 0xf4) {
                hi = 0x8f;
            }
        } else {
            return false;
        }

        if (bytes.size() - i < len) {
            return false;
        }
        // Only the first continuation byte has a narrowed range.
        const auto first = static_cast<uint8_t>(bytes[i + 1]);
        if (first < lo || first > hi) {
            return false;
        }
        for (std::size_t k = 2; k < len; ++k) {
            const auto cont = static_cast<uint8_t>(bytes[i + k]);
            if (cont < 0x80 || cont > 0xbf) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

}  // namespace Tagpack
