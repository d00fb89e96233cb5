#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string_view>
#include <tagpack/codec/tagpack_marker.hpp>
#include <tagpack/codec/tagpack_token.hpp>
#include <tagpack/core/tagpack_endian.hpp>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Tagpack::codec {

/**
 * @brief Appends MessagePack tokens to an owned byte buffer.
 *
 * Every header and integer is written in the narrowest representation that
 * holds it. Writing never fails. Lengths above UINT32_MAX cannot be encoded
 * in MessagePack and are a precondition violation.
 */
class Writer {
   public:
    Writer() = default;

    void write_nil() { put(Marker::Nil); }

    void write_bool(bool value) { put(value ? Marker::True : Marker::False); }

    /**
     * @brief Writes a signed integer. Non-negative values take the unsigned
     * encodings, so 200 becomes uint8 rather than int16.
     */
    void write_int(int64_t value) {
        if (value >= 0) {
            write_uint(static_cast<uint64_t>(value));
        } else if (value >= MinNegativeFixint) {
            put_raw(static_cast<uint8_t>(static_cast<int8_t>(value)));
        } else if (value >= std::numeric_limits<int8_t>::min()) {
            put(Marker::Int8);
            put_be(static_cast<int8_t>(value));
        } else if (value >= std::numeric_limits<int16_t>::min()) {
            put(Marker::Int16);
            put_be(static_cast<int16_t>(value));
        } else if (value >= std::numeric_limits<int32_t>::min()) {
            put(Marker::Int32);
            put_be(static_cast<int32_t>(value));
        } else {
            put(Marker::Int64);
            put_be(value);
        }
    }

    void write_uint(uint64_t value) {
        if (value <= MaxPositiveFixint) {
            put_raw(static_cast<uint8_t>(value));
        } else if (value <= std::numeric_limits<uint8_t>::max()) {
            put(Marker::UInt8);
            put_be(static_cast<uint8_t>(value));
        } else if (value <= std::numeric_limits<uint16_t>::max()) {
            put(Marker::UInt16);
            put_be(static_cast<uint16_t>(value));
        } else if (value <= std::numeric_limits<uint32_t>::max()) {
            put(Marker::UInt32);
            put_be(static_cast<uint32_t>(value));
        } else {
            put(Marker::UInt64);
            put_be(value);
        }
    }

    void write_f32(float value) {
        put(Marker::Float32);
        put_be(value);
    }

    void write_f64(double value) {
        put(Marker::Float64);
        put_be(value);
    }

    void write_str(std::string_view value) {
        write_str(std::as_bytes(std::span{value.data(), value.size()}));
    }

    void write_str(std::span<const std::byte> bytes) {
        const auto len = length_of(bytes.size());
        if (len <= MaxFixStrLength) {
            put_raw(static_cast<uint8_t>(ToByte(Marker::FixStr) | len));
        } else {
            put_length(len, Marker::Str8, Marker::Str16, Marker::Str32);
        }
        put_bytes(bytes);
    }

    void write_bin(std::span<const std::byte> bytes) {
        put_length(length_of(bytes.size()), Marker::Bin8, Marker::Bin16,
                   Marker::Bin32);
        put_bytes(bytes);
    }

    void write_array_header(std::size_t length) {
        const auto len = length_of(length);
        if (len <= MaxFixArrayLength) {
            put_raw(static_cast<uint8_t>(ToByte(Marker::FixArray) | len));
        } else if (len <= std::numeric_limits<uint16_t>::max()) {
            put(Marker::Array16);
            put_be(static_cast<uint16_t>(len));
        } else {
            put(Marker::Array32);
            put_be(len);
        }
    }

    void write_map_header(std::size_t length) {
        const auto len = length_of(length);
        if (len <= MaxFixMapLength) {
            put_raw(static_cast<uint8_t>(ToByte(Marker::FixMap) | len));
        } else if (len <= std::numeric_limits<uint16_t>::max()) {
            put(Marker::Map16);
            put_be(static_cast<uint16_t>(len));
        } else {
            put(Marker::Map32);
            put_be(len);
        }
    }

    /**
     * @brief Writes an extension value, using a fixext form when the payload
     * is exactly 1, 2, 4, 8 or 16 bytes long.
     */
    void write_ext(int8_t type, std::span<const std::byte> bytes) {
        switch (bytes.size()) {
            case 1:
                put(Marker::FixExt1);
                break;
            case 2:
                put(Marker::FixExt2);
                break;
            case 4:
                put(Marker::FixExt4);
                break;
            case 8:
                put(Marker::FixExt8);
                break;
            case 16:
                put(Marker::FixExt16);
                break;
            default:
                put_length(length_of(bytes.size()), Marker::Ext8,
                           Marker::Ext16, Marker::Ext32);
                break;
        }
        put_be(type);
        put_bytes(bytes);
    }

    /**
     * @brief Writes a single token. Header tokens are not followed by their
     * elements; the caller writes those next.
     */
    void write(const Token& token) {
        std::visit(
            [this](const auto& t) {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, Nil>) {
                    write_nil();
                } else if constexpr (std::is_same_v<T, bool>) {
                    write_bool(t);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    write_int(t);
                } else if constexpr (std::is_same_v<T, uint64_t>) {
                    write_uint(t);
                } else if constexpr (std::is_same_v<T, float>) {
                    write_f32(t);
                } else if constexpr (std::is_same_v<T, double>) {
                    write_f64(t);
                } else if constexpr (std::is_same_v<T, token::Str>) {
                    write_str(t.data);
                } else if constexpr (std::is_same_v<T, token::Bin>) {
                    write_bin(t.data);
                } else if constexpr (std::is_same_v<T, token::Array>) {
                    write_array_header(t.length);
                } else if constexpr (std::is_same_v<T, token::Map>) {
                    write_map_header(t.length);
                } else {
                    write_ext(t.type, t.data);
                }
            },
            token);
    }

    /**
     * @brief View of the bytes written so far.
     */
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
        return buffer_;
    }

    /**
     * @brief Moves the written bytes out of the writer.
     */
    [[nodiscard]] std::vector<std::byte> take() && noexcept {
        return std::move(buffer_);
    }

   private:
    [[nodiscard]] static constexpr uint32_t length_of(std::size_t n) noexcept {
        return static_cast<uint32_t>(n);
    }

    void put(Marker m) { put_raw(ToByte(m)); }

    void put_raw(uint8_t b) { buffer_.push_back(static_cast<std::byte>(b)); }

    template <typename T>
    void put_be(T value) {
        const T be = BigEndian(value);
        const auto offset = buffer_.size();
        buffer_.resize(offset + sizeof(T));
        std::memcpy(buffer_.data() + offset, &be, sizeof(T));
    }

    void put_bytes(std::span<const std::byte> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    void put_length(uint32_t len, Marker m8, Marker m16, Marker m32) {
        if (len <= std::numeric_limits<uint8_t>::max()) {
            put(m8);
            put_be(static_cast<uint8_t>(len));
        } else if (len <= std::numeric_limits<uint16_t>::max()) {
            put(m16);
            put_be(static_cast<uint16_t>(len));
        } else {
            put(m32);
            put_be(len);
        }
    }

    std::vector<std::byte> buffer_;
};

}  // namespace Tagpack::codec
