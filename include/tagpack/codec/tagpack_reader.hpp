#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <tagpack/codec/tagpack_marker.hpp>
#include <tagpack/codec/tagpack_token.hpp>
#include <tagpack/core/tagpack_endian.hpp>
#include <tagpack/core/tagpack_types.hpp>
#include <type_traits>
#include <variant>

namespace Tagpack::codec {

/**
 * @brief Cursor that reads MessagePack tokens from a borrowed byte buffer.
 *
 * A Reader is a plain (span, offset) pair and is cheap to copy. A copy is an
 * independent cursor: advancing it leaves the original untouched. Every read
 * is bounds checked; truncated or malformed input yields InvalidInput and
 * leaves the cursor at an unspecified position within the buffer.
 */
class Reader {
   public:
    constexpr explicit Reader(std::span<const std::byte> input) noexcept
        : input_(input) {}

    /**
     * @brief Reads the next token and advances past it.
     *
     * For string, binary and extension tokens the payload is consumed too and
     * the token borrows it. For array and map headers only the header is
     * consumed.
     */
    [[nodiscard]] std::expected<Token, Error> read_token() noexcept {
        if (empty()) {
            return std::unexpected(Error::invalid_input("unexpected end of input"));
        }
        const auto lead = static_cast<uint8_t>(input_[offset_++]);

        if (lead <= MaxPositiveFixint) {
            return Token{static_cast<uint64_t>(lead)};
        }
        if (lead >= ToByte(Marker::NegativeFixint)) {
            return Token{static_cast<int64_t>(static_cast<int8_t>(lead))};
        }
        if ((lead & 0xf0) == ToByte(Marker::FixMap)) {
            return Token{token::Map{static_cast<uint32_t>(lead & 0x0f)}};
        }
        if ((lead & 0xf0) == ToByte(Marker::FixArray)) {
            return Token{token::Array{static_cast<uint32_t>(lead & 0x0f)}};
        }
        if ((lead & 0xe0) == ToByte(Marker::FixStr)) {
            return read_str(lead & 0x1f);
        }

        switch (static_cast<Marker>(lead)) {
            case Marker::Nil:
                return Token{Nil{}};
            case Marker::False:
                return Token{false};
            case Marker::True:
                return Token{true};
            case Marker::Bin8:
                return read_sized<uint8_t>(
                    [this](uint32_t n) { return read_bin(n); });
            case Marker::Bin16:
                return read_sized<uint16_t>(
                    [this](uint32_t n) { return read_bin(n); });
            case Marker::Bin32:
                return read_sized<uint32_t>(
                    [this](uint32_t n) { return read_bin(n); });
            case Marker::Ext8:
                return read_sized<uint8_t>(
                    [this](uint32_t n) { return read_ext(n); });
            case Marker::Ext16:
                return read_sized<uint16_t>(
                    [this](uint32_t n) { return read_ext(n); });
            case Marker::Ext32:
                return read_sized<uint32_t>(
                    [this](uint32_t n) { return read_ext(n); });
            case Marker::Float32:
                return read_number<float, float>();
            case Marker::Float64:
                return read_number<double, double>();
            case Marker::UInt8:
                return read_number<uint8_t, uint64_t>();
            case Marker::UInt16:
                return read_number<uint16_t, uint64_t>();
            case Marker::UInt32:
                return read_number<uint32_t, uint64_t>();
            case Marker::UInt64:
                return read_number<uint64_t, uint64_t>();
            case Marker::Int8:
                return read_signed<int8_t>();
            case Marker::Int16:
                return read_signed<int16_t>();
            case Marker::Int32:
                return read_signed<int32_t>();
            case Marker::Int64:
                return read_signed<int64_t>();
            case Marker::FixExt1:
                return read_ext(1);
            case Marker::FixExt2:
                return read_ext(2);
            case Marker::FixExt4:
                return read_ext(4);
            case Marker::FixExt8:
                return read_ext(8);
            case Marker::FixExt16:
                return read_ext(16);
            case Marker::Str8:
                return read_sized<uint8_t>(
                    [this](uint32_t n) { return read_str(n); });
            case Marker::Str16:
                return read_sized<uint16_t>(
                    [this](uint32_t n) { return read_str(n); });
            case Marker::Str32:
                return read_sized<uint32_t>(
                    [this](uint32_t n) { return read_str(n); });
            case Marker::Array16:
                return read_sized<uint16_t>(
                    [](uint32_t n) -> std::expected<Token, Error> {
                        return Token{token::Array{n}};
                    });
            case Marker::Array32:
                return read_sized<uint32_t>(
                    [](uint32_t n) -> std::expected<Token, Error> {
                        return Token{token::Array{n}};
                    });
            case Marker::Map16:
                return read_sized<uint16_t>(
                    [](uint32_t n) -> std::expected<Token, Error> {
                        return Token{token::Map{n}};
                    });
            case Marker::Map32:
                return read_sized<uint32_t>(
                    [](uint32_t n) -> std::expected<Token, Error> {
                        return Token{token::Map{n}};
                    });
            default:
                break;
        }
        return std::unexpected(Error::invalid_input("reserved marker byte"));
    }

    /**
     * @brief Reads the next token without advancing.
     */
    [[nodiscard]] std::expected<Token, Error> peek_token() const noexcept {
        Reader copy = *this;
        return copy.read_token();
    }

    /**
     * @brief Skips one complete value, including every element of an array or
     * map, without building anything.
     *
     * Iterative: a pending counter replaces recursion, so nesting depth costs
     * nothing. Fails with InvalidInput when the remaining input cannot hold
     * the declared number of elements.
     */
    [[nodiscard]] std::optional<Error> skip_value() noexcept {
        uint64_t pending = 1;
        while (pending > 0) {
            // Each pending value needs at least one byte.
            if (pending > remaining()) {
                return Error::invalid_input("declared length exceeds input");
            }
            auto tok = read_token();
            if (!tok) {
                return tok.error();
            }
            --pending;
            if (const auto* arr = std::get_if<token::Array>(&*tok)) {
                pending += arr->length;
            } else if (const auto* map = std::get_if<token::Map>(&*tok)) {
                pending += 2 * static_cast<uint64_t>(map->length);
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Bytes consumed so far.
     */
    [[nodiscard]] constexpr std::size_t offset() const noexcept {
        return offset_;
    }

    [[nodiscard]] constexpr std::size_t remaining() const noexcept {
        return input_.size() - offset_;
    }

    [[nodiscard]] constexpr bool empty() const noexcept {
        return remaining() == 0;
    }

    /**
     * @brief The bytes between two cursor positions over the same buffer.
     */
    [[nodiscard]] constexpr std::span<const std::byte> consumed_since(
        const Reader& start) const noexcept {
        return input_.subspan(start.offset_, offset_ - start.offset_);
    }

   private:
    [[nodiscard]] std::expected<std::span<const std::byte>, Error> take(
        std::size_t n) noexcept {
        if (n > remaining()) {
            return std::unexpected(Error::invalid_input("truncated input"));
        }
        auto out = input_.subspan(offset_, n);
        offset_ += n;
        return out;
    }

    template <typename Wire>
    [[nodiscard]] std::expected<Wire, Error> read_be() noexcept {
        auto bytes = take(sizeof(Wire));
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        return LoadBigEndian<Wire>(*bytes);
    }

    template <typename Wire, typename Out>
    [[nodiscard]] std::expected<Token, Error> read_number() noexcept {
        auto v = read_be<Wire>();
        if (!v) {
            return std::unexpected(v.error());
        }
        return Token{static_cast<Out>(*v)};
    }

    template <typename Wire>
    [[nodiscard]] std::expected<Token, Error> read_signed() noexcept {
        auto v = read_be<Wire>();
        if (!v) {
            return std::unexpected(v.error());
        }
        if (*v >= 0) {
            return Token{static_cast<uint64_t>(*v)};
        }
        return Token{static_cast<int64_t>(*v)};
    }

    template <typename LengthType, typename F>
    [[nodiscard]] std::expected<Token, Error> read_sized(F&& then) noexcept {
        auto len = read_be<LengthType>();
        if (!len) {
            return std::unexpected(len.error());
        }
        return then(static_cast<uint32_t>(*len));
    }

    [[nodiscard]] std::expected<Token, Error> read_str(uint32_t n) noexcept {
        auto bytes = take(n);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        return Token{token::Str{*bytes}};
    }

    [[nodiscard]] std::expected<Token, Error> read_bin(uint32_t n) noexcept {
        auto bytes = take(n);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        return Token{token::Bin{*bytes}};
    }

    // Ext layout after the header: one type byte, then n payload bytes.
    [[nodiscard]] std::expected<Token, Error> read_ext(uint32_t n) noexcept {
        auto type = read_be<int8_t>();
        if (!type) {
            return std::unexpected(type.error());
        }
        auto bytes = take(n);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        return Token{token::Ext{*type, *bytes}};
    }

    std::span<const std::byte> input_;
    std::size_t offset_{0};
};

}  // namespace Tagpack::codec
