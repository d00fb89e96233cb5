#pragma once

#include <cstdint>

namespace Tagpack::codec {

/**
 * @brief MessagePack leading bytes.
 *
 * Fixed-family entries (fixint, fixmap, fixarray, fixstr) name the first byte
 * of their range.
 */
enum class Marker : uint8_t {
    PositiveFixint = 0x00,
    FixMap = 0x80,
    FixArray = 0x90,
    FixStr = 0xa0,
    Nil = 0xc0,
    Reserved = 0xc1,
    False = 0xc2,
    True = 0xc3,
    Bin8 = 0xc4,
    Bin16 = 0xc5,
    Bin32 = 0xc6,
    Ext8 = 0xc7,
    Ext16 = 0xc8,
    Ext32 = 0xc9,
    Float32 = 0xca,
    Float64 = 0xcb,
    UInt8 = 0xcc,
    UInt16 = 0xcd,
    UInt32 = 0xce,
    UInt64 = 0xcf,
    Int8 = 0xd0,
    Int16 = 0xd1,
    Int32 = 0xd2,
    Int64 = 0xd3,
    FixExt1 = 0xd4,
    FixExt2 = 0xd5,
    FixExt4 = 0xd6,
    FixExt8 = 0xd7,
    FixExt16 = 0xd8,
    Str8 = 0xd9,
    Str16 = 0xda,
    Str32 = 0xdb,
    Array16 = 0xdc,
    Array32 = 0xdd,
    Map16 = 0xde,
    Map32 = 0xdf,
    NegativeFixint = 0xe0,
};

static constexpr uint8_t MaxPositiveFixint = 0x7f;
static constexpr int8_t MinNegativeFixint = -32;
static constexpr uint8_t MaxFixMapLength = 0x0f;
static constexpr uint8_t MaxFixArrayLength = 0x0f;
static constexpr uint8_t MaxFixStrLength = 0x1f;

[[nodiscard]] constexpr uint8_t ToByte(Marker m) noexcept {
    return static_cast<uint8_t>(m);
}

}  // namespace Tagpack::codec
