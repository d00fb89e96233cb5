#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <tagpack/codec/tagpack_reader.hpp>
#include <tagpack/codec/tagpack_token.hpp>
#include <tagpack/codec/tagpack_writer.hpp>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/value/tagpack_value.hpp>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Tagpack {

/**
 * @brief Writes a Value and all of its children.
 */
inline void WriteValue(const Value& value, codec::Writer& writer) {
    std::visit(
        [&writer](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Nil>) {
                writer.write_nil();
            } else if constexpr (std::is_same_v<T, bool>) {
                writer.write_bool(v);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                writer.write_int(v);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                writer.write_uint(v);
            } else if constexpr (std::is_same_v<T, float>) {
                writer.write_f32(v);
            } else if constexpr (std::is_same_v<T, double>) {
                writer.write_f64(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                writer.write_str(v);
            } else if constexpr (std::is_same_v<T, Binary>) {
                writer.write_bin(v);
            } else if constexpr (std::is_same_v<T, Value::Array>) {
                writer.write_array_header(v.size());
                for (const auto& element : v) {
                    WriteValue(element, writer);
                }
            } else if constexpr (std::is_same_v<T, Value::Map>) {
                writer.write_map_header(v.size());
                for (const auto& [key, val] : v) {
                    WriteValue(key, writer);
                    WriteValue(val, writer);
                }
            } else {
                writer.write_ext(v.type, v.data);
            }
        },
        value.get());
}

namespace detail {

/**
 * @brief An array or map being filled by ReadValue.
 */
struct OpenContainer {
    bool is_map;
    uint32_t length;
    Value::Array elements{};
    Value::Map entries{};
    std::optional<Value> key{};

    /**
     * @brief Appends the next decoded item. For maps, items alternate
     * between key and value.
     * @return true once the container holds all `length` children.
     */
    bool append(Value item) {
        if (!is_map) {
            elements.push_back(std::move(item));
            return elements.size() == length;
        }
        if (!key.has_value()) {
            key = std::move(item);
            return false;
        }
        entries.emplace_back(std::move(*key), std::move(item));
        key.reset();
        return entries.size() == length;
    }

    [[nodiscard]] Value close() && {
        if (is_map) {
            return Value{std::move(entries)};
        }
        return Value{std::move(elements)};
    }
};

[[nodiscard]] inline Value ScalarValue(const codec::Token& tok) {
    return std::visit(
        [](const auto& t) -> Value {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, codec::token::Str>) {
                return Value{std::string{t.view()}};
            } else if constexpr (std::is_same_v<T, codec::token::Bin>) {
                return Value{Binary(t.data.begin(), t.data.end())};
            } else if constexpr (std::is_same_v<T, codec::token::Ext>) {
                return Value{Ext{t.type, Binary(t.data.begin(), t.data.end())}};
            } else if constexpr (std::is_same_v<T, codec::token::Array>) {
                return Value{Value::Array{}};
            } else if constexpr (std::is_same_v<T, codec::token::Map>) {
                return Value{Value::Map{}};
            } else {
                return Value{t};
            }
        },
        tok);
}

}  // namespace detail

/**
 * @brief Reads one complete value of any shape.
 *
 * Fails only on malformed input: a bad marker, truncation, or a declared
 * length the remaining input cannot hold. Containers are filled from an
 * explicit stack, so nesting depth is limited by the input alone.
 *
 * @param reader Cursor positioned at the value; advanced past it on success.
 */
[[nodiscard]] inline std::expected<Value, Error> ReadValue(
    codec::Reader& reader) {
    std::vector<detail::OpenContainer> open;
    while (true) {
        auto tok = reader.read_token();
        if (!tok) {
            return std::unexpected(tok.error());
        }

        if (const auto* arr = std::get_if<codec::token::Array>(&*tok);
            arr != nullptr && arr->length > 0) {
            if (arr->length > reader.remaining()) {
                return std::unexpected(
                    Error::invalid_input("declared length exceeds input"));
            }
            open.push_back({.is_map = false, .length = arr->length});
            continue;
        }
        if (const auto* map = std::get_if<codec::token::Map>(&*tok);
            map != nullptr && map->length > 0) {
            if (2 * static_cast<uint64_t>(map->length) > reader.remaining()) {
                return std::unexpected(
                    Error::invalid_input("declared length exceeds input"));
            }
            open.push_back({.is_map = true, .length = map->length});
            continue;
        }

        // Close every container this item completes.
        Value item = detail::ScalarValue(*tok);
        while (!open.empty() && open.back().append(std::move(item))) {
            item = std::move(open.back()).close();
            open.pop_back();
        }
        if (open.empty()) {
            return item;
        }
    }
}

}  // namespace Tagpack
