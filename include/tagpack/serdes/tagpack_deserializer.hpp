#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tagpack/codec/tagpack_reader.hpp>
#include <tagpack/codec/tagpack_token.hpp>
#include <tagpack/codec/tagpack_writer.hpp>
#include <tagpack/core/tagpack_options.hpp>
#include <tagpack/core/tagpack_types.hpp>
#include <tagpack/core/tagpack_utf8.hpp>
#include <tagpack/schema/tagpack_descriptor.hpp>
#include <tagpack/schema/tagpack_enum.hpp>
#include <tagpack/schema/tagpack_field.hpp>
#include <tagpack/schema/tagpack_struct.hpp>
#include <tagpack/schema/tagpack_traits.hpp>
#include <tagpack/value/tagpack_value.hpp>
#include <tagpack/value/tagpack_value_codec.hpp>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Tagpack::serdes {

/**
 * @brief Schema-directed decoder.
 *
 * Errors distinguish malformed input (InvalidInput) from well-formed input
 * of the wrong shape (UnexpectedType). Untagged enums rely on this: a shape
 * mismatch moves on to the next alternative, malformed input stops the
 * decode.
 *
 * @tparam Options Decode configuration (see DecodeOptions).
 */
template <DecodeOptions Options = DefaultDecodeOptions>
struct Deserializer {
    /**
     * @brief Decodes one value of type T.
     * @param reader Cursor at the value; advanced past it on success.
     * @param out Destination. Partially written on failure.
     * @param depth Nesting level of this value.
     * @return std::nullopt on success, or Error.
     */
    template <typename T>
    [[nodiscard]] static std::optional<Error> Deserialize(codec::Reader& reader,
                                                          T& out,
                                                          std::size_t depth = 0) {
        static_assert(schema::Encodable<T>,
                      "type cannot be decoded; declare it with a TAGPACK_ "
                      "macro, Enum or Untagged");

        if (depth > Options::max_depth) {
            return Error::invalid_input("nesting too deep");
        }

        if constexpr (std::is_same_v<T, Nil>) {
            auto tok = expect<Nil>(reader, "expected nil");
            if (!tok) {
                return tok.error();
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            auto tok = expect<bool>(reader, "expected bool");
            if (!tok) {
                return tok.error();
            }
            out = *tok;
            return std::nullopt;
        } else if constexpr (std::is_integral_v<T>) {
            return read_integer(reader, out);
        } else if constexpr (std::is_same_v<T, float>) {
            auto tok = expect<float>(reader, "expected float32");
            if (!tok) {
                return tok.error();
            }
            out = *tok;
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, double>) {
            auto tok = expect<double>(reader, "expected float64");
            if (!tok) {
                return tok.error();
            }
            out = *tok;
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, std::string>) {
            auto tok = expect<codec::token::Str>(reader, "expected string");
            if (!tok) {
                return tok.error();
            }
            if (!IsValidUtf8(tok->data)) {
                return Error::unexpected_type("invalid utf-8 in string");
            }
            out.assign(tok->view());
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, Binary>) {
            auto tok = expect<codec::token::Bin>(reader, "expected binary");
            if (!tok) {
                return tok.error();
            }
            out.assign(tok->data.begin(), tok->data.end());
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, Value>) {
            auto value = ReadValue(reader);
            if (!value) {
                return value.error();
            }
            out = std::move(*value);
            return std::nullopt;
        } else if constexpr (schema::is_optional_v<T>) {
            return deserialize_optional(reader, out, depth);
        } else if constexpr (schema::is_vector_v<T>) {
            return deserialize_vector(reader, out, depth);
        } else if constexpr (schema::is_box_v<T>) {
            return deserialize_box(reader, out, depth);
        } else if constexpr (schema::is_shape_v<T, schema::Shape::NamedStruct>) {
            static_assert(schema::TaggedStruct<T>,
                          "tagged struct members must be Field<> or "
                          "Flatten<> with unique tags");
            return deserialize_tagged(reader, out, depth);
        } else if constexpr (schema::is_shape_v<T, schema::Shape::UntaggedStruct> ||
                             schema::is_shape_v<T, schema::Shape::TupleStruct>) {
            static_assert(schema::UntaggedStruct<T> || schema::TupleStruct<T>,
                          "ill-formed positional struct");
            return deserialize_positional(reader, out, depth);
        } else if constexpr (schema::is_shape_v<T, schema::Shape::NewtypeStruct>) {
            static_assert(schema::NewtypeStruct<T>, "ill-formed newtype struct");
            return Deserialize(reader, std::get<0>(out.get_fields()), depth + 1);
        } else if constexpr (schema::is_shape_v<T, schema::Shape::Enum>) {
            return deserialize_enum(reader, out, depth);
        } else {
            static_assert(schema::is_shape_v<T, schema::Shape::UntaggedEnum>);
            return try_alternatives(reader, out.get(), depth);
        }
    }

    /**
     * @brief Decodes a T if the input has T's shape.
     *
     * @return The value on success; std::nullopt on a shape mismatch, with
     * the reader left where it was; Error on malformed input.
     */
    template <typename T>
    [[nodiscard]] static std::expected<std::optional<T>, Error> TryDeserialize(
        codec::Reader& reader) {
        codec::Reader attempt = reader;
        T value{};
        if (auto err = Deserialize(attempt, value); err.has_value()) {
            if (err->code == ErrorCode::UnexpectedType) {
                return std::optional<T>{};
            }
            return std::unexpected(*err);
        }
        reader = attempt;
        return std::optional<T>{std::move(value)};
    }

   private:
    /**
     * @brief One key/value pair of a map being decoded as a tagged struct.
     * The key is kept in its canonical (narrowest) encoding so that equal
     * keys compare byte-equal whatever width they were sent in.
     */
    struct Entry {
        std::vector<std::byte> key;
        codec::Reader value;
    };

    using Entries = std::vector<Entry>;

    template <typename Alt>
    [[nodiscard]] static std::expected<Alt, Error> expect(
        codec::Reader& reader, std::string_view what) {
        auto tok = reader.read_token();
        if (!tok) {
            return std::unexpected(tok.error());
        }
        if (const auto* alt = std::get_if<Alt>(&*tok)) {
            return *alt;
        }
        return std::unexpected(Error::unexpected_type(what));
    }

    template <typename T>
    [[nodiscard]] static std::optional<Error> read_integer(codec::Reader& reader,
                                                           T& out) {
        auto tok = reader.read_token();
        if (!tok) {
            return tok.error();
        }
        if (const auto* u = std::get_if<uint64_t>(&*tok)) {
            if (*u > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                return Error::unexpected_type("integer out of range");
            }
            out = static_cast<T>(*u);
            return std::nullopt;
        }
        if (const auto* i = std::get_if<int64_t>(&*tok)) {
            if constexpr (std::is_unsigned_v<T>) {
                return Error::unexpected_type("integer out of range");
            } else {
                if (*i < static_cast<int64_t>(std::numeric_limits<T>::min())) {
                    return Error::unexpected_type("integer out of range");
                }
                out = static_cast<T>(*i);
                return std::nullopt;
            }
        }
        return Error::unexpected_type("expected integer");
    }

    template <typename T>
    [[nodiscard]] static std::optional<Error> deserialize_optional(
        codec::Reader& reader, std::optional<T>& out, std::size_t depth) {
        codec::Reader ahead = reader;
        auto next = ahead.read_token();
        if (!next) {
            return next.error();
        }
        if (std::holds_alternative<Nil>(*next)) {
            reader = ahead;
            out.reset();
            return std::nullopt;
        }
        T value{};
        if (auto err = Deserialize(reader, value, depth + 1); err.has_value()) {
            return err;
        }
        out = std::move(value);
        return std::nullopt;
    }

    template <typename T, typename A>
    [[nodiscard]] static std::optional<Error> deserialize_vector(
        codec::Reader& reader, std::vector<T, A>& out, std::size_t depth) {
        auto header = expect<codec::token::Array>(reader, "expected array");
        if (!header) {
            return header.error();
        }
        if (header->length > reader.remaining()) {
            return Error::invalid_input("declared length exceeds input");
        }
        out.clear();
        out.reserve(header->length);
        for (uint32_t i = 0; i < header->length; ++i) {
            T element{};
            if (auto err = Deserialize(reader, element, depth + 1);
                err.has_value()) {
                return err;
            }
            out.push_back(std::move(element));
        }
        return std::nullopt;
    }

    template <typename Box>
    [[nodiscard]] static std::optional<Error> deserialize_box(
        codec::Reader& reader, Box& out, std::size_t depth) {
        using Inner = typename Box::element_type;
        Box box;
        if constexpr (std::is_same_v<Box, std::shared_ptr<Inner>>) {
            box = std::make_shared<Inner>();
        } else {
            box = std::make_unique<Inner>();
        }
        if (auto err = Deserialize(reader, *box, depth + 1); err.has_value()) {
            return err;
        }
        out = std::move(box);
        return std::nullopt;
    }

    template <typename T>
    [[nodiscard]] static std::optional<Error> deserialize_positional(
        codec::Reader& reader, T& out, std::size_t depth) {
        auto header = expect<codec::token::Array>(reader, "expected array");
        if (!header) {
            return header.error();
        }
        if (header->length != schema::field_count_v<T>) {
            return Error::unexpected_type("array length mismatch");
        }
        std::optional<Error> err;
        std::apply(
            [&](auto&... members) {
                static_cast<void>(([&] {
                    err = Deserialize(reader, members, depth + 1);
                    return !err.has_value();
                }() &&
                                   ...));
            },
            out.get_fields());
        return err;
    }

    template <typename T>
    [[nodiscard]] static std::optional<Error> deserialize_tagged(
        codec::Reader& reader, T& out, std::size_t depth) {
        auto header = expect<codec::token::Map>(reader, "expected map");
        if (!header) {
            return header.error();
        }
        Entries entries;
        if (header->length > 0) {
            if (auto err = collect_entries(reader, header->length, entries);
                err.has_value()) {
                return err;
            }
        }
        return bind_fields(entries, out, depth);
    }

    /**
     * @brief Reads every pair of a map, skipping over the values and keeping
     * a cursor to each. Applies the duplicate-key policy.
     */
    [[nodiscard]] static std::optional<Error> collect_entries(
        codec::Reader& reader, uint32_t length, Entries& entries) {
        // Each pair takes at least two bytes.
        if (2 * static_cast<uint64_t>(length) > reader.remaining()) {
            return Error::invalid_input("declared length exceeds input");
        }
        entries.reserve(length);
        for (uint32_t i = 0; i < length; ++i) {
            auto key = ReadValue(reader);
            if (!key) {
                return key.error();
            }
            codec::Writer canonical;
            WriteValue(*key, canonical);

            const codec::Reader value_start = reader;
            if (auto err = reader.skip_value(); err.has_value()) {
                return err;
            }
            entries.push_back(Entry{std::move(canonical).take(), value_start});
        }

        if constexpr (Options::duplicate_keys == DuplicateKeyPolicy::Reject) {
            std::vector<std::span<const std::byte>> keys;
            keys.reserve(entries.size());
            for (const auto& entry : entries) {
                keys.emplace_back(entry.key);
            }
            std::ranges::sort(keys, [](const auto& a, const auto& b) {
                return std::ranges::lexicographical_compare(a, b);
            });
            const auto dup = std::ranges::adjacent_find(
                keys,
                [](const auto& a, const auto& b) {
                    return std::ranges::equal(a, b);
                });
            if (dup != keys.end()) {
                return Error::invalid_input("duplicate map key");
            }
        }
        return std::nullopt;
    }

    /**
     * @brief The entry for a tag. Scans from the back so that, when
     * duplicates are accepted, the last occurrence wins.
     */
    [[nodiscard]] static const Entry* find_entry(const Entries& entries,
                                                 Tag tag) {
        codec::Writer key;
        key.write_uint(tag);
        const auto it = std::find_if(
            entries.rbegin(), entries.rend(), [&key](const Entry& entry) {
                return std::ranges::equal(entry.key, key.bytes());
            });
        return it == entries.rend() ? nullptr : &*it;
    }

    template <typename T>
    [[nodiscard]] static std::optional<Error> bind_fields(
        const Entries& entries, T& out, std::size_t depth) {
        std::optional<Error> err;
        std::apply(
            [&](auto&... members) {
                static_cast<void>(([&] {
                    err = bind_member(entries, members, depth);
                    return !err.has_value();
                }() &&
                                   ...));
            },
            out.get_fields());
        return err;
    }

    template <typename M>
    [[nodiscard]] static std::optional<Error> bind_member(
        const Entries& entries, M& member, std::size_t depth) {
        if constexpr (schema::is_flatten_v<M>) {
            return bind_fields(entries, member.get(), depth);
        } else {
            const Entry* entry = find_entry(entries, M::tag);
            if (entry == nullptr) {
                if constexpr (M::optional) {
                    member.get().reset();
                    return std::nullopt;
                } else {
                    return Error::missing_field(M::tag);
                }
            }
            codec::Reader value = entry->value;
            typename M::ValueType decoded{};
            if (auto err = Deserialize(value, decoded, depth + 1);
                err.has_value()) {
                return err;
            }
            member.get() = std::move(decoded);
            return std::nullopt;
        }
    }

    template <typename T>
    [[nodiscard]] static std::optional<Error> deserialize_enum(
        codec::Reader& reader, T& out, std::size_t depth) {
        auto tok = reader.read_token();
        if (!tok) {
            return tok.error();
        }

        uint64_t tag = 0;
        bool has_payload = false;
        if (const auto* u = std::get_if<uint64_t>(&*tok)) {
            tag = *u;
        } else if (const auto* arr = std::get_if<codec::token::Array>(&*tok)) {
            if (arr->length != 2) {
                return Error::unexpected_type(
                    "enum array must hold a tag and a payload");
            }
            auto inner = expect<uint64_t>(reader, "expected enum tag");
            if (!inner) {
                return inner.error();
            }
            tag = *inner;
            has_payload = true;
        } else {
            return Error::unexpected_type("expected enum tag");
        }

        if (tag > std::numeric_limits<Tag>::max()) {
            return Error::unexpected_type("unknown enum tag");
        }
        return select_variant(reader, out.get(), static_cast<Tag>(tag),
                              has_payload, depth);
    }

    template <typename... Vs>
    [[nodiscard]] static std::optional<Error> select_variant(
        codec::Reader& reader, std::variant<Vs...>& out, Tag tag,
        bool has_payload, std::size_t depth) {
        std::optional<Error> err = Error::unexpected_type("unknown enum tag");
        ([&] {
            if (Vs::tag != tag) {
                return false;
            }
            err = decode_variant<Vs>(reader, out, has_payload, depth);
            return true;
        }() ||
         ...);
        return err;
    }

    template <typename V, typename Variant>
    [[nodiscard]] static std::optional<Error> decode_variant(
        codec::Reader& reader, Variant& out, bool has_payload,
        std::size_t depth) {
        if constexpr (V::payload == schema::Payload::Newtype) {
            if (!has_payload) {
                return Error::unexpected_type("enum variant expects a payload");
            }
            V variant{};
            if (auto err = Deserialize(reader, variant.value, depth + 1);
                err.has_value()) {
                return err;
            }
            out.template emplace<V>(std::move(variant));
        } else {
            if (has_payload) {
                return Error::unexpected_type("enum variant takes no payload");
            }
            out.template emplace<V>();
        }
        return std::nullopt;
    }

    /**
     * @brief Tries each alternative in order on its own copy of the cursor.
     * The first success commits its cursor; malformed input ends the search.
     */
    template <typename... Ts>
    [[nodiscard]] static std::optional<Error> try_alternatives(
        codec::Reader& reader, std::variant<Ts...>& out, std::size_t depth) {
        std::optional<Error> fatal;
        const bool matched = ([&] {
            codec::Reader attempt = reader;
            Ts candidate{};
            auto err = Deserialize(attempt, candidate, depth + 1);
            if (!err.has_value()) {
                reader = attempt;
                out.template emplace<Ts>(std::move(candidate));
                return true;
            }
            if (err->code != ErrorCode::UnexpectedType) {
                fatal = err;
                return true;
            }
            return false;
        }() ||
                             ...);
        if (fatal.has_value()) {
            return fatal;
        }
        if (!matched) {
            return Error::unexpected_type("no untagged variant matched");
        }
        return std::nullopt;
    }
};

}  // namespace Tagpack::serdes
