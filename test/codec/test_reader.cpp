#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <tagpack/codec/tagpack_reader.hpp>
#include <tagpack/codec/tagpack_token.hpp>
#include <tagpack/codec/tagpack_writer.hpp>
#include <variant>
#include <vector>

#include "../test_bytes.hpp"

using namespace Tagpack;
using namespace Tagpack::codec;

namespace {

Token read_one(const std::vector<std::byte>& input) {
    Reader reader{input};
    auto tok = reader.read_token();
    REQUIRE(tok.has_value());
    return *tok;
}

Error read_error(const std::vector<std::byte>& input) {
    Reader reader{input};
    auto tok = reader.read_token();
    REQUIRE_FALSE(tok.has_value());
    return tok.error();
}

}  // namespace

TEST_CASE("Reader: integers of any width", "[reader]") {
    SECTION("non-negative values are read as uint64") {
        REQUIRE(read_one(Bytes({0x05})) == Token{uint64_t{5}});
        REQUIRE(read_one(Bytes({0xcc, 0x80})) == Token{uint64_t{128}});
        REQUIRE(read_one(Bytes({0xcd, 0x00, 0x05})) == Token{uint64_t{5}});
        REQUIRE(read_one(Bytes({0xce, 0x00, 0x00, 0x00, 0x05})) ==
                Token{uint64_t{5}});
        REQUIRE(read_one(Bytes({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
                                0xff, 0xff})) ==
                Token{std::numeric_limits<uint64_t>::max()});
    }

    SECTION("signed encodings of non-negative values normalize to uint64") {
        REQUIRE(read_one(Bytes({0xd0, 0x05})) == Token{uint64_t{5}});
        REQUIRE(read_one(Bytes({0xd3, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                0x00, 0x2a})) == Token{uint64_t{42}});
    }

    SECTION("negative values are read as int64") {
        REQUIRE(read_one(Bytes({0xff})) == Token{int64_t{-1}});
        REQUIRE(read_one(Bytes({0xe0})) == Token{int64_t{-32}});
        REQUIRE(read_one(Bytes({0xd0, 0x80})) == Token{int64_t{-128}});
        REQUIRE(read_one(Bytes({0xd1, 0xff, 0x7f})) == Token{int64_t{-129}});
        REQUIRE(read_one(Bytes({0xd2, 0xff, 0xff, 0xff, 0xff})) ==
                Token{int64_t{-1}});
        REQUIRE(read_one(Bytes({0xd3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00,
                                0x00, 0x00})) ==
                Token{std::numeric_limits<int64_t>::min()});
    }
}

TEST_CASE("Reader: scalars", "[reader]") {
    REQUIRE(read_one(Bytes({0xc0})) == Token{Nil{}});
    REQUIRE(read_one(Bytes({0xc3})) == Token{true});
    REQUIRE(read_one(Bytes({0xc2})) == Token{false});
    REQUIRE(read_one(Bytes({0xca, 0x3f, 0x80, 0x00, 0x00})) == Token{1.0f});
    REQUIRE(read_one(Bytes({0xcb, 0x3f, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00,
                            0x00})) == Token{1.0});
}

TEST_CASE("Reader: strings borrow from the input", "[reader]") {
    const auto input = Bytes({0xa5}) + "hello";
    Reader reader{input};
    auto tok = reader.read_token();
    REQUIRE(tok.has_value());
    const auto* str = std::get_if<token::Str>(&*tok);
    REQUIRE(str != nullptr);
    REQUIRE(str->view() == "hello");
    REQUIRE(str->data.data() == input.data() + 1);
    REQUIRE(reader.empty());

    REQUIRE(std::get<token::Str>(read_one(Bytes({0xd9, 0x02}) + "hi"))
                .view() == "hi");
    REQUIRE(std::get<token::Str>(read_one(Bytes({0xda, 0x00, 0x02}) + "hi"))
                .view() == "hi");
    REQUIRE(std::get<token::Str>(
                read_one(Bytes({0xdb, 0x00, 0x00, 0x00, 0x02}) + "hi"))
                .view() == "hi");
}

TEST_CASE("Reader: binary, array and map headers", "[reader]") {
    const auto bin_input = Bytes({0xc5, 0x00, 0x02, 0x01, 0x02});
    const auto bin = read_one(bin_input);
    REQUIRE(std::get<token::Bin>(bin).data.size() == 2);
    REQUIRE(std::get<token::Bin>(bin).data[1] == std::byte{0x02});

    REQUIRE(read_one(Bytes({0x93})) == Token{token::Array{3}});
    REQUIRE(read_one(Bytes({0xdc, 0x00, 0x10})) == Token{token::Array{16}});
    REQUIRE(read_one(Bytes({0xdd, 0x00, 0x01, 0x00, 0x00})) ==
            Token{token::Array{65536}});
    REQUIRE(read_one(Bytes({0x82})) == Token{token::Map{2}});
    REQUIRE(read_one(Bytes({0xde, 0x00, 0x10})) == Token{token::Map{16}});
    REQUIRE(read_one(Bytes({0xdf, 0x00, 0x01, 0x00, 0x00})) ==
            Token{token::Map{65536}});
}

TEST_CASE("Reader: fixext8 and fixext16 boundaries", "[reader][ext]") {
    SECTION("fixext8 consumes exactly 8 payload bytes") {
        const auto input =
            Bytes({0xd7, 0x05, 1, 2, 3, 4, 5, 6, 7, 8, 0x2a});
        Reader reader{input};
        auto tok = reader.read_token();
        REQUIRE(tok.has_value());
        const auto& ext = std::get<token::Ext>(*tok);
        REQUIRE(ext.type == 5);
        REQUIRE(ext.data.size() == 8);
        REQUIRE(ext.data[7] == std::byte{8});
        REQUIRE(reader.offset() == 10);

        auto next = reader.read_token();
        REQUIRE(next.has_value());
        REQUIRE(*next == Token{uint64_t{42}});
    }

    SECTION("fixext16 consumes exactly 16 payload bytes") {
        auto input = Bytes({0xd8, 0x7f});
        for (int i = 0; i < 16; ++i) {
            input.push_back(static_cast<std::byte>(i));
        }
        input.push_back(std::byte{0xc3});
        Reader reader{input};
        auto tok = reader.read_token();
        REQUIRE(tok.has_value());
        const auto& ext = std::get<token::Ext>(*tok);
        REQUIRE(ext.type == 127);
        REQUIRE(ext.data.size() == 16);
        REQUIRE(ext.data[15] == std::byte{15});
        REQUIRE(reader.offset() == 18);
        REQUIRE(reader.read_token() == Token{true});
    }

    SECTION("fixext8 and ext8 of length 8 are the same token") {
        const auto fixed_input = Bytes({0xd7, 0x01, 1, 2, 3, 4, 5, 6, 7, 8});
        const auto sized_input =
            Bytes({0xc7, 0x08, 0x01, 1, 2, 3, 4, 5, 6, 7, 8});
        REQUIRE(read_one(fixed_input) == read_one(sized_input));
    }

    SECTION("truncated fixext payloads fail") {
        REQUIRE(read_error(Bytes({0xd7, 0x01, 1, 2, 3, 4, 5, 6, 7})) ==
                ErrorCode::InvalidInput);
        REQUIRE(read_error(Bytes({0xd8, 0x01, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10,
                                  11, 12, 13, 14, 15})) ==
                ErrorCode::InvalidInput);
    }

    SECTION("other fixext sizes") {
        REQUIRE(std::get<token::Ext>(read_one(Bytes({0xd4, 0x01, 9})))
                    .data.size() == 1);
        REQUIRE(std::get<token::Ext>(read_one(Bytes({0xd5, 0x01, 9, 9})))
                    .data.size() == 2);
        REQUIRE(std::get<token::Ext>(read_one(Bytes({0xd6, 0xff, 9, 9, 9, 9})))
                    .type == -1);
    }
}

TEST_CASE("Reader: malformed input", "[reader]") {
    SECTION("empty input") {
        const auto err = read_error({});
        REQUIRE(err == ErrorCode::InvalidInput);
        REQUIRE(err.message == "unexpected end of input");
    }

    SECTION("reserved marker") {
        const auto err = read_error(Bytes({0xc1}));
        REQUIRE(err == ErrorCode::InvalidInput);
        REQUIRE(err.message == "reserved marker byte");
    }

    SECTION("truncated headers and payloads") {
        REQUIRE(read_error(Bytes({0xcd, 0x01})).message == "truncated input");
        REQUIRE(read_error(Bytes({0xcb, 0x00, 0x00})).message ==
                "truncated input");
        REQUIRE(read_error(Bytes({0xa3}) + "ab").message == "truncated input");
        REQUIRE(read_error(Bytes({0xd9, 0x05}) + "a").message ==
                "truncated input");
        REQUIRE(read_error(Bytes({0xc6, 0xff, 0xff, 0xff, 0xff})).message ==
                "truncated input");
        REQUIRE(read_error(Bytes({0xdc, 0x00})).message == "truncated input");
        REQUIRE(read_error(Bytes({0xdf, 0x00, 0x00})).message ==
                "truncated input");
        REQUIRE(read_error(Bytes({0xc7, 0x02})).message == "truncated input");
    }
}

TEST_CASE("Reader: copies are independent cursors", "[reader]") {
    const auto input = Bytes({0x01, 0x02});
    Reader a{input};
    Reader b = a;
    REQUIRE(b.read_token() == Token{uint64_t{1}});
    REQUIRE(a.offset() == 0);
    REQUIRE(b.offset() == 1);

    REQUIRE(a.peek_token() == Token{uint64_t{1}});
    REQUIRE(a.offset() == 0);
}

TEST_CASE("Reader: skip_value skips nested values", "[reader]") {
    // [1, {"a": true}], then 5
    const auto input = Bytes({0x92, 0x01, 0x81, 0xa1, 0x61, 0xc3, 0x05});
    Reader reader{input};
    const Reader start = reader;
    REQUIRE_FALSE(reader.skip_value().has_value());
    REQUIRE(reader.offset() == 6);
    REQUIRE(reader.consumed_since(start).size() == 6);
    REQUIRE(reader.read_token() == Token{uint64_t{5}});
}

TEST_CASE("Reader: skip_value bounds declared lengths by the input",
          "[reader]") {
    SECTION("huge array") {
        const auto input = Bytes({0xdd, 0xff, 0xff, 0xff, 0xff, 0x01});
        Reader reader{input};
        const auto err = reader.skip_value();
        REQUIRE(err.has_value());
        REQUIRE(*err == ErrorCode::InvalidInput);
        REQUIRE(err->message == "declared length exceeds input");
    }

    SECTION("map missing its last value") {
        const auto input = Bytes({0x82, 0x01, 0x02, 0x03});
        Reader reader{input};
        REQUIRE(reader.skip_value().has_value());
    }

    SECTION("reserved byte inside an array") {
        const auto input = Bytes({0x92, 0x01, 0xc1});
        Reader reader{input};
        const auto err = reader.skip_value();
        REQUIRE(err.has_value());
        REQUIRE(err->message == "reserved marker byte");
    }
}

TEST_CASE("Reader: writer output reads back token by token", "[reader]") {
    Writer w;
    w.write_map_header(1);
    w.write_int(-200);
    w.write_ext(3, Bytes({1, 2, 3, 4, 5, 6, 7, 8}));

    Reader reader{w.bytes()};
    REQUIRE(reader.read_token() == Token{token::Map{1}});
    REQUIRE(reader.read_token() == Token{int64_t{-200}});
    auto ext = reader.read_token();
    REQUIRE(ext.has_value());
    REQUIRE(std::get<token::Ext>(*ext).type == 3);
    REQUIRE(reader.empty());
}
