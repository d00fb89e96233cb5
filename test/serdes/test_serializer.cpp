#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tagpack/codec/tagpack_writer.hpp>
#include <tagpack/serdes/tagpack_serializer.hpp>
#include <tagpack/tagpack.hpp>
#include <vector>

#include "../test_bytes.hpp"

using namespace Tagpack;
using namespace Tagpack::serdes;

namespace {

template <typename T>
std::vector<std::byte> encode(const T& value) {
    codec::Writer writer;
    Serializer::Serialize(value, writer);
    return std::move(writer).take();
}

struct Person {
    TAGPACK_FIELDS(age, name);

    Field<0, Required, uint32_t> age;
    Field<1, Optional, std::string> name;
};

struct Inner {
    TAGPACK_FIELDS(x, y);

    Field<1, Required, uint32_t> x;
    Field<2, Optional, uint32_t> y;
};

struct Outer {
    TAGPACK_FIELDS(a, inner, c);

    Field<0, Required, uint32_t> a;
    Flatten<Inner> inner;
    Field<3, Required, bool> c;
};

struct Empty {
    TAGPACK_FIELDS();
};

struct AllOptional {
    TAGPACK_FIELDS(a, b);

    Field<0, Optional, uint32_t> a;
    Field<1, Optional, std::string> b;
};

struct Row {
    TAGPACK_UNTAGGED_FIELDS(id, name);

    uint32_t id;
    std::string name;
};

struct Pair {
    TAGPACK_TUPLE(first, second);

    uint32_t first;
    bool second;
};

struct Id {
    TAGPACK_NEWTYPE(value);

    uint32_t value;
};

struct Nullable {
    TAGPACK_FIELDS(value);

    Field<0, Required, std::optional<uint32_t>> value;
};

using Command = Enum<UnitVariant<3>, EmptyTupleVariant<4>,
                     NewtypeVariant<5, uint32_t>>;

using Newtyped = Enum<NewtypeVariant<3, uint32_t>>;

}  // namespace

TEST_CASE("Serializer: tagged struct writes a map of tag to value",
          "[serializer]") {
    SECTION("optional field absent is omitted") {
        const Person p{.age = 42, .name = std::nullopt};
        const auto out = encode(p);
        REQUIRE(out == Bytes({0x81, 0x00, 0x2a}));
        REQUIRE(out.size() == 3);
    }

    SECTION("optional field present") {
        const Person p{.age = 42, .name = "hello"};
        REQUIRE(encode(p) == Bytes({0x82, 0x00, 0x2a, 0x01, 0xa5}) + "hello");
    }
}

TEST_CASE("Serializer: flatten splices pairs at its position",
          "[serializer]") {
    Outer o;
    o.a = 7;
    o.inner.get().x = 8;
    o.c = true;
    REQUIRE(encode(o) == Bytes({0x83, 0x00, 0x07, 0x01, 0x08, 0x03, 0xc3}));

    o.inner.get().y = 9;
    REQUIRE(encode(o) ==
            Bytes({0x84, 0x00, 0x07, 0x01, 0x08, 0x02, 0x09, 0x03, 0xc3}));
}

TEST_CASE("Serializer: structs with no present fields write an empty map",
          "[serializer]") {
    REQUIRE(encode(Empty{}) == Bytes({0x80}));
    REQUIRE(encode(AllOptional{}) == Bytes({0x80}));
}

TEST_CASE("Serializer: positional shapes", "[serializer]") {
    SECTION("untagged struct") {
        const Row r{42, "hello"};
        REQUIRE(encode(r) == Bytes({0x92, 0x2a, 0xa5}) + "hello");
    }

    SECTION("tuple struct") {
        REQUIRE(encode(Pair{1, true}) == Bytes({0x92, 0x01, 0xc3}));
    }

    SECTION("newtype struct is transparent") {
        REQUIRE(encode(Id{42}) == Bytes({0x2a}));
    }
}

TEST_CASE("Serializer: enum variants", "[serializer]") {
    SECTION("unit variant is the bare tag") {
        const Command c = UnitVariant<3>{};
        REQUIRE(encode(c) == Bytes({0x03}));
    }

    SECTION("empty tuple variant is the bare tag") {
        const Command c = EmptyTupleVariant<4>{};
        REQUIRE(encode(c) == Bytes({0x04}));
    }

    SECTION("newtype variant is [tag, value]") {
        const Newtyped n = NewtypeVariant<3, uint32_t>{42};
        const auto out = encode(n);
        REQUIRE(out == Bytes({0x92, 0x03, 0x2a}));
        REQUIRE(out.size() == 3);
    }
}

TEST_CASE("Serializer: untagged enum writes only the payload",
          "[serializer]") {
    using Key = Untagged<std::string, uint32_t>;
    REQUIRE(encode(Key{uint32_t{42}}) == encode(uint32_t{42}));
    REQUIRE(encode(Key{std::string{"hi"}}) == Bytes({0xa2, 0x68, 0x69}));
}

TEST_CASE("Serializer: nil for an ordinary optional", "[serializer]") {
    REQUIRE(encode(Nullable{}) == Bytes({0x81, 0x00, 0xc0}));
    REQUIRE(encode(Nullable{.value = uint32_t{5}}) == Bytes({0x81, 0x00, 0x05}));
}

TEST_CASE("Serializer: leaves and containers", "[serializer]") {
    REQUIRE(encode(int8_t{-1}) == Bytes({0xff}));
    REQUIRE(encode(uint8_t{200}) == Bytes({0xcc, 0xc8}));
    REQUIRE(encode(int16_t{200}) == Bytes({0xcc, 0xc8}));
    REQUIRE(encode(Nil{}) == Bytes({0xc0}));
    REQUIRE(encode(std::vector<uint8_t>{1, 2}) == Bytes({0x92, 0x01, 0x02}));
    REQUIRE(encode(Binary{std::byte{1}, std::byte{2}}) ==
            Bytes({0xc4, 0x02, 0x01, 0x02}));
    REQUIRE(encode(std::make_unique<uint32_t>(5)) == Bytes({0x05}));
    REQUIRE(encode(std::shared_ptr<uint32_t>{}) == Bytes({0xc0}));
    REQUIRE(encode(Value(Value::Map{{0, "a"}})) == Bytes({0x81, 0x00, 0xa1, 0x61}));
    REQUIRE(encode(std::vector<Person>{Person{.age = 1, .name = std::nullopt}}) ==
            Bytes({0x91, 0x81, 0x00, 0x01}));
}
