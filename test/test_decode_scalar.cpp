#include <catch2/catch.hpp>
#include <ds/dictserde.h>
#include <cstdint>
#include <string>

using namespace ds;

namespace {
Decoder& plainDecoder() {
    static Decoder decoder{DecodeOptions{}};
    return decoder;
}
}

TEST_CASE("Integers decode from integer values only", "[decode][scalar]") {
    auto& decoder = plainDecoder();
    REQUIRE(decoder.decode_input<int64_t>(Dictionary(int64_t(5))) == 5);
    REQUIRE(decoder.decode_input<int>(Dictionary(-3)) == -3);

    REQUIRE_THROWS_AS(decoder.decode_input<int64_t>(Dictionary("5")), WrongTypeError);
    REQUIRE_THROWS_AS(decoder.decode_input<int64_t>(Dictionary(5.0)), WrongTypeError);
    REQUIRE_THROWS_AS(decoder.decode_input<int64_t>(Dictionary::null()), WrongTypeError);
}

TEST_CASE("Booleans are not integers unless enabled", "[decode][scalar]") {
    REQUIRE_THROWS_AS(plainDecoder().decode_input<int64_t>(Dictionary(true)), WrongTypeError);

    DecodeOptions options;
    options.bool_is_integer = true;
    Decoder lenient(options);
    REQUIRE(lenient.decode_input<int64_t>(Dictionary(true)) == 1);
    REQUIRE(lenient.decode_input<int64_t>(Dictionary(false)) == 0);
}

TEST_CASE("Integers outside the target range are rejected", "[decode][scalar]") {
    auto& decoder = plainDecoder();
    REQUIRE(decoder.decode_input<int8_t>(Dictionary(127)) == 127);
    REQUIRE_THROWS_AS(decoder.decode_input<int8_t>(Dictionary(300)), WrongTypeError);
    REQUIRE_THROWS_AS(decoder.decode_input<uint32_t>(Dictionary(-1)), WrongTypeError);
    REQUIRE(decoder.decode_input<uint32_t>(Dictionary(int64_t(4000000000))) == 4000000000u);
}

TEST_CASE("Floats outside the target range are rejected", "[decode][scalar]") {
    auto& decoder = plainDecoder();
    REQUIRE_THROWS_AS(decoder.decode_input<float>(Dictionary(1e300)), WrongTypeError);
    REQUIRE_THROWS_AS(decoder.decode_input<float>(Dictionary(-1e300)), WrongTypeError);
    REQUIRE(decoder.decode_input<float>(Dictionary(3.0e38)) == 3.0e38f);
    REQUIRE(decoder.decode_input<double>(Dictionary(1e300)) == 1e300);
}

TEST_CASE("Floats decode from double values", "[decode][scalar]") {
    auto& decoder = plainDecoder();
    REQUIRE(decoder.decode_input<double>(Dictionary(2.5)) == 2.5);
    REQUIRE(decoder.decode_input<float>(Dictionary(0.5)) == 0.5f);
    REQUIRE_THROWS_AS(decoder.decode_input<double>(Dictionary(1)), WrongTypeError);

    DecodeOptions options;
    options.integer_is_float = true;
    Decoder widening(options);
    REQUIRE(widening.decode_input<double>(Dictionary(1)) == 1.0);
}

TEST_CASE("Text, boolean and any", "[decode][scalar]") {
    auto& decoder = plainDecoder();
    REQUIRE(decoder.decode_input<std::string>(Dictionary("abc")) == "abc");
    REQUIRE_THROWS_AS(decoder.decode_input<std::string>(Dictionary(1)), WrongTypeError);

    REQUIRE(decoder.decode_input<bool>(Dictionary(false)) == false);
    REQUIRE_THROWS_AS(decoder.decode_input<bool>(Dictionary(0)), WrongTypeError);

    auto raw = parse_json(R"({"anything": [1, null]})");
    REQUIRE(decoder.decode_input<Dictionary>(raw) == raw);
    REQUIRE(decoder.decode_input<Dictionary>(Dictionary::null()).isNull());
}

TEST_CASE("Scalar errors carry value, target and path", "[decode][scalar]") {
    try {
        plainDecoder().decode_input<int64_t>(Dictionary("5"));
        FAIL("expected WrongTypeError");
    } catch (const WrongTypeError& e) {
        REQUIRE(e.path() == "$");
        REQUIRE(e.value() == Dictionary("5"));
        REQUIRE(e.target() == describe<int64_t>());
        REQUIRE(e.targetName() == "integer");
        REQUIRE(std::string(e.what()) == "path: $, target: integer, value: \"5\"");
    }
}

TEST_CASE("Validate reports instead of throwing", "[decode][scalar]") {
    auto& decoder = plainDecoder();
    REQUIRE_FALSE(decoder.validate(Dictionary(1), describe<int64_t>()).has_value());
    auto failure = decoder.validate(Dictionary("x"), describe<int64_t>());
    REQUIRE(failure.has_value());
    REQUIRE(failure->find("target: integer") != std::string::npos);
}
