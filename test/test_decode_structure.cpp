#include <catch2/catch.hpp>
#include "test_model.h"

using namespace ds;

namespace {
Decoder& plainDecoder() {
    static Decoder decoder{DecodeOptions{}};
    return decoder;
}
}

TEST_CASE("Decode a structure with required and optional fields", "[decode][structure]") {
    auto p = plainDecoder().decode_input<Point>(parse_json(R"({"x": 1, "y": 2, "label": "p"})"));
    REQUIRE(p.x == 1);
    REQUIRE(p.y == 2);
    REQUIRE(p.label == "p");

    auto q = plainDecoder().decode_input<Point>(parse_json(R"({"x": 3, "y": 4})"));
    REQUIRE(q.label == "origin");
}

TEST_CASE("Missing required fields are reported together", "[decode][structure]") {
    try {
        plainDecoder().decode_input<Sample>(parse_json("{}"));
        FAIL("expected MissingRequiredAttributeError");
    } catch (const MissingRequiredAttributeError& e) {
        std::set<std::string> expected = {"a", "b"};
        REQUIRE(e.attrs() == expected);
        REQUIRE(e.path() == "$");
        REQUIRE(e.targetName() == "Sample");
        std::string msg = e.what();
        REQUIRE(msg.find("attrs: ['a', 'b']") != std::string::npos);
    }

    try {
        plainDecoder().decode_input<Sample>(parse_json(R"({"a": 1, "c": 3})"));
        FAIL("expected MissingRequiredAttributeError");
    } catch (const MissingRequiredAttributeError& e) {
        REQUIRE(e.attrs() == std::set<std::string>{"b"});
    }
}

TEST_CASE("Defaults and factories fill absent optional fields", "[decode][structure]") {
    auto s = plainDecoder().decode_input<Sample>(parse_json(R"({"a": 1, "b": 2})"));
    REQUIRE(s.c == 7);

    auto o = plainDecoder().decode_input<Order>(parse_json(R"({"items": []})"));
    REQUIRE(o.items.empty());
    REQUIRE(o.note == "none");
    REQUIRE(o.tags == std::vector<std::string>{"new"});

    auto given = plainDecoder().decode_input<Order>(parse_json(R"({"items": [], "tags": []})"));
    REQUIRE(given.tags.empty());
}

TEST_CASE("Unknown keys are ignored", "[decode][structure]") {
    auto p = plainDecoder().decode_input<Point>(parse_json(R"({"x": 1, "y": 2, "z": 99})"));
    REQUIRE(p.x == 1);
    REQUIRE(p.y == 2);
}

TEST_CASE("A structure target needs an object", "[decode][structure]") {
    REQUIRE_THROWS_AS(plainDecoder().decode_input<Point>(Dictionary(5)), WrongTypeError);
    REQUIRE_THROWS_AS(plainDecoder().decode_input<Point>(parse_json("[1, 2]")), WrongTypeError);
    REQUIRE_THROWS_AS(plainDecoder().decode_input<Point>(Dictionary::null()), WrongTypeError);
}

TEST_CASE("Field errors report the field path", "[decode][structure]") {
    try {
        plainDecoder().decode_input<Point>(parse_json(R"({"x": "one", "y": 2})"));
        FAIL("expected WrongTypeError");
    } catch (const WrongTypeError& e) {
        REQUIRE(e.path() == "$.x");
        REQUIRE(e.value() == Dictionary("one"));
    }
}

TEST_CASE("Enumerations, any and booleans inside a structure", "[decode][structure]") {
    auto px = plainDecoder().decode_input<Pixel>(
                parse_json(R"({"color": 2, "weight": 0.25, "visible": false, "extra": {"k": [1]}})"));
    REQUIRE(px.color == Color::Green);
    REQUIRE(px.weight == 0.25);
    REQUIRE_FALSE(px.visible);
    REQUIRE(px.extra.at("k").at(0).asInt() == 1);

    auto defaults = plainDecoder().decode_input<Pixel>(parse_json(R"({"color": 3})"));
    REQUIRE(defaults.weight == 1.0);
    REQUIRE(defaults.visible);
}

TEST_CASE("Free decode_input uses the global decoder", "[decode][structure]") {
    std::any decoded = decode_input(parse_json(R"({"n": 4})"), describe<Item>());
    REQUIRE(std::any_cast<Item>(decoded).n == 4);
    REQUIRE(decode_input<Item>(parse_json(R"({"n": 5})")).n == 5);
}
