#include <catch2/catch.hpp>
#include "test_model.h"

using namespace ds;

namespace {
Decoder& plainDecoder() {
    static Decoder decoder{DecodeOptions{}};
    return decoder;
}
using IntList = std::vector<int64_t>;
}

TEST_CASE("Decode a homogeneous sequence", "[decode][sequence]") {
    auto v = plainDecoder().decode_input<IntList>(parse_json("[1, 2, 3]"));
    REQUIRE(v == IntList{1, 2, 3});
    REQUIRE(plainDecoder().decode_input<IntList>(parse_json("[]")).empty());

    auto nested = plainDecoder().decode_input<std::vector<std::vector<std::string> > >(
                parse_json(R"([["a"], [], ["b", "c"]])"));
    REQUIRE(nested.size() == 3);
    REQUIRE(nested[2][1] == "c");
}

TEST_CASE("A sequence target needs an array", "[decode][sequence]") {
    REQUIRE_THROWS_AS(plainDecoder().decode_input<IntList>(parse_json("{}")), WrongTypeError);
    REQUIRE_THROWS_AS(plainDecoder().decode_input<IntList>(Dictionary("1,2")), WrongTypeError);
}

TEST_CASE("Every failing element is reported", "[decode][sequence]") {
    try {
        plainDecoder().decode_input<IntList>(parse_json(R"([1, "x", 3])"));
        FAIL("expected WrongCollectionError");
    } catch (const WrongCollectionError& e) {
        REQUIRE(e.path() == "$");
        REQUIRE(e.details().size() == 1);
        REQUIRE(e.details()[0].path() == "$[1]");
        REQUIRE(e.details()[0].value() == Dictionary("x"));
        REQUIRE(e.details()[0].targetName() == "integer");
        std::string msg = e.what();
        REQUIRE(msg.find("details:\n- path: $[1]") != std::string::npos);
    }

    try {
        plainDecoder().decode_input<IntList>(parse_json(R"(["a", 2, null, 4.5])"));
        FAIL("expected WrongCollectionError");
    } catch (const WrongCollectionError& e) {
        REQUIRE(e.details().size() == 3);
        REQUIRE(e.details()[0].path() == "$[0]");
        REQUIRE(e.details()[1].path() == "$[2]");
        REQUIRE(e.details()[2].path() == "$[3]");
    }
}

TEST_CASE("Element errors keep the inner failure", "[decode][sequence]") {
    try {
        plainDecoder().decode_input<Order>(parse_json(R"({"items": [{"n": "bad"}, {"n": 2}]})"));
        FAIL("expected WrongCollectionError");
    } catch (const WrongCollectionError& e) {
        REQUIRE(e.path() == "$.items");
        REQUIRE(e.details().size() == 1);
        const auto& item = e.details()[0];
        REQUIRE(item.path() == "$.items[0]");
        REQUIRE(item.targetName() == "Item");
        REQUIRE(item.cause() != nullptr);
        REQUIRE_THROWS_AS(std::rethrow_exception(item.cause()), WrongTypeError);
        try {
            std::rethrow_exception(item.cause());
        } catch (const WrongTypeError& inner) {
            REQUIRE(inner.path() == "$.items[0].n");
        }
    }
}

TEST_CASE("Sequences of structures decode in order", "[decode][sequence]") {
    auto o = plainDecoder().decode_input<Order>(parse_json(R"({"items": [{"n": 1}, {"n": 2}], "note": "x"})"));
    REQUIRE(o.items.size() == 2);
    REQUIRE(o.items[0].n == 1);
    REQUIRE(o.items[1].n == 2);
    REQUIRE(o.note == "x");
}
