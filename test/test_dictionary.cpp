#include <catch2/catch.hpp>
#include <ds/dictionary.h>

using namespace ds;

TEST_CASE("Dictionary basic operations", "[dictionary]") {
    Dictionary d;
    REQUIRE(d.empty());
    REQUIRE(d.isMappedObject());

    d["one"] = 1;
    d["pi"] = 3.1415;
    d["name"] = std::string("dictserde");

    REQUIRE(d.size() == 3);
    REQUIRE(d.contains("one"));
    REQUIRE(d.at("one").isInt());
    REQUIRE(d.at("pi").isDouble());
    REQUIRE(d.at("name").isString());

    auto keys = d.keys();
    REQUIRE(keys.size() == 3);
    REQUIRE(keys.front() == "name");

    d.erase("one");
    REQUIRE(!d.contains("one"));
    REQUIRE(d.size() == 2);
}

TEST_CASE("Dictionary scalar accessors are strict", "[dictionary]") {
    Dictionary i(int64_t(5));
    REQUIRE(i.asInt() == 5);
    REQUIRE(i.asDouble() == 5.0);
    REQUIRE_THROWS_AS(i.asString(), std::runtime_error);
    REQUIRE_THROWS_AS(i.asBool(), std::runtime_error);

    Dictionary b(true);
    REQUIRE(b.isBool());
    REQUIRE_FALSE(b.isInt());
    REQUIRE_THROWS_AS(b.asInt(), std::runtime_error);

    REQUIRE(Dictionary::null().isNull());
    REQUIRE_FALSE(Dictionary::null().isValueObject());
}

TEST_CASE("Dictionary arrays", "[dictionary]") {
    Dictionary list = Dictionary::array({1, "two", 3.0});
    REQUIRE(list.isArrayObject());
    REQUIRE(list.size() == 3);
    REQUIRE(list[1].asString() == "two");
    REQUIRE_THROWS_AS(list.at(3), std::out_of_range);

    Dictionary grown;
    grown.push_back(Dictionary(int64_t(1)));
    REQUIRE(grown.isArrayObject());
    REQUIRE(grown.elements().size() == 1);
    REQUIRE_THROWS_AS(grown.items(), std::logic_error);
}

TEST_CASE("Dictionary at() lists the available keys", "[dictionary]") {
    Dictionary d = {{"alpha", 1}, {"beta", 2}};
    try {
        d.at("gamma");
        FAIL("expected out_of_range");
    } catch (const std::out_of_range& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("gamma") != std::string::npos);
        REQUIRE(msg.find("\"alpha\",\"beta\"") != std::string::npos);
    }
}

TEST_CASE("Dictionary equality and dump", "[dictionary]") {
    Dictionary a = {{"x", 1}, {"list", Dictionary::array({true, Dictionary::null()})}};
    Dictionary b = {{"list", Dictionary::array({true, Dictionary::null()})}, {"x", 1}};
    REQUIRE(a == b);
    REQUIRE(a.dump() == R"({"list":[true,null],"x":1})");

    b["x"] = 2;
    REQUIRE(a != b);
    REQUIRE(Dictionary(int64_t(1)) != Dictionary(1.0));
}
