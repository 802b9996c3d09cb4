#pragma once

#include <ds/dictserde.h>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

// Types shared by the decode and encode tests.

struct Point {
    int64_t x = 0;
    int64_t y = 0;
    std::string label = "origin";
};

struct Sample {
    int64_t a = 0;
    int64_t b = 0;
    int64_t c = 0;
};

struct Item {
    int64_t n = 0;
};

struct Order {
    std::vector<Item> items;
    std::string note;
    std::vector<std::string> tags;
};

struct Node {
    std::string name;
    std::vector<Node> children;
};

struct Bag {
    std::set<int> values;
};

struct Loose {
    ds::AnySequence items;
};

struct Staged {
    ds::InitOnly<int> seed;
};

struct Broken {
    Bag bag;
};

// Has no structure declaration; only a registered converter handles it.
struct Timestamp {
    int64_t seconds = 0;
};

struct Event {
    std::string name;
    Timestamp at;
};

enum class Color : int { Red = 1, Green = 2, Blue = 3 };

struct Pixel {
    Color color = Color::Red;
    double weight = 1.0;
    bool visible = true;
    ds::Dictionary extra;
};

namespace ds {

template <>
struct Structure<Point> {
    static constexpr const char* name = "Point";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("x", &Point::x).required("y", &Point::y).optional("label", &Point::label);
    }
};

template <>
struct Structure<Sample> {
    static constexpr const char* name = "Sample";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("a", &Sample::a).required("b", &Sample::b).optional("c", &Sample::c, int64_t(7));
    }
};

template <>
struct Structure<Item> {
    static constexpr const char* name = "Item";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("n", &Item::n);
    }
};

template <>
struct Structure<Order> {
    static constexpr const char* name = "Order";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("items", &Order::items)
                    .optional("note", &Order::note, std::string("none"))
                    .optional_factory("tags", &Order::tags, [] { return std::vector<std::string>{"new"}; });
    }
};

template <>
struct Structure<Node> {
    static constexpr const char* name = "Node";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("name", &Node::name).optional("children", &Node::children);
    }
};

template <>
struct Structure<Bag> {
    static constexpr const char* name = "Bag";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("values", &Bag::values);
    }
};

template <>
struct Structure<Loose> {
    static constexpr const char* name = "Loose";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("items", &Loose::items);
    }
};

template <>
struct Structure<Staged> {
    static constexpr const char* name = "Staged";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("seed", &Staged::seed);
    }
};

template <>
struct Structure<Broken> {
    static constexpr const char* name = "Broken";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("bag", &Broken::bag);
    }
};

template <>
struct Structure<Event> {
    static constexpr const char* name = "Event";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("name", &Event::name).required("at", &Event::at);
    }
};

template <>
struct Structure<Pixel> {
    static constexpr const char* name = "Pixel";
    template <typename Fields>
    static void declare(Fields& f) {
        f.required("color", &Pixel::color)
                    .optional("weight", &Pixel::weight)
                    .optional("visible", &Pixel::visible)
                    .optional("extra", &Pixel::extra);
    }
};

}  // namespace ds
