#pragma once

#include <ds/dictionary.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace ds {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c) : std::runtime_error(msg), line(l), col(c) {}
};

// Parse a JSON document into a Dictionary. `//` and `/* */` comments are
// skipped. Throws JsonParseError with line/column context on malformed input.
Dictionary parse_json(const std::string& text);

namespace json_literals {
    inline Dictionary operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}

}  // namespace ds
