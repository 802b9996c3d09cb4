#include <ds/json.h>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace ds {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener { char ch; size_t line, col; };
        std::vector<Opener> opener_stack;

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') { ++line; col = 1; }
            else ++col;
            return c;
        }

        void pop_opener() {
            if (opener_stack.empty()) return;
            opener_stack.pop_back();
        }

        std::string format_error(const std::string& base) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = col > 0 ? col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << base << " (line " << line << ", column " << col << ")" << "\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw JsonParseError(format_error(base), line, col);
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) { get(); continue; }

                // line comment //...
                if (c == '/' and i + 1 < s.size() and s[i+1] == '/') {
                    get(); get();
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }

                // block comment /* ... */
                if (c == '/' and i + 1 < s.size() and s[i+1] == '*') {
                    get(); get();
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') { get(); closed = true; break; }
                    }
                    if (not closed) throw JsonParseError("unterminated block comment", line, col);
                    continue;
                }

                break;
            }
        }

        Dictionary parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') return parse_null();
            if (c == 't' or c == 'f') return parse_bool();
            if (c == '"') return Dictionary(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            // True/False/None are a common mistake in hand-written documents
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False" or token == "None") {
                    std::string sug = token == "True" ? "true" : (token == "False" ? "false" : "null");
                    fail("unexpected token while parsing value - did you mean '" + sug + "'?");
                }
            }
            if (c == '\0') fail("unexpected end of input while parsing value");
            fail("unexpected token while parsing value");
        }

        Dictionary parse_null() {
            if (s.compare(i, 4, "null") == 0) { i += 4; col += 4; return Dictionary::null(); }
            fail("invalid literal");
        }

        Dictionary parse_bool() {
            if (s.compare(i, 4, "true") == 0) { i += 4; col += 4; return Dictionary(true); }
            if (s.compare(i, 5, "false") == 0) { i += 5; col += 5; return Dictionary(false); }
            fail("invalid literal");
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                char h = get();
                if (h == '\0') throw JsonParseError("unterminated unicode escape", line, col);
                int hv = hex_val(h);
                if (hv < 0) throw JsonParseError("invalid unicode escape", line, col);
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            if (get() != '"') throw JsonParseError("expected '\"'", line, col);
            std::string out;
            while (true) {
                char c = get();
                if (c == '\0') throw JsonParseError("unexpected end in string", line, col);
                if (c == '"') break;
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        // surrogate pair
                        if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and i + 1 < s.size() and s[i+1] == 'u') {
                            get(); get();
                            uint32_t lo = parse_hex4();
                            if (lo >= 0xDC00 and lo <= 0xDFFF) cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            else { encode_utf8(cp, out); cp = lo; }
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    case '\0':
                        throw JsonParseError("unexpected end in string escape", line, col);
                    default:
                        throw JsonParseError("unsupported escape sequence", line, col);
                }
            }
            return out;
        }

        Dictionary parse_number() {
            size_t start = i;
            if (peek() == '-') { get(); }
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true; get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true; get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            std::istringstream ss(token);
            if (is_float) {
                double d = 0.0;
                ss >> d;
                return Dictionary(d);
            }
            int64_t v = 0;
            if (not(ss >> v)) fail("integer out of range '" + token + "'");
            return Dictionary(v);
        }

        Dictionary parse_array() {
            opener_stack.push_back(Opener{'[', line, col});
            get();
            Dictionary out = Dictionary::array();
            skip_ws();
            if (peek() == ']') { get(); pop_opener(); return out; }
            while (true) {
                out.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') { get(); pop_opener(); break; }
                if (c == ',') { get(); continue; }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
            return out;
        }

        Dictionary parse_object() {
            opener_stack.push_back(Opener{'{', line, col});
            get();
            Dictionary d;
            skip_ws();
            if (peek() == '}') { get(); pop_opener(); return d; }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    // read an identifier to suggest missing quotes
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += " - are you missing quotes around '" + s.substr(i, j - i) + "'?";
                    fail(base);
                }
                std::string key = parse_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                d[key] = parse_value();
                skip_ws();
                char c = peek();
                if (c == '}') { get(); pop_opener(); break; }
                if (c == ',') { get(); continue; }
                fail("expected ',' or '}'");
            }
            return d;
        }
    };
}

Dictionary parse_json(const std::string& text) {
    Parser p(text);
    Dictionary val = p.parse_value();
    p.skip_ws();
    if (p.peek() != '\0') p.fail("extra data after JSON value");
    return val;
}

}  // namespace ds
