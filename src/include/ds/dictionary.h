#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <initializer_list>
#include <map>
#include <vector>
#include <stdexcept>
#include <sstream>
#include <ostream>
#include <functional>

namespace ds {

// Untyped tree of objects, arrays and scalars: the parsed form of a
// self-describing document.
struct Dictionary {
    enum TYPE { Object, Array, Boolean, String, Integer, Double, Null };

  private:
    TYPE my_type = Object;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    std::string m_string;

    std::vector<Dictionary> m_array;
    std::map<std::string, Dictionary> m_object_map;

  public:
    Dictionary() = default;
    Dictionary(const Dictionary&) = default;
    Dictionary(Dictionary&&) = default;
    Dictionary& operator=(const Dictionary&) = default;
    Dictionary& operator=(Dictionary&&) = default;
    ~Dictionary() = default;

    Dictionary(const std::string& s) : my_type(String), m_string(s) {}
    Dictionary(std::string&& s) : my_type(String), m_string(std::move(s)) {}
    Dictionary(const char* s) : my_type(String), m_string(s) {}
    Dictionary(int64_t n) : my_type(Integer), m_int(n) {}
    Dictionary(int n) : my_type(Integer), m_int(n) {}
    Dictionary(double x) : my_type(Double), m_double(x) {}
    Dictionary(bool b) : my_type(Boolean), m_bool(b) {}

    Dictionary(const std::vector<Dictionary>& v) : my_type(Array), m_array(v) {}
    Dictionary(std::vector<Dictionary>&& v) : my_type(Array), m_array(std::move(v)) {}

    // Construct an object from initializer list of (key, value) pairs
    Dictionary(std::initializer_list<std::pair<const std::string, Dictionary> > init)
        : my_type(Object), m_object_map(init) {}

    static Dictionary null() {
        Dictionary d;
        d.my_type = Null;
        return d;
    }

    static Dictionary array(std::initializer_list<Dictionary> init = {}) {
        return Dictionary(std::vector<Dictionary>(init));
    }

    static Dictionary object() { return Dictionary(); }

    bool operator==(const Dictionary& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case Boolean:
                return m_bool == rhs.m_bool;
            case Double:
                return m_double == rhs.m_double;
            case Integer:
                return m_int == rhs.m_int;
            case String:
                return m_string == rhs.m_string;
            case Array:
                return m_array == rhs.m_array;
            case Object:
                return m_object_map == rhs.m_object_map;
            case Null:
                return true;
        }
        return false;
    }

    bool operator!=(const Dictionary& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case Array:
                return static_cast<int>(m_array.size());
            case Object:
                return static_cast<int>(m_object_map.size());
            default:
                return 0;
        }
    }

    // Scalars are never empty; null is handled by callers that care.
    bool empty() const noexcept {
        switch (my_type) {
            case Object:
                return m_object_map.empty();
            case Array:
                return m_array.empty();
            default:
                return false;
        }
    }

    Dictionary& erase(const std::string& k) {
        if (my_type == Object) m_object_map.erase(k);
        return *this;
    }

    void push_back(Dictionary v) {
        if (my_type == Object && m_object_map.empty()) my_type = Array;
        if (my_type != Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
    }

    TYPE type() const noexcept { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case Object:
                return "Object";
            case Array:
                return "Array";
            case Boolean:
                return "Boolean";
            case String:
                return "String";
            case Integer:
                return "Integer";
            case Double:
                return "Double";
            case Null:
                return "Null";
        }
        throw std::logic_error("Not a valid type");
    }

    // An untouched Object converts to an Array on first integer-index access
    // so `d["list"][0] = 5` works naturally.
    Dictionary& operator[](int index) {
        if (my_type == Object && m_object_map.empty()) {
            my_type = Array;
            m_array.clear();
        }
        if (my_type != Array) throw std::logic_error("Not a list");
        if (index < 0) throw std::logic_error("Negative index");
        if (static_cast<size_t>(index) >= m_array.size()) m_array.resize(static_cast<size_t>(index) + 1);
        return m_array[static_cast<size_t>(index)];
    }

    const Dictionary& operator[](int index) const { return at(index); }

    Dictionary& operator[](const std::string& k) {
        if (my_type != Object) {
            my_type = Object;
            m_array.clear();
        }
        return m_object_map[k];
    }

    const Dictionary& operator[](const std::string& k) const { return at(k); }

    const Dictionary& at(int index) const {
        if (my_type != Array) throw std::logic_error("Not a list");
        if (index < 0 || static_cast<size_t>(index) >= m_array.size())
            throw std::out_of_range("index " + std::to_string(index) + " out of range for list of size " +
                                    std::to_string(m_array.size()));
        return m_array[static_cast<size_t>(index)];
    }

    Dictionary& at(int index) {
        return const_cast<Dictionary&>(static_cast<const Dictionary&>(*this).at(index));
    }

    const Dictionary& at(const std::string& k) const {
        auto it = m_object_map.find(k);
        if (my_type == Object && it != m_object_map.end()) return it->second;

        // didn't find it, throw a decent error message
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object_map) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        throw std::out_of_range(ss.str());
    }

    Dictionary& at(const std::string& k) {
        return const_cast<Dictionary&>(static_cast<const Dictionary&>(*this).at(k));
    }

    std::vector<std::string> keys() const {
        if (my_type != Object) return {};
        std::vector<std::string> out;
        out.reserve(m_object_map.size());
        for (auto const& p : m_object_map) out.push_back(p.first);
        return out;
    }

    const std::map<std::string, Dictionary>& items() const {
        if (my_type != Object) throw std::logic_error("Cannot get items of non-object type");
        return m_object_map;
    }

    const std::vector<Dictionary>& elements() const {
        if (my_type != Array) throw std::logic_error("Cannot get elements of non-list type");
        return m_array;
    }

    std::string asString() const {
        if (my_type == String) return m_string;
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == Integer) return m_int;
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == Double) return m_double;
        if (my_type == Integer) return static_cast<double>(m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == Boolean) return m_bool;
        throw std::runtime_error("not a bool");
    }

    bool isMappedObject() const { return my_type == Object; }
    bool isArrayObject() const { return my_type == Array; }
    bool isValueObject() const { return my_type != Object && my_type != Array && my_type != Null; }

    bool isDict() const { return isMappedObject(); }
    bool isList() const { return isArrayObject(); }
    bool isInt() const { return my_type == Integer; }
    bool isDouble() const { return my_type == Double; }
    bool isString() const { return my_type == String; }
    bool isBool() const { return my_type == Boolean; }
    bool isNull() const { return my_type == Null; }

    std::string dump(int indent = 0) const;
};

// Helper function to escape JSON strings
inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    result.push_back('"');
    return result;
}

// indent == 0 gives single-line output.
inline std::string Dictionary::dump(int indent) const {
    std::ostringstream out;

    std::function<void(const Dictionary&, int)> dumpValue;
    dumpValue = [&](const Dictionary& val, int level) {
        const std::string pad = indent > 0 ? std::string(static_cast<size_t>(level + indent), ' ') : "";
        const std::string close_pad = indent > 0 ? std::string(static_cast<size_t>(level), ' ') : "";
        const char* sep = indent > 0 ? ",\n" : ",";
        const char* open_nl = indent > 0 ? "\n" : "";
        switch (val.my_type) {
            case Null:
                out << "null";
                return;
            case Boolean:
                out << (val.m_bool ? "true" : "false");
                return;
            case Integer:
                out << val.m_int;
                return;
            case Double:
                out << val.m_double;
                return;
            case String:
                out << escape_json_string(val.m_string);
                return;
            case Array: {
                if (val.m_array.empty()) {
                    out << "[]";
                    return;
                }
                out << '[' << open_nl;
                for (size_t i = 0; i < val.m_array.size(); ++i) {
                    if (i) out << sep;
                    out << pad;
                    dumpValue(val.m_array[i], level + indent);
                }
                out << open_nl << close_pad << ']';
                return;
            }
            case Object: {
                if (val.m_object_map.empty()) {
                    out << "{}";
                    return;
                }
                out << '{' << open_nl;
                bool first = true;
                for (auto const& p : val.m_object_map) {
                    if (!first) out << sep;
                    first = false;
                    out << pad << escape_json_string(p.first) << (indent > 0 ? ": " : ":");
                    dumpValue(p.second, level + indent);
                }
                out << open_nl << close_pad << '}';
                return;
            }
        }
    };

    dumpValue(*this, 0);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

}  // namespace ds
