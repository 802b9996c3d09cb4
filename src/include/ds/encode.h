#pragma once

#include <ds/dictionary.h>
#include <ds/errors.h>
#include <ds/structure.h>
#include <array>
#include <cstdint>
#include <deque>
#include <forward_list>
#include <functional>
#include <limits>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ds {

// How to_dynamic treats a C++ type. Chosen from the type alone; converters
// registered at runtime are tried after Custom and before everything else.
enum class EncodeKind {
    Custom,      // obj.to_dynamic()
    Null,        // std::nullopt_t, std::nullptr_t
    Optional,    // std::optional<T>: null or the contained value
    Enumerated,  // the underlying integer
    Scalar,      // bool, integers, floating point, strings, Dictionary
    Sequence,    // ordered or set-like containers -> Array
    Mapping,     // string-keyed maps -> Object
    Structure,   // ds::Structure<T> fields in declaration order
    Model,       // obj.dict() returning a Dictionary
    Unsupported
};

namespace detail {
    template <typename T, typename = void>
    struct has_to_dynamic_hook : std::false_type {};
    template <typename T>
    struct has_to_dynamic_hook<T, std::void_t<decltype(std::declval<const T&>().to_dynamic())> > : std::true_type {};

    template <typename T, typename = void>
    struct has_dict_model : std::false_type {};
    template <typename T>
    struct has_dict_model<T, std::void_t<decltype(std::declval<const T&>().dict())> >
        : std::is_same<std::decay_t<decltype(std::declval<const T&>().dict())>, Dictionary> {};

    template <typename T, typename = void>
    struct has_is_empty : std::false_type {};
    template <typename T>
    struct has_is_empty<T, std::void_t<decltype(std::declval<const T&>().is_empty())> > : std::true_type {};

    template <typename T>
    struct is_encodable_sequence : std::false_type {};
    template <typename... A>
    struct is_encodable_sequence<std::vector<A...> > : std::true_type {};
    template <typename... A>
    struct is_encodable_sequence<std::list<A...> > : std::true_type {};
    template <typename... A>
    struct is_encodable_sequence<std::forward_list<A...> > : std::true_type {};
    template <typename... A>
    struct is_encodable_sequence<std::deque<A...> > : std::true_type {};
    template <typename... A>
    struct is_encodable_sequence<std::set<A...> > : std::true_type {};
    template <typename... A>
    struct is_encodable_sequence<std::multiset<A...> > : std::true_type {};
    template <typename... A>
    struct is_encodable_sequence<std::unordered_set<A...> > : std::true_type {};
    template <typename A, std::size_t N>
    struct is_encodable_sequence<std::array<A, N> > : std::true_type {};

    template <typename T>
    struct is_string_mapping : std::false_type {};
    template <typename V, typename... A>
    struct is_string_mapping<std::map<std::string, V, A...> > : std::true_type {};
    template <typename V, typename... A>
    struct is_string_mapping<std::unordered_map<std::string, V, A...> > : std::true_type {};

    template <typename T>
    struct is_std_optional : std::false_type {};
    template <typename T>
    struct is_std_optional<std::optional<T> > : std::true_type {};

    template <typename T>
    constexpr bool is_text() {
        return std::is_same<T, std::string>::value || std::is_same<T, const char*>::value ||
               std::is_same<T, char*>::value ||
               (std::is_array<T>::value && std::is_same<std::remove_cv_t<std::remove_extent_t<T> >, char>::value);
    }
}  // namespace detail

template <typename T>
constexpr EncodeKind encode_kind() {
    using U = std::remove_cv_t<T>;
    if constexpr (detail::has_to_dynamic_hook<U>::value) return EncodeKind::Custom;
    else if constexpr (std::is_same<U, std::nullopt_t>::value || std::is_same<U, std::nullptr_t>::value)
        return EncodeKind::Null;
    else if constexpr (detail::is_std_optional<U>::value) return EncodeKind::Optional;
    else if constexpr (std::is_enum<U>::value) return EncodeKind::Enumerated;
    else if constexpr (std::is_arithmetic<U>::value || detail::is_text<U>() || std::is_same<U, Dictionary>::value)
        return EncodeKind::Scalar;
    else if constexpr (detail::is_encodable_sequence<U>::value) return EncodeKind::Sequence;
    else if constexpr (detail::is_string_mapping<U>::value) return EncodeKind::Mapping;
    else if constexpr (detail::has_structure<U>::value) return EncodeKind::Structure;
    else if constexpr (detail::has_dict_model<U>::value) return EncodeKind::Model;
    else return EncodeKind::Unsupported;
}

// Converters keyed by the exact runtime type of the object being encoded.
class EncoderRegistry {
  public:
    using EncodeFn = std::function<Dictionary(const void* object)>;

    EncoderRegistry() = default;
    EncoderRegistry(const EncoderRegistry&) = delete;
    EncoderRegistry& operator=(const EncoderRegistry&) = delete;

    void register_encoder(std::type_index identity, EncodeFn fn);

    template <typename T>
    void register_encoder(std::function<Dictionary(const T&)> fn) {
        register_encoder(std::type_index(typeid(T)),
                         [fn](const void* object) { return fn(*static_cast<const T*>(object)); });
    }

    bool unregister_encoder(std::type_index identity);
    EncodeFn find(std::type_index identity) const;
    size_t size() const;

  private:
    mutable std::mutex m_mutex;
    std::map<std::type_index, EncodeFn> m_encoders;
};

class Encoder;

// Visits the fields of a Structure<T> and writes each one into an object.
template <typename T>
class FieldEncoder {
  public:
    FieldEncoder(const Encoder& encoder, const T& obj, Dictionary& out) : m_encoder(encoder), m_obj(obj), m_out(out) {}

    template <typename M>
    FieldEncoder& required(const std::string& name, M T::*member);

    template <typename M>
    FieldEncoder& optional(const std::string& name, M T::*member) {
        return required(name, member);
    }

    template <typename M, typename V>
    FieldEncoder& optional(const std::string& name, M T::*member, const V&) {
        return required(name, member);
    }

    template <typename M, typename F>
    FieldEncoder& optional_factory(const std::string& name, M T::*member, const F&) {
        return required(name, member);
    }

  private:
    const Encoder& m_encoder;
    const T& m_obj;
    Dictionary& m_out;
};

// Turns typed values back into Dictionary trees.
class Encoder {
  public:
    Encoder() = default;
    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;

    // Throws NotEncodableError when no conversion applies.
    template <typename T>
    Dictionary encode(const T& obj) const {
        using U = std::remove_cv_t<T>;
        constexpr EncodeKind kind = encode_kind<U>();

        if constexpr (kind == EncodeKind::Custom) {
            return encode(obj.to_dynamic());
        } else {
            if constexpr (!std::is_array<U>::value) {
                if (m_registry.size() != 0) {
                    const void* address = &obj;
                    if constexpr (std::is_polymorphic<U>::value) address = dynamic_cast<const void*>(&obj);
                    if (auto fn = m_registry.find(std::type_index(typeid(obj)))) return fn(address);
                }
            }
            return encode_builtin<U>(obj);
        }
    }

    EncoderRegistry& registry() noexcept { return m_registry; }
    const EncoderRegistry& registry() const noexcept { return m_registry; }

    static Encoder& global();

  private:
    template <typename U>
    Dictionary encode_builtin(const U& obj) const {
        constexpr EncodeKind kind = encode_kind<U>();
        if constexpr (kind == EncodeKind::Null) {
            return Dictionary::null();
        } else if constexpr (kind == EncodeKind::Optional) {
            if (!obj.has_value()) return Dictionary::null();
            return encode(*obj);
        } else if constexpr (kind == EncodeKind::Enumerated) {
            return encode(static_cast<std::underlying_type_t<U> >(obj));
        } else if constexpr (kind == EncodeKind::Scalar) {
            return encode_scalar(obj);
        } else if constexpr (kind == EncodeKind::Sequence) {
            Dictionary out = Dictionary::array();
            for (auto const& item : obj) out.push_back(encode(item));
            return out;
        } else if constexpr (kind == EncodeKind::Mapping) {
            Dictionary out = Dictionary::object();
            for (auto const& kv : obj) out[kv.first] = encode(kv.second);
            return out;
        } else if constexpr (kind == EncodeKind::Structure) {
            Dictionary out = Dictionary::object();
            FieldEncoder<U> fields(*this, obj, out);
            Structure<U>::declare(fields);
            return out;
        } else if constexpr (kind == EncodeKind::Model) {
            return obj.dict();
        } else {
            throw NotEncodableError(typeid(U).name());
        }
    }

    template <typename U>
    static Dictionary encode_scalar(const U& obj) {
        if constexpr (std::is_same<U, bool>::value) {
            return Dictionary(obj);
        } else if constexpr (std::is_integral<U>::value) {
            if constexpr (std::is_unsigned<U>::value && sizeof(U) >= sizeof(int64_t)) {
                if (obj > static_cast<U>(std::numeric_limits<int64_t>::max()))
                    throw std::out_of_range("unsigned value " + std::to_string(obj) + " does not fit a 64-bit integer");
            }
            return Dictionary(static_cast<int64_t>(obj));
        } else if constexpr (std::is_floating_point<U>::value) {
            return Dictionary(static_cast<double>(obj));
        } else if constexpr (std::is_same<U, Dictionary>::value) {
            return obj;
        } else {
            return Dictionary(std::string(obj));
        }
    }

    EncoderRegistry m_registry;
};

template <typename T>
template <typename M>
FieldEncoder<T>& FieldEncoder<T>::required(const std::string& name, M T::*member) {
    m_out[name] = m_encoder.encode(m_obj.*member);
    return *this;
}

// Encode with the global encoder.
template <typename T>
Dictionary to_dynamic(const T& obj) {
    return Encoder::global().encode(obj);
}

// Recursively drops null leaves and empty arrays/objects. An empty array is
// kept under a key listed in `keep_empty_keys`.
Dictionary prune_empty(const Dictionary& value, const std::set<std::string>& keep_empty_keys = {});

template <typename T>
Dictionary to_dynamic_pruned(const T& obj, const std::set<std::string>& keep_empty_keys = {}) {
    if constexpr (detail::has_is_empty<T>::value) {
        if (obj.is_empty()) return Dictionary::null();
    }
    return prune_empty(to_dynamic(obj), keep_empty_keys);
}

}  // namespace ds
