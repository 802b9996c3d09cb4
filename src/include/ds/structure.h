#pragma once

#include <ds/descriptor.h>
#include <ds/errors.h>
#include <ds/path.h>
#include <ds/profile.h>
#include <any>
#include <array>
#include <cmath>
#include <deque>
#include <forward_list>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace ds {

// Declares a C++ type as a structure with named fields. Specialize it for each
// structure type; `declare` receives a field visitor (FieldList when decoding,
// a field encoder when encoding):
//
//     template <>
//     struct ds::Structure<Point> {
//         static constexpr const char* name = "Point";
//         template <typename Fields>
//         static void declare(Fields& f) {
//             f.required("x", &Point::x).optional("label", &Point::label);
//         }
//     };
//
// The type must be default constructible and copyable.
template <typename T>
struct Structure {};

namespace detail {
    template <typename T, typename = void>
    struct has_structure : std::false_type {};
    template <typename T>
    struct has_structure<T, std::void_t<decltype(Structure<T>::name)> > : std::true_type {};

    template <typename T>
    struct is_vector : std::false_type {};
    template <typename E, typename A>
    struct is_vector<std::vector<E, A> > : std::true_type {};

    template <typename T>
    struct is_not_allowed : std::false_type {};
    template <>
    struct is_not_allowed<AnySequence> : std::true_type {};
    template <typename T>
    struct is_not_allowed<InitOnly<T> > : std::true_type {};

    // Parametric containers other than std::vector.
    template <typename T>
    struct generic_origin {
        static constexpr const char* name = nullptr;
    };
    template <typename... A>
    struct generic_origin<std::set<A...> > {
        static constexpr const char* name = "set";
    };
    template <typename... A>
    struct generic_origin<std::multiset<A...> > {
        static constexpr const char* name = "multiset";
    };
    template <typename... A>
    struct generic_origin<std::unordered_set<A...> > {
        static constexpr const char* name = "unordered_set";
    };
    template <typename... A>
    struct generic_origin<std::map<A...> > {
        static constexpr const char* name = "map";
    };
    template <typename... A>
    struct generic_origin<std::multimap<A...> > {
        static constexpr const char* name = "multimap";
    };
    template <typename... A>
    struct generic_origin<std::unordered_map<A...> > {
        static constexpr const char* name = "unordered_map";
    };
    template <typename... A>
    struct generic_origin<std::list<A...> > {
        static constexpr const char* name = "list";
    };
    template <typename... A>
    struct generic_origin<std::forward_list<A...> > {
        static constexpr const char* name = "forward_list";
    };
    template <typename... A>
    struct generic_origin<std::deque<A...> > {
        static constexpr const char* name = "deque";
    };
    template <typename... A>
    struct generic_origin<std::tuple<A...> > {
        static constexpr const char* name = "tuple";
    };
    template <typename A, typename B>
    struct generic_origin<std::pair<A, B> > {
        static constexpr const char* name = "pair";
    };
    template <typename A>
    struct generic_origin<std::optional<A> > {
        static constexpr const char* name = "optional";
    };
    template <typename... A>
    struct generic_origin<std::variant<A...> > {
        static constexpr const char* name = "variant";
    };
    template <typename A, std::size_t N>
    struct generic_origin<std::array<A, N> > {
        static constexpr const char* name = "array";
    };

    template <typename T>
    constexpr bool is_unsupported_generic() {
        return generic_origin<T>::name != nullptr;
    }

    template <typename T>
    std::string marker_name() {
        if constexpr (std::is_same<T, AnySequence>::value) return "AnySequence";
        else return "InitOnly";
    }

    template <typename U>
    std::optional<std::any> convert_integer(const Dictionary& d) {
        int64_t v = d.isBool() ? (d.asBool() ? 1 : 0) : d.asInt();
        if constexpr (std::is_signed<U>::value) {
            if (v < static_cast<int64_t>(std::numeric_limits<U>::min()) ||
                v > static_cast<int64_t>(std::numeric_limits<U>::max()))
                return std::nullopt;
        } else {
            if (v < 0 || static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<U>::max()))
                return std::nullopt;
        }
        return std::any(static_cast<U>(v));
    }

    template <typename U>
    DescriptorPtr make_descriptor();

    // Resolves every field of Structure<U> once per process so that schema
    // errors surface from describe<U>() rather than from a later decode.
    template <typename U>
    void check_structure(const std::string& where);

    bool structure_resolving(std::type_index identity);
    bool structure_checked(std::type_index identity);
    void mark_structure_checked(std::type_index identity);

    // Marks a structure as being resolved on the current thread.
    class ResolvingScope {
      public:
        explicit ResolvingScope(std::type_index identity);
        ~ResolvingScope();
        ResolvingScope(const ResolvingScope&) = delete;
        ResolvingScope& operator=(const ResolvingScope&) = delete;
    };
}  // namespace detail

template <typename T>
DescriptorPtr resolve(const std::string& where);

// The descriptor for T, built once and shared. The fields of a structure are
// resolved too, recursively. Throws NotSupportedTypeError for container
// shapes other than std::vector, and NotAllowedTypeError for the disallowed
// marker types and for structures that contain themselves.
template <typename T>
DescriptorPtr describe() {
    return resolve<T>(root_path());
}

// As describe(), reporting resolution failures at `where` (a field path such
// as "Order.items").
template <typename T>
DescriptorPtr resolve(const std::string& where) {
    using U = std::remove_cv_t<T>;
    if constexpr (detail::is_not_allowed<U>::value) {
        throw NotAllowedTypeError(detail::marker_name<U>(), where);
    } else if constexpr (detail::is_unsupported_generic<U>()) {
        throw NotSupportedTypeError(detail::generic_origin<U>::name, where);
    } else if constexpr (detail::is_vector<U>::value) {
        using E = typename U::value_type;
        DescriptorPtr element = resolve<E>(where + "[]");
        static const DescriptorPtr descriptor = make_sequence_descriptor(
                    typeid(U), element, [](std::vector<std::any>&& items) -> std::any {
                        U out;
                        out.reserve(items.size());
                        for (auto& item : items) out.push_back(std::any_cast<E>(std::move(item)));
                        return std::any(std::move(out));
                    });
        return descriptor;
    } else {
        static const DescriptorPtr descriptor = detail::make_descriptor<U>();
        if constexpr (detail::has_structure<U>::value) detail::check_structure<U>(where);
        return descriptor;
    }
}

namespace detail {
    // Field visitor that only resolves the declared field types.
    template <typename T>
    class FieldResolver {
      public:
        explicit FieldResolver(std::string owner) : m_owner(std::move(owner)) {}

        template <typename M>
        FieldResolver& required(const std::string& name, M T::*) {
            resolve<M>(m_owner + "." + name);
            return *this;
        }

        template <typename M>
        FieldResolver& optional(const std::string& name, M T::*member) {
            return required(name, member);
        }

        template <typename M, typename V>
        FieldResolver& optional(const std::string& name, M T::*member, const V&) {
            return required(name, member);
        }

        template <typename M, typename F>
        FieldResolver& optional_factory(const std::string& name, M T::*member, const F&) {
            return required(name, member);
        }

      private:
        std::string m_owner;
    };

    template <typename U>
    void check_structure(const std::string& where) {
        const std::type_index identity(typeid(U));
        if (structure_resolving(identity))
            throw NotAllowedTypeError(Structure<U>::name, where, "self-referential structure");
        if (structure_checked(identity)) return;

        ResolvingScope scope(identity);
        FieldResolver<U> fields(Structure<U>::name);
        Structure<U>::declare(fields);
        mark_structure_checked(identity);
    }
}  // namespace detail

// Collects the field declarations of one structure type and turns them into
// its StructureProfile.
template <typename T>
class FieldList {
  public:
    explicit FieldList(std::string owner) : m_owner(std::move(owner)) {}

    template <typename M>
    FieldList& required(const std::string& name, M T::*member) {
        return add<M>(name, member, true, nullptr);
    }

    // When absent from the payload the member keeps its initializer.
    template <typename M>
    FieldList& optional(const std::string& name, M T::*member) {
        return add<M>(name, member, false, nullptr);
    }

    template <typename M, typename V>
    FieldList& optional(const std::string& name, M T::*member, V default_value) {
        return add<M>(name, member, false, [member, default_value](T& obj) { obj.*member = default_value; });
    }

    template <typename M, typename F>
    FieldList& optional_factory(const std::string& name, M T::*member, F factory) {
        return add<M>(name, member, false, [member, factory](T& obj) { obj.*member = factory(); });
    }

    std::shared_ptr<const StructureProfile> build() const {
        auto profile = std::make_shared<StructureProfile>();
        profile->identity = typeid(T);
        profile->name = m_owner;
        for (auto const& b : *m_bindings) {
            FieldSpec spec{b.resolve(m_owner + "." + b.name), b.required};
            profile->field_order.push_back(b.name);
            profile->field_specs.emplace(b.name, spec);
            if (spec.required) profile->required_names.insert(b.name);
        }
        auto bindings = m_bindings;
        profile->construct = [bindings](std::map<std::string, std::any>&& values) -> std::any {
            T obj{};
            for (auto const& b : *bindings) {
                auto it = values.find(b.name);
                if (it != values.end())
                    b.assign(obj, std::move(it->second));
                else if (b.apply_default)
                    b.apply_default(obj);
            }
            return std::any(std::move(obj));
        };
        return profile;
    }

  private:
    struct Binding {
        std::string name;
        bool required;
        std::function<DescriptorPtr(const std::string&)> resolve;
        std::function<void(T&, std::any&&)> assign;
        std::function<void(T&)> apply_default;
    };

    template <typename M>
    FieldList& add(const std::string& name, M T::*member, bool required, std::function<void(T&)> apply_default) {
        for (auto const& b : *m_bindings) {
            if (b.name == name) throw TypeCompileError(m_owner, m_owner + "." + name, "duplicate field");
        }
        Binding b;
        b.name = name;
        b.required = required;
        b.resolve = [](const std::string& where) { return resolve<M>(where); };
        b.assign = [member](T& obj, std::any&& value) { obj.*member = std::any_cast<M>(std::move(value)); };
        b.apply_default = std::move(apply_default);
        m_bindings->push_back(std::move(b));
        return *this;
    }

    std::string m_owner;
    std::shared_ptr<std::vector<Binding> > m_bindings = std::make_shared<std::vector<Binding> >();
};

namespace detail {
    template <typename U>
    DescriptorPtr make_descriptor() {
        if constexpr (std::is_same<U, bool>::value) {
            return make_scalar_descriptor(typeid(U), "boolean", ScalarKind::Boolean,
                                          [](const Dictionary& d) -> std::optional<std::any> {
                                              return std::any(d.asBool());
                                          });
        } else if constexpr (std::is_integral<U>::value) {
            return make_scalar_descriptor(typeid(U), "integer", ScalarKind::Integer, &convert_integer<U>);
        } else if constexpr (std::is_floating_point<U>::value) {
            return make_scalar_descriptor(typeid(U), "float", ScalarKind::Float,
                                          [](const Dictionary& d) -> std::optional<std::any> {
                                              double v = d.asDouble();
                                              if constexpr (sizeof(U) < sizeof(double)) {
                                                  if (std::isfinite(v) &&
                                                      std::fabs(v) > static_cast<double>(std::numeric_limits<U>::max()))
                                                      return std::nullopt;
                                              }
                                              return std::any(static_cast<U>(v));
                                          });
        } else if constexpr (std::is_same<U, std::string>::value) {
            return make_scalar_descriptor(typeid(U), "text", ScalarKind::Text,
                                          [](const Dictionary& d) -> std::optional<std::any> {
                                              return std::any(d.asString());
                                          });
        } else if constexpr (std::is_same<U, Dictionary>::value) {
            return make_scalar_descriptor(typeid(U), "any", ScalarKind::Any,
                                          [](const Dictionary& d) -> std::optional<std::any> {
                                              return std::any(d);
                                          });
        } else if constexpr (std::is_enum<U>::value) {
            // enumerations decode from their underlying integer
            using Underlying = std::underlying_type_t<U>;
            return make_scalar_descriptor(typeid(U), "integer", ScalarKind::Integer,
                                          [](const Dictionary& d) -> std::optional<std::any> {
                                              auto raw = convert_integer<Underlying>(d);
                                              if (!raw) return std::nullopt;
                                              return std::any(static_cast<U>(std::any_cast<Underlying>(*raw)));
                                          });
        } else if constexpr (has_structure<U>::value) {
            return make_structure_descriptor(typeid(U), Structure<U>::name, []() {
                FieldList<U> fields(Structure<U>::name);
                Structure<U>::declare(fields);
                return fields.build();
            });
        } else {
            return make_scalar_descriptor(typeid(U), typeid(U).name(), ScalarKind::Opaque, nullptr);
        }
    }
}  // namespace detail

}  // namespace ds
