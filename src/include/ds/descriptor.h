#pragma once

#include <ds/dictionary.h>
#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace ds {

struct Descriptor;
struct StructureProfile;
using DescriptorPtr = std::shared_ptr<const Descriptor>;

enum class ScalarKind {
    Integer,
    Float,
    Text,
    Boolean,
    Any,     // the Dictionary itself, unchanged
    Opaque   // a concrete C++ type with no built-in rule; decodable only through the registry
};

const char* scalarKindName(ScalarKind kind) noexcept;

struct ScalarShape {
    // Builds the C++ value from an accepted Dictionary. An empty result means
    // the value does not fit the target type (e.g. integer out of range).
    using Convert = std::function<std::optional<std::any>(const Dictionary&)>;

    ScalarKind kind = ScalarKind::Opaque;
    Convert convert;
};

struct StructureShape {
    using Build = std::function<std::shared_ptr<const StructureProfile>()>;

    // Invoked by ProfileCache the first time the structure is used.
    Build build_profile;
};

struct SequenceShape {
    using Collect = std::function<std::any(std::vector<std::any>&&)>;

    DescriptorPtr element;
    Collect collect;
};

// What is expected at a decode position. The shape is a closed union of the
// three supported forms; `identity` is the C++ type a successful decode
// produces and the key used by the profile cache and the decoder registry.
struct Descriptor {
    std::type_index identity;
    std::string name;
    std::variant<ScalarShape, StructureShape, SequenceShape> shape;

    bool isScalar() const noexcept { return std::holds_alternative<ScalarShape>(shape); }
    bool isStructure() const noexcept { return std::holds_alternative<StructureShape>(shape); }
    bool isSequence() const noexcept { return std::holds_alternative<SequenceShape>(shape); }

    const ScalarShape& scalar() const { return std::get<ScalarShape>(shape); }
    const StructureShape& structure() const { return std::get<StructureShape>(shape); }
    const SequenceShape& sequence() const { return std::get<SequenceShape>(shape); }
};

DescriptorPtr make_scalar_descriptor(std::type_index identity, std::string name, ScalarKind kind,
                                     ScalarShape::Convert convert);
DescriptorPtr make_structure_descriptor(std::type_index identity, std::string name, StructureShape::Build build);
DescriptorPtr make_sequence_descriptor(std::type_index identity, DescriptorPtr element,
                                       SequenceShape::Collect collect);

// Field types that are rejected when a structure is resolved.

// A sequence with no declared element type.
struct AnySequence {
    std::vector<Dictionary> items;
};

// A value consumed while constructing the owner and never stored on it.
template <typename T>
struct InitOnly {
    T value;
};

}  // namespace ds
