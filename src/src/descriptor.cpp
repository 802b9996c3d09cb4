#include <ds/descriptor.h>
#include <stdexcept>

namespace ds {

const char* scalarKindName(ScalarKind kind) noexcept {
    switch (kind) {
        case ScalarKind::Integer:
            return "integer";
        case ScalarKind::Float:
            return "float";
        case ScalarKind::Text:
            return "text";
        case ScalarKind::Boolean:
            return "boolean";
        case ScalarKind::Any:
            return "any";
        case ScalarKind::Opaque:
            return "opaque";
    }
    return "unknown";
}

DescriptorPtr make_scalar_descriptor(std::type_index identity, std::string name, ScalarKind kind,
                                     ScalarShape::Convert convert) {
    if (kind != ScalarKind::Opaque && !convert)
        throw std::logic_error("scalar descriptor '" + name + "' needs a conversion");
    return std::make_shared<const Descriptor>(
                Descriptor{identity, std::move(name), ScalarShape{kind, std::move(convert)}});
}

DescriptorPtr make_structure_descriptor(std::type_index identity, std::string name, StructureShape::Build build) {
    if (!build) throw std::logic_error("structure descriptor '" + name + "' needs a profile builder");
    return std::make_shared<const Descriptor>(Descriptor{identity, std::move(name), StructureShape{std::move(build)}});
}

DescriptorPtr make_sequence_descriptor(std::type_index identity, DescriptorPtr element,
                                       SequenceShape::Collect collect) {
    if (!element) throw std::logic_error("sequence descriptor needs an element descriptor");
    if (!collect) throw std::logic_error("sequence descriptor needs a collector");
    std::string name = "sequence<" + element->name + ">";
    return std::make_shared<const Descriptor>(
                Descriptor{identity, std::move(name), SequenceShape{std::move(element), std::move(collect)}});
}

}  // namespace ds
