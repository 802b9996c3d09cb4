#include <ds/decode.h>
#include <ds/path.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <typeindex>
#include <vector>

namespace ds {

namespace {
    bool env_flag(const char* name) {
        const char* raw = std::getenv(name);
        if (raw == nullptr) return false;
        std::string v(raw);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
        return !(v.empty() || v == "0" || v == "false" || v == "no" || v == "off");
    }

    std::string preview(const Dictionary& d) {
        std::string s = d.dump();
        if (s.size() > 80) s = s.substr(0, 77) + "...";
        return s;
    }
}

DecodeOptions DecodeOptions::from_env() {
    DecodeOptions options;
    options.bool_is_integer = env_flag("DS_BOOL_IS_INTEGER");
    options.integer_is_float = env_flag("DS_INTEGER_IS_FLOAT");
    options.debug = env_flag("DS_DECODE_DEBUG");
    return options;
}

Decoder::Decoder(DecodeOptions options) : m_options(options), m_profiles(options.debug) {}

Decoder& Decoder::global() {
    static Decoder decoder;
    return decoder;
}

std::shared_ptr<const StructureProfile> Decoder::profile(const Descriptor& structure) const {
    return m_profiles.profile(structure);
}

std::any Decoder::decode_input(const Dictionary& value, const DescriptorPtr& target) const {
    return decode(value, target, root_path());
}

std::optional<std::string> Decoder::validate(const Dictionary& value, const DescriptorPtr& target) const {
    try {
        decode_input(value, target);
    } catch (const DecodeError& e) {
        return std::optional<std::string>(e.what());
    }
    return std::nullopt;
}

std::any Decoder::decode(const Dictionary& value, const DescriptorPtr& target, const std::string& path) const {
    if (!target) throw std::invalid_argument("decode called without a target at '" + path + "'");
    if (m_options.debug) {
        std::cerr << "decode enter: path='" << path << "' target=" << target->name << " value=" << preview(value)
                  << "\n";
    }

    if (auto custom = m_registry.find(target->identity)) {
        if (m_options.debug) std::cerr << "decode: registered decoder for " << target->name << "\n";
        std::any result = custom(value, *target, path);
        if (std::type_index(result.type()) != target->identity)
            throw TypeCompileError(target->name, path, "registered decoder returned a different type");
        return result;
    }

    if (target->isSequence()) return decode_sequence(value, target, path);
    if (target->isStructure()) return decode_structure(value, target, path);
    return decode_scalar(value, target, path);
}

std::any Decoder::decode_sequence(const Dictionary& value, const DescriptorPtr& target,
                                  const std::string& path) const {
    if (!value.isArrayObject()) throw WrongTypeError(value, target, path);

    const SequenceShape& shape = target->sequence();
    const std::vector<Dictionary>& items = value.elements();
    std::vector<std::any> decoded;
    std::vector<WrongCollectionItemError> failures;
    decoded.reserve(items.size());

    for (size_t i = 0; i < items.size(); ++i) {
        std::string item_path = index_path(path, i);
        try {
            decoded.push_back(decode(items[i], shape.element, item_path));
        } catch (const NotSupportedTypeError&) {
            // no decode rule for the element type; every element would fail
            throw;
        } catch (const DecodeError& e) {
            if (m_options.debug) std::cerr << "decode: item failed: " << e.what() << "\n";
            failures.emplace_back(items[i], shape.element, item_path, std::current_exception());
        }
    }

    if (!failures.empty()) throw WrongCollectionError(value, target, path, std::move(failures));
    return shape.collect(std::move(decoded));
}

std::any Decoder::decode_structure(const Dictionary& value, const DescriptorPtr& target,
                                   const std::string& path) const {
    if (!value.isMappedObject()) throw WrongTypeError(value, target, path);

    std::shared_ptr<const StructureProfile> profile = m_profiles.profile(*target);
    std::set<std::string> missing = profile->compute_missing(value.keys());
    if (!missing.empty()) throw MissingRequiredAttributeError(value, target, path, std::move(missing));

    std::map<std::string, std::any> fields;
    for (auto const& item : value.items()) {
        const FieldSpec* spec = profile->find(item.first);
        if (spec == nullptr) {
            // undeclared keys are not part of the constructed value
            if (m_options.debug)
                std::cerr << "decode: ignoring unknown key '" << item.first << "' at '" << path << "'\n";
            continue;
        }
        fields.emplace(item.first, decode(item.second, spec->type, field_path(path, item.first)));
    }
    return profile->construct(std::move(fields));
}

bool Decoder::accepts(ScalarKind kind, const Dictionary& value) const {
    switch (kind) {
        case ScalarKind::Integer:
            return value.isInt() || (m_options.bool_is_integer && value.isBool());
        case ScalarKind::Float:
            return value.isDouble() || (m_options.integer_is_float && value.isInt());
        case ScalarKind::Text:
            return value.isString();
        case ScalarKind::Boolean:
            return value.isBool();
        case ScalarKind::Any:
            return true;
        case ScalarKind::Opaque:
            return false;
    }
    return false;
}

std::any Decoder::decode_scalar(const Dictionary& value, const DescriptorPtr& target, const std::string& path) const {
    const ScalarShape& shape = target->scalar();
    if (shape.kind == ScalarKind::Opaque) throw NotSupportedTypeError(value, target, path);
    if (!accepts(shape.kind, value)) throw WrongTypeError(value, target, path);

    std::optional<std::any> converted = shape.convert(value);
    if (!converted) throw WrongTypeError(value, target, path);
    return std::move(*converted);
}

std::any decode_input(const Dictionary& value, const DescriptorPtr& target) {
    return Decoder::global().decode_input(value, target);
}

}  // namespace ds
