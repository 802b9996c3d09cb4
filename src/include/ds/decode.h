#pragma once

#include <ds/descriptor.h>
#include <ds/dictionary.h>
#include <ds/errors.h>
#include <ds/profile.h>
#include <ds/registry.h>
#include <ds/structure.h>
#include <any>
#include <memory>
#include <optional>
#include <string>

namespace ds {

struct DecodeOptions {
    // Accept a Boolean where an integer is expected (true -> 1, false -> 0).
    bool bool_is_integer = false;
    // Accept an Integer where a float is expected.
    bool integer_is_float = false;
    // Trace every decode step on stderr.
    bool debug = false;

    // Reads DS_BOOL_IS_INTEGER, DS_INTEGER_IS_FLOAT and DS_DECODE_DEBUG. A
    // variable that is set enables its option unless it is "0", "false",
    // "no", "off" or empty.
    static DecodeOptions from_env();
};

// Schema-directed construction of typed values from Dictionary trees.
//
// A Decoder owns the decoder registry and the structure profile cache it
// uses. Decoding is re-entrant and may run on several threads at once; the
// registry and the cache are internally locked.
class Decoder {
  public:
    explicit Decoder(DecodeOptions options = DecodeOptions::from_env());
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    // Decode `value` against `target` at `path`. Returns a std::any holding
    // the C++ type named by target->identity, or throws a DecodeError.
    // Schema problems surface as TypeCompileError.
    std::any decode(const Dictionary& value, const DescriptorPtr& target, const std::string& path) const;

    std::any decode_input(const Dictionary& value, const DescriptorPtr& target) const;

    template <typename T>
    T decode_input(const Dictionary& value) const {
        return std::any_cast<T>(decode_input(value, describe<T>()));
    }

    // Returns std::nullopt on success, or the rendered error on failure.
    std::optional<std::string> validate(const Dictionary& value, const DescriptorPtr& target) const;

    std::shared_ptr<const StructureProfile> profile(const Descriptor& structure) const;

    DecoderRegistry& registry() noexcept { return m_registry; }
    const DecoderRegistry& registry() const noexcept { return m_registry; }
    const ProfileCache& profiles() const noexcept { return m_profiles; }
    const DecodeOptions& options() const noexcept { return m_options; }

    // Process-wide decoder, configured from the environment on first use and
    // kept until exit.
    static Decoder& global();

  private:
    std::any decode_sequence(const Dictionary& value, const DescriptorPtr& target, const std::string& path) const;
    std::any decode_structure(const Dictionary& value, const DescriptorPtr& target, const std::string& path) const;
    std::any decode_scalar(const Dictionary& value, const DescriptorPtr& target, const std::string& path) const;
    bool accepts(ScalarKind kind, const Dictionary& value) const;

    DecodeOptions m_options;
    DecoderRegistry m_registry;
    mutable ProfileCache m_profiles;
};

// Decode with the global decoder, starting at path "$".
std::any decode_input(const Dictionary& value, const DescriptorPtr& target);

template <typename T>
T decode_input(const Dictionary& value) {
    return Decoder::global().decode_input<T>(value);
}

}  // namespace ds
