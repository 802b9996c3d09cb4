#pragma once

#include <ds/descriptor.h>
#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <typeindex>

namespace ds {

// User-supplied decode functions keyed by target identity. The decode engine
// consults the registry before its own dispatch, so an entry overrides the
// built-in rule for that type everywhere it appears in a schema.
class DecoderRegistry {
  public:
    // Same contract as the engine: return the decoded value (holding the
    // target's C++ type) or throw a DecodeError.
    using DecodeFn = std::function<std::any(const Dictionary& value, const Descriptor& target, const std::string& path)>;

    DecoderRegistry() = default;
    DecoderRegistry(const DecoderRegistry&) = delete;
    DecoderRegistry& operator=(const DecoderRegistry&) = delete;

    // Replaces any decoder already registered for `identity`.
    void register_decoder(std::type_index identity, DecodeFn fn);

    template <typename T>
    void register_decoder(DecodeFn fn) {
        register_decoder(std::type_index(typeid(T)), std::move(fn));
    }

    bool unregister_decoder(std::type_index identity);
    bool contains(std::type_index identity) const;
    // Empty function when nothing is registered.
    DecodeFn find(std::type_index identity) const;
    size_t size() const;

  private:
    mutable std::mutex m_mutex;
    std::map<std::type_index, DecodeFn> m_decoders;
};

}  // namespace ds
