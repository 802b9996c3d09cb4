#include <ds/registry.h>
#include <stdexcept>

namespace ds {

void DecoderRegistry::register_decoder(std::type_index identity, DecodeFn fn) {
    if (!fn) throw std::invalid_argument(std::string("empty decoder for ") + identity.name());
    std::lock_guard<std::mutex> lock(m_mutex);
    m_decoders[identity] = std::move(fn);
}

bool DecoderRegistry::unregister_decoder(std::type_index identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_decoders.erase(identity) == 1;
}

bool DecoderRegistry::contains(std::type_index identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_decoders.count(identity) == 1;
}

DecoderRegistry::DecodeFn DecoderRegistry::find(std::type_index identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_decoders.find(identity);
    if (it == m_decoders.end()) return DecodeFn();
    return it->second;
}

size_t DecoderRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_decoders.size();
}

}  // namespace ds
