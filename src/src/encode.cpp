#include <ds/encode.h>

namespace ds {

namespace {
    bool is_empty_value(const Dictionary& d) {
        if (d.isNull()) return true;
        if (d.isMappedObject() || d.isArrayObject()) return d.empty();
        return false;
    }
}

void EncoderRegistry::register_encoder(std::type_index identity, EncodeFn fn) {
    if (!fn) throw std::invalid_argument("register_encoder: empty converter");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_encoders[identity] = std::move(fn);
}

bool EncoderRegistry::unregister_encoder(std::type_index identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_encoders.erase(identity) != 0;
}

EncoderRegistry::EncodeFn EncoderRegistry::find(std::type_index identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_encoders.find(identity);
    if (it == m_encoders.end()) return {};
    return it->second;
}

size_t EncoderRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_encoders.size();
}

Encoder& Encoder::global() {
    static Encoder encoder;
    return encoder;
}

Dictionary prune_empty(const Dictionary& value, const std::set<std::string>& keep_empty_keys) {
    if (value.isArrayObject()) {
        Dictionary out = Dictionary::array();
        for (auto const& item : value.elements()) {
            Dictionary pruned = prune_empty(item, keep_empty_keys);
            if (!is_empty_value(pruned)) out.push_back(pruned);
        }
        return out;
    }
    if (value.isMappedObject()) {
        Dictionary out = Dictionary::object();
        for (auto const& kv : value.items()) {
            Dictionary pruned = prune_empty(kv.second, keep_empty_keys);
            bool keep_empty_list = keep_empty_keys.count(kv.first) != 0 && pruned.isArrayObject() && pruned.empty();
            if (keep_empty_list || !is_empty_value(pruned)) out[kv.first] = pruned;
        }
        return out;
    }
    return value;
}

}  // namespace ds
