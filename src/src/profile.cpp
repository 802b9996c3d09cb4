#include <ds/profile.h>
#include <ds/errors.h>
#include <algorithm>
#include <iostream>

namespace ds {

const FieldSpec* StructureProfile::find(const std::string& field) const {
    auto it = field_specs.find(field);
    if (it == field_specs.end()) return nullptr;
    return &it->second;
}

std::set<std::string> StructureProfile::compute_missing(const std::vector<std::string>& payload_keys) const {
    std::set<std::string> missing;
    for (auto const& name : required_names) {
        if (std::find(payload_keys.begin(), payload_keys.end(), name) == payload_keys.end()) missing.insert(name);
    }
    return missing;
}

std::shared_ptr<const StructureProfile> ProfileCache::profile(const Descriptor& structure) {
    if (!structure.isStructure())
        throw std::logic_error("profile requested for non-structure target '" + structure.name + "'");
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::type_index> in_progress;
    return ensure(structure, in_progress);
}

bool ProfileCache::contains(std::type_index identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profiles.count(identity) == 1;
}

size_t ProfileCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profiles.size();
}

size_t ProfileCache::builds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_builds;
}

// Called with m_mutex held.
std::shared_ptr<const StructureProfile> ProfileCache::ensure(const Descriptor& structure,
                                                             std::vector<std::type_index>& in_progress) {
    auto found = m_profiles.find(structure.identity);
    if (found != m_profiles.end()) return found->second;
    auto failed = m_failures.find(structure.identity);
    if (failed != m_failures.end()) std::rethrow_exception(failed->second);

    in_progress.push_back(structure.identity);
    try {
        if (m_debug) std::cerr << "profile build: " << structure.name << "\n";
        std::shared_ptr<const StructureProfile> built = structure.structure().build_profile();
        ++m_builds;
        for (auto const& field : built->field_order) {
            check_nested(*built->field_specs.at(field).type, structure.name + "." + field, in_progress);
        }
        in_progress.pop_back();
        m_profiles.emplace(structure.identity, built);
        return built;
    } catch (const TypeCompileError&) {
        record_failure(structure.identity, in_progress);
        throw;
    } catch (const NotSupportedTypeError&) {
        record_failure(structure.identity, in_progress);
        throw;
    }
}

// Called from a catch handler with m_mutex held.
void ProfileCache::record_failure(std::type_index identity, std::vector<std::type_index>& in_progress) {
    in_progress.pop_back();
    m_failures.emplace(identity, std::current_exception());
}

void ProfileCache::check_nested(const Descriptor& type, const std::string& where,
                                std::vector<std::type_index>& in_progress) {
    if (type.isSequence()) {
        check_nested(*type.sequence().element, where + "[]", in_progress);
        return;
    }
    if (!type.isStructure()) return;
    if (std::find(in_progress.begin(), in_progress.end(), type.identity) != in_progress.end())
        throw NotAllowedTypeError(type.name, where, "self-referential structure");
    ensure(type, in_progress);
}

}  // namespace ds
