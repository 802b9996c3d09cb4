#pragma once

#include <ds/descriptor.h>
#include <any>
#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <typeindex>
#include <vector>

namespace ds {

struct FieldSpec {
    DescriptorPtr type;
    // true iff the field declares neither a default value nor a factory
    bool required = true;
};

// Derived metadata for one structure type.
struct StructureProfile {
    // Builds the structure from decoded field values; fields missing from
    // `values` take their declared default.
    using Construct = std::function<std::any(std::map<std::string, std::any>&&)>;

    std::type_index identity = typeid(void);
    std::string name;
    std::vector<std::string> field_order;
    std::map<std::string, FieldSpec> field_specs;
    std::set<std::string> required_names;
    Construct construct;

    const FieldSpec* find(const std::string& field) const;

    // required_names minus the keys present in the payload
    std::set<std::string> compute_missing(const std::vector<std::string>& payload_keys) const;
};

// Memoizes structure profiles by structure identity. A profile is built the
// first time its structure is requested, together with the profiles of every
// structure reachable from its fields, and is kept for the lifetime of the
// cache. A structure whose resolution failed keeps failing with the same
// error without being rebuilt. Safe to share between threads.
class ProfileCache {
  public:
    explicit ProfileCache(bool debug = false) : m_debug(debug) {}
    ProfileCache(const ProfileCache&) = delete;
    ProfileCache& operator=(const ProfileCache&) = delete;

    // Throws TypeCompileError if the structure's schema is unusable.
    std::shared_ptr<const StructureProfile> profile(const Descriptor& structure);

    bool contains(std::type_index identity) const;
    size_t size() const;
    // Number of profiles constructed so far.
    size_t builds() const;

  private:
    std::shared_ptr<const StructureProfile> ensure(const Descriptor& structure,
                                                   std::vector<std::type_index>& in_progress);
    void check_nested(const Descriptor& type, const std::string& where, std::vector<std::type_index>& in_progress);
    void record_failure(std::type_index identity, std::vector<std::type_index>& in_progress);

    bool m_debug;
    mutable std::mutex m_mutex;
    std::map<std::type_index, std::shared_ptr<const StructureProfile> > m_profiles;
    std::map<std::type_index, std::exception_ptr> m_failures;
    size_t m_builds = 0;
};

}  // namespace ds
