#include <ds/path.h>

namespace ds {

std::string field_path(const std::string& parent, const std::string& field) {
    std::string out;
    out.reserve(parent.size() + field.size() + 1);
    out.append(parent).push_back('.');
    out.append(field);
    return out;
}

std::string index_path(const std::string& parent, size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

}  // namespace ds
