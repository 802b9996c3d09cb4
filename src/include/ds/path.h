#pragma once

#include <cstddef>
#include <string>

namespace ds {

// Path expressions locate a position inside a decoded document for
// diagnostics: "$" is the root, ".name" descends into a structure field and
// "[i]" into a sequence element, e.g. "$.items[0].n".
inline const char* root_path() noexcept { return "$"; }

std::string field_path(const std::string& parent, const std::string& field);
std::string index_path(const std::string& parent, size_t index);

}  // namespace ds
