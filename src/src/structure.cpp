#include <ds/structure.h>
#include <algorithm>
#include <mutex>
#include <set>
#include <vector>

namespace ds {
namespace detail {

namespace {
    std::vector<std::type_index>& resolving_on_this_thread() {
        thread_local std::vector<std::type_index> stack;
        return stack;
    }

    std::mutex& checked_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::set<std::type_index>& checked_structures() {
        static std::set<std::type_index> checked;
        return checked;
    }
}

bool structure_resolving(std::type_index identity) {
    auto const& stack = resolving_on_this_thread();
    return std::find(stack.begin(), stack.end(), identity) != stack.end();
}

bool structure_checked(std::type_index identity) {
    std::lock_guard<std::mutex> lock(checked_mutex());
    return checked_structures().count(identity) == 1;
}

void mark_structure_checked(std::type_index identity) {
    std::lock_guard<std::mutex> lock(checked_mutex());
    checked_structures().insert(identity);
}

ResolvingScope::ResolvingScope(std::type_index identity) { resolving_on_this_thread().push_back(identity); }

ResolvingScope::~ResolvingScope() { resolving_on_this_thread().pop_back(); }

}  // namespace detail
}  // namespace ds
