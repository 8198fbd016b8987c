#include "model/TypeHierarchy.h"
#include "common/FlowErrors.h"
#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace SFR {

TypeHierarchy::TypeHierarchy(std::type_index root) : root_(root) {}

void TypeHierarchy::declare(std::type_index child, std::type_index parent) {
    if (child == root_) {
        throw FlowConfigurationError("Cannot declare a parent for root type " + typeName(root_));
    }

    // Walk up from the new parent; reaching child again means a cycle
    std::type_index current = parent;
    while (current != root_) {
        if (current == child) {
            throw FlowConfigurationError("Declaring " + typeName(parent) + " as parent of " + typeName(child) +
                                         " forms a cycle");
        }
        current = parentOf(current);
    }

    parents_.insert_or_assign(child, parent);
}

std::type_index TypeHierarchy::parentOf(std::type_index type) const {
    if (type == root_) {
        return root_;
    }
    auto it = parents_.find(type);
    return it != parents_.end() ? it->second : root_;
}

std::vector<std::type_index> TypeHierarchy::ancestry(std::type_index type) const {
    std::vector<std::type_index> chain;
    chain.push_back(type);
    while (type != root_) {
        type = parentOf(type);
        chain.push_back(type);
    }
    return chain;
}

bool TypeHierarchy::isDeclared(std::type_index type) const {
    return type == root_ || parents_.find(type) != parents_.end();
}

std::string TypeHierarchy::typeName(std::type_index type) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
                                                      std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return type.name();
}

}  // namespace SFR
