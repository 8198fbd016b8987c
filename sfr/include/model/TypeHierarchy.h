#pragma once

#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace SFR {

/**
 * @brief Explicit parent table for a polymorphic type family
 *
 * C++ RTTI exposes a value's dynamic type but not its base classes, so the
 * hierarchy used for dispatch is declared once at configuration time.
 * Types that were never declared have the root as their parent.
 *
 * @code
 * TypeHierarchy events = TypeHierarchy::rootedAt<Event>();
 * events.declare<TextMessage, Message>();
 * events.declare<Message, Event>();
 * events.ancestry(typeid(TextMessage));  // TextMessage, Message, Event
 * @endcode
 */
class TypeHierarchy {
public:
    explicit TypeHierarchy(std::type_index root);

    template <typename Root> static TypeHierarchy rootedAt() {
        return TypeHierarchy(std::type_index(typeid(Root)));
    }

    template <typename Derived, typename Base> void declare() {
        static_assert(std::is_base_of_v<Base, Derived>, "declared parent must be a base class");
        static_assert(!std::is_same_v<Base, Derived>, "a type cannot be its own parent");
        declare(std::type_index(typeid(Derived)), std::type_index(typeid(Base)));
    }

    /**
     * @brief Declare (or redeclare) the parent of a type
     * @throws FlowConfigurationError if child is the root or the declaration would form a cycle
     */
    void declare(std::type_index child, std::type_index parent);

    std::type_index getRoot() const {
        return root_;
    }

    /**
     * @brief Parent of type; the root is its own parent
     */
    std::type_index parentOf(std::type_index type) const;

    /**
     * @brief type, its parent, ..., root (most to least specific)
     */
    std::vector<std::type_index> ancestry(std::type_index type) const;

    bool isDeclared(std::type_index type) const;

    /**
     * @brief Demangled name of a type for diagnostics
     */
    static std::string typeName(std::type_index type);

private:
    std::type_index root_;
    std::unordered_map<std::type_index, std::type_index> parents_;
};

}  // namespace SFR
