#pragma once

#include <memory>
#include <string>

namespace SFR {

/**
 * @brief Root of all session state types
 *
 * A session's state is held as a StatePtr; nullptr means the session has no
 * state yet and is routed to the initial controller.
 *
 * equals() backs exact-value controller bindings. The default is identity,
 * which suits singleton states; value-like states override it.
 */
class State {
public:
    virtual ~State() = default;

    virtual bool equals(const State &other) const {
        return this == &other;
    }

    virtual std::string toString() const;
};

using StatePtr = std::shared_ptr<const State>;

/**
 * @brief State identified by a name, equal to any state of the same dynamic type and name
 *
 * Derive from it to give named states their own type for type bindings:
 * @code
 * struct Chatting : SFR::NamedState {
 *     explicit Chatting(std::string topic) : NamedState(std::move(topic)) {}
 * };
 * @endcode
 */
class NamedState : public State {
public:
    explicit NamedState(std::string name);

    const std::string &getName() const {
        return name_;
    }

    bool equals(const State &other) const override;
    std::string toString() const override;

private:
    std::string name_;
};

/**
 * @brief Null-safe state comparison (two absent states are equal)
 */
bool sameState(const StatePtr &lhs, const StatePtr &rhs);

std::string describeState(const StatePtr &state);

}  // namespace SFR
