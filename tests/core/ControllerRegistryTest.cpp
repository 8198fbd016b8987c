#include "common/FlowErrors.h"
#include "common/FlowTestTypes.h"
#include "runtime/ControllerRegistry.h"
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace SFR {

using namespace SFR::Test;

class ControllerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto events = std::make_shared<TypeHierarchy>(TypeHierarchy::rootedAt<Event>());
        events->declare<Message, Event>();
        events->declare<TextMessage, Message>();
        events->declare<Command, TextMessage>();

        auto states = std::make_shared<TypeHierarchy>(TypeHierarchy::rootedAt<State>());
        states->declare<AskingName, Asking>();

        registry_ = std::make_unique<ControllerRegistry>(events, states);
    }

    // Controller that answers with a state named after the binding
    static Controller tagged(const std::string &tag) {
        return [tag](const EventPtr &, const StatePtr &, StateCallback done) {
            done(StageResult<StatePtr>::createSuccess(std::make_shared<NamedState>(tag)));
        };
    }

    std::string resolveTag(const EventPtr &event, const StatePtr &state) {
        std::string tag;
        registry_->resolve(*event, state)(event, state, [&tag](StageResult<StatePtr> result) {
            tag = std::dynamic_pointer_cast<const NamedState>(result.getValue())->getName();
        });
        return tag;
    }

    std::unique_ptr<ControllerRegistry> registry_;
    EventPtr text_ = std::make_shared<TextMessage>("7", "hi");
    EventPtr command_ = std::make_shared<Command>("7", "/start");
};

TEST_F(ControllerRegistryTest, ExactValueBeatsStateType) {
    registry_->put(typeid(TextMessage), std::make_shared<Counter>(1), tagged("value"));
    registry_->put(typeid(TextMessage), typeid(Counter), tagged("type"));

    EXPECT_EQ("value", resolveTag(text_, std::make_shared<Counter>(1)));
    EXPECT_EQ("type", resolveTag(text_, std::make_shared<Counter>(2)));
}

TEST_F(ControllerRegistryTest, StateTypeBeatsAnyState) {
    registry_->put(typeid(TextMessage), tagged("any"));
    registry_->put(typeid(TextMessage), typeid(Greeting), tagged("greeting"));

    EXPECT_EQ("greeting", resolveTag(text_, std::make_shared<Greeting>()));
    EXPECT_EQ("any", resolveTag(text_, std::make_shared<Done>()));
}

TEST_F(ControllerRegistryTest, ExactThenTypeThenAnyWithAllThreeBound) {
    registry_->put(typeid(TextMessage), tagged("any"));
    registry_->put(typeid(TextMessage), typeid(Counter), tagged("type"));
    registry_->put(typeid(TextMessage), std::make_shared<Counter>(1), tagged("value"));

    EXPECT_EQ("value", resolveTag(text_, std::make_shared<Counter>(1)));
    EXPECT_EQ("type", resolveTag(text_, std::make_shared<Counter>(2)));
    EXPECT_EQ("any", resolveTag(text_, std::make_shared<Greeting>()));
    EXPECT_EQ("any", resolveTag(text_, nullptr));
}

TEST_F(ControllerRegistryTest, StateAncestryIsWalked) {
    registry_->put(typeid(TextMessage), typeid(Asking), tagged("asking"));

    EXPECT_EQ("asking", resolveTag(text_, std::make_shared<AskingName>()));
}

TEST_F(ControllerRegistryTest, StateIsExhaustedBeforeEventIsGeneralized) {
    registry_->put(typeid(Message), typeid(AskingName), tagged("message-askingname"));
    registry_->put(typeid(TextMessage), tagged("text-any"));

    EXPECT_EQ("text-any", resolveTag(text_, std::make_shared<AskingName>()));
}

TEST_F(ControllerRegistryTest, EventAncestryIsWalked) {
    registry_->put(typeid(TextMessage), typeid(Greeting), tagged("text"));

    EXPECT_EQ("text", resolveTag(command_, std::make_shared<Greeting>()));
}

TEST_F(ControllerRegistryTest, RootBindingCatchesUndeclaredEvents) {
    registry_->put(typeid(Event), tagged("fallback"));

    EXPECT_EQ("fallback", resolveTag(std::make_shared<Ping>("7"), std::make_shared<Greeting>()));
}

TEST_F(ControllerRegistryTest, NoMatchThrowsDispatchFailure) {
    registry_->put(typeid(TextMessage), typeid(Greeting), tagged("text"));
    auto ping = std::make_shared<Ping>("7");

    try {
        registry_->resolve(*ping, std::make_shared<Greeting>());
        FAIL() << "resolve should throw";
    } catch (const FlowException &e) {
        EXPECT_EQ(ErrorKind::Dispatch, e.getKind());
        std::string message = e.what();
        EXPECT_NE(std::string::npos, message.find("No controller registered for state Greeting"));
        EXPECT_NE(std::string::npos, message.find("Ping"));
    }
    EXPECT_EQ(nullptr, registry_->find(*ping, std::make_shared<Greeting>()));
}

TEST_F(ControllerRegistryTest, AbsentStateOnlyMatchesAnyState) {
    registry_->put(typeid(TextMessage), typeid(Greeting), tagged("greeting"));
    EXPECT_EQ(nullptr, registry_->find(*text_, nullptr));

    registry_->put(typeid(TextMessage), tagged("any"));
    EXPECT_EQ("any", resolveTag(text_, nullptr));
}

TEST_F(ControllerRegistryTest, RegisteringTwiceReplaces) {
    registry_->put(typeid(TextMessage), std::make_shared<Counter>(1), tagged("first"));
    registry_->put(typeid(TextMessage), std::make_shared<Counter>(1), tagged("second"));
    registry_->put(typeid(TextMessage), typeid(Greeting), tagged("first"));
    registry_->put(typeid(TextMessage), typeid(Greeting), tagged("second"));

    EXPECT_EQ(2u, registry_->size());
    EXPECT_EQ("second", resolveTag(text_, std::make_shared<Counter>(1)));
    EXPECT_EQ("second", resolveTag(text_, std::make_shared<Greeting>()));
}

TEST_F(ControllerRegistryTest, InvalidRegistrationsThrow) {
    EXPECT_THROW(registry_->put(typeid(TextMessage), StatePtr(), tagged("x")), FlowConfigurationError);
    EXPECT_THROW(registry_->put(typeid(TextMessage), Controller()), FlowConfigurationError);
    EXPECT_THROW(ControllerRegistry(nullptr, nullptr), FlowConfigurationError);
}

}  // namespace SFR
