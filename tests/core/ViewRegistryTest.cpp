#include "common/FlowErrors.h"
#include "common/FlowTestTypes.h"
#include "runtime/ViewRegistry.h"
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace SFR {

using namespace SFR::Test;

class ViewRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto states = std::make_shared<TypeHierarchy>(TypeHierarchy::rootedAt<State>());
        states->declare<AskingName, Asking>();
        registry_ = std::make_unique<ViewRegistry<std::string>>(states);
    }

    static View<std::string> writing(const std::string &text) {
        return [text](const Session &, std::string &out, const EventPtr &, Completion done) {
            out = text;
            done(nullptr);
        };
    }

    std::string render(const StatePtr &state) {
        std::string out;
        Session session("7", state, {});
        registry_->resolve(state)(session, out, std::make_shared<Ping>("7"), [](std::exception_ptr) {});
        return out;
    }

    std::unique_ptr<ViewRegistry<std::string>> registry_;
};

TEST_F(ViewRegistryTest, ResolvesByDynamicType) {
    registry_->put(typeid(Greeting), writing("hello"));
    registry_->put(typeid(Done), writing("bye"));

    EXPECT_EQ("hello", render(std::make_shared<Greeting>()));
    EXPECT_EQ("bye", render(std::make_shared<Done>()));
}

TEST_F(ViewRegistryTest, FallsBackToDeclaredAncestor) {
    registry_->put(typeid(Asking), writing("question"));

    EXPECT_EQ("question", render(std::make_shared<AskingName>()));
}

TEST_F(ViewRegistryTest, MostSpecificBindingWins) {
    registry_->put(typeid(Asking), writing("question"));
    registry_->put(typeid(AskingName), writing("your name?"));

    EXPECT_EQ("your name?", render(std::make_shared<AskingName>()));
}

TEST_F(ViewRegistryTest, MissingViewIsViewBindingFailure) {
    registry_->put(typeid(Greeting), writing("hello"));

    try {
        registry_->resolve(std::make_shared<Done>());
        FAIL() << "resolve should throw";
    } catch (const FlowException &e) {
        EXPECT_EQ(ErrorKind::ViewBinding, e.getKind());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("No view defined for state class"));
    }
}

TEST_F(ViewRegistryTest, AbsentStateIsViewBindingFailure) {
    try {
        registry_->resolve(nullptr);
        FAIL() << "resolve should throw";
    } catch (const FlowException &e) {
        EXPECT_EQ(ErrorKind::ViewBinding, e.getKind());
    }
}

TEST_F(ViewRegistryTest, EmptyViewIsRejected) {
    EXPECT_THROW(registry_->put(typeid(Greeting), View<std::string>()), FlowConfigurationError);
    EXPECT_FALSE(registry_->contains(typeid(Greeting)));
    EXPECT_EQ(0u, registry_->size());
}

}  // namespace SFR
