#include "common/FlowTestTypes.h"
#include "model/Session.h"
#include <gtest/gtest.h>
#include <memory>

namespace SFR {

using namespace SFR::Test;

TEST(StateTest, NamedStatesCompareByTypeAndName) {
    EXPECT_TRUE(sameState(std::make_shared<Greeting>(), std::make_shared<Greeting>()));
    EXPECT_FALSE(sameState(std::make_shared<Greeting>(), std::make_shared<NamedState>("Greeting")));
    EXPECT_FALSE(sameState(std::make_shared<Asking>(), std::make_shared<AskingName>()));
    EXPECT_TRUE(sameState(nullptr, nullptr));
    EXPECT_FALSE(sameState(std::make_shared<Greeting>(), nullptr));
}

TEST(StateTest, PlainStatesCompareByIdentity) {
    auto a = std::make_shared<State>();
    auto b = std::make_shared<State>();

    EXPECT_TRUE(sameState(a, a));
    EXPECT_FALSE(sameState(a, b));
    EXPECT_EQ("<none>", describeState(nullptr));
}

TEST(SessionTest, WithStateKeepsIdAndVars) {
    Session session("7", nullptr, Vars{{"name", "Ann"}});
    EXPECT_FALSE(session.hasState());

    Session next = session.withState(std::make_shared<Counter>(3));
    EXPECT_EQ("7", next.getId());
    EXPECT_EQ("Ann", next.getVars().at("name").get<std::string>());
    ASSERT_NE(nullptr, next.getStateAs<Counter>());
    EXPECT_EQ(3, next.getStateAs<Counter>()->getValue());
    EXPECT_EQ(nullptr, next.getStateAs<Greeting>());
    EXPECT_FALSE(session.hasState());
}

TEST(SessionTest, OfBuildsFromLoadedStateAndVars) {
    Session session = Session::of("8", StateAndVars{std::make_shared<Done>(), {}});

    EXPECT_EQ("8", session.getId());
    EXPECT_EQ("Done", session.getState()->toString());
    EXPECT_NE(std::string::npos, session.toString().find("Done"));
}

}  // namespace SFR
