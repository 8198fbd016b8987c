#include "common/FlowTestTypes.h"
#include "events/ManualEventSource.h"
#include "mocks/CompletionRecorder.h"
#include "mocks/RecordingRenderer.h"
#include "runtime/FlowBuilder.h"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace SFR {

using namespace SFR::Test;

class FlowBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        outbox_ = std::make_shared<Outbox>();
        source_ = std::make_shared<ManualEventSource>();
        storage_ = std::make_shared<InMemorySessionStorage>();
    }

    FlowBuilder<RecordingRenderer> &configureMinimal(FlowBuilder<RecordingRenderer> &builder) {
        return builder.eventSource(source_)
            .sessionStorage(storage_)
            .rendererFactory([outbox = outbox_](const EventPtr &event) {
                return RecordingRenderer(outbox, event->getSessionId());
            })
            .initial([](const EventPtr &) -> StatePtr { return std::make_shared<Counter>(0); })
            .failView([](const FailureContext &failure, RecordingRenderer &out) {
                out.send(toString(failure.kind));
            });
    }

    std::shared_ptr<Outbox> outbox_;
    std::shared_ptr<ManualEventSource> source_;
    std::shared_ptr<InMemorySessionStorage> storage_;
};

TEST_F(FlowBuilderTest, MissingCollaboratorsAreNamed) {
    FlowBuilder<RecordingRenderer> builder;

    try {
        builder.build();
        FAIL() << "build should throw";
    } catch (const FlowConfigurationError &e) {
        std::string message = e.what();
        EXPECT_NE(std::string::npos, message.find("renderer factory"));
        EXPECT_NE(std::string::npos, message.find("event source"));
        EXPECT_NE(std::string::npos, message.find("initial controller"));
        EXPECT_NE(std::string::npos, message.find("failure view"));
        EXPECT_EQ(std::string::npos, message.find("session storage"));
    }

    // A failed build leaves the builder usable
    configureMinimal(builder);
    EXPECT_NE(nullptr, builder.build());
}

TEST_F(FlowBuilderTest, BuilderIsFrozenAfterBuild) {
    FlowBuilder<RecordingRenderer> builder;
    configureMinimal(builder).build();

    EXPECT_THROW(builder.allowUnlockedRendering(true), FlowConfigurationError);
    EXPECT_THROW(builder.handle<Ping>(), FlowConfigurationError);
    EXPECT_THROW(builder.build(), FlowConfigurationError);
}

TEST_F(FlowBuilderTest, ValueBindingBeatsTypeBinding) {
    FlowBuilder<RecordingRenderer> builder;
    configureMinimal(builder);
    builder.handle<Ping>()
        .when<Counter>()
        .with([](const std::shared_ptr<const Ping> &, const std::shared_ptr<const Counter> &counter) -> StatePtr {
            return std::make_shared<Counter>(counter->getValue() + 1);
        });
    builder.handle<Ping>().when(std::make_shared<const Counter>(2)).by([](const EventPtr &) -> StatePtr {
        return std::make_shared<Done>();
    });
    builder.render<Counter>().as(
        [](const std::shared_ptr<const Counter> &counter, RecordingRenderer &out, const EventPtr &) {
            out.send(std::to_string(counter->getValue()));
        });
    builder.render<Done>().as([](const Session &, RecordingRenderer &out, const EventPtr &) { out.send("done"); });
    auto flow = builder.build();

    for (int i = 0; i < 4; ++i) {
        source_->publish(std::make_shared<Ping>("7"));
    }

    // 0 (initial), 1, 2, then the value binding for Counter(2)
    std::vector<std::string> expected{"0", "1", "2", "done"};
    EXPECT_EQ(expected, outbox_->textsFor("7"));
}

TEST_F(FlowBuilderTest, OneViewForSeveralStateTypes) {
    FlowBuilder<RecordingRenderer> builder;
    configureMinimal(builder);
    builder.handle().with([](const EventPtr &, const StatePtr &state) -> StatePtr {
        return std::dynamic_pointer_cast<const Counter>(state) ? StatePtr(std::make_shared<Greeting>())
                                                                : StatePtr(std::make_shared<Done>());
    });
    builder.render<Counter, Greeting, Done>().as(
        [](const StatePtr &state, RecordingRenderer &out, const EventPtr &) { out.send(state->toString()); });
    auto flow = builder.build();

    source_->publish(std::make_shared<Ping>("7"));
    source_->publish(std::make_shared<Ping>("7"));
    source_->publish(std::make_shared<Ping>("7"));

    std::vector<std::string> expected{"Counter(0)", "Greeting", "Done"};
    EXPECT_EQ(expected, outbox_->textsFor("7"));
}

TEST_F(FlowBuilderTest, OptionsConfigureWorkerPoolAndUnlockedRendering) {
    FlowOptions options = FlowOptions::fromJson(R"({"allowUnlockedRendering": true, "workerThreads": 2})");
    auto recorder = std::make_shared<CompletionRecorder>();

    FlowBuilder<RecordingRenderer> builder;
    configureMinimal(builder).options(options).observer(recorder);
    builder.render<Counter>().as([](const Session &, RecordingRenderer &out, const EventPtr &) { out.send("ok"); });
    auto flow = builder.build();

    EXPECT_TRUE(flow->getConfig().allowUnlockedRendering);
    auto pool = std::dynamic_pointer_cast<ThreadPoolExecutor>(flow->getConfig().executor);
    ASSERT_NE(nullptr, pool);
    EXPECT_EQ(2u, pool->getThreadCount());

    source_->publish(std::make_shared<Ping>("7"));
    ASSERT_TRUE(recorder->waitFor(1));
    EXPECT_EQ(std::vector<std::string>{"ok"}, outbox_->textsFor("7"));
    pool->shutdown();
}

TEST_F(FlowBuilderTest, ExplicitSettingOverridesOptions) {
    FlowBuilder<RecordingRenderer> builder;
    configureMinimal(builder).options(FlowOptions::fromJson(R"({"allowUnlockedRendering": true})"));
    builder.allowUnlockedRendering(false);

    EXPECT_FALSE(builder.build()->getConfig().allowUnlockedRendering);
}

TEST_F(FlowBuilderTest, DefaultsToInlineExecutorAndInMemoryStorage) {
    FlowBuilder<RecordingRenderer> builder;
    builder.eventSource(source_)
        .rendererFactory([outbox = outbox_](const EventPtr &event) {
            return RecordingRenderer(outbox, event->getSessionId());
        })
        .initial([](const EventPtr &) -> StatePtr { return std::make_shared<Greeting>(); })
        .failView([](const FailureContext &, RecordingRenderer &) {});
    auto flow = builder.build();

    EXPECT_NE(nullptr, std::dynamic_pointer_cast<InlineExecutor>(flow->getConfig().executor));
    EXPECT_NE(nullptr, std::dynamic_pointer_cast<InMemorySessionStorage>(flow->getConfig().sessionStorage));
}

TEST_F(FlowBuilderTest, InvalidRegistrationsThrow) {
    FlowBuilder<RecordingRenderer> builder;

    EXPECT_THROW(builder.handle<Ping>().when(std::shared_ptr<Counter>()), FlowConfigurationError);
    EXPECT_THROW(builder.observer(nullptr), FlowConfigurationError);
}

}  // namespace SFR
