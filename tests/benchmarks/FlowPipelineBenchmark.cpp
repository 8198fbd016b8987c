#include "common/FlowTestTypes.h"
#include "events/ManualEventSource.h"
#include "mocks/RecordingRenderer.h"
#include "runtime/FlowBuilder.h"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>

using namespace SFR;
using namespace SFR::Test;

// ============================================================================
// Helper Functions
// ============================================================================
static std::shared_ptr<Flow<RecordingRenderer>> buildBenchmarkFlow(const std::shared_ptr<ManualEventSource> &source,
                                                                   const std::shared_ptr<Outbox> &outbox) {
    Logger::setLevel(LogLevel::Off);

    FlowBuilder<RecordingRenderer> builder;
    builder.eventSource(source)
        .declareEvent<Message, Event>()
        .declareEvent<TextMessage, Message>()
        .declareEvent<Command, TextMessage>()
        .rendererFactory([outbox](const EventPtr &event) { return RecordingRenderer(outbox, event->getSessionId()); })
        .initial([](const EventPtr &) -> StatePtr { return std::make_shared<Counter>(0); })
        .failView([](const FailureContext &, RecordingRenderer &) {});
    builder.handle<TextMessage>().when<Counter>().with(
        [](const std::shared_ptr<const TextMessage> &, const std::shared_ptr<const Counter> &counter) -> StatePtr {
            return std::make_shared<Counter>(counter->getValue() + 1);
        });
    builder.render<Counter>().as([](const Session &, RecordingRenderer &, const EventPtr &) {});
    return builder.build();
}

// ============================================================================
// Inline pipeline, one session
// ============================================================================
static void BM_InlinePipelineSingleSession(benchmark::State &state) {
    auto source = std::make_shared<ManualEventSource>();
    auto outbox = std::make_shared<Outbox>();
    auto flow = buildBenchmarkFlow(source, outbox);
    auto event = std::make_shared<Command>("7", "/count");

    for (auto _ : state) {
        source->publish(event);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_InlinePipelineSingleSession);

// ============================================================================
// Inline pipeline, many sessions (storage map growth)
// ============================================================================
static void BM_InlinePipelineManySessions(benchmark::State &state) {
    auto source = std::make_shared<ManualEventSource>();
    auto outbox = std::make_shared<Outbox>();
    auto flow = buildBenchmarkFlow(source, outbox);
    const auto sessions = state.range(0);

    int64_t i = 0;
    for (auto _ : state) {
        source->publish(std::make_shared<TextMessage>(std::to_string(i++ % sessions), "x"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_InlinePipelineManySessions)->Arg(16)->Arg(1024);

BENCHMARK_MAIN();
