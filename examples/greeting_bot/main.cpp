#include "common/FlowOptions.h"
#include "events/ManualEventSource.h"
#include "runtime/FlowBuilder.h"
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace {

class TextMessage : public SFR::Event {
public:
    TextMessage(SFR::SessionId sessionId, std::string text) : Event(std::move(sessionId)), text_(std::move(text)) {}

    const std::string &getText() const {
        return text_;
    }

    std::string toString() const override {
        return "TextMessage(" + getSessionId() + ")";
    }

private:
    std::string text_;
};

class Greeting : public SFR::NamedState {
public:
    Greeting() : NamedState("Greeting") {}
};

class AskingName : public SFR::NamedState {
public:
    AskingName() : NamedState("AskingName") {}
};

class KnowsName : public SFR::State {
public:
    explicit KnowsName(std::string name) : name_(std::move(name)) {}

    const std::string &getName() const {
        return name_;
    }

    std::string toString() const override {
        return "KnowsName(" + name_ + ")";
    }

private:
    std::string name_;
};

// Writes replies for one session to stdout
class ConsoleReply {
public:
    explicit ConsoleReply(SFR::SessionId sessionId) : sessionId_(std::move(sessionId)) {}

    void send(const std::string &text) {
        static std::mutex outputMutex;
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cout << "[" << sessionId_ << "] " << text << "\n";
    }

private:
    SFR::SessionId sessionId_;
};

}  // namespace

int main(int argc, char *argv[]) {
    auto source = std::make_shared<SFR::ManualEventSource>();

    SFR::FlowBuilder<ConsoleReply> builder;
    builder.eventSource(source)
        .rendererFactory([](const SFR::EventPtr &event) { return ConsoleReply(event->getSessionId()); })
        .initial([](const SFR::EventPtr &) -> SFR::StatePtr { return std::make_shared<Greeting>(); })
        .failView([](const SFR::FailureContext &failure, ConsoleReply &out) {
            out.send("Sorry, something went wrong (" + std::string(SFR::toString(failure.kind)) + ")");
        });

    if (argc > 1) {
        try {
            builder.options(SFR::FlowOptions::fromFile(argv[1]));
        } catch (const SFR::FlowConfigurationError &e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    builder.handle<TextMessage>().when<Greeting>().with(
        [](const std::shared_ptr<const TextMessage> &) -> SFR::StatePtr { return std::make_shared<AskingName>(); });
    builder.handle<TextMessage>().when<AskingName>().with(
        [](const std::shared_ptr<const TextMessage> &message) -> SFR::StatePtr {
            return std::make_shared<KnowsName>(message->getText());
        });
    builder.handle<TextMessage>().when<KnowsName>().with(
        [](const std::shared_ptr<const TextMessage> &message,
           const std::shared_ptr<const KnowsName> &state) -> SFR::StatePtr {
            return message->getText() == "/reset" ? SFR::StatePtr(std::make_shared<Greeting>()) : SFR::StatePtr(state);
        });

    builder.render<Greeting>().as([](const SFR::Session &, ConsoleReply &out, const SFR::EventPtr &) {
        out.send("Hello! Say anything to continue, /reset starts over.");
    });
    builder.render<AskingName>().as(
        [](const SFR::Session &, ConsoleReply &out, const SFR::EventPtr &) { out.send("What is your name?"); });
    builder.render<KnowsName>().as(
        [](const std::shared_ptr<const KnowsName> &state, ConsoleReply &out, const SFR::EventPtr &) {
            out.send("Nice to meet you, " + state->getName() + ".");
        });

    auto flow = builder.build();

    // Input lines: "<session id> <text>"
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream input(line);
        std::string sessionId;
        std::string text;
        if (!(input >> sessionId)) {
            continue;
        }
        std::getline(input >> std::ws, text);
        source->publish(std::make_shared<TextMessage>(sessionId, text));
    }

    if (auto pool = std::dynamic_pointer_cast<SFR::ThreadPoolExecutor>(flow->getConfig().executor)) {
        pool->shutdown(true);
    }
    SFR::Logger::flush();
    return 0;
}
