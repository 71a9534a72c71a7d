// tests/test_runner.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "testing_utils.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace agentrt;
using namespace agentrt::testing;

TEST_CASE("Runner rejects incomplete wiring", "[runner]") {
    REQUIRE_THROWS_AS(Runner("app", nullptr, std::make_shared<InMemorySessionStore>()), ConfigError);
    REQUIRE_THROWS_AS(Runner("app", say("a", "x"), nullptr), ConfigError);
}

TEST_CASE("Events are committed before the agent resumes", "[runner][commit]") {
    auto store = std::make_shared<InMemorySessionStore>();
    std::optional<Value> persisted_after_yield;
    std::optional<Value> local_after_yield;

    auto agent = std::make_shared<FunctionAgent>("worker", [&](InvocationContext& ctx, const EventSink& sink) {
        if (!sink(make_event(ctx, "step one", StateMap{{"step", 1}}))) return false;
        // 1. the caller's session already reflects the delta
        local_after_yield = ctx.session()->get_state("step");
        // 2. so does the store
        auto stored = ctx.session_store().get_session(ctx.app_name(), ctx.user_id(), ctx.session()->id());
        persisted_after_yield = stored->get_state("step");
        return sink(make_event(ctx, "step two", StateMap{{"step", 2}}));
    });
    Runner runner("app", agent, store);

    std::vector<Value> seen_by_consumer;
    RunResult result = runner.run("u1", "s1", Content::user_text("go"), [&](const Event&) {
        seen_by_consumer.push_back(*store->get_session("app", "u1", "s1")->get_state("step"));
        return true;
    });

    REQUIRE(result.success);
    REQUIRE(result.message == "Invocation completed");
    REQUIRE(local_after_yield == std::optional<Value>(1));
    REQUIRE(persisted_after_yield == std::optional<Value>(1));
    // the consumer sees each event only after its commit
    REQUIRE(seen_by_consumer == std::vector<Value>{1, 2});
}

TEST_CASE("The user message is committed but not forwarded", "[runner]") {
    InMemoryRunner runner(say("worker", "hi"));
    std::vector<std::string> forwarded;

    RunResult result = runner.run("u1", "s1", Content::user_text("hello"), [&](const Event& e) {
        forwarded.push_back(e.author);
        return true;
    });

    REQUIRE(result.success);
    REQUIRE(forwarded == std::vector<std::string>{"worker"});
    REQUIRE(result.committed_events.front().author == "user");
    REQUIRE(result.committed_events.front().content->role == "user");
    REQUIRE(result.committed_events.front().invocation_id == result.invocation_id);
    REQUIRE_THAT(result.invocation_id, Catch::Matchers::StartsWith("e-"));
}

TEST_CASE("Sessions are created on first use and reused afterwards", "[runner][session]") {
    InMemoryRunner runner(say("worker", "hi", StateMap{{"visits", 1}}));

    REQUIRE(runner.run("u1", "s1", Content::user_text("one")).success);
    REQUIRE(runner.session_store().list_sessions("InMemoryRunner", "u1") == std::vector<std::string>{"s1"});

    RunResult second = runner.run("u1", "s1", Content::user_text("two"));
    REQUIRE(second.success);
    REQUIRE(second.session->event_count() == 4);
}

TEST_CASE("A consumer returning false stops the invocation", "[runner][cancel]") {
    auto pipeline = std::make_shared<SequentialAgent>(
        "pipeline", std::vector<AgentPtr>{say("a", "1"), say("b", "2"), say("c", "3")});
    InMemoryRunner runner(pipeline);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"),
                                  [](const Event& e) { return e.author != "b"; });

    REQUIRE(result.success);
    REQUIRE(result.message == "Invocation ended early");
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user", "a", "b"});
    REQUIRE(result.session->event_count() == 3);
}

TEST_CASE("end_invocation stops every remaining unit", "[runner][cancel]") {
    auto stopper = std::make_shared<FunctionAgent>("stopper", [](InvocationContext& ctx, const EventSink& sink) {
        ctx.set_end_invocation();
        return sink(make_event(ctx, "stopping here"));
    });
    auto pipeline = std::make_shared<SequentialAgent>(
        "pipeline", std::vector<AgentPtr>{say("a", "1"), stopper, say("c", "3")});
    InMemoryRunner runner(pipeline);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(result.success);
    REQUIRE(result.message == "Invocation ended early");
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user", "a", "stopper"});
}

TEST_CASE("Events emitted after termination are rejected", "[runner][cancel]") {
    std::vector<bool> sink_answers;
    auto stubborn = std::make_shared<FunctionAgent>("stubborn", [&](InvocationContext& ctx, const EventSink& sink) {
        sink_answers.push_back(sink(make_event(ctx, "first")));
        sink_answers.push_back(sink(make_event(ctx, "ignored the stop", StateMap{{"leak", true}})));
        return true;
    });
    InMemoryRunner runner(stubborn);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"), [](const Event&) { return false; });

    REQUIRE(sink_answers == std::vector<bool>{false, false});
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user", "stubborn"});
    REQUIRE_FALSE(result.session->has_state("leak"));
}

TEST_CASE("Agent failures are reported in the result", "[runner][error]") {
    auto failing = std::make_shared<FunctionAgent>("failing", [](InvocationContext&, const EventSink&) -> bool {
        throw ToolError("backend unreachable");
    });
    auto pipeline = std::make_shared<SequentialAgent>(
        "pipeline", std::vector<AgentPtr>{say("a", "kept", StateMap{{"kept", true}}), failing, say("c", "3")});
    InMemoryRunner runner(pipeline);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "backend unreachable");
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user", "a"});
    // committed work survives the failure
    auto stored = runner.session_store().get_session("InMemoryRunner", "u1", "s1");
    REQUIRE(stored->get_state("kept") == std::optional<Value>(true));
}

TEST_CASE("Runner persists through the SQLite backend", "[runner][sqlite]") {
    auto store = std::make_shared<SqliteSessionStore>(":memory:");
    Runner runner("app", say("worker", "done", StateMap{{"user:seen", true}, {"temp:scratch", 1}}), store);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(result.success);
    auto stored = store->get_session("app", "u1", "s1");
    REQUIRE(stored->event_count() == 2);
    REQUIRE(stored->get_state("user:seen") == std::optional<Value>(true));
    REQUIRE_FALSE(stored->has_state("temp:scratch"));
    // temp: values stay visible on the live session of the invocation
    REQUIRE(result.session->get_state("temp:scratch") == std::optional<Value>(1));
}

TEST_CASE("run_stream hands over one event per pull", "[runner][stream]") {
    std::atomic<int> started{0};
    auto counted = [&](const std::string& name) {
        return std::make_shared<FunctionAgent>(name, [&, name](InvocationContext& ctx, const EventSink& sink) {
            ++started;
            return sink(make_event(ctx, name + " done"));
        });
    };
    auto pipeline = std::make_shared<SequentialAgent>(
        "pipeline", std::vector<AgentPtr>{counted("a"), counted("b"), counted("c")});
    InMemoryRunner runner(pipeline);

    EventStream stream = runner.run_stream("u1", "s1", Content::user_text("go"));
    REQUIRE_FALSE(stream.finished());
    REQUIRE(started == 0); // nothing runs before the first pull
    REQUIRE_THROWS_AS(stream.result(), Error);

    auto first = stream.next();
    REQUIRE(first);
    REQUIRE(first->author == "a");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(started == 1); // the producer waits for the next pull

    REQUIRE(stream.next()->author == "b");
    REQUIRE(stream.next()->author == "c");
    REQUIRE_FALSE(stream.next().has_value());
    REQUIRE_FALSE(stream.next().has_value());

    REQUIRE(stream.finished());
    REQUIRE(stream.result().success);
    REQUIRE(stream.result().committed_events.size() == 4);
}

TEST_CASE("Dropping a stream cancels the invocation", "[runner][stream]") {
    std::atomic<int> emitted{0};
    auto ticker = std::make_shared<FunctionAgent>("ticker", [&](InvocationContext& ctx, const EventSink& sink) {
        ++emitted;
        return sink(make_event(ctx, "tick"));
    });
    // unbounded loop; only cancellation ends it
    InMemoryRunner runner(std::make_shared<LoopAgent>("forever", std::vector<AgentPtr>{ticker}));

    {
        EventStream stream = runner.run_stream("u1", "s1", Content::user_text("go"));
        REQUIRE(stream.next());
        REQUIRE(stream.next());
    }

    REQUIRE(emitted == 2);
    auto stored = runner.session_store().get_session("InMemoryRunner", "u1", "s1");
    REQUIRE(stored->event_count() == 3);
}

TEST_CASE("A failed invocation ends the stream with an unsuccessful result", "[runner][stream]") {
    auto failing = std::make_shared<FunctionAgent>("failing", [](InvocationContext& ctx, const EventSink& sink) -> bool {
        sink(make_event(ctx, "partial work"));
        throw Error("gave up");
    });
    InMemoryRunner runner(failing);

    EventStream stream = runner.run_stream("u1", "s1", Content::user_text("go"));
    REQUIRE(stream.next()->text() == "partial work");
    REQUIRE_FALSE(stream.next().has_value());
    REQUIRE_FALSE(stream.result().success);
    REQUIRE(stream.result().message == "gave up");
}
