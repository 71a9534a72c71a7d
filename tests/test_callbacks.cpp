// tests/test_callbacks.cpp
#include <catch2/catch_test_macros.hpp>
#include "testing_utils.h"
#include <algorithm>
#include <atomic>
#include <cctype>

using namespace agentrt;
using namespace agentrt::testing;

namespace {

std::shared_ptr<LlmAgent> make_llm(const std::string& name,
                                   std::shared_ptr<ModelClient> model,
                                   std::shared_ptr<ToolRegistry> registry = nullptr,
                                   std::vector<std::string> tools = {}) {
    LlmAgent::Config config;
    config.name = name;
    config.model = std::move(model);
    config.tool_registry = std::move(registry);
    config.tools = std::move(tools);
    return std::make_shared<LlmAgent>(std::move(config));
}

} // namespace

TEST_CASE("before_agent content skips only that agent", "[callbacks][agent]") {
    std::atomic<bool> guarded_ran{false};
    auto guarded = std::make_shared<FunctionAgent>("guarded", [&](InvocationContext& ctx, const EventSink& sink) {
        guarded_ran = true;
        return sink(make_event(ctx, "real work"));
    });
    guarded->add_before_agent_callback([](CallbackContext& cb) -> std::optional<Content> {
        if (cb.state().get("skip", false).get<bool>()) {
            return Content::model_text("skipped by guard");
        }
        return std::nullopt;
    });
    auto next = say("next", "still runs");
    InMemoryRunner runner(std::make_shared<SequentialAgent>("seq", std::vector<AgentPtr>{guarded, next}));
    runner.session_store().create_session("InMemoryRunner", "u1", std::string("s1"), StateMap{{"skip", true}});

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(result.success);
    REQUIRE_FALSE(guarded_ran);
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user", "guarded", "next"});
    REQUIRE(result.committed_events[1].text() == "skipped by guard");
}

TEST_CASE("before_agent ending the invocation stops the agent body", "[callbacks][agent]") {
    int runs = 0;
    auto worker = std::make_shared<FunctionAgent>("worker", [&](InvocationContext& ctx, const EventSink& sink) {
        ++runs;
        return sink(make_event(ctx, "should not appear", StateMap{{"leaked", true}}));
    });
    worker->add_before_agent_callback([](CallbackContext& cb) -> std::optional<Content> {
        cb.invocation_context().set_end_invocation();
        return std::nullopt;
    });
    auto next = say("next", "never reached");
    InMemoryRunner runner(std::make_shared<SequentialAgent>("seq", std::vector<AgentPtr>{worker, next}));

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(runs == 0);
    REQUIRE_FALSE(result.session->has_state("leaked"));
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user"});
    REQUIRE(result.message == "Invocation ended early");
    const auto traces = runner.last_traces();
    const auto it = std::find_if(traces.begin(), traces.end(), [](const TraceRecord& r) { return r.agent_name == "worker"; });
    REQUIRE(it != traces.end());
    REQUIRE(it->status == "cancelled");
}

TEST_CASE("Agent callbacks that only change state emit an actions-only event", "[callbacks][agent]") {
    auto agent = std::make_shared<FunctionAgent>("worker", [](InvocationContext& ctx, const EventSink& sink) {
        // the before callback's write is committed before the body runs
        auto started = ctx.session()->get_state("started");
        return sink(make_event(ctx, started ? "saw start" : "no start"));
    });
    agent->add_before_agent_callback([](CallbackContext& cb) -> std::optional<Content> {
        cb.state().set("started", true);
        return std::nullopt;
    });
    agent->add_after_agent_callback([](CallbackContext& cb) -> std::optional<Content> {
        cb.state().set("finished_by", cb.agent_name());
        return std::nullopt;
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(result.success);
    REQUIRE(result.committed_events.size() == 4);
    const Event& before = result.committed_events[1];
    REQUIRE_FALSE(before.content.has_value());
    REQUIRE(before.actions.state_delta == StateMap{{"started", true}});
    REQUIRE(result.committed_events[2].text() == "saw start");
    REQUIRE(result.committed_events[3].actions.state_delta == StateMap{{"finished_by", "worker"}});
    REQUIRE(result.session->get_state("finished_by") == std::optional<Value>("worker"));
}

TEST_CASE("after_agent content is appended after the agent's own events", "[callbacks][agent]") {
    auto agent = say("worker", "body");
    agent->add_after_agent_callback([](CallbackContext&) -> std::optional<Content> {
        return Content::model_text("epilogue");
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(result.success);
    REQUIRE(result.committed_events.size() == 3);
    REQUIRE(result.committed_events[1].text() == "body");
    REQUIRE(result.committed_events[2].text() == "epilogue");
    REQUIRE(result.committed_events[2].author == "worker");
}

TEST_CASE("The first callback returning a value wins", "[callbacks][chain]") {
    std::vector<std::string> calls;
    auto agent = say("worker", "body");
    agent->add_before_agent_callback([&](CallbackContext&) -> std::optional<Content> {
        calls.push_back("first");
        return std::nullopt;
    });
    agent->add_before_agent_callback([&](CallbackContext&) -> std::optional<Content> {
        calls.push_back("second");
        return Content::model_text("from second");
    });
    agent->add_before_agent_callback([&](CallbackContext&) -> std::optional<Content> {
        calls.push_back("third");
        return Content::model_text("from third");
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE(calls == std::vector<std::string>{"first", "second"});
    REQUIRE(result.committed_events.back().text() == "from second");
}

TEST_CASE("before_model can replace the model call", "[callbacks][model]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{});
    auto agent = make_llm("assistant", model);
    agent->add_before_model_callback([](CallbackContext& cb, LlmRequest& request) -> std::optional<LlmResponse> {
        cb.state().set("intercepted", true);
        if (!request.contents.empty() && request.contents.back().text().find("blocked") != std::string::npos) {
            return text_response("I cannot help with that.");
        }
        return std::nullopt;
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("a blocked topic"));

    REQUIRE(result.success);
    REQUIRE(model->calls() == 0);
    REQUIRE(result.committed_events.back().text() == "I cannot help with that.");
    // state written by the hook travels with the event it produced
    REQUIRE(result.committed_events.back().actions.state_delta["intercepted"] == true);
    REQUIRE(runner.last_traces().front().budget_snapshot["llm_calls_used"] == 0);
}

TEST_CASE("before_model can edit the request", "[callbacks][model]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("ok")});
    auto agent = make_llm("assistant", model);
    agent->add_before_model_callback([](CallbackContext&, LlmRequest& request) -> std::optional<LlmResponse> {
        request.system_instruction += "Answer briefly.";
        return std::nullopt;
    });
    InMemoryRunner runner(agent);

    REQUIRE(runner.run("u1", "s1", Content::user_text("hello")).success);
    REQUIRE(model->requests().at(0).system_instruction == "Answer briefly.");
}

TEST_CASE("after_model can replace the response", "[callbacks][model]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("raw answer")});
    auto agent = make_llm("assistant", model);
    agent->add_after_model_callback([](CallbackContext&, const LlmResponse& response) -> std::optional<LlmResponse> {
        std::string text = response.content ? response.content->text() : "";
        return text_response("[edited] " + text);
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("hello"));

    REQUIRE(result.success);
    REQUIRE(model->calls() == 1);
    REQUIRE(result.committed_events.back().text() == "[edited] raw answer");
}

TEST_CASE("Tool callbacks can skip or rewrite a tool call", "[callbacks][tool]") {
    auto registry = std::make_shared<ToolRegistry>();
    std::atomic<int> tool_runs{0};
    registry->register_tool(ToolDeclaration{"lookup", "Find a price", Value::object()},
                            [&](const Value& args, ToolContext&) -> Value {
                                ++tool_runs;
                                return Value{{"price", args.value("ticker", "") == "GOOG" ? 100 : 1}};
                            });

    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{
        call_response("lookup", Value{{"ticker", "CACHED"}}, "c1"),
        call_response("lookup", Value{{"ticker", "goog"}}, "c2"),
        text_response("done")});
    auto agent = make_llm("trader", model, registry, {"lookup"});

    agent->add_before_tool_callback([](const std::string& tool, Value& args, ToolContext& ctx) -> std::optional<Value> {
        if (args["ticker"] == "CACHED") {
            ctx.state().set("cache_hit", true);
            return Value{{"price", 5}};
        }
        // normalise arguments in place
        std::string ticker = args["ticker"].get<std::string>();
        for (auto& ch : ticker) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        args["ticker"] = ticker;
        REQUIRE(tool == "lookup");
        return std::nullopt;
    });
    agent->add_after_tool_callback([](const std::string&, const Value& args, ToolContext&, const Value& result)
                                       -> std::optional<Value> {
        Value altered = result;
        altered["ticker"] = args["ticker"];
        return altered;
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("prices please"));

    REQUIRE(result.success);
    REQUIRE(tool_runs == 1);
    // user, call, response, call, response, final text
    REQUIRE(result.committed_events.size() == 6);

    auto first = result.committed_events[2].function_responses();
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].id == "c1");
    REQUIRE(first[0].response == Value{{"price", 5}, {"ticker", "CACHED"}});
    REQUIRE(result.committed_events[2].actions.state_delta["cache_hit"] == true);

    auto second = result.committed_events[4].function_responses();
    REQUIRE(second[0].response == Value{{"price", 100}, {"ticker", "GOOG"}});
    REQUIRE(result.session->get_state("cache_hit") == std::optional<Value>(true));
}

TEST_CASE("Callback exceptions fail the enclosing agent", "[callbacks][error]") {
    auto agent = say("worker", "body");
    agent->add_before_agent_callback([](CallbackContext&) -> std::optional<Content> {
        throw std::runtime_error("guard crashed");
    });
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "guard crashed");
    REQUIRE(runner.last_traces().front().status == "failed");
}
