// tests/test_llm_agent.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "testing_utils.h"

using namespace agentrt;
using namespace agentrt::testing;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

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

std::shared_ptr<ToolRegistry> calculator_registry() {
    auto registry = std::make_shared<ToolRegistry>();
    registry->register_tool(
        ToolDeclaration{"add", "Add two integers",
                        Value{{"type", "object"},
                              {"properties", {{"a", {{"type", "integer"}}}, {"b", {{"type", "integer"}}}}}}},
        [](const Value& args, ToolContext& ctx) -> Value {
            int sum = args.at("a").get<int>() + args.at("b").get<int>();
            ctx.state().set("last_sum", sum);
            return sum;
        });
    registry->register_tool(ToolDeclaration{"boom", "Always fails", Value::object()},
                            [](const Value&, ToolContext&) -> Value { throw std::runtime_error("kaboom"); });
    return registry;
}

bool mentions(const std::vector<Content>& contents, const std::string& needle) {
    for (const auto& c : contents) {
        if (c.text().find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST_CASE("LLM agent configuration is validated", "[llm][config]") {
    auto registry = calculator_registry();

    SECTION("model is required") {
        LlmAgent::Config config;
        config.name = "assistant";
        REQUIRE_THROWS_AS(LlmAgent(config), ConfigError);
    }

    SECTION("tools need a registry") {
        LlmAgent::Config config;
        config.name = "assistant";
        config.model = std::make_shared<EchoModel>("hi");
        config.tools = {"add"};
        REQUIRE_THROWS_AS(LlmAgent(config), ConfigError);
    }

    SECTION("tools must be registered") {
        REQUIRE_THROWS_AS(make_llm("assistant", std::make_shared<EchoModel>("hi"), registry, {"multiply"}), ConfigError);
    }

    SECTION("the request offers only the listed tools") {
        auto agent = make_llm("assistant", std::make_shared<EchoModel>("hi"), registry, {"add"});
        InMemorySessionStore store;
        auto session = store.create_session("app", "u1");
        InvocationContext ctx("e-1", session, store, *agent);
        LlmRequest request = agent->build_request(ctx);
        REQUIRE(request.model == "echo");
        REQUIRE(request.tools.size() == 1);
        REQUIRE(request.tools[0].name == "add");
    }
}

TEST_CASE("Tool calls round trip through one merged response event", "[llm][tools]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{
        call_response("add", Value{{"a", 2}, {"b", 3}}),
        text_response("The sum is 5.")});
    auto agent = make_llm("calculator", model, calculator_registry(), {"add"});
    InMemoryRunner runner(agent);

    RunResult result = runner.run("u1", "s1", Content::user_text("what is 2 + 3?"));

    REQUIRE(result.success);
    REQUIRE(result.committed_events.size() == 4);

    const Event& call_event = result.committed_events[1];
    auto calls = call_event.function_calls();
    REQUIRE(calls.size() == 1);
    REQUIRE_THAT(calls[0].id, StartsWith("call-"));

    const Event& response_event = result.committed_events[2];
    REQUIRE(response_event.author == "calculator");
    REQUIRE(response_event.content->role == "user");
    auto responses = response_event.function_responses();
    REQUIRE(responses.size() == 1);
    REQUIRE(responses[0].id == calls[0].id);
    REQUIRE(responses[0].name == "add");
    // scalar tool results are wrapped
    REQUIRE(responses[0].response == Value{{"result", 5}});
    REQUIRE(response_event.actions.state_delta["last_sum"] == 5);

    REQUIRE(result.committed_events[3].is_final_response());
    REQUIRE(result.committed_events[3].text() == "The sum is 5.");

    // the second request carries the call and its response
    REQUIRE(model->calls() == 2);
    const auto& second = model->requests()[1].contents;
    REQUIRE(second.size() == 3);
    REQUIRE(second[1].parts[0].function_call.has_value());
    REQUIRE(second[2].parts[0].function_response.has_value());
    REQUIRE(result.session->get_state("last_sum") == std::optional<Value>(5));
}

TEST_CASE("Several calls in one answer produce one response event", "[llm][tools]") {
    LlmResponse both;
    both.content = Content();
    both.content->role = "model";
    both.content->parts.push_back(Part::from_function_call(FunctionCall{"c1", "add", Value{{"a", 1}, {"b", 1}}}));
    both.content->parts.push_back(Part::from_function_call(FunctionCall{"c2", "add", Value{{"a", 2}, {"b", 2}}}));
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{both, text_response("2 and 4")});
    InMemoryRunner runner(make_llm("calculator", model, calculator_registry(), {"add"}));

    RunResult result = runner.run("u1", "s1", Content::user_text("two sums"));

    REQUIRE(result.success);
    auto responses = result.committed_events[2].function_responses();
    REQUIRE(responses.size() == 2);
    REQUIRE(responses[0].id == "c1");
    REQUIRE(responses[1].id == "c2");
    REQUIRE(responses[1].response["result"] == 4);
    // later tool writes win inside the merged actions
    REQUIRE(result.committed_events[2].actions.state_delta["last_sum"] == 4);
}

TEST_CASE("exit_loop ends the enclosing loop", "[llm][tools][loop]") {
    auto registry = std::make_shared<ToolRegistry>();
    auto writer = make_llm("writer", std::make_shared<EchoModel>("draft"));
    auto critic_model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{
        text_response("needs work"),
        call_response(ToolRegistry::kExitLoop, Value::object(), "exit-1")});
    auto critic = make_llm("critic", critic_model, registry, {ToolRegistry::kExitLoop});
    auto after = say("publisher", "published");
    auto loop = std::make_shared<LoopAgent>("refine", std::vector<AgentPtr>{writer, critic}, 5);
    InMemoryRunner runner(std::make_shared<SequentialAgent>("pipeline", std::vector<AgentPtr>{loop, after}));

    RunResult result = runner.run("u1", "s1", Content::user_text("write a poem"));

    REQUIRE(result.success);
    REQUIRE(critic_model->calls() == 2);
    REQUIRE(authors_of(result.committed_events) ==
            std::vector<std::string>{"user", "writer", "critic", "writer", "critic", "critic", "publisher"});
    const Event& exit_response = result.committed_events[5];
    REQUIRE(exit_response.actions.escalate);
    REQUIRE(exit_response.actions.skip_downstream_processing);
}

TEST_CASE("Streaming partials reach the consumer but are not committed", "[llm][streaming]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("one two three")});
    InMemoryRunner runner(make_llm("streamer", model));

    std::vector<Event> seen;
    RunConfig config;
    config.streaming = true;
    RunResult result = runner.run("u1", "s1", Content::user_text("count"),
                                  [&](const Event& e) {
                                      seen.push_back(e);
                                      return true;
                                  },
                                  config);

    REQUIRE(result.success);
    REQUIRE(seen.size() == 4);
    REQUIRE(seen[0].partial);
    REQUIRE(seen[0].text() == "one");
    REQUIRE(seen[2].text() == "three");
    REQUIRE_FALSE(seen[3].partial);
    REQUIRE(seen[3].text() == "one two three");

    REQUIRE(result.committed_events.size() == 2);
    REQUIRE(result.session->event_count() == 2);
}

TEST_CASE("output_key stores the final text in state", "[llm][state]") {
    LlmAgent::Config config;
    config.name = "summarizer";
    config.model = std::make_shared<EchoModel>("short summary");
    config.output_key = "summary";
    InMemoryRunner runner(std::make_shared<LlmAgent>(config));

    RunResult result = runner.run("u1", "s1", Content::user_text("summarize"));

    REQUIRE(result.success);
    REQUIRE(result.committed_events.back().actions.state_delta["summary"] == "short summary");
    auto stored = runner.session_store().get_session("InMemoryRunner", "u1", "s1");
    REQUIRE(stored->get_state("summary") == std::optional<Value>("short summary"));
}

TEST_CASE("Instructions are rendered over session state", "[llm][template]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("ok")});
    LlmAgent::Config config;
    config.name = "writer";
    config.model = model;
    config.instruction = "Write about {{ topic }} for {{ user.name }}.";
    InMemoryRunner runner(std::make_shared<LlmAgent>(config));
    runner.session_store().create_session("InMemoryRunner", "u1", std::string("s1"),
                                          StateMap{{"topic", "rivers"}, {"user:name", "Ada"}});

    REQUIRE(runner.run("u1", "s1", Content::user_text("go")).success);
    REQUIRE(model->requests()[0].system_instruction == "Write about rivers for Ada.");
}

TEST_CASE("A missing template variable fails the agent", "[llm][template]") {
    LlmAgent::Config config;
    config.name = "writer";
    config.model = std::make_shared<EchoModel>("unused");
    config.instruction = "Write about {{ topic }}.";
    InMemoryRunner runner(std::make_shared<LlmAgent>(config));

    RunResult result = runner.run("u1", "s1", Content::user_text("go"));

    REQUIRE_FALSE(result.success);
    REQUIRE_THAT(result.message, ContainsSubstring("Template render error"));
}

TEST_CASE("Output of other agents is presented as context", "[llm][history]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("reviewed")});
    auto reviewer = make_llm("reviewer", model);
    auto drafter = say("drafter", "first draft");
    InMemoryRunner runner(std::make_shared<SequentialAgent>("pipeline", std::vector<AgentPtr>{drafter, reviewer}));

    REQUIRE(runner.run("u1", "s1", Content::user_text("review this")).success);

    const auto& contents = model->requests()[0].contents;
    REQUIRE(contents.size() == 2);
    REQUIRE(contents[0].role == "user");
    REQUIRE(contents[0].text() == "review this");
    REQUIRE(contents[1].role == "user");
    REQUIRE(contents[1].parts.size() == 2);
    REQUIRE(*contents[1].parts[0].text == "For context:");
    REQUIRE(*contents[1].parts[1].text == "[drafter] said: first draft");
}

TEST_CASE("Parallel branches do not see each other's history", "[llm][history][parallel]") {
    auto model_a = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("alpha result")}, "a");
    auto model_b = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("beta result")}, "b");
    auto summary_model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{text_response("merged")}, "s");

    auto fan_out = std::make_shared<ParallelAgent>(
        "research", std::vector<AgentPtr>{make_llm("alpha", model_a), make_llm("beta", model_b)});
    auto pipeline = std::make_shared<SequentialAgent>(
        "pipeline", std::vector<AgentPtr>{say("intro", "shared brief"), fan_out, make_llm("merger", summary_model)});
    InMemoryRunner runner(pipeline);

    REQUIRE(runner.run("u1", "s1", Content::user_text("investigate")).success);

    const auto& seen_by_a = model_a->requests()[0].contents;
    const auto& seen_by_b = model_b->requests()[0].contents;
    REQUIRE(mentions(seen_by_a, "[intro] said: shared brief"));
    REQUIRE(mentions(seen_by_b, "[intro] said: shared brief"));
    REQUIRE_FALSE(mentions(seen_by_a, "beta result"));
    REQUIRE_FALSE(mentions(seen_by_b, "alpha result"));

    // the unbranched merger sees the output of both branches
    const auto& seen_by_merger = summary_model->requests()[0].contents;
    REQUIRE(mentions(seen_by_merger, "[alpha] said: alpha result"));
    REQUIRE(mentions(seen_by_merger, "[beta] said: beta result"));
}

TEST_CASE("include_contents=false limits history to the current invocation", "[llm][history]") {
    auto model = std::make_shared<ScriptedModel>(
        std::vector<LlmResponse>{text_response("first answer"), text_response("second answer")});
    LlmAgent::Config config;
    config.name = "stateless";
    config.model = model;
    config.include_contents = false;
    InMemoryRunner runner(std::make_shared<LlmAgent>(config));

    REQUIRE(runner.run("u1", "s1", Content::user_text("first question")).success);
    REQUIRE(runner.run("u1", "s1", Content::user_text("second question")).success);

    const auto& contents = model->requests()[1].contents;
    REQUIRE(contents.size() == 1);
    REQUIRE(contents[0].text() == "second question");
}

TEST_CASE("The LLM call budget is enforced per invocation", "[llm][budget]") {
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{
        call_response("add", Value{{"a", 1}, {"b", 2}}, "c1"),
        text_response("never reached")});
    InMemoryRunner runner(make_llm("calculator", model, calculator_registry(), {"add"}));

    RunConfig config;
    config.max_llm_calls = 1;
    RunResult result = runner.run("u1", "s1", Content::user_text("1 + 2"), nullptr, config);

    REQUIRE_FALSE(result.success);
    REQUIRE_THAT(result.message, ContainsSubstring("Max number of LLM calls limit of 1 exceeded"));
    REQUIRE(model->calls() == 1);
    // work committed before the limit was hit stays committed
    REQUIRE(authors_of(result.committed_events) == std::vector<std::string>{"user", "calculator", "calculator"});
    REQUIRE(result.session->get_state("last_sum") == std::optional<Value>(3));
}

TEST_CASE("Tool failures fail the invocation", "[llm][tools][error]") {
    auto registry = calculator_registry();

    SECTION("tool not offered to the agent") {
        auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{call_response("boom", Value::object(), "c1")});
        InMemoryRunner runner(make_llm("calculator", model, registry, {"add"}));
        RunResult result = runner.run("u1", "s1", Content::user_text("explode"));
        REQUIRE_FALSE(result.success);
        REQUIRE_THAT(result.message, ContainsSubstring("has no tool named 'boom'"));
    }

    SECTION("tool body throws") {
        auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{call_response("boom", Value::object(), "c1")});
        InMemoryRunner runner(make_llm("calculator", model, registry, {"boom"}));
        RunResult result = runner.run("u1", "s1", Content::user_text("explode"));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Tool boom execution failed: kaboom");
        REQUIRE(runner.last_traces().front().status == "failed");
    }
}

TEST_CASE("Model errors end the agent without tool handling", "[llm][error]") {
    LlmResponse failed;
    failed.error_code = "SAFETY";
    failed.error_message = "blocked by filter";
    auto model = std::make_shared<ScriptedModel>(std::vector<LlmResponse>{failed});
    InMemoryRunner runner(make_llm("assistant", model));

    RunResult result = runner.run("u1", "s1", Content::user_text("something"));

    REQUIRE(result.success);
    REQUIRE(result.committed_events.size() == 2);
    REQUIRE(result.committed_events[1].error_code == std::optional<std::string>("SAFETY"));
    REQUIRE_FALSE(result.committed_events[1].content.has_value());
}
