// tests/test_event.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/event.h"

using namespace agentrt;

TEST_CASE("Event::create fills id and timestamp", "[event]") {
    Event a = Event::create("e-1", "writer");
    Event b = Event::create("e-1", "writer", "pipeline.writer");

    REQUIRE_FALSE(a.id.empty());
    REQUIRE(a.id != b.id);
    REQUIRE(a.timestamp > 0.0);
    REQUIRE(a.branch.empty());
    REQUIRE(b.branch == "pipeline.writer");
    REQUIRE(a.actions.empty());
}

TEST_CASE("Final response detection", "[event]") {
    Event text = Event::create("e-1", "a");
    text.content = Content::model_text("done");
    REQUIRE(text.is_final_response());

    Event partial = text;
    partial.partial = true;
    REQUIRE_FALSE(partial.is_final_response());

    Event call = Event::create("e-1", "a");
    call.content = Content{"model", {Part::from_function_call(FunctionCall{"c1", "lookup", Value{{"q", "x"}}})}};
    REQUIRE_FALSE(call.is_final_response());
    REQUIRE(call.function_calls().size() == 1);
    REQUIRE(call.function_calls()[0].name == "lookup");

    Event response = Event::create("e-1", "a");
    response.content = Content{"user", {Part::from_function_response(FunctionResponse{"c1", "lookup", Value::object()})}};
    REQUIRE_FALSE(response.is_final_response());
    response.actions.skip_downstream_processing = true;
    REQUIRE(response.is_final_response());
}

TEST_CASE("EventActions merge keeps later writes", "[event]") {
    EventActions first;
    first.state_delta["a"] = 1;
    first.state_delta["b"] = 1;
    first.artifact_delta["f.txt"] = 0;

    EventActions second;
    second.state_delta["b"] = 2;
    second.artifact_delta["f.txt"] = 1;
    second.escalate = true;

    first.merge(second);
    REQUIRE(first.state_delta["a"] == 1);
    REQUIRE(first.state_delta["b"] == 2);
    REQUIRE(first.artifact_delta["f.txt"] == 1);
    REQUIRE(first.escalate);
    REQUIRE_FALSE(first.skip_downstream_processing);
}

TEST_CASE("Event survives JSON persistence", "[event][json]") {
    Event event = Event::create("e-42", "critic", "loop.critic");
    event.content = Content{"model", {Part::from_text("Looks good. "),
                                      Part::from_function_call(FunctionCall{"c9", "exit_loop", Value::object()})}};
    event.actions.state_delta["user:lang"] = "en";
    event.actions.state_delta["stale"] = nullptr;
    event.actions.escalate = true;
    event.error_code = "RATE_LIMIT";

    Value j = event;
    Event restored = j.get<Event>();

    REQUIRE(restored.id == event.id);
    REQUIRE(restored.invocation_id == "e-42");
    REQUIRE(restored.branch == "loop.critic");
    REQUIRE(restored.text() == "Looks good. ");
    REQUIRE(restored.function_calls().size() == 1);
    REQUIRE(restored.actions.state_delta["stale"].is_null());
    REQUIRE(restored.actions.escalate);
    REQUIRE(restored.error_code == std::optional<std::string>("RATE_LIMIT"));
    REQUIRE_FALSE(restored.error_message.has_value());
    REQUIRE(restored.timestamp == event.timestamp);
}
