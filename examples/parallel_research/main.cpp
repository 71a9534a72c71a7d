// main.cpp
#include "agentrt/agentrt.h"
#include "common/llm/llama_adapter.h"
#include <fstream>
#include <iostream>

using namespace agentrt;

namespace {

struct Topic {
    const char* agent;
    const char* subject;
    const char* output_key;
};

const Topic kTopics[] = {
    {"renewable_energy", "renewable energy sources", "renewable_energy_result"},
    {"electric_vehicles", "electric vehicle technology", "ev_technology_result"},
    {"carbon_capture", "carbon capture methods", "carbon_capture_result"},
};

// Offline stand-in for a search backend: notes kept in memory per user
std::shared_ptr<InMemoryMemoryStore> make_notes() {
    auto notes = std::make_shared<InMemoryMemoryStore>();
    notes->add_memories("parallel_research", "researcher_01", {
        MemoryEntry{Content::model_text("Perovskite solar cells passed 26 percent efficiency in lab tests."), "notes", 1.0, 0.0},
        MemoryEntry{Content::model_text("Solid state batteries promise faster charging for electric vehicles."), "notes", 2.0, 0.0},
        MemoryEntry{Content::model_text("Direct air capture plants remove carbon dioxide at high energy cost."), "notes", 3.0, 0.0},
    });
    return notes;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <model.gguf>\n";
        return 1;
    }

    try {
        init_logging();

        // 1. 模型
        LlamaModel::Config llama_config;
        llama_config.model_path = argv[1];
        llama_config.n_predict = 192;
        auto model = std::make_shared<LlamaModel>(llama_config);
        if (!model->is_loaded()) {
            std::cerr << "[ERROR] failed to load model " << argv[1] << "\n";
            return 1;
        }

        // 2. 工具：从笔记中检索
        auto registry = std::make_shared<ToolRegistry>();
        registry->register_tool(
            ToolDeclaration{"search_notes", "Search the research notes for a query",
                            Value{{"type", "object"},
                                  {"properties", {{"query", {{"type", "string"}}}}},
                                  {"required", {"query"}}}},
            [](const Value& args, ToolContext& ctx) -> Value {
                Value hits = Value::array();
                for (const auto& entry : ctx.search_memory(args.value("query", ""))) {
                    hits.push_back(entry.content.text());
                }
                return Value{{"results", hits}};
            });

        // 3. 并行研究员 + 汇总
        std::vector<AgentPtr> researchers;
        for (const auto& topic : kTopics) {
            LlmAgent::Config config;
            config.name = topic.agent;
            config.description = std::string("Researches ") + topic.subject;
            config.instruction = std::string("You are a research assistant. Research '") + topic.subject +
                                 "' using the search_notes tool. Summarize the findings in 1-2 sentences. "
                                 "Output only the summary.";
            config.model = model;
            config.tool_registry = registry;
            config.tools = {"search_notes"};
            config.output_key = topic.output_key;
            researchers.push_back(std::make_shared<LlmAgent>(std::move(config)));
        }
        auto fan_out = std::make_shared<ParallelAgent>("research", researchers,
                                                       "Runs the researchers concurrently");

        LlmAgent::Config merger_config;
        merger_config.name = "synthesis";
        merger_config.model = model;
        merger_config.include_contents = false;
        merger_config.instruction =
            "Combine these findings into one short report.\n"
            "Renewable energy: {{ renewable_energy_result }}\n"
            "Electric vehicles: {{ ev_technology_result }}\n"
            "Carbon capture: {{ carbon_capture_result }}";
        merger_config.output_key = "report";
        auto merger = std::make_shared<LlmAgent>(std::move(merger_config));

        // 汇总前确认三个分支都有结果
        merger->add_before_agent_callback([](CallbackContext& cb) -> std::optional<Content> {
            for (const auto& topic : kTopics) {
                if (!cb.state().has(topic.output_key)) {
                    return Content::model_text(std::string("Missing research result: ") + topic.output_key);
                }
            }
            return std::nullopt;
        });

        auto root = std::make_shared<SequentialAgent>("research_pipeline", std::vector<AgentPtr>{fan_out, merger});

        // 4. 运行：推送模式
        Runner runner("parallel_research", root, std::make_shared<InMemorySessionStore>(), nullptr, make_notes());
        RunResult result = runner.run("researcher_01", "research_session", Content::user_text("Start the research."),
                                      [](const Event& event) {
                                          if (event.is_final_response() && !event.text().empty()) {
                                              std::cout << "[" << event.author << "@" << event.branch << "] "
                                                        << event.text() << "\n";
                                          }
                                          return true;
                                      });

        if (!result.success) {
            std::cerr << "[ERROR] " << result.message << "\n";
        } else {
            auto report = result.session->get_state("report");
            std::cout << "\n[REPORT]\n" << (report ? report->get<std::string>() : "<none>") << "\n";
        }

        std::ofstream trace_file("parallel_research_trace.json");
        trace_file << traces_to_json(runner.last_traces()).dump(2) << std::endl;
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
