// main.cpp
#include "agentrt/agentrt.h"
#include "common/llm/llama_adapter.h"
#include <fstream>
#include <iostream>

using namespace agentrt;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <app.yaml> [topic] [session_id]\n";
        return 1;
    }
    const std::string topic = argc > 2 ? argv[2] : "a lighthouse keeper";
    const std::string session_id = argc > 3 ? argv[3] : "doc-session";
    const std::string user_id = "writer_01";

    try {
        // 1. 加载配置并初始化日志
        AppConfig config = AppConfig::load(argv[1]);
        init_logging(config.logging);
        if (!config.llm || !config.agent_file) {
            std::cerr << "[ERROR] app config needs 'llm' and 'agent_file'\n";
            return 1;
        }

        // 2. 模型与工具
        LlamaModel::Config llama_config;
        llama_config.model_path = config.llm->model_path;
        llama_config.n_ctx = config.llm->n_ctx;
        llama_config.n_threads = config.llm->n_threads;
        llama_config.temperature = config.llm->temperature;
        llama_config.min_p = config.llm->min_p;
        llama_config.n_predict = config.llm->n_predict;
        auto model = std::make_shared<LlamaModel>(llama_config);
        if (!model->is_loaded()) {
            std::cerr << "[ERROR] failed to load model " << llama_config.model_path << "\n";
            return 1;
        }
        auto registry = std::make_shared<ToolRegistry>();

        // 3. 构建 agent 树
        AgentLoader loader(
            [model](const std::string& name) -> std::shared_ptr<ModelClient> {
                return name.empty() || name == model->name() ? model : nullptr;
            },
            registry);
        AgentPtr root = loader.load_file(*config.agent_file);

        // 4. 会话：首次运行时写入主题
        auto store = make_session_store(config.session_store);
        if (!store->get_session(config.app_name, user_id, session_id)) {
            store->create_session(config.app_name, user_id, session_id, StateMap{{"topic", topic}});
        }
        Runner runner(config.app_name, root, store);

        // 5. 拉取事件流
        EventStream stream = runner.run_stream(user_id, session_id, Content::user_text("Write the document."), config.run);
        std::string streaming_author;
        while (auto event = stream.next()) {
            if (event->partial) {
                if (streaming_author != event->author) {
                    streaming_author = event->author;
                    std::cout << "\n[" << event->author << "] ";
                }
                std::cout << event->text() << std::flush;
                continue;
            }
            streaming_author.clear();
            for (const auto& call : event->function_calls()) {
                std::cout << "\n[" << event->author << "] -> " << call.name << "(" << call.args.dump() << ")";
            }
            if (event->is_final_response() && !event->text().empty()) {
                std::cout << "\n[" << event->author << "] " << event->text();
            }
        }
        std::cout << "\n";

        const RunResult& result = stream.result();
        if (!result.success) {
            std::cerr << "[ERROR] " << result.message << "\n";
        } else {
            std::cout << "[SUCCESS] " << result.message << "\n";
            auto document = result.session->get_state("current_document");
            std::cout << "Final document:\n" << (document ? document->get<std::string>() : "<none>") << "\n";
        }

        // 6. 导出 Trace
        auto traces = runner.last_traces();
        std::ofstream trace_file("doc_writer_trace.json");
        trace_file << traces_to_json(traces).dump(2) << std::endl;
        std::cout << "Trace exported to doc_writer_trace.json (" << traces.size() << " records)\n";
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
