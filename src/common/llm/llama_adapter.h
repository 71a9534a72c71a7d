// common/llm/llama_adapter.h
#ifndef AGENTRT_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTRT_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/llm/model_client.h"
#include <llama.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentrt {

// Local inference through llama.cpp. Requests are flattened into a single
// prompt; a model turn whose whole text is {"function_call": {"name": ..., "args": {...}}}
// is reported as a function call.
class LlamaModel : public ModelClient {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    };

    explicit LlamaModel(const Config& config, std::string name = "llama");
    ~LlamaModel() override;

    std::string name() const override { return name_; }

    bool generate_content(const LlmRequest& request, bool stream, const ResponseCallback& on_response) override;

    bool is_loaded() const;

    static std::string build_prompt(const LlmRequest& request);
    static Content parse_model_output(const std::string& text);

private:
    Config config_;
    std::string name_;
    std::mutex mutex_; // one llama_context, one generation at a time
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace agentrt

#endif // AGENTRT_COMMON_LLM_LLAMA_ADAPTER_H
