// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include "common/logging/logger.h"
#include "common/utils/ids.h"
#include "core/types/errors.h"

namespace agentrt {

LlamaModel::LlamaModel(const Config& config, std::string name)
    : config_(config),
      name_(std::move(name)),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_backend_init();

    // Load model
    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // Use all GPU layers if available

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw Error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    // Create context
    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw Error("Failed to create context");
    }
    ctx_.reset(raw_ctx);

    // Create sampler chain
    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    AGENTRT_LOG_INFO("Loaded llama model '{}' from {}", name_, config_.model_path);
}

LlamaModel::~LlamaModel() = default;

std::vector<llama_token> LlamaModel::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                      nullptr, 0, add_bos, true);
    // 缓冲区为空时返回负数，其绝对值为所需 token 数
    if (n_tokens < 0) n_tokens = -n_tokens;
    if (n_tokens == 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaModel::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaModel::build_prompt(const LlmRequest& request) {
    std::string prompt;
    if (!request.system_instruction.empty()) {
        prompt += "### System\n" + request.system_instruction + "\n\n";
    }
    if (!request.tools.empty()) {
        prompt += "### Tools\nTo call a tool reply with only "
                  "{\"function_call\": {\"name\": <tool>, \"args\": {...}}}\n";
        for (const auto& tool : request.tools) {
            Value decl = tool;
            prompt += decl.dump() + "\n";
        }
        prompt += "\n";
    }
    for (const auto& content : request.contents) {
        prompt += content.role == "model" ? "### Assistant\n" : "### User\n";
        for (const auto& part : content.parts) {
            if (part.text) {
                prompt += *part.text;
            } else if (part.function_call) {
                prompt += Value{{"function_call", Value{{"name", part.function_call->name},
                                                        {"args", part.function_call->args}}}}.dump();
            } else if (part.function_response) {
                prompt += "Tool " + part.function_response->name + " returned: " +
                          part.function_response->response.dump();
            }
        }
        prompt += "\n\n";
    }
    prompt += "### Assistant\n";
    return prompt;
}

Content LlamaModel::parse_model_output(const std::string& text) {
    // 1. Function call convention
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && text[first] == '{') {
        Value parsed = Value::parse(text.substr(first), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("function_call")) {
            const Value& call = parsed["function_call"];
            if (call.is_object() && call.contains("name") && call["name"].is_string()) {
                FunctionCall fc;
                fc.id = "call-" + new_uuid();
                fc.name = call["name"].get<std::string>();
                fc.args = call.value("args", Value::object());
                Content content;
                content.role = "model";
                content.parts.push_back(Part::from_function_call(std::move(fc)));
                return content;
            }
        }
    }
    // 2. Plain text
    return Content::model_text(text);
}

bool LlamaModel::generate_content(const LlmRequest& request, bool stream, const ResponseCallback& on_response) {
    if (!is_loaded()) {
        throw Error("Model not loaded");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Every request carries the full history, start from an empty context
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(build_prompt(request), true);
    if (tokens.empty()) {
        throw Error("Tokenization failed");
    }

    // Prepare batch
    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));

    // Decode prompt
    if (llama_decode(ctx_.get(), batch)) {
        throw Error("Prompt evaluation failed");
    }

    std::string response;
    bool keep_going = true;
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);

        if (llama_vocab_is_eog(llama_model_get_vocab(model_.get()), new_token)) {
            break;
        }

        std::string piece = detokenize(new_token);
        response += piece;

        if (stream && !piece.empty()) {
            LlmResponse fragment;
            fragment.content = Content::model_text(piece);
            fragment.partial = true;
            if (!on_response(fragment)) {
                keep_going = false;
                break;
            }
        }

        // Prepare next token
        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            break;
        }
    }

    // Reset sampler state for next call
    llama_sampler_reset(sampler_.get());

    if (!keep_going) {
        return false;
    }

    LlmResponse final_response;
    final_response.content = parse_model_output(response);
    return on_response(final_response);
}

bool LlamaModel::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

} // namespace agentrt
