#include "conclave/gateway/llama_gateway.hpp"
#include "conclave/log.hpp"
#include <llama.h>
#include <cstdint>
#include <ctime>
#include <vector>

namespace conclave {
namespace gateway {

static std::once_flag g_init_flag;

using Clock = std::chrono::steady_clock;

/**
 * @brief One loaded GGUF model with its own context and sampler
 */
struct LlamaGateway::LoadedModel {
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    llama_sampler* sampler = nullptr;
    const llama_vocab* vocab = nullptr;   // Owned by model
    const char* tmpl = nullptr;           // Owned by model; nullptr falls back to ChatML
    int context_size = 0;
    std::timed_mutex busy;                // Guards loading and generation for this model

    ~LoadedModel() { release(); }

    bool loaded() const { return model != nullptr; }

    void release() {
        if (sampler != nullptr) {
            llama_sampler_free(sampler);
            sampler = nullptr;
        }
        if (ctx != nullptr) {
            llama_free(ctx);
            ctx = nullptr;
        }
        if (model != nullptr) {
            llama_model_free(model);
            model = nullptr;
        }
        vocab = nullptr;
        tmpl = nullptr;
        context_size = 0;
    }
};

namespace {

llama_sampler* create_sampler_chain(const SamplingParams& sp) {
    auto chain_params = llama_sampler_chain_default_params();
    llama_sampler* chain = llama_sampler_chain_init(chain_params);
    if (chain == nullptr) {
        return nullptr;
    }

    if (sp.repeat_penalty != 1.0f) {
        if (auto* penalties = llama_sampler_init_penalties(sp.repeat_last_n, sp.repeat_penalty, 0.0f, 0.0f)) {
            llama_sampler_chain_add(chain, penalties);
        }
    }
    if (sp.top_k > 0) {
        if (auto* top_k = llama_sampler_init_top_k(sp.top_k)) {
            llama_sampler_chain_add(chain, top_k);
        }
    }
    if (sp.top_p < 1.0f) {
        if (auto* top_p = llama_sampler_init_top_p(sp.top_p, 1)) {
            llama_sampler_chain_add(chain, top_p);
        }
    }
    if (sp.temperature > 0.0f) {
        if (auto* temp = llama_sampler_init_temp(sp.temperature)) {
            llama_sampler_chain_add(chain, temp);
        }
    }

    const uint32_t seed = (sp.seed < 0) ? static_cast<uint32_t>(time(nullptr)) : static_cast<uint32_t>(sp.seed);
    if (auto* dist = llama_sampler_init_dist(seed)) {
        llama_sampler_chain_add(chain, dist);
    } else if (auto* greedy = llama_sampler_init_greedy()) {
        llama_sampler_chain_add(chain, greedy);
    }
    return chain;
}

Error timeout_error(const std::string& model_id) {
    return Error{ErrorCode::RequestTimeout, "Local generation exceeded its deadline", model_id};
}

} // namespace

void LlamaGateway::initialize_global() {
    std::call_once(g_init_flag, []() {
        llama_backend_init();
        ggml_backend_load_all();
    });
}

void LlamaGateway::shutdown_global() {
    llama_backend_free();
}

Expected<std::shared_ptr<LlamaGateway>> LlamaGateway::create(const LlamaGatewayConfig& config) {
    if (auto result = config.validate(); !result) {
        return tl::unexpected(result.error());
    }
    initialize_global();

    // Keep llama.cpp/ggml chatter out of the debate output
    llama_log_set([](enum ggml_log_level level, const char* text, void*) {
        if (level >= GGML_LOG_LEVEL_WARN) {
            log::warn("llama", text);
        }
    }, nullptr);

    return std::shared_ptr<LlamaGateway>(new LlamaGateway(config));
}

LlamaGateway::LlamaGateway(LlamaGatewayConfig config)
    : config_(std::move(config))
{}

LlamaGateway::~LlamaGateway() = default;

std::future<Completion> LlamaGateway::complete(
    const std::string& model_id,
    const std::string& prompt,
    std::chrono::milliseconds timeout
) {
    const auto started = Clock::now();
    const Deadline deadline = started + timeout;
    return std::async(std::launch::async, [self = shared_from_this(), model_id, prompt, started, deadline]() {
        auto output = self->run_call(model_id, prompt, deadline);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        return Completion{std::move(output), elapsed};
    });
}

Expected<std::string> LlamaGateway::run_call(const std::string& model_id,
                                              const std::string& prompt,
                                              Deadline deadline) {
    auto path = config_.model_paths.find(model_id);
    if (path == config_.model_paths.end()) {
        return tl::unexpected(Error{ErrorCode::UnknownModel, "No GGUF file configured for model", model_id});
    }

    LoadedModel& entry = slot(model_id);
    std::unique_lock<std::timed_mutex> lock(entry.busy, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return tl::unexpected(timeout_error(model_id));
    }

    if (!entry.loaded()) {
        if (Clock::now() >= deadline) {
            return tl::unexpected(timeout_error(model_id));
        }
        if (auto result = load(entry, model_id, path->second); !result) {
            entry.release();
            return tl::unexpected(result.error());
        }
        // Loading cannot be interrupted; the model stays cached for later calls
        if (Clock::now() >= deadline) {
            return tl::unexpected(timeout_error(model_id));
        }
    }
    return generate(entry, prompt, deadline);
}

LlamaGateway::LoadedModel& LlamaGateway::slot(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(models_mutex_);
    auto& entry = models_[model_id];
    if (!entry) {
        entry = std::make_unique<LoadedModel>();
    }
    return *entry;
}

Expected<void> LlamaGateway::load(LoadedModel& entry, const std::string& model_id, const std::string& path) const {
    log::info("llama", "loading " + model_id + " from " + path);

    auto model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.n_gpu_layers;
    model_params.use_mmap = config_.use_mmap;
    entry.model = llama_model_load_from_file(path.c_str(), model_params);
    if (entry.model == nullptr) {
        return tl::unexpected(Error{ErrorCode::ModelLoadFailed, "Failed to load model from path: " + path, model_id});
    }

    auto ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(config_.context_size);
    ctx_params.n_batch = 512;
    ctx_params.n_ubatch = 512;
    entry.ctx = llama_init_from_model(entry.model, ctx_params);
    if (entry.ctx == nullptr) {
        return tl::unexpected(Error{ErrorCode::ModelLoadFailed, "Failed to create llama context", model_id});
    }
    entry.context_size = static_cast<int>(llama_n_ctx(entry.ctx));

    entry.vocab = llama_model_get_vocab(entry.model);
    entry.sampler = create_sampler_chain(config_.sampling);
    if (entry.vocab == nullptr || entry.sampler == nullptr) {
        return tl::unexpected(Error{ErrorCode::ModelLoadFailed, "Failed to set up vocabulary or sampler", model_id});
    }
    entry.tmpl = llama_model_chat_template(entry.model, nullptr);
    return {};
}

Expected<std::string> LlamaGateway::generate(LoadedModel& m, const std::string& prompt, Deadline deadline) const {
    // Every call is an independent single-turn conversation
    llama_memory_clear(llama_get_memory(m.ctx), false);
    llama_sampler_reset(m.sampler);

    llama_chat_message message{"user", prompt.c_str()};
    std::vector<char> formatted(prompt.size() * 2 + 256);
    int len = llama_chat_apply_template(m.tmpl, &message, 1, true, formatted.data(), static_cast<int32_t>(formatted.size()));
    if (len > static_cast<int>(formatted.size())) {
        formatted.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(m.tmpl, &message, 1, true, formatted.data(), static_cast<int32_t>(formatted.size()));
    }
    if (len < 0) {
        return tl::unexpected(Error{ErrorCode::InferenceFailed, "llama_chat_apply_template failed"});
    }
    const std::string text(formatted.data(), static_cast<size_t>(len));

    const int32_t required = llama_tokenize(m.vocab, text.c_str(), static_cast<int32_t>(text.size()), nullptr, 0, true, true);
    if (required == INT32_MIN) {
        return tl::unexpected(Error{ErrorCode::InferenceFailed, "Tokenization overflow (input too large)"});
    }
    std::vector<llama_token> tokens(static_cast<size_t>(required < 0 ? -required : required));
    if (llama_tokenize(m.vocab, text.c_str(), static_cast<int32_t>(text.size()),
                       tokens.data(), static_cast<int32_t>(tokens.size()), true, true) < 0) {
        return tl::unexpected(Error{ErrorCode::InferenceFailed, "Tokenization failed"});
    }
    if (static_cast<int>(tokens.size()) >= m.context_size) {
        return tl::unexpected(Error{ErrorCode::InferenceFailed, "Prompt exceeds context size",
                                    "prompt_tokens=" + std::to_string(tokens.size()) +
                                    " context_size=" + std::to_string(m.context_size)});
    }

    std::string generated;
    generated.reserve(static_cast<size_t>(config_.max_tokens) * 8);

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    llama_token next;
    for (int produced = 0; produced < config_.max_tokens; ++produced) {
        if (Clock::now() >= deadline) {
            return tl::unexpected(Error{ErrorCode::RequestTimeout, "Local generation exceeded its deadline"});
        }

        const int used = llama_memory_seq_pos_max(llama_get_memory(m.ctx), 0) + 1;
        if (used + batch.n_tokens > m.context_size) {
            break;
        }
        if (llama_decode(m.ctx, batch) != 0) {
            return tl::unexpected(Error{ErrorCode::InferenceFailed, "Failed to decode batch"});
        }

        next = llama_sampler_sample(m.sampler, m.ctx, -1);
        if (llama_vocab_is_eog(m.vocab, next)) {
            break;
        }

        char piece[256];
        const int n = llama_token_to_piece(m.vocab, next, piece, sizeof(piece), 0, true);
        if (n < 0) {
            return tl::unexpected(Error{ErrorCode::InferenceFailed, "Failed to convert token to piece"});
        }
        generated.append(piece, static_cast<size_t>(n));

        batch = llama_batch_get_one(&next, 1);
    }

    if (conclave::detail::is_blank(generated)) {
        return tl::unexpected(Error{ErrorCode::EmptyResponse, "Model produced no text"});
    }
    return generated;
}

} // namespace gateway
} // namespace conclave
