#pragma once

#include "IGateway.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace conclave {
namespace gateway {

/**
 * @brief Sampling parameters controlling local model output randomness
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct SamplingParams {
    float temperature = 0.7f;        ///< Sampling temperature (0.0 = deterministic, higher = more random)
    float top_p = 0.9f;              ///< Nucleus sampling threshold (0.0-1.0)
    int top_k = 40;                  ///< Top-K sampling limit (0 = disabled)
    float repeat_penalty = 1.1f;     ///< Penalty for repeating tokens (1.0 = no penalty)
    int repeat_last_n = 64;          ///< Number of tokens to consider for repeat penalty
    int seed = -1;                   ///< Random seed (-1 = random seed per request)

    bool operator==(const SamplingParams& other) const {
        return temperature == other.temperature &&
               top_p == other.top_p &&
               top_k == other.top_k &&
               repeat_penalty == other.repeat_penalty &&
               repeat_last_n == other.repeat_last_n &&
               seed == other.seed;
    }
};

/**
 * @brief Local GGUF models served through llama.cpp
 *
 * Each model identifier used in the pipeline configuration maps to a GGUF
 * file. Models are loaded on first use and kept for the gateway's lifetime.
 */
struct LlamaGatewayConfig {
    std::map<std::string, std::string> model_paths;   ///< Model identifier -> GGUF path
    int context_size = 8192;                          ///< Context window per loaded model (> 0)
    int n_gpu_layers = -1;                            ///< GPU layers to offload (-1 = all, 0 = CPU only)
    bool use_mmap = true;                             ///< Memory-map model files
    int max_tokens = 1024;                            ///< Generation limit per call (> 0)
    SamplingParams sampling;

    Expected<void> validate() const {
        if (model_paths.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "No local models configured"});
        }
        for (const auto& entry : model_paths) {
            if (entry.second.empty()) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Model path cannot be empty", entry.first});
            }
        }
        if (context_size <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "context_size must be positive"});
        }
        if (max_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_tokens must be positive"});
        }
        return {};
    }

    bool operator==(const LlamaGatewayConfig& other) const {
        return model_paths == other.model_paths &&
               context_size == other.context_size &&
               n_gpu_layers == other.n_gpu_layers &&
               use_mmap == other.use_mmap &&
               max_tokens == other.max_tokens &&
               sampling == other.sampling;
    }
};

/**
 * @brief IGateway running local models with llama.cpp.
 *
 * Each call runs on its own task. Calls to the same model are serialized
 * (one llama_context per model); calls to different models run in parallel,
 * including while another model is still loading. The deadline covers
 * waiting for the model, loading it and generation, and is checked after
 * every decoded token.
 */
class LlamaGateway : public IGateway, public std::enable_shared_from_this<LlamaGateway> {
public:
    static Expected<std::shared_ptr<LlamaGateway>> create(const LlamaGatewayConfig& config);

    ~LlamaGateway() override;

    LlamaGateway(const LlamaGateway&) = delete;
    LlamaGateway& operator=(const LlamaGateway&) = delete;

    std::future<Completion> complete(
        const std::string& model_id,
        const std::string& prompt,
        std::chrono::milliseconds timeout
    ) override;

    /// Process-wide llama.cpp initialization (idempotent).
    static void initialize_global();

    /// Process-wide llama.cpp teardown; call once at exit.
    static void shutdown_global();

private:
    struct LoadedModel;
    using Deadline = std::chrono::steady_clock::time_point;

    explicit LlamaGateway(LlamaGatewayConfig config);

    Expected<std::string> run_call(const std::string& model_id, const std::string& prompt, Deadline deadline);
    LoadedModel& slot(const std::string& model_id);
    Expected<void> load(LoadedModel& entry, const std::string& model_id, const std::string& path) const;
    Expected<std::string> generate(LoadedModel& model, const std::string& prompt, Deadline deadline) const;

    LlamaGatewayConfig config_;
    std::mutex models_mutex_;
    std::map<std::string, std::unique_ptr<LoadedModel>> models_;
};

} // namespace gateway
} // namespace conclave
