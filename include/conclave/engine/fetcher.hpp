#pragma once

#include "../gateway/IGateway.hpp"
#include "fan_out.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace conclave {
namespace engine {

/**
 * @brief Fans the user prompt out to every configured model.
 *
 * One gateway call per model, all in flight at once. A model that times out
 * or fails is recorded as a failed ModelResponse; the others are unaffected.
 */
class InitialFetcher {
public:
    InitialFetcher(std::shared_ptr<gateway::IGateway> gateway, std::chrono::milliseconds timeout)
        : gateway_(std::move(gateway))
        , timeout_(timeout) {}

    /**
     * @brief Query all models with the user prompt and wait for every answer.
     *
     * @param prompt User prompt, sent unchanged
     * @param models Distinct model identifiers (at least one)
     * @return Exactly one ModelResponse per model, in roster order, or
     *         EmptyModelRoster / DuplicateModelId before any call is made
     */
    Expected<InitialResponses> fetch(const std::string& prompt,
                                     const std::vector<std::string>& models) const {
        if (models.empty()) {
            return tl::unexpected(Error{ErrorCode::EmptyModelRoster, "No models to query"});
        }
        std::unordered_set<std::string> seen;
        std::vector<BatchCall> calls;
        calls.reserve(models.size());
        for (const auto& model : models) {
            if (!seen.insert(model).second) {
                return tl::unexpected(Error{ErrorCode::DuplicateModelId, "Model listed twice in roster", model});
            }
            calls.push_back(BatchCall{model, prompt});
        }

        InitialResponses responses;
        for (auto& response : run_batch(*gateway_, calls, timeout_, "fetch")) {
            responses.insert(std::move(response));
        }
        log::info("fetch", std::to_string(responses.usable_count()) + "/" +
                               std::to_string(responses.size()) + " initial responses usable");
        return responses;
    }

private:
    std::shared_ptr<gateway::IGateway> gateway_;
    std::chrono::milliseconds timeout_;
};

} // namespace engine
} // namespace conclave
