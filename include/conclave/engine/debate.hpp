#pragma once

#include "../gateway/IGateway.hpp"
#include "../log.hpp"
#include "agreement.hpp"
#include "fan_out.hpp"
#include "prompts.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conclave {
namespace engine {

/**
 * @brief What one model is confronted with in the debate round
 */
struct DebateBrief {
    std::string model_id;
    std::vector<std::string> missed_claims;      ///< Claims others made that this model did not
    std::vector<std::string> contested_claims;   ///< Claims this model made against the majority (opt-in)
    bool has_initial_answer = false;             ///< Whether a usable initial answer was quoted back
    std::string prompt;                          ///< Exact prompt sent to the model

    bool operator==(const DebateBrief& other) const {
        return model_id == other.model_id &&
               missed_claims == other.missed_claims &&
               contested_claims == other.contested_claims &&
               has_initial_answer == other.has_initial_answer &&
               prompt == other.prompt;
    }
};

/**
 * @brief Everything the debate stage produced
 */
struct DebateRound {
    std::vector<DebateBrief> briefs;                  ///< One per model, roster order
    std::vector<ModelResponse> attempts;              ///< Raw debate call outcome, one per model
    DebateResponses responses;                        ///< Post-debate set handed to synthesis
    std::vector<std::string> agreement_substitutions; ///< Models whose answer was judged a simple agreement
};

struct DebateOptions {
    bool flag_minority_claims = false;
    std::optional<std::string> agreement_model;
};

/**
 * @brief Re-prompts every model with the claims it missed and collects revisions.
 *
 * Every model of the initial mapping is re-queried, including models whose
 * initial call failed. When a debate call fails, the model's usable initial
 * answer stands in for it; a model with neither is left out of the
 * post-debate set.
 */
class DebateOrchestrator {
public:
    DebateOrchestrator(std::shared_ptr<gateway::IGateway> gateway,
                       std::chrono::milliseconds timeout,
                       DebateOptions options = {})
        : gateway_(std::move(gateway))
        , timeout_(timeout)
        , options_(std::move(options)) {}

    /**
     * @brief Build the per-model briefs without issuing any call.
     */
    std::vector<DebateBrief> plan(const std::string& original_prompt,
                                  const InitialResponses& initial,
                                  const DiscrepancySet& discrepancies) const {
        std::vector<DebateBrief> briefs;
        briefs.reserve(initial.size());
        for (const auto& response : initial) {
            DebateBrief brief;
            brief.model_id = response.model_id;
            brief.missed_claims = discrepancies.missed_claims(response.model_id);
            if (options_.flag_minority_claims) {
                brief.contested_claims = discrepancies.minority_claims(response.model_id);
            }
            brief.has_initial_answer = response.usable();
            brief.prompt = prompts::debate(original_prompt,
                                           brief.has_initial_answer ? &response.text : nullptr,
                                           brief.missed_claims,
                                           brief.contested_claims);
            briefs.push_back(std::move(brief));
        }
        return briefs;
    }

    /**
     * @brief Run the debate round.
     *
     * @param original_prompt User prompt of the run
     * @param initial Initial-stage responses (defines the set of models)
     * @param discrepancies Critic result computed from @p initial
     * @return Briefs, raw attempts and the post-debate set
     */
    DebateRound run(const std::string& original_prompt,
                    const InitialResponses& initial,
                    const DiscrepancySet& discrepancies) const {
        DebateRound round;
        round.briefs = plan(original_prompt, initial, discrepancies);

        std::vector<BatchCall> calls;
        calls.reserve(round.briefs.size());
        for (const auto& brief : round.briefs) {
            calls.push_back(BatchCall{brief.model_id, brief.prompt});
        }
        round.attempts = run_batch(*gateway_, calls, timeout_, "debate");

        std::vector<ModelResponse> survivors;
        survivors.reserve(round.attempts.size());
        for (const auto& attempt : round.attempts) {
            const ModelResponse* first = initial.find(attempt.model_id);
            if (attempt.usable()) {
                survivors.push_back(attempt);
            } else if (first != nullptr && first->usable()) {
                ModelResponse fallback = carry_over(*first, attempt.elapsed);
                fallback.error = attempt.error.has_value()
                    ? attempt.error
                    : std::optional<Error>(Error{ErrorCode::EmptyResponse, "Debate answer was blank"});
                log::warn("debate", attempt.model_id + " keeps its initial answer");
                survivors.push_back(std::move(fallback));
            } else {
                log::warn("debate", attempt.model_id + " has no usable answer and is dropped");
            }
        }

        if (options_.agreement_model.has_value()) {
            substitute_agreements(initial, survivors, round.agreement_substitutions);
        }

        for (auto& survivor : survivors) {
            round.responses.insert(std::move(survivor));
        }
        return round;
    }

private:
    static ModelResponse carry_over(const ModelResponse& initial, std::chrono::milliseconds elapsed) {
        ModelResponse response = ModelResponse::ok(initial.model_id, initial.text, elapsed);
        response.carried_over = true;
        return response;
    }

    // Answers that only restate agreement are replaced by the initial answer
    void substitute_agreements(const InitialResponses& initial,
                               std::vector<ModelResponse>& survivors,
                               std::vector<std::string>& substituted) const {
        std::vector<size_t> candidates;
        std::vector<std::string> answers;
        for (size_t i = 0; i < survivors.size(); ++i) {
            const ModelResponse* first = initial.find(survivors[i].model_id);
            if (!survivors[i].carried_over && first != nullptr && first->usable()) {
                candidates.push_back(i);
                answers.push_back(survivors[i].text);
            }
        }
        if (candidates.empty()) {
            return;
        }

        AgreementDetector detector(gateway_, *options_.agreement_model, timeout_);
        const auto flags = detector.classify(answers);
        for (size_t k = 0; k < candidates.size(); ++k) {
            if (!flags[k]) {
                continue;
            }
            auto& survivor = survivors[candidates[k]];
            survivor = carry_over(*initial.find(survivor.model_id), survivor.elapsed);
            substituted.push_back(survivor.model_id);
            log::info("debate", survivor.model_id + " agreed with itself; initial answer kept");
        }
    }

    std::shared_ptr<gateway::IGateway> gateway_;
    std::chrono::milliseconds timeout_;
    DebateOptions options_;
};

} // namespace engine
} // namespace conclave
