#pragma once

#include "../gateway/IGateway.hpp"
#include "../log.hpp"
#include "prompts.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace conclave {
namespace engine {

/** @brief Final answer of a run. */
struct Synthesis {
    std::string model_id;                    ///< Model that produced the answer
    std::string answer;                      ///< Final answer text
    std::chrono::milliseconds elapsed{0};    ///< Duration of the synthesis call

    bool operator==(const Synthesis& other) const {
        return model_id == other.model_id && answer == other.answer && elapsed == other.elapsed;
    }
};

/**
 * @brief Merges the post-debate answers into a single answer.
 *
 * Accepts only DebateResponses; initial responses never reach synthesis.
 * Any failure is fatal for the run.
 */
class Synthesizer {
public:
    Synthesizer(std::shared_ptr<gateway::IGateway> gateway,
                std::string model,
                std::chrono::milliseconds timeout)
        : gateway_(std::move(gateway))
        , model_(std::move(model))
        , timeout_(timeout) {}

    /**
     * @brief Produce the final answer.
     *
     * @param original_prompt User prompt of the run
     * @param responses Post-debate set
     * @return Synthesis, NoSynthesisInput (no call issued) or SynthesisFailure
     */
    Expected<Synthesis> synthesize(const std::string& original_prompt,
                                   const DebateResponses& responses) const {
        if (responses.empty()) {
            return tl::unexpected(Error{ErrorCode::NoSynthesisInput, "No post-debate responses to synthesize"});
        }

        gateway::Completion completion;
        try {
            completion = gateway_->complete(model_, prompts::synthesis(original_prompt, responses), timeout_).get();
        } catch (const std::exception& e) {
            return tl::unexpected(Error{ErrorCode::SynthesisFailure, "Synthesis call failed", e.what()});
        }
        if (!completion.ok()) {
            return tl::unexpected(Error{ErrorCode::SynthesisFailure,
                                        "Synthesis call to " + model_ + " failed",
                                        completion.output.error().to_string()});
        }
        if (conclave::detail::is_blank(*completion.output)) {
            return tl::unexpected(Error{ErrorCode::SynthesisFailure, "Synthesizer returned an empty answer", model_});
        }

        log::info("synthesis", "final answer from " + model_ + " (" +
                                   std::to_string(completion.elapsed.count()) + " ms)");
        return Synthesis{model_, std::move(*completion.output), completion.elapsed};
    }

    const std::string& model() const { return model_; }

private:
    std::shared_ptr<gateway::IGateway> gateway_;
    std::string model_;
    std::chrono::milliseconds timeout_;
};

} // namespace engine
} // namespace conclave
