#pragma once

#include "../gateway/IGateway.hpp"
#include "../log.hpp"
#include "critic_parser.hpp"
#include "prompts.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace conclave {
namespace engine {

/**
 * @brief Asks one designated model to extract claim-level discrepancies.
 *
 * Exactly one gateway call per analysis. The result is either a fully
 * validated DiscrepancySet or an Error; there is no partial result.
 */
class CriticAnalyzer {
public:
    CriticAnalyzer(std::shared_ptr<gateway::IGateway> gateway,
                   std::string critic_model,
                   std::chrono::milliseconds timeout)
        : gateway_(std::move(gateway))
        , critic_model_(std::move(critic_model))
        , timeout_(timeout) {}

    /**
     * @brief Analyze the usable initial responses.
     *
     * @param initial Initial-stage responses; failed entries are ignored
     * @return DiscrepancySet, or one of NoCritiqueInput (no call issued),
     *         CriticUnavailable, CriticParseFailure, CriticValidationFailure
     */
    Expected<DiscrepancySet> analyze(const InitialResponses& initial) const {
        const auto usable = initial.usable();
        if (usable.empty()) {
            return tl::unexpected(Error{ErrorCode::NoCritiqueInput, "No usable initial responses to critique"});
        }

        std::vector<std::string> responding;
        responding.reserve(usable.size());
        for (const auto& response : usable) {
            responding.push_back(response.model_id);
        }

        gateway::Completion completion;
        try {
            completion = gateway_->complete(critic_model_, prompts::critic(usable), timeout_).get();
        } catch (const std::exception& e) {
            return tl::unexpected(Error{ErrorCode::CriticUnavailable, "Critic call failed", e.what()});
        }
        if (!completion.ok()) {
            return tl::unexpected(Error{ErrorCode::CriticUnavailable,
                                        "Critic call to " + critic_model_ + " failed",
                                        completion.output.error().to_string()});
        }

        auto parsed = CriticParser::parse(*completion.output, responding);
        if (!parsed) {
            log::warn("critic", parsed.error().message + " | raw (first 500 chars): " +
                                    completion.output->substr(0, 500));
            return parsed;
        }
        log::info("critic", std::to_string(parsed->size()) + " discrepancies found");
        return parsed;
    }

    const std::string& model() const { return critic_model_; }

private:
    std::shared_ptr<gateway::IGateway> gateway_;
    std::string critic_model_;
    std::chrono::milliseconds timeout_;
};

} // namespace engine
} // namespace conclave
