#pragma once

#include "../types.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace conclave {
namespace engine {
namespace prompts {

namespace detail {

inline void append_bullets(std::ostringstream& out, const std::vector<std::string>& items) {
    for (const auto& item : items) {
        out << "- " << item << "\n";
    }
}

inline void append_answers(std::ostringstream& out, const std::vector<ModelResponse>& responses) {
    for (size_t i = 0; i < responses.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        out << "**" << responses[i].model_id << "**:\n" << responses[i].text << "\n";
    }
}

} // namespace detail

/**
 * @brief Prompt asking the critic for a claim-level comparison.
 *
 * @param responses Usable initial responses only
 */
inline std::string critic(const std::vector<ModelResponse>& responses) {
    std::ostringstream out;
    out << "You are a technical auditor comparing answers that " << responses.size()
        << " AI models gave to the same question.\n"
        << "Find MATERIAL, FACTUAL discrepancies between them: contradictions in facts, math or logic, "
           "code that would behave differently, or an omission that makes an answer wrong or unsafe.\n"
        << "Ignore style, tone, length, formatting, naming and harmless extra tips.\n\n"
        << "---\n\n";
    detail::append_answers(out, responses);
    out << "\n---\n\n"
        << "Model names available: [";
    for (size_t i = 0; i < responses.size(); ++i) {
        out << (i > 0 ? ", " : "") << "\"" << responses[i].model_id << "\"";
    }
    out << "]\n\n"
        << "Rules:\n"
        << "1. A discrepancy is a claim that at least one model makes and another model omits or contradicts.\n"
        << "2. Use only the model names listed above.\n"
        << "3. `models_missing_claim` can never be empty; a claim every model makes is not a discrepancy.\n"
        << "4. If there are no discrepancies, return an empty list and set `consensus_reached` to true.\n"
        << "5. `confidence` (0.0 to 1.0) is your certainty that the discrepancy is genuine and material.\n\n"
        << "Reply with a single raw JSON object and nothing else:\n"
        << "{\n"
        << "  \"consensus_reached\": false,\n"
        << "  \"discrepancies\": [\n"
        << "    {\n"
        << "      \"claim\": \"the specific fact or reasoning step in question\",\n"
        << "      \"models_with_claim\": [\"model-a\"],\n"
        << "      \"models_missing_claim\": [\"model-b\"],\n"
        << "      \"confidence\": 0.8\n"
        << "    }\n"
        << "  ]\n"
        << "}\n";
    return out.str();
}

/**
 * @brief Model-specific debate prompt.
 *
 * @param original_prompt User question
 * @param initial_answer The model's usable initial answer, or nullptr when it has none
 * @param missed Claims other models made that this model did not
 * @param contested Claims this model made that most models did not (may be empty)
 */
inline std::string debate(const std::string& original_prompt,
                          const std::string* initial_answer,
                          const std::vector<std::string>& missed,
                          const std::vector<std::string>& contested) {
    std::ostringstream out;
    out << "Original Question: " << original_prompt << "\n\n";
    if (initial_answer != nullptr) {
        out << "Your Initial Response:\n" << *initial_answer << "\n\n";
    } else {
        out << "Your initial response could not be retrieved. Answer the question from scratch.\n\n";
    }

    if (missed.empty() && contested.empty()) {
        out << "A parallel review found no significant discrepancies in your response. "
               "Review it once more and confirm or refine it if needed.";
        return out.str();
    }

    if (!missed.empty()) {
        out << "In a parallel review, other models raised the following points that you did not include:\n";
        detail::append_bullets(out, missed);
        out << "\n";
    }
    if (!contested.empty()) {
        out << "You made the following claims that most other models did not make:\n";
        detail::append_bullets(out, contested);
        out << "\n";
    }
    out << "Does this change your reasoning? If so, explain why. "
           "Re-evaluate your answer and provide an updated, complete response.";
    return out.str();
}

/**
 * @brief Synthesis prompt built from post-debate answers only.
 */
inline std::string synthesis(const std::string& original_prompt, const DebateResponses& responses) {
    std::ostringstream out;
    out << "You are an expert synthesizer producing the definitive answer to a question.\n\n"
        << "Original Question:\n" << original_prompt << "\n\n"
        << "Several AI models answered it, were shown the points they had missed, "
           "and then revised their answers. These are their final answers:\n\n";
    detail::append_answers(out, responses.responses());
    out << "\nCombine the most accurate, complete and well-reasoned points into one authoritative answer. "
           "Resolve contradictions instead of listing them, and do not mention the individual models.\n\n"
        << "Final answer:";
    return out.str();
}

/**
 * @brief Classifier prompt: does a debate answer add nothing new?
 */
inline std::string agreement(const std::string& debate_answer) {
    std::ostringstream out;
    out << "You are a text classifier. Decide whether the text below is a simple agreement: "
           "it only confirms an earlier answer and adds no new information or claims.\n\n"
        << "---\n\nText:\n" << debate_answer << "\n\n---\n\n"
        << "Reply with exactly \"true\" or \"false\".";
    return out.str();
}

} // namespace prompts
} // namespace engine
} // namespace conclave
