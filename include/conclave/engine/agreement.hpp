#pragma once

#include "../gateway/IGateway.hpp"
#include "fan_out.hpp"
#include "prompts.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace conclave {
namespace engine {

/**
 * @brief Classifies debate answers that merely restate agreement.
 *
 * All classifications of a round run concurrently on the agreement model. A
 * failed classification counts as "not an agreement", so the debate answer
 * is kept.
 */
class AgreementDetector {
public:
    AgreementDetector(std::shared_ptr<gateway::IGateway> gateway,
                      std::string model,
                      std::chrono::milliseconds timeout)
        : gateway_(std::move(gateway))
        , model_(std::move(model))
        , timeout_(timeout) {}

    /// @return One flag per answer, true when the classifier replied "true"
    std::vector<bool> classify(const std::vector<std::string>& answers) const {
        std::vector<BatchCall> calls;
        calls.reserve(answers.size());
        for (const auto& answer : answers) {
            calls.push_back(BatchCall{model_, prompts::agreement(answer)});
        }

        std::vector<bool> flags;
        flags.reserve(answers.size());
        for (const auto& verdict : run_batch(*gateway_, calls, timeout_, "agreement")) {
            flags.push_back(verdict.success && is_true(verdict.text));
        }
        return flags;
    }

    static bool is_true(const std::string& verdict) {
        std::string normalized;
        for (unsigned char c : verdict) {
            if (!std::isspace(c) && c != '.' && c != '"') {
                normalized += static_cast<char>(std::tolower(c));
            }
        }
        return normalized == "true";
    }

    const std::string& model() const { return model_; }

private:
    std::shared_ptr<gateway::IGateway> gateway_;
    std::string model_;
    std::chrono::milliseconds timeout_;
};

} // namespace engine
} // namespace conclave
