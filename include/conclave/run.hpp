#pragma once

#include "types.hpp"
#include "engine/debate.hpp"
#include "engine/synthesizer.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace conclave {

/**
 * @brief Wall time spent in each stage of a run
 */
struct StageTimings {
    std::chrono::milliseconds fetch{0};
    std::chrono::milliseconds critique{0};
    std::chrono::milliseconds debate{0};
    std::chrono::milliseconds synthesis{0};
    std::chrono::milliseconds total{0};
};

/**
 * @brief Complete record of one pipeline execution
 *
 * Filled stage by stage; fields of stages that never ran stay empty. The
 * record is the only output of a run and is never shared between runs.
 */
struct PipelineRun {
    std::string prompt;                                   ///< User prompt
    std::chrono::system_clock::time_point started_at;     ///< When the run began
    Stage stage = Stage::Fetching;                        ///< Current or terminal stage
    std::optional<Stage> failed_at;                       ///< Stage that failed (stage == Failed)
    std::optional<Error> error;                           ///< Fatal error (stage == Failed)

    InitialResponses initial;                             ///< Fetch stage output
    std::optional<DiscrepancySet> discrepancies;          ///< Critique stage output
    std::optional<Error> critique_error;                  ///< Critic error tolerated by policy
    std::vector<engine::DebateBrief> debate_briefs;       ///< Per-model debate plan
    std::vector<ModelResponse> debate_attempts;           ///< Raw debate call outcomes
    std::vector<std::string> agreement_substitutions;     ///< Models whose answer was a simple agreement
    std::optional<DebateResponses> debate;                ///< Post-debate set (synthesis input)
    std::optional<engine::Synthesis> synthesis;           ///< Final answer

    StageTimings timings;

    bool succeeded() const { return stage == Stage::Done; }

    /// @return The final answer, or nullptr if the run did not reach Done
    const std::string* final_answer() const {
        return synthesis.has_value() ? &synthesis->answer : nullptr;
    }
};

} // namespace conclave
