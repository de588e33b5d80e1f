#pragma once

#include "types.hpp"
#include "run.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace conclave {

// ============================================================================
// JSON serialization (found by nlohmann via ADL)
// ============================================================================

inline void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"code", static_cast<int>(error.code)},
        {"message", error.message},
        {"context", error.context.has_value() ? nlohmann::json(*error.context) : nlohmann::json(nullptr)}
    };
}

inline void to_json(nlohmann::json& j, const ModelResponse& response) {
    j = nlohmann::json{
        {"model_id", response.model_id},
        {"success", response.success},
        {"text", response.text},
        {"elapsed_ms", response.elapsed.count()},
        {"carried_over", response.carried_over},
        {"error", response.error.has_value() ? nlohmann::json(*response.error) : nlohmann::json(nullptr)}
    };
}

inline void to_json(nlohmann::json& j, const Discrepancy& d) {
    j = nlohmann::json{
        {"claim_id", d.claim_id},
        {"claim", d.claim},
        {"models_with_claim", d.models_with_claim},
        {"models_missing_claim", d.models_missing_claim},
        {"confidence", d.confidence.has_value() ? nlohmann::json(*d.confidence) : nlohmann::json(nullptr)}
    };
}

template<typename StageTag>
void to_json(nlohmann::json& j, const ResponseSet<StageTag>& responses) {
    j = nlohmann::json::array();
    for (const auto& response : responses) {
        j.push_back(response);
    }
}

namespace engine {

inline void to_json(nlohmann::json& j, const DebateBrief& brief) {
    j = nlohmann::json{
        {"model_id", brief.model_id},
        {"missed_claims", brief.missed_claims},
        {"contested_claims", brief.contested_claims},
        {"has_initial_answer", brief.has_initial_answer}
    };
}

inline void to_json(nlohmann::json& j, const Synthesis& synthesis) {
    j = nlohmann::json{
        {"model_id", synthesis.model_id},
        {"answer", synthesis.answer},
        {"elapsed_ms", synthesis.elapsed.count()}
    };
}

} // namespace engine

/**
 * @brief UTC ISO-8601 timestamp with second precision ("2025-01-31T12:00:00Z")
 */
inline std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

/**
 * @brief Serialize a run into the artifact document
 *
 * Sections of stages that never ran are null.
 */
inline nlohmann::json run_to_json(const PipelineRun& run) {
    nlohmann::json j;
    j["metadata"] = {
        {"prompt", run.prompt},
        {"started_at", format_timestamp(run.started_at)},
        {"total_ms", run.timings.total.count()}
    };
    j["stage"] = stage_to_string(run.stage);
    j["failed_at"] = run.failed_at.has_value() ? nlohmann::json(stage_to_string(*run.failed_at)) : nlohmann::json(nullptr);
    j["error"] = run.error.has_value() ? nlohmann::json(*run.error) : nlohmann::json(nullptr);
    j["timings"] = {
        {"fetch_ms", run.timings.fetch.count()},
        {"critique_ms", run.timings.critique.count()},
        {"debate_ms", run.timings.debate.count()},
        {"synthesis_ms", run.timings.synthesis.count()},
        {"total_ms", run.timings.total.count()}
    };
    j["initial_responses"] = run.initial;

    if (run.discrepancies.has_value()) {
        j["critic"] = {
            {"consensus_reached", run.discrepancies->consensus_reached},
            {"discrepancies", run.discrepancies->discrepancies},
            {"raw_output", run.discrepancies->raw_output},
            {"error", run.critique_error.has_value() ? nlohmann::json(*run.critique_error) : nlohmann::json(nullptr)}
        };
    } else {
        j["critic"] = nullptr;
    }

    if (run.debate.has_value()) {
        j["debate"] = {
            {"briefs", run.debate_briefs},
            {"attempts", run.debate_attempts},
            {"responses", *run.debate},
            {"agreement_substitutions", run.agreement_substitutions}
        };
    } else {
        j["debate"] = nullptr;
    }

    j["synthesis"] = run.synthesis.has_value() ? nlohmann::json(*run.synthesis) : nlohmann::json(nullptr);
    return j;
}

/**
 * @brief Serialize a run to text
 *
 * Model output may end mid-character (truncated bodies, token limits), so
 * invalid UTF-8 is replaced with U+FFFD instead of throwing.
 */
inline std::string dump_run(const PipelineRun& run, int indent = -1) {
    return run_to_json(run).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

/**
 * @brief Write the run artifact as pretty-printed JSON
 *
 * @return Expected<void> or ArtifactWriteFailed
 */
inline Expected<void> write_run_artifact(const PipelineRun& run, const std::string& path) {
    std::string document;
    try {
        document = dump_run(run, 2);
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::ArtifactWriteFailed, std::string("Cannot serialize run: ") + e.what(), path});
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return tl::unexpected(Error{ErrorCode::ArtifactWriteFailed, "Cannot open artifact file", path});
    }
    out << document << '\n';
    if (!out) {
        return tl::unexpected(Error{ErrorCode::ArtifactWriteFailed, "Failed writing artifact file", path});
    }
    return {};
}

} // namespace conclave
