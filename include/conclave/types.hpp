#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <tl/expected.hpp>

namespace conclave {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Transport failures (gateway calls)
 * - 300-399: Critique errors (parse / validation)
 * - 400-499: Synthesis errors
 * - 500-599: Storage errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    EmptyModelRoster = 101,
    DuplicateModelId = 102,
    InvalidTimeout = 103,
    MissingApiKey = 104,
    ConfigFileUnreadable = 105,
    ConfigParseFailed = 106,
    InvalidPrompt = 107,

    // Transport errors (200-299)
    TransportFailure = 200,
    RequestTimeout = 201,
    HttpError = 202,
    MalformedPayload = 203,
    EmptyResponse = 204,
    UnknownModel = 205,
    ModelLoadFailed = 206,
    InferenceFailed = 207,
    GatewayShutdown = 208,

    // Critique errors (300-399)
    CriticParseFailure = 300,
    CriticValidationFailure = 301,
    CriticUnavailable = 302,
    NoCritiqueInput = 303,

    // Synthesis errors (400-499)
    SynthesisFailure = 400,
    NoSynthesisInput = 401,

    // Storage errors (500-599)
    ArchiveOpenFailed = 500,
    ArchiveWriteFailed = 501,
    ArchiveReadFailed = 502,
    ArtifactWriteFailed = 503,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions. Critique errors keep the raw
 * critic text in `context`.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (raw output, HTTP body, paths)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }

    bool is_transport_failure() const {
        const int value = static_cast<int>(code);
        return value >= 200 && value < 300;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && context == other.context;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

namespace detail {

inline bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace detail

// ============================================================================
// Model Responses
// ============================================================================

/**
 * @brief Outcome of one gateway call for one model in one stage
 *
 * Exactly one ModelResponse exists per model per stage. A failed call is
 * recorded with `success == false` and the transport error, never omitted.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ModelResponse {
    std::string model_id;                         ///< Join key across all stages
    std::string text;                             ///< Response body (empty on failure)
    std::chrono::milliseconds elapsed{0};         ///< Wall time of the call
    bool success = false;                         ///< Whether the gateway returned text
    std::optional<Error> error;                   ///< Transport error of the call, if any
    bool carried_over = false;                    ///< Debate entry that reuses the initial answer

    static ModelResponse ok(std::string model_id, std::string text, std::chrono::milliseconds elapsed) {
        ModelResponse response;
        response.model_id = std::move(model_id);
        response.text = std::move(text);
        response.elapsed = elapsed;
        response.success = true;
        return response;
    }

    static ModelResponse failed(std::string model_id, Error error, std::chrono::milliseconds elapsed) {
        ModelResponse response;
        response.model_id = std::move(model_id);
        response.elapsed = elapsed;
        response.error = std::move(error);
        return response;
    }

    /// Succeeded with non-blank text.
    bool usable() const {
        return success && !detail::is_blank(text);
    }

    bool operator==(const ModelResponse& other) const {
        return model_id == other.model_id &&
               text == other.text &&
               elapsed == other.elapsed &&
               success == other.success &&
               error == other.error &&
               carried_over == other.carried_over;
    }

    bool operator!=(const ModelResponse& other) const {
        return !(*this == other);
    }
};

struct InitialStage {};
struct DebateStage {};

/**
 * @brief Ordered mapping model identifier -> ModelResponse for one stage
 *
 * Insertion order follows the configured roster. The stage tag makes initial
 * and post-debate sets distinct types so a component can only be handed the
 * set it is meant to consume.
 */
template<typename StageTag>
class ResponseSet {
public:
    using const_iterator = typename std::vector<ModelResponse>::const_iterator;

    /// @return false if a response for the same model already exists
    bool insert(ModelResponse response) {
        if (contains(response.model_id)) {
            return false;
        }
        responses_.push_back(std::move(response));
        return true;
    }

    const ModelResponse* find(const std::string& model_id) const {
        for (const auto& response : responses_) {
            if (response.model_id == model_id) {
                return &response;
            }
        }
        return nullptr;
    }

    bool contains(const std::string& model_id) const {
        return find(model_id) != nullptr;
    }

    std::vector<std::string> model_ids() const {
        std::vector<std::string> ids;
        ids.reserve(responses_.size());
        for (const auto& response : responses_) {
            ids.push_back(response.model_id);
        }
        return ids;
    }

    /// Responses that succeeded with non-blank text, in roster order.
    std::vector<ModelResponse> usable() const {
        std::vector<ModelResponse> out;
        for (const auto& response : responses_) {
            if (response.usable()) {
                out.push_back(response);
            }
        }
        return out;
    }

    size_t usable_count() const {
        return static_cast<size_t>(std::count_if(responses_.begin(), responses_.end(),
                                                 [](const ModelResponse& r) { return r.usable(); }));
    }

    size_t size() const { return responses_.size(); }
    bool empty() const { return responses_.empty(); }
    const_iterator begin() const { return responses_.begin(); }
    const_iterator end() const { return responses_.end(); }
    const std::vector<ModelResponse>& responses() const { return responses_; }

    bool operator==(const ResponseSet& other) const {
        return responses_ == other.responses_;
    }

private:
    std::vector<ModelResponse> responses_;
};

using InitialResponses = ResponseSet<InitialStage>;  ///< Output of the Initial Fetcher
using DebateResponses = ResponseSet<DebateStage>;    ///< Post-debate set, the only Synthesizer input

// ============================================================================
// Discrepancies
// ============================================================================

/**
 * @brief Converts a claim into a stable identifier
 *
 * Lowercase, punctuation removed, whitespace runs collapsed to '-',
 * truncated to 40 characters, no leading or trailing '-'.
 */
inline std::string make_claim_id(const std::string& claim) {
    std::string slug;
    bool pending_dash = false;
    for (unsigned char c : claim) {
        if (std::isspace(c)) {
            pending_dash = !slug.empty();
            continue;
        }
        if (!std::isalnum(c) && c != '_' && c != '-') {
            continue;
        }
        if (pending_dash) {
            slug += '-';
            pending_dash = false;
        }
        slug += static_cast<char>(std::tolower(c));
    }
    if (slug.size() > 40) {
        slug.resize(40);
    }
    const auto first = slug.find_first_not_of('-');
    if (first == std::string::npos) {
        return "";
    }
    const auto last = slug.find_last_not_of('-');
    return slug.substr(first, last - first + 1);
}

/**
 * @brief One claim and the models that did or did not assert it
 */
struct Discrepancy {
    std::string claim_id;                         ///< Stable slug of the claim
    std::string claim;                            ///< Claim text as reported by the critic
    std::vector<std::string> models_with_claim;   ///< Models whose initial answer asserted it
    std::vector<std::string> models_missing_claim;///< Models whose initial answer lacks or contradicts it
    std::optional<double> confidence;             ///< Critic confidence in [0, 1], if given

    bool asserted_by(const std::string& model_id) const {
        return std::find(models_with_claim.begin(), models_with_claim.end(), model_id) != models_with_claim.end();
    }

    bool missed_by(const std::string& model_id) const {
        return std::find(models_missing_claim.begin(), models_missing_claim.end(), model_id) != models_missing_claim.end();
    }

    bool operator==(const Discrepancy& other) const {
        return claim_id == other.claim_id &&
               claim == other.claim &&
               models_with_claim == other.models_with_claim &&
               models_missing_claim == other.models_missing_claim &&
               confidence == other.confidence;
    }

    bool operator!=(const Discrepancy& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Validated critic result for one run
 *
 * Derived only from initial-stage responses and never recomputed afterwards.
 */
struct DiscrepancySet {
    std::vector<Discrepancy> discrepancies;
    bool consensus_reached = true;   ///< True exactly when there are no discrepancies
    std::string raw_output;          ///< Critic text the set was parsed from

    size_t size() const { return discrepancies.size(); }
    bool empty() const { return discrepancies.empty(); }

    /// Claims listing @p model_id among the models that missed them.
    std::vector<std::string> missed_claims(const std::string& model_id) const {
        std::vector<std::string> claims;
        for (const auto& d : discrepancies) {
            if (d.missed_by(model_id)) {
                claims.push_back(d.claim);
            }
        }
        return claims;
    }

    /// Claims @p model_id asserted while more models did not.
    std::vector<std::string> minority_claims(const std::string& model_id) const {
        std::vector<std::string> claims;
        for (const auto& d : discrepancies) {
            if (d.asserted_by(model_id) && d.models_missing_claim.size() > d.models_with_claim.size()) {
                claims.push_back(d.claim);
            }
        }
        return claims;
    }

    // Equality ignores raw_output so fenced and unfenced inputs compare equal
    bool operator==(const DiscrepancySet& other) const {
        return discrepancies == other.discrepancies && consensus_reached == other.consensus_reached;
    }

    bool operator!=(const DiscrepancySet& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Pipeline Stages
// ============================================================================

/**
 * @brief Pipeline state machine
 *
 * Fetching -> Critiquing -> Debating -> Synthesizing -> Done.
 * Failed is reachable from Critiquing and Synthesizing.
 */
enum class Stage {
    Fetching,
    Critiquing,
    Debating,
    Synthesizing,
    Done,
    Failed
};

[[nodiscard]] inline const char* stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::Fetching: return "fetching";
        case Stage::Critiquing: return "critiquing";
        case Stage::Debating: return "debating";
        case Stage::Synthesizing: return "synthesizing";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief What the pipeline does when the critic stage fails
 */
enum class CriticFailurePolicy {
    Abort,                          ///< Run ends in Failed at Critiquing
    ContinueWithoutDiscrepancies    ///< Error is recorded, debate runs with an empty set
};

[[nodiscard]] inline const char* critic_policy_to_string(CriticFailurePolicy policy) {
    switch (policy) {
        case CriticFailurePolicy::Abort: return "abort";
        case CriticFailurePolicy::ContinueWithoutDiscrepancies: return "continue";
    }
    return "unknown";
}

struct PipelineRun;

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Complete configuration for a DebatePipeline
 *
 * Value type holding the model roster, the designated critic and synthesizer
 * models, and the per-call deadline. Must be validated via validate() before
 * use. Immutable after pipeline construction.
 *
 * @threadsafety Safe to copy and pass by value across threads (excluding callbacks)
 */
struct Config {
    // Models
    std::vector<std::string> models = {
        "google/gemini-2.5-flash-lite",
        "anthropic/claude-3-haiku",
        "openai/gpt-4o-mini",
    };                                                          ///< Debating models, in roster order (distinct, non-empty)
    std::string critic_model = "deepseek/deepseek-v3.2";        ///< Fast model extracting discrepancies
    std::string synthesizer_model = "deepseek/deepseek-v3.2";   ///< Strong model producing the final answer
    std::optional<std::string> agreement_model;                 ///< Enables agreement detection in the debate stage

    // Calls
    std::chrono::milliseconds call_timeout{30000};              ///< Hard deadline applied to every gateway call

    // Behaviour
    CriticFailurePolicy critic_failure_policy = CriticFailurePolicy::Abort;
    bool flag_minority_claims = false;                          ///< Also show models the claims they asserted against the majority

    // Callbacks
    using StageCallback = std::function<void(Stage, const PipelineRun&)>;
    std::optional<StageCallback> on_stage;                      ///< Invoked on every state transition (pipeline thread)

    // Validation
    Expected<void> validate() const {
        if (models.empty()) {
            return tl::unexpected(Error{ErrorCode::EmptyModelRoster, "At least one model is required"});
        }
        std::unordered_set<std::string> seen;
        for (const auto& model : models) {
            if (detail::is_blank(model)) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Model identifiers cannot be empty"});
            }
            if (!seen.insert(model).second) {
                return tl::unexpected(Error{ErrorCode::DuplicateModelId, "Model listed twice in roster", model});
            }
        }
        if (detail::is_blank(critic_model)) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Critic model cannot be empty"});
        }
        if (detail::is_blank(synthesizer_model)) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Synthesizer model cannot be empty"});
        }
        if (agreement_model.has_value() && detail::is_blank(*agreement_model)) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agreement model cannot be empty when set"});
        }
        if (call_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidTimeout, "call_timeout must be positive"});
        }
        return {};
    }

    // Equality for testing (excluding callbacks)
    bool operator==(const Config& other) const {
        return models == other.models &&
               critic_model == other.critic_model &&
               synthesizer_model == other.synthesizer_model &&
               agreement_model == other.agreement_model &&
               call_timeout == other.call_timeout &&
               critic_failure_policy == other.critic_failure_policy &&
               flag_minority_claims == other.flag_minority_claims;
    }

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }
};

} // namespace conclave
