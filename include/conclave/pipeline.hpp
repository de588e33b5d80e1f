#pragma once

#include "types.hpp"
#include "log.hpp"
#include "run.hpp"
#include "gateway/IGateway.hpp"
#include "engine/fetcher.hpp"
#include "engine/critic.hpp"
#include "engine/debate.hpp"
#include "engine/synthesizer.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace conclave {

/**
 * @brief Runs the four-stage debate for a prompt
 *
 * Fetching -> Critiquing -> Debating -> Synthesizing -> Done. Each stage
 * starts only after every call of the previous stage has resolved. Fetching
 * and Debating tolerate per-model failures; a critic failure ends the run
 * under CriticFailurePolicy::Abort, and a synthesis failure always does.
 *
 * Example Usage:
 * @code
 * Config config;
 * config.models = {"openai/gpt-4o-mini", "anthropic/claude-3-haiku"};
 *
 * auto gateway = gateway::OpenRouterGateway::create(openrouter_config);
 * auto pipeline = DebatePipeline::create(config, *gateway);
 * if (!pipeline) {
 *     std::cerr << pipeline.error().to_string() << std::endl;
 *     return 1;
 * }
 *
 * auto run = (*pipeline)->run("Why is the sky blue?");
 * if (run && run->succeeded()) {
 *     std::cout << *run->final_answer() << std::endl;
 * }
 * @endcode
 *
 * @threadsafety run() may be called concurrently; runs share nothing but the gateway
 */
class DebatePipeline {
public:
    /**
     * @brief Factory method to create a pipeline
     *
     * @param config Pipeline configuration (validated here)
     * @param gateway Gateway used for every model call
     * @return Expected<std::unique_ptr<DebatePipeline>> Pipeline or configuration error
     */
    static Expected<std::unique_ptr<DebatePipeline>> create(
        const Config& config,
        std::shared_ptr<gateway::IGateway> gateway
    ) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (!gateway) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Gateway is required"});
        }
        return std::unique_ptr<DebatePipeline>(new DebatePipeline(config, std::move(gateway)));
    }

    DebatePipeline(const DebatePipeline&) = delete;
    DebatePipeline& operator=(const DebatePipeline&) = delete;

    /**
     * @brief Execute one full run
     *
     * Stage failures do not surface as errors here; they are recorded in the
     * returned PipelineRun (stage == Failed, failed_at, error).
     *
     * @param prompt User prompt
     * @return PipelineRun, or InvalidPrompt for a blank prompt
     */
    Expected<PipelineRun> run(const std::string& prompt) const {
        if (detail::is_blank(prompt)) {
            return tl::unexpected(Error{ErrorCode::InvalidPrompt, "Prompt cannot be empty"});
        }

        PipelineRun record;
        record.prompt = prompt;
        record.started_at = std::chrono::system_clock::now();
        const auto run_start = Clock::now();

        // Fetching
        enter(record, Stage::Fetching);
        auto stage_start = Clock::now();
        auto initial = fetcher_.fetch(prompt, config_.models);
        record.timings.fetch = since(stage_start);
        if (!initial) {
            // Roster was validated in create(); reaching here means a broken invariant
            fail(record, Stage::Fetching, initial.error(), run_start);
            return record;
        }
        record.initial = std::move(*initial);

        // Critiquing
        enter(record, Stage::Critiquing);
        stage_start = Clock::now();
        auto discrepancies = critic_.analyze(record.initial);
        record.timings.critique = since(stage_start);
        if (!discrepancies) {
            if (config_.critic_failure_policy == CriticFailurePolicy::Abort) {
                fail(record, Stage::Critiquing, discrepancies.error(), run_start);
                return record;
            }
            log::warn("pipeline", "critic failed, continuing without discrepancies: " +
                                      discrepancies.error().to_string());
            record.critique_error = discrepancies.error();
            record.discrepancies = DiscrepancySet{};
        } else {
            record.discrepancies = std::move(*discrepancies);
        }

        // Debating
        enter(record, Stage::Debating);
        stage_start = Clock::now();
        auto round = debate_.run(prompt, record.initial, *record.discrepancies);
        record.timings.debate = since(stage_start);
        record.debate_briefs = std::move(round.briefs);
        record.debate_attempts = std::move(round.attempts);
        record.agreement_substitutions = std::move(round.agreement_substitutions);
        record.debate = std::move(round.responses);

        // Synthesizing
        enter(record, Stage::Synthesizing);
        stage_start = Clock::now();
        auto synthesis = synthesizer_.synthesize(prompt, *record.debate);
        record.timings.synthesis = since(stage_start);
        if (!synthesis) {
            fail(record, Stage::Synthesizing, synthesis.error(), run_start);
            return record;
        }
        record.synthesis = std::move(*synthesis);

        record.timings.total = since(run_start);
        enter(record, Stage::Done);
        return record;
    }

    /**
     * @brief Execute a run on a separate thread
     */
    std::future<Expected<PipelineRun>> run_async(std::string prompt) const {
        return std::async(std::launch::async, [this, prompt = std::move(prompt)]() {
            return run(prompt);
        });
    }

private:
    using Clock = std::chrono::steady_clock;

    DebatePipeline(const Config& config, std::shared_ptr<gateway::IGateway> gateway)
        : config_(config)
        , gateway_(std::move(gateway))
        , fetcher_(gateway_, config.call_timeout)
        , critic_(gateway_, config.critic_model, config.call_timeout)
        , debate_(gateway_, config.call_timeout,
                  engine::DebateOptions{config.flag_minority_claims, config.agreement_model})
        , synthesizer_(gateway_, config.synthesizer_model, config.call_timeout)
    {}

    static std::chrono::milliseconds since(Clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    }

    void enter(PipelineRun& record, Stage stage) const {
        record.stage = stage;
        log::info("pipeline", std::string("stage: ") + stage_to_string(stage));
        if (config_.on_stage) {
            (*config_.on_stage)(stage, record);
        }
    }

    void fail(PipelineRun& record, Stage at, const Error& error, Clock::time_point run_start) const {
        log::error("pipeline", std::string("run failed while ") + stage_to_string(at) + ": " + error.to_string());
        record.failed_at = at;
        record.error = error;
        record.timings.total = since(run_start);
        enter(record, Stage::Failed);
    }

    Config config_;
    std::shared_ptr<gateway::IGateway> gateway_;
    engine::InitialFetcher fetcher_;
    engine::CriticAnalyzer critic_;
    engine::DebateOrchestrator debate_;
    engine::Synthesizer synthesizer_;
};

} // namespace conclave
