#pragma once

/**
 * @file conclave.hpp
 * @brief Main convenience header for Conclave
 *
 * Include this single header to get access to the public Conclave APIs.
 *
 * Conclave runs a four-stage debate among several language models:
 * every model answers, a critic lists the claims they disagree on, each
 * model revises its answer against the claims it missed, and a synthesizer
 * merges the revised answers into one.
 *
 * Quick Start:
 * @code
 * #include <conclave/conclave.hpp>
 *
 * int main() {
 *     conclave::gateway::OpenRouterConfig openrouter;
 *     if (const char* key = std::getenv("OPENROUTER_API_KEY")) {
 *         openrouter.api_key = key;
 *     }
 *
 *     auto gateway = conclave::gateway::OpenRouterGateway::create(openrouter);
 *     if (!gateway) {
 *         std::cerr << "Error: " << gateway.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     conclave::Config config;
 *     auto pipeline = conclave::DebatePipeline::create(config, *gateway);
 *     auto run = (*pipeline)->run("Is 1 a prime number?");
 *
 *     if (run && run->succeeded()) {
 *         std::cout << *run->final_answer() << std::endl;
 *     } else if (run) {
 *         std::cerr << "Error: " << run->error->to_string() << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - conclave::DebatePipeline: Runs the four stages for a prompt
 * - conclave::Config: Model roster, critic/synthesizer models, deadline
 * - conclave::PipelineRun: Everything a run produced
 * - conclave::gateway::IGateway: Boundary for model calls (inject a mock in tests)
 * - conclave::Error: Structured error handling
 *
 * The OpenRouter and llama.cpp gateways are compiled separately; include
 * their headers from gateway/ when linking against them.
 */

// Core types
#include "types.hpp"
#include "log.hpp"
#include "run.hpp"

// Public API
#include "pipeline.hpp"

// Gateway interface (for custom implementations and testing)
#include "gateway/IGateway.hpp"

// Stage components (optional, for advanced usage)
#include "engine/critic_parser.hpp"
#include "engine/fetcher.hpp"
#include "engine/critic.hpp"
#include "engine/debate.hpp"
#include "engine/synthesizer.hpp"

// Persistence and configuration
#include "run_artifact.hpp"
#include "storage/run_archive.hpp"
#include "config_loader.hpp"

/**
 * @namespace conclave
 * @brief Main namespace for Conclave
 *
 * Nested namespaces:
 * - conclave::gateway - Model gateway interface and implementations
 * - conclave::engine - Stage components
 * - conclave::storage - Run archive
 */
