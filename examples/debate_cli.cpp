/**
 * Conclave Debate CLI
 *
 * Runs one multi-model debate for a prompt and prints the progress of each
 * stage followed by the synthesized answer.
 *
 * Usage:
 *   ./debate_cli [options] <prompt>
 *
 * Options:
 *   --models <a,b,c>              Comma-separated debating models
 *   --critic <model>              Critic model
 *   --synthesizer <model>         Synthesizer model
 *   --agreement <model>           Enable agreement detection with this model
 *   --timeout <seconds>           Per-call deadline (default: 30)
 *   --config <file>               JSON configuration file
 *   --env-file <file>             .env file with OPENROUTER_API_KEY (default: ./.env if present)
 *   --backend <name>              openrouter or llama (default: openrouter)
 *   --archive <file>              Record the run in this SQLite archive
 *   --artifact <file>             Write the run as JSON to this file
 *   --continue-on-critic-failure  Debate without discrepancies if the critic fails
 *   --flag-minority               Also show models the claims they made against the majority
 *   --verbose                     Log stage transitions and model failures
 *   --help                        Show this help message
 */

#include "conclave/config_loader.hpp"
#include "conclave/pipeline.hpp"
#include "conclave/run_artifact.hpp"
#include "conclave/storage/run_archive.hpp"
#include "conclave/gateway/llama_gateway.hpp"
#include "conclave/gateway/openrouter_gateway.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

struct CLIArgs {
    std::string prompt;
    std::optional<std::vector<std::string>> models;
    std::optional<std::string> critic;
    std::optional<std::string> synthesizer;
    std::optional<std::string> agreement;
    std::optional<double> timeout_seconds;
    std::optional<std::string> config_path;
    std::optional<std::string> env_path;
    std::optional<std::string> backend;
    std::optional<std::string> archive;
    std::optional<std::string> artifact;
    bool continue_on_critic_failure = false;
    bool flag_minority = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Conclave Debate CLI\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options] <prompt>\n\n";
    std::cout << "Options:\n";
    std::cout << "  --models <a,b,c>              Comma-separated debating models\n";
    std::cout << "  --critic <model>              Critic model\n";
    std::cout << "  --synthesizer <model>         Synthesizer model\n";
    std::cout << "  --agreement <model>           Enable agreement detection with this model\n";
    std::cout << "  --timeout <seconds>           Per-call deadline (default: 30)\n";
    std::cout << "  --config <file>               JSON configuration file\n";
    std::cout << "  --env-file <file>             .env file with OPENROUTER_API_KEY (default: ./.env if present)\n";
    std::cout << "  --backend <name>              openrouter or llama (default: openrouter)\n";
    std::cout << "  --archive <file>              Record the run in this SQLite archive\n";
    std::cout << "  --artifact <file>             Write the run as JSON to this file\n";
    std::cout << "  --continue-on-critic-failure  Debate without discrepancies if the critic fails\n";
    std::cout << "  --flag-minority               Also show models the claims they made against the majority\n";
    std::cout << "  --verbose                     Log stage transitions and model failures\n";
    std::cout << "  --help                        Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " --timeout 45 \"Is 0.1 + 0.2 == 0.3 in IEEE 754?\"\n";
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--models" && i + 1 < argc) {
            args.models = split_list(argv[++i]);
        }
        else if (arg == "--critic" && i + 1 < argc) {
            args.critic = argv[++i];
        }
        else if (arg == "--synthesizer" && i + 1 < argc) {
            args.synthesizer = argv[++i];
        }
        else if (arg == "--agreement" && i + 1 < argc) {
            args.agreement = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            try {
                args.timeout_seconds = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid timeout: " << argv[i] << "\n";
                args.help = true;
                return args;
            }
        }
        else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (arg == "--env-file" && i + 1 < argc) {
            args.env_path = argv[++i];
        }
        else if (arg == "--backend" && i + 1 < argc) {
            args.backend = argv[++i];
        }
        else if (arg == "--archive" && i + 1 < argc) {
            args.archive = argv[++i];
        }
        else if (arg == "--artifact" && i + 1 < argc) {
            args.artifact = argv[++i];
        }
        else if (arg == "--continue-on-critic-failure") {
            args.continue_on_critic_failure = true;
        }
        else if (arg == "--flag-minority") {
            args.flag_minority = true;
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
        else {
            args.prompt += (args.prompt.empty() ? "" : " ") + arg;
        }
    }

    if (args.prompt.empty()) {
        args.help = true;
    }
    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

std::string preview(const std::string& text) {
    constexpr size_t limit = 150;
    std::string flat = text;
    for (auto& c : flat) {
        if (c == '\n') {
            c = ' ';
        }
    }
    return flat.size() > limit ? flat.substr(0, limit) + "..." : flat;
}

void print_responses(const std::vector<conclave::ModelResponse>& responses) {
    for (const auto& response : responses) {
        std::cout << "  " << response.model_id << " (" << response.elapsed.count() << " ms)";
        if (response.carried_over) {
            std::cout << " [kept initial answer]";
        }
        std::cout << ":\n";
        if (response.usable()) {
            std::cout << "    " << preview(response.text) << "\n";
        } else if (response.error.has_value()) {
            std::cout << "    ERROR " << response.error->to_string() << "\n";
        } else {
            std::cout << "    ERROR empty response\n";
        }
    }
}

void print_progress(conclave::Stage stage, const conclave::PipelineRun& run) {
    using conclave::Stage;
    switch (stage) {
        case Stage::Fetching:
            std::cout << "\n[1/4] Fetching initial responses...\n";
            break;
        case Stage::Critiquing:
            print_responses(run.initial.responses());
            std::cout << "\n[2/4] Analyzing discrepancies...\n";
            break;
        case Stage::Debating:
            if (run.critique_error.has_value()) {
                std::cout << "  Critic failed, debating without discrepancies: "
                          << run.critique_error->to_string() << "\n";
            } else if (run.discrepancies->empty()) {
                std::cout << "  No discrepancies: the models agree.\n";
            } else {
                for (const auto& d : run.discrepancies->discrepancies) {
                    std::cout << "  - " << preview(d.claim) << "\n";
                    std::cout << "    missing from: ";
                    for (size_t i = 0; i < d.models_missing_claim.size(); ++i) {
                        std::cout << (i > 0 ? ", " : "") << d.models_missing_claim[i];
                    }
                    std::cout << "\n";
                }
            }
            std::cout << "\n[3/4] Running debate round...\n";
            break;
        case Stage::Synthesizing:
            print_responses(run.debate->responses());
            std::cout << "\n[4/4] Synthesizing final answer...\n";
            break;
        case Stage::Done:
        case Stage::Failed:
            break;
    }
}

std::shared_ptr<conclave::gateway::IGateway> make_gateway(conclave::ConfigFile& file,
                                                          const std::map<std::string, std::string>& env) {
    if (file.backend == "llama") {
#ifdef CONCLAVE_HAS_LLAMA
        auto gateway = conclave::gateway::LlamaGateway::create(file.llama);
        if (!gateway) {
            std::cerr << "Failed to create llama.cpp gateway: " << gateway.error().to_string() << "\n";
            return nullptr;
        }
        return *gateway;
#else
        std::cerr << "This build has no llama.cpp support; use --backend openrouter\n";
        return nullptr;
#endif
    }

    if (file.openrouter.api_key.empty()) {
        file.openrouter.api_key = conclave::resolve_variable(env, file.api_key_env).value_or("");
    }
    auto gateway = conclave::gateway::OpenRouterGateway::create(file.openrouter);
    if (!gateway) {
        std::cerr << "Failed to create OpenRouter gateway: " << gateway.error().to_string() << "\n";
        return nullptr;
    }
    return *gateway;
}

int run_cli(int argc, char** argv, bool& used_llama) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return args.prompt.empty() ? 1 : 0;
    }

    conclave::log::set_level(args.verbose ? conclave::LogLevel::Info : conclave::LogLevel::Warn);

    // Configuration file first, command line overrides second
    conclave::ConfigFile file;
    if (args.config_path) {
        auto loaded = conclave::load_config_file(*args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error().to_string() << "\n";
            return 1;
        }
        file = std::move(*loaded);
    }

    auto& config = file.pipeline;
    if (args.models) config.models = *args.models;
    if (args.critic) config.critic_model = *args.critic;
    if (args.synthesizer) config.synthesizer_model = *args.synthesizer;
    if (args.agreement) config.agreement_model = *args.agreement;
    if (args.timeout_seconds) {
        auto timeout = conclave::timeout_from_seconds(*args.timeout_seconds);
        if (!timeout) {
            std::cerr << "Invalid timeout: " << timeout.error().to_string() << "\n";
            return 1;
        }
        config.call_timeout = *timeout;
    }
    if (args.continue_on_critic_failure) {
        config.critic_failure_policy = conclave::CriticFailurePolicy::ContinueWithoutDiscrepancies;
    }
    if (args.flag_minority) config.flag_minority_claims = true;
    if (args.backend) file.backend = *args.backend;
    if (args.archive) file.archive_path = *args.archive;
    if (args.artifact) file.artifact_path = *args.artifact;
    config.on_stage = print_progress;

    std::map<std::string, std::string> env;
    const std::string env_path = args.env_path.value_or(".env");
    if (args.env_path || std::ifstream(env_path).good()) {
        auto loaded = conclave::load_env_file(env_path);
        if (!loaded) {
            std::cerr << "Failed to read env file: " << loaded.error().to_string() << "\n";
            return 1;
        }
        env = std::move(*loaded);
    }

    auto gateway = make_gateway(file, env);
    if (!gateway) {
        return 1;
    }
    used_llama = file.backend == "llama";

    auto pipeline = conclave::DebatePipeline::create(config, gateway);
    if (!pipeline) {
        std::cerr << "Invalid configuration: " << pipeline.error().to_string() << "\n";
        return 1;
    }

    print_separator();
    std::cout << "Prompt: " << args.prompt << "\n";
    std::cout << "Models: ";
    for (size_t i = 0; i < config.models.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << config.models[i];
    }
    std::cout << "\nCritic: " << config.critic_model << "\n";
    std::cout << "Synthesizer: " << config.synthesizer_model << "\n";
    print_separator();

    auto run = (*pipeline)->run(args.prompt);
    if (!run) {
        std::cerr << "Error: " << run.error().to_string() << "\n";
        return 1;
    }

    std::cout << "\n";
    print_separator();
    if (run->succeeded()) {
        std::cout << "FINAL ANSWER (" << run->synthesis->model_id << ")\n";
        print_separator();
        std::cout << *run->final_answer() << "\n";
    } else {
        std::cout << "Run failed while " << conclave::stage_to_string(*run->failed_at) << "\n";
        std::cout << run->error->to_string() << "\n";
    }
    print_separator();
    std::cout << "Total: " << run->timings.total.count() << " ms\n";

    if (file.artifact_path) {
        if (auto written = conclave::write_run_artifact(*run, *file.artifact_path); !written) {
            std::cerr << "Failed to write artifact: " << written.error().to_string() << "\n";
        } else {
            std::cout << "Artifact: " << *file.artifact_path << "\n";
        }
    }

    if (file.archive_path) {
        auto archive = conclave::storage::RunArchive::open(*file.archive_path);
        if (!archive) {
            std::cerr << "Failed to open archive: " << archive.error().to_string() << "\n";
        } else if (auto id = (*archive)->record(*run); !id) {
            std::cerr << "Failed to archive run: " << id.error().to_string() << "\n";
        } else {
            std::cout << "Archived as run #" << *id << " in " << *file.archive_path << "\n";
        }
    }

    return run->succeeded() ? 0 : 1;
}

int main(int argc, char** argv) {
    bool used_llama = false;
    const int status = run_cli(argc, argv, used_llama);
#ifdef CONCLAVE_HAS_LLAMA
    // Every gateway and model is released once run_cli returns
    if (used_llama) {
        conclave::gateway::LlamaGateway::shutdown_global();
    }
#endif
    return status;
}
