#pragma once

#include "types.hpp"
#include "gateway/llama_gateway.hpp"
#include "gateway/openrouter_gateway.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace conclave {

/**
 * @brief Everything a configuration file can set
 */
struct ConfigFile {
    Config pipeline;                                    ///< Pipeline settings
    std::string backend = "openrouter";                 ///< "openrouter" or "llama"
    gateway::OpenRouterConfig openrouter;               ///< Used when backend == "openrouter"
    std::string api_key_env = "OPENROUTER_API_KEY";     ///< Variable holding the key when api_key is unset
    gateway::LlamaGatewayConfig llama;                  ///< Used when backend == "llama"
    std::optional<std::string> archive_path;            ///< SQLite run archive
    std::optional<std::string> artifact_path;           ///< JSON artifact of the last run
};

namespace config_detail {

inline std::optional<CriticFailurePolicy> parse_policy(const std::string& value) {
    if (value == "abort") {
        return CriticFailurePolicy::Abort;
    }
    if (value == "continue") {
        return CriticFailurePolicy::ContinueWithoutDiscrepancies;
    }
    return std::nullopt;
}

inline std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace config_detail

/**
 * @brief Convert a timeout in seconds to a call deadline
 *
 * @return The duration, or InvalidTimeout for NaN, infinities and values
 *         too large to represent in milliseconds
 */
inline Expected<std::chrono::milliseconds> timeout_from_seconds(double seconds) {
    constexpr double limit = static_cast<double>(std::numeric_limits<long long>::max()) / 2000.0;
    if (!std::isfinite(seconds) || std::fabs(seconds) > limit) {
        return tl::unexpected(Error{ErrorCode::InvalidTimeout, "Timeout out of range", std::to_string(seconds)});
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

/**
 * @brief Build a ConfigFile from a parsed JSON document
 *
 * Absent keys keep their defaults; unknown keys are ignored. A key of the
 * wrong type, or an invalid value, is ConfigParseFailed. The pipeline
 * configuration is validated before it is returned.
 */
inline Expected<ConfigFile> parse_config(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return tl::unexpected(Error{ErrorCode::ConfigParseFailed, "Configuration must be a JSON object"});
    }

    ConfigFile file;
    auto& pipeline = file.pipeline;
    std::optional<std::string> policy;
    try {
        if (doc.contains("models")) {
            pipeline.models = doc.at("models").get<std::vector<std::string>>();
        }
        pipeline.critic_model = doc.value("critic_model", pipeline.critic_model);
        pipeline.synthesizer_model = doc.value("synthesizer_model", pipeline.synthesizer_model);
        if (doc.contains("agreement_model") && !doc.at("agreement_model").is_null()) {
            pipeline.agreement_model = doc.at("agreement_model").get<std::string>();
        }
        if (doc.contains("timeout_seconds")) {
            auto timeout = timeout_from_seconds(doc.at("timeout_seconds").get<double>());
            if (!timeout) {
                return tl::unexpected(timeout.error());
            }
            pipeline.call_timeout = *timeout;
        }
        if (doc.contains("critic_failure_policy")) {
            policy = doc.at("critic_failure_policy").get<std::string>();
        }
        pipeline.flag_minority_claims = doc.value("flag_minority_claims", pipeline.flag_minority_claims);

        file.backend = doc.value("backend", file.backend);
        if (doc.contains("archive")) {
            file.archive_path = doc.at("archive").get<std::string>();
        }
        if (doc.contains("artifact")) {
            file.artifact_path = doc.at("artifact").get<std::string>();
        }

        if (doc.contains("openrouter")) {
            const auto& o = doc.at("openrouter");
            auto& cfg = file.openrouter;
            cfg.api_key = o.value("api_key", cfg.api_key);
            cfg.host = o.value("host", cfg.host);
            cfg.port = o.value("port", cfg.port);
            cfg.target = o.value("target", cfg.target);
            cfg.referer = o.value("referer", cfg.referer);
            cfg.title = o.value("title", cfg.title);
            cfg.verify_peer = o.value("verify_peer", cfg.verify_peer);
            file.api_key_env = o.value("api_key_env", file.api_key_env);
        }

        if (doc.contains("llama")) {
            const auto& l = doc.at("llama");
            auto& cfg = file.llama;
            if (l.contains("models")) {
                cfg.model_paths = l.at("models").get<std::map<std::string, std::string>>();
            }
            cfg.context_size = l.value("context_size", cfg.context_size);
            cfg.n_gpu_layers = l.value("n_gpu_layers", cfg.n_gpu_layers);
            cfg.use_mmap = l.value("use_mmap", cfg.use_mmap);
            cfg.max_tokens = l.value("max_tokens", cfg.max_tokens);
            if (l.contains("sampling")) {
                const auto& s = l.at("sampling");
                cfg.sampling.temperature = s.value("temperature", cfg.sampling.temperature);
                cfg.sampling.top_p = s.value("top_p", cfg.sampling.top_p);
                cfg.sampling.top_k = s.value("top_k", cfg.sampling.top_k);
                cfg.sampling.repeat_penalty = s.value("repeat_penalty", cfg.sampling.repeat_penalty);
                cfg.sampling.repeat_last_n = s.value("repeat_last_n", cfg.sampling.repeat_last_n);
                cfg.sampling.seed = s.value("seed", cfg.sampling.seed);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::ConfigParseFailed, "Invalid configuration value", e.what()});
    }

    if (policy.has_value()) {
        auto parsed = config_detail::parse_policy(*policy);
        if (!parsed) {
            return tl::unexpected(Error{ErrorCode::ConfigParseFailed,
                                        "critic_failure_policy must be \"abort\" or \"continue\"", *policy});
        }
        pipeline.critic_failure_policy = *parsed;
    }

    if (file.backend != "openrouter" && file.backend != "llama") {
        return tl::unexpected(Error{ErrorCode::ConfigParseFailed,
                                    "backend must be \"openrouter\" or \"llama\"", file.backend});
    }
    if (auto valid = pipeline.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return file;
}

/**
 * @brief Read and parse a JSON configuration file
 */
inline Expected<ConfigFile> load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(Error{ErrorCode::ConfigFileUnreadable, "Cannot open configuration file", path});
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::ConfigParseFailed,
                                    std::string("Configuration is not valid JSON: ") + e.what(), path});
    }
    return parse_config(doc);
}

/**
 * @brief Parse KEY=VALUE lines of a .env document
 *
 * Blank lines and '#' comments are skipped, an "export " prefix is allowed,
 * and matching single or double quotes around the value are removed.
 */
inline Expected<std::map<std::string, std::string>> parse_env(const std::string& content) {
    std::map<std::string, std::string> values;
    std::istringstream lines(content);
    std::string line;
    int line_no = 0;
    while (std::getline(lines, line)) {
        ++line_no;
        line = config_detail::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = config_detail::trim(line.substr(7));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            return tl::unexpected(Error{ErrorCode::ConfigParseFailed, "Malformed .env line",
                                        "line " + std::to_string(line_no)});
        }
        std::string key = config_detail::trim(line.substr(0, eq));
        std::string value = config_detail::trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values[std::move(key)] = std::move(value);
    }
    return values;
}

inline Expected<std::map<std::string, std::string>> load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(Error{ErrorCode::ConfigFileUnreadable, "Cannot open env file", path});
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_env(buffer.str());
}

/**
 * @brief Look a variable up in @p env first, then in the process environment
 */
inline std::optional<std::string> resolve_variable(const std::map<std::string, std::string>& env,
                                                   const std::string& name) {
    auto it = env.find(name);
    if (it != env.end() && !it->second.empty()) {
        return it->second;
    }
    if (const char* value = std::getenv(name.c_str()); value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace conclave
