#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace conclave {
namespace engine {

// ============================================================================
// CriticParser
// ============================================================================

/**
 * @brief Turns raw critic text into a validated DiscrepancySet.
 *
 * Accepted shapes, optionally wrapped in a markdown code fence:
 * - {"consensus_reached": bool, "discrepancies": [ ... ]}
 * - [ ... ]
 *
 * Each discrepancy object carries "claim" (string) and "models_with_claim"
 * (array of model ids); "models_missing_claim", "claim_id" and "confidence"
 * are optional. Nothing is coerced: any deviation is a validation failure and
 * no partial result is returned.
 */
class CriticParser {
public:
    /**
     * @brief Remove a surrounding ``` / ```json fence, if present.
     *
     * @param raw Critic text
     * @return Inner text, trimmed of surrounding whitespace
     */
    static std::string strip_code_fences(std::string_view raw) {
        std::string_view text = trim(raw);
        if (starts_with(text, "```")) {
            text.remove_prefix(3);
            // Optional language tag such as "json"
            size_t tag = 0;
            while (tag < text.size() && std::isalpha(static_cast<unsigned char>(text[tag]))) {
                ++tag;
            }
            text = trim(text.substr(tag));
        }
        if (ends_with(text, "```")) {
            text.remove_suffix(3);
            text = trim(text);
        }
        return std::string(text);
    }

    /**
     * @brief Parse and validate critic output.
     *
     * @param raw Critic text exactly as returned by the gateway
     * @param responding_models Models whose initial answers were shown to the critic
     * @return DiscrepancySet on success; CriticParseFailure or CriticValidationFailure
     *         (raw text in Error::context) otherwise
     */
    static Expected<DiscrepancySet> parse(const std::string& raw,
                                          const std::vector<std::string>& responding_models) {
        const std::string cleaned = strip_code_fences(raw);
        if (cleaned.empty()) {
            return tl::unexpected(Error{ErrorCode::CriticParseFailure, "Critic returned no content", raw});
        }

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(cleaned);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::CriticParseFailure,
                                        std::string("Critic output is not valid JSON: ") + e.what(), raw});
        }

        const nlohmann::json* items = nullptr;
        if (doc.is_array()) {
            items = &doc;
        } else if (doc.is_object()) {
            auto it = doc.find("discrepancies");
            if (it == doc.end() || !it->is_array()) {
                return invalid("Field 'discrepancies' must be an array", raw);
            }
            items = &(*it);
            // Informational only; consensus is recomputed from the validated list
            auto consensus = doc.find("consensus_reached");
            if (consensus != doc.end() && !consensus->is_boolean()) {
                return invalid("Field 'consensus_reached' must be a boolean", raw);
            }
        } else {
            return invalid("Critic output must be a JSON object or array", raw);
        }

        const std::unordered_set<std::string> known(responding_models.begin(), responding_models.end());

        DiscrepancySet result;
        result.raw_output = raw;
        size_t index = 0;
        for (const auto& item : *items) {
            const std::string where = "discrepancies[" + std::to_string(index++) + "]";
            if (!item.is_object()) {
                return invalid(where + " must be an object", raw);
            }

            Discrepancy d;
            auto claim = item.find("claim");
            if (claim == item.end() || !claim->is_string() || conclave::detail::is_blank(claim->get<std::string>())) {
                return invalid(where + ".claim must be a non-empty string", raw);
            }
            d.claim = claim->get<std::string>();

            auto with = read_model_list(item, "models_with_claim", where, known, raw);
            if (!with) {
                return tl::unexpected(with.error());
            }
            if (!with->has_value()) {
                return invalid(where + ".models_with_claim is required", raw);
            }
            d.models_with_claim = std::move(**with);

            auto missing = read_model_list(item, "models_missing_claim", where, known, raw);
            if (!missing) {
                return tl::unexpected(missing.error());
            }
            if (missing->has_value()) {
                d.models_missing_claim = std::move(**missing);
                for (const auto& model : d.models_missing_claim) {
                    if (d.asserted_by(model)) {
                        return invalid(where + " lists '" + model + "' as both asserting and missing the claim", raw);
                    }
                }
            } else {
                for (const auto& model : responding_models) {
                    if (!d.asserted_by(model)) {
                        d.models_missing_claim.push_back(model);
                    }
                }
            }

            auto claim_id = item.find("claim_id");
            if (claim_id != item.end() && !claim_id->is_null()) {
                if (!claim_id->is_string()) {
                    return invalid(where + ".claim_id must be a string", raw);
                }
                d.claim_id = claim_id->get<std::string>();
            }
            if (d.claim_id.empty()) {
                d.claim_id = make_claim_id(d.claim);
            }

            auto confidence = item.find("confidence");
            if (confidence != item.end() && !confidence->is_null()) {
                if (!confidence->is_number()) {
                    return invalid(where + ".confidence must be a number", raw);
                }
                const double value = confidence->get<double>();
                if (value < 0.0 || value > 1.0) {
                    return invalid(where + ".confidence must be within [0, 1]", raw);
                }
                d.confidence = value;
            }

            // Asserted by everyone: nothing for the debate to address
            if (d.models_missing_claim.empty()) {
                log::debug("critic", "dropping claim asserted by every model: " + d.claim);
                continue;
            }
            result.discrepancies.push_back(std::move(d));
        }

        result.consensus_reached = result.discrepancies.empty();
        return result;
    }

private:
    using ModelList = std::optional<std::vector<std::string>>;

    static tl::unexpected<Error> invalid(std::string message, const std::string& raw) {
        return tl::unexpected(Error{ErrorCode::CriticValidationFailure, std::move(message), raw});
    }

    /// Absent field -> nullopt; present field must be an array of known, distinct ids.
    static Expected<ModelList> read_model_list(const nlohmann::json& item,
                                               const char* field,
                                               const std::string& where,
                                               const std::unordered_set<std::string>& known,
                                               const std::string& raw) {
        auto it = item.find(field);
        if (it == item.end()) {
            return ModelList{};
        }
        const std::string name = where + "." + field;
        if (!it->is_array()) {
            return invalid(name + " must be an array", raw);
        }
        std::vector<std::string> models;
        for (const auto& entry : *it) {
            if (!entry.is_string()) {
                return invalid(name + " must contain only strings", raw);
            }
            auto model = entry.get<std::string>();
            if (known.count(model) == 0) {
                return invalid(name + " references unknown model '" + model + "'", raw);
            }
            if (std::find(models.begin(), models.end(), model) != models.end()) {
                return invalid(name + " lists '" + model + "' twice", raw);
            }
            models.push_back(std::move(model));
        }
        return ModelList{std::move(models)};
    }

    static std::string_view trim(std::string_view text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    static bool starts_with(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    static bool ends_with(std::string_view text, std::string_view suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
};

} // namespace engine
} // namespace conclave
