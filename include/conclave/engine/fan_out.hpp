#pragma once

#include "../gateway/IGateway.hpp"
#include "../log.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conclave {
namespace engine {

/** @brief One call of a concurrent batch. */
struct BatchCall {
    std::string model_id;
    std::string prompt;
};

namespace detail {

inline ModelResponse to_model_response(const std::string& model_id, gateway::Completion completion) {
    if (completion.output) {
        return ModelResponse::ok(model_id, std::move(*completion.output), completion.elapsed);
    }
    return ModelResponse::failed(model_id, std::move(completion.output.error()), completion.elapsed);
}

} // namespace detail

/**
 * @brief Issue every call of a batch, then wait for all of them.
 *
 * All requests are handed to the gateway before the first result is awaited,
 * so the calls overlap. The function returns only after every future has
 * resolved, which is the barrier between pipeline stages.
 *
 * A gateway that throws while issuing, or whose future breaks, is recorded
 * as a TransportFailure for that model alone.
 *
 * @return One ModelResponse per call, in call order
 */
inline std::vector<ModelResponse> run_batch(gateway::IGateway& gateway,
                                            const std::vector<BatchCall>& calls,
                                            std::chrono::milliseconds timeout,
                                            std::string_view component) {
    struct Pending {
        std::future<gateway::Completion> future;
        std::optional<Error> issue_error;
    };

    std::vector<Pending> pending;
    pending.reserve(calls.size());
    for (const auto& call : calls) {
        Pending slot;
        try {
            slot.future = gateway.complete(call.model_id, call.prompt, timeout);
        } catch (const std::exception& e) {
            slot.issue_error = Error{ErrorCode::TransportFailure, "Gateway rejected request", e.what()};
        }
        pending.push_back(std::move(slot));
    }

    std::vector<ModelResponse> responses;
    responses.reserve(calls.size());
    for (size_t i = 0; i < calls.size(); ++i) {
        const auto& model_id = calls[i].model_id;
        auto& slot = pending[i];
        ModelResponse response;
        if (slot.issue_error) {
            response = ModelResponse::failed(model_id, std::move(*slot.issue_error), std::chrono::milliseconds{0});
        } else {
            try {
                response = detail::to_model_response(model_id, slot.future.get());
            } catch (const std::exception& e) {
                response = ModelResponse::failed(
                    model_id, Error{ErrorCode::TransportFailure, "Gateway future failed", e.what()},
                    std::chrono::milliseconds{0});
            }
        }
        if (!response.success) {
            log::warn(component, model_id + " failed: " + response.error->to_string());
        }
        responses.push_back(std::move(response));
    }
    return responses;
}

} // namespace engine
} // namespace conclave
