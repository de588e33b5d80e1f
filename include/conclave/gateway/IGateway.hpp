#pragma once

#include "../types.hpp"
#include <chrono>
#include <future>
#include <string>

namespace conclave {
namespace gateway {

/**
 * @brief Result of a single gateway call
 *
 * Either response text or the transport error that ended the call, together
 * with the time the call took.
 */
struct Completion {
    Expected<std::string> output;            ///< Response text or transport error (2xx ErrorCode)
    std::chrono::milliseconds elapsed{0};    ///< Wall time from issue to resolution

    bool ok() const { return output.has_value(); }
};

/**
 * @brief Abstract boundary through which every model call is issued
 *
 * Implementations own deadline enforcement: a call whose deadline passes
 * resolves with ErrorCode::RequestTimeout and does not affect other calls.
 * The gateway never retries.
 *
 * Design principles:
 * - Asynchronous: complete() returns immediately; the future resolves later
 * - Independent: calls for different models may be in flight concurrently
 * - Total: every returned future resolves, with text or with an Error
 */
class IGateway {
public:
    virtual ~IGateway() = default;

    /**
     * @brief Issue one completion request
     *
     * @param model_id Stable model identifier (e.g. "openai/gpt-4o-mini")
     * @param prompt Full prompt text sent as a single user message
     * @param timeout Hard deadline for the whole call
     * @return std::future<Completion> Resolves once the call finished, failed or timed out
     */
    virtual std::future<Completion> complete(
        const std::string& model_id,
        const std::string& prompt,
        std::chrono::milliseconds timeout
    ) = 0;
};

} // namespace gateway
} // namespace conclave
