#pragma once

#include "IGateway.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace conclave {
namespace gateway {

/**
 * @brief Connection settings for the OpenRouter chat-completions API
 */
struct OpenRouterConfig {
    std::string api_key;                                ///< Bearer token (required)
    std::string host = "openrouter.ai";                 ///< API host
    std::string port = "443";                           ///< TLS port
    std::string target = "/api/v1/chat/completions";    ///< Request path
    std::string referer;                                ///< Optional HTTP-Referer header
    std::string title = "conclave";                     ///< X-Title header
    bool verify_peer = true;                            ///< Verify the server certificate

    Expected<void> validate() const {
        if (api_key.empty()) {
            return tl::unexpected(Error{ErrorCode::MissingApiKey, "OpenRouter API key is not set",
                                        "set OPENROUTER_API_KEY or openrouter.api_key"});
        }
        if (host.empty() || port.empty() || target.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "OpenRouter host, port and target are required"});
        }
        return {};
    }

    bool operator==(const OpenRouterConfig& other) const {
        return api_key == other.api_key &&
               host == other.host &&
               port == other.port &&
               target == other.target &&
               referer == other.referer &&
               title == other.title &&
               verify_peer == other.verify_peer;
    }
};

/**
 * @brief IGateway over HTTPS to OpenRouter.
 *
 * Every call is an asynchronous Boost.Beast session on one I/O thread, so any
 * number of requests are in flight at once without a thread per call. Each
 * session owns a deadline timer; when it fires the session is cancelled and
 * the call resolves with RequestTimeout.
 *
 * Destroying the gateway cancels outstanding calls; their futures resolve
 * with GatewayShutdown.
 */
class OpenRouterGateway : public IGateway {
public:
    /**
     * @brief Factory method to create the gateway
     *
     * Validates the configuration, sets up TLS and starts the I/O thread.
     */
    static Expected<std::shared_ptr<OpenRouterGateway>> create(const OpenRouterConfig& config);

    ~OpenRouterGateway() override;

    OpenRouterGateway(const OpenRouterGateway&) = delete;
    OpenRouterGateway& operator=(const OpenRouterGateway&) = delete;

    std::future<Completion> complete(
        const std::string& model_id,
        const std::string& prompt,
        std::chrono::milliseconds timeout
    ) override;

    /**
     * @brief JSON request body for one single-turn completion
     */
    static std::string build_request_body(const std::string& model_id, const std::string& prompt);

    /**
     * @brief Map an HTTP status and body onto the completion text or an Error
     *
     * @param status HTTP status code
     * @param body Response body
     * @return choices[0].message.content, or HttpError / MalformedPayload / EmptyResponse
     */
    static Expected<std::string> parse_response(unsigned status, const std::string& body);

private:
    class Impl;

    explicit OpenRouterGateway(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace gateway
} // namespace conclave
