#include "conclave/gateway/openrouter_gateway.hpp"
#include "conclave/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <exception>
#include <thread>

namespace conclave {
namespace gateway {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kExcerptBytes = 300;

// Leading bytes of a body for error context, never ending inside a UTF-8 sequence
std::string excerpt(const std::string& body) {
    if (body.size() <= kExcerptBytes) {
        return body;
    }
    size_t end = kExcerptBytes;
    while (end > 0 && (static_cast<unsigned char>(body[end]) & 0xC0) == 0x80) {
        --end;
    }
    return body.substr(0, end);
}

/**
 * @brief One HTTPS request/response exchange with a deadline.
 *
 * All handlers run on the session's strand. The promise is fulfilled exactly
 * once: by the response, by the first error, by the deadline, or by the
 * destructor when the I/O context shuts down first.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(net::any_io_executor executor,
            ssl::context& ssl_ctx,
            const OpenRouterConfig& config,
            std::string model_id,
            std::string body,
            std::chrono::milliseconds timeout)
        : resolver_(executor)
        , stream_(executor, ssl_ctx)
        , deadline_(executor)
        , config_(config)
        , model_id_(std::move(model_id))
        , timeout_(timeout)
        , started_(Clock::now())
    {
        req_.method(http::verb::post);
        req_.target(config_.target);
        req_.version(11);
        req_.set(http::field::host, config_.host);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.set(http::field::authorization, "Bearer " + config_.api_key);
        req_.set(http::field::content_type, "application/json");
        req_.set(http::field::accept, "application/json");
        if (!config_.referer.empty()) {
            req_.set(http::field::referer, config_.referer);
        }
        if (!config_.title.empty()) {
            req_.set("X-Title", config_.title);
        }
        req_.body() = std::move(body);
        req_.prepare_payload();
    }

    ~Session() {
        if (!done_) {
            promise_.set_value(Completion{
                tl::unexpected(Error{ErrorCode::GatewayShutdown, "Gateway shut down before the call finished", model_id_}),
                elapsed()
            });
        }
    }

    std::future<Completion> get_future() { return promise_.get_future(); }

    void start() {
        deadline_.expires_after(timeout_);
        deadline_.async_wait(beast::bind_front_handler(&Session::on_deadline, shared_from_this()));

        if (!SSL_set_tlsext_host_name(stream_.native_handle(), config_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            fail(ec, "TLS SNI setup");
            return;
        }
        if (config_.verify_peer) {
            stream_.set_verify_mode(ssl::verify_peer);
            stream_.set_verify_callback(ssl::host_name_verification(config_.host));
        }

        resolver_.async_resolve(config_.host, config_.port,
                                beast::bind_front_handler(&Session::on_resolve, shared_from_this()));
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail(ec, "resolve");
        }
        beast::get_lowest_layer(stream_).async_connect(
            results, beast::bind_front_handler(&Session::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail(ec, "connect");
        }
        stream_.async_handshake(ssl::stream_base::client,
                                beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            return fail(ec, "TLS handshake");
        }
        http::async_write(stream_, req_, beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ec, "write");
        }
        http::async_read(stream_, buffer_, res_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ec, "read");
        }
        finish(OpenRouterGateway::parse_response(res_.result_int(), res_.body()));

        // The answer is already delivered; shutdown errors (e.g. stream_truncated) are irrelevant
        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(5));
        stream_.async_shutdown(beast::bind_front_handler(&Session::on_shutdown, shared_from_this()));
    }

    void on_shutdown(beast::error_code) {}

    void on_deadline(beast::error_code ec) {
        if (ec == net::error::operation_aborted || done_) {
            return;
        }
        finish(tl::unexpected(Error{ErrorCode::RequestTimeout,
                                    "Request timed out after " + std::to_string(timeout_.count()) + " ms",
                                    model_id_}));
        resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

    void fail(beast::error_code ec, const char* what) {
        if (done_) {
            return;
        }
        finish(tl::unexpected(Error{ErrorCode::TransportFailure,
                                    std::string(what) + " failed: " + ec.message(),
                                    model_id_}));
    }

    void finish(Expected<std::string> output) {
        if (done_) {
            return;
        }
        done_ = true;
        deadline_.cancel();
        promise_.set_value(Completion{std::move(output), elapsed()});
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
    }

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    net::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;

    const OpenRouterConfig& config_;
    std::string model_id_;
    std::chrono::milliseconds timeout_;
    Clock::time_point started_;
    std::promise<Completion> promise_;
    bool done_ = false;
};

} // namespace

// ============================================================================
// Impl: I/O context and TLS state shared by all sessions
// ============================================================================

class OpenRouterGateway::Impl {
public:
    explicit Impl(OpenRouterConfig config)
        : config_(std::move(config))
        , ssl_ctx_(ssl::context::tls_client)
        , work_(net::make_work_guard(ioc_))
    {}

    ~Impl() {
        work_.reset();
        ioc_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    Expected<void> start() {
        if (config_.verify_peer) {
            beast::error_code ec;
            ssl_ctx_.set_default_verify_paths(ec);
            if (ec) {
                return tl::unexpected(Error{ErrorCode::TransportFailure,
                                            "Failed to load system CA certificates", ec.message()});
            }
        }

        io_thread_ = std::thread([this]() {
            for (;;) {
                try {
                    ioc_.run();
                    return;
                } catch (const std::exception& e) {
                    log::error("openrouter", std::string("I/O handler threw: ") + e.what());
                }
            }
        });
        return {};
    }

    std::future<Completion> submit(const std::string& model_id,
                                   const std::string& prompt,
                                   std::chrono::milliseconds timeout) {
        auto strand = net::make_strand(ioc_);
        auto session = std::make_shared<Session>(
            strand, ssl_ctx_, config_,
            model_id, OpenRouterGateway::build_request_body(model_id, prompt), timeout);
        auto future = session->get_future();
        net::post(strand, [session]() { session->start(); });
        return future;
    }

private:
    OpenRouterConfig config_;
    ssl::context ssl_ctx_;   // outlives ioc_: pending sessions reference it on teardown
    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    std::thread io_thread_;
};

// ============================================================================
// OpenRouterGateway
// ============================================================================

Expected<std::shared_ptr<OpenRouterGateway>> OpenRouterGateway::create(const OpenRouterConfig& config) {
    if (auto result = config.validate(); !result) {
        return tl::unexpected(result.error());
    }
    auto impl = std::make_unique<Impl>(config);
    if (auto result = impl->start(); !result) {
        return tl::unexpected(result.error());
    }
    return std::shared_ptr<OpenRouterGateway>(new OpenRouterGateway(std::move(impl)));
}

OpenRouterGateway::OpenRouterGateway(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl))
{}

OpenRouterGateway::~OpenRouterGateway() = default;

std::future<Completion> OpenRouterGateway::complete(
    const std::string& model_id,
    const std::string& prompt,
    std::chrono::milliseconds timeout
) {
    log::debug("openrouter", "request to " + model_id);
    return impl_->submit(model_id, prompt, timeout);
}

std::string OpenRouterGateway::build_request_body(const std::string& model_id, const std::string& prompt) {
    nlohmann::json body = {
        {"model", model_id},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })}
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Expected<std::string> OpenRouterGateway::parse_response(unsigned status, const std::string& body) {
    if (status < 200 || status >= 300) {
        return tl::unexpected(Error{ErrorCode::HttpError, "HTTP " + std::to_string(status), excerpt(body)});
    }

    try {
        auto doc = nlohmann::json::parse(body);
        if (doc.is_object() && doc.contains("error")) {
            const auto& err = doc["error"];
            std::string message = err.is_object() && err.contains("message") && err["message"].is_string()
                ? err["message"].get<std::string>()
                : err.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            return tl::unexpected(Error{ErrorCode::HttpError, "Provider error", excerpt(message)});
        }

        const auto& content = doc.at("choices").at(0).at("message").at("content");
        if (content.is_null()) {
            return tl::unexpected(Error{ErrorCode::EmptyResponse, "Response has no content"});
        }
        if (!content.is_string()) {
            return tl::unexpected(Error{ErrorCode::MalformedPayload, "Response content is not a string",
                                        excerpt(body)});
        }
        auto text = content.get<std::string>();
        if (conclave::detail::is_blank(text)) {
            return tl::unexpected(Error{ErrorCode::EmptyResponse, "Response content is empty"});
        }
        return text;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::MalformedPayload,
                                    std::string("Malformed response payload: ") + e.what(),
                                    excerpt(body)});
    }
}

} // namespace gateway
} // namespace conclave
