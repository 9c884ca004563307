#include "acerelay/server/HttpServer.hpp"
#include "acerelay/server/Router.hpp"
#include "acerelay/server/RequestContext.hpp"
#include "acerelay/util/JsonResponse.hpp"
#include "acerelay/util/Logging.hpp"
#include "acerelay/util/ServiceError.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace acerelay::server {
namespace {

namespace http = boost::beast::http;

constexpr auto kIdleTimeout = std::chrono::seconds(60);

std::string_view toStd(boost::beast::string_view value) {
    return {value.data(), value.size()};
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

void setJsonError(RequestContext& ctx, unsigned status, std::string_view message) {
    ctx.response.result(status);
    ctx.response.set(http::field::content_type, "application/json");
    ctx.response.body() = util::makeMessageBody(message);
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Router> router)
        : stream_(std::move(socket)), router_(std::move(router)) {}

    void start() { readRequest(); }

private:
    void readRequest() {
        request_ = {};
        stream_.expires_after(kIdleTimeout);
        http::async_read(stream_, buffer_, request_,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                self->dispatch();
            }));
    }

    void dispatch() {
        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = std::move(request_);
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());
        ctx.response.set(http::field::server, "acerelay");

        std::unordered_map<std::string, std::string> params;
        auto handler = router_->resolve(toStd(ctx.request.method_string()), toStd(ctx.request.target()), params);
        ctx.pathParameters = std::move(params);

        if (!handler) {
            setJsonError(ctx, 404, "not_found");
        } else {
            invoke(handler, ctx);
            if (ctx.response.body().empty() && ctx.response.result() == http::status::unknown) {
                ctx.response.result(http::status::no_content);
            }
        }

        wrapJsonEnvelope(ctx);
        ctx.response.prepare_payload();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.startedAt);
        util::log(util::LogLevel::trace,
                  std::string(toStd(ctx.request.method_string())) + " " + std::string(toStd(ctx.request.target())) + " -> " +
                      std::to_string(ctx.response.result_int()) + " (" + std::to_string(elapsed.count()) + "ms)");

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        http::async_write(stream_, *response,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                if (!response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            }));
    }

    static void invoke(const Router::Handler& handler, RequestContext& ctx) {
        try {
            handler(ctx);
        } catch (const util::ServiceError& ex) {
            setJsonError(ctx, static_cast<unsigned>(ex.status()), ex.what());
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error,
                      "Unhandled error for " + std::string(toStd(ctx.request.target())) + ": " + ex.what());
            setJsonError(ctx, 500, "internal_error");
        }
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    // JSON bodies under /api are wrapped in the success/error envelope. A
    // handler can opt out with "X-Api-Envelope: skip".
    void wrapJsonEnvelope(RequestContext& ctx) {
        auto& response = ctx.response;
        const bool skip = [&response] {
            auto header = response.find("X-Api-Envelope");
            if (header == response.end()) {
                return false;
            }
            const bool flag = toLower(std::string(header->value())) == "skip";
            response.erase(header);
            return flag;
        }();
        if (skip || response.body().empty()) {
            return;
        }

        auto contentTypeIt = response.find(http::field::content_type);
        if (contentTypeIt == response.end() ||
            toLower(std::string(contentTypeIt->value())).find("application/json") == std::string::npos) {
            return;
        }

        const auto fullTarget = toStd(ctx.request.target());
        std::string target(fullTarget.substr(0, fullTarget.find('?')));
        if (target.rfind("/api/", 0) != 0) {
            return;
        }

        const bool success = response.result_int() >= 200 && response.result_int() < 400;

        boost::json::value parsed;
        try {
            parsed = boost::json::parse(response.body());
        } catch (const std::exception&) {
            parsed = boost::json::value(boost::json::string(response.body()));
        }

        std::string message;
        boost::json::value details;
        if (!success && parsed.is_object()) {
            auto& object = parsed.as_object();
            if (auto it = object.if_contains("message"); it && it->is_string()) {
                message = std::string(it->as_string().c_str());
                object.erase("message");
            }
            if (!object.empty()) {
                details = parsed;
            }
        } else if (!success) {
            details = parsed;
        }

        boost::json::object envelope = success
            ? util::makeSuccessResponse(parsed, target)
            : util::makeErrorDetails(message, details, target);

        response.body() = boost::json::serialize(envelope);
        response.set(http::field::content_type, "application/json; charset=utf-8");
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    RequestContext::HttpRequest request_;
    std::shared_ptr<Router> router_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<Router> router,
                       std::string host,
                       unsigned short port)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , host_(std::move(host))
    , port_(port) {}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(host_), port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    boundPort_ = acceptor_.local_endpoint().port();

    util::log(util::LogLevel::info, "Listening on " + host_ + ":" + std::to_string(boundPort_.load()));
    doAccept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        boost::system::error_code ec;
        self->acceptor_.cancel(ec);
        self->acceptor_.close(ec);
    });
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }

            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), self->router_)->start();
            }

            self->doAccept();
        });
}

} // namespace acerelay::server
