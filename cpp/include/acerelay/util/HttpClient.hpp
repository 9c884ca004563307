#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace acerelay::util {

class HttpError : public std::runtime_error {
public:
    enum class Type {
        invalid_url,
        timeout,
        connect_failed,
        protocol,
    };

    HttpError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

private:
    Type type_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url);

// Blocking HTTP/1.1 client. Every call runs on its own io_context, so callers
// on different threads never share state. Connect, handshake and each
// read or write are bounded by the timeout.
class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpClient();

    HttpResponse fetch(HttpRequest request,
                       const ParsedUrl& url,
                       std::chrono::milliseconds timeout);

    HttpResponse fetch(boost::beast::http::verb method,
                       const std::string& url,
                       std::chrono::milliseconds timeout);

    HttpResponse get(const std::string& url, std::chrono::milliseconds timeout);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace acerelay::util
