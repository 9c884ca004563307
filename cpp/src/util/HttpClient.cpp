#include "acerelay/util/HttpClient.hpp"
#include "acerelay/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace acerelay::util {
namespace {
constexpr unsigned kHttpVersion = 11;
constexpr std::uint64_t kBodyLimit = 64ull * 1024 * 1024;

std::string hostHeader(const ParsedUrl& parsed) {
    if ((parsed.scheme == "http" && parsed.port == "80") ||
        (parsed.scheme == "https" && parsed.port == "443")) {
        return parsed.host;
    }
    return parsed.host + ":" + parsed.port;
}

// Runs one asynchronous operation to completion on `io`.
template <typename Initiate>
boost::system::error_code runToCompletion(boost::asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    return result;
}

void throwOnError(const boost::system::error_code& ec, const ParsedUrl& url, std::string_view stage) {
    if (!ec) {
        return;
    }
    const std::string where = url.scheme + "://" + hostHeader(url) + url.target;
    if (ec == boost::beast::error::timeout) {
        throw HttpError(HttpError::Type::timeout, std::string(stage) + " timed out: " + where);
    }
    if (stage == "connect" || stage == "handshake") {
        throw HttpError(HttpError::Type::connect_failed,
                        std::string(stage) + " failed for " + where + ": " + ec.message());
    }
    throw HttpError(HttpError::Type::protocol, std::string(stage) + " failed for " + where + ": " + ec.message());
}

template <typename Stream>
HttpClient::HttpResponse exchange(boost::asio::io_context& io,
                                  Stream& stream,
                                  boost::beast::tcp_stream& lowest,
                                  HttpClient::HttpRequest& request,
                                  const ParsedUrl& url,
                                  std::chrono::milliseconds timeout) {
    lowest.expires_after(timeout);
    auto ec = runToCompletion(io, [&](auto handler) {
        boost::beast::http::async_write(stream, request, std::move(handler));
    });
    throwOnError(ec, url, "write");

    boost::beast::flat_buffer buffer;
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(kBodyLimit);
    ec = runToCompletion(io, [&](auto handler) {
        boost::beast::http::async_read(stream, buffer, parser, std::move(handler));
    });
    throwOnError(ec, url, "read");
    return parser.release();
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw HttpError(HttpError::Type::invalid_url, "URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw HttpError(HttpError::Type::invalid_url, "Unsupported URL scheme: " + url);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw HttpError(HttpError::Type::invalid_url, "URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

HttpClient::HttpResponse HttpClient::fetch(HttpRequest request,
                                           const ParsedUrl& url,
                                           std::chrono::milliseconds timeout) {
    request.version(kHttpVersion);
    request.set(boost::beast::http::field::host, hostHeader(url));
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.keep_alive(false);

    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    boost::asio::ip::tcp::resolver::results_type results;
    boost::system::error_code ec = runToCompletion(io, [&](auto handler) {
        resolver.async_resolve(url.host, url.port,
                               [&results, handler = std::move(handler)](boost::system::error_code resolveEc,
                                                                         boost::asio::ip::tcp::resolver::results_type found) mutable {
                                   results = std::move(found);
                                   handler(resolveEc);
                               });
    });
    throwOnError(ec, url, "connect");

    if (url.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw HttpError(HttpError::Type::connect_failed, "Failed to set SNI host name for " + url.host);
        }
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        ec = runToCompletion(io, [&](auto handler) { lowest.async_connect(results, std::move(handler)); });
        throwOnError(ec, url, "connect");

        lowest.expires_after(timeout);
        ec = runToCompletion(io, [&](auto handler) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });
        throwOnError(ec, url, "handshake");

        auto response = exchange(io, stream, lowest, request, url, timeout);

        lowest.expires_after(timeout);
        ec = runToCompletion(io, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
            log(LogLevel::trace, "TLS shutdown for " + url.host + ": " + ec.message());
        }
        return response;
    }

    boost::beast::tcp_stream stream(io);
    stream.expires_after(timeout);
    ec = runToCompletion(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
    throwOnError(ec, url, "connect");

    auto response = exchange(io, stream, stream, request, url, timeout);

    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return response;
}

HttpClient::HttpResponse HttpClient::fetch(boost::beast::http::verb method,
                                           const std::string& url,
                                           std::chrono::milliseconds timeout) {
    const auto parsed = parseUrl(url);
    return fetch(HttpRequest{method, parsed.target, kHttpVersion}, parsed, timeout);
}

HttpClient::HttpResponse HttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
    return fetch(boost::beast::http::verb::get, url, timeout);
}

} // namespace acerelay::util
