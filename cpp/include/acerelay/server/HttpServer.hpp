#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace acerelay::server {

class Router;

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io,
               std::shared_ptr<Router> router,
               std::string host,
               unsigned short port);

    // Binds and starts accepting. Port 0 picks a free port, see port().
    void start();
    void stop();

    [[nodiscard]] unsigned short port() const noexcept { return boundPort_.load(); }

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    std::string host_;
    unsigned short port_{};
    std::atomic<unsigned short> boundPort_{0};
    std::atomic<bool> running_{false};
};

} // namespace acerelay::server
