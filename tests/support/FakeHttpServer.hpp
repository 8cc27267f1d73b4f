#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcp_host::test {

/**
 * @brief Loopback HTTP/1.1 server for transport tests (Boost.Beast)
 *
 * Serves one request per connection on 127.0.0.1 and an ephemeral port.
 * Requests are recorded; the reply comes from the handler.
 */
class FakeHttpServer {
public:
    struct Request {
        std::string method;
        std::string path;
        std::map<std::string, std::string> headers;  // Lower-cased names
        std::string body;
    };

    struct Reply {
        int status = 200;
        std::string body;
    };

    using Handler = std::function<Reply(const Request&)>;

    explicit FakeHttpServer(Handler handler);
    ~FakeHttpServer();

    FakeHttpServer(const FakeHttpServer&) = delete;
    FakeHttpServer& operator=(const FakeHttpServer&) = delete;

    int port() const { return port_; }
    std::string url(const std::string& path = "/mcp") const;

    std::vector<Request> requests() const;

private:
    using tcp = boost::asio::ip::tcp;

    void serve();
    void handle_session(tcp::socket socket);

    Handler handler_;
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    int port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<Request> requests_;
};

} // namespace mcp_host::test
