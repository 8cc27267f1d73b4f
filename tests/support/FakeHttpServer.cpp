#include "support/FakeHttpServer.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <stdexcept>

namespace mcp_host::test {

namespace beast = boost::beast;
namespace http = boost::beast::http;

FakeHttpServer::FakeHttpServer(Handler handler)
    : handler_(std::move(handler)), acceptor_(ioc_) {
    beast::error_code ec;
    const tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        throw std::runtime_error("acceptor open failed: " + ec.message());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(ep, ec);
    if (ec)
        throw std::runtime_error("bind failed: " + ec.message());
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec)
        throw std::runtime_error("listen failed: " + ec.message());

    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this]() { serve(); });
}

FakeHttpServer::~FakeHttpServer() {
    stopping_ = true;
    // A throwaway connection wakes the blocking accept()
    beast::error_code ec;
    tcp::socket waker{ioc_};
    waker.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"),
                                static_cast<unsigned short>(port_)}, ec);
    if (thread_.joinable()) {
        thread_.join();
    }
    waker.close(ec);
    acceptor_.close(ec);
}

std::string FakeHttpServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

std::vector<FakeHttpServer::Request> FakeHttpServer::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

void FakeHttpServer::serve() {
    while (!stopping_) {
        tcp::socket socket{ioc_};
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (stopping_) {
            return;
        }
        if (ec) {
            continue;
        }
        handle_session(std::move(socket));
    }
}

void FakeHttpServer::handle_session(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
        return;
    }

    Request request;
    request.method = std::string(req.method_string());
    request.path = std::string(req.target());
    for (const auto& field : req) {
        request.headers[boost::algorithm::to_lower_copy(std::string(field.name_string()))] =
            std::string(field.value());
    }
    request.body = req.body();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    Reply reply = handler_(request);

    http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = reply.body;
    res.keep_alive(false);
    res.prepare_payload();
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace mcp_host::test
