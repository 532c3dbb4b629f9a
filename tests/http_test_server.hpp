#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

// Loopback pprof stand-in. Serves one connection at a time on
// 127.0.0.1:<ephemeral port> from its own thread.
class HttpTestServer {
public:
    struct Reply {
        int status = 200;
        std::string body;
        // > 0: send the body one byte at a time with this gap
        std::chrono::milliseconds byte_interval{0};
    };

    explicit HttpTestServer(Reply reply)
        : reply_(std::move(reply)), acceptor_(ioc_) {
        namespace net = boost::asio;
        using tcp = net::ip::tcp;

        tcp::endpoint ep(net::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(ep.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen();
        acceptor_.non_blocking(true);
        port_ = acceptor_.local_endpoint().port();

        thread_ = std::thread([this] { serve(); });
    }

    ~HttpTestServer() { stop(); }

    HttpTestServer(const HttpTestServer&) = delete;
    HttpTestServer& operator=(const HttpTestServer&) = delete;

    void stop() {
        quit_.store(true);
        if (thread_.joinable()) thread_.join();
        boost::beast::error_code ignored;
        acceptor_.close(ignored);
    }

    int port() const { return port_; }
    int accepted() const { return accepted_.load(); }

    std::vector<std::string> targets() {
        std::lock_guard<std::mutex> lock(mutex_);
        return targets_;
    }

private:
    void serve() {
        namespace beast = boost::beast;
        namespace http = beast::http;
        using tcp = boost::asio::ip::tcp;

        while (!quit_.load()) {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }
            if (ec) continue;

            accepted_++;
            socket.non_blocking(false);
            handle(socket);
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    void handle(boost::asio::ip::tcp::socket& socket) {
        namespace beast = boost::beast;
        namespace http = beast::http;

        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::empty_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) return;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets_.emplace_back(req.target().data(), req.target().size());
        }

        if (reply_.byte_interval.count() == 0) {
            http::response<http::string_body> res{static_cast<http::status>(reply_.status), 11};
            res.set(http::field::content_type, "application/octet-stream");
            res.body() = reply_.body;
            res.prepare_payload();
            http::write(socket, res, ec);
            return;
        }

        std::string head = "HTTP/1.1 " + std::to_string(reply_.status) + " OK\r\n"
                           "Content-Type: application/octet-stream\r\n"
                           "Content-Length: " + std::to_string(reply_.body.size()) + "\r\n\r\n";
        boost::asio::write(socket, boost::asio::buffer(head), ec);
        for (char c : reply_.body) {
            if (ec || quit_.load()) return;
            std::this_thread::sleep_for(reply_.byte_interval);
            boost::asio::write(socket, boost::asio::buffer(&c, 1), ec);
        }
    }

    Reply reply_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    int port_ = 0;
    std::thread thread_;
    std::atomic<bool> quit_{false};
    std::atomic<int> accepted_{0};
    std::mutex mutex_;
    std::vector<std::string> targets_;
};
