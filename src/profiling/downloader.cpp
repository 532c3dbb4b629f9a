#include "downloader.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <array>
#include <condition_variable>
#include <limits>
#include <memory>
#include <mutex>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

const char* download_error_name(DownloadError error) {
    switch (error) {
        case DownloadError::None:            return "none";
        case DownloadError::UnsupportedKind: return "unsupported-kind";
        case DownloadError::Aborted:         return "aborted";
        case DownloadError::Canceled:        return "canceled";
        case DownloadError::RemoteError:     return "remote-error";
        case DownloadError::TransportError:  return "transport-error";
        case DownloadError::SinkError:       return "sink-error";
    }
    return "unknown";
}

DownloadResult DownloadResult::Ok(uint64_t bytes) {
    DownloadResult r;
    r.status_code = 200;
    r.bytes = bytes;
    return r;
}

DownloadResult DownloadResult::Err(DownloadError error, const std::string& message) {
    DownloadResult r;
    r.error = error;
    r.message = message;
    return r;
}

DownloadResult DownloadResult::Remote(int status_code, const std::string& body) {
    DownloadResult r;
    r.error = DownloadError::RemoteError;
    r.status_code = status_code;
    r.body = body;
    r.message = fmt::format("download error: {}, code {}", body, status_code);
    return r;
}

// ── Fetch operation ───────────────────────────────────────
// One GET on a private io_context. Every completion handler checks the
// canceled flag first: a close posted by the stop gate surfaces as an
// aborted read, but the flag is what classifies it.

namespace {

class FetchOp {
public:
    FetchOp(const std::string& host, int port, const std::string& target, std::ostream& sink)
        : stream_(ioc_), sink_(sink), target_(target),
          endpoint_(net::ip::make_address(host), static_cast<unsigned short>(port)) {
        request_.version(11);
        request_.method(http::verb::get);
        request_.target(target);
        request_.set(http::field::host, fmt::format("localhost:{}", port));
        request_.set(http::field::user_agent, fmt::format("knadmin/{}", KNADMIN_VERSION));
        parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    // Thread-safe: may be called from the thread signaling the stop gate.
    void cancel() {
        canceled_.store(true);
        net::post(ioc_, [this] { close(); });
    }

    DownloadResult run() {
        if (canceled_.load()) return canceled_result(net::error::operation_aborted);
        stream_.async_connect(endpoint_, [this](beast::error_code ec) { on_connect(ec); });
        ioc_.run();
        return result_;
    }

private:
    void on_connect(beast::error_code ec) {
        if (canceled_.load()) return finish(canceled_result(ec));
        if (ec) return finish(transport_result("connect", ec));

        http::async_write(stream_, request_,
            [this](beast::error_code ec, std::size_t) { on_write(ec); });
    }

    void on_write(beast::error_code ec) {
        if (canceled_.load()) return finish(canceled_result(ec));
        if (ec) return finish(transport_result("write request", ec));

        http::async_read_header(stream_, buffer_, parser_,
            [this](beast::error_code ec, std::size_t) { on_header(ec); });
    }

    void on_header(beast::error_code ec) {
        if (canceled_.load()) return finish(canceled_result(ec));
        if (ec) return finish(transport_result("read response header", ec));

        status_ = parser_.get().result_int();
        knadmin_log(fmt::format("ProfileDownloader: GET {} -> {}", target_, status_));
        if (parser_.is_done()) return complete();
        read_body();
    }

    void read_body() {
        parser_.get().body().data = chunk_.data();
        parser_.get().body().size = chunk_.size();
        http::async_read_some(stream_, buffer_, parser_,
            [this](beast::error_code ec, std::size_t) { on_body(ec); });
    }

    void on_body(beast::error_code ec) {
        // buffer_body reports a full chunk as need_buffer
        if (ec == http::error::need_buffer) ec = {};
        if (canceled_.load()) return finish(canceled_result(ec));
        if (ec) return finish(transport_result("read response body", ec));

        size_t n = chunk_.size() - parser_.get().body().size;
        if (n > 0) {
            if (status_ != 200) {
                error_body_.append(chunk_.data(), n);
            } else {
                sink_.write(chunk_.data(), static_cast<std::streamsize>(n));
                if (!sink_) {
                    return finish(DownloadResult::Err(DownloadError::SinkError,
                        fmt::format("failed to write profile data after {} bytes", copied_)));
                }
                copied_ += n;
            }
        }

        if (parser_.is_done()) return complete();
        read_body();
    }

    void complete() {
        if (status_ != 200) return finish(DownloadResult::Remote(status_, error_body_));
        sink_.flush();
        if (!sink_) {
            return finish(DownloadResult::Err(DownloadError::SinkError,
                fmt::format("failed to flush profile data after {} bytes", copied_)));
        }
        finish(DownloadResult::Ok(copied_));
    }

    void finish(DownloadResult result) {
        result_ = std::move(result);
        close();
    }

    void close() {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
    }

    DownloadResult canceled_result(beast::error_code ec) const {
        std::string cause = ec ? ec.message() : "stop requested";
        return DownloadResult::Err(DownloadError::Canceled,
            fmt::format("download canceled: {} (after {} bytes)", cause, copied_));
    }

    DownloadResult transport_result(const char* step, beast::error_code ec) const {
        return DownloadResult::Err(DownloadError::TransportError,
            fmt::format("failed to {} from localhost:{}: {}", step, endpoint_.port(), ec.message()));
    }

    net::io_context ioc_;
    beast::tcp_stream stream_;
    std::ostream& sink_;
    std::string target_;
    tcp::endpoint endpoint_;
    http::request<http::empty_body> request_;
    http::response_parser<http::buffer_body> parser_;
    beast::flat_buffer buffer_;
    std::array<char, DOWNLOAD_BUF_SIZE> chunk_{};
    std::atomic<bool> canceled_{false};
    int status_ = 0;
    uint64_t copied_ = 0;
    std::string error_body_;
    DownloadResult result_;
};

} // namespace

// ── ProfileDownloader ─────────────────────────────────────

ProfileDownloader::ProfileDownloader(int local_port, std::string host)
    : local_port_(local_port), host_(std::move(host)) {}

ProfileDownloader::FirstSignal ProfileDownloader::wait_for_gates() {
    std::mutex mtx;
    std::condition_variable cv;
    FirstSignal first = FirstSignal::None;

    auto decide = [&](FirstSignal which) {
        std::lock_guard<std::mutex> lock(mtx);
        if (first == FirstSignal::None) first = which;
        cv.notify_all();
    };

    // Subscribe to stop first so an already-signaled stop wins over an
    // already-signaled ready.
    auto on_stop = stop_.subscribe([&] { decide(FirstSignal::Stop); });
    auto on_ready = ready_.subscribe([&] { decide(FirstSignal::Ready); });

    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [&] { return first != FirstSignal::None; });
    return first;
}

DownloadResult ProfileDownloader::download(ProfileKind kind, std::ostream& sink,
                                           const DownloadOptions& options) {
    auto endpoint = profile_endpoint(kind);
    if (!endpoint) {
        return DownloadResult::Err(DownloadError::UnsupportedKind,
            fmt::format("unsupported profiling type {}", static_cast<int>(kind)));
    }

    std::string target = *endpoint;
    if (options.seconds) {
        target += fmt::format("?seconds={}", *options.seconds);
    }

    state_.store(DownloadState::WaitingForReady);
    if (wait_for_gates() == FirstSignal::Stop) {
        state_.store(DownloadState::Aborted);
        knadmin_log(fmt::format("ProfileDownloader: {} aborted before the endpoint was ready",
                                profile_name(kind)));
        return DownloadResult::Err(DownloadError::Aborted,
            "download failed: stopped before the profiling endpoint was ready");
    }

    state_.store(DownloadState::Fetching);
    auto result = fetch(target, sink);
    state_.store(DownloadState::Done);

    if (result.failed()) {
        knadmin_log(fmt::format("ProfileDownloader: {} failed ({}): {}", profile_name(kind),
                                download_error_name(result.error), result.message));
    }
    return result;
}

DownloadResult ProfileDownloader::fetch(const std::string& target, std::ostream& sink) {
    std::unique_ptr<FetchOp> op;
    try {
        op = std::make_unique<FetchOp>(host_, local_port_, target, sink);
    } catch (const std::exception& e) {
        return DownloadResult::Err(DownloadError::TransportError,
            fmt::format("invalid download endpoint {}:{}: {}", host_, local_port_, e.what()));
    }

    // Declared after op so it unsubscribes before op is destroyed.
    auto on_stop = stop_.subscribe([&op] { op->cancel(); });
    return op->run();
}
