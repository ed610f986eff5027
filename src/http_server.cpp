// http_server.cpp
#include "http_server.hpp"
#include "app_log.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;

namespace {

constexpr std::uint64_t kBodyLimit = 8 * 1024 * 1024;

// Treat these errors as normal client disconnects (not server fatal)
bool is_normal_disconnect(const boost::system::error_code& ec) {
    if (!ec) return false;
    return ec == boost::asio::error::eof
        || ec == boost::asio::error::connection_reset
        || ec == boost::asio::error::connection_aborted
        || ec == boost::asio::error::broken_pipe
        || ec == boost::asio::error::operation_aborted
        || ec == boost::asio::error::not_connected
        || ec == boost::asio::ssl::error::stream_truncated
        || ec == http::error::end_of_stream
        || ec == websocket::error::closed;
}

HttpServer::Response make_response(const HttpServer::Request& req, http::status status,
                                   std::string body, const char* content_type = "application/json") {
    HttpServer::Response res{status, req.version()};
    res.set(http::field::server, "completion-bridge");
    res.keep_alive(req.keep_alive());
    if (!body.empty()) res.set(http::field::content_type, content_type);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

template <class Stream>
void close_transport(Stream& stream) {
    boost::system::error_code ec;
    beast::get_lowest_layer(stream).shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(stream).close(ec);
}

template <class Next>
void close_transport(ssl::stream<Next>& stream) {
    boost::system::error_code ec;
    if (beast::get_lowest_layer(stream).is_open()) {
        stream.shutdown(ec);
        if (ec && !is_normal_disconnect(ec) && ec.value() != EBADF) {
            log_error("http") << "SSL shutdown error: " << ec.message();
        }
    }
    beast::get_lowest_layer(stream).close(ec);
}

} // namespace

HttpServer::HttpServer(McpDispatcher& dispatcher, CancelContext::Ptr root)
    : dispatcher_(dispatcher), root_(root ? std::move(root) : CancelContext::background()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(const ListenOptions& opts, std::string& error) {
    if (running_) {
        error = "server already running";
        return false;
    }
    opts_ = opts;

    try {
        if (opts_.use_tls) {
            ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tlsv12_server);
            ssl_ctx_->use_certificate_chain_file(opts_.cert_file);
            ssl_ctx_->use_private_key_file(opts_.key_file, ssl::context::pem);
        }
    } catch (std::exception const& e) {
        error = std::string("TLS setup failed: ") + e.what();
        return false;
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(opts_.address, ec);
    if (ec) {
        error = "invalid bind address '" + opts_.address + "': " + ec.message();
        return false;
    }
    tcp::endpoint endpoint{address, opts_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        error = "acceptor.open error: " + ec.message();
        return false;
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        log_error("http") << "setting reuse_address failed: " << ec.message();
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        error = "bind error: " + ec.message();
        acceptor_.close(ec);
        return false;
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        error = "listen error: " + ec.message();
        acceptor_.close(ec);
        return false;
    }
    bound_port_ = acceptor_.local_endpoint(ec).port();

    running_ = true;
    do_accept();
    accept_thread_ = std::thread([this] { ioc_.run(); });

    log_info("http") << "Starting MCP " << (opts_.use_tls ? "HTTPS" : "HTTP") << " server on " << opts_.address << ":"
                     << bound_port_ << opts_.target;
    return true;
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (!running_) return;
        if (ec) {
            log_error("http") << "accept error: " << ec.message();
        } else {
            try {
                spawn_session(std::move(socket));
            } catch (std::exception const& e) {
                log_error("http") << "failed to start session: " << e.what();
            }
        }
        if (running_ && acceptor_.is_open()) do_accept();
    });
}

void HttpServer::spawn_session(tcp::socket socket) {
    reap_finished_sessions();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(sessions_mtx_);
    Session s;
    // A private duplicate: stop() may shut it down at any time without
    // racing the session closing (and the kernel reusing) the original.
    s.fd = ::fcntl(socket.native_handle(), F_DUPFD_CLOEXEC, 0);
    s.finished = finished;
    // The thread cannot report completion before this lock is released.
    s.th = std::thread([this, finished, socket = std::move(socket)]() mutable {
        run_session(std::move(socket));
        {
            std::lock_guard<std::mutex> done_lock(sessions_mtx_);
            *finished = true;
            active_sessions_--;
        }
        sessions_cv_.notify_all();
    });
    active_sessions_++;
    sessions_.push_back(std::move(s));
}

void HttpServer::reap_finished_sessions() {
    std::list<Session> done;
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->finished->load()) {
                auto next = std::next(it);
                done.splice(done.end(), sessions_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& s : done) {
        if (s.th.joinable()) s.th.join();
        if (s.fd >= 0) ::close(s.fd);
    }
}

void HttpServer::run_session(tcp::socket socket) {
    try {
        if (ssl_ctx_) {
            ssl::stream<tcp::socket> ssl_socket{std::move(socket), *ssl_ctx_};
            boost::system::error_code hs_ec;
            ssl_socket.handshake(ssl::stream_base::server, hs_ec);
            if (hs_ec) {
                if (is_normal_disconnect(hs_ec)) {
                    if (running_) log_info("http") << "SSL handshake aborted by client: " << hs_ec.message();
                } else {
                    log_error("http") << "SSL handshake error: " << hs_ec.message();
                }
                boost::system::error_code close_ec;
                ssl_socket.lowest_layer().close(close_ec);
                return;
            }
            serve(ssl_socket);
            close_transport(ssl_socket);
        } else {
            serve(socket);
            close_transport(socket);
        }
    } catch (std::exception const& e) {
        if (running_) log_error("http") << "connection handler exception: " << e.what();
    }
}

template <class Stream>
void HttpServer::serve(Stream& stream) {
    beast::flat_buffer buffer;
    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kBodyLimit);

        boost::system::error_code ec;
        http::read(stream, buffer, parser, ec);
        if (ec) {
            if (!is_normal_disconnect(ec) && running_) {
                log_error("http") << "read error: " << ec.message();
                if (ec == http::error::body_limit) {
                    Request dummy;
                    auto res = make_response(dummy, http::status::payload_too_large, R"({"error":"request too large"})");
                    res.keep_alive(false);
                    http::write(stream, res, ec);
                }
            }
            return;
        }

        Request req = parser.release();
        if (websocket::is_upgrade(req)) {
            if (!matches_target(req.target())) {
                auto res = make_response(req, http::status::not_found, R"({"error":"not found"})");
                res.keep_alive(false);
                http::write(stream, res, ec);
                return;
            }
            serve_websocket(stream, std::move(req));
            return;
        }

        Response res = handle_request(req);
        http::write(stream, res, ec);
        if (ec) {
            if (!is_normal_disconnect(ec)) log_error("http") << "write error: " << ec.message();
            return;
        }
        if (res.need_eof()) return;
    }
}

template <class Stream>
void HttpServer::serve_websocket(Stream& stream, Request req) {
    websocket::stream<Stream&> ws{stream};
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "completion-bridge");
    }));

    boost::system::error_code ec;
    ws.accept(req, ec);
    if (ec) {
        if (is_normal_disconnect(ec)) {
            if (running_) log_info("ws") << "WebSocket accept aborted by client: " << ec.message();
        } else {
            log_error("ws") << "WebSocket accept error: " << ec.message();
        }
        return;
    }
    log_info("ws") << "WebSocket session opened";

    beast::flat_buffer buffer;
    for (;;) {
        boost::system::error_code read_ec;
        ws.read(buffer, read_ec);
        if (read_ec) {
            if (is_normal_disconnect(read_ec)) {
                if (running_) log_info("ws") << "client disconnected (read): " << read_ec.message();
            } else {
                log_error("ws") << "WebSocket read error: " << read_ec.message();
            }
            return;
        }

        std::string s = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        auto out = dispatcher_.handle_text(s);
        if (!out) continue;

        ws.text(true);
        boost::system::error_code write_ec;
        ws.write(boost::asio::buffer(*out), write_ec);
        if (write_ec) {
            if (is_normal_disconnect(write_ec)) {
                if (running_) log_info("ws") << "client disconnected (write): " << write_ec.message();
            } else {
                log_error("ws") << "WebSocket write error: " << write_ec.message();
            }
            return;
        }
    }
}

bool HttpServer::matches_target(beast::string_view target) const {
    auto q = target.find('?');
    if (q != beast::string_view::npos) target = target.substr(0, q);
    return target == beast::string_view(opts_.target);
}

HttpServer::Response HttpServer::handle_request(const Request& req) const {
    if (!matches_target(req.target())) {
        return make_response(req, http::status::not_found, R"({"error":"not found"})");
    }
    if (req.method() != http::verb::post) {
        auto res = make_response(req, http::status::method_not_allowed, R"({"error":"method not allowed"})");
        res.set(http::field::allow, "POST");
        return res;
    }

    auto out = dispatcher_.handle_text(req.body());
    if (!out) {
        return make_response(req, http::status::accepted, "");
    }
    return make_response(req, http::status::ok, std::move(*out));
}

void HttpServer::stop(std::chrono::milliseconds grace) {
    bool was_running = running_.exchange(false);

    if (accept_thread_.joinable()) {
        // Closing the acceptor aborts the pending accept and lets run() return.
        boost::asio::post(ioc_, [this] {
            boost::system::error_code ec;
            acceptor_.close(ec);
        });
        accept_thread_.join();
    }
    if (!was_running) return;

    log_info("http") << "Shutting down server...";
    root_->cancel();

    // Unblock sessions waiting on idle keep-alive connections.
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        for (auto& s : sessions_) {
            if (!s.finished->load() && s.fd >= 0) ::shutdown(s.fd, SHUT_RDWR);
        }
    }

    bool drained;
    {
        std::unique_lock<std::mutex> lock(sessions_mtx_);
        drained = sessions_cv_.wait_for(lock, grace, [this] { return active_sessions_.load() == 0; });
    }

    if (!drained) {
        // The root is cancelled and every socket is shut down, so the
        // remaining sessions return once their executions are killed.
        log_error("http") << "Sessions still running after grace period: " << active_sessions_.load()
                          << "; waiting for them to finish";
    }

    std::list<Session> remaining;
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        remaining.swap(sessions_);
    }
    for (auto& s : remaining) {
        if (s.th.joinable()) s.th.join();
        if (s.fd >= 0) ::close(s.fd);
    }
    log_info("http") << "Server shutdown complete";
}
