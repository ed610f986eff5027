#pragma once
#include "cancel_context.hpp"
#include "mcp_dispatcher.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct ListenOptions {
    std::string address{"0.0.0.0"};
    unsigned short port{8080};
    std::string target{"/mcp-completion"};
    bool use_tls{false};
    std::string cert_file{"server.crt"};
    std::string key_file{"server.key"};
};

// MCP endpoint over HTTP POST, plus JSON-RPC over a WebSocket upgrade on the
// same path. One thread per connection; no queueing.
class HttpServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    HttpServer(McpDispatcher& dispatcher, CancelContext::Ptr root);
    ~HttpServer();

    bool start(const ListenOptions& opts, std::string& error);

    // Stops accepting, cancels the root context and closes open connections.
    // Logs sessions still running after grace, then joins every session
    // thread before returning.
    void stop(std::chrono::milliseconds grace = std::chrono::seconds(30));

    unsigned short bound_port() const { return bound_port_; }
    int active_sessions() const { return active_sessions_.load(); }

    // Answers one plain HTTP request (no upgrade).
    Response handle_request(const Request& req) const;

private:
    struct Session {
        std::thread th;
        int fd{-1};
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void do_accept();
    void spawn_session(boost::asio::ip::tcp::socket socket);
    void run_session(boost::asio::ip::tcp::socket socket);
    void reap_finished_sessions();

    template <class Stream>
    void serve(Stream& stream);
    template <class Stream>
    void serve_websocket(Stream& stream, Request req);

    bool matches_target(boost::beast::string_view target) const;

    McpDispatcher& dispatcher_;
    CancelContext::Ptr root_;
    ListenOptions opts_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_{ioc_};
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    unsigned short bound_port_{0};

    std::mutex sessions_mtx_;
    std::condition_variable sessions_cv_;
    std::list<Session> sessions_;
    std::atomic<int> active_sessions_{0};
};
