#include <http_server.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <boost/asio/connect.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <thread>

namespace {

using namespace std::chrono_literals;
using json = nlohmann::json;
using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

class UpperExecutor : public IExecutor {
public:
    ExecResult execute(const std::string&, const std::vector<std::string>& args,
                       const CancelContext::Ptr&) override
    {
        ExecResult r;
        r.status = ExecStatus::Output;
        r.exit_code = 0;
        r.output = args.empty() ? "" : args.back();
        for (auto& c : r.output) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return r;
    }
};

LlamaCliConfig prompt_only()
{
    LlamaCliConfig c;
    c.prompt = {"--prompt", ""};
    return c;
}

class HttpServerTest : public testing::Test {
protected:
    HttpServerTest()
        : root(CancelContext::with_cancel(CancelContext::background())),
          service(AppConfig{}, prompt_only(), std::make_shared<UpperExecutor>(), root),
          dispatcher(service),
          server(dispatcher, root)
    {
    }

    HttpServer::Request make_request(http::verb verb, const std::string& target, const std::string& body = "")
    {
        HttpServer::Request req{verb, target, 11};
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    CancelContext::Ptr root;
    CompletionService service;
    McpDispatcher dispatcher;
    HttpServer server;
};

const char* kPing = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

TEST_F(HttpServerTest, PostToEndpointAnswersJson)
{
    auto res = server.handle_request(make_request(http::verb::post, "/mcp-completion", kPing));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    auto body = json::parse(res.body());
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"], json::object());
}

TEST_F(HttpServerTest, QueryStringIsIgnoredWhenMatchingTarget)
{
    auto res = server.handle_request(make_request(http::verb::post, "/mcp-completion?session=1", kPing));
    EXPECT_EQ(res.result(), http::status::ok);
}

TEST_F(HttpServerTest, OtherPathIsNotFound)
{
    auto res = server.handle_request(make_request(http::verb::post, "/other", kPing));
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(HttpServerTest, NonPostIsMethodNotAllowed)
{
    auto res = server.handle_request(make_request(http::verb::get, "/mcp-completion"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "POST");
}

TEST_F(HttpServerTest, NotificationIsAcceptedWithoutBody)
{
    auto res = server.handle_request(
        make_request(http::verb::post, "/mcp-completion", R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    EXPECT_EQ(res.result(), http::status::accepted);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(HttpServerTest, MalformedBodyIsParseErrorOverHttp)
{
    auto res = server.handle_request(make_request(http::verb::post, "/mcp-completion", "{oops"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["error"]["code"], kParseError);
}

TEST_F(HttpServerTest, InvalidBindAddressFailsToStart)
{
    ListenOptions opts;
    opts.address = "not-an-address";
    opts.port = 0;
    std::string error;
    EXPECT_FALSE(server.start(opts, error));
    EXPECT_THAT(error, testing::HasSubstr("invalid bind address"));
}

TEST_F(HttpServerTest, MissingTlsFilesFailToStart)
{
    ListenOptions opts;
    opts.address = "127.0.0.1";
    opts.port = 0;
    opts.use_tls = true;
    opts.cert_file = "/nonexistent/server.crt";
    opts.key_file = "/nonexistent/server.key";
    std::string error;
    EXPECT_FALSE(server.start(opts, error));
    EXPECT_THAT(error, testing::HasSubstr("TLS setup failed"));
}

class LiveHttpServerTest : public HttpServerTest {
protected:
    void SetUp() override
    {
        ListenOptions opts;
        opts.address = "127.0.0.1";
        opts.port = 0;
        std::string error;
        ASSERT_TRUE(server.start(opts, error)) << error;
        ASSERT_NE(server.bound_port(), 0);
    }

    void TearDown() override { server.stop(5s); }

    tcp::socket connect()
    {
        tcp::socket socket{ioc};
        socket.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), server.bound_port()});
        return socket;
    }

    boost::asio::io_context ioc;
};

TEST_F(LiveHttpServerTest, ToolCallOverHttp)
{
    auto socket = connect();
    json call = {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                 {"params", {{"name", "generate_completion"}, {"arguments", {{"prompt", "hello"}}}}}};
    auto req = make_request(http::verb::post, "/mcp-completion", call.dump());
    req.set(http::field::host, "127.0.0.1");
    http::write(socket, req);

    beast::flat_buffer buffer;
    HttpServer::Response res;
    http::read(socket, buffer, res);
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["id"], 5);
    EXPECT_EQ(body["result"]["isError"], false);
    EXPECT_EQ(body["result"]["content"][0]["text"], "HELLO");
}

TEST_F(LiveHttpServerTest, KeepAliveServesSeveralRequests)
{
    auto socket = connect();
    beast::flat_buffer buffer;
    for (int i = 0; i < 3; ++i) {
        auto req = make_request(http::verb::post, "/mcp-completion", kPing);
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(true);
        http::write(socket, req);

        HttpServer::Response res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result(), http::status::ok);
    }
}

TEST_F(LiveHttpServerTest, WebSocketCarriesJsonRpc)
{
    websocket::stream<tcp::socket> ws{connect()};
    ws.handshake("127.0.0.1", "/mcp-completion");

    ws.text(true);
    ws.write(boost::asio::buffer(std::string(kPing)));

    beast::flat_buffer buffer;
    ws.read(buffer);
    auto body = json::parse(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"], json::object());

    ws.close(websocket::close_code::normal);
}

TEST_F(LiveHttpServerTest, StopClosesIdleConnections)
{
    auto socket = connect();
    auto req = make_request(http::verb::post, "/mcp-completion", kPing);
    req.set(http::field::host, "127.0.0.1");
    http::write(socket, req);
    beast::flat_buffer buffer;
    HttpServer::Response res;
    http::read(socket, buffer, res);

    auto t0 = std::chrono::steady_clock::now();
    server.stop(5s);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_EQ(server.active_sessions(), 0);
    EXPECT_TRUE(root->done());
}

TEST_F(LiveHttpServerTest, StopLeavesUnrelatedDescriptorsAlone)
{
    {
        auto socket = connect();
        auto req = make_request(http::verb::post, "/mcp-completion", kPing);
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(false);
        http::write(socket, req);
        beast::flat_buffer buffer;
        HttpServer::Response res;
        http::read(socket, buffer, res);
    }
    auto wait_until = std::chrono::steady_clock::now() + 5s;
    while (server.active_sessions() > 0 && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(server.active_sessions(), 0);

    // Likely to reuse the descriptor number the finished session closed.
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    server.stop(5s);

    char c = 'x';
    EXPECT_EQ(::send(sv[0], &c, 1, MSG_NOSIGNAL), 1);
    EXPECT_EQ(::recv(sv[1], &c, 1, 0), 1);
    EXPECT_EQ(::send(sv[1], &c, 1, MSG_NOSIGNAL), 1);
    EXPECT_EQ(::recv(sv[0], &c, 1, 0), 1);
    ::close(sv[0]);
    ::close(sv[1]);
}

// Ignores cancellation for a while, like a child that takes time to die.
class StubbornExecutor : public IExecutor {
public:
    ExecResult execute(const std::string&, const std::vector<std::string>&, const CancelContext::Ptr&) override
    {
        entered = true;
        std::this_thread::sleep_for(500ms);
        finished = true;
        ExecResult r;
        r.status = ExecStatus::Output;
        r.output = "late";
        return r;
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
};

TEST(HttpServerShutdown, SessionsOutlivingGraceAreJoined)
{
    auto root = CancelContext::with_cancel(CancelContext::background());
    auto executor = std::make_shared<StubbornExecutor>();
    CompletionService service(AppConfig{}, prompt_only(), executor, root);
    McpDispatcher dispatcher(service);
    HttpServer server(dispatcher, root);

    ListenOptions opts;
    opts.address = "127.0.0.1";
    opts.port = 0;
    std::string error;
    ASSERT_TRUE(server.start(opts, error)) << error;

    boost::asio::io_context ioc;
    tcp::socket socket{ioc};
    socket.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), server.bound_port()});
    json call = {{"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
                 {"params", {{"name", "generate_completion"}, {"arguments", {{"prompt", "slow"}}}}}};
    HttpServer::Request req{http::verb::post, "/mcp-completion", 11};
    req.set(http::field::host, "127.0.0.1");
    req.body() = call.dump();
    req.prepare_payload();
    http::write(socket, req);

    auto wait_until = std::chrono::steady_clock::now() + 5s;
    while (!executor->entered && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(executor->entered);

    server.stop(50ms);
    EXPECT_TRUE(executor->finished);
    EXPECT_EQ(server.active_sessions(), 0);
}

} // namespace
