#include <catch2/catch_test_macros.hpp>
#include "chatgate/llm/adapters/openai.hpp"
#include "chatgate/net/httplib_transport.hpp"
#include "chatgate/net/sse_parser.hpp"
#include "mock_http_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace chatgate::net;

TEST_CASE("HTTP status codes map to error codes", "[http]") {
    REQUIRE(error_code_for_status(401) == ErrorCode::LLMAuthFailed);
    REQUIRE(error_code_for_status(403) == ErrorCode::LLMAuthFailed);
    REQUIRE(error_code_for_status(429) == ErrorCode::LLMRateLimited);
    REQUIRE(error_code_for_status(408) == ErrorCode::Timeout);
    REQUIRE(error_code_for_status(400) == ErrorCode::LLMInvalidRequest);
    REQUIRE(error_code_for_status(404) == ErrorCode::LLMInvalidRequest);
    REQUIRE(error_code_for_status(500) == ErrorCode::LLMProviderUnavailable);
    REQUIRE(error_code_for_status(503) == ErrorCode::LLMProviderUnavailable);
    REQUIRE(error_code_for_status(302) == ErrorCode::LLMInvalidResponse);
}

TEST_CASE("Refused connection is reported when opening", "[http]") {
    HttplibTransport transport(std::chrono::seconds(2));

    HttpRequest request;
    request.base_url = "http://127.0.0.1:1";
    request.path = "/v1/chat/completions";
    request.body = "{}";
    request.timeout = std::chrono::seconds(5);

    auto connection = transport.open_stream(request);
    REQUIRE(connection.is_err());
    REQUIRE(connection.error().is_transport_error());
}

namespace {

// In-process SSE endpoint on an ephemeral loopback port
class LoopbackServer {
public:
    LoopbackServer() {
        server_.Post("/v1/chat/completions", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                [this](size_t, httplib::DataSink& sink) {
                    return stream_events(sink);
                });
        });
        server_.Post("/trickle", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                [this](size_t, httplib::DataSink& sink) {
                    return trickle(sink);
                });
        });
        server_.Post("/finite", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("data: one\n\ndata: two\n\ndata: [DONE]\n\n", "text/event-stream");
        });
        server_.Post("/unauthorized", [](const httplib::Request&, httplib::Response& res) {
            res.status = 401;
            res.set_content(R"({"error":{"message":"bad key"}})", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LoopbackServer() {
        stopping_ = true;
        server_.stop();
        thread_.join();
    }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    bool wait_for_disconnect(std::chrono::milliseconds limit) const {
        auto until = std::chrono::steady_clock::now() + limit;
        while (!disconnected_ && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return disconnected_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> disconnected_{false};

    // One delta, then keep-alive comments until the client goes away
    bool stream_events(httplib::DataSink& sink) {
        std::string first = "data: " + chatgate::testing::delta_unit("first") + "\n\n";
        if (!sink.write(first.data(), first.size())) {
            disconnected_ = true;
            return false;
        }
        while (!stopping_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            if (!sink.write(": ping\n\n", 8)) {
                disconnected_ = true;
                return false;
            }
        }
        return false;
    }

    // Comments only, never an event
    bool trickle(httplib::DataSink& sink) {
        while (!stopping_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (!sink.write(": ping\n\n", 8)) {
                return false;
            }
        }
        return false;
    }
};

HttpRequest loopback_request(const LoopbackServer& server, const std::string& path, int timeout_seconds) {
    HttpRequest request;
    request.base_url = server.base_url();
    request.path = path;
    request.body = "{}";
    request.timeout = std::chrono::seconds(timeout_seconds);
    return request;
}

}  // namespace

TEST_CASE("Body fragments are handed over until the end of the response", "[http]") {
    LoopbackServer server;
    HttplibTransport transport;

    auto connection = transport.open_stream(loopback_request(server, "/finite", 10));
    REQUIRE(connection.is_ok());
    auto conn = std::move(connection).value();

    std::string body;
    while (true) {
        auto fragment = conn->read();
        REQUIRE(fragment.is_ok());
        if (!fragment.value()) break;
        body += *fragment.value();
    }

    SseParser parser;
    auto events = parser.feed(body);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].data == "one");
    REQUIRE(events[2].data == "[DONE]");

    conn->close();
    REQUIRE(conn->is_closed());
}

TEST_CASE("Error status is reported with the response body", "[http]") {
    LoopbackServer server;
    HttplibTransport transport;

    auto connection = transport.open_stream(loopback_request(server, "/unauthorized", 10));
    REQUIRE(connection.is_err());
    REQUIRE(connection.error().code == ErrorCode::LLMAuthFailed);
    REQUIRE(connection.error().message.find("bad key") != std::string::npos);
    REQUIRE(connection.error().context == "HTTP 401");
}

TEST_CASE("Abandoning a live stream disconnects from the server", "[http]") {
    LoopbackServer server;
    chatgate::core::OpenAIConfig config;
    config.api_key = "sk-test";
    config.base_url = server.base_url();
    config.timeout_seconds = 30;
    chatgate::llm::OpenAIAdapter adapter(
        config,
        chatgate::llm::TokenCounter(std::make_shared<chatgate::llm::ApproximateEncoder>()),
        std::make_shared<HttplibTransport>());

    auto started = std::chrono::steady_clock::now();
    {
        auto result = adapter.generate("ctx", {}, "hi");
        REQUIRE(result.is_ok());
        auto stream = std::move(result).value();
        REQUIRE(*stream.next().value() == "first");
    }
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(server.wait_for_disconnect(std::chrono::seconds(3)));
}

TEST_CASE("Closing a connection with a pending fragment returns promptly", "[http]") {
    LoopbackServer server;
    HttplibTransport transport;

    auto connection = transport.open_stream(loopback_request(server, "/v1/chat/completions", 30));
    REQUIRE(connection.is_ok());
    auto conn = std::move(connection).value();
    REQUIRE(conn->read().is_ok());

    // Let the reader fill the slot and block on the next fragment
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto started = std::chrono::steady_clock::now();
    conn->close();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    REQUIRE(conn->is_closed());
    REQUIRE(conn->read().is_err());
    REQUIRE(server.wait_for_disconnect(std::chrono::seconds(3)));
}

TEST_CASE("Total deadline ends a response that never finishes", "[http]") {
    LoopbackServer server;
    HttplibTransport transport;

    auto connection = transport.open_stream(loopback_request(server, "/trickle", 1));
    REQUIRE(connection.is_ok());
    auto conn = std::move(connection).value();

    auto started = std::chrono::steady_clock::now();
    Result<std::optional<std::string>, Error> fragment = conn->read();
    while (fragment.is_ok() && fragment.value()) {
        fragment = conn->read();
    }

    REQUIRE(fragment.is_err());
    REQUIRE(fragment.error().code == ErrorCode::Timeout);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
    REQUIRE(conn->is_closed());
}
