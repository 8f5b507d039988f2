#include <catch2/catch_test_macros.hpp>
#include "stream/curl_stream_transport.hpp"
#include "stream/httplib_stream_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <atomic>
#include <thread>

using namespace rulegate;

namespace {

UpstreamRequest short_timeouts(UpstreamRequest req) {
    req.timeouts.connect = std::chrono::milliseconds(500);
    req.timeouts.read = std::chrono::milliseconds(2000);
    req.timeouts.write = std::chrono::milliseconds(500);
    return req;
}

/// Local upstream: an SSE chat endpoint plus a few echo and error routes
struct LocalSseServer {
    httplib::Server server;
    std::thread thread;
    std::atomic<bool> stopping{false};
    int port = 0;

    LocalSseServer() {
        server.Post("/chat", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                [](size_t, httplib::DataSink& sink) {
                    sink.write("data: a\n\n", 9);
                    sink.write("data: [DONE]\n\n", 14);
                    sink.done();
                    return true;
                });
        });
        server.Post("/missing", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content(R"({"code":404})", "application/json");
        });
        server.Get("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.get_param_value("name") + "|" + req.get_param_value("page") + "|" +
                            req.get_header_value("Authorization"), "text/plain");
        });
        server.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.get_header_value("Content-Type") + "|" + req.body, "text/plain");
        });
        server.Get("/forever", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                [this](size_t, httplib::DataSink& sink) {
                    while (!stopping.load() && sink.is_writable()) {
                        if (!sink.write(": ping\n\n", 8)) break;
                        std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    }
                    sink.done();
                    return true;
                });
        });
        port = server.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~LocalSseServer() {
        stopping.store(true);
        server.stop();
        thread.join();
    }

    [[nodiscard]] std::string base() const { return "http://127.0.0.1:" + std::to_string(port); }
};

/// Drain a connection, returning the concatenated DATA bytes
std::string drain(IStreamConnection& conn) {
    std::string body;
    for (int i = 0; i < 200; ++i) {
        auto read = conn.read(std::chrono::milliseconds(50));
        if (read.status == StreamRead::Status::DATA) {
            body += read.data;
        } else if (read.status != StreamRead::Status::TIMEOUT) {
            break;
        }
    }
    return body;
}

UpstreamRequest chat_request(const std::string& path = "/chat") {
    UpstreamRequest req;
    req.method = "POST";
    req.path = path;
    req.body = R"({"q":"hi"})";
    req.content_type = "application/json";
    return short_timeouts(std::move(req));
}

} // namespace

// ============================================================================
// Both transports
// ============================================================================

TEST_CASE("Stream transports: unreachable upstream", "[stream][curl][httplib]") {
    const auto req = chat_request();

    SECTION("curl") {
        CurlStreamTransport transport({"http://127.0.0.1:1", true});
        auto opened = transport.open(req);
        REQUIRE(opened.is_error());
        CHECK(opened.error_category() == ErrorCategory::UPSTREAM_UNREACHABLE);
        CHECK(opened.error_message().find("(curl)") != std::string::npos);
    }

    SECTION("httplib") {
        HttplibStreamTransport transport({"http://127.0.0.1:1", true});
        auto opened = transport.open(req);
        REQUIRE(opened.is_error());
        CHECK(opened.error_category() == ErrorCategory::UPSTREAM_UNREACHABLE);
    }
}

TEST_CASE("Stream transports: chunked event stream from a live server", "[stream][curl][httplib]") {
    LocalSseServer sse;

    SECTION("curl") {
        CurlStreamTransport transport({sse.base(), true});
        CHECK(transport.name() == "curl");
        auto opened = transport.open(chat_request());
        REQUIRE(opened.is_ok());
        auto& conn = *opened.value();
        CHECK(conn.status() == 200);
        CHECK(header_value(conn.headers(), "content-type") == "text/event-stream");
        CHECK(drain(conn) == "data: a\n\ndata: [DONE]\n\n");
        conn.close();
        conn.close();
    }

    SECTION("httplib") {
        HttplibStreamTransport transport({sse.base(), true});
        CHECK(transport.name() == "httplib");
        auto opened = transport.open(chat_request());
        REQUIRE(opened.is_ok());
        auto& conn = *opened.value();
        CHECK(conn.status() == 200);
        CHECK(drain(conn) == "data: a\n\ndata: [DONE]\n\n");
        conn.close();
    }
}

// ============================================================================
// CurlStreamTransport
// ============================================================================

TEST_CASE("CurlStreamTransport: error statuses open normally", "[stream][curl]") {
    LocalSseServer sse;
    CurlStreamTransport transport({sse.base(), true});

    auto opened = transport.open(chat_request("/missing"));
    REQUIRE(opened.is_ok());
    CHECK(opened.value()->status() == 404);
    CHECK(header_value(opened.value()->headers(), "Content-Type") == "application/json");
    CHECK(drain(*opened.value()) == R"({"code":404})");
}

TEST_CASE("CurlStreamTransport: request line, headers and body", "[stream][curl]") {
    LocalSseServer sse;
    CurlStreamTransport transport({sse.base(), true});

    SECTION("Query parameters are encoded") {
        UpstreamRequest req;
        req.method = "GET";
        req.path = "/echo";
        req.params.emplace("name", "a b&c");
        req.params.emplace("page", "2");
        req.headers.emplace("Authorization", "tok-1");
        req.headers.emplace("Content-Length", "999");
        auto opened = transport.open(short_timeouts(std::move(req)));
        REQUIRE(opened.is_ok());
        CHECK(drain(*opened.value()) == "a b&c|2|tok-1");
    }

    SECTION("Raw query wins over params") {
        UpstreamRequest req;
        req.method = "GET";
        req.path = "/echo";
        req.raw_query = "name=x%20y&page=7";
        req.params.emplace("name", "ignored");
        auto opened = transport.open(short_timeouts(std::move(req)));
        REQUIRE(opened.is_ok());
        CHECK(drain(*opened.value()) == "x y|7|");
    }

    SECTION("POST body and content type") {
        auto opened = transport.open(chat_request("/echo"));
        REQUIRE(opened.is_ok());
        CHECK(drain(*opened.value()) == R"(application/json|{"q":"hi"})");
    }
}

TEST_CASE("CurlStreamTransport: handles go back to the pool", "[stream][curl]") {
    LocalSseServer sse;
    CurlStreamTransport transport({sse.base(), true});
    CHECK(transport.idle_handles() == 0);

    for (int i = 0; i < 3; ++i) {
        auto opened = transport.open(chat_request());
        REQUIRE(opened.is_ok());
        CHECK(drain(*opened.value()) == "data: a\n\ndata: [DONE]\n\n");
        opened.value().reset();
        CHECK(transport.idle_handles() == 1);
    }
}

TEST_CASE("CurlStreamTransport: close() aborts an endless stream", "[stream][curl]") {
    LocalSseServer sse;
    CurlStreamTransport transport({sse.base(), true});

    UpstreamRequest req;
    req.method = "GET";
    req.path = "/forever";
    auto opened = transport.open(short_timeouts(std::move(req)));
    REQUIRE(opened.is_ok());

    auto read = opened.value()->read(std::chrono::milliseconds(1000));
    REQUIRE(read.status == StreamRead::Status::DATA);
    CHECK(read.data.starts_with(": ping"));

    const auto before = std::chrono::steady_clock::now();
    opened.value()->close();
    opened.value().reset();
    CHECK(std::chrono::steady_clock::now() - before < std::chrono::seconds(3));
    CHECK(transport.idle_handles() == 1);
}
