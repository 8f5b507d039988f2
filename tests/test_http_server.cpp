#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "auth/static_identity_resolver.hpp"
#include "credential/credential_manager.hpp"
#include "hooks/hook_registry.hpp"
#include "routing/mount.hpp"
#include "stream/streaming_relay.hpp"
#include "upstream/request_forwarder.hpp"
#include "mocks/mock_upstream_client.hpp"
#include "mocks/scripted_stream_transport.hpp"
#include "mocks/silent_stream_transport.hpp"
#include "mocks/test_keys.hpp"

#include <regex>
#include <thread>

using namespace rulegate;
using rulegate::testing::MockUpstreamClient;
using rulegate::testing::ScriptedStreamTransport;
using rulegate::testing::SilentTransport;
using rulegate::testing::TestKeyPair;

namespace {

std::vector<ApiKeyUser> test_users() {
    ApiKeyUser alice;
    alice.api_key = "key-alice";
    alice.identity.user_id = "1";
    alice.identity.user_name = "alice";
    alice.identity.permissions = {"dataset:read"};

    ApiKeyUser bob;
    bob.api_key = "key-bob";
    bob.identity.user_id = "2";
    bob.identity.user_name = "bob";
    return {alice, bob};
}

HeaderMap bearer(const std::string& key) {
    return {{"Authorization", "Bearer " + key}};
}

struct ServerFixture {
    std::shared_ptr<MockUpstreamClient> upstream = std::make_shared<MockUpstreamClient>();
    std::shared_ptr<Mount> mount = std::make_shared<Mount>();
    std::shared_ptr<Pipeline> pipeline;
    std::unique_ptr<HttpServer> server;

    ServerFixture() {
        mount->name = "ragflow";
        mount->prefix = "/ragflow";
        Rule rule;
        rule.name = "list-datasets";
        rule.path_pattern = "/v1/datasets";
        rule.permission = Requirement::single("dataset:read");
        REQUIRE(mount->rules.add(rule).is_ok());
        mount->forwarder = std::make_shared<RequestForwarder>(upstream, UpstreamTimeouts{});

        pipeline = PipelineBuilder()
            .with_hooks(std::make_shared<HookRegistry>(HookRegistry::with_builtins()))
            .with_request_logging(false)
            .build();
        server = std::make_unique<HttpServer>(pipeline, std::vector<std::shared_ptr<Mount>>{mount},
            std::make_shared<StaticIdentityResolver>(test_users()), ServerConfig{});
    }

    GatewayResponse call(HeaderMap headers, std::string sub_path = "/v1/datasets") {
        InboundRequest in;
        in.method = "GET";
        in.sub_path = std::move(sub_path);
        in.headers = std::move(headers);
        return server->dispatch(*mount, std::move(in));
    }
};

} // namespace

// ============================================================================
// StaticIdentityResolver
// ============================================================================

TEST_CASE("StaticIdentityResolver: bearer API keys", "[auth]") {
    StaticIdentityResolver resolver(test_users());
    CHECK(resolver.size() == 2);

    SECTION("Known key") {
        auto identity = resolver.resolve(bearer("key-alice"));
        REQUIRE(identity.has_value());
        CHECK(identity->user_name == "alice");
        CHECK(identity->permissions.contains("dataset:read"));
    }

    SECTION("Header name in any case, padded key") {
        auto identity = resolver.resolve({{"authorization", "Bearer  key-bob "}});
        REQUIRE(identity.has_value());
        CHECK(identity->user_name == "bob");
    }

    SECTION("Unknown or malformed") {
        CHECK_FALSE(resolver.resolve(bearer("key-carol")).has_value());
        CHECK_FALSE(resolver.resolve({{"Authorization", "Basic a2V5LWFsaWNl"}}).has_value());
        CHECK_FALSE(resolver.resolve({{"Authorization", "Bearer "}}).has_value());
        CHECK_FALSE(resolver.resolve({}).has_value());
    }
}

TEST_CASE("StaticIdentityResolver: duplicate keys keep the first user", "[auth]") {
    auto users = test_users();
    users[1].api_key = "key-alice";
    users.push_back({"", {}});

    StaticIdentityResolver resolver(users);
    CHECK(resolver.size() == 1);
    CHECK(resolver.authenticate_api_key("key-alice")->user_name == "alice");
}

// ============================================================================
// HttpServer
// ============================================================================

TEST_CASE("HttpServer: route pattern per mount prefix", "[server]") {
    const std::regex route(HttpServer::route_pattern("/ragflow"));
    std::smatch m;

    std::string path = "/ragflow/v1/datasets";
    REQUIRE(std::regex_match(path, m, route));
    CHECK(m[1] == "/v1/datasets");

    path = "/ragflow";
    REQUIRE(std::regex_match(path, m, route));
    CHECK(m[1].str().empty());

    path = "/ragflowx/v1";
    CHECK_FALSE(std::regex_match(path, route));

    CHECK(HttpServer::route_pattern("/a.b") == R"(/a\.b(/.*)?)");
}

TEST_CASE("HttpServer: unknown callers get 401", "[server][auth]") {
    ServerFixture fx;

    const auto response = fx.call(bearer("nope"));
    CHECK(response.status == 401);
    const auto body = nlohmann::json::parse(response.body);
    CHECK(body["error"] == "unauthenticated");
    CHECK(body["code"] == 401);

    CHECK(fx.call({}).status == 401);
    CHECK(fx.server->get_http_stats().auth_rejects == 2);
    CHECK(fx.upstream->call_count() == 0);
    CHECK(fx.pipeline->get_stats().total_requests == 0);
}

TEST_CASE("HttpServer: known callers reach the pipeline", "[server]") {
    ServerFixture fx;

    CHECK(fx.call(bearer("key-alice")).status == 200);
    CHECK(fx.upstream->last_request().path == "/v1/datasets");

    // bob lacks the permission
    CHECK(fx.call(bearer("key-bob")).status == 403);
    CHECK(fx.pipeline->get_stats().total_requests == 2);
}

TEST_CASE("HttpServer: health document", "[server][health]") {
    ServerFixture fx;
    (void)fx.call(bearer("key-alice"));

    const auto health = fx.server->health_json();
    CHECK(health["status"] == "healthy");
    CHECK(health["service"] == "rulegate");
    CHECK(health["pipeline"]["total_requests"] == 1);
    REQUIRE(health["mounts"].size() == 1);
    CHECK(health["mounts"][0]["name"] == "ragflow");
    CHECK(health["mounts"][0]["prefix"] == "/ragflow");
    CHECK(health["mounts"][0]["rules"] == 1);
    CHECK_FALSE(health["mounts"][0].contains("streaming"));
    CHECK_FALSE(health["mounts"][0].contains("credentials"));
}

TEST_CASE("HttpServer: health reports relay and credential state", "[server][health]") {
    ServerFixture fx;

    auto transport = std::make_shared<ScriptedStreamTransport>();
    transport->fail_open("connection refused");
    fx.mount->relay = std::make_shared<StreamingRelay>(transport, nullptr, StreamSettings{});
    (void)fx.mount->relay->open(UpstreamRequest{});

    auto login = std::make_shared<MockUpstreamClient>([](const UpstreamRequest&) {
        return MockUpstreamClient::respond(500, "{}");
    });
    CredentialConfig cfg;
    cfg.identity = "svc@example.com";
    cfg.password = "pw";
    cfg.public_key_pem = TestKeyPair::instance().public_pem();
    cfg.register_on_unauthorized = false;
    auto encryptor = PasswordEncryptor::from_pem(cfg.public_key_pem);
    REQUIRE(encryptor.is_ok());
    fx.mount->credentials = std::make_shared<CredentialManager>(
        cfg, login, nullptr, std::move(encryptor.value()));

    auto health = fx.server->health_json();
    CHECK(health["status"] == "healthy");
    CHECK(health["mounts"][0]["streaming"]["failed"] == 1);
    CHECK(health["mounts"][0]["credentials"]["identity"] == "svc@example.com");
    CHECK(health["mounts"][0]["credentials"]["state"] == "no_token");

    CHECK(fx.mount->credentials->get_valid_token().is_error());
    health = fx.server->health_json();
    CHECK(health["status"] == "degraded");
    CHECK(health["mounts"][0]["credentials"]["state"] == "failed");
    CHECK(health["mounts"][0]["credentials"]["login_failures"] == 1);
}

TEST_CASE("HttpServer: health while draining", "[server][health][shutdown]") {
    ServerFixture fx;
    auto sc = std::make_shared<ShutdownCoordinator>();
    fx.server->set_shutdown_coordinator(sc);

    REQUIRE(sc->try_admit());
    CHECK(fx.server->health_json()["in_flight"] == 1);

    sc->begin_drain();
    CHECK(fx.server->health_json()["status"] == "draining");
    sc->release();
}

TEST_CASE("HttpServer: cancel_streams() reaches a stream still waiting for data", "[server][stream][shutdown]") {
    ServerFixture fx;
    Rule chat;
    chat.name = "chat";
    chat.path_pattern = "/v1/chats/[^/]+/completions";
    chat.permission = Requirement::single("dataset:read");
    chat.streaming = true;
    REQUIRE(fx.mount->rules.add(chat).is_ok());

    StreamSettings settings;
    settings.poll_interval = std::chrono::milliseconds(10);
    settings.first_chunk_timeout = std::chrono::hours(1);
    auto transport = std::make_shared<SilentTransport>();
    fx.mount->relay = std::make_shared<StreamingRelay>(transport, nullptr, settings);

    auto sc = std::make_shared<ShutdownCoordinator>();
    fx.server->set_shutdown_coordinator(sc);

    size_t cancelled = 0;
    std::thread drain([&sc, &cancelled] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sc->begin_drain();
        cancelled = sc->cancel_streams();
    });

    const auto before = std::chrono::steady_clock::now();
    const auto response = fx.call(bearer("key-alice"), "/v1/chats/c1/completions");
    const auto waited = std::chrono::steady_clock::now() - before;
    drain.join();

    CHECK(cancelled == 1);
    CHECK(waited < std::chrono::seconds(5));
    CHECK_FALSE(response.stream);
    CHECK(response.status == 503);
    CHECK(transport->close_count() == 1);

    // The hook goes away with the request
    CHECK(sc->cancel_streams() == 0);
}
