#include "routing/mount_builder.hpp"
#include "core/utils.hpp"
#include "credential/authenticated_client.hpp"
#include "credential/credential_manager.hpp"
#include "credential/credential_store.hpp"
#include "credential/password_encryptor.hpp"
#include "stream/curl_stream_transport.hpp"
#include "stream/httplib_stream_transport.hpp"
#include "stream/streaming_relay.hpp"
#include "upstream/http_upstream_client.hpp"
#include "upstream/request_forwarder.hpp"
#include "upstream/upstream_url.hpp"

#include <format>

namespace rulegate {

Result<std::vector<std::shared_ptr<Mount>>> MountBuilder::build() const {
    std::vector<std::shared_ptr<Mount>> mounts;
    mounts.reserve(config_.upstreams.size());
    for (const auto& upstream : config_.upstreams) {
        auto mount = build_mount(upstream);
        if (mount.is_error()) {
            return mount.forward_error<std::vector<std::shared_ptr<Mount>>>();
        }
        mounts.push_back(std::move(mount.value()));
    }
    return Result<std::vector<std::shared_ptr<Mount>>>::ok(std::move(mounts));
}

Result<std::shared_ptr<Mount>> MountBuilder::build_mount(const UpstreamConfig& upstream) const {
    using R = Result<std::shared_ptr<Mount>>;

    const auto url = UpstreamUrl::parse(upstream.base_url);
    if (!url) {
        return R::error(ErrorCategory::CONFIG_ERROR,
            std::format("Upstream {}: invalid base_url '{}'", upstream.name, upstream.base_url));
    }

    auto mount = std::make_shared<Mount>();
    mount->name = upstream.name;
    mount->prefix = upstream.prefix;
    mount->base_path = upstream.base_path.value_or(url->base_path);
    mount->scope_entity = upstream.scope_entity;
    mount->scope_column = upstream.scope_column;

    bool has_streaming = false;
    for (const auto& rc : config_.rules) {
        if (rc.upstream != upstream.name) continue;
        has_streaming |= rc.rule.streaming;
        const auto added = mount->rules.add(rc.rule);
        if (added.is_error()) return added.forward_error<std::shared_ptr<Mount>>();
    }

    // ---- Upstream client + credentials ----
    std::shared_ptr<IUpstreamClient> raw_client = std::make_shared<HttpUpstreamClient>(
        HttpUpstreamClient::Config{
            .scheme_host_port = url->scheme_host_port(),
            .follow_redirects = upstream.follow_redirects,
            .verify_tls = upstream.verify_tls,
        });
    std::shared_ptr<IUpstreamClient> client = raw_client;

    if (upstream.credentials) {
        auto encryptor = PasswordEncryptor::from_pem(upstream.credentials->credential.public_key_pem);
        if (encryptor.is_error()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("Upstream {}: {}", upstream.name, encryptor.error_message()));
        }

        std::shared_ptr<ICredentialStore> store;
        if (upstream.credentials->token_file.empty()) {
            store = std::make_shared<InMemoryCredentialStore>();
        } else {
            store = std::make_shared<JsonFileCredentialStore>(upstream.credentials->token_file);
        }

        CredentialConfig cc = upstream.credentials->credential;
        // Login paths live under the same base path as every other call
        cc.login_path = utils::join_path(mount->base_path, cc.login_path);
        cc.register_path = utils::join_path(mount->base_path, cc.register_path);

        mount->credentials = std::make_shared<CredentialManager>(
            std::move(cc), raw_client, std::move(store), std::move(encryptor.value()));
        client = std::make_shared<AuthenticatedUpstreamClient>(raw_client, mount->credentials);
    }

    mount->forwarder = std::make_shared<RequestForwarder>(client, upstream.timeouts);

    // ---- Streaming relay ----
    if (has_streaming) {
        auto primary = std::make_shared<HttplibStreamTransport>(HttplibStreamTransport::Config{
            .scheme_host_port = url->scheme_host_port(),
            .verify_tls = upstream.verify_tls,
        });
        std::shared_ptr<IStreamTransport> fallback;
        if (upstream.fallback_transport) {
            fallback = std::make_shared<CurlStreamTransport>(CurlStreamTransport::Config{
                .scheme_host_port = url->scheme_host_port(),
                .verify_tls = upstream.verify_tls,
            });
        }
        mount->relay = std::make_shared<StreamingRelay>(
            std::move(primary), std::move(fallback), config_.streaming, mount->credentials);
    }

    utils::log::info(std::format("Mounted {} at {} -> {}{} ({} rules{}{})",
        mount->name, mount->prefix, url->scheme_host_port(), mount->base_path,
        mount->rules.size(),
        mount->relay ? ", streaming" : "",
        mount->credentials ? ", machine login" : ""));

    return R::ok(std::move(mount));
}

} // namespace rulegate
