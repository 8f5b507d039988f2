#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "routing/mount.hpp"

#include <memory>
#include <vector>

namespace rulegate {

/**
 * @brief Assembles live mounts from a validated configuration
 *
 * Per upstream: an httplib client (wrapped by the authenticating client
 * when credentials are configured), a request forwarder and, when at least
 * one of its rules streams, a relay over the httplib transport with the
 * libcurl transport as fallback. The credential manager logs in through the
 * unwrapped client.
 */
class MountBuilder {
public:
    explicit MountBuilder(const GatewayConfig& config) : config_(config) {}

    /**
     * @brief Build every configured mount, in configuration order
     * @return Mounts, or CONFIG_ERROR for the first upstream that cannot be set up
     */
    [[nodiscard]] Result<std::vector<std::shared_ptr<Mount>>> build() const;

    [[nodiscard]] Result<std::shared_ptr<Mount>> build_mount(const UpstreamConfig& upstream) const;

private:
    const GatewayConfig& config_;
};

} // namespace rulegate
