#pragma once

#include "core/types.hpp"

#include <string_view>

namespace rulegate::header_filter {

/// connection, keep-alive, proxy-authenticate, proxy-authorization, te,
/// trailer, transfer-encoding, upgrade
[[nodiscard]] bool is_hop_by_hop(std::string_view name);

/**
 * @brief Headers of a caller request that may travel upstream verbatim
 *
 * Drops hop-by-hop headers plus host, content-length and authorization
 * (the transport recomputes the first two; the caller's credential is
 * never handed to the upstream).
 */
[[nodiscard]] HeaderMap for_upstream(const HeaderMap& caller_headers);

/**
 * @brief Headers of an upstream response that may travel back to the caller
 *
 * Drops hop-by-hop headers plus content-length and content-type, which the
 * server sets itself from the relayed body.
 */
[[nodiscard]] HeaderMap for_caller(const HeaderMap& upstream_headers);

} // namespace rulegate::header_filter
