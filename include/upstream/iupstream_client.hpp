#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

namespace rulegate {

/**
 * @brief Interface for one-shot (non-streaming) upstream exchanges
 *
 * Any HTTP status is a successful exchange; the Result only carries an
 * error when no response was obtained (connect, read or write failure).
 */
class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;

    [[nodiscard]] virtual Result<UpstreamResponse> send(const UpstreamRequest& request) = 0;
};

} // namespace rulegate
