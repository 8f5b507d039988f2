#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace rulegate {

/**
 * @brief Result of one read from a streaming upstream connection
 *
 * DATA may carry zero or whitespace-only bytes; the relay counts those as
 * empty reads. TIMEOUT means nothing arrived within the read's deadline.
 */
struct StreamRead {
    enum class Status { DATA, END, ERROR, TIMEOUT };

    Status status = Status::END;
    std::string data;
    std::string error;

    static StreamRead chunk(std::string bytes) { return {Status::DATA, std::move(bytes), {}}; }
    static StreamRead end() { return {Status::END, {}, {}}; }
    static StreamRead failure(std::string message) { return {Status::ERROR, {}, std::move(message)}; }
    static StreamRead timeout() { return {Status::TIMEOUT, {}, {}}; }
};

/**
 * @brief An open upstream response whose body arrives incrementally
 *
 * Owned by exactly one stream session. close() must be idempotent and
 * safe to call while another thread is blocked in read().
 */
class IStreamConnection {
public:
    virtual ~IStreamConnection() = default;

    [[nodiscard]] virtual int status() const = 0;
    [[nodiscard]] virtual const HeaderMap& headers() const = 0;

    [[nodiscard]] virtual StreamRead read(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @brief Opens streaming upstream connections
 *
 * open() returns once the response status line and headers are known, or
 * an UPSTREAM_UNREACHABLE error when they could not be obtained.
 */
class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IStreamConnection>> open(
        const UpstreamRequest& request) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rulegate
