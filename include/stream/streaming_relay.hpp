#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "stream/istream_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulegate {

class CredentialManager;

/**
 * @brief Tunables of the streaming relay
 */
struct StreamSettings {
    std::chrono::milliseconds flush_interval{1};        // Yield after every forwarded chunk
    size_t max_empty_reads = 5;                         // Consecutive empty reads that end a stream
    std::chrono::milliseconds idle_timeout{360000};     // No data for this long is a failure
    std::chrono::milliseconds first_chunk_timeout{60000}; // Wait for the first chunk before falling back
    std::chrono::milliseconds poll_interval{200};       // Upper bound of one read()
    std::vector<std::string> sentinels{"data: [DONE]", "event: end"};
};

/**
 * @brief Where a session writes relayed chunks
 *
 * write() returning false, or is_writable() (optional) returning false,
 * means the caller went away.
 */
struct StreamSink {
    std::function<bool(std::string_view)> write;
    std::function<bool()> is_writable;
};

/**
 * @brief One live relay from an upstream stream to a caller
 *
 * Owns its upstream connection exclusively and closes it on every exit path
 * of pump() and on destruction. pump() runs at most once.
 */
class StreamSession {
public:
    enum class EndReason {
        UPSTREAM_END,       // Upstream finished the body
        EMPTY_READS,        // max_empty_reads consecutive empty reads
        SENTINEL,           // A chunk carried an end-of-stream marker
        CANCELLED,          // Sink rejected a write or cancel() was called
        IDLE_TIMEOUT,
        ERROR               // Transport failure after the stream started
    };

    struct Outcome {
        EndReason reason = EndReason::UPSTREAM_END;
        uint64_t chunks = 0;
        uint64_t bytes = 0;
        std::string error;
    };

    StreamSession(std::unique_ptr<IStreamConnection> connection,
                  std::deque<StreamRead> prefetched,
                  StreamSettings settings,
                  std::string transport_name);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /**
     * @brief Relay chunks into the sink until the stream ends
     *
     * Blank chunks are never written. Each written chunk is followed by a
     * flush_interval sleep. The chunk carrying a sentinel is written, then
     * the stream ends.
     */
    Outcome pump(const StreamSink& sink);

    /// Close the upstream connection; safe from any thread
    void cancel();

    [[nodiscard]] int upstream_status() const { return status_; }
    [[nodiscard]] const HeaderMap& upstream_headers() const { return headers_; }
    [[nodiscard]] const std::string& transport_name() const { return transport_name_; }

    [[nodiscard]] bool contains_sentinel(std::string_view chunk) const;

private:
    StreamRead next_read();

    std::unique_ptr<IStreamConnection> connection_;
    std::deque<StreamRead> prefetched_;
    StreamSettings settings_;
    std::string transport_name_;
    int status_ = 0;
    HeaderMap headers_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> pumped_{false};
};

const char* end_reason_to_string(StreamSession::EndReason reason);

/**
 * @brief Opens upstream streams, falling back to a second transport
 *
 * The primary transport is tried first. When it cannot connect, times out
 * or errors before the first non-empty chunk arrives, the same request is
 * issued once over the fallback transport; a second failure is fatal.
 * Upstream statuses other than 2xx are not streamed: the body is drained
 * and handed back as a passthrough response.
 *
 * With a credential manager, a rejected token (a 401 status, or a 2xx whose
 * first chunk is a JSON 401) is renewed once and the stream re-opened once
 * over the same transport.
 */
class StreamingRelay {
public:
    struct Opening {
        std::shared_ptr<StreamSession> session;         // Set for 2xx upstreams
        std::optional<UpstreamResponse> passthrough;    // Set otherwise
    };

    StreamingRelay(std::shared_ptr<IStreamTransport> primary,
                   std::shared_ptr<IStreamTransport> fallback,
                   StreamSettings settings,
                   std::shared_ptr<CredentialManager> credentials = nullptr);

    /**
     * @brief Open the stream for a prepared upstream request
     * @param abandoned Raised by another thread to give up while waiting for
     *        the first chunk; may be null
     * @return Opening, UPSTREAM_UNREACHABLE when both transports failed,
     *         CREDENTIAL_FAILED when no upstream token could be obtained,
     *         or SHUTTING_DOWN when abandoned
     */
    [[nodiscard]] Result<Opening> open(UpstreamRequest request,
                                       const std::atomic<bool>* abandoned = nullptr);

    [[nodiscard]] const StreamSettings& settings() const { return settings_; }

    struct Stats {
        uint64_t streams_opened;
        uint64_t fallbacks_used;
        uint64_t streams_failed;
        uint64_t passthroughs;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            streams_opened_.load(std::memory_order_relaxed),
            fallbacks_used_.load(std::memory_order_relaxed),
            streams_failed_.load(std::memory_order_relaxed),
            passthroughs_.load(std::memory_order_relaxed),
        };
    }

private:
    Result<Opening> attempt(IStreamTransport& transport, UpstreamRequest request,
                            const std::atomic<bool>* abandoned);

    Result<Opening> passthrough(std::unique_ptr<IStreamConnection> connection,
                                const UpstreamRequest& request);

    /// Reads up to the first non-blank chunk, END, or max_empty_reads blanks
    Result<std::deque<StreamRead>> prefetch(IStreamConnection& connection,
                                            const std::string& name,
                                            const std::atomic<bool>* abandoned);

    [[nodiscard]] static bool rejects_token(int status, const std::deque<StreamRead>& prefetched);

    std::shared_ptr<IStreamTransport> primary_;
    std::shared_ptr<IStreamTransport> fallback_;
    StreamSettings settings_;
    std::shared_ptr<CredentialManager> credentials_;

    std::atomic<uint64_t> streams_opened_{0};
    std::atomic<uint64_t> fallbacks_used_{0};
    std::atomic<uint64_t> streams_failed_{0};
    std::atomic<uint64_t> passthroughs_{0};
};

} // namespace rulegate
