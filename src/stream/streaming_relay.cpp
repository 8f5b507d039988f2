#include "stream/streaming_relay.hpp"
#include "credential/authenticated_client.hpp"
#include "credential/credential_manager.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace rulegate {

const char* end_reason_to_string(StreamSession::EndReason reason) {
    switch (reason) {
        case StreamSession::EndReason::UPSTREAM_END: return "upstream_end";
        case StreamSession::EndReason::EMPTY_READS:  return "empty_reads";
        case StreamSession::EndReason::SENTINEL:     return "sentinel";
        case StreamSession::EndReason::CANCELLED:    return "cancelled";
        case StreamSession::EndReason::IDLE_TIMEOUT: return "idle_timeout";
        case StreamSession::EndReason::ERROR:        return "error";
    }
    return "unknown";
}

// ============================================================================
// StreamSession
// ============================================================================

StreamSession::StreamSession(std::unique_ptr<IStreamConnection> connection,
                             std::deque<StreamRead> prefetched,
                             StreamSettings settings,
                             std::string transport_name)
    : connection_(std::move(connection)),
      prefetched_(std::move(prefetched)),
      settings_(std::move(settings)),
      transport_name_(std::move(transport_name)),
      status_(connection_->status()),
      headers_(connection_->headers()) {}

StreamSession::~StreamSession() {
    connection_->close();
}

void StreamSession::cancel() {
    cancelled_.store(true, std::memory_order_relaxed);
    connection_->close();
}

bool StreamSession::contains_sentinel(std::string_view chunk) const {
    for (const auto& sentinel : settings_.sentinels) {
        if (!sentinel.empty() && chunk.find(sentinel) != std::string_view::npos) return true;
    }
    return false;
}

StreamRead StreamSession::next_read() {
    if (!prefetched_.empty()) {
        StreamRead read = std::move(prefetched_.front());
        prefetched_.pop_front();
        return read;
    }
    return connection_->read(settings_.poll_interval);
}

StreamSession::Outcome StreamSession::pump(const StreamSink& sink) {
    Outcome outcome;
    if (pumped_.exchange(true)) {
        outcome.reason = EndReason::ERROR;
        outcome.error = "stream already consumed";
        return outcome;
    }

    const auto finish = [this, &outcome](EndReason reason, std::string error = {}) {
        connection_->close();
        outcome.reason = reason;
        outcome.error = std::move(error);
        utils::log::debug(std::format("Stream over {} ended: {} ({} chunks, {} bytes)",
            transport_name_, end_reason_to_string(reason), outcome.chunks, outcome.bytes));
        return outcome;
    };

    size_t empty_reads = 0;
    auto last_data = std::chrono::steady_clock::now();

    for (;;) {
        if (cancelled_.load(std::memory_order_relaxed)) return finish(EndReason::CANCELLED);
        if (sink.is_writable && !sink.is_writable()) return finish(EndReason::CANCELLED);

        StreamRead read = next_read();
        switch (read.status) {
            case StreamRead::Status::TIMEOUT:
                if (std::chrono::steady_clock::now() - last_data >= settings_.idle_timeout) {
                    utils::log::warn(std::format("Stream over {} idle for {}ms, closing",
                        transport_name_, settings_.idle_timeout.count()));
                    return finish(EndReason::IDLE_TIMEOUT, "upstream idle timeout");
                }
                continue;

            case StreamRead::Status::END:
                return finish(cancelled_.load(std::memory_order_relaxed)
                    ? EndReason::CANCELLED : EndReason::UPSTREAM_END);

            case StreamRead::Status::ERROR:
                utils::log::warn(std::format("Stream over {} failed after {} chunks: {}",
                    transport_name_, outcome.chunks, read.error));
                return finish(EndReason::ERROR, read.error);

            case StreamRead::Status::DATA:
                break;
        }

        if (utils::is_blank(read.data)) {
            if (++empty_reads >= settings_.max_empty_reads) {
                return finish(EndReason::EMPTY_READS);
            }
            continue;
        }
        empty_reads = 0;
        last_data = std::chrono::steady_clock::now();

        if (!sink.write(read.data)) return finish(EndReason::CANCELLED);
        ++outcome.chunks;
        outcome.bytes += read.data.size();

        // Flush point: give the server thread a chance to push the chunk out
        std::this_thread::sleep_for(settings_.flush_interval);

        if (contains_sentinel(read.data)) return finish(EndReason::SENTINEL);
    }
}

// ============================================================================
// StreamingRelay
// ============================================================================

StreamingRelay::StreamingRelay(std::shared_ptr<IStreamTransport> primary,
                               std::shared_ptr<IStreamTransport> fallback,
                               StreamSettings settings,
                               std::shared_ptr<CredentialManager> credentials)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      settings_(std::move(settings)),
      credentials_(std::move(credentials)) {}

Result<StreamingRelay::Opening> StreamingRelay::open(UpstreamRequest request,
                                                     const std::atomic<bool>* abandoned) {
    set_header(request.headers, "Accept", http::kEventStreamContentType);

    auto first = attempt(*primary_, request, abandoned);
    if (first.is_ok() || first.error_category() != ErrorCategory::UPSTREAM_UNREACHABLE) {
        if (first.is_error()) streams_failed_.fetch_add(1, std::memory_order_relaxed);
        return first;
    }

    if (!fallback_ || (abandoned && abandoned->load())) {
        streams_failed_.fetch_add(1, std::memory_order_relaxed);
        return first;
    }

    utils::log::warn(std::format("Primary stream transport {} failed ({}), retrying over {}",
        primary_->name(), first.error_message(), fallback_->name()));
    fallbacks_used_.fetch_add(1, std::memory_order_relaxed);

    auto second = attempt(*fallback_, std::move(request), abandoned);
    if (second.is_error()) {
        streams_failed_.fetch_add(1, std::memory_order_relaxed);
        return Result<Opening>::error(second.error_category(),
            std::format("{}; fallback: {}", first.error_message(), second.error_message()));
    }
    return second;
}

Result<StreamingRelay::Opening> StreamingRelay::attempt(IStreamTransport& transport,
                                                        UpstreamRequest request,
                                                        const std::atomic<bool>* abandoned) {
    std::string token;
    if (credentials_) {
        auto fetched = credentials_->get_valid_token();
        if (fetched.is_error()) return fetched.forward_error<Opening>();
        token = std::move(fetched.value());
        set_header(request.headers, "authorization", token);
    }

    const std::string name(transport.name());
    bool renewed = false;

    // The upstream rejects a stale token either with a 401 or with a 200
    // whose first chunk is a JSON 401; both get one re-login and one re-open
    const auto renew = [&](std::unique_ptr<IStreamConnection>& connection) -> Result<bool> {
        connection->close();
        connection.reset();
        renewed = true;

        utils::log::info(std::format("Upstream rejected token on stream {} {} over {}, re-authenticating",
            request.method, request.path, name));
        credentials_->invalidate(token);

        auto fresh = credentials_->get_valid_token();
        if (fresh.is_error()) return fresh.forward_error<bool>();
        token = std::move(fresh.value());
        set_header(request.headers, "authorization", token);
        return Result<bool>::ok(true);
    };

    for (;;) {
        auto opened = transport.open(request);
        if (opened.is_error()) return opened.forward_error<Opening>();
        auto connection = std::move(opened.value());

        if (!is_success_status(connection->status())) {
            if (credentials_ && !renewed && connection->status() == 401) {
                if (auto r = renew(connection); r.is_error()) return r.forward_error<Opening>();
                continue;
            }
            return passthrough(std::move(connection), request);
        }

        auto prefetched = prefetch(*connection, name, abandoned);
        if (prefetched.is_error()) {
            connection->close();
            return prefetched.forward_error<Opening>();
        }

        if (credentials_ && !renewed && rejects_token(connection->status(), prefetched.value())) {
            if (auto r = renew(connection); r.is_error()) return r.forward_error<Opening>();
            continue;
        }

        streams_opened_.fetch_add(1, std::memory_order_relaxed);
        Opening opening;
        opening.session = std::make_shared<StreamSession>(
            std::move(connection), std::move(prefetched.value()), settings_, name);
        return Result<Opening>::ok(std::move(opening));
    }
}

bool StreamingRelay::rejects_token(int status, const std::deque<StreamRead>& prefetched) {
    for (const auto& read : prefetched) {
        if (read.status == StreamRead::Status::DATA && !utils::is_blank(read.data)) {
            return is_token_rejected(status, utils::trim(read.data));
        }
    }
    return false;
}

Result<StreamingRelay::Opening> StreamingRelay::passthrough(
    std::unique_ptr<IStreamConnection> connection,
    const UpstreamRequest& request) {
    // Not a stream: collect the whole body and pass it through
    UpstreamResponse response;
    response.status = connection->status();
    response.headers = connection->headers();
    response.content_type = header_value(response.headers, "Content-Type");

    const auto deadline = std::chrono::steady_clock::now() + request.timeouts.read;
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) break;
        auto read = connection->read(std::min(left, settings_.poll_interval));
        if (read.status == StreamRead::Status::DATA) {
            response.body += read.data;
        } else if (read.status != StreamRead::Status::TIMEOUT) {
            break;
        }
    }
    connection->close();

    passthroughs_.fetch_add(1, std::memory_order_relaxed);
    Opening opening;
    opening.passthrough = std::move(response);
    return Result<Opening>::ok(std::move(opening));
}

Result<std::deque<StreamRead>> StreamingRelay::prefetch(IStreamConnection& connection,
                                                        const std::string& name,
                                                        const std::atomic<bool>* abandoned) {
    using R = Result<std::deque<StreamRead>>;

    // Wait for the first real chunk; failures up to here are eligible for fallback
    std::deque<StreamRead> prefetched;
    size_t empty_reads = 0;
    const auto started = std::chrono::steady_clock::now();
    for (;;) {
        if (abandoned && abandoned->load()) {
            return R::error(ErrorCategory::SHUTTING_DOWN,
                std::format("{}: stream abandoned before the first chunk", name));
        }

        StreamRead read = connection.read(settings_.poll_interval);
        switch (read.status) {
            case StreamRead::Status::TIMEOUT:
                if (std::chrono::steady_clock::now() - started >= settings_.first_chunk_timeout) {
                    return R::error(ErrorCategory::UPSTREAM_UNREACHABLE,
                        std::format("{}: no data from upstream within {}ms",
                                    name, settings_.first_chunk_timeout.count()));
                }
                continue;

            case StreamRead::Status::ERROR:
                return R::error(ErrorCategory::UPSTREAM_UNREACHABLE,
                    std::format("{}: {}", name, read.error));

            case StreamRead::Status::END:
                prefetched.push_back(std::move(read));
                return R::ok(std::move(prefetched));

            case StreamRead::Status::DATA: {
                const bool ready = !utils::is_blank(read.data)
                    || ++empty_reads >= settings_.max_empty_reads;
                prefetched.push_back(std::move(read));
                if (ready) return R::ok(std::move(prefetched));
                continue;
            }
        }
    }
}

} // namespace rulegate
