#include "stream/curl_stream_transport.hpp"
#include "core/utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace rulegate {

// ============================================================================
// CurlHandlePool
// ============================================================================

/**
 * @brief Idle easy handles kept for reuse
 *
 * A handle keeps its connection cache across curl_easy_reset(), so a
 * pooled handle reopens a stream on an already established connection.
 */
class CurlHandlePool {
public:
    explicit CurlHandlePool(size_t max_idle) : max_idle_(max_idle) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~CurlHandlePool() {
        std::lock_guard lock(mutex_);
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    CurlHandlePool(const CurlHandlePool&) = delete;
    CurlHandlePool& operator=(const CurlHandlePool&) = delete;

    /// A reset handle, or nullptr when libcurl cannot create one
    [[nodiscard]] CURL* acquire() {
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release(CURL* handle) {
        if (!handle) return;
        curl_easy_reset(handle);

        std::lock_guard lock(mutex_);
        if (idle_.size() < max_idle_) {
            idle_.push_back(handle);
            return;
        }
        curl_easy_cleanup(handle);
    }

    [[nodiscard]] size_t idle() const {
        std::lock_guard lock(mutex_);
        return idle_.size();
    }

private:
    const size_t max_idle_;
    mutable std::mutex mutex_;
    std::vector<CURL*> idle_;
};

namespace {

constexpr size_t kMaxQueuedChunks = 64;

// Hand-off between the curl worker thread and the relay
struct ChunkChannel {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> chunks;
    bool head_ready = false;
    bool finished = false;
    bool closed = false;
    int status = 0;
    HeaderMap headers;
    std::string error;
};

/// Everything one curl_easy_perform() needs to outlive the caller
struct Transfer {
    std::shared_ptr<CurlHandlePool> pool;
    std::shared_ptr<ChunkChannel> channel;
    CURL* handle = nullptr;
    curl_slist* header_list = nullptr;
    std::string url;
    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {};

    Transfer(std::shared_ptr<CurlHandlePool> p, std::shared_ptr<ChunkChannel> c)
        : pool(std::move(p)), channel(std::move(c)), handle(pool->acquire()) {}

    ~Transfer() {
        if (header_list) curl_slist_free_all(header_list);
        pool->release(handle);
    }

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;
};

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* channel = static_cast<ChunkChannel*>(userdata);
    const size_t bytes = size * nitems;
    std::string_view line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    bool ready = false;
    {
        std::lock_guard lock(channel->mutex);
        if (line.starts_with("HTTP/")) {
            // Interim 1xx responses are followed by another status line
            const auto space = line.find(' ');
            const auto code = space == std::string_view::npos
                ? std::nullopt : utils::try_parse_int<int>(line.substr(space + 1, 3));
            channel->status = code.value_or(0);
            channel->headers.clear();
        } else if (line.empty()) {
            ready = channel->status >= 200;
            if (ready) channel->head_ready = true;
        } else if (const auto colon = line.find(':'); colon != std::string_view::npos) {
            channel->headers.emplace(utils::trim(line.substr(0, colon)),
                                     utils::trim(line.substr(colon + 1)));
        }
    }
    if (ready) channel->cv.notify_all();
    return bytes;
}

size_t on_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* channel = static_cast<ChunkChannel*>(userdata);
    const size_t bytes = size * nmemb;
    {
        // Backpressure: the worker blocks while the reader is behind
        std::unique_lock lock(channel->mutex);
        channel->cv.wait(lock, [channel] {
            return channel->chunks.size() < kMaxQueuedChunks || channel->closed;
        });
        if (channel->closed) return 0;
        channel->head_ready = true;
        channel->chunks.emplace_back(data, bytes);
    }
    channel->cv.notify_all();
    return bytes;
}

// Polled by libcurl while the transfer is idle; non-zero aborts it
int on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* channel = static_cast<ChunkChannel*>(userdata);
    std::lock_guard lock(channel->mutex);
    return channel->closed ? 1 : 0;
}

std::string build_url(CURL* handle, const std::string& base, const UpstreamRequest& request) {
    std::string url = base + (request.path.empty() ? "/" : request.path);
    if (!request.raw_query.empty()) {
        return url + "?" + request.raw_query;
    }

    char separator = '?';
    for (const auto& [key, value] : request.params) {
        char* k = curl_easy_escape(handle, key.c_str(), static_cast<int>(key.size()));
        char* v = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
        if (k && v) url += std::format("{}{}={}", separator, k, v);
        curl_free(k);
        curl_free(v);
        separator = '&';
    }
    return url;
}

bool is_hop_header(const std::string& name) {
    return utils::iequals(name, "host") || utils::iequals(name, "content-length") ||
           utils::iequals(name, "connection") || utils::iequals(name, "transfer-encoding");
}

void configure(Transfer& t, const UpstreamRequest& request, bool verify_tls) {
    CURL* curl = t.handle;

    curl_easy_setopt(curl, CURLOPT_URL, t.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, t.error_buffer);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        if (request.method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (request.method == "POST" || !t.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, t.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(t.body.size()));
        }
    }

    for (const auto& [name, value] : request.headers) {
        if (is_hop_header(name)) continue;
        t.header_list = curl_slist_append(t.header_list, std::format("{}: {}", name, value).c_str());
    }
    if (!request.content_type.empty()) {
        t.header_list = curl_slist_append(t.header_list,
            std::format("Content-Type: {}", request.content_type).c_str());
    }
    // No "Expect: 100-continue" round trip before the body
    t.header_list = curl_slist_append(t.header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, t.header_list);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, t.channel.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, t.channel.get());
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, t.channel.get());
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    // A body that stalls for the read timeout fails the transfer
    const long stall_seconds = std::max<long>(1,
        static_cast<long>((request.timeouts.read.count() + 999) / 1000));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.timeouts.connect.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall_seconds);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_tls ? 2L : 0L);
}

class CurlStreamConnection final : public IStreamConnection {
public:
    explicit CurlStreamConnection(std::shared_ptr<ChunkChannel> channel)
        : channel_(std::move(channel)) {}

    ~CurlStreamConnection() override {
        close();
        if (worker_.joinable()) worker_.join();
    }

    void start(std::thread worker) { worker_ = std::move(worker); }

    void capture_head() {
        std::lock_guard lock(channel_->mutex);
        status_ = channel_->status;
        headers_ = channel_->headers;
    }

    [[nodiscard]] int status() const override { return status_; }
    [[nodiscard]] const HeaderMap& headers() const override { return headers_; }

    [[nodiscard]] StreamRead read(std::chrono::milliseconds timeout) override {
        std::unique_lock lock(channel_->mutex);
        const bool ready = channel_->cv.wait_for(lock, timeout, [this] {
            return !channel_->chunks.empty() || channel_->finished || channel_->closed;
        });
        if (!ready) return StreamRead::timeout();

        if (!channel_->chunks.empty()) {
            std::string chunk = std::move(channel_->chunks.front());
            channel_->chunks.pop_front();
            lock.unlock();
            channel_->cv.notify_all();
            return StreamRead::chunk(std::move(chunk));
        }
        if (!channel_->closed && !channel_->error.empty()) {
            return StreamRead::failure(channel_->error);
        }
        return StreamRead::end();
    }

    void close() override {
        {
            std::lock_guard lock(channel_->mutex);
            if (channel_->closed) return;
            channel_->closed = true;
        }
        channel_->cv.notify_all();
    }

private:
    std::shared_ptr<ChunkChannel> channel_;
    std::thread worker_;
    int status_ = 0;
    HeaderMap headers_;
};

} // anonymous namespace

// ============================================================================
// CurlStreamTransport
// ============================================================================

CurlStreamTransport::CurlStreamTransport(Config config)
    : config_(std::move(config)),
      pool_(std::make_shared<CurlHandlePool>(config_.max_idle_handles)) {}

CurlStreamTransport::~CurlStreamTransport() = default;

size_t CurlStreamTransport::idle_handles() const {
    return pool_->idle();
}

Result<std::unique_ptr<IStreamConnection>> CurlStreamTransport::open(
    const UpstreamRequest& request) {
    using OpenResult = Result<std::unique_ptr<IStreamConnection>>;
    const auto fail = [this, &request](const std::string& why) {
        return OpenResult::error(ErrorCategory::UPSTREAM_UNREACHABLE,
            std::format("{} {}{} (curl): {}", request.method, config_.scheme_host_port,
                        request.path, why));
    };

    auto channel = std::make_shared<ChunkChannel>();
    auto transfer = std::make_unique<Transfer>(pool_, channel);
    if (!transfer->handle) return fail("curl_easy_init failed");

    transfer->url = build_url(transfer->handle, config_.scheme_host_port, request);
    transfer->body = request.body;
    configure(*transfer, request, config_.verify_tls);

    auto connection = std::make_unique<CurlStreamConnection>(channel);
    connection->start(std::thread([channel, transfer = std::move(transfer)]() {
        const CURLcode rc = curl_easy_perform(transfer->handle);
        {
            std::lock_guard lock(channel->mutex);
            channel->finished = true;
            if (rc != CURLE_OK && !channel->closed) {
                channel->error = transfer->error_buffer[0] != '\0'
                    ? std::string(transfer->error_buffer) : curl_easy_strerror(rc);
            }
        }
        channel->cv.notify_all();
    }));

    std::string failure;
    {
        std::unique_lock lock(channel->mutex);
        const auto deadline = request.timeouts.connect + request.timeouts.read;
        channel->cv.wait_for(lock, deadline, [&channel] {
            return channel->head_ready || channel->finished;
        });
        if (!channel->head_ready) {
            failure = channel->finished && !channel->error.empty()
                ? channel->error : "timed out waiting for response headers";
        }
    }

    if (!failure.empty()) {
        // connection's destructor aborts the transfer and joins the worker
        return fail(failure);
    }

    connection->capture_head();
    return OpenResult::ok(std::move(connection));
}

} // namespace rulegate
