#include "stream/httplib_stream_transport.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

namespace rulegate {

namespace {

constexpr size_t kMaxQueuedChunks = 64;

// Hand-off between the httplib worker thread and the relay
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

class HttplibStreamConnection final : public IStreamConnection {
public:
    HttplibStreamConnection(std::shared_ptr<ChunkChannel> channel,
                            std::shared_ptr<httplib::Client> client)
        : channel_(std::move(channel)), client_(std::move(client)) {}

    ~HttplibStreamConnection() override {
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
        client_->stop();
    }

private:
    std::shared_ptr<ChunkChannel> channel_;
    std::shared_ptr<httplib::Client> client_;
    std::thread worker_;
    int status_ = 0;
    HeaderMap headers_;
};

} // anonymous namespace

HttplibStreamTransport::HttplibStreamTransport(Config config)
    : config_(std::move(config)) {}

Result<std::unique_ptr<IStreamConnection>> HttplibStreamTransport::open(
    const UpstreamRequest& request) {
    using OpenResult = Result<std::unique_ptr<IStreamConnection>>;

    auto channel = std::make_shared<ChunkChannel>();
    auto client = std::make_shared<httplib::Client>(config_.scheme_host_port);
    client->set_connection_timeout(request.timeouts.connect);
    client->set_read_timeout(request.timeouts.read);
    client->set_write_timeout(request.timeouts.write);
    client->enable_server_certificate_verification(config_.verify_tls);

    httplib::Request req;
    req.method = request.method;
    req.path = request.raw_query.empty()
        ? httplib::append_query_params(request.path, request.params)
        : request.path + "?" + request.raw_query;
    for (const auto& [name, value] : request.headers) {
        req.headers.emplace(name, value);
    }
    if (!request.content_type.empty()) {
        req.set_header("Content-Type", request.content_type);
    }
    req.body = request.body;

    req.response_handler = [channel](const httplib::Response& res) {
        {
            std::lock_guard lock(channel->mutex);
            channel->status = res.status;
            for (const auto& [name, value] : res.headers) {
                channel->headers.emplace(name, value);
            }
            channel->head_ready = true;
        }
        channel->cv.notify_all();
        return true;
    };

    req.content_receiver = [channel](const char* data, size_t length,
                                     uint64_t /*offset*/, uint64_t /*total*/) {
        {
            // Backpressure: the worker blocks while the reader is behind
            std::unique_lock lock(channel->mutex);
            channel->cv.wait(lock, [&channel] {
                return channel->chunks.size() < kMaxQueuedChunks || channel->closed;
            });
            if (channel->closed) return false;
            channel->chunks.emplace_back(data, length);
        }
        channel->cv.notify_all();
        return true;
    };

    auto connection = std::make_unique<HttplibStreamConnection>(channel, client);
    connection->start(std::thread([channel, client, req = std::move(req)]() mutable {
        const auto res = client->send(req);
        {
            std::lock_guard lock(channel->mutex);
            channel->finished = true;
            if (!res && !channel->closed) {
                channel->error = httplib::to_string(res.error());
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
        // connection's destructor stops the client and joins the worker
        return OpenResult::error(ErrorCategory::UPSTREAM_UNREACHABLE,
            std::format("{} {}{}: {}", request.method, config_.scheme_host_port,
                        request.path, failure));
    }

    connection->capture_head();
    return OpenResult::ok(std::move(connection));
}

} // namespace rulegate
