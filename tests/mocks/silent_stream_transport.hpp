#pragma once

#include "stream/istream_transport.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>

namespace rulegate::testing {

/// Connection that never produces data
class SilentConnection : public IStreamConnection {
public:
    [[nodiscard]] int status() const override { return 200; }
    [[nodiscard]] const HeaderMap& headers() const override { return headers_; }

    [[nodiscard]] StreamRead read(std::chrono::milliseconds timeout) override {
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
        return StreamRead::timeout();
    }

    void close() override {
        closed.store(true);
        if (closes) closes->fetch_add(1);
    }

    std::atomic<bool> closed{false};
    std::shared_ptr<std::atomic<int>> closes;

private:
    HeaderMap headers_;
};

/// Transport whose connections answer 200 and then stay silent
class SilentTransport : public IStreamTransport {
public:
    [[nodiscard]] Result<std::unique_ptr<IStreamConnection>> open(const UpstreamRequest&) override {
        auto connection = std::make_unique<SilentConnection>();
        connection->closes = closes_;
        return Result<std::unique_ptr<IStreamConnection>>::ok(std::move(connection));
    }

    [[nodiscard]] std::string_view name() const override { return "silent"; }

    [[nodiscard]] int close_count() const { return closes_->load(); }

private:
    std::shared_ptr<std::atomic<int>> closes_ = std::make_shared<std::atomic<int>>(0);
};

} // namespace rulegate::testing
