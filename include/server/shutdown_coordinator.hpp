#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace rulegate {

/**
 * @brief Admission gate and drain tracking for a graceful stop
 *
 * The server admits each request with try_admit() and hands it back with
 * release(). Streaming responses also register a cancel hook, so that
 * streams still running when the drain budget is spent can be aborted.
 */
class ShutdownCoordinator {
public:
    struct Settings {
        std::chrono::milliseconds drain_timeout{30000};
    };

    ShutdownCoordinator() = default;
    explicit ShutdownCoordinator(Settings settings) : settings_(settings) {}

    /// Close the gate. Requests already admitted keep running.
    void begin_drain();

    [[nodiscard]] bool try_admit();
    void release();

    /// Wait up to drain_timeout for the in-flight count to reach zero
    [[nodiscard]] bool await_idle();

    uint64_t add_cancel_hook(std::function<void()> hook);
    void remove_cancel_hook(uint64_t id);

    /// Fire every registered hook; returns the number fired
    size_t cancel_streams();

    [[nodiscard]] bool draining() const;
    [[nodiscard]] uint32_t in_flight() const;

private:
    Settings settings_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool draining_ = false;
    uint32_t in_flight_ = 0;

    std::mutex hooks_mutex_;
    std::map<uint64_t, std::function<void()>> cancel_hooks_;
    uint64_t next_hook_id_ = 1;
};

/// Owns one admitted slot and releases it on destruction
class AdmissionTicket {
public:
    explicit AdmissionTicket(ShutdownCoordinator* owner) : owner_(owner) {}
    ~AdmissionTicket() {
        if (owner_) owner_->release();
    }

    AdmissionTicket(AdmissionTicket&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
    AdmissionTicket& operator=(AdmissionTicket&&) = delete;
    AdmissionTicket(const AdmissionTicket&) = delete;
    AdmissionTicket& operator=(const AdmissionTicket&) = delete;

private:
    ShutdownCoordinator* owner_;
};

/// Keeps a cancel hook registered for the lifetime of the object
class ScopedCancelHook {
public:
    ScopedCancelHook(ShutdownCoordinator* owner, std::function<void()> hook)
        : owner_(owner), id_(owner ? owner->add_cancel_hook(std::move(hook)) : 0) {}
    ~ScopedCancelHook() {
        if (owner_) owner_->remove_cancel_hook(id_);
    }

    ScopedCancelHook(const ScopedCancelHook&) = delete;
    ScopedCancelHook& operator=(const ScopedCancelHook&) = delete;

private:
    ShutdownCoordinator* owner_;
    uint64_t id_;
};

} // namespace rulegate
