#include "server/shutdown_coordinator.hpp"

#include <vector>

namespace rulegate {

void ShutdownCoordinator::begin_drain() {
    {
        std::lock_guard lock(mutex_);
        draining_ = true;
    }
    idle_cv_.notify_all();
}

bool ShutdownCoordinator::try_admit() {
    std::lock_guard lock(mutex_);
    if (draining_) return false;
    ++in_flight_;
    return true;
}

void ShutdownCoordinator::release() {
    bool idle = false;
    {
        std::lock_guard lock(mutex_);
        if (in_flight_ > 0) --in_flight_;
        idle = draining_ && in_flight_ == 0;
    }
    if (idle) idle_cv_.notify_all();
}

bool ShutdownCoordinator::await_idle() {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, settings_.drain_timeout, [this] { return in_flight_ == 0; });
}

bool ShutdownCoordinator::draining() const {
    std::lock_guard lock(mutex_);
    return draining_;
}

uint32_t ShutdownCoordinator::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

uint64_t ShutdownCoordinator::add_cancel_hook(std::function<void()> hook) {
    std::lock_guard lock(hooks_mutex_);
    const uint64_t id = next_hook_id_++;
    cancel_hooks_.emplace(id, std::move(hook));
    return id;
}

void ShutdownCoordinator::remove_cancel_hook(uint64_t id) {
    std::lock_guard lock(hooks_mutex_);
    cancel_hooks_.erase(id);
}

size_t ShutdownCoordinator::cancel_streams() {
    // Hooks run unlocked; a hook may remove itself
    std::vector<std::function<void()>> snapshot;
    {
        std::lock_guard lock(hooks_mutex_);
        snapshot.reserve(cancel_hooks_.size());
        for (const auto& entry : cancel_hooks_) snapshot.push_back(entry.second);
    }
    for (const auto& hook : snapshot) hook();
    return snapshot.size();
}

} // namespace rulegate
