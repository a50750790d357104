/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation: scripted usage samples for testing.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

#include <system_error>

namespace exec_engine {

MockMonitor::MockMonitor(uint32_t /*sampling_interval_ms*/) {}

Result<MonitorHandle> MockMonitor::attach(const SandboxHandle& sandbox) {
    std::lock_guard lock(mutex_);
    ++attach_calls_;
    if (!sandbox) {
        return Error{ErrorKind::InvalidArgument, "Cannot attach monitor to a null sandbox"};
    }
    if (fail_attach_) {
        return Error{ErrorKind::Internal, "Mock attach failure"};
    }
    if (throw_attach_) {
        throw_attach_ = false;
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "thread");
    }
    auto handle = next_handle_++;
    attached_.emplace(handle, UsageSnapshot{});
    return handle;
}

Result<UsageSnapshot> MockMonitor::snapshot(MonitorHandle handle) {
    std::lock_guard lock(mutex_);
    auto it = attached_.find(handle);
    if (it == attached_.end()) {
        return Error{ErrorKind::NotFound, "Unknown monitor handle " + std::to_string(handle)};
    }
    if (!sequence_.empty()) {
        it->second = fold_usage(it->second, sequence_.front());
        sequence_.pop_front();
    }
    return it->second;
}

void MockMonitor::merge(MonitorHandle handle, const UsageSnapshot& usage) {
    std::lock_guard lock(mutex_);
    if (throw_merge_) {
        throw_merge_ = false;
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "merge");
    }
    if (ignore_merge_) return;
    auto it = attached_.find(handle);
    if (it == attached_.end()) return;
    it->second = fold_usage(it->second, usage);
}

Result<UsageSnapshot> MockMonitor::detach(MonitorHandle handle) {
    std::lock_guard lock(mutex_);
    ++detach_calls_;
    auto it = attached_.find(handle);
    if (it == attached_.end()) {
        return Error{ErrorKind::NotFound, "Unknown monitor handle " + std::to_string(handle)};
    }
    auto usage = it->second;
    while (!sequence_.empty()) {
        usage = fold_usage(usage, sequence_.front());
        sequence_.pop_front();
    }
    attached_.erase(it);
    return usage;
}

size_t MockMonitor::attached_count() const {
    std::lock_guard lock(mutex_);
    return attached_.size();
}

void MockMonitor::push_sample(UsageSnapshot sample) {
    std::lock_guard lock(mutex_);
    sequence_.push_back(sample);
}

void MockMonitor::set_fail_attach(bool fail) {
    std::lock_guard lock(mutex_);
    fail_attach_ = fail;
}

void MockMonitor::set_ignore_merge(bool ignore) {
    std::lock_guard lock(mutex_);
    ignore_merge_ = ignore;
}

void MockMonitor::throw_on_next_attach() {
    std::lock_guard lock(mutex_);
    throw_attach_ = true;
}

void MockMonitor::throw_on_next_merge() {
    std::lock_guard lock(mutex_);
    throw_merge_ = true;
}

size_t MockMonitor::attach_calls() const {
    std::lock_guard lock(mutex_);
    return attach_calls_;
}

size_t MockMonitor::detach_calls() const {
    std::lock_guard lock(mutex_);
    return detach_calls_;
}

}  // namespace exec_engine
