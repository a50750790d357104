/**
 * @file process_monitor.cpp
 * @brief ProcessMonitor: samples CPU time and resident memory of a
 *        sandboxed process group from /proc/<pid>/stat.
 * @author Dimitris Kafetzis
 *
 * Sampling is performed by one std::jthread per attachment at a configurable
 * interval. The running aggregate is published atomically for lock-free
 * reads by status queries.
 */

#include "resource_monitor/monitor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace exec_engine {

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

struct ProcStat {
    pid_t pgrp{0};
    uint64_t cpu_ticks{0};   ///< utime + stime + cutime + cstime
    uint64_t rss_pages{0};
};

std::string read_file_line(const std::string& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

/**
 * @brief Parse /proc/<pid>/stat.
 * Format: "pid (comm) state ppid pgrp ... utime stime cutime cstime ... rss ..."
 * comm may contain spaces and parentheses, so fields are counted from the
 * last ')'.
 */
bool parse_stat_line(const std::string& line, ProcStat& out) {
    auto close = line.rfind(')');
    if (close == std::string::npos) return false;

    std::istringstream iss(line.substr(close + 1));
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
        if (fields.size() > 21) break;
    }
    // fields[0] is field 3 (state); rss is field 24.
    if (fields.size() <= 21) return false;

    try {
        out.pgrp = static_cast<pid_t>(std::stol(fields[2]));
        int64_t utime = std::stoll(fields[11]);
        int64_t stime = std::stoll(fields[12]);
        int64_t cutime = std::stoll(fields[13]);
        int64_t cstime = std::stoll(fields[14]);
        int64_t rss = std::stoll(fields[21]);
        out.cpu_ticks = static_cast<uint64_t>(std::max<int64_t>(0, utime + stime + cutime + cstime));
        out.rss_pages = static_cast<uint64_t>(std::max<int64_t>(0, rss));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool is_pid_dir(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // anonymous namespace

Result<UsageSnapshot> read_process_group_usage(pid_t pgid) {
    if (pgid <= 0) {
        return Error{ErrorKind::InvalidArgument, "Invalid process group " + std::to_string(pgid)};
    }

    static const long ticks_per_second = std::max(1L, ::sysconf(_SC_CLK_TCK));
    static const long page_size = std::max(1L, ::sysconf(_SC_PAGESIZE));

    uint64_t ticks = 0;
    uint64_t rss_pages = 0;
    size_t members = 0;

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator("/proc", ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (!is_pid_dir(name)) continue;

        // Processes may vanish between listing and reading.
        auto line = read_file_line("/proc/" + name + "/stat");
        ProcStat stat;
        if (line.empty() || !parse_stat_line(line, stat)) continue;
        if (stat.pgrp != pgid) continue;

        ticks += stat.cpu_ticks;
        rss_pages += stat.rss_pages;
        ++members;
    }
    if (ec) {
        return Error{ErrorKind::Internal, "Cannot scan /proc: " + ec.message()};
    }
    if (members == 0) {
        return Error{ErrorKind::NotFound, "No process in group " + std::to_string(pgid)};
    }

    UsageSnapshot usage;
    usage.cpu_time = Duration{static_cast<int64_t>(ticks * 1'000'000 / static_cast<uint64_t>(ticks_per_second))};
    usage.peak_memory_bytes = rss_pages * static_cast<uint64_t>(page_size);
    usage.samples = 1;
    return usage;
}

UsageSnapshot fold_usage(const UsageSnapshot& current, const UsageSnapshot& sample) noexcept {
    UsageSnapshot next;
    next.cpu_time = std::max(current.cpu_time, sample.cpu_time);
    next.peak_memory_bytes = std::max(current.peak_memory_bytes, sample.peak_memory_bytes);
    next.samples = current.samples + sample.samples;
    return next;
}

// ─────────────────────────────────────────────
// ProcessMonitor implementation
// ─────────────────────────────────────────────

ProcessMonitor::ProcessMonitor(uint32_t sampling_interval_ms)
    : interval_ms_(sampling_interval_ms == 0 ? 1 : sampling_interval_ms) {}

ProcessMonitor::~ProcessMonitor() {
    std::unordered_map<MonitorHandle, std::unique_ptr<Attachment>> remaining;
    {
        std::lock_guard lock(mutex_);
        remaining.swap(attachments_);
    }
    // Attachment destructors request stop and join their samplers.
    for (auto& [handle, attachment] : remaining) {
        attachment->sampler.request_stop();
    }
}

Result<MonitorHandle> ProcessMonitor::attach(const SandboxHandle& sandbox) {
    if (!sandbox) {
        return Error{ErrorKind::InvalidArgument, "Cannot attach monitor to a null sandbox"};
    }

    auto attachment = std::make_unique<Attachment>();
    attachment->sandbox = sandbox;
    attachment->latest.store(std::make_shared<const UsageSnapshot>());

    auto* raw = attachment.get();
    raw->sampler = std::jthread([this, raw](std::stop_token stop) {
        sampling_loop(*raw, stop);
    });

    std::lock_guard lock(mutex_);
    MonitorHandle handle = next_handle_++;
    attachments_.emplace(handle, std::move(attachment));
    return handle;
}

Result<UsageSnapshot> ProcessMonitor::snapshot(MonitorHandle handle) {
    std::lock_guard lock(mutex_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) {
        return Error{ErrorKind::NotFound, "Unknown monitor handle " + std::to_string(handle)};
    }
    return *it->second->latest.load();
}

void ProcessMonitor::merge(MonitorHandle handle, const UsageSnapshot& usage) {
    std::lock_guard lock(mutex_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) return;
    fold_into(*it->second, usage);
}

Result<UsageSnapshot> ProcessMonitor::detach(MonitorHandle handle) {
    std::unique_ptr<Attachment> attachment;
    {
        std::lock_guard lock(mutex_);
        auto it = attachments_.find(handle);
        if (it == attachments_.end()) {
            return Error{ErrorKind::NotFound, "Unknown monitor handle " + std::to_string(handle)};
        }
        attachment = std::move(it->second);
        attachments_.erase(it);
    }

    attachment->sampler.request_stop();
    if (attachment->sampler.joinable()) {
        attachment->sampler.join();
    }
    return *attachment->latest.load();
}

size_t ProcessMonitor::attached_count() const {
    std::lock_guard lock(mutex_);
    return attachments_.size();
}

void ProcessMonitor::sampling_loop(Attachment& attachment, std::stop_token stop) {
    const auto interval = std::chrono::milliseconds(interval_ms_);
    while (!stop.stop_requested()) {
        pid_t pgid = attachment.sandbox->process_group.load();
        if (pgid > 0) {
            auto usage = read_process_group_usage(pgid);
            if (usage.has_value()) {
                fold_into(attachment, *usage);
            }
        }

        std::unique_lock lock(attachment.sleep_mutex);
        attachment.sleep_cv.wait_for(lock, stop, interval, [] { return false; });
    }
}

void ProcessMonitor::fold_into(Attachment& attachment, const UsageSnapshot& sample) {
    std::lock_guard lock(attachment.fold_mutex);
    auto current = attachment.latest.load();
    attachment.latest.store(std::make_shared<const UsageSnapshot>(fold_usage(*current, sample)));
}

}  // namespace exec_engine
