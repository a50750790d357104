/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ExecEngine interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for components that sit on
 * the sampling path. These concepts enable static polymorphism with no
 * virtual dispatch.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>
#include <cstdint>
#include <memory>

namespace exec_engine {

// Forward declarations
struct Sandbox;
using SandboxHandle = std::shared_ptr<Sandbox>;

/// Opaque identifier of one monitor attachment.
using MonitorHandle = uint64_t;

// ─────────────────────────────────────────────
// UsageMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept UsageMonitorLike
 * @brief Constrains types that sample resource usage of a sandbox.
 *
 * snapshot() may be called at any time by status queries while the
 * sampler runs, so we use concept-based static polymorphism instead of
 * virtual dispatch.
 */
template <typename T>
concept UsageMonitorLike = requires(T monitor,
                                    const SandboxHandle& sandbox,
                                    MonitorHandle handle,
                                    const UsageSnapshot& usage) {
    { monitor.attach(sandbox) } -> std::same_as<Result<MonitorHandle>>;
    { monitor.snapshot(handle) } -> std::same_as<Result<UsageSnapshot>>;
    { monitor.merge(handle, usage) } -> std::same_as<void>;
    { monitor.detach(handle) } -> std::same_as<Result<UsageSnapshot>>;
    { monitor.attached_count() } -> std::convertible_to<size_t>;
};

}  // namespace exec_engine
