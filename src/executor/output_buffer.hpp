/**
 * @file output_buffer.hpp
 * @brief Bounded capture buffer for one output stream.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace exec_engine {

/// Appended once when a stream exceeds its cap.
inline constexpr std::string_view kTruncationMarker = "\n[output truncated]\n";

/**
 * @brief Accumulates stream output up to a byte cap.
 *
 * Bytes past the cap are dropped and kTruncationMarker is appended exactly
 * once. The marker does not count against the cap.
 */
class OutputBuffer {
public:
    /// @param limit_bytes 0 = unbounded
    explicit OutputBuffer(uint64_t limit_bytes = 0);

    /**
     * @brief Append a chunk.
     * @return The text actually stored by this call (possibly a prefix of
     *         @p chunk followed by the marker, possibly empty).
     */
    std::string append(std::string_view chunk);

    [[nodiscard]] const std::string& str() const noexcept { return data_; }
    [[nodiscard]] std::string take() noexcept { return std::move(data_); }
    [[nodiscard]] bool truncated() const noexcept { return truncated_; }
    [[nodiscard]] uint64_t dropped_bytes() const noexcept { return dropped_; }
    [[nodiscard]] uint64_t captured_bytes() const noexcept { return captured_; }

private:
    uint64_t limit_;
    uint64_t captured_{0};
    uint64_t dropped_{0};
    bool truncated_{false};
    std::string data_;
};

}  // namespace exec_engine
