/**
 * @file output_buffer.cpp
 * @brief OutputBuffer implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/output_buffer.hpp"

#include <algorithm>

namespace exec_engine {

OutputBuffer::OutputBuffer(uint64_t limit_bytes) : limit_(limit_bytes) {}

std::string OutputBuffer::append(std::string_view chunk) {
    if (chunk.empty()) return {};

    if (truncated_) {
        dropped_ += chunk.size();
        return {};
    }

    uint64_t room = limit_ == 0 ? chunk.size() : limit_ - captured_;
    auto keep = static_cast<size_t>(std::min<uint64_t>(room, chunk.size()));

    std::string stored(chunk.substr(0, keep));
    captured_ += keep;

    if (keep < chunk.size()) {
        dropped_ += chunk.size() - keep;
        truncated_ = true;
        stored += kTruncationMarker;
    }

    data_ += stored;
    return stored;
}

}  // namespace exec_engine
