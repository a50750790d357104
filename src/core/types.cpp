/**
 * @file types.cpp
 * @brief Identifier generation and enum parsing.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <array>
#include <mutex>
#include <random>

namespace exec_engine {

std::string generate_id() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard lock(mutex);
        hi = rng();
        lo = rng();
    }

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    constexpr std::array<char, 16> hex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                          '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string out;
    out.reserve(36);
    for (int i = 60; i >= 0; i -= 4) {
        out.push_back(hex[(hi >> i) & 0xF]);
        if (i == 32 || i == 16) out.push_back('-');
    }
    out.push_back('-');
    for (int i = 60; i >= 0; i -= 4) {
        out.push_back(hex[(lo >> i) & 0xF]);
        if (i == 48) out.push_back('-');
    }
    return out;
}

Result<Language> parse_language(std::string_view name) {
    if (name == "python")     return Language::Python;
    if (name == "javascript") return Language::JavaScript;
    if (name == "ruby")       return Language::Ruby;
    return Error{ErrorKind::InvalidArgument,
                 "Unsupported language: " + std::string{name}};
}

Result<ExecutionStatus> parse_execution_status(std::string_view text) {
    if (text == "QUEUED")    return ExecutionStatus::Queued;
    if (text == "RUNNING")   return ExecutionStatus::Running;
    if (text == "COMPLETED") return ExecutionStatus::Completed;
    if (text == "ERROR")     return ExecutionStatus::Error;
    return Error{ErrorKind::InvalidArgument,
                 "Invalid execution status: " + std::string{text}};
}

}  // namespace exec_engine
