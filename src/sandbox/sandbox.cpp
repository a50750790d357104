/**
 * @file sandbox.cpp
 * @brief Sandbox helpers.
 * @author Dimitris Kafetzis
 */

#include "sandbox/sandbox.hpp"

#include <algorithm>

namespace exec_engine {

bool Sandbox::contains(std::string_view relative_path) const {
    return std::find(files.begin(), files.end(), relative_path) != files.end();
}

bool is_safe_relative_path(std::string_view path) {
    if (path.empty() || path.front() == '/') return false;

    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        auto part = path.substr(start, end - start);
        if (part.empty() || part == "." || part == "..") return false;
        if (part.find('\0') != std::string_view::npos) return false;
        start = end + 1;
    }
    return true;
}

}  // namespace exec_engine
