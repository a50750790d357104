/**
 * @file logger.cpp
 * @brief Logger record formatting and JSON escaping.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace exec_engine {

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += hex.str();
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message, LogFields fields) { log(LogLevel::Debug, message, fields); }
void Logger::info(std::string_view message, LogFields fields)  { log(LogLevel::Info, message, fields); }
void Logger::warn(std::string_view message, LogFields fields)  { log(LogLevel::Warn, message, fields); }
void Logger::error(std::string_view message, LogFields fields) { log(LogLevel::Error, message, fields); }

std::string Logger::format_record(LogLevel level, std::string_view message, LogFields fields) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << R"({"level":")" << to_string(level)
        << R"(","ts":")" << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << millis
        << R"(Z","msg":")" << json_escape(message) << '"';
    for (const auto& field : fields) {
        out << ",\"" << json_escape(field.key) << "\":\"" << json_escape(field.value) << '"';
    }
    out << '}';
    return out.str();
}

void Logger::log(LogLevel level, std::string_view message, LogFields fields) {
    if (!enabled(level)) return;

    auto line = format_record(level, message, fields);
    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_.store(level); }
LogLevel Logger::level() const noexcept { return min_level_.load(); }

bool Logger::enabled(LogLevel level) const noexcept {
    return level >= min_level_.load(std::memory_order_relaxed);
}

}  // namespace exec_engine
