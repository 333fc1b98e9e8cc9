/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author AnalyzerOrchestrator Team
 */

#include "core/logger.hpp"

#include "core/types.hpp"

#include <chrono>
#include <cstdio>

namespace analyzer_orchestrator {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, {}, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, {}, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, {}, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, {}, message); }

void Logger::debug(std::string_view ctx, std::string_view message) { log(LogLevel::Debug, ctx, message); }
void Logger::info(std::string_view ctx, std::string_view message)  { log(LogLevel::Info, ctx, message); }
void Logger::warn(std::string_view ctx, std::string_view message)  { log(LogLevel::Warn, ctx, message); }
void Logger::error(std::string_view ctx, std::string_view message) { log(LogLevel::Error, ctx, message); }

void Logger::log(LogLevel level, std::string_view message) {
    log(level, {}, message);
}

void Logger::log(LogLevel level, std::string_view ctx, std::string_view message) {
    if (level < min_level_) return;

    std::string line;
    line.reserve(message.size() + 80);
    line += R"({"level":")";
    line += to_string(level);
    line += R"(","ts":")";
    line += format_timestamp(std::chrono::system_clock::now());
    line += '"';
    if (!ctx.empty()) {
        line += R"(,"ctx":")";
        line += json_escape(ctx);
        line += '"';
    }
    line += R"(,"msg":")";
    line += json_escape(message);
    line += R"("})";

    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace analyzer_orchestrator
