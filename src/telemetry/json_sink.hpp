/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace analyzer_orchestrator {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The live file is <prefix>.ndjson. When it reaches the size limit it is
 * shifted to <prefix>.1.ndjson, older files move up by one and anything past
 * max_files is removed.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Byte-granular limit, used by tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory. Tests read them back through a shared handle.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    explicit MemorySink(std::shared_ptr<Buffer> buffer) : buffer_(std::move(buffer)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(buffer_->mutex);
        buffer_->lines.emplace_back(json_line);
    }
    void flush() override {}

private:
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace analyzer_orchestrator
