/**
 * @file test_env.hpp
 * @brief Shared fixtures: scratch directories, quiet loggers, store configs.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

namespace analyzer_orchestrator::testing {

/// Logger that keeps every line in memory.
struct CapturedLogger {
    std::shared_ptr<MemorySink::Buffer> buffer = std::make_shared<MemorySink::Buffer>();
    Logger logger{std::make_unique<MemorySink>(buffer), LogLevel::Debug};

    [[nodiscard]] bool contains(const std::string& needle) const {
        std::lock_guard lock(buffer->mutex);
        for (const auto& line : buffer->lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

/**
 * @brief Fixture owning a fresh scratch directory per test.
 */
class ScratchDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("ao_test_" + make_id("dir"));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] StoreConfig store_config() const {
        StoreConfig config;
        config.database_path = dir_ / "orchestrator.db";
        config.lock_dir = dir_ / "locks";
        config.lock_timeout_ms = 5000;
        config.busy_timeout_ms = 5000;
        config.allocation_max_attempts = 50;
        return config;
    }
};

}  // namespace analyzer_orchestrator::testing
