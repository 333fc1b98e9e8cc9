/**
 * @file pipeline.hpp
 * @brief Declarative pipeline definition: models x templates, optional analysis.
 * @author AnalyzerOrchestrator Team
 *
 * JSON shape:
 *   {"generation": {"models": [...], "templates": [...],
 *                   "options": {"parallel": true, "maxConcurrentTasks": 2}},
 *    "analysis":   {"enabled": true, "tools": [...],
 *                   "options": {"parallel": true, "maxConcurrentTasks": 2}}}
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace analyzer_orchestrator {

struct StageOptions {
    bool parallel = true;
    uint32_t max_concurrent_tasks = 2;   ///< Forced to 1 when parallel is false
};

struct PipelineDefinition {
    std::string name;
    std::vector<ModelSlug> models;
    std::vector<std::string> templates;
    StageOptions generation;
    bool analysis_enabled = false;
    std::vector<ToolName> tools;
    StageOptions analysis;

    /// |models| x |templates|
    [[nodiscard]] size_t job_count() const noexcept { return models.size() * templates.size(); }
};

/// Checks non-empty models and templates, and tools when analysis is enabled.
Result<void> validate(const PipelineDefinition& definition);

Result<PipelineDefinition> parse_pipeline(const Json::Value& doc,
                                          uint32_t default_max_concurrent = 2);
Result<PipelineDefinition> parse_pipeline_text(std::string_view text,
                                               uint32_t default_max_concurrent = 2);
Result<PipelineDefinition> load_pipeline_file(const std::filesystem::path& path,
                                              uint32_t default_max_concurrent = 2);

Json::Value to_json(const PipelineDefinition& definition);

}  // namespace analyzer_orchestrator
