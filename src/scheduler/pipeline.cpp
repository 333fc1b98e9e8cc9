/**
 * @file pipeline.cpp
 * @brief Pipeline definition parsing and validation.
 * @author AnalyzerOrchestrator Team
 */

#include "scheduler/pipeline.hpp"

#include "protocol/worker_protocol.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace analyzer_orchestrator {

namespace {

Result<std::vector<std::string>> string_list(const Json::Value& value, const char* field) {
    std::vector<std::string> out;
    if (value.isNull()) return out;
    if (!value.isArray()) {
        return Error{std::string{field} + " must be an array", ErrorKind::InvalidArgument};
    }
    std::set<std::string> seen;
    for (const auto& item : value) {
        if (!item.isString() || item.asString().empty()) {
            return Error{std::string{field} + " must contain non-empty strings",
                         ErrorKind::InvalidArgument};
        }
        if (seen.insert(item.asString()).second) out.push_back(item.asString());
    }
    return out;
}

Result<StageOptions> stage_options(const Json::Value& value, uint32_t default_max) {
    StageOptions opts;
    opts.max_concurrent_tasks = default_max;
    if (value.isNull()) return opts;
    if (!value.isObject()) {
        return Error{"options must be an object", ErrorKind::InvalidArgument};
    }
    if (value.isMember("parallel")) {
        if (!value["parallel"].isBool()) {
            return Error{"options.parallel must be a boolean", ErrorKind::InvalidArgument};
        }
        opts.parallel = value["parallel"].asBool();
    }
    const auto& max = value.isMember("maxConcurrentTasks") ? value["maxConcurrentTasks"]
                                                           : value["max_concurrent_tasks"];
    if (!max.isNull()) {
        if (!max.isIntegral() || max.asInt64() < 1) {
            return Error{"options.maxConcurrentTasks must be a positive integer",
                         ErrorKind::InvalidArgument};
        }
        opts.max_concurrent_tasks = static_cast<uint32_t>(max.asUInt());
    }
    if (!opts.parallel) opts.max_concurrent_tasks = 1;
    return opts;
}

Json::Value options_json(const StageOptions& opts) {
    Json::Value v(Json::objectValue);
    v["parallel"] = opts.parallel;
    v["maxConcurrentTasks"] = opts.max_concurrent_tasks;
    return v;
}

}  // namespace

Result<void> validate(const PipelineDefinition& definition) {
    if (definition.models.empty()) {
        return Error{"Pipeline needs at least one model", ErrorKind::InvalidArgument};
    }
    if (definition.templates.empty()) {
        return Error{"Pipeline needs at least one template", ErrorKind::InvalidArgument};
    }
    if (definition.analysis_enabled && definition.tools.empty()) {
        return Error{"Analysis is enabled but no tools were selected",
                     ErrorKind::InvalidArgument};
    }
    if (definition.generation.max_concurrent_tasks == 0
        || definition.analysis.max_concurrent_tasks == 0) {
        return Error{"maxConcurrentTasks must be at least 1", ErrorKind::InvalidArgument};
    }
    return {};
}

Result<PipelineDefinition> parse_pipeline(const Json::Value& doc,
                                          uint32_t default_max_concurrent) {
    if (!doc.isObject()) {
        return Error{"Pipeline definition must be a JSON object", ErrorKind::InvalidArgument};
    }
    const auto& generation = doc["generation"];
    if (!generation.isObject()) {
        return Error{"Pipeline definition lacks a generation section",
                     ErrorKind::InvalidArgument};
    }

    PipelineDefinition def;
    if (doc["name"].isString()) def.name = doc["name"].asString();

    auto models = string_list(generation["models"], "generation.models");
    if (!models) return models.error();
    def.models = std::move(models).value();

    auto templates = string_list(generation["templates"], "generation.templates");
    if (!templates) return templates.error();
    def.templates = std::move(templates).value();

    auto gen_opts = stage_options(generation["options"], default_max_concurrent);
    if (!gen_opts) return gen_opts.error();
    def.generation = *gen_opts;

    def.analysis.max_concurrent_tasks = default_max_concurrent;
    const auto& analysis = doc["analysis"];
    if (!analysis.isNull()) {
        if (!analysis.isObject()) {
            return Error{"analysis must be an object", ErrorKind::InvalidArgument};
        }
        def.analysis_enabled = analysis["enabled"].isBool() ? analysis["enabled"].asBool()
                                                            : analysis.isMember("tools");
        auto tools = string_list(analysis["tools"], "analysis.tools");
        if (!tools) return tools.error();
        def.tools = std::move(tools).value();

        auto ana_opts = stage_options(analysis["options"], default_max_concurrent);
        if (!ana_opts) return ana_opts.error();
        def.analysis = *ana_opts;
    }

    if (auto r = validate(def); !r) return r.error();
    return def;
}

Result<PipelineDefinition> parse_pipeline_text(std::string_view text,
                                               uint32_t default_max_concurrent) {
    auto doc = parse_json(text);
    if (!doc) return Error{doc.error().message, ErrorKind::InvalidArgument};
    return parse_pipeline(*doc, default_max_concurrent);
}

Result<PipelineDefinition> load_pipeline_file(const std::filesystem::path& path,
                                              uint32_t default_max_concurrent) {
    std::ifstream in(path);
    if (!in) {
        return Error{"Cannot open pipeline file " + path.string(), ErrorKind::NotFound};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto def = parse_pipeline_text(buffer.str(), default_max_concurrent);
    if (!def) return Error{path.string() + ": " + def.error().message, def.error().kind};
    if (def->name.empty()) def->name = path.stem().string();
    return def;
}

Json::Value to_json(const PipelineDefinition& definition) {
    Json::Value doc(Json::objectValue);
    if (!definition.name.empty()) doc["name"] = definition.name;

    Json::Value generation(Json::objectValue);
    Json::Value models(Json::arrayValue);
    for (const auto& m : definition.models) models.append(m);
    Json::Value templates(Json::arrayValue);
    for (const auto& t : definition.templates) templates.append(t);
    generation["models"] = models;
    generation["templates"] = templates;
    generation["options"] = options_json(definition.generation);
    doc["generation"] = generation;

    Json::Value analysis(Json::objectValue);
    analysis["enabled"] = definition.analysis_enabled;
    Json::Value tools(Json::arrayValue);
    for (const auto& t : definition.tools) tools.append(t);
    analysis["tools"] = tools;
    analysis["options"] = options_json(definition.analysis);
    doc["analysis"] = analysis;
    return doc;
}

}  // namespace analyzer_orchestrator
