/**
 * @file fake_worker_client.hpp
 * @brief Scripted IWorkerClient: probe answers per URL, send answers from a handler.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "network/worker_client.hpp"
#include "protocol/worker_protocol.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace analyzer_orchestrator::testing {

class FakeWorkerClient : public IWorkerClient {
public:
    using SendHandler = std::function<Result<Json::Value>(ServiceType, const std::string& url,
                                                          const Json::Value& message)>;

    struct Call {
        ServiceType service;
        std::string url;
        Json::Value message;
    };

    FakeWorkerClient() : handler_(success_handler()) {}

    bool probe(ServiceType /*service*/, const std::string& url, Duration /*timeout*/) override {
        std::lock_guard lock(mutex_);
        ++probes_[url];
        auto it = healthy_.find(url);
        return it == healthy_.end() ? true : it->second;
    }

    Result<Json::Value> send(ServiceType service, const std::string& url,
                             const Json::Value& message, Duration /*timeout*/) override {
        SendHandler handler;
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(Call{service, url, message});
            handler = handler_;
        }
        return handler(service, url, message);
    }

    void set_probe_result(const std::string& url, bool healthy) {
        std::lock_guard lock(mutex_);
        healthy_[url] = healthy;
    }

    void set_handler(SendHandler handler) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    [[nodiscard]] int probes(const std::string& url) const {
        std::lock_guard lock(mutex_);
        auto it = probes_.find(url);
        return it == probes_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    /// A worker reply with the given status and one finding per tool.
    static Json::Value analysis_reply(const std::string& status, const Json::Value& request,
                                      const std::string& severity = "high") {
        Json::Value reply(Json::objectValue);
        reply["type"] = "analysis_result";
        reply["status"] = status;
        Json::Value analysis(Json::objectValue);
        Json::Value findings(Json::arrayValue);
        Json::Value used(Json::arrayValue);
        for (const auto& tool : request["tools"]) {
            Json::Value finding(Json::objectValue);
            finding["tool"] = tool.asString();
            finding["severity"] = severity;
            finding["message"] = "issue from " + tool.asString();
            findings.append(finding);
            used.append(tool.asString());
        }
        analysis["findings"] = findings;
        analysis["toolsUsed"] = used;
        Json::Value breakdown(Json::objectValue);
        breakdown[severity] = findings.size();
        analysis["severityBreakdown"] = breakdown;
        reply["analysis"] = analysis;
        if (status == "error") reply["error"] = "tool crashed";
        return reply;
    }

    static SendHandler success_handler() {
        return [](ServiceType, const std::string&, const Json::Value& message)
                   -> Result<Json::Value> {
            if (message["type"].asString() == "generation_request") {
                Json::Value reply(Json::objectValue);
                reply["type"] = "generation_result";
                reply["status"] = "success";
                reply["appDir"] = "generated/" + message["model"].asString() + "/app"
                                  + std::to_string(message["appNumber"].asInt64());
                return reply;
            }
            return analysis_reply("success", message);
        };
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> healthy_;
    std::map<std::string, int> probes_;
    std::vector<Call> calls_;
    SendHandler handler_;
};

}  // namespace analyzer_orchestrator::testing
