/**
 * @file worker_client.cpp
 * @brief WsWorkerClient implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "network/worker_client.hpp"

#include "protocol/worker_protocol.hpp"

#include <algorithm>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "POOL";

Duration remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<Duration>(deadline - std::chrono::steady_clock::now());
    return std::max(left, Duration{0});
}

}  // namespace

Result<WsUrl> worker_request_url(ServiceType service, const std::string& url) {
    auto parsed = parse_ws_url(url);
    if (!parsed) return parsed.error();
    if (parsed->path.empty() || parsed->path == "/") {
        parsed->path = "/" + std::string{to_string(service)};
    }
    return parsed;
}

WsWorkerClient::WsWorkerClient(Logger& logger, const ServicesConfig& config)
    : logger_(logger),
      connect_timeout_(config.connect_timeout_ms),
      max_message_size_(config.max_message_size_bytes) {}

bool WsWorkerClient::probe(ServiceType service, const std::string& url, Duration timeout) {
    auto reply = exchange(service, url, make_health_check(), timeout);
    if (!reply) {
        logger_.debug(kCtx, "Probe " + url + " failed: " + reply.error().message);
        return false;
    }
    const auto& status = (*reply)["status"];
    return status.isString() && status.asString() == "healthy";
}

Result<Json::Value> WsWorkerClient::send(ServiceType service, const std::string& url,
                                         const Json::Value& message, Duration timeout) {
    return exchange(service, url, message, timeout);
}

Result<Json::Value> WsWorkerClient::exchange(ServiceType service, const std::string& url,
                                             const Json::Value& message, Duration timeout) {
    auto target = worker_request_url(service, url);
    if (!target) return target.error();

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    WsConnection conn;
    conn.set_max_message_size(max_message_size_);
    if (auto r = conn.connect(*target, std::min(connect_timeout_, timeout)); !r) {
        return r.error();
    }
    if (auto r = conn.send_text(to_json_string(message), remaining(deadline)); !r) {
        conn.close();
        return r.error();
    }

    while (true) {
        auto text = conn.receive(remaining(deadline));
        if (!text) {
            conn.close();
            return text.error();
        }

        auto reply = parse_json(*text);
        if (!reply) {
            conn.close();
            return reply.error();
        }

        if (is_terminal_message(*reply)) {
            conn.close();
            return reply;
        }

        static const Json::Value kNone;
        const auto& type = reply->isObject() ? (*reply)["type"] : kNone;
        if (type.isString() && type.asString() == "progress_update") {
            const auto& text = (*reply)["message"];
            logger_.debug(kCtx, "Progress from " + target->to_string() + ": "
                                    + (text.isString() ? text.asString() : to_json_string(text)));
        } else if (type.isString() && type.asString() == "request_queued") {
            logger_.debug(kCtx, "Request queued at " + target->to_string());
        } else {
            logger_.debug(kCtx, "Ignoring message from " + target->to_string() + ": "
                                    + to_json_string(*reply));
        }
    }
}

}  // namespace analyzer_orchestrator
