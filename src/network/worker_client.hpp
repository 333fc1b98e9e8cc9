/**
 * @file worker_client.hpp
 * @brief Request/response exchange with a remote worker endpoint.
 * @author AnalyzerOrchestrator Team
 *
 * IWorkerClient is the seam between dispatch logic and the wire: the
 * orchestrator, the generation worker and the endpoint pool only see JSON
 * messages, and tests substitute a scripted client.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/ws_connection.hpp"

#include <json/json.h>

#include <string>

namespace analyzer_orchestrator {

class IWorkerClient {
public:
    virtual ~IWorkerClient() = default;

    /// Health probe. True only for an explicit "healthy" reply within the timeout.
    virtual bool probe(ServiceType service, const std::string& url, Duration timeout) = 0;

    /**
     * @brief Send one request and wait for its terminal reply.
     *
     * Intermediate messages (queued, progress) are consumed. Transport
     * failures are RemoteFailure, deadline expiry is Timeout.
     */
    virtual Result<Json::Value> send(ServiceType service, const std::string& url,
                                     const Json::Value& message, Duration timeout) = 0;
};

/// Endpoint URL plus the service path, unless the URL already names one.
Result<WsUrl> worker_request_url(ServiceType service, const std::string& url);

/**
 * @brief IWorkerClient over a fresh WebSocket connection per exchange.
 */
class WsWorkerClient : public IWorkerClient {
public:
    WsWorkerClient(Logger& logger, const ServicesConfig& config);

    bool probe(ServiceType service, const std::string& url, Duration timeout) override;
    Result<Json::Value> send(ServiceType service, const std::string& url,
                             const Json::Value& message, Duration timeout) override;

private:
    Result<Json::Value> exchange(ServiceType service, const std::string& url,
                                 const Json::Value& message, Duration timeout);

    Logger& logger_;
    Duration connect_timeout_;
    uint64_t max_message_size_;
};

}  // namespace analyzer_orchestrator
