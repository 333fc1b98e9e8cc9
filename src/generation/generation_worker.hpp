/**
 * @file generation_worker.hpp
 * @brief Produces one application for an allocated slot.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/worker_client.hpp"
#include "pool/endpoint_pool.hpp"
#include "protocol/worker_protocol.hpp"

#include <optional>
#include <string>

namespace analyzer_orchestrator {

struct GenerationOutput {
    std::optional<std::string> app_dir;
};

class IGenerationWorker {
public:
    virtual ~IGenerationWorker() = default;
    virtual Result<GenerationOutput> generate(const GenerationRequest& request) = 0;
};

/**
 * @brief Sends generation requests to a "generation" endpoint from the pool.
 *
 * Endpoint failures are reported back to the pool the same way analysis
 * dispatch reports them.
 */
class RemoteGenerationWorker : public IGenerationWorker {
public:
    RemoteGenerationWorker(EndpointPool& pool, IWorkerClient& client, Logger& logger,
                           Duration timeout);

    Result<GenerationOutput> generate(const GenerationRequest& request) override;

private:
    EndpointPool& pool_;
    IWorkerClient& client_;
    Logger& logger_;
    Duration timeout_;
};

}  // namespace analyzer_orchestrator
