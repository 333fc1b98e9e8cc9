/**
 * @file generation_worker.cpp
 * @brief RemoteGenerationWorker implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "generation/generation_worker.hpp"

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "GEN";

}  // namespace

RemoteGenerationWorker::RemoteGenerationWorker(EndpointPool& pool, IWorkerClient& client,
                                               Logger& logger, Duration timeout)
    : pool_(pool), client_(client), logger_(logger), timeout_(timeout) {}

Result<GenerationOutput> RemoteGenerationWorker::generate(const GenerationRequest& request) {
    auto lease = pool_.lease(ServiceType::Generation);
    if (!lease) {
        return Error{"No healthy generation endpoint available", ErrorKind::CapacityExhausted};
    }
    const auto& url = lease->endpoint().url;
    logger_.debug(kCtx, "Generating " + request.model + "/app" + std::to_string(request.app_number)
                            + " (" + request.template_name + ") on " + url);

    const auto started = std::chrono::steady_clock::now();
    auto reply = client_.send(ServiceType::Generation, url, encode_generation_request(request),
                              timeout_);
    const auto latency = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    if (!reply) {
        lease->report_failure();
        return Error{"Generation on " + url + " failed: " + reply.error().message,
                     reply.error().kind == ErrorKind::Timeout ? ErrorKind::Timeout
                                                              : ErrorKind::RemoteFailure};
    }

    auto response = decode_generation_response(*reply);
    if (!response) return response.error();

    switch (response->status) {
        case WorkerStatus::Success:
        case WorkerStatus::Partial:
            lease->report_success(latency);
            return GenerationOutput{response->app_dir};
        case WorkerStatus::Timeout:
            lease->report_failure();
            return Error{"Generation timed out on " + url, ErrorKind::Timeout};
        case WorkerStatus::Error:
            break;
    }
    lease->report_success(latency);
    return Error{response->error.value_or("Generation failed"), ErrorKind::RemoteFailure};
}

}  // namespace analyzer_orchestrator
