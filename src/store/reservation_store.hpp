/**
 * @file reservation_store.hpp
 * @brief Conflict-free application slot allocation with linear version lineage.
 * @author AnalyzerOrchestrator Team
 *
 * Allocation is one INSERT ... SELECT statement guarded by
 * UNIQUE(model, app_number, version); a collision or busy store is retried
 * internally with jittered backoff. There is no read-then-write path.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "store/database.hpp"
#include "store/named_lock.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace analyzer_orchestrator {

enum class GenerationStatus : uint8_t {
    Pending,
    Generated,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(GenerationStatus status) noexcept {
    switch (status) {
        case GenerationStatus::Pending:   return "pending";
        case GenerationStatus::Generated: return "generated";
        case GenerationStatus::Failed:    return "failed";
    }
    return "unknown";
}

struct ApplicationSlot {
    SlotId id = 0;
    ModelSlug model;
    int64_t app_number = 0;
    int64_t version = 1;
    std::optional<SlotId> parent_slot_id;
    std::string template_name;
    std::optional<std::string> batch_id;
    GenerationStatus generation_status = GenerationStatus::Pending;
    std::optional<std::string> error_message;
    Timestamp created_at{};
};

struct AllocationRequest {
    ModelSlug model;
    std::optional<int64_t> requested_app_number;
    std::string template_name;
    std::optional<std::string> batch_id;
};

class ReservationStore {
public:
    static Result<std::unique_ptr<ReservationStore>> open(const StoreConfig& config,
                                                          Logger& logger,
                                                          ClockFn clock = system_clock_fn());

    ReservationStore(const ReservationStore&) = delete;
    ReservationStore& operator=(const ReservationStore&) = delete;

    /**
     * @brief Reserve the next free app number for a model (version 1).
     *
     * Safe under any number of concurrent callers, in this process or others.
     * A requested number that is already taken is an AllocationConflict.
     */
    Result<ApplicationSlot> allocate(const AllocationRequest& request);

    /// Convenience overload: next free number, no template or batch.
    Result<ApplicationSlot> allocate(const ModelSlug& model,
                                     std::optional<int64_t> requested_app_number = std::nullopt);

    /**
     * @brief Create version parent.version + 1 of the parent's application.
     *
     * Rejects with StaleVersion when the parent is not the latest version.
     */
    Result<ApplicationSlot> create_version(SlotId parent_slot_id);

    /// Record the outcome of the generation job for a slot.
    Result<void> mark_generated(SlotId slot_id, bool success,
                                const std::optional<std::string>& error = std::nullopt);

    Result<ApplicationSlot> get(SlotId slot_id);
    Result<ApplicationSlot> latest(const ModelSlug& model, int64_t app_number);
    Result<std::vector<ApplicationSlot>> lineage(const ModelSlug& model, int64_t app_number);
    Result<bool> exists(const ModelSlug& model, int64_t app_number);

private:
    ReservationStore(Database db, const StoreConfig& config, Logger& logger, ClockFn clock);

    Result<void> create_schema();
    Result<ApplicationSlot> insert_next(const AllocationRequest& request);
    Result<ApplicationSlot> insert_requested(const AllocationRequest& request);
    Result<ApplicationSlot> get_locked(SlotId slot_id);
    Result<ApplicationSlot> latest_locked(const ModelSlug& model, int64_t app_number);

    Database db_;
    StoreConfig config_;
    Logger& logger_;
    ClockFn clock_;
    NamedLock write_lock_;
    std::mutex mutex_;
};

}  // namespace analyzer_orchestrator
