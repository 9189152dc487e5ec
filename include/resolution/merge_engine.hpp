#pragma once

#include "resolution/entity_registry.hpp"
#include "resolution/resolver.hpp"
#include "resolution/types.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

// ============================================================================
// Configuration and Results
// ============================================================================

struct MergeEngineConfig {
    size_t writer_shards = 4;       ///< Writer threads; blocking keys hash onto them
    size_t max_segments = 4096;     ///< Arena capacity in segments of 1024 entities
    bool verbose = false;

    nlohmann::json to_json() const;
    static MergeEngineConfig from_json(const nlohmann::json& j);
};

enum class ApplyOutcome {
    Created,
    Merged,
    Replayed
};

struct ApplyResult {
    EntityId entity_id = kNoEntity;         ///< Root the mention belongs to after the commit
    ApplyOutcome outcome = ApplyOutcome::Created;
    MergeDecision decision;
    std::vector<EntityId> absorbed;         ///< Roots united into entity_id by this commit
    bool type_conflict = false;
};

// ============================================================================
// Writer Shard
// ============================================================================

/**
 * @brief Single worker thread draining a FIFO of tasks
 *
 * Every task posted to one shard runs on the same thread, one at a time, in
 * posting order.
 */
class WriterShard {
public:
    WriterShard();
    ~WriterShard();

    WriterShard(const WriterShard&) = delete;
    WriterShard& operator=(const WriterShard&) = delete;

    /**
     * @brief Queue a task
     * @return false if the shard is stopping and the task was not queued
     */
    bool post(std::function<void()> task);

    /**
     * @brief Run the queued tasks, then join the worker
     */
    void stop();

private:
    void worker();

    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool stop_ = false;
};

// ============================================================================
// Merge Engine
// ============================================================================

/**
 * @brief Owns the entity registry and applies merge decisions
 *
 * Writes are serialized per blocking key: a candidate is routed to the writer
 * shard its bucket hashes to, where it is resolved against the bucket and
 * committed without racing another writer of the same bucket. Record reads
 * (entity, entities) are lock-free; lookup takes a shared lock on one
 * mention-index stripe.
 *
 * A registry corruption halts the engine: every later call fails with
 * RegistryCorruptionError.
 */
class MergeEngine {
public:
    MergeEngine(
        const ResolverConfig& resolver_config = ResolverConfig(),
        const MergeEngineConfig& config = MergeEngineConfig(),
        std::shared_ptr<const Embedder> embedder = nullptr
    );
    ~MergeEngine();

    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;

    // ========================================
    // Writes
    // ========================================

    /**
     * @brief Resolve and commit a candidate on its bucket's writer
     */
    std::future<ApplyResult> submit(Candidate candidate);

    /**
     * @brief View of a candidate's bucket, taken on its writer
     */
    std::future<RegistrySnapshot> snapshot(const Candidate& candidate);

    /**
     * @brief Commit a decision computed outside the engine
     *
     * A decision computed against an older bucket version, or targeting an
     * entity that has since been absorbed, is resolved again first.
     */
    std::future<ApplyResult> apply(Decision decision);

    /**
     * @brief Manual merge from review
     *
     * @param allow_type_override Permit merging entities of different types;
     *        the surviving root keeps its own type
     * @throws TypeConflictError on a cross-type merge without override
     * @throws std::out_of_range for an unknown id
     */
    ApplyResult merge_entities(EntityId absorbed, EntityId into, bool allow_type_override = false);

    // ========================================
    // Reads
    // ========================================

    /**
     * @brief Root entity a mention resolved to
     */
    std::optional<EntityId> lookup(const std::string& mention_id) const;

    /**
     * @brief Root record of an id's set; nullptr for an unknown id
     */
    std::shared_ptr<const CanonicalEntity> entity(EntityId id) const;

    /**
     * @brief Current root records ordered by id
     */
    std::vector<std::shared_ptr<const CanonicalEntity>> entities() const;

    EntityId find_root(EntityId id) const;

    std::vector<MergeDecision> audit_log() const;

    /**
     * @brief Low-confidence merges and type conflicts awaiting a human
     */
    std::vector<MergeDecision> review_queue() const;

    /**
     * @brief Write the audit log as JSON lines
     */
    void export_audit_log(const std::string& path) const;

    nlohmann::json entities_to_json() const;

    const EntityRegistry& registry() const { return registry_; }

    bool halted() const { return halted_.load(); }

    void shutdown();

private:
    struct BucketState {
        std::vector<EntityId> members;
        uint64_t version = 0;
    };

    // State private to one writer thread
    struct Shard {
        WriterShard writer;
        std::map<std::string, BucketState> buckets;
    };

    Shard& shard_for(const BlockingKey& block);
    void ensure_running() const;

    template <typename Result, typename Func>
    std::future<Result> run_on_shard(Shard& shard, Func&& func);

    RegistrySnapshot build_snapshot(Shard& shard, const Candidate& candidate);
    ApplyResult process(Shard& shard, const Candidate& candidate, const Decision* precomputed);
    ApplyResult commit(Shard& shard, const Decision& decision);

    EntityId create_entity(const Candidate& candidate);
    EntityId add_to_root(EntityId target, const Candidate& candidate);

    /**
     * @brief Union two sets under both roots' commit locks
     * @return Surviving root, or kNoEntity if they were already one set
     */
    EntityId unite(EntityId from, EntityId into, bool allow_type_override);

    void record_decision(const MergeDecision& decision);

    static Provenance provenance_of(const Candidate& candidate);

    MergeEngineConfig config_;
    SimilarityResolver resolver_;
    EntityRegistry registry_;
    std::vector<std::unique_ptr<Shard>> shards_;

    mutable std::mutex audit_mutex_;
    std::vector<MergeDecision> audit_log_;
    std::vector<MergeDecision> review_queue_;

    std::atomic<bool> halted_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace canon
