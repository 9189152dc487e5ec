#include "resolution/merge_engine.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace canon {

// ============================================================================
// Configuration
// ============================================================================

json MergeEngineConfig::to_json() const {
    return json{
        {"writer_shards", writer_shards},
        {"max_segments", max_segments},
        {"verbose", verbose}
    };
}

MergeEngineConfig MergeEngineConfig::from_json(const json& j) {
    MergeEngineConfig config;
    config.writer_shards = j.value("writer_shards", config.writer_shards);
    config.max_segments = j.value("max_segments", config.max_segments);
    config.verbose = j.value("verbose", config.verbose);
    return config;
}

// ============================================================================
// WriterShard
// ============================================================================

WriterShard::WriterShard() {
    thread_ = std::thread(&WriterShard::worker, this);
}

WriterShard::~WriterShard() {
    stop();
}

bool WriterShard::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return false;
        }
        queue_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WriterShard::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void WriterShard::worker() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
            if (stop_ && queue_.empty()) break;
            task = std::move(queue_.front());
            queue_.pop();
        }
        task();
    }
}

// ============================================================================
// MergeEngine
// ============================================================================

MergeEngine::MergeEngine(
    const ResolverConfig& resolver_config,
    const MergeEngineConfig& config,
    std::shared_ptr<const Embedder> embedder
) : config_(config),
    resolver_(resolver_config, std::move(embedder)),
    registry_(config.max_segments) {
    if (config_.writer_shards == 0) {
        throw std::invalid_argument("MergeEngine needs at least one writer shard");
    }
    shards_.reserve(config_.writer_shards);
    for (size_t i = 0; i < config_.writer_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

MergeEngine::~MergeEngine() {
    shutdown();
}

void MergeEngine::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    for (auto& shard : shards_) {
        shard->writer.stop();
    }
}

MergeEngine::Shard& MergeEngine::shard_for(const BlockingKey& block) {
    size_t index = std::hash<std::string>{}(block.str()) % shards_.size();
    return *shards_[index];
}

void MergeEngine::ensure_running() const {
    if (halted_.load()) {
        throw RegistryCorruptionError("Merge engine halted after a registry corruption");
    }
}

template <typename Result, typename Func>
std::future<Result> MergeEngine::run_on_shard(Shard& shard, Func&& func) {
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    bool queued = shard.writer.post([this, promise, func = std::forward<Func>(func)]() mutable {
        try {
            ensure_running();
            promise->set_value(func());
        } catch (const RegistryCorruptionError& e) {
            if (!halted_.exchange(true)) {
                std::cerr << ("[MergeEngine] Halting: " + std::string(e.what()) + "\n");
            }
            promise->set_exception(std::current_exception());
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });

    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("Merge engine is shut down")));
    }
    return future;
}

std::future<ApplyResult> MergeEngine::submit(Candidate candidate) {
    Shard& shard = shard_for(candidate.block);
    return run_on_shard<ApplyResult>(shard, [this, &shard, candidate = std::move(candidate)]() {
        return process(shard, candidate, nullptr);
    });
}

std::future<RegistrySnapshot> MergeEngine::snapshot(const Candidate& candidate) {
    Shard& shard = shard_for(candidate.block);
    return run_on_shard<RegistrySnapshot>(shard, [this, &shard, candidate]() {
        return build_snapshot(shard, candidate);
    });
}

std::future<ApplyResult> MergeEngine::apply(Decision decision) {
    Shard& shard = shard_for(decision.candidate.block);
    return run_on_shard<ApplyResult>(shard, [this, &shard, decision = std::move(decision)]() {
        return process(shard, decision.candidate, &decision);
    });
}

RegistrySnapshot MergeEngine::build_snapshot(Shard& shard, const Candidate& candidate) {
    RegistrySnapshot snap;
    snap.block = candidate.block;

    BucketState& bucket = shard.buckets[candidate.block.str()];
    snap.bucket_version = bucket.version;

    // Members absorbed since the last visit collapse onto their roots
    std::vector<EntityId> roots;
    std::set<EntityId> seen;
    for (EntityId member : bucket.members) {
        EntityId root = registry_.find(member);
        if (!seen.insert(root).second) continue;
        roots.push_back(root);
        auto record = registry_.record(root);
        if (record) {
            snap.bucket.push_back(std::move(record));
        }
    }
    bucket.members = std::move(roots);

    std::set<EntityId> seen_key;
    for (EntityId id : registry_.ids_for_key(candidate.key)) {
        EntityId root = registry_.find(id);
        if (!seen_key.insert(root).second) continue;
        auto record = registry_.record(root);
        if (record && record->type != candidate.type) {
            snap.same_key.push_back(std::move(record));
        }
    }

    return snap;
}

ApplyResult MergeEngine::process(Shard& shard, const Candidate& candidate, const Decision* precomputed) {
    const std::string& mention_id = candidate.mention.mention_id;

    if (auto owner = registry_.mention_owner(mention_id)) {
        ApplyResult result;
        result.entity_id = registry_.find(*owner);
        result.outcome = ApplyOutcome::Replayed;
        result.decision.mention_id = mention_id;
        result.decision.surface_form = candidate.surface_form;
        result.decision.key = candidate.key;
        result.decision.type = candidate.type;
        result.decision.matched = result.entity_id;
        result.decision.entity_id = result.entity_id;
        result.decision.score = 1.0;
        result.decision.tier = DecisionTier::Replay;
        result.decision.timestamp_ms = now_millis();
        return result;
    }

    RegistrySnapshot snap = build_snapshot(shard, candidate);

    bool reuse = precomputed != nullptr &&
                 precomputed->bucket_version == snap.bucket_version &&
                 (!precomputed->is_merge() || registry_.is_root(precomputed->target));

    if (reuse) {
        return commit(shard, *precomputed);
    }

    if (precomputed != nullptr && config_.verbose) {
        std::cerr << ("[MergeEngine] Stale decision for " + mention_id + " (bucket " +
                      candidate.block.str() + " v" + std::to_string(precomputed->bucket_version) +
                      " -> v" + std::to_string(snap.bucket_version) + "), resolving again\n");
    }

    return commit(shard, resolver_.resolve(candidate, snap));
}

Provenance MergeEngine::provenance_of(const Candidate& candidate) {
    Provenance prov;
    prov.mention_id = candidate.mention.mention_id;
    prov.document_id = candidate.mention.document_id;
    prov.surface_form = candidate.surface_form;
    prov.start = candidate.mention.start;
    prov.end = candidate.mention.end;
    return prov;
}

EntityId MergeEngine::create_entity(const Candidate& candidate) {
    EntityId id = registry_.allocate();

    auto record = std::make_shared<CanonicalEntity>();
    record->id = id;
    record->type = candidate.type;
    record->block = candidate.block;
    record->add_mention(provenance_of(candidate), candidate.key);

    {
        std::lock_guard<std::mutex> lock(registry_.stripe(id));
        registry_.publish(record);
    }
    registry_.index_mention(candidate.mention.mention_id, id);
    registry_.index_key(candidate.key, id);
    return id;
}

EntityId MergeEngine::add_to_root(EntityId target, const Candidate& candidate) {
    while (true) {
        EntityId root = registry_.find(target);
        std::lock_guard<std::mutex> lock(registry_.stripe(root));
        if (!registry_.is_root(root)) {
            continue;   // absorbed between find and lock
        }

        auto current = registry_.record(root);
        if (!current) {
            throw RegistryCorruptionError("Root entity " + std::to_string(root) + " has no record");
        }

        auto next = std::make_shared<CanonicalEntity>(*current);
        next->add_mention(provenance_of(candidate), candidate.key);
        registry_.publish(next);
        registry_.index_mention(candidate.mention.mention_id, root);
        registry_.index_key(candidate.key, root);
        return root;
    }
}

EntityId MergeEngine::unite(EntityId from, EntityId into, bool allow_type_override) {
    while (true) {
        EntityId a = registry_.find(from);
        EntityId b = registry_.find(into);
        if (a == b) {
            return kNoEntity;
        }

        std::mutex& lock_a = registry_.stripe(a);
        std::mutex& lock_b = registry_.stripe(b);
        std::unique_lock<std::mutex> guard_a(lock_a, std::defer_lock);
        std::unique_lock<std::mutex> guard_b(lock_b, std::defer_lock);
        if (&lock_a == &lock_b) {
            guard_a.lock();
        } else {
            std::lock(guard_a, guard_b);
        }

        if (!registry_.is_root(a) || !registry_.is_root(b)) {
            continue;
        }

        auto absorbed = registry_.record(a);
        auto survivor = registry_.record(b);
        if (!absorbed || !survivor) {
            throw RegistryCorruptionError(
                "Cannot unite " + std::to_string(a) + " and " + std::to_string(b) + ": missing record");
        }

        if (absorbed->type != survivor->type && !allow_type_override) {
            throw TypeConflictError(
                "Refusing to merge " + entity_type_to_string(absorbed->type) + " entity " +
                std::to_string(a) + " into " + entity_type_to_string(survivor->type) +
                " entity " + std::to_string(b));
        }

        auto merged = std::make_shared<CanonicalEntity>(*survivor);
        merged->absorb(*absorbed);

        // Publish before linking so a reader following the new parent sees the union
        registry_.publish(merged);
        registry_.set_parent(a, b);
        for (const auto& key : absorbed->alias_keys) {
            registry_.index_key(key, b);
        }
        return b;
    }
}

ApplyResult MergeEngine::commit(Shard& shard, const Decision& decision) {
    const Candidate& candidate = decision.candidate;
    BucketState& bucket = shard.buckets[candidate.block.str()];

    ApplyResult result;
    result.type_conflict = decision.type_conflict;

    MergeDecision record;
    record.mention_id = candidate.mention.mention_id;
    record.surface_form = candidate.surface_form;
    record.key = candidate.key;
    record.type = candidate.type;
    record.score = decision.score;
    record.tier = decision.tier;
    record.type_conflict = decision.type_conflict;
    record.conflict_with = decision.conflict_with;
    record.timestamp_ms = now_millis();

    if (!decision.is_merge()) {
        EntityId id = create_entity(candidate);
        bucket.members.push_back(id);
        result.entity_id = id;
        result.outcome = ApplyOutcome::Created;
        record.tier = DecisionTier::New;
        record.entity_id = id;
    } else {
        EntityId root = add_to_root(decision.target, candidate);
        result.outcome = ApplyOutcome::Merged;
        record.matched = root;

        std::vector<MergeDecision> consolidations;
        for (const auto& bridge : decision.bridges) {
            EntityId bridged_root = registry_.find(bridge.entity_id);
            EntityId survivor = unite(bridged_root, root, false);
            if (survivor == kNoEntity) continue;
            root = survivor;
            result.absorbed.push_back(bridged_root);

            MergeDecision consolidated;
            consolidated.mention_id = candidate.mention.mention_id;
            consolidated.surface_form = candidate.surface_form;
            consolidated.key = candidate.key;
            consolidated.type = candidate.type;
            consolidated.matched = bridged_root;
            consolidated.entity_id = survivor;
            consolidated.score = bridge.score;
            consolidated.tier = DecisionTier::Consolidated;
            consolidated.low_confidence = bridge.score < resolver_.config().high_threshold;
            consolidated.timestamp_ms = now_millis();
            consolidations.push_back(consolidated);
        }

        result.entity_id = root;
        record.entity_id = root;
        ++bucket.version;
        result.decision = record;
        record_decision(record);
        for (const auto& consolidated : consolidations) {
            record_decision(consolidated);
        }
        return result;
    }

    ++bucket.version;
    result.decision = record;
    record_decision(record);
    return result;
}

ApplyResult MergeEngine::merge_entities(EntityId absorbed, EntityId into, bool allow_type_override) {
    ensure_running();
    if (!registry_.contains(absorbed) || !registry_.contains(into)) {
        throw std::out_of_range(
            "Unknown entity id in merge of " + std::to_string(absorbed) + " into " + std::to_string(into));
    }

    ApplyResult result;
    try {
        EntityId from_root = registry_.find(absorbed);
        auto from_record = registry_.record(from_root);
        EntityId survivor = unite(from_root, into, allow_type_override);

        result.outcome = ApplyOutcome::Merged;
        result.entity_id = survivor == kNoEntity ? registry_.find(into) : survivor;
        if (survivor != kNoEntity) {
            result.absorbed.push_back(from_root);
        }

        result.decision.surface_form = from_record ? from_record->primary_label : "";
        result.decision.type = from_record ? from_record->type : EntityType::Unknown;
        result.decision.matched = from_root;
        result.decision.entity_id = result.entity_id;
        result.decision.score = 1.0;
        result.decision.tier = DecisionTier::Manual;
        result.decision.timestamp_ms = now_millis();
    } catch (const RegistryCorruptionError& e) {
        halted_ = true;
        std::cerr << ("[MergeEngine] Halting: " + std::string(e.what()) + "\n");
        throw;
    }

    if (!result.absorbed.empty()) {
        record_decision(result.decision);
    }
    return result;
}

void MergeEngine::record_decision(const MergeDecision& decision) {
    if (config_.verbose) {
        std::ostringstream line;
        line << "[MergeEngine] " << decision_tier_to_string(decision.tier)
             << " \"" << decision.surface_form << "\" -> entity " << decision.entity_id
             << " (score " << decision.score << ")";
        if (decision.type_conflict) {
            line << " TYPE CONFLICT with " << decision.conflict_with.value_or(kNoEntity);
        }
        line << "\n";
        std::cerr << line.str();
    }

    std::lock_guard<std::mutex> lock(audit_mutex_);
    audit_log_.push_back(decision);
    if (decision.needs_review()) {
        review_queue_.push_back(decision);
    }
}

// ============================================================================
// Reads
// ============================================================================

std::optional<EntityId> MergeEngine::lookup(const std::string& mention_id) const {
    auto owner = registry_.mention_owner(mention_id);
    if (!owner) {
        return std::nullopt;
    }
    return registry_.find(*owner);
}

std::shared_ptr<const CanonicalEntity> MergeEngine::entity(EntityId id) const {
    if (!registry_.contains(id)) {
        return nullptr;
    }
    return registry_.root_record(id);
}

std::vector<std::shared_ptr<const CanonicalEntity>> MergeEngine::entities() const {
    return registry_.roots();
}

EntityId MergeEngine::find_root(EntityId id) const {
    return registry_.find(id);
}

std::vector<MergeDecision> MergeEngine::audit_log() const {
    std::lock_guard<std::mutex> lock(audit_mutex_);
    return audit_log_;
}

std::vector<MergeDecision> MergeEngine::review_queue() const {
    std::lock_guard<std::mutex> lock(audit_mutex_);
    return review_queue_;
}

void MergeEngine::export_audit_log(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open audit log for writing: " + path);
    }

    for (const auto& decision : audit_log()) {
        file << decision.to_json().dump() << "\n";
    }
}

json MergeEngine::entities_to_json() const {
    json j;
    json list = json::array();
    for (const auto& record : registry_.roots()) {
        list.push_back(record->to_json());
    }
    j["entities"] = list;

    json redirects = json::object();
    for (const auto& record : registry_.all_records()) {
        if (!registry_.is_root(record->id)) {
            redirects[std::to_string(record->id)] = registry_.find(record->id);
        }
    }
    j["merged_into"] = redirects;
    return j;
}

} // namespace canon
