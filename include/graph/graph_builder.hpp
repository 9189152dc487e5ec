#pragma once

#include "graph/graph_store.hpp"
#include "resolution/types.hpp"
#include "search/embedder.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

struct GraphBuilderConfig {
    int max_write_attempts = 3;
    int base_backoff_ms = 50;
    double backoff_multiplier = 2.0;
    bool store_embeddings = true;       ///< Attach label embeddings for dense search
    bool verbose = false;

    nlohmann::json to_json() const;
    static GraphBuilderConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Outcome of one graph write operation
 */
struct GraphWriteResult {
    bool success = true;
    bool changed = false;               ///< Something was written to the store
    bool pending = false;               ///< Relation parked until an endpoint exists
    size_t relations_flushed = 0;       ///< Pending relations written as a side effect
    std::string error_message;
};

/**
 * @brief Projects canonical entities, relations and documents into a GraphStore
 *
 * Idempotent: unchanged entities and already-known relation provenance do
 * not touch the store. Relations whose endpoints are not materialized yet
 * wait in a pending queue keyed by the missing entity and are written exactly
 * once, when that entity arrives.
 */
class GraphBuilder {
public:
    /// Maps any entity id to the root of its set
    using RootResolver = std::function<EntityId(EntityId)>;

    GraphBuilder(
        std::shared_ptr<GraphStore> store,
        const GraphBuilderConfig& config = GraphBuilderConfig(),
        std::shared_ptr<const Embedder> embedder = nullptr,
        RootResolver resolve_root = nullptr
    );

    /**
     * @brief Upsert the node of a canonical entity, then flush relations
     *        pending on it
     *
     * A record older than the last version written for the same id is
     * ignored, so concurrent callers cannot roll a node back.
     */
    GraphWriteResult materialize(const CanonicalEntity& entity);

    /**
     * @brief Upsert the edge of a relation, or park it until both endpoints exist
     */
    GraphWriteResult materialize(const Relation& relation);

    /**
     * @brief Upsert a document node
     */
    GraphWriteResult materialize_document(
        const std::string& document_id,
        const std::string& text,
        const std::map<std::string, std::string>& properties = {}
    );

    /**
     * @brief MENTIONS edge from a document to the entity a mention resolved to
     */
    GraphWriteResult link_mention(
        const std::string& document_id,
        EntityId entity,
        const std::string& mention_id
    );

    /**
     * @brief Mark an absorbed entity's node as merged and move its edges
     *        (and relations pending on it) to the surviving root
     */
    GraphWriteResult redirect(EntityId absorbed, EntityId root);

    bool is_materialized(EntityId id) const;

    size_t pending_count() const;

    /**
     * @brief Relations currently waiting on a given entity
     */
    size_t pending_on(EntityId id) const;

    /**
     * @brief Number of edge writes issued to the store
     */
    size_t edge_writes() const;

    /**
     * @brief Provenance recorded for an edge (empty if unknown)
     */
    std::set<std::string> edge_provenance(EntityId subject, const std::string& predicate, EntityId object) const;

    GraphStore& store() { return *store_; }

private:
    using EdgeKey = std::tuple<std::string, std::string, std::string>;     // from, predicate, to

    EntityId root_of(EntityId id) const;

    GraphWriteResult materialize_entity_locked(const CanonicalEntity& entity);
    GraphWriteResult materialize_relation_locked(const Relation& relation);
    GraphWriteResult write_edge_locked(
        const std::string& from,
        const std::string& predicate,
        const std::string& to,
        const std::set<std::string>& provenance
    );
    size_t flush_pending_locked(EntityId id, GraphWriteResult& result);

    /**
     * @brief Run a store write with retry and backoff
     * @return false after the last attempt failed (error_message filled in)
     */
    bool with_retry(const std::function<void()>& write, const std::string& what, std::string& error_message);

    static std::string fingerprint(const CanonicalEntity& entity);

    std::shared_ptr<GraphStore> store_;
    GraphBuilderConfig config_;
    std::shared_ptr<const Embedder> embedder_;
    RootResolver resolve_root_;

    mutable std::mutex mutex_;
    std::map<EntityId, std::string> fingerprints_;          // materialized entities
    std::map<EntityId, uint64_t> versions_;                 // newest record version written
    std::map<std::string, std::string> documents_;          // materialized documents
    std::multimap<EntityId, Relation> pending_;             // missing endpoint -> relation
    std::map<EdgeKey, std::set<std::string>> edges_;        // written edges -> provenance
    size_t edge_writes_ = 0;
};

} // namespace canon
