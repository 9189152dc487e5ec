#ifndef CANON_GRAPH_STORE_HPP
#define CANON_GRAPH_STORE_HPP

#include "resolution/types.hpp"
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

/**
 * @brief A node of the knowledge graph (canonical entity or document)
 */
struct GraphNode {
    std::string id;                                    // "entity:<id>" or "document:<id>"
    std::string label;                                 // Human-readable label
    std::string kind;                                  // "entity" or "document"
    std::map<std::string, std::string> properties;     // Additional metadata
    std::vector<float> embedding;                      // Optional, for nearest()

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief A directed, labelled edge; at most one per (from, predicate, to)
 */
struct GraphEdge {
    std::string id;
    std::string from;
    std::string predicate;
    std::string to;
    std::map<std::string, std::string> properties;

    static std::string make_id(const std::string& from, const std::string& predicate, const std::string& to);

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Traversal request for GraphStore::query
 */
struct GraphPattern {
    std::string start;                  ///< Node to expand from
    std::string predicate;              ///< Only follow edges with this predicate (empty: any)
    std::string node_kind;              ///< Only report nodes of this kind (empty: any)
    bool follow_incoming = true;        ///< Traverse edges against their direction too
};

struct GraphQueryHit {
    std::string node_id;
    int hops = 0;
    std::string via_predicate;          ///< Predicate of the edge that reached the node
};

std::string entity_node_id(EntityId id);
std::string document_node_id(const std::string& document_id);

/**
 * @brief Entity id encoded in an "entity:<id>" node id
 */
std::optional<EntityId> parse_entity_node_id(const std::string& node_id);

// ============================================================================
// GraphStore Interface
// ============================================================================

/**
 * @brief Graph database capability used by the graph builder and search
 *
 * Writes throw GraphWriteError on failure. Implementations must be
 * thread-safe.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    /**
     * @brief Insert a node or replace its label, properties and embedding
     */
    virtual void upsert_node(const GraphNode& node) = 0;

    /**
     * @brief Insert an edge or merge attributes into the existing one
     * @return Edge id
     */
    virtual std::string upsert_edge(
        const std::string& from,
        const std::string& to,
        const std::string& predicate,
        const std::map<std::string, std::string>& attributes
    ) = 0;

    virtual bool remove_edge(const std::string& edge_id) = 0;

    /**
     * @brief Breadth-first expansion from pattern.start, up to `depth` hops
     */
    virtual std::vector<GraphQueryHit> query(const GraphPattern& pattern, int depth) const = 0;

    /**
     * @brief k nodes with the highest cosine similarity to an embedding
     */
    virtual std::vector<std::pair<std::string, double>> nearest(
        const std::vector<float>& embedding,
        size_t k
    ) const = 0;

    virtual bool has_node(const std::string& node_id) const = 0;

    virtual std::optional<GraphNode> get_node(const std::string& node_id) const = 0;

    virtual std::optional<GraphEdge> get_edge(const std::string& edge_id) const = 0;

    virtual std::vector<GraphEdge> incident_edges(const std::string& node_id) const = 0;
};

// ============================================================================
// In-Memory Store
// ============================================================================

/**
 * @brief Reference GraphStore keeping everything in ordered maps
 *
 * Guarded by a reader-writer lock: queries run concurrently, writes are
 * exclusive.
 */
class InMemoryGraphStore : public GraphStore {
public:
    InMemoryGraphStore() = default;

    void upsert_node(const GraphNode& node) override;

    std::string upsert_edge(
        const std::string& from,
        const std::string& to,
        const std::string& predicate,
        const std::map<std::string, std::string>& attributes
    ) override;

    bool remove_edge(const std::string& edge_id) override;

    std::vector<GraphQueryHit> query(const GraphPattern& pattern, int depth) const override;

    std::vector<std::pair<std::string, double>> nearest(
        const std::vector<float>& embedding,
        size_t k
    ) const override;

    bool has_node(const std::string& node_id) const override;

    std::optional<GraphNode> get_node(const std::string& node_id) const override;

    std::optional<GraphEdge> get_edge(const std::string& edge_id) const override;

    std::vector<GraphEdge> incident_edges(const std::string& node_id) const override;

    size_t num_nodes() const;
    size_t num_edges() const;

    std::vector<GraphEdge> get_all_edges() const;

    /**
     * @brief Export nodes and edges (embeddings omitted unless asked for)
     */
    nlohmann::json to_json(bool include_embeddings = false) const;

    void export_to_json(const std::string& filename, bool include_embeddings = false) const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, GraphNode> nodes_;
    std::map<std::string, GraphEdge> edges_;
    std::map<std::string, std::set<std::string>> node_to_edges_;   // node id -> incident edge ids
};

} // namespace canon

#endif // CANON_GRAPH_STORE_HPP
