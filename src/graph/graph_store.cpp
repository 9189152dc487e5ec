#include "graph/graph_store.hpp"
#include "common/errors.hpp"
#include "search/embedder.hpp"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace canon {

// ==========================================
// GraphNode / GraphEdge
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["kind"] = kind;
    j["properties"] = properties;
    if (!embedding.empty()) {
        j["embedding"] = embedding;
    }
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();
    node.label = j.value("label", "");
    node.kind = j.value("kind", "");
    if (j.contains("properties")) {
        node.properties = j["properties"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("embedding")) {
        node.embedding = j["embedding"].get<std::vector<float>>();
    }
    return node;
}

std::string GraphEdge::make_id(const std::string& from, const std::string& predicate, const std::string& to) {
    return from + "|" + predicate + "|" + to;
}

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["from"] = from;
    j["predicate"] = predicate;
    j["to"] = to;
    j["properties"] = properties;
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.from = j.at("from").get<std::string>();
    edge.predicate = j.at("predicate").get<std::string>();
    edge.to = j.at("to").get<std::string>();
    edge.id = j.value("id", make_id(edge.from, edge.predicate, edge.to));
    if (j.contains("properties")) {
        edge.properties = j["properties"].get<std::map<std::string, std::string>>();
    }
    return edge;
}

std::string entity_node_id(EntityId id) {
    return "entity:" + std::to_string(id);
}

std::string document_node_id(const std::string& document_id) {
    return "document:" + document_id;
}

std::optional<EntityId> parse_entity_node_id(const std::string& node_id) {
    static const std::string prefix = "entity:";
    if (node_id.compare(0, prefix.size(), prefix) != 0 || node_id.size() == prefix.size()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(node_id.substr(prefix.size()), &consumed);
        if (consumed != node_id.size() - prefix.size()) {
            return std::nullopt;
        }
        return static_cast<EntityId>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

// ==========================================
// InMemoryGraphStore: writes
// ==========================================

void InMemoryGraphStore::upsert_node(const GraphNode& node) {
    if (node.id.empty()) {
        throw GraphWriteError("Cannot upsert a node without an id");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    nodes_[node.id] = node;
}

std::string InMemoryGraphStore::upsert_edge(
    const std::string& from,
    const std::string& to,
    const std::string& predicate,
    const std::map<std::string, std::string>& attributes
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (nodes_.find(from) == nodes_.end() || nodes_.find(to) == nodes_.end()) {
        throw GraphWriteError("Edge " + from + " -" + predicate + "-> " + to + " has a missing endpoint");
    }

    std::string id = GraphEdge::make_id(from, predicate, to);
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        GraphEdge edge;
        edge.id = id;
        edge.from = from;
        edge.predicate = predicate;
        edge.to = to;
        edge.properties = attributes;
        edges_[id] = edge;
        node_to_edges_[from].insert(id);
        node_to_edges_[to].insert(id);
    } else {
        for (const auto& [key, value] : attributes) {
            it->second.properties[key] = value;
        }
    }
    return id;
}

bool InMemoryGraphStore::remove_edge(const std::string& edge_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = edges_.find(edge_id);
    if (it == edges_.end()) {
        return false;
    }

    node_to_edges_[it->second.from].erase(edge_id);
    node_to_edges_[it->second.to].erase(edge_id);
    edges_.erase(it);
    return true;
}

void InMemoryGraphStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    nodes_.clear();
    edges_.clear();
    node_to_edges_.clear();
}

// ==========================================
// InMemoryGraphStore: reads
// ==========================================

std::vector<GraphQueryHit> InMemoryGraphStore::query(const GraphPattern& pattern, int depth) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (nodes_.find(pattern.start) == nodes_.end() || depth < 0) {
        return {};
    }

    std::vector<GraphQueryHit> hits;
    std::set<std::string> current_level = {pattern.start};
    std::set<std::string> visited_nodes = {pattern.start};

    for (int h = 0; h < depth && !current_level.empty(); ++h) {
        std::set<std::string> next_level;

        for (const auto& current_node : current_level) {
            auto incident = node_to_edges_.find(current_node);
            if (incident == node_to_edges_.end()) continue;

            for (const auto& edge_id : incident->second) {
                const GraphEdge& edge = edges_.at(edge_id);
                if (!pattern.predicate.empty() && edge.predicate != pattern.predicate) {
                    continue;
                }

                std::string neighbour;
                if (edge.from == current_node) {
                    neighbour = edge.to;
                } else if (pattern.follow_incoming) {
                    neighbour = edge.from;
                } else {
                    continue;
                }

                if (visited_nodes.insert(neighbour).second) {
                    next_level.insert(neighbour);
                    auto node = nodes_.find(neighbour);
                    if (node != nodes_.end() &&
                        (pattern.node_kind.empty() || node->second.kind == pattern.node_kind)) {
                        hits.push_back({neighbour, h + 1, edge.predicate});
                    }
                }
            }
        }

        current_level = next_level;
    }

    return hits;
}

std::vector<std::pair<std::string, double>> InMemoryGraphStore::nearest(
    const std::vector<float>& embedding,
    size_t k
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::pair<std::string, double>> scored;
    for (const auto& [id, node] : nodes_) {
        if (node.embedding.empty()) continue;
        scored.emplace_back(id, cosine_similarity(embedding, node.embedding));
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    if (scored.size() > k) {
        scored.resize(k);
    }
    return scored;
}

bool InMemoryGraphStore::has_node(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.find(node_id) != nodes_.end();
}

std::optional<GraphNode> InMemoryGraphStore::get_node(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<GraphEdge> InMemoryGraphStore::get_edge(const std::string& edge_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = edges_.find(edge_id);
    if (it == edges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<GraphEdge> InMemoryGraphStore::incident_edges(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<GraphEdge> result;
    auto it = node_to_edges_.find(node_id);
    if (it != node_to_edges_.end()) {
        for (const auto& edge_id : it->second) {
            result.push_back(edges_.at(edge_id));
        }
    }
    return result;
}

size_t InMemoryGraphStore::num_nodes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

size_t InMemoryGraphStore::num_edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return edges_.size();
}

std::vector<GraphEdge> InMemoryGraphStore::get_all_edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<GraphEdge> result;
    result.reserve(edges_.size());
    for (const auto& [id, edge] : edges_) {
        result.push_back(edge);
    }
    return result;
}

// ==========================================
// Export
// ==========================================

nlohmann::json InMemoryGraphStore::to_json(bool include_embeddings) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& [id, node] : nodes_) {
        auto node_json = node.to_json();
        if (!include_embeddings) {
            node_json.erase("embedding");
        }
        nodes_json.push_back(node_json);
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& [id, edge] : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    j["metadata"] = {
        {"num_nodes", nodes_.size()},
        {"num_edges", edges_.size()}
    };

    return j;
}

void InMemoryGraphStore::export_to_json(const std::string& filename, bool include_embeddings) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    auto j = to_json(include_embeddings);
    file << j.dump(2);
    file.close();
}

} // namespace canon
