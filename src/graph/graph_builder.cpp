#include "graph/graph_builder.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace canon {

namespace {

const char* const kMentions = "MENTIONS";

std::string join_set(const std::set<std::string>& values, const std::string& separator) {
    return text::join(std::vector<std::string>(values.begin(), values.end()), separator);
}

} // anonymous namespace

// ============================================================================
// GraphBuilderConfig
// ============================================================================

json GraphBuilderConfig::to_json() const {
    return json{
        {"max_write_attempts", max_write_attempts},
        {"base_backoff_ms", base_backoff_ms},
        {"backoff_multiplier", backoff_multiplier},
        {"store_embeddings", store_embeddings},
        {"verbose", verbose}
    };
}

GraphBuilderConfig GraphBuilderConfig::from_json(const json& j) {
    GraphBuilderConfig config;
    config.max_write_attempts = j.value("max_write_attempts", config.max_write_attempts);
    config.base_backoff_ms = j.value("base_backoff_ms", config.base_backoff_ms);
    config.backoff_multiplier = j.value("backoff_multiplier", config.backoff_multiplier);
    config.store_embeddings = j.value("store_embeddings", config.store_embeddings);
    config.verbose = j.value("verbose", config.verbose);
    return config;
}

// ============================================================================
// GraphBuilder
// ============================================================================

GraphBuilder::GraphBuilder(
    std::shared_ptr<GraphStore> store,
    const GraphBuilderConfig& config,
    std::shared_ptr<const Embedder> embedder,
    RootResolver resolve_root
) : store_(std::move(store)),
    config_(config),
    embedder_(std::move(embedder)),
    resolve_root_(std::move(resolve_root)) {
    if (!store_) {
        throw std::invalid_argument("GraphBuilder requires a graph store");
    }
    if (config_.max_write_attempts < 1) {
        throw std::invalid_argument("GraphBuilder needs at least one write attempt");
    }
}

EntityId GraphBuilder::root_of(EntityId id) const {
    return resolve_root_ ? resolve_root_(id) : id;
}

bool GraphBuilder::with_retry(
    const std::function<void()>& write,
    const std::string& what,
    std::string& error_message
) {
    for (int attempt = 1; attempt <= config_.max_write_attempts; ++attempt) {
        try {
            write();
            return true;
        } catch (const GraphWriteError& e) {
            if (attempt >= config_.max_write_attempts) {
                error_message = "Failed to write " + what + " after " +
                                std::to_string(attempt) + " attempts: " + e.what();
                std::cerr << ("[GraphBuilder] " + error_message + "\n");
                return false;
            }

            auto delay = static_cast<long long>(
                config_.base_backoff_ms * std::pow(config_.backoff_multiplier, attempt - 1));
            if (config_.verbose) {
                std::cerr << ("[GraphBuilder] Attempt " + std::to_string(attempt) + " failed for " +
                              what + ": " + e.what() + ". Retrying in " + std::to_string(delay) + "ms\n");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
    return false;
}

std::string GraphBuilder::fingerprint(const CanonicalEntity& entity) {
    json j;
    j["label"] = entity.primary_label;
    j["type"] = entity_type_to_string(entity.type);
    j["aliases"] = entity.alias_frequency;
    j["absorbed"] = entity.absorbed_ids;
    return j.dump();
}

GraphWriteResult GraphBuilder::materialize(const CanonicalEntity& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return materialize_entity_locked(entity);
}

GraphWriteResult GraphBuilder::materialize_entity_locked(const CanonicalEntity& entity) {
    GraphWriteResult result;

    auto written = versions_.find(entity.id);
    bool stale = written != versions_.end() && written->second > entity.version;

    std::string fp = fingerprint(entity);
    auto known = fingerprints_.find(entity.id);

    if (!stale && (known == fingerprints_.end() || known->second != fp)) {
        GraphNode node;
        node.id = entity_node_id(entity.id);
        node.label = entity.primary_label;
        node.kind = "entity";
        node.properties["entity_id"] = std::to_string(entity.id);
        node.properties["type"] = entity_type_to_string(entity.type);
        node.properties["aliases"] = join_set(entity.aliases(), " | ");
        node.properties["alias_frequency"] = json(entity.alias_frequency).dump();
        node.properties["mention_count"] = std::to_string(entity.mention_count());

        if (embedder_ && config_.store_embeddings) {
            std::string embed_text = entity.primary_label;
            for (const auto& alias : entity.aliases()) {
                if (alias != entity.primary_label) {
                    embed_text += " " + alias;
                }
            }
            node.embedding = embedder_->embed(embed_text);
        }

        if (!with_retry([&] { store_->upsert_node(node); }, "node " + node.id, result.error_message)) {
            result.success = false;
            return result;
        }

        fingerprints_[entity.id] = fp;
        versions_[entity.id] = entity.version;
        result.changed = true;
    }

    // Also retries relations whose earlier flush failed
    result.relations_flushed = flush_pending_locked(entity.id, result);
    return result;
}

size_t GraphBuilder::flush_pending_locked(EntityId id, GraphWriteResult& result) {
    auto range = pending_.equal_range(id);
    if (range.first == range.second) {
        return 0;
    }

    std::vector<Relation> waiting;
    for (auto it = range.first; it != range.second; ++it) {
        waiting.push_back(it->second);
    }
    pending_.erase(range.first, range.second);

    size_t flushed = 0;
    for (const auto& relation : waiting) {
        GraphWriteResult edge = materialize_relation_locked(relation);
        if (!edge.success) {
            result.success = false;
            result.error_message = edge.error_message;
            pending_.emplace(id, relation);
        } else if (edge.changed) {
            ++flushed;
        }
    }

    if (config_.verbose && flushed > 0) {
        std::cerr << ("[GraphBuilder] Flushed " + std::to_string(flushed) +
                      " pending relations on " + entity_node_id(id) + "\n");
    }
    return flushed;
}

GraphWriteResult GraphBuilder::materialize(const Relation& relation) {
    std::lock_guard<std::mutex> lock(mutex_);
    return materialize_relation_locked(relation);
}

GraphWriteResult GraphBuilder::materialize_relation_locked(const Relation& relation) {
    GraphWriteResult result;

    Relation resolved = relation;
    resolved.subject = root_of(relation.subject);
    resolved.object = root_of(relation.object);

    if (resolved.subject == resolved.object) {
        return result;      // both mentions ended up in one entity
    }

    EntityId missing = kNoEntity;
    if (!fingerprints_.count(resolved.subject)) {
        missing = resolved.subject;
    } else if (!fingerprints_.count(resolved.object)) {
        missing = resolved.object;
    }

    if (missing != kNoEntity) {
        auto range = pending_.equal_range(missing);
        for (auto it = range.first; it != range.second; ++it) {
            Relation& parked = it->second;
            if (parked.subject == resolved.subject && parked.object == resolved.object &&
                parked.predicate == resolved.predicate) {
                parked.provenance.insert(resolved.provenance.begin(), resolved.provenance.end());
                result.pending = true;
                return result;
            }
        }
        pending_.emplace(missing, resolved);
        result.pending = true;
        return result;
    }

    return write_edge_locked(
        entity_node_id(resolved.subject), resolved.predicate,
        entity_node_id(resolved.object), resolved.provenance);
}

GraphWriteResult GraphBuilder::write_edge_locked(
    const std::string& from,
    const std::string& predicate,
    const std::string& to,
    const std::set<std::string>& provenance
) {
    GraphWriteResult result;
    EdgeKey key{from, predicate, to};

    std::set<std::string> merged;
    auto existing = edges_.find(key);
    if (existing != edges_.end()) {
        merged = existing->second;
        bool known = std::includes(merged.begin(), merged.end(), provenance.begin(), provenance.end());
        if (known) {
            return result;      // replay
        }
    }
    merged.insert(provenance.begin(), provenance.end());

    std::map<std::string, std::string> attributes = {
        {"provenance", join_set(merged, ",")},
        {"support", std::to_string(merged.size())}
    };

    std::string what = "edge " + GraphEdge::make_id(from, predicate, to);
    if (!with_retry([&] { store_->upsert_edge(from, to, predicate, attributes); }, what, result.error_message)) {
        result.success = false;
        return result;
    }

    edges_[key] = std::move(merged);
    ++edge_writes_;
    result.changed = true;
    return result;
}

GraphWriteResult GraphBuilder::materialize_document(
    const std::string& document_id,
    const std::string& text,
    const std::map<std::string, std::string>& properties
) {
    std::lock_guard<std::mutex> lock(mutex_);
    GraphWriteResult result;

    GraphNode node;
    node.id = document_node_id(document_id);
    node.label = document_id;
    node.kind = "document";
    node.properties = properties;
    node.properties["document_id"] = document_id;
    node.properties["length"] = std::to_string(text.size());

    std::string fp = json(node.properties).dump() + "#" + std::to_string(std::hash<std::string>{}(text));
    auto known = documents_.find(document_id);
    if (known != documents_.end() && known->second == fp) {
        return result;
    }

    if (embedder_ && config_.store_embeddings) {
        node.embedding = embedder_->embed(text);
    }

    if (!with_retry([&] { store_->upsert_node(node); }, "node " + node.id, result.error_message)) {
        result.success = false;
        return result;
    }

    documents_[document_id] = fp;
    result.changed = true;
    return result;
}

GraphWriteResult GraphBuilder::link_mention(
    const std::string& document_id,
    EntityId entity,
    const std::string& mention_id
) {
    std::lock_guard<std::mutex> lock(mutex_);

    EntityId root = root_of(entity);
    if (!fingerprints_.count(root) || !documents_.count(document_id)) {
        GraphWriteResult result;
        result.success = false;
        result.error_message = "Cannot link " + mention_id + ": " + document_node_id(document_id) +
                               " or " + entity_node_id(root) + " is not materialized";
        return result;
    }

    return write_edge_locked(document_node_id(document_id), kMentions, entity_node_id(root), {mention_id});
}

GraphWriteResult GraphBuilder::redirect(EntityId absorbed, EntityId root) {
    std::lock_guard<std::mutex> lock(mutex_);
    GraphWriteResult result;

    root = root_of(root);
    if (absorbed == root) {
        return result;
    }

    // Relations parked on the absorbed id now wait on (or flush to) the root
    auto range = pending_.equal_range(absorbed);
    std::vector<Relation> moved;
    for (auto it = range.first; it != range.second; ++it) {
        Relation relation = it->second;
        if (relation.subject == absorbed) relation.subject = root;
        if (relation.object == absorbed) relation.object = root;
        moved.push_back(std::move(relation));
    }
    pending_.erase(range.first, range.second);

    if (!fingerprints_.count(absorbed)) {
        for (const auto& relation : moved) {
            GraphWriteResult r = materialize_relation_locked(relation);
            if (!r.success) {
                result.success = false;
                result.error_message = r.error_message;
            }
            result.changed = result.changed || r.changed;
        }
        return result;
    }

    if (!fingerprints_.count(root)) {
        for (const auto& relation : moved) {
            materialize_relation_locked(relation);      // parks on the root
        }
        result.success = false;
        result.error_message = "Cannot redirect " + entity_node_id(absorbed) + ": " +
                               entity_node_id(root) + " is not materialized";
        return result;
    }

    const std::string old_id = entity_node_id(absorbed);
    const std::string new_id = entity_node_id(root);

    auto node = store_->get_node(old_id);
    if (node) {
        node->properties["merged_into"] = new_id;
        node->embedding.clear();
        if (!with_retry([&] { store_->upsert_node(*node); }, "node " + old_id, result.error_message)) {
            result.success = false;
            return result;
        }
        result.changed = true;
    }

    for (const auto& edge : store_->incident_edges(old_id)) {
        std::string from = edge.from == old_id ? new_id : edge.from;
        std::string to = edge.to == old_id ? new_id : edge.to;

        EdgeKey old_key{edge.from, edge.predicate, edge.to};
        std::set<std::string> provenance;
        auto known = edges_.find(old_key);
        if (known != edges_.end()) {
            provenance = known->second;
        }

        if (!with_retry([&] { store_->remove_edge(edge.id); }, "edge removal " + edge.id, result.error_message)) {
            result.success = false;
            return result;
        }
        edges_.erase(old_key);
        result.changed = true;

        if (from == to) {
            continue;
        }

        GraphWriteResult moved_edge = write_edge_locked(from, edge.predicate, to, provenance);
        if (!moved_edge.success) {
            result.success = false;
            result.error_message = moved_edge.error_message;
        }
    }

    fingerprints_.erase(absorbed);

    for (const auto& relation : moved) {
        GraphWriteResult r = materialize_relation_locked(relation);
        if (!r.success) {
            result.success = false;
            result.error_message = r.error_message;
        } else if (r.changed) {
            ++result.relations_flushed;
        }
    }

    if (config_.verbose) {
        std::cerr << ("[GraphBuilder] Redirected " + old_id + " -> " + new_id + "\n");
    }
    return result;
}

bool GraphBuilder::is_materialized(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fingerprints_.count(id) > 0;
}

size_t GraphBuilder::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t GraphBuilder::pending_on(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id);
}

size_t GraphBuilder::edge_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edge_writes_;
}

std::set<std::string> GraphBuilder::edge_provenance(
    EntityId subject,
    const std::string& predicate,
    EntityId object
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = edges_.find(EdgeKey{entity_node_id(subject), predicate, entity_node_id(object)});
    if (it == edges_.end()) {
        return {};
    }
    return it->second;
}

} // namespace canon
