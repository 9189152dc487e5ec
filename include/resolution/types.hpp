#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace canon {

using EntityId = uint64_t;

/// Id 0 is never allocated; it marks "no entity" and "is a root" in the arena
constexpr EntityId kNoEntity = 0;

// ============================================================================
// Entity Types
// ============================================================================

enum class EntityType {
    Unknown,
    Person,
    Organization,
    Location,
    Product,
    Event,
    Other
};

std::string entity_type_to_string(EntityType type);

/**
 * @brief Parse the canonical name produced by entity_type_to_string
 */
EntityType entity_type_from_string(const std::string& name);

/**
 * @brief Map an extractor label ("PER", "person", "ORG", "company", "GPE", ...)
 * @return std::nullopt when the label is empty or not recognized
 */
std::optional<EntityType> parse_entity_label(const std::string& label);

// ============================================================================
// Mentions and Candidates
// ============================================================================

/**
 * @brief One textual occurrence of an entity in one document
 *
 * Offsets are byte offsets into the full document text.
 */
struct RawMention {
    std::string mention_id;         ///< Stable id derived from document + offsets
    std::string text;               ///< Surface form exactly as it appears
    std::string document_id;
    std::string chunk_id;
    size_t start = 0;               ///< Byte offset of the first byte
    size_t end = 0;                 ///< Byte offset one past the last byte
    std::string declared_type;      ///< Extractor label, may be empty
    std::string context;            ///< Surrounding context window
    double confidence = 1.0;

    static std::string make_id(const std::string& document_id, size_t start, size_t end);

    nlohmann::json to_json() const;
};

/**
 * @brief Coarse bucket limiting similarity comparisons
 */
struct BlockingKey {
    EntityType type = EntityType::Unknown;
    std::string code;               ///< Phonetic code or first token

    std::string str() const;

    bool operator==(const BlockingKey& other) const {
        return type == other.type && code == other.code;
    }
    bool operator!=(const BlockingKey& other) const { return !(*this == other); }
};

/**
 * @brief A normalized mention awaiting a merge decision
 */
struct Candidate {
    std::string key;                    ///< Comparison key (folded, stripped)
    std::vector<std::string> tokens;    ///< Key split on whitespace
    std::string surface_form;           ///< Untouched surface text
    EntityType type = EntityType::Unknown;
    BlockingKey block;
    RawMention mention;
};

// ============================================================================
// Canonical Entities
// ============================================================================

struct Provenance {
    std::string mention_id;
    std::string document_id;
    std::string surface_form;
    size_t start = 0;
    size_t end = 0;

    nlohmann::json to_json() const;
    static Provenance from_json(const nlohmann::json& j);
};

/**
 * @brief Deduplicated, authoritative representation of a real-world entity
 *
 * Records are published as immutable snapshots; the Merge Engine builds a
 * new version for every change.
 */
struct CanonicalEntity {
    EntityId id = kNoEntity;
    EntityType type = EntityType::Unknown;
    std::string primary_label;
    BlockingKey block;                                  // Home bucket
    std::map<std::string, uint32_t> alias_frequency;    // surface form -> mentions
    std::set<std::string> alias_keys;                   // normalized keys of all aliases
    std::map<std::string, Provenance> provenance;       // mention id -> provenance
    std::vector<EntityId> absorbed_ids;                 // roots merged into this one
    uint64_t version = 0;

    std::set<std::string> aliases() const;

    uint64_t mention_count() const;

    bool has_mention(const std::string& mention_id) const {
        return provenance.find(mention_id) != provenance.end();
    }

    /**
     * @brief Record one more mention of a surface form
     * @return false if the mention was already recorded (nothing changed)
     */
    bool add_mention(const Provenance& prov, const std::string& key);

    /**
     * @brief Fold another entity's aliases, frequencies and provenance in
     *
     * Mentions already present are not counted twice.
     */
    void absorb(const CanonicalEntity& other);

    /**
     * @brief Most frequent alias, then longest, then lexicographically first
     */
    void recompute_primary_label();

    nlohmann::json to_json() const;
    static CanonicalEntity from_json(const nlohmann::json& j);
};

/**
 * @brief Typed edge between two canonical entities
 */
struct Relation {
    EntityId subject = kNoEntity;
    std::string predicate;
    EntityId object = kNoEntity;
    std::set<std::string> provenance;   ///< Mention ids supporting the relation

    nlohmann::json to_json() const;
};

// ============================================================================
// Audit Records
// ============================================================================

enum class DecisionTier {
    HighConfidence,     ///< Auto-merged
    LowConfidence,      ///< Merged, flagged for audit
    New,                ///< New canonical entity
    Consolidated,       ///< Existing root united into another by a bridging mention
    Manual,             ///< Explicit merge from review
    Replay              ///< Mention already recorded, no-op
};

std::string decision_tier_to_string(DecisionTier tier);
DecisionTier decision_tier_from_string(const std::string& name);

/**
 * @brief Append-only audit record of one merge decision
 */
struct MergeDecision {
    std::string mention_id;
    std::string surface_form;
    std::string key;
    EntityType type = EntityType::Unknown;
    std::optional<EntityId> matched;        ///< std::nullopt means "new"
    EntityId entity_id = kNoEntity;         ///< Root the mention ended in
    double score = 0.0;
    DecisionTier tier = DecisionTier::New;
    bool type_conflict = false;
    std::optional<EntityId> conflict_with;
    bool low_confidence = false;            ///< Consolidation scored below the high threshold
    int64_t timestamp_ms = 0;

    bool needs_review() const {
        return tier == DecisionTier::LowConfidence || low_confidence || type_conflict;
    }

    nlohmann::json to_json() const;
    static MergeDecision from_json(const nlohmann::json& j);
};

int64_t now_millis();

} // namespace canon
