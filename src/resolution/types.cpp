#include "resolution/types.hpp"
#include "common/text.hpp"
#include <algorithm>
#include <chrono>

using json = nlohmann::json;

namespace canon {

// ==========================================
// Entity Types
// ==========================================

std::string entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::Person: return "Person";
        case EntityType::Organization: return "Organization";
        case EntityType::Location: return "Location";
        case EntityType::Product: return "Product";
        case EntityType::Event: return "Event";
        case EntityType::Other: return "Other";
        case EntityType::Unknown:
        default: return "Unknown";
    }
}

EntityType entity_type_from_string(const std::string& name) {
    if (name == "Person") return EntityType::Person;
    if (name == "Organization") return EntityType::Organization;
    if (name == "Location") return EntityType::Location;
    if (name == "Product") return EntityType::Product;
    if (name == "Event") return EntityType::Event;
    if (name == "Other") return EntityType::Other;
    return EntityType::Unknown;
}

std::optional<EntityType> parse_entity_label(const std::string& label) {
    std::string l = text::fold(text::trim(label));
    if (l.empty()) return std::nullopt;

    // BIO tagging prefixes
    if (l.size() > 2 && (l.compare(0, 2, "b-") == 0 || l.compare(0, 2, "i-") == 0)) {
        l = l.substr(2);
    }

    static const std::map<std::string, EntityType> kLabels = {
        {"person", EntityType::Person}, {"per", EntityType::Person},
        {"people", EntityType::Person}, {"human", EntityType::Person},
        {"organization", EntityType::Organization}, {"organisation", EntityType::Organization},
        {"org", EntityType::Organization}, {"company", EntityType::Organization},
        {"corporation", EntityType::Organization}, {"institution", EntityType::Organization},
        {"location", EntityType::Location}, {"loc", EntityType::Location},
        {"gpe", EntityType::Location}, {"place", EntityType::Location},
        {"city", EntityType::Location}, {"country", EntityType::Location},
        {"product", EntityType::Product}, {"technology", EntityType::Product},
        {"device", EntityType::Product}, {"software", EntityType::Product},
        {"event", EntityType::Event},
        {"misc", EntityType::Other}, {"other", EntityType::Other},
        {"concept", EntityType::Other}, {"food", EntityType::Other},
    };

    auto it = kLabels.find(l);
    if (it == kLabels.end()) return std::nullopt;
    return it->second;
}

// ==========================================
// RawMention / BlockingKey
// ==========================================

std::string RawMention::make_id(const std::string& document_id, size_t start, size_t end) {
    return document_id + "#" + std::to_string(start) + "-" + std::to_string(end);
}

json RawMention::to_json() const {
    json j;
    j["mention_id"] = mention_id;
    j["text"] = text;
    j["document_id"] = document_id;
    j["chunk_id"] = chunk_id;
    j["start"] = start;
    j["end"] = end;
    j["declared_type"] = declared_type;
    j["context"] = context;
    j["confidence"] = confidence;
    return j;
}

std::string BlockingKey::str() const {
    return entity_type_to_string(type) + ":" + code;
}

// ==========================================
// CanonicalEntity
// ==========================================

json Provenance::to_json() const {
    return json{
        {"mention_id", mention_id},
        {"document_id", document_id},
        {"surface_form", surface_form},
        {"start", start},
        {"end", end}
    };
}

Provenance Provenance::from_json(const json& j) {
    Provenance p;
    p.mention_id = j.at("mention_id").get<std::string>();
    p.document_id = j.value("document_id", "");
    p.surface_form = j.value("surface_form", "");
    p.start = j.value("start", static_cast<size_t>(0));
    p.end = j.value("end", static_cast<size_t>(0));
    return p;
}

std::set<std::string> CanonicalEntity::aliases() const {
    std::set<std::string> result;
    for (const auto& [alias, count] : alias_frequency) {
        result.insert(alias);
    }
    return result;
}

uint64_t CanonicalEntity::mention_count() const {
    return provenance.size();
}

bool CanonicalEntity::add_mention(const Provenance& prov, const std::string& key) {
    if (has_mention(prov.mention_id)) {
        return false;
    }
    provenance.emplace(prov.mention_id, prov);
    alias_frequency[prov.surface_form]++;
    alias_keys.insert(key);
    ++version;
    recompute_primary_label();
    return true;
}

void CanonicalEntity::absorb(const CanonicalEntity& other) {
    for (const auto& [mention_id, prov] : other.provenance) {
        if (provenance.emplace(mention_id, prov).second) {
            alias_frequency[prov.surface_form]++;
        }
    }
    alias_keys.insert(other.alias_keys.begin(), other.alias_keys.end());
    absorbed_ids.push_back(other.id);
    absorbed_ids.insert(absorbed_ids.end(), other.absorbed_ids.begin(), other.absorbed_ids.end());
    ++version;
    recompute_primary_label();
}

void CanonicalEntity::recompute_primary_label() {
    const std::string* best = nullptr;
    uint32_t best_count = 0;

    for (const auto& [alias, count] : alias_frequency) {
        if (best == nullptr ||
            count > best_count ||
            (count == best_count && alias.size() > best->size())) {
            best = &alias;
            best_count = count;
        }
        // Equal count and length: the map order keeps the lexicographically first
    }

    if (best != nullptr) {
        primary_label = *best;
    }
}

json CanonicalEntity::to_json() const {
    json j;
    j["id"] = id;
    j["type"] = entity_type_to_string(type);
    j["primary_label"] = primary_label;
    j["block"] = block.code;
    j["alias_frequency"] = alias_frequency;
    j["alias_keys"] = alias_keys;
    j["absorbed_ids"] = absorbed_ids;
    j["version"] = version;

    json prov = json::array();
    for (const auto& [mention_id, p] : provenance) {
        prov.push_back(p.to_json());
    }
    j["provenance"] = prov;
    return j;
}

CanonicalEntity CanonicalEntity::from_json(const json& j) {
    CanonicalEntity e;
    e.id = j.at("id").get<EntityId>();
    e.type = entity_type_from_string(j.at("type").get<std::string>());
    e.primary_label = j.value("primary_label", "");
    e.block.type = e.type;
    e.block.code = j.value("block", "");
    e.version = j.value("version", static_cast<uint64_t>(0));

    if (j.contains("alias_frequency")) {
        e.alias_frequency = j["alias_frequency"].get<std::map<std::string, uint32_t>>();
    }
    if (j.contains("alias_keys")) {
        e.alias_keys = j["alias_keys"].get<std::set<std::string>>();
    }
    if (j.contains("absorbed_ids")) {
        e.absorbed_ids = j["absorbed_ids"].get<std::vector<EntityId>>();
    }
    if (j.contains("provenance")) {
        for (const auto& item : j["provenance"]) {
            Provenance p = Provenance::from_json(item);
            e.provenance.emplace(p.mention_id, p);
        }
    }
    return e;
}

// ==========================================
// Relation
// ==========================================

json Relation::to_json() const {
    json j;
    j["subject"] = subject;
    j["predicate"] = predicate;
    j["object"] = object;
    j["provenance"] = provenance;
    return j;
}

// ==========================================
// MergeDecision
// ==========================================

std::string decision_tier_to_string(DecisionTier tier) {
    switch (tier) {
        case DecisionTier::HighConfidence: return "high_confidence";
        case DecisionTier::LowConfidence: return "low_confidence";
        case DecisionTier::New: return "new";
        case DecisionTier::Consolidated: return "consolidated";
        case DecisionTier::Manual: return "manual";
        case DecisionTier::Replay: return "replay";
        default: return "new";
    }
}

DecisionTier decision_tier_from_string(const std::string& name) {
    if (name == "high_confidence") return DecisionTier::HighConfidence;
    if (name == "low_confidence") return DecisionTier::LowConfidence;
    if (name == "consolidated") return DecisionTier::Consolidated;
    if (name == "manual") return DecisionTier::Manual;
    if (name == "replay") return DecisionTier::Replay;
    return DecisionTier::New;
}

json MergeDecision::to_json() const {
    json j;
    j["mention_id"] = mention_id;
    j["surface_form"] = surface_form;
    j["key"] = key;
    j["type"] = entity_type_to_string(type);
    if (matched.has_value()) {
        j["matched"] = matched.value();
    } else {
        j["matched"] = "new";
    }
    j["entity_id"] = entity_id;
    j["score"] = score;
    j["tier"] = decision_tier_to_string(tier);
    j["type_conflict"] = type_conflict;
    if (conflict_with.has_value()) {
        j["conflict_with"] = conflict_with.value();
    }
    if (low_confidence) {
        j["low_confidence"] = true;
    }
    j["timestamp_ms"] = timestamp_ms;
    return j;
}

MergeDecision MergeDecision::from_json(const json& j) {
    MergeDecision d;
    d.mention_id = j.value("mention_id", "");
    d.surface_form = j.value("surface_form", "");
    d.key = j.value("key", "");
    d.type = entity_type_from_string(j.value("type", "Unknown"));
    if (j.contains("matched") && j["matched"].is_number_unsigned()) {
        d.matched = j["matched"].get<EntityId>();
    }
    d.entity_id = j.value("entity_id", kNoEntity);
    d.score = j.value("score", 0.0);
    d.tier = decision_tier_from_string(j.value("tier", "new"));
    d.type_conflict = j.value("type_conflict", false);
    if (j.contains("conflict_with")) {
        d.conflict_with = j["conflict_with"].get<EntityId>();
    }
    d.low_confidence = j.value("low_confidence", false);
    d.timestamp_ms = j.value("timestamp_ms", static_cast<int64_t>(0));
    return d;
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace canon
