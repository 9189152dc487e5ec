#pragma once

#include "resolution/types.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace canon {

// ============================================================================
// Per-Type Normalization Rules
// ============================================================================

/**
 * @brief Honorifics and generational suffixes are dropped from the key;
 *        people are blocked by the phonetic code of their surname
 */
struct PersonRule {
    std::set<std::string> honorifics;
    std::set<std::string> suffixes;     ///< "jr", "sr", "iii", ...
};

/**
 * @brief Trailing legal suffixes are dropped; blocked by the first token's code
 */
struct OrganizationRule {
    std::set<std::string> legal_suffixes;
    std::set<std::string> leading_articles;
};

/**
 * @brief Leading article dropped and common abbreviations expanded ("st" -> "saint")
 */
struct LocationRule {
    std::set<std::string> leading_articles;
    std::map<std::string, std::string> abbreviations;
};

/**
 * @brief Fallback for products, events and untyped entities
 */
struct GenericRule {
    std::set<std::string> leading_articles;
};

using NormalizationRule = std::variant<PersonRule, OrganizationRule, LocationRule, GenericRule>;

/**
 * @brief Default rule table keyed by entity type
 */
std::map<EntityType, NormalizationRule> default_normalization_rules();

// ============================================================================
// Type Inference
// ============================================================================

/**
 * @brief Decides the entity type of a mention whose declared label is absent
 *        or not recognized
 */
class TypeInferrer {
public:
    virtual ~TypeInferrer() = default;

    virtual EntityType infer(const RawMention& mention) const = 0;
};

/**
 * @brief Surface and context heuristics
 *
 * A trailing legal suffix means Organization; a leading honorific, or a
 * neighbouring word such as "said" or "CEO", means Person. Anything else is
 * typed Other.
 */
class HeuristicTypeInferrer : public TypeInferrer {
public:
    HeuristicTypeInferrer();

    EntityType infer(const RawMention& mention) const override;

private:
    std::set<std::string> legal_suffixes_;
    std::set<std::string> honorifics_;
    std::set<std::string> person_words_before_;
    std::set<std::string> person_words_after_;
};

// ============================================================================
// Candidate Normalizer
// ============================================================================

struct NormalizerConfig {
    size_t max_span_chars = 256;    ///< Longer mentions are rejected as malformed
};

/**
 * @brief Turns a RawMention into a Candidate: comparison key, tokens,
 *        entity type and blocking key
 *
 * Stateless once constructed; safe to call from several threads.
 */
class CandidateNormalizer {
public:
    explicit CandidateNormalizer(
        const NormalizerConfig& config = NormalizerConfig(),
        std::shared_ptr<TypeInferrer> inferrer = nullptr
    );

    /**
     * @brief Normalize one mention
     * @throws MalformedMentionError when the mention cannot yield a key
     */
    Candidate normalize(const RawMention& mention) const;

    /**
     * @brief Comparison key of a surface form under a type's rule
     * @return Empty string if nothing survives cleaning
     */
    std::string normalize_key(const std::string& surface, EntityType type) const;

    /**
     * @brief Blocking key of an already normalized key
     */
    BlockingKey blocking_key(const std::string& key, EntityType type) const;

    /**
     * @brief Declared label if recognized, otherwise the inferrer's answer
     */
    EntityType resolve_type(const RawMention& mention) const;

    /**
     * @brief Fold diacritics, lowercase, turn punctuation into spaces and
     *        collapse whitespace
     */
    static std::string clean(const std::string& text);

    void set_rule(EntityType type, NormalizationRule rule);

    const NormalizationRule& rule_for(EntityType type) const;

private:
    NormalizerConfig config_;
    std::shared_ptr<TypeInferrer> inferrer_;
    std::map<EntityType, NormalizationRule> rules_;
    NormalizationRule generic_rule_;
};

} // namespace canon
