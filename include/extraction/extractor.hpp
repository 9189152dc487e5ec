#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Entity span reported by an extractor
 *
 * Offsets are byte offsets into the text handed to extract().
 */
struct ExtractedMention {
    std::string text;               ///< Surface form
    std::string label;              ///< Entity type label, may be empty
    size_t start = 0;
    size_t end = 0;
    double score = 1.0;             ///< Extractor confidence (0.0-1.0)
};

/**
 * @brief Relation between two extracted mentions, by index into mentions
 */
struct ExtractedRelation {
    size_t subject = 0;
    std::string predicate;
    size_t object = 0;
    double confidence = 1.0;
};

struct ExtractionResult {
    std::vector<ExtractedMention> mentions;
    std::vector<ExtractedRelation> relations;
};

/**
 * @brief Configuration of the remote extraction service
 */
struct ExtractorConfig {
    std::string service_url = "http://localhost:8001";
    std::string api_key;                    ///< Sent as a Bearer token when set
    std::vector<std::string> labels = {"person", "organization", "location", "product", "event"};
    double threshold = 0.5;                 ///< Minimum entity score kept by the service
    bool extract_relations = true;
    int timeout_seconds = 30;               ///< Per-request transport timeout
    bool verbose = false;

    nlohmann::json to_json() const;
    static ExtractorConfig from_json(const nlohmann::json& j);
};

// ============================================================================
// Extractor Interface
// ============================================================================

/**
 * @brief Named-entity (and optionally relation) extraction capability
 *
 * Implementations are called from several gateway workers at once and must
 * be thread-safe. Failures are reported by throwing:
 * TransientExtractionError for conditions worth retrying (network errors,
 * rate limiting, overloaded service), ExtractionError otherwise.
 */
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual ExtractionResult extract(const std::string& text) = 0;

    /**
     * @brief Health probe; defaults to true for in-process extractors
     */
    virtual bool is_available() { return true; }

    virtual std::string name() const = 0;
};

// ============================================================================
// HTTP Extractor
// ============================================================================

/**
 * @brief Client for an NER service speaking JSON over HTTP
 *
 * POST {service_url}/extract with {"text", "labels", "threshold", "relations"}
 * and expects {"entities": [{"text", "label", "start", "end", "score"}],
 * "relations": [{"subject", "predicate", "object"}]} where entity offsets
 * count Unicode code points. GET {service_url}/health answers {"status": "ok"}.
 */
class HttpExtractor : public Extractor {
public:
    explicit HttpExtractor(const ExtractorConfig& config);

    ExtractionResult extract(const std::string& text) override;

    bool is_available() override;

    std::string name() const override { return "http:" + config_.service_url; }

    /**
     * @brief Build the request body for a text
     */
    std::string build_request(const std::string& text) const;

    /**
     * @brief Parse a service response; offsets are converted to bytes of `text`
     * @throws ExtractionError on a malformed body
     */
    static ExtractionResult parse_response(const std::string& body, const std::string& text);

    /**
     * @brief Map a status code to the error to throw (nothing for 2xx)
     */
    static void check_status(long http_code, const std::string& body);

private:
    std::vector<std::string> headers() const;

    ExtractorConfig config_;
};

// ============================================================================
// Gazetteer Extractor
// ============================================================================

/**
 * @brief Dictionary tagger: longest case-sensitive match on word boundaries
 *
 * Relation rules connect two consecutive mentions of the given labels when
 * the text between them (within one sentence) contains the trigger word.
 */
class GazetteerExtractor : public Extractor {
public:
    struct Entry {
        std::string surface;
        std::string label;
    };

    struct RelationRule {
        std::string subject_label;
        std::string trigger;
        std::string predicate;
        std::string object_label;
    };

    GazetteerExtractor() = default;
    explicit GazetteerExtractor(std::vector<Entry> entries);

    void add_entry(const std::string& surface, const std::string& label);
    void add_relation_rule(const RelationRule& rule);

    /**
     * @brief Load {"entries": [{"surface", "label"}], "relations": [...]}
     */
    static std::unique_ptr<GazetteerExtractor> from_json_file(const std::string& path);

    ExtractionResult extract(const std::string& text) override;

    std::string name() const override { return "gazetteer"; }

    size_t size() const { return entries_.size(); }

private:
    std::vector<Entry> entries_;            // longest surface first
    std::vector<RelationRule> rules_;
};

} // namespace canon
