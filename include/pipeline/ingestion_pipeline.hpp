#pragma once

#include "common/errors.hpp"
#include "extraction/extraction_gateway.hpp"
#include "extraction/extractor.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_store.hpp"
#include "resolution/merge_engine.hpp"
#include "resolution/normalizer.hpp"
#include "resolution/resolver.hpp"
#include "search/embedder.hpp"
#include "search/hybrid_search.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for the ingestion pipeline
 */
struct PipelineConfig {
    ExtractorConfig extractor;              ///< Remote NER service
    GatewayConfig gateway;                  ///< Chunking, fan-out, retry
    NormalizerConfig normalizer;
    ResolverConfig resolver;                ///< Score weights and thresholds
    MergeEngineConfig merge;
    GraphBuilderConfig graph;
    SearchConfig search;

    std::string output_directory = "output_json";  ///< Where save_state() writes by default
    bool verbose = false;                   ///< Turns on every component's logging

    /**
     * @brief Load configuration from JSON file
     *
     * Sections missing from the file keep their defaults.
     */
    static PipelineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (API key redacted)
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;
    static PipelineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Defaults overridden by CANON_* environment variables
     */
    static PipelineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Reports
// ============================================================================

/**
 * @brief Outcome of ingesting one document
 *
 * Non-fatal errors land in `errors`; the document still counts as ingested.
 */
struct IngestionReport {
    std::string document_id;

    // Extraction
    size_t chunks_total = 0;
    size_t chunks_succeeded = 0;
    size_t chunks_failed = 0;
    size_t chunks_cancelled = 0;
    size_t mentions_extracted = 0;

    // Resolution
    size_t mentions_dropped = 0;            ///< Malformed, never reached the registry
    size_t mentions_created = 0;            ///< Started a new canonical entity
    size_t mentions_merged = 0;             ///< Joined an existing entity
    size_t mentions_replayed = 0;           ///< Already recorded, no-op
    size_t low_confidence_merges = 0;
    size_t type_conflicts = 0;
    size_t entities_consolidated = 0;       ///< Roots absorbed through a bridging mention

    // Graph
    size_t relations_extracted = 0;
    size_t relations_materialized = 0;
    size_t relations_pending = 0;           ///< Waiting on an endpoint after this document
    bool partially_materialized = false;    ///< A graph write failed after all retries

    double total_time_seconds = 0.0;

    std::vector<ErrorRecord> errors;

    bool cancelled() const { return chunks_cancelled > 0; }

    void print_summary() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Totals over every document ingested by one pipeline
 */
struct PipelineStatistics {
    int documents_processed = 0;
    int documents_partial = 0;              ///< Failed chunks or graph writes
    size_t total_chunks = 0;
    size_t chunks_failed = 0;
    size_t mentions_extracted = 0;
    size_t mentions_created = 0;
    size_t mentions_merged = 0;
    size_t mentions_replayed = 0;
    size_t type_conflicts = 0;
    double total_time_seconds = 0.0;

    // Filled in by get_statistics()
    size_t canonical_entities = 0;
    size_t review_queue_size = 0;
    size_t pending_relations = 0;

    void add(const IngestionReport& report);

    void print_summary() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Ingestion Pipeline
// ============================================================================

/**
 * @brief End-to-end entity resolution pipeline
 *
 * Document text -> chunks -> extraction -> normalization -> resolution and
 * merge -> knowledge graph. ingest() may be called from several threads at
 * once; the merge engine keeps per-bucket writes serialized.
 *
 * A RegistryCorruptionError propagates out of ingest() and halts the
 * pipeline: every later ingest() fails with the same error.
 */
class IngestionPipeline {
public:
    /**
     * @brief Constructor
     *
     * Null collaborators fall back to HttpExtractor, InMemoryGraphStore and
     * HashedNgramEmbedder.
     *
     * @throws std::invalid_argument on an invalid configuration
     */
    explicit IngestionPipeline(
        const PipelineConfig& config,
        std::shared_ptr<Extractor> extractor = nullptr,
        std::shared_ptr<GraphStore> store = nullptr,
        std::shared_ptr<const Embedder> embedder = nullptr
    );
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    /**
     * @brief Extract, resolve and materialize one document
     *
     * @throws RegistryCorruptionError when the registry is (or becomes) corrupt
     */
    IngestionReport ingest(
        const std::string& document_id,
        const std::string& text,
        std::shared_ptr<CancellationToken> cancel = nullptr
    );

    /**
     * @brief Ranked entities and documents for a query
     */
    std::vector<SearchHit> search(const std::string& query, size_t limit = 5, int explore_depth = -1) const;

    /**
     * @brief Canonical entity a mention resolved to (nullptr if unknown)
     */
    std::shared_ptr<const CanonicalEntity> lookup(const std::string& mention_id) const;

    std::shared_ptr<const CanonicalEntity> entity(EntityId id) const;

    std::vector<std::shared_ptr<const CanonicalEntity>> entities() const;

    std::vector<MergeDecision> audit_log() const;

    std::vector<MergeDecision> review_queue() const;

    /**
     * @brief Manual merge from review, reflected in the graph
     *
     * @throws TypeConflictError on a cross-type merge without override
     */
    ApplyResult merge_entities(EntityId absorbed, EntityId into, bool allow_type_override = false);

    /**
     * @brief Write entities.json, graph.json and merge_decisions.jsonl
     * @param directory Defaults to config.output_directory
     */
    void save_state(const std::string& directory = "") const;

    /**
     * @brief Probe the extraction service
     */
    bool is_extractor_available();

    void set_progress_callback(ProgressCallback callback);

    PipelineStatistics get_statistics() const;

    bool halted() const { return halted_.load() || merge_->halted(); }

    const PipelineConfig& config() const { return config_; }

    GraphStore& graph_store() { return *store_; }

    GraphBuilder& graph_builder() { return *graph_; }

    MergeEngine& merge_engine() { return *merge_; }

private:
    struct DocumentState;

    void initialize_components();

    /**
     * @brief Normalize, resolve and materialize everything one chunk produced
     */
    void process_chunk(DocumentState& state, ChunkExtraction&& chunk);

    void materialize_result(DocumentState& state, const ApplyResult& result, const RawMention& mention);

    void record_graph_failure(IngestionReport& report, const GraphWriteResult& result, const std::string& subject);

    void report_progress(const std::string& stage, int current, int total, const std::string& message = "");

    PipelineConfig config_;
    ProgressCallback progress_callback_;

    std::shared_ptr<Extractor> extractor_;
    std::shared_ptr<GraphStore> store_;
    std::shared_ptr<const Embedder> embedder_;

    std::unique_ptr<CandidateNormalizer> normalizer_;
    std::unique_ptr<MergeEngine> merge_;
    std::unique_ptr<GraphBuilder> graph_;
    std::unique_ptr<ExtractionGateway> gateway_;
    std::unique_ptr<HybridSearch> search_;

    mutable std::mutex stats_mutex_;
    PipelineStatistics stats_;

    std::atomic<bool> halted_{false};
};

} // namespace canon
