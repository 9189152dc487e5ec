#include "pipeline/ingestion_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <sys/stat.h>

using json = nlohmann::json;

namespace canon {

namespace {

const char* const kRedacted = "***REDACTED***";

} // namespace

// ============================================================================
// PipelineConfig
// ============================================================================

json PipelineConfig::to_json() const {
    json j;
    j["extractor"] = extractor.to_json();
    j["gateway"] = gateway.to_json();
    j["normalizer"] = {{"max_span_chars", normalizer.max_span_chars}};
    j["resolver"] = resolver.to_json();
    j["merge"] = merge.to_json();
    j["graph"] = graph.to_json();
    j["search"] = search.to_json();
    j["output_directory"] = output_directory;
    j["verbose"] = verbose;
    return j;
}

PipelineConfig PipelineConfig::from_json(const json& j) {
    PipelineConfig config;

    if (j.contains("extractor")) {
        config.extractor = ExtractorConfig::from_json(j["extractor"]);
        if (config.extractor.api_key == kRedacted) {
            config.extractor.api_key.clear();
        }
    }
    if (j.contains("gateway")) config.gateway = GatewayConfig::from_json(j["gateway"]);
    if (j.contains("normalizer")) {
        config.normalizer.max_span_chars =
            j["normalizer"].value("max_span_chars", config.normalizer.max_span_chars);
    }
    if (j.contains("resolver")) config.resolver = ResolverConfig::from_json(j["resolver"]);
    if (j.contains("merge")) config.merge = MergeEngineConfig::from_json(j["merge"]);
    if (j.contains("graph")) config.graph = GraphBuilderConfig::from_json(j["graph"]);
    if (j.contains("search")) config.search = SearchConfig::from_json(j["search"]);

    config.output_directory = j.value("output_directory", config.output_directory);
    config.verbose = j.value("verbose", config.verbose);

    return config;
}

PipelineConfig PipelineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

void PipelineConfig::to_json_file(const std::string& path) const {
    json j = to_json();
    if (!extractor.api_key.empty()) {
        j["extractor"]["api_key"] = kRedacted;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << j.dump(2);
}

PipelineConfig PipelineConfig::from_environment() {
    PipelineConfig config;

    const char* url = std::getenv("CANON_EXTRACTOR_URL");
    if (url) config.extractor.service_url = url;

    const char* api_key = std::getenv("CANON_EXTRACTOR_API_KEY");
    if (api_key) config.extractor.api_key = api_key;

    const char* concurrency = std::getenv("CANON_MAX_CONCURRENCY");
    if (concurrency) {
        try {
            int value = std::stoi(concurrency);
            if (value > 0) {
                config.gateway.max_concurrency = static_cast<size_t>(value);
            }
        } catch (const std::logic_error&) {
            std::cerr << ("[PipelineConfig] Ignoring CANON_MAX_CONCURRENCY=" + std::string(concurrency) + "\n");
        }
    }

    const char* output_dir = std::getenv("CANON_OUTPUT_DIR");
    if (output_dir) config.output_directory = output_dir;

    return config;
}

bool PipelineConfig::validate(std::string& error_message) const {
    if (extractor.service_url.empty()) {
        error_message = "Extractor service URL is required";
        return false;
    }

    if (extractor.threshold < 0.0 || extractor.threshold > 1.0) {
        error_message = "Extractor threshold must be between 0.0 and 1.0";
        return false;
    }

    if (extractor.timeout_seconds <= 0) {
        error_message = "Extractor timeout must be positive";
        return false;
    }

    if (normalizer.max_span_chars == 0) {
        error_message = "normalizer.max_span_chars must be positive";
        return false;
    }

    if (merge.writer_shards == 0) {
        error_message = "merge.writer_shards must be at least 1";
        return false;
    }

    if (graph.max_write_attempts < 1) {
        error_message = "graph.max_write_attempts must be at least 1";
        return false;
    }

    return gateway.validate(error_message) &&
           resolver.validate(error_message) &&
           search.validate(error_message);
}

// ============================================================================
// IngestionReport
// ============================================================================

void IngestionReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Ingestion Summary: " << document_id << "\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Extraction:\n";
    std::cout << "  Chunks: " << chunks_total << " (" << chunks_succeeded << " ok, "
              << chunks_failed << " failed, " << chunks_cancelled << " cancelled)\n";
    std::cout << "  Mentions extracted: " << mentions_extracted << "\n";
    std::cout << "  Relations extracted: " << relations_extracted << "\n\n";

    std::cout << "Resolution:\n";
    std::cout << "  New entities: " << mentions_created << "\n";
    std::cout << "  Merged mentions: " << mentions_merged
              << " (" << low_confidence_merges << " low confidence)\n";
    std::cout << "  Replayed mentions: " << mentions_replayed << "\n";
    std::cout << "  Dropped mentions: " << mentions_dropped << "\n";
    std::cout << "  Type conflicts: " << type_conflicts << "\n";
    std::cout << "  Entities consolidated: " << entities_consolidated << "\n\n";

    std::cout << "Graph:\n";
    std::cout << "  Relations materialized: " << relations_materialized << "\n";
    std::cout << "  Relations pending: " << relations_pending << "\n";
    if (partially_materialized) {
        std::cout << "  PARTIALLY MATERIALIZED\n";
    }

    if (!errors.empty()) {
        std::cout << "\nErrors (" << errors.size() << "):\n";
        for (const auto& err : errors) {
            std::cout << "  [" << error_kind_to_string(err.kind) << "] " << err.subject
                      << ": " << err.message << "\n";
        }
    }

    std::cout << "\nTime: " << total_time_seconds << " seconds\n";
    std::cout << std::string(70, '=') << "\n\n";
}

json IngestionReport::to_json() const {
    json j;
    j["document_id"] = document_id;

    j["chunks_total"] = chunks_total;
    j["chunks_succeeded"] = chunks_succeeded;
    j["chunks_failed"] = chunks_failed;
    j["chunks_cancelled"] = chunks_cancelled;
    j["mentions_extracted"] = mentions_extracted;

    j["mentions_dropped"] = mentions_dropped;
    j["mentions_created"] = mentions_created;
    j["mentions_merged"] = mentions_merged;
    j["mentions_replayed"] = mentions_replayed;
    j["low_confidence_merges"] = low_confidence_merges;
    j["type_conflicts"] = type_conflicts;
    j["entities_consolidated"] = entities_consolidated;

    j["relations_extracted"] = relations_extracted;
    j["relations_materialized"] = relations_materialized;
    j["relations_pending"] = relations_pending;
    j["partially_materialized"] = partially_materialized;

    j["total_time_seconds"] = total_time_seconds;

    j["errors"] = json::array();
    for (const auto& err : errors) {
        j["errors"].push_back(err.to_json());
    }
    return j;
}

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::add(const IngestionReport& report) {
    documents_processed++;
    if (report.chunks_failed > 0 || report.partially_materialized) {
        documents_partial++;
    }
    total_chunks += report.chunks_total;
    chunks_failed += report.chunks_failed;
    mentions_extracted += report.mentions_extracted;
    mentions_created += report.mentions_created;
    mentions_merged += report.mentions_merged;
    mentions_replayed += report.mentions_replayed;
    type_conflicts += report.type_conflicts;
    total_time_seconds += report.total_time_seconds;
}

void PipelineStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Pipeline Execution Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Documents:\n";
    std::cout << "  Processed: " << documents_processed << "\n";
    std::cout << "  Partial: " << documents_partial << "\n";
    std::cout << "  Total chunks: " << total_chunks << " (" << chunks_failed << " failed)\n\n";

    std::cout << "Resolution:\n";
    std::cout << "  Mentions extracted: " << mentions_extracted << "\n";
    std::cout << "  New entities: " << mentions_created << "\n";
    std::cout << "  Merged mentions: " << mentions_merged << "\n";
    std::cout << "  Replayed mentions: " << mentions_replayed << "\n";
    std::cout << "  Type conflicts: " << type_conflicts << "\n\n";

    std::cout << "Registry:\n";
    std::cout << "  Canonical entities: " << canonical_entities << "\n";
    std::cout << "  Awaiting review: " << review_queue_size << "\n";
    std::cout << "  Pending relations: " << pending_relations << "\n\n";

    std::cout << "Total time: " << total_time_seconds << " seconds\n";
    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json PipelineStatistics::to_json() const {
    json j;
    j["documents_processed"] = documents_processed;
    j["documents_partial"] = documents_partial;
    j["total_chunks"] = total_chunks;
    j["chunks_failed"] = chunks_failed;
    j["mentions_extracted"] = mentions_extracted;
    j["mentions_created"] = mentions_created;
    j["mentions_merged"] = mentions_merged;
    j["mentions_replayed"] = mentions_replayed;
    j["type_conflicts"] = type_conflicts;
    j["total_time_seconds"] = total_time_seconds;
    j["canonical_entities"] = canonical_entities;
    j["review_queue_size"] = review_queue_size;
    j["pending_relations"] = pending_relations;
    return j;
}

// ============================================================================
// IngestionPipeline
// ============================================================================

struct IngestionPipeline::DocumentState {
    std::string document_id;
    IngestionReport& report;
    std::map<std::string, EntityId> resolved;      // mention id -> entity at commit time
    int chunks_done = 0;
};

IngestionPipeline::IngestionPipeline(
    const PipelineConfig& config,
    std::shared_ptr<Extractor> extractor,
    std::shared_ptr<GraphStore> store,
    std::shared_ptr<const Embedder> embedder
) : config_(config),
    extractor_(std::move(extractor)),
    store_(std::move(store)),
    embedder_(std::move(embedder)) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    initialize_components();
}

IngestionPipeline::~IngestionPipeline() {
    // Gateway workers call back into the merge engine and the graph builder
    gateway_.reset();
    merge_->shutdown();
}

void IngestionPipeline::initialize_components() {
    if (config_.verbose) {
        config_.extractor.verbose = true;
        config_.gateway.verbose = true;
        config_.merge.verbose = true;
        config_.graph.verbose = true;
        config_.search.verbose = true;
    }

    if (!extractor_) {
        extractor_ = std::make_shared<HttpExtractor>(config_.extractor);
    }
    if (!store_) {
        store_ = std::make_shared<InMemoryGraphStore>();
    }
    if (!embedder_) {
        embedder_ = std::make_shared<HashedNgramEmbedder>();
    }

    normalizer_ = std::make_unique<CandidateNormalizer>(config_.normalizer);
    merge_ = std::make_unique<MergeEngine>(config_.resolver, config_.merge, embedder_);

    auto resolve_root = [this](EntityId id) -> EntityId {
        try {
            return merge_->find_root(id);
        } catch (const std::out_of_range&) {
            return id;      // not an id this registry allocated
        }
    };

    graph_ = std::make_unique<GraphBuilder>(store_, config_.graph, embedder_, resolve_root);
    search_ = std::make_unique<HybridSearch>(store_, embedder_, config_.search, resolve_root);
    gateway_ = std::make_unique<ExtractionGateway>(extractor_, config_.gateway);
}

IngestionReport IngestionPipeline::ingest(
    const std::string& document_id,
    const std::string& text,
    std::shared_ptr<CancellationToken> cancel
) {
    if (halted()) {
        throw RegistryCorruptionError(
            "Pipeline halted after a registry corruption; refusing to ingest " + document_id);
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    IngestionReport report;
    report.document_id = document_id;

    report_progress("Ingesting", 0, 1, document_id);

    GraphWriteResult doc_write = graph_->materialize_document(document_id, text);
    if (!doc_write.success) {
        record_graph_failure(report, doc_write, document_node_id(document_id));
    }

    DocumentState state{document_id, report, {}, 0};
    ChunkSink sink = [this, &state](ChunkExtraction&& chunk) {
        process_chunk(state, std::move(chunk));
    };

    GatewayReport extraction;
    try {
        extraction = gateway_->submit(document_id, text, sink, std::move(cancel));
    } catch (const RegistryCorruptionError& e) {
        halted_ = true;
        std::cerr << ("[IngestionPipeline] Halting on " + document_id + ": " + e.what() + "\n");
        throw;
    }

    report.chunks_total = extraction.chunks_total;
    report.chunks_succeeded = extraction.chunks_succeeded;
    report.chunks_failed = extraction.chunks_failed;
    report.chunks_cancelled = extraction.chunks_cancelled;
    report.mentions_extracted = extraction.mentions_extracted;
    report.relations_extracted = extraction.relations_extracted;
    report.errors.insert(report.errors.end(), extraction.errors.begin(), extraction.errors.end());
    report.relations_pending = graph_->pending_count();

    auto end_time = std::chrono::high_resolution_clock::now();
    report.total_time_seconds = std::chrono::duration<double>(end_time - start_time).count();

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.add(report);
    }

    report_progress("Ingested", 1, 1, document_id);

    if (config_.verbose) {
        std::cout << ("[IngestionPipeline] " + document_id + ": " +
                      std::to_string(report.mentions_created) + " created, " +
                      std::to_string(report.mentions_merged) + " merged, " +
                      std::to_string(report.mentions_replayed) + " replayed, " +
                      std::to_string(report.chunks_failed) + " chunks failed\n");
    }

    return report;
}

void IngestionPipeline::process_chunk(DocumentState& state, ChunkExtraction&& chunk) {
    IngestionReport& report = state.report;

    // Normalize everything first so candidates of different buckets resolve in parallel
    std::vector<std::pair<RawMention, std::future<ApplyResult>>> submitted;
    submitted.reserve(chunk.mentions.size());

    for (auto& mention : chunk.mentions) {
        try {
            Candidate candidate = normalizer_->normalize(mention);
            submitted.emplace_back(mention, merge_->submit(std::move(candidate)));
        } catch (const MalformedMentionError& e) {
            report.mentions_dropped++;
            report.errors.push_back({ErrorKind::MalformedMention, e.what(), mention.mention_id});
            if (config_.verbose) {
                std::cerr << ("[IngestionPipeline] Dropped " + mention.mention_id + ": " + e.what() + "\n");
            }
        }
    }

    for (auto& [mention, pending] : submitted) {
        ApplyResult result;
        try {
            result = pending.get();
        } catch (const PipelineError& e) {
            if (e.is_fatal()) {
                throw;
            }
            report.errors.push_back({e.kind(), e.what(), mention.mention_id});
            continue;
        }

        switch (result.outcome) {
            case ApplyOutcome::Created:  report.mentions_created++; break;
            case ApplyOutcome::Merged:   report.mentions_merged++; break;
            case ApplyOutcome::Replayed: report.mentions_replayed++; break;
        }
        if (result.decision.tier == DecisionTier::LowConfidence) {
            report.low_confidence_merges++;
        }
        if (result.type_conflict) {
            report.type_conflicts++;
            report.errors.push_back({
                ErrorKind::TypeConflict,
                "\"" + mention.text + "\" kept apart from entity " +
                    std::to_string(result.decision.conflict_with.value_or(kNoEntity)) +
                    " of another type",
                mention.mention_id});
        }
        report.entities_consolidated += result.absorbed.size();

        state.resolved[mention.mention_id] = result.entity_id;
        materialize_result(state, result, mention);
    }

    for (const auto& rel : chunk.relations) {
        auto subject = state.resolved.find(rel.subject_mention_id);
        auto object = state.resolved.find(rel.object_mention_id);
        if (subject == state.resolved.end() || object == state.resolved.end()) {
            if (config_.verbose) {
                std::cerr << ("[IngestionPipeline] Skipping relation " + rel.predicate + " in " +
                              chunk.chunk.chunk_id + ": an endpoint mention was dropped\n");
            }
            continue;
        }

        Relation relation;
        relation.subject = subject->second;
        relation.predicate = rel.predicate;
        relation.object = object->second;
        relation.provenance = {rel.subject_mention_id, rel.object_mention_id};

        GraphWriteResult written = graph_->materialize(relation);
        if (!written.success) {
            record_graph_failure(report, written, rel.subject_mention_id);
        } else if (written.changed) {
            report.relations_materialized++;
        }
    }

    report_progress("Resolved chunk", ++state.chunks_done, 0, chunk.chunk.chunk_id);
}

void IngestionPipeline::materialize_result(
    DocumentState& state,
    const ApplyResult& result,
    const RawMention& mention
) {
    IngestionReport& report = state.report;

    auto root = merge_->entity(result.entity_id);
    if (!root) {
        return;
    }

    GraphWriteResult written = graph_->materialize(*root);
    if (!written.success) {
        record_graph_failure(report, written, entity_node_id(root->id));
    }
    report.relations_materialized += written.relations_flushed;

    for (EntityId absorbed : result.absorbed) {
        GraphWriteResult redirected = graph_->redirect(absorbed, root->id);
        if (!redirected.success) {
            record_graph_failure(report, redirected, entity_node_id(absorbed));
        }
        report.relations_materialized += redirected.relations_flushed;
    }

    GraphWriteResult linked = graph_->link_mention(state.document_id, root->id, mention.mention_id);
    if (!linked.success) {
        record_graph_failure(report, linked, mention.mention_id);
    }
}

void IngestionPipeline::record_graph_failure(
    IngestionReport& report,
    const GraphWriteResult& result,
    const std::string& subject
) {
    report.partially_materialized = true;
    report.errors.push_back({ErrorKind::GraphWriteFailure, result.error_message, subject});
}

std::vector<SearchHit> IngestionPipeline::search(const std::string& query, size_t limit, int explore_depth) const {
    return search_->query(query, limit, explore_depth);
}

std::shared_ptr<const CanonicalEntity> IngestionPipeline::lookup(const std::string& mention_id) const {
    auto id = merge_->lookup(mention_id);
    if (!id) {
        return nullptr;
    }
    return merge_->entity(*id);
}

std::shared_ptr<const CanonicalEntity> IngestionPipeline::entity(EntityId id) const {
    return merge_->entity(id);
}

std::vector<std::shared_ptr<const CanonicalEntity>> IngestionPipeline::entities() const {
    return merge_->entities();
}

std::vector<MergeDecision> IngestionPipeline::audit_log() const {
    return merge_->audit_log();
}

std::vector<MergeDecision> IngestionPipeline::review_queue() const {
    return merge_->review_queue();
}

ApplyResult IngestionPipeline::merge_entities(EntityId absorbed, EntityId into, bool allow_type_override) {
    if (halted()) {
        throw RegistryCorruptionError("Pipeline halted after a registry corruption; refusing to merge");
    }

    ApplyResult result;
    try {
        result = merge_->merge_entities(absorbed, into, allow_type_override);
    } catch (const RegistryCorruptionError& e) {
        halted_ = true;
        std::cerr << ("[IngestionPipeline] Halting: " + std::string(e.what()) + "\n");
        throw;
    }

    if (result.absorbed.empty()) {
        return result;
    }

    auto root = merge_->entity(result.entity_id);
    if (root) {
        GraphWriteResult written = graph_->materialize(*root);
        if (!written.success) {
            std::cerr << ("[IngestionPipeline] Manual merge not reflected in graph: " + written.error_message + "\n");
        }
        for (EntityId id : result.absorbed) {
            GraphWriteResult redirected = graph_->redirect(id, root->id);
            if (!redirected.success) {
                std::cerr << ("[IngestionPipeline] Manual merge not reflected in graph: " +
                              redirected.error_message + "\n");
            }
        }
    }

    return result;
}

void IngestionPipeline::save_state(const std::string& directory) const {
    std::string dir = directory.empty() ? config_.output_directory : directory;

    if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
        throw std::runtime_error("Failed to create output directory " + dir + ": " + std::strerror(errno));
    }

    {
        std::ofstream file(dir + "/entities.json");
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + dir + "/entities.json");
        }
        file << merge_->entities_to_json().dump(2);
    }

    if (auto memory_store = std::dynamic_pointer_cast<InMemoryGraphStore>(store_)) {
        memory_store->export_to_json(dir + "/graph.json");
    } else if (config_.verbose) {
        std::cout << "[IngestionPipeline] Graph store is external, graph.json not written\n";
    }

    merge_->export_audit_log(dir + "/merge_decisions.jsonl");

    {
        std::ofstream file(dir + "/statistics.json");
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + dir + "/statistics.json");
        }
        file << get_statistics().to_json().dump(2);
    }

    if (config_.verbose) {
        std::cout << "[IngestionPipeline] Saved state to " << dir << "\n";
    }
}

bool IngestionPipeline::is_extractor_available() {
    return extractor_->is_available();
}

void IngestionPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = callback;
}

PipelineStatistics IngestionPipeline::get_statistics() const {
    PipelineStatistics stats;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats = stats_;
    }
    stats.canonical_entities = merge_->entities().size();
    stats.review_queue_size = merge_->review_queue().size();
    stats.pending_relations = graph_->pending_count();
    return stats;
}

void IngestionPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose) {
        std::string line = "[" + stage + "] " + std::to_string(current);
        if (total > 0) {
            line += "/" + std::to_string(total);
        }
        if (!message.empty()) {
            line += " - " + message;
        }
        std::cout << (line + "\n");
    }
}

} // namespace canon
