#pragma once

#include "common/errors.hpp"
#include "extraction/extractor.hpp"
#include "extraction/text_chunker.hpp"
#include "resolution/types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

// ============================================================================
// Gateway Configuration
// ============================================================================

struct GatewayConfig {
    size_t max_chunk_chars = 800;       ///< Chunk size limit in bytes
    size_t max_concurrency = 4;         ///< Worker threads calling the extractor
    int max_attempts = 3;               ///< Attempts per chunk, first call included
    int base_backoff_ms = 500;
    double backoff_multiplier = 1.5;
    int max_jitter_ms = 250;
    int chunk_timeout_ms = 60000;       ///< Wall-clock budget per chunk, retries included
    size_t context_window = 100;        ///< Bytes of context kept on each side of a mention
    bool verbose = false;

    nlohmann::json to_json() const;
    static GatewayConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error_message) const;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Relation between two mentions of the same chunk
 */
struct ChunkRelation {
    std::string subject_mention_id;
    std::string predicate;
    std::string object_mention_id;
};

/**
 * @brief Everything one chunk produced, delivered to the sink as a unit
 */
struct ChunkExtraction {
    TextChunk chunk;
    std::vector<RawMention> mentions;
    std::vector<ChunkRelation> relations;
    int attempts = 0;
};

struct GatewayReport {
    std::string document_id;
    size_t chunks_total = 0;
    size_t chunks_succeeded = 0;
    size_t chunks_failed = 0;           ///< Retries exhausted, permanent error or timeout
    size_t chunks_cancelled = 0;
    size_t mentions_extracted = 0;
    size_t relations_extracted = 0;
    std::vector<ErrorRecord> errors;

    nlohmann::json to_json() const;
};

/**
 * @brief Document-level cancellation shared between caller and workers
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Called once per successful chunk, in completion order
 *
 * Calls for one document never overlap. An exception thrown by the sink is
 * recorded against the chunk; a fatal PipelineError cancels the document and
 * is rethrown from submit().
 */
using ChunkSink = std::function<void(ChunkExtraction&&)>;

// ============================================================================
// Extraction Gateway
// ============================================================================

/**
 * @brief Runs chunked extraction on a fixed worker pool with retry and
 *        cancellation
 *
 * Failed chunks are logged and skipped without affecting the other chunks.
 * A cancelled or timed-out chunk discards whatever it extracted.
 */
class ExtractionGateway {
public:
    ExtractionGateway(std::shared_ptr<Extractor> extractor, const GatewayConfig& config);
    ~ExtractionGateway();

    ExtractionGateway(const ExtractionGateway&) = delete;
    ExtractionGateway& operator=(const ExtractionGateway&) = delete;

    /**
     * @brief Extract a whole document, blocking until every chunk settled
     */
    GatewayReport submit(
        const std::string& document_id,
        const std::string& text,
        const ChunkSink& sink,
        std::shared_ptr<CancellationToken> cancel = nullptr
    );

    /**
     * @brief Convert an extractor result for a chunk into document-level mentions
     *
     * Mentions whose span falls outside the chunk are reported in `errors`.
     * A span returned under several labels yields one mention carrying the
     * highest-scoring label (the first one on a tie).
     */
    ChunkExtraction to_chunk_extraction(
        const TextChunk& chunk,
        const std::string& document_text,
        const ExtractionResult& result,
        std::vector<ErrorRecord>& errors
    ) const;

    /**
     * @brief Delay before attempt `attempt + 1`, jitter excluded
     */
    std::chrono::milliseconds backoff_delay(int attempt) const;

    const GatewayConfig& config() const { return config_; }

    Extractor& extractor() { return *extractor_; }

private:
    struct Submission;

    void worker();
    void run_chunk(const std::shared_ptr<Submission>& submission, size_t index);
    void finish_chunk(const std::shared_ptr<Submission>& submission);

    /**
     * @brief Sleep until the delay elapses, the deadline passes or the
     *        document is cancelled
     * @return false when the chunk should stop
     */
    bool wait_backoff(
        const Submission& submission,
        std::chrono::milliseconds delay,
        std::chrono::steady_clock::time_point deadline
    );

    std::shared_ptr<Extractor> extractor_;
    GatewayConfig config_;
    TextChunker chunker_;

    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    bool stop_ = false;
};

} // namespace canon
