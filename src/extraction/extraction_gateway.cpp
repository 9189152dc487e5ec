#include "extraction/extraction_gateway.hpp"
#include "common/text.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace canon {

// ============================================================================
// GatewayConfig / GatewayReport
// ============================================================================

json GatewayConfig::to_json() const {
    json j;
    j["max_chunk_chars"] = max_chunk_chars;
    j["max_concurrency"] = max_concurrency;
    j["max_attempts"] = max_attempts;
    j["base_backoff_ms"] = base_backoff_ms;
    j["backoff_multiplier"] = backoff_multiplier;
    j["max_jitter_ms"] = max_jitter_ms;
    j["chunk_timeout_ms"] = chunk_timeout_ms;
    j["context_window"] = context_window;
    j["verbose"] = verbose;
    return j;
}

GatewayConfig GatewayConfig::from_json(const json& j) {
    GatewayConfig config;
    config.max_chunk_chars = j.value("max_chunk_chars", config.max_chunk_chars);
    config.max_concurrency = j.value("max_concurrency", config.max_concurrency);
    config.max_attempts = j.value("max_attempts", config.max_attempts);
    config.base_backoff_ms = j.value("base_backoff_ms", config.base_backoff_ms);
    config.backoff_multiplier = j.value("backoff_multiplier", config.backoff_multiplier);
    config.max_jitter_ms = j.value("max_jitter_ms", config.max_jitter_ms);
    config.chunk_timeout_ms = j.value("chunk_timeout_ms", config.chunk_timeout_ms);
    config.context_window = j.value("context_window", config.context_window);
    config.verbose = j.value("verbose", config.verbose);
    return config;
}

bool GatewayConfig::validate(std::string& error_message) const {
    if (max_chunk_chars < 4) {
        error_message = "gateway.max_chunk_chars must be at least 4";
        return false;
    }
    if (max_concurrency == 0) {
        error_message = "gateway.max_concurrency must be positive";
        return false;
    }
    if (max_attempts < 1) {
        error_message = "gateway.max_attempts must be at least 1";
        return false;
    }
    if (base_backoff_ms < 0 || max_jitter_ms < 0 || backoff_multiplier < 1.0) {
        error_message = "gateway backoff must be non-negative with a multiplier >= 1";
        return false;
    }
    if (chunk_timeout_ms <= 0) {
        error_message = "gateway.chunk_timeout_ms must be positive";
        return false;
    }
    return true;
}

json GatewayReport::to_json() const {
    json j;
    j["document_id"] = document_id;
    j["chunks_total"] = chunks_total;
    j["chunks_succeeded"] = chunks_succeeded;
    j["chunks_failed"] = chunks_failed;
    j["chunks_cancelled"] = chunks_cancelled;
    j["mentions_extracted"] = mentions_extracted;
    j["relations_extracted"] = relations_extracted;
    json errs = json::array();
    for (const auto& e : errors) {
        errs.push_back(e.to_json());
    }
    j["errors"] = errs;
    return j;
}

// ============================================================================
// Submission
// ============================================================================

struct ExtractionGateway::Submission {
    std::string document_id;
    const std::string* text = nullptr;      // owned by the blocked submit() caller
    const ChunkSink* sink = nullptr;
    std::shared_ptr<CancellationToken> cancel;
    std::vector<TextChunk> chunks;

    std::mutex mutex;                       // guards report, pending, fatal
    std::condition_variable done;
    size_t pending = 0;
    GatewayReport report;
    std::exception_ptr fatal;

    std::mutex sink_mutex;
};

// ============================================================================
// ExtractionGateway
// ============================================================================

ExtractionGateway::ExtractionGateway(std::shared_ptr<Extractor> extractor, const GatewayConfig& config)
    : extractor_(std::move(extractor)),
      config_(config),
      chunker_(config.max_chunk_chars) {
    if (!extractor_) {
        throw std::invalid_argument("ExtractionGateway requires an extractor");
    }
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid gateway configuration: " + error);
    }

    workers_.reserve(config_.max_concurrency);
    for (size_t i = 0; i < config_.max_concurrency; ++i) {
        workers_.emplace_back(&ExtractionGateway::worker, this);
    }
}

ExtractionGateway::~ExtractionGateway() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void ExtractionGateway::worker() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
            if (stop_ && queue_.empty()) break;
            task = std::move(queue_.front());
            queue_.pop();
        }
        task();
    }
}

std::chrono::milliseconds ExtractionGateway::backoff_delay(int attempt) const {
    double delay = config_.base_backoff_ms * std::pow(config_.backoff_multiplier, attempt - 1);
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

bool ExtractionGateway::wait_backoff(
    const Submission& submission,
    std::chrono::milliseconds delay,
    std::chrono::steady_clock::time_point deadline
) {
    thread_local std::mt19937 rng(std::random_device{}());
    if (config_.max_jitter_ms > 0) {
        std::uniform_int_distribution<int> jitter(0, config_.max_jitter_ms);
        delay += std::chrono::milliseconds(jitter(rng));
    }

    auto wake = std::chrono::steady_clock::now() + delay;
    if (wake > deadline) {
        return false;
    }

    // Sleep in slices so a cancellation is noticed promptly
    const auto slice = std::chrono::milliseconds(20);
    while (std::chrono::steady_clock::now() < wake) {
        if (submission.cancel->is_cancelled()) {
            return false;
        }
        auto remaining = wake - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, slice));
    }
    return !submission.cancel->is_cancelled();
}

ChunkExtraction ExtractionGateway::to_chunk_extraction(
    const TextChunk& chunk,
    const std::string& document_text,
    const ExtractionResult& result,
    std::vector<ErrorRecord>& errors
) const {
    ChunkExtraction extraction;
    extraction.chunk = chunk;

    // Extractor index -> mention id, empty for dropped spans
    std::vector<std::string> ids(result.mentions.size());
    // Mention id -> position in extraction.mentions
    std::unordered_map<std::string, size_t> positions;

    for (size_t i = 0; i < result.mentions.size(); ++i) {
        const auto& found = result.mentions[i];
        if (found.end > chunk.text.size() || found.start > chunk.text.size()) {
            errors.push_back({ErrorKind::MalformedMention,
                              "Span [" + std::to_string(found.start) + ", " +
                              std::to_string(found.end) + ") is outside the chunk",
                              chunk.chunk_id});
            continue;
        }

        RawMention mention;
        mention.document_id = chunk.document_id;
        mention.chunk_id = chunk.chunk_id;
        mention.start = chunk.start_position + found.start;
        mention.end = chunk.start_position + found.end;
        mention.mention_id = RawMention::make_id(chunk.document_id, mention.start, mention.end);

        auto existing = positions.find(mention.mention_id);
        if (existing != positions.end()) {
            RawMention& kept = extraction.mentions[existing->second];
            if (found.score > kept.confidence) {
                kept.declared_type = found.label;
                kept.confidence = found.score;
            }
            ids[i] = kept.mention_id;
            continue;
        }

        mention.text = found.end > found.start
            ? document_text.substr(mention.start, mention.end - mention.start)
            : found.text;
        mention.declared_type = found.label;
        mention.confidence = found.score;

        if (mention.end >= mention.start) {
            size_t ctx_start = mention.start > config_.context_window
                ? mention.start - config_.context_window : 0;
            size_t ctx_end = std::min(document_text.size(), mention.end + config_.context_window);
            ctx_start = text::utf8_boundary_before(document_text, ctx_start);
            ctx_end = text::utf8_boundary_before(document_text, ctx_end);
            mention.context = document_text.substr(ctx_start, ctx_end - ctx_start);
        }

        ids[i] = mention.mention_id;
        positions.emplace(mention.mention_id, extraction.mentions.size());
        extraction.mentions.push_back(std::move(mention));
    }

    for (const auto& rel : result.relations) {
        if (rel.subject >= ids.size() || rel.object >= ids.size() ||
            ids[rel.subject].empty() || ids[rel.object].empty() || rel.predicate.empty()) {
            continue;
        }
        extraction.relations.push_back({ids[rel.subject], rel.predicate, ids[rel.object]});
    }

    return extraction;
}

void ExtractionGateway::finish_chunk(const std::shared_ptr<Submission>& submission) {
    std::lock_guard<std::mutex> lock(submission->mutex);
    if (--submission->pending == 0) {
        submission->done.notify_all();
    }
}

void ExtractionGateway::run_chunk(const std::shared_ptr<Submission>& submission, size_t index) {
    const TextChunk& chunk = submission->chunks[index];
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.chunk_timeout_ms);

    auto record = [&](size_t GatewayReport::*counter, std::optional<ErrorRecord> error) {
        std::lock_guard<std::mutex> lock(submission->mutex);
        ++(submission->report.*counter);
        if (error) {
            submission->report.errors.push_back(*error);
        }
    };

    if (submission->cancel->is_cancelled()) {
        record(&GatewayReport::chunks_cancelled, std::nullopt);
        finish_chunk(submission);
        return;
    }

    ExtractionResult result;
    bool succeeded = false;
    std::optional<ErrorRecord> failure;
    int attempt = 0;

    while (true) {
        ++attempt;
        try {
            result = extractor_->extract(chunk.text);
            succeeded = true;
            break;
        } catch (const TransientExtractionError& e) {
            if (attempt >= config_.max_attempts) {
                failure = ErrorRecord{ErrorKind::TransientExtractionFailure,
                                      "Failed after " + std::to_string(attempt) + " attempts: " + e.what(),
                                      chunk.chunk_id};
                break;
            }
            auto delay = backoff_delay(attempt);
            if (config_.verbose) {
                std::cerr << ("[ExtractionGateway] Attempt " + std::to_string(attempt) + " failed for " +
                              chunk.chunk_id + ": " + e.what() + ". Retrying in " +
                              std::to_string(delay.count()) + "ms\n");
            }
            if (!wait_backoff(*submission, delay, deadline)) {
                break;
            }
        } catch (const PipelineError& e) {
            failure = ErrorRecord{e.kind(), e.what(), chunk.chunk_id};
            break;
        } catch (const std::exception& e) {
            failure = ErrorRecord{ErrorKind::ExtractionFailure, e.what(), chunk.chunk_id};
            break;
        }
    }

    if (submission->cancel->is_cancelled()) {
        record(&GatewayReport::chunks_cancelled, std::nullopt);
        finish_chunk(submission);
        return;
    }

    if (std::chrono::steady_clock::now() > deadline ||
        (!succeeded && !failure.has_value())) {
        ErrorRecord timeout{ErrorKind::TransientExtractionFailure,
                            "Timed out after " + std::to_string(config_.chunk_timeout_ms) + "ms (" +
                            std::to_string(attempt) + " attempts)",
                            chunk.chunk_id};
        std::cerr << ("[ExtractionGateway] Chunk " + chunk.chunk_id + " discarded: " + timeout.message + "\n");
        record(&GatewayReport::chunks_failed, timeout);
        finish_chunk(submission);
        return;
    }

    if (!succeeded) {
        std::cerr << ("[ExtractionGateway] Chunk " + chunk.chunk_id + " failed: " + failure->message + "\n");
        record(&GatewayReport::chunks_failed, failure);
        finish_chunk(submission);
        return;
    }

    std::vector<ErrorRecord> conversion_errors;
    ChunkExtraction extraction = to_chunk_extraction(chunk, *submission->text, result, conversion_errors);
    extraction.attempts = attempt;
    size_t mention_count = extraction.mentions.size();
    size_t relation_count = extraction.relations.size();

    std::optional<ErrorRecord> sink_error;
    bool delivered = false;
    {
        std::lock_guard<std::mutex> sink_lock(submission->sink_mutex);
        if (!submission->cancel->is_cancelled()) {
            try {
                (*submission->sink)(std::move(extraction));
                delivered = true;
            } catch (const PipelineError& e) {
                if (e.is_fatal()) {
                    std::lock_guard<std::mutex> lock(submission->mutex);
                    if (!submission->fatal) {
                        submission->fatal = std::current_exception();
                    }
                    submission->cancel->cancel();
                }
                sink_error = ErrorRecord{e.kind(), e.what(), chunk.chunk_id};
            } catch (const std::exception& e) {
                sink_error = ErrorRecord{ErrorKind::ExtractionFailure,
                                         std::string("Sink rejected chunk: ") + e.what(),
                                         chunk.chunk_id};
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(submission->mutex);
        auto& report = submission->report;
        for (auto& err : conversion_errors) {
            report.errors.push_back(std::move(err));
        }
        if (sink_error) {
            report.errors.push_back(*sink_error);
        }
        if (delivered) {
            ++report.chunks_succeeded;
            report.mentions_extracted += mention_count;
            report.relations_extracted += relation_count;
        } else if (sink_error) {
            ++report.chunks_failed;
        } else {
            ++report.chunks_cancelled;
        }
    }

    if (config_.verbose && delivered) {
        std::cerr << ("[ExtractionGateway] " + chunk.chunk_id + ": " + std::to_string(mention_count) +
                      " mentions, " + std::to_string(relation_count) + " relations (attempt " +
                      std::to_string(attempt) + ")\n");
    }

    finish_chunk(submission);
}

GatewayReport ExtractionGateway::submit(
    const std::string& document_id,
    const std::string& text,
    const ChunkSink& sink,
    std::shared_ptr<CancellationToken> cancel
) {
    auto submission = std::make_shared<Submission>();
    submission->document_id = document_id;
    submission->text = &text;
    submission->sink = &sink;
    submission->cancel = cancel ? std::move(cancel) : std::make_shared<CancellationToken>();
    submission->chunks = chunker_.chunk(document_id, text);
    submission->report.document_id = document_id;
    submission->report.chunks_total = submission->chunks.size();
    submission->pending = submission->chunks.size();

    if (submission->chunks.empty()) {
        return submission->report;
    }

    if (config_.verbose) {
        std::cerr << ("[ExtractionGateway] " + document_id + ": " +
                      std::to_string(submission->chunks.size()) + " chunks\n");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ExtractionGateway is shutting down");
        }
        for (size_t i = 0; i < submission->chunks.size(); ++i) {
            queue_.push([this, submission, i]() { run_chunk(submission, i); });
        }
    }
    cv_.notify_all();

    std::unique_lock<std::mutex> lock(submission->mutex);
    submission->done.wait(lock, [&] { return submission->pending == 0; });

    if (submission->fatal) {
        std::rethrow_exception(submission->fatal);
    }
    return submission->report;
}

} // namespace canon
