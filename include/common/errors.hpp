#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace canon {

// ============================================================================
// Error Taxonomy
// ============================================================================

/**
 * @brief Category of a pipeline failure
 *
 * Everything except RegistryCorruption is non-fatal: it is recorded in the
 * ingestion report and processing continues.
 */
enum class ErrorKind {
    TransientExtractionFailure,
    ExtractionFailure,
    MalformedMention,
    TypeConflict,
    GraphWriteFailure,
    RegistryCorruption
};

std::string error_kind_to_string(ErrorKind kind);

/**
 * @brief Base class for all errors raised by the resolution core
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    bool is_fatal() const { return kind_ == ErrorKind::RegistryCorruption; }

private:
    ErrorKind kind_;
};

/// Retryable extractor failure (network error, HTTP 429, HTTP 5xx, timeout)
class TransientExtractionError : public PipelineError {
public:
    explicit TransientExtractionError(const std::string& message)
        : PipelineError(ErrorKind::TransientExtractionFailure, message) {}
};

/// Extractor failure that retrying will not fix (HTTP 4xx, unparseable body)
class ExtractionError : public PipelineError {
public:
    explicit ExtractionError(const std::string& message)
        : PipelineError(ErrorKind::ExtractionFailure, message) {}
};

class MalformedMentionError : public PipelineError {
public:
    explicit MalformedMentionError(const std::string& message)
        : PipelineError(ErrorKind::MalformedMention, message) {}
};

class TypeConflictError : public PipelineError {
public:
    explicit TypeConflictError(const std::string& message)
        : PipelineError(ErrorKind::TypeConflict, message) {}
};

class GraphWriteError : public PipelineError {
public:
    explicit GraphWriteError(const std::string& message)
        : PipelineError(ErrorKind::GraphWriteFailure, message) {}
};

/**
 * @brief Union-find invariant violated (cycle, dangling parent)
 *
 * Fatal: downstream data can no longer be trusted, ingestion halts.
 */
class RegistryCorruptionError : public PipelineError {
public:
    explicit RegistryCorruptionError(const std::string& message)
        : PipelineError(ErrorKind::RegistryCorruption, message) {}
};

/**
 * @brief A non-fatal error accumulated into an ingestion report
 */
struct ErrorRecord {
    ErrorKind kind;
    std::string message;
    std::string subject;        ///< Chunk id, mention id or node id involved

    nlohmann::json to_json() const;
};

} // namespace canon
