#include "common/errors.hpp"

namespace canon {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientExtractionFailure: return "TransientExtractionFailure";
        case ErrorKind::ExtractionFailure: return "ExtractionFailure";
        case ErrorKind::MalformedMention: return "MalformedMention";
        case ErrorKind::TypeConflict: return "TypeConflict";
        case ErrorKind::GraphWriteFailure: return "GraphWriteFailure";
        case ErrorKind::RegistryCorruption: return "RegistryCorruption";
        default: return "Unknown";
    }
}

nlohmann::json ErrorRecord::to_json() const {
    nlohmann::json j;
    j["kind"] = error_kind_to_string(kind);
    j["message"] = message;
    if (!subject.empty()) {
        j["subject"] = subject;
    }
    return j;
}

} // namespace canon
