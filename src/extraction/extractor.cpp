#include "extraction/extractor.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace canon {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Transport failures are transient; the status code is left to the caller
HttpResponse http_request(
    const std::string& url,
    const std::string* json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransientExtractionError("Failed to initialize CURL");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (json_payload != nullptr) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload->c_str());
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw TransientExtractionError("CURL request to " + url + " failed: " + error);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);
    return response;
}

bool mentions_overload(const std::string& body) {
    std::string lower = body;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("rate limit") != std::string::npos ||
           lower.find("quota") != std::string::npos ||
           lower.find("overloaded") != std::string::npos;
}

bool is_word_char(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

} // anonymous namespace

// ============================================================================
// ExtractorConfig
// ============================================================================

json ExtractorConfig::to_json() const {
    json j;
    j["service_url"] = service_url;
    j["labels"] = labels;
    j["threshold"] = threshold;
    j["extract_relations"] = extract_relations;
    j["timeout_seconds"] = timeout_seconds;
    j["verbose"] = verbose;
    // api_key stays out of serialized config
    return j;
}

ExtractorConfig ExtractorConfig::from_json(const json& j) {
    ExtractorConfig config;
    config.service_url = j.value("service_url", config.service_url);
    config.api_key = j.value("api_key", config.api_key);
    if (j.contains("labels")) {
        config.labels = j["labels"].get<std::vector<std::string>>();
    }
    config.threshold = j.value("threshold", config.threshold);
    config.extract_relations = j.value("extract_relations", config.extract_relations);
    config.timeout_seconds = j.value("timeout_seconds", config.timeout_seconds);
    config.verbose = j.value("verbose", config.verbose);
    return config;
}

// ============================================================================
// HttpExtractor
// ============================================================================

HttpExtractor::HttpExtractor(const ExtractorConfig& config) : config_(config) {
    if (config_.service_url.empty()) {
        throw std::invalid_argument("HttpExtractor requires a service URL");
    }
    while (!config_.service_url.empty() && config_.service_url.back() == '/') {
        config_.service_url.pop_back();
    }
}

std::vector<std::string> HttpExtractor::headers() const {
    std::vector<std::string> result = {
        "Content-Type: application/json",
        "Accept: application/json"
    };
    if (!config_.api_key.empty()) {
        result.push_back("Authorization: Bearer " + config_.api_key);
    }
    return result;
}

std::string HttpExtractor::build_request(const std::string& text) const {
    json request;
    request["text"] = text;
    request["labels"] = config_.labels;
    request["threshold"] = config_.threshold;
    request["relations"] = config_.extract_relations;
    return request.dump();
}

void HttpExtractor::check_status(long http_code, const std::string& body) {
    if (http_code >= 200 && http_code < 300) {
        return;
    }

    std::string message = "Extraction service returned HTTP " + std::to_string(http_code) +
                          ": " + body.substr(0, 200);

    if (http_code == 429 || http_code == 408 || http_code >= 500 || mentions_overload(body)) {
        throw TransientExtractionError(message);
    }
    throw ExtractionError(message);
}

ExtractionResult HttpExtractor::parse_response(const std::string& body, const std::string& text) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ExtractionError(std::string("Unparseable extraction response: ") + e.what());
    }

    if (!response.is_object() || !response.contains("entities") || !response["entities"].is_array()) {
        throw ExtractionError("Extraction response has no \"entities\" array");
    }

    ExtractionResult result;
    try {
        for (const auto& entity : response["entities"]) {
            ExtractedMention mention;
            mention.label = entity.value("label", "");
            mention.score = entity.value("score", 1.0);

            size_t cp_start = entity.at("start").get<size_t>();
            size_t cp_end = entity.at("end").get<size_t>();
            mention.start = text::codepoint_to_byte_offset(text, cp_start);
            mention.end = text::codepoint_to_byte_offset(text, cp_end);

            if (mention.end > mention.start) {
                mention.text = text.substr(mention.start, mention.end - mention.start);
            } else {
                mention.text = entity.value("text", "");
            }
            result.mentions.push_back(mention);
        }

        if (response.contains("relations") && response["relations"].is_array()) {
            for (const auto& rel : response["relations"]) {
                ExtractedRelation relation;
                relation.subject = rel.at("subject").get<size_t>();
                relation.predicate = rel.at("predicate").get<std::string>();
                relation.object = rel.at("object").get<size_t>();
                relation.confidence = rel.value("score", 1.0);
                if (relation.subject < result.mentions.size() &&
                    relation.object < result.mentions.size()) {
                    result.relations.push_back(relation);
                }
            }
        }
    } catch (const json::exception& e) {
        throw ExtractionError(std::string("Malformed extraction response: ") + e.what());
    }

    return result;
}

ExtractionResult HttpExtractor::extract(const std::string& text) {
    std::string payload = build_request(text);
    HttpResponse response = http_request(
        config_.service_url + "/extract", &payload, headers(), config_.timeout_seconds);

    check_status(response.status, response.body);

    ExtractionResult result = parse_response(response.body, text);
    if (config_.verbose) {
        std::cerr << ("[HttpExtractor] " + std::to_string(result.mentions.size()) + " entities, " +
                      std::to_string(result.relations.size()) + " relations\n");
    }
    return result;
}

bool HttpExtractor::is_available() {
    try {
        HttpResponse response = http_request(
            config_.service_url + "/health", nullptr, headers(), std::min(config_.timeout_seconds, 5));
        if (response.status != 200) {
            return false;
        }
        json health = json::parse(response.body);
        return health.value("status", "") == "ok";
    } catch (const TransientExtractionError& e) {
        if (config_.verbose) {
            std::cerr << ("[HttpExtractor] Health check failed: " + std::string(e.what()) + "\n");
        }
        return false;
    } catch (const json::exception& e) {
        if (config_.verbose) {
            std::cerr << ("[HttpExtractor] Health response unreadable: " + std::string(e.what()) + "\n");
        }
        return false;
    }
}

// ============================================================================
// GazetteerExtractor
// ============================================================================

GazetteerExtractor::GazetteerExtractor(std::vector<Entry> entries) {
    for (const auto& entry : entries) {
        add_entry(entry.surface, entry.label);
    }
}

void GazetteerExtractor::add_entry(const std::string& surface, const std::string& label) {
    if (surface.empty()) {
        return;
    }
    Entry entry{surface, label};
    auto pos = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) {
        return e.surface.size() < surface.size();
    });
    entries_.insert(pos, entry);
}

void GazetteerExtractor::add_relation_rule(const RelationRule& rule) {
    rules_.push_back(rule);
}

std::unique_ptr<GazetteerExtractor> GazetteerExtractor::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open gazetteer file: " + path);
    }

    json j;
    file >> j;

    auto extractor = std::make_unique<GazetteerExtractor>();
    for (const auto& item : j.value("entries", json::array())) {
        extractor->add_entry(item.at("surface").get<std::string>(), item.value("label", ""));
    }
    for (const auto& item : j.value("relations", json::array())) {
        RelationRule rule;
        rule.subject_label = item.at("subject_label").get<std::string>();
        rule.trigger = item.at("trigger").get<std::string>();
        rule.predicate = item.at("predicate").get<std::string>();
        rule.object_label = item.at("object_label").get<std::string>();
        extractor->add_relation_rule(rule);
    }
    return extractor;
}

ExtractionResult GazetteerExtractor::extract(const std::string& input) {
    ExtractionResult result;

    size_t pos = 0;
    while (pos < input.size()) {
        bool at_word_start = pos == 0 || !is_word_char(static_cast<unsigned char>(input[pos - 1]));
        if (!at_word_start) {
            ++pos;
            continue;
        }

        const Entry* match = nullptr;
        for (const auto& entry : entries_) {
            size_t end = pos + entry.surface.size();
            if (end > input.size() || input.compare(pos, entry.surface.size(), entry.surface) != 0) {
                continue;
            }
            if (end < input.size() && is_word_char(static_cast<unsigned char>(input[end])) &&
                is_word_char(static_cast<unsigned char>(entry.surface.back()))) {
                continue;
            }
            match = &entry;     // entries are longest first
            break;
        }

        if (match == nullptr) {
            ++pos;
            continue;
        }

        ExtractedMention mention;
        mention.text = match->surface;
        mention.label = match->label;
        mention.start = pos;
        mention.end = pos + match->surface.size();
        result.mentions.push_back(mention);
        pos = mention.end;
    }

    for (size_t i = 0; i + 1 < result.mentions.size(); ++i) {
        const auto& subject = result.mentions[i];
        const auto& object = result.mentions[i + 1];
        std::string between = input.substr(subject.end, object.start - subject.end);
        if (between.find_first_of(".!?") != std::string::npos) {
            continue;
        }

        for (const auto& rule : rules_) {
            if (rule.subject_label == subject.label &&
                rule.object_label == object.label &&
                between.find(rule.trigger) != std::string::npos) {
                result.relations.push_back({i, rule.predicate, i + 1, 1.0});
            }
        }
    }

    return result;
}

} // namespace canon
