#pragma once

#include "common/errors.hpp"
#include "extraction/extractor.hpp"
#include "graph/graph_store.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace canon {
namespace test {

// ==========================================
// Fixture documents
// ==========================================

inline const std::string kAppleNews =
    "Apple Inc. reported record quarterly revenue. Tim Cook said the results "
    "reflected strong demand. Apple Inc. also raised its dividend.";

inline const std::string kIphoneReview =
    "The latest iPhone from Apple feels refined. Timothy Cook introduced it at "
    "Apple Inc headquarters. Tim Cook called it the best iPhone yet.";

/**
 * @brief Gazetteer knowing the entities of the fixture documents
 */
inline std::shared_ptr<GazetteerExtractor> make_gazetteer() {
    auto gazetteer = std::make_shared<GazetteerExtractor>();
    gazetteer->add_entry("Apple Inc.", "organization");
    gazetteer->add_entry("Apple Inc", "organization");
    gazetteer->add_entry("Apple", "organization");
    gazetteer->add_entry("Tim Cook", "person");
    gazetteer->add_entry("Timothy Cook", "person");
    gazetteer->add_entry("iPhone", "product");
    gazetteer->add_entry("Cupertino", "location");
    gazetteer->add_relation_rule({"person", " at ", "WORKS_AT", "organization"});
    gazetteer->add_relation_rule({"person", "called", "PRAISED", "product"});
    return gazetteer;
}

// ==========================================
// Extractor doubles
// ==========================================

/**
 * @brief Delegates to a gazetteer, failing on chunks that contain a marker
 *
 * Chunks containing `fail_marker` throw TransientExtractionError on every
 * attempt; chunks containing `flaky_marker` throw on their first
 * `flaky_failures` attempts and then succeed.
 */
class ScriptedExtractor : public Extractor {
public:
    explicit ScriptedExtractor(std::shared_ptr<Extractor> inner = make_gazetteer())
        : inner_(std::move(inner)) {}

    ExtractionResult extract(const std::string& text) override {
        calls_++;

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        if (!fail_marker.empty() && text.find(fail_marker) != std::string::npos) {
            failures_++;
            if (permanent) {
                throw ExtractionError("scripted permanent failure");
            }
            throw TransientExtractionError("scripted outage");
        }

        if (!flaky_marker.empty() && text.find(flaky_marker) != std::string::npos) {
            std::lock_guard<std::mutex> lock(mutex_);
            int& seen = attempts_[text];
            if (seen++ < flaky_failures) {
                failures_++;
                throw TransientExtractionError("scripted rate limit (HTTP 429)");
            }
        }

        return inner_->extract(text);
    }

    std::string name() const override { return "scripted"; }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    int calls() const { return calls_.load(); }
    int failures() const { return failures_.load(); }

    std::string fail_marker;
    bool permanent = false;
    std::string flaky_marker;
    int flaky_failures = 0;

private:
    std::shared_ptr<Extractor> inner_;
    std::chrono::milliseconds delay_{0};
    std::atomic<int> calls_{0};
    std::atomic<int> failures_{0};
    std::mutex mutex_;
    std::map<std::string, int> attempts_;
};

// ==========================================
// Graph store double
// ==========================================

/**
 * @brief InMemoryGraphStore whose next N writes throw GraphWriteError
 */
class FlakyGraphStore : public InMemoryGraphStore {
public:
    void upsert_node(const GraphNode& node) override {
        maybe_fail("node " + node.id);
        node_writes_++;
        InMemoryGraphStore::upsert_node(node);
    }

    std::string upsert_edge(
        const std::string& from,
        const std::string& to,
        const std::string& predicate,
        const std::map<std::string, std::string>& attributes
    ) override {
        maybe_fail("edge " + from + " -> " + to);
        edge_writes_++;
        return InMemoryGraphStore::upsert_edge(from, to, predicate, attributes);
    }

    void fail_next(int writes) { fail_remaining_ = writes; }

    int node_writes() const { return node_writes_.load(); }
    int edge_writes() const { return edge_writes_.load(); }

private:
    void maybe_fail(const std::string& what) {
        if (fail_remaining_.load() > 0) {
            fail_remaining_--;
            throw GraphWriteError("injected failure writing " + what);
        }
    }

    std::atomic<int> fail_remaining_{0};
    std::atomic<int> node_writes_{0};
    std::atomic<int> edge_writes_{0};
};

} // namespace test
} // namespace canon
