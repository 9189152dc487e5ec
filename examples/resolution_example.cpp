#include "pipeline/ingestion_pipeline.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace canon;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Progress callback function
void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (stage == "Resolved chunk") {
        return;
    }
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

std::shared_ptr<Extractor> demo_gazetteer() {
    auto gazetteer = std::make_shared<GazetteerExtractor>();
    gazetteer->add_entry("Apple Inc.", "organization");
    gazetteer->add_entry("Apple Inc", "organization");
    gazetteer->add_entry("Apple", "organization");
    gazetteer->add_entry("Tim Cook", "person");
    gazetteer->add_entry("Timothy Cook", "person");
    gazetteer->add_entry("iPhone", "product");
    gazetteer->add_entry("Cupertino", "location");
    gazetteer->add_relation_rule({"person", " at ", "WORKS_AT", "organization"});
    gazetteer->add_relation_rule({"organization", " in ", "LOCATED_IN", "location"});
    gazetteer->add_relation_rule({"person", "called", "PRAISED", "product"});
    return gazetteer;
}

int main(int argc, char* argv[]) {
    print_separator("Entity Resolution into a Knowledge Graph");

    std::cout << "Mentions from several documents are merged into canonical entities:\n";
    std::cout << "  Text -> Chunks -> Extraction -> Normalization -> Merge -> Graph\n\n";

    // =========================================================================
    // Configuration
    // =========================================================================

    print_separator("Step 1: Configuration");

    PipelineConfig config;
    std::shared_ptr<Extractor> extractor;

    if (argc > 1 && std::string(argv[1]) == "--config") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " --config <config.json>\n";
            return 1;
        }
        std::cout << "Loading configuration from: " << argv[2] << "\n";
        try {
            config = PipelineConfig::from_json_file(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "Configuration error: " << e.what() << "\n";
            return 1;
        }
        std::cout << "Using extraction service at " << config.extractor.service_url << "\n";
    } else {
        config = PipelineConfig::from_environment();
        extractor = demo_gazetteer();
        std::cout << "Using the built-in gazetteer (pass --config to call an extraction service)\n";
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Configuration error: " << error << "\n";
        return 1;
    }

    std::cout << "✓ Configuration validated\n";
    std::cout << "  Thresholds: " << config.resolver.mid_threshold << " / "
              << config.resolver.high_threshold << "\n";
    std::cout << "  Output: " << config.output_directory << "\n";

    // =========================================================================
    // Ingest
    // =========================================================================

    print_separator("Step 2: Ingest Documents");

    IngestionPipeline pipeline(config, extractor);
    pipeline.set_progress_callback(progress_handler);

    if (!pipeline.is_extractor_available()) {
        std::cerr << "Extractor is not reachable\n";
        return 1;
    }

    const std::vector<std::pair<std::string, std::string>> documents = {
        {"apple-news",
         "Apple Inc. reported record quarterly revenue. Tim Cook said the results "
         "reflected strong demand. Apple Inc. also raised its dividend."},
        {"iphone-review",
         "The latest iPhone from Apple feels refined. Timothy Cook introduced it at "
         "Apple Inc headquarters. Tim Cook called it the best iPhone yet."},
        {"campus",
         "Apple Inc. opened a new office in Cupertino this spring."}
    };

    for (const auto& [id, text] : documents) {
        try {
            IngestionReport report = pipeline.ingest(id, text);
            report.print_summary();
        } catch (const PipelineError& e) {
            std::cerr << "Ingestion of " << id << " failed [" << error_kind_to_string(e.kind())
                      << "]: " << e.what() << "\n";
            return 1;
        }
    }

    // =========================================================================
    // Canonical entities
    // =========================================================================

    print_separator("Step 3: Canonical Entities");

    for (const auto& entity : pipeline.entities()) {
        std::cout << std::setw(4) << entity->id << "  " << std::left << std::setw(14)
                  << entity_type_to_string(entity->type) << std::setw(16) << entity->primary_label
                  << std::right << entity->mention_count() << " mentions\n";
        for (const auto& [alias, count] : entity->alias_frequency) {
            std::cout << "        " << alias << " x" << count << "\n";
        }
    }

    auto review = pipeline.review_queue();
    if (!review.empty()) {
        std::cout << "\nDecisions awaiting review:\n";
        for (const auto& decision : review) {
            std::cout << "  " << decision.surface_form << " -> entity " << decision.entity_id
                      << " (" << decision_tier_to_string(decision.tier) << ", score "
                      << std::fixed << std::setprecision(3) << decision.score << ")\n";
        }
    }

    // =========================================================================
    // Search
    // =========================================================================

    print_separator("Step 4: Hybrid Search");

    for (const std::string query : {"Tim Cook", "Apple", "Cupertino"}) {
        std::cout << "Query: " << query << "\n";
        for (const auto& hit : pipeline.search(query, 3, 1)) {
            std::cout << "  " << std::fixed << std::setprecision(3) << hit.score << "  "
                      << hit.node_id << "  " << hit.label << " (hops " << hit.hops << ")\n";
        }
        std::cout << "\n";
    }

    // =========================================================================
    // Results and Statistics
    // =========================================================================

    print_separator("Step 5: Results");

    pipeline.get_statistics().print_summary();

    try {
        pipeline.save_state();
    } catch (const std::exception& e) {
        std::cerr << "Failed to save state: " << e.what() << "\n";
        return 1;
    }
    std::cout << "✓ Saved entities, graph and merge decisions to: " << config.output_directory << "\n\n";

    return 0;
}
