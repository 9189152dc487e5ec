#include "resolution/normalizer.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"
#include <cctype>

namespace canon {

namespace {

const std::set<std::string> kHonorifics = {
    "mr", "mrs", "ms", "miss", "mx", "dr", "prof", "sir", "dame", "lord", "lady",
    "mme", "mlle", "m", "herr", "frau", "sen", "rep", "gov", "gen", "col", "capt"
};

const std::set<std::string> kLegalSuffixes = {
    "inc", "incorporated", "corp", "corporation", "co", "company", "ltd", "limited",
    "llc", "llp", "plc", "sa", "sas", "sarl", "gmbh", "ag", "nv", "bv", "spa", "srl"
};

const std::set<std::string> kArticles = {"the", "a", "an"};

// Strips tokens from the front while something would remain
void strip_leading(std::vector<std::string>& tokens, const std::set<std::string>& words) {
    size_t drop = 0;
    while (drop + 1 < tokens.size() && words.count(tokens[drop])) {
        ++drop;
    }
    tokens.erase(tokens.begin(), tokens.begin() + static_cast<long>(drop));
}

void strip_trailing(std::vector<std::string>& tokens, const std::set<std::string>& words) {
    while (tokens.size() > 1 && words.count(tokens.back())) {
        tokens.pop_back();
    }
}

bool is_alpha_token(const std::string& token) {
    for (char c : token) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return !token.empty();
}

std::string phonetic_code(const std::string& token) {
    return is_alpha_token(token) ? text::soundex(token) : token;
}

// Applies a rule to the cleaned tokens of a surface form
struct KeyVisitor {
    std::vector<std::string>& tokens;

    void operator()(const PersonRule& rule) const {
        strip_leading(tokens, rule.honorifics);
        strip_trailing(tokens, rule.suffixes);
    }

    void operator()(const OrganizationRule& rule) const {
        strip_leading(tokens, rule.leading_articles);
        strip_trailing(tokens, rule.legal_suffixes);
    }

    void operator()(const LocationRule& rule) const {
        strip_leading(tokens, rule.leading_articles);
        for (auto& token : tokens) {
            auto it = rule.abbreviations.find(token);
            if (it != rule.abbreviations.end()) {
                token = it->second;
            }
        }
    }

    void operator()(const GenericRule& rule) const {
        strip_leading(tokens, rule.leading_articles);
    }
};

struct BlockVisitor {
    const std::vector<std::string>& tokens;

    std::string operator()(const PersonRule&) const {
        return phonetic_code(tokens.back());
    }
    std::string operator()(const OrganizationRule&) const {
        return phonetic_code(tokens.front());
    }
    std::string operator()(const LocationRule&) const {
        return phonetic_code(tokens.front());
    }
    std::string operator()(const GenericRule&) const {
        return tokens.front();
    }
};

// Lowercased words of the context right before and right after the mention
std::pair<std::string, std::string> neighbour_words(const RawMention& mention) {
    std::string before;
    std::string after;
    if (mention.context.empty()) {
        return {before, after};
    }

    size_t pos = mention.context.find(mention.text);
    if (pos == std::string::npos) {
        return {before, after};
    }

    auto left = text::split_whitespace(CandidateNormalizer::clean(mention.context.substr(0, pos)));
    auto right = text::split_whitespace(
        CandidateNormalizer::clean(mention.context.substr(pos + mention.text.size())));
    if (!left.empty()) before = left.back();
    if (!right.empty()) after = right.front();
    return {before, after};
}

} // anonymous namespace

// ============================================================================
// Rule Table
// ============================================================================

std::map<EntityType, NormalizationRule> default_normalization_rules() {
    std::map<EntityType, NormalizationRule> rules;

    PersonRule person;
    person.honorifics = kHonorifics;
    person.suffixes = {"jr", "sr", "ii", "iii", "iv", "phd", "md", "esq"};
    rules[EntityType::Person] = person;

    OrganizationRule organization;
    organization.legal_suffixes = kLegalSuffixes;
    organization.leading_articles = kArticles;
    rules[EntityType::Organization] = organization;

    LocationRule location;
    location.leading_articles = kArticles;
    location.abbreviations = {
        {"st", "saint"}, {"ste", "sainte"}, {"mt", "mount"}, {"ft", "fort"}, {"pt", "port"}
    };
    rules[EntityType::Location] = location;

    return rules;
}

// ============================================================================
// HeuristicTypeInferrer
// ============================================================================

HeuristicTypeInferrer::HeuristicTypeInferrer()
    : legal_suffixes_(kLegalSuffixes),
      honorifics_(kHonorifics),
      person_words_before_({"ceo", "founder", "cofounder", "president", "chairman",
                            "chairwoman", "director", "minister", "senator", "professor"}),
      person_words_after_({"said", "says", "told", "added", "explained", "stated",
                           "argued", "wrote", "introduced"}) {}

EntityType HeuristicTypeInferrer::infer(const RawMention& mention) const {
    auto tokens = text::split_whitespace(CandidateNormalizer::clean(mention.text));
    if (tokens.empty()) {
        return EntityType::Other;
    }

    if (tokens.size() > 1 && legal_suffixes_.count(tokens.back())) {
        return EntityType::Organization;
    }
    if (tokens.size() > 1 && honorifics_.count(tokens.front())) {
        return EntityType::Person;
    }

    auto [before, after] = neighbour_words(mention);
    if (person_words_before_.count(before) || person_words_after_.count(after)) {
        return EntityType::Person;
    }

    return EntityType::Other;
}

// ============================================================================
// CandidateNormalizer
// ============================================================================

CandidateNormalizer::CandidateNormalizer(
    const NormalizerConfig& config,
    std::shared_ptr<TypeInferrer> inferrer
) : config_(config),
    inferrer_(std::move(inferrer)),
    rules_(default_normalization_rules()),
    generic_rule_(GenericRule{kArticles}) {
    if (!inferrer_) {
        inferrer_ = std::make_shared<HeuristicTypeInferrer>();
    }
}

std::string CandidateNormalizer::clean(const std::string& input) {
    std::string folded = text::fold(input);
    std::string out;
    out.reserve(folded.size());

    for (char c : folded) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x80 || std::isalnum(uc)) {
            out += c;
        } else if (c == '\'') {
            continue;   // "O'Brien" -> "obrien"
        } else {
            out += ' ';
        }
    }

    return text::join(text::split_whitespace(out), " ");
}

std::string CandidateNormalizer::normalize_key(const std::string& surface, EntityType type) const {
    std::string cleaned = clean(surface);
    auto tokens = text::split_whitespace(cleaned);
    if (tokens.empty()) {
        return "";
    }

    std::visit(KeyVisitor{tokens}, rule_for(type));

    std::string key = text::join(tokens, " ");
    return key.empty() ? cleaned : key;
}

BlockingKey CandidateNormalizer::blocking_key(const std::string& key, EntityType type) const {
    BlockingKey block;
    block.type = type;

    auto tokens = text::split_whitespace(key);
    if (!tokens.empty()) {
        block.code = std::visit(BlockVisitor{tokens}, rule_for(type));
    }
    return block;
}

EntityType CandidateNormalizer::resolve_type(const RawMention& mention) const {
    auto declared = parse_entity_label(mention.declared_type);
    if (declared.has_value() && *declared != EntityType::Unknown) {
        return *declared;
    }
    return inferrer_->infer(mention);
}

Candidate CandidateNormalizer::normalize(const RawMention& mention) const {
    if (text::trim(mention.text).empty()) {
        throw MalformedMentionError("Mention " + mention.mention_id + " has empty text");
    }
    if (!text::is_valid_utf8(mention.text)) {
        throw MalformedMentionError("Mention " + mention.mention_id + " is not valid UTF-8");
    }
    if (mention.end < mention.start) {
        throw MalformedMentionError(
            "Mention " + mention.mention_id + " has inverted offsets [" +
            std::to_string(mention.start) + ", " + std::to_string(mention.end) + ")");
    }
    size_t span = text::decode_utf8(mention.text).size();
    if (span > config_.max_span_chars) {
        throw MalformedMentionError(
            "Mention " + mention.mention_id + " spans " + std::to_string(span) +
            " characters (limit " + std::to_string(config_.max_span_chars) + ")");
    }

    Candidate candidate;
    candidate.type = resolve_type(mention);
    candidate.key = normalize_key(mention.text, candidate.type);
    if (candidate.key.empty()) {
        throw MalformedMentionError(
            "Mention " + mention.mention_id + " (\"" + mention.text + "\") is empty after cleaning");
    }

    candidate.tokens = text::split_whitespace(candidate.key);
    candidate.surface_form = mention.text;
    candidate.block = blocking_key(candidate.key, candidate.type);
    candidate.mention = mention;
    return candidate;
}

void CandidateNormalizer::set_rule(EntityType type, NormalizationRule rule) {
    rules_[type] = std::move(rule);
}

const NormalizationRule& CandidateNormalizer::rule_for(EntityType type) const {
    auto it = rules_.find(type);
    if (it == rules_.end()) {
        return generic_rule_;
    }
    return it->second;
}

} // namespace canon
