#include "classifier/field_classifier.hpp"
#include "core/utils.hpp"

#include <stdexcept>

namespace doubleblind {

namespace {

bool matches(const NamePattern& p, const std::string& lower) {
    switch (p.match) {
        case MatchKind::EXACT:    return lower == p.pattern;
        case MatchKind::PREFIX:   return lower.starts_with(p.pattern);
        case MatchKind::SUFFIX:   return lower.ends_with(p.pattern);
        case MatchKind::CONTAINS: return lower.find(p.pattern) != std::string::npos;
    }
    return false;
}

const std::optional<std::string>* find_override(const ClassificationOverrides& overrides,
                                                std::string_view record_type,
                                                std::string_view field_name) {
    if (!record_type.empty()) {
        std::string qualified;
        qualified.reserve(record_type.size() + 1 + field_name.size());
        qualified.append(record_type).append(".").append(field_name);
        if (const auto it = overrides.find(qualified); it != overrides.end()) {
            return &it->second;
        }
    }
    if (const auto it = overrides.find(std::string(field_name)); it != overrides.end()) {
        return &it->second;
    }
    return nullptr;
}

} // anonymous namespace

std::optional<MatchKind> parse_match_kind(std::string_view text) {
    const std::string lower = utils::to_lower(std::string(text));
    if (lower == "exact") return MatchKind::EXACT;
    if (lower == "prefix") return MatchKind::PREFIX;
    if (lower == "suffix") return MatchKind::SUFFIX;
    if (lower == "contains") return MatchKind::CONTAINS;
    return std::nullopt;
}

std::string_view classification_source_to_string(Classification::Source source) {
    switch (source) {
        case Classification::Source::NONE:       return "none";
        case Classification::Source::OVERRIDE:   return "override";
        case Classification::Source::DESCRIPTOR: return "descriptor";
        case Classification::Source::HEURISTIC:  return "heuristic";
    }
    return "none";
}

FieldClassifier::FieldClassifier(std::shared_ptr<const ISchemaProvider> schemas)
    : FieldClassifier(std::move(schemas), Config{}) {}

FieldClassifier::FieldClassifier(std::shared_ptr<const ISchemaProvider> schemas, Config config)
    : schemas_(std::move(schemas)), config_(std::move(config)) {
    if (!schemas_) {
        throw std::invalid_argument("FieldClassifier requires a schema provider");
    }
    for (auto p : config_.patterns) {
        if (p.pattern.empty() || p.category.empty()) {
            throw std::invalid_argument("Field name pattern needs a pattern and a category");
        }
        p.pattern = utils::to_lower(p.pattern);
        if (p.match == MatchKind::EXACT) {
            exact_.push_back(std::move(p));
        } else {
            partial_.push_back(std::move(p));
        }
    }
}

std::vector<NamePattern> FieldClassifier::default_patterns() {
    std::vector<NamePattern> patterns;
    const auto exact = [&](std::string name, std::string category) {
        patterns.push_back({MatchKind::EXACT, std::move(name), std::move(category)});
    };
    const auto suffix = [&](std::string name, std::string category) {
        patterns.push_back({MatchKind::SUFFIX, std::move(name), std::move(category)});
    };

    exact("email", "email");
    exact("e_mail", "email");
    exact("mail", "email");
    exact("email_address", "email");

    exact("phone", "phone");
    exact("telephone", "phone");
    exact("mobile", "phone");
    exact("phone_number", "phone");

    exact("ssn", "ssn");
    exact("social_security", "ssn");
    exact("social_security_number", "ssn");

    exact("credit_card", "credit_card");
    exact("card_number", "credit_card");
    exact("cc_number", "credit_card");
    exact("creditcard", "credit_card");

    exact("first_name", "first_name");
    exact("firstname", "first_name");
    exact("given_name", "first_name");
    exact("last_name", "last_name");
    exact("lastname", "last_name");
    exact("surname", "last_name");
    exact("family_name", "last_name");
    exact("full_name", "full_name");

    exact("username", "username");
    exact("user_name", "username");
    exact("ip_address", "ip_address");
    exact("date_of_birth", "date_of_birth");
    exact("dob", "date_of_birth");
    exact("birth_date", "date_of_birth");
    exact("postcode", "postcode");
    exact("zip", "postcode");
    exact("zip_code", "postcode");
    exact("postal_code", "postcode");

    // Prefixed variants ("billing_email", "home_phone")
    suffix("_email", "email");
    suffix("_phone", "phone");
    suffix("_ssn", "ssn");
    suffix("_ip_address", "ip_address");

    return patterns;
}

std::optional<std::string> FieldClassifier::classify_by_name(std::string_view field_name) const {
    const std::string lower = utils::to_lower(std::string(field_name));

    for (const auto& p : exact_) {
        if (p.pattern == lower) return p.category;
    }
    for (const auto& p : partial_) {
        if (matches(p, lower)) return p.category;
    }
    return std::nullopt;
}

Classification FieldClassifier::classify(std::string_view record_type,
                                         std::string_view field_name,
                                         const ClassificationOverrides* overrides) const {
    std::shared_ptr<const RecordSchema> schema;
    if (!record_type.empty()) {
        schema = schemas_->describe(record_type);
    }
    const FieldDescriptor* descriptor = schema ? schema->find(field_name) : nullptr;
    return classify(record_type, field_name, descriptor, overrides);
}

Classification FieldClassifier::classify(std::string_view record_type,
                                         std::string_view field_name,
                                         const FieldDescriptor* descriptor,
                                         const ClassificationOverrides* overrides) const {
    Classification result;
    if (descriptor) {
        result.locale = descriptor->locale;
    }

    if (overrides) {
        if (const auto* entry = find_override(*overrides, record_type, field_name)) {
            result.category = *entry;
            result.source = Classification::Source::OVERRIDE;
            return result;
        }
    }

    if (descriptor) {
        if (descriptor->category) {
            result.category = descriptor->category;
            result.source = Classification::Source::DESCRIPTOR;
        }
        // A declared field without a category is not sensitive
        return result;
    }

    if (config_.heuristics_enabled) {
        if (auto category = classify_by_name(field_name)) {
            result.category = std::move(category);
            result.source = Classification::Source::HEURISTIC;
        }
    }
    return result;
}

} // namespace doubleblind
