#pragma once

#include "core/types.hpp"
#include "schema/schema_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace doubleblind {

enum class MatchKind { EXACT, PREFIX, SUFFIX, CONTAINS };

[[nodiscard]] std::optional<MatchKind> parse_match_kind(std::string_view text);

struct NamePattern {
    MatchKind match = MatchKind::EXACT;
    std::string pattern;        // Compared case-insensitively
    std::string category;
};

struct Classification {
    enum class Source { NONE, OVERRIDE, DESCRIPTOR, HEURISTIC };

    std::optional<std::string> category;
    std::optional<std::string> locale;      // Descriptor locale override, if any
    Source source = Source::NONE;

    [[nodiscard]] bool sensitive() const { return category.has_value(); }
};

[[nodiscard]] std::string_view classification_source_to_string(Classification::Source source);

/**
 * @brief Decides, per record field, whether it holds PII and which category.
 *
 * Resolution order:
 * 1. Per-call override map ("Type.field" before "field")
 * 2. Category declared on the field descriptor
 * 3. Field-name heuristic (exact match first, then prefix/suffix/contains
 *    patterns in declaration order). Best effort only: it guesses from the
 *    name, never from the data, and only runs when nothing was declared.
 */
class FieldClassifier {
public:
    struct Config {
        bool heuristics_enabled = true;
        std::vector<NamePattern> patterns = default_patterns();
    };

    explicit FieldClassifier(std::shared_ptr<const ISchemaProvider> schemas);
    FieldClassifier(std::shared_ptr<const ISchemaProvider> schemas, Config config);

    /**
     * @brief Classify a field of a record type (descriptor resolved via the schema provider)
     */
    [[nodiscard]] Classification classify(std::string_view record_type,
                                          std::string_view field_name,
                                          const ClassificationOverrides* overrides = nullptr) const;

    /**
     * @brief Classify with an already resolved descriptor (nullptr if the
     * field is not declared)
     */
    [[nodiscard]] Classification classify(std::string_view record_type,
                                          std::string_view field_name,
                                          const FieldDescriptor* descriptor,
                                          const ClassificationOverrides* overrides) const;

    /// Heuristic step alone
    [[nodiscard]] std::optional<std::string> classify_by_name(std::string_view field_name) const;

    [[nodiscard]] const ISchemaProvider& schemas() const { return *schemas_; }
    [[nodiscard]] bool heuristics_enabled() const { return config_.heuristics_enabled; }

    [[nodiscard]] static std::vector<NamePattern> default_patterns();

private:
    std::shared_ptr<const ISchemaProvider> schemas_;
    Config config_;
    std::vector<NamePattern> exact_;
    std::vector<NamePattern> partial_;
};

} // namespace doubleblind
