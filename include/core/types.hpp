#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace doubleblind {

// ============================================================================
// Scalars
// ============================================================================

struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const Date&) const = default;

    [[nodiscard]] std::string to_string() const;

    /// Parse "YYYY-MM-DD". Returns nullopt on malformed or out-of-range input.
    [[nodiscard]] static std::optional<Date> parse(std::string_view text);
};

using Scalar = std::variant<std::monostate, bool, int64_t, double, std::string, Date>;

enum class PrimitiveType {
    NULL_VALUE,
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
    DATE
};

[[nodiscard]] PrimitiveType primitive_type_of(const Scalar& value);
[[nodiscard]] std::string_view primitive_type_to_string(PrimitiveType type);

/// Canonical text form (used for cache keys and JSON rendering of dates)
[[nodiscard]] std::string scalar_to_string(const Scalar& value);

// ============================================================================
// Schema metadata
// ============================================================================

/**
 * @brief Declared type of a record field (primitive or structural)
 */
enum class ValueType {
    ANY,
    NULL_VALUE,
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
    DATE,
    SEQUENCE,
    MAPPING,
    RECORD
};

[[nodiscard]] std::string_view value_type_to_string(ValueType type);
[[nodiscard]] std::optional<ValueType> parse_value_type(std::string_view text);

struct FieldDescriptor {
    std::string name;
    ValueType type = ValueType::ANY;
    std::optional<std::string> category;
    std::optional<std::string> locale;
    std::optional<std::string> record_type;   // Element record type for nested objects

    FieldDescriptor() = default;
    FieldDescriptor(std::string n, ValueType t,
                    std::optional<std::string> cat = std::nullopt,
                    std::optional<std::string> loc = std::nullopt)
        : name(std::move(n)), type(t), category(std::move(cat)), locale(std::move(loc)) {}
};

/**
 * @brief Ordered field descriptors of one record type. Immutable once
 * registered with a schema provider.
 */
struct RecordSchema {
    std::string name;
    std::vector<FieldDescriptor> fields;

    [[nodiscard]] const FieldDescriptor* find(std::string_view field_name) const;
};

// ============================================================================
// Classification
// ============================================================================

/**
 * @brief Per-call classification overrides.
 *
 * Keys are "RecordType.field" or bare "field" (any record type).
 * A nullopt value marks the field explicitly not sensitive.
 */
using ClassificationOverrides = std::unordered_map<std::string, std::optional<std::string>>;

// ============================================================================
// Audit
// ============================================================================

struct AuditSummary {
    std::map<std::string, uint64_t> substitutions;  // category -> count
    uint64_t records_visited = 0;
    uint64_t cache_hits = 0;

    [[nodiscard]] uint64_t total_substitutions() const {
        uint64_t total = 0;
        for (const auto& [category, count] : substitutions) total += count;
        return total;
    }

    void merge(const AuditSummary& other) {
        for (const auto& [category, count] : other.substitutions) {
            substitutions[category] += count;
        }
        records_visited += other.records_visited;
        cache_hits += other.cache_hits;
    }
};

} // namespace doubleblind
