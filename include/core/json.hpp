#pragma once

#include "core/node.hpp"
#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace doubleblind {

class ISchemaProvider;

/**
 * @brief JSON bridge for object graphs, built on glz::json_t.
 *
 * Decoding maps objects to records (or mappings), arrays to sequences and
 * primitives to scalars. Numbers without a fractional part that fit in the
 * exactly representable double range (|n| <= 2^53) decode as integers; an
 * integer field holding a larger number is a parse error, and encoding an
 * integer outside that range throws encode_error. glz::json_t keeps
 * object keys sorted, so decoded entries follow key order, not document order.
 */
namespace json {

struct parse_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct encode_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DecodeOptions {
    bool objects_as_records = true;     // false: every object becomes a mapping
    std::string record_type;            // record type given to decoded objects
};

/**
 * @brief Decode JSON text into an object graph (schema-less)
 * @throws json::parse_error on malformed JSON
 */
[[nodiscard]] NodePtr decode(std::string_view text, const DecodeOptions& options = {});

/**
 * @brief Decode JSON text as a record of root_type.
 *
 * Nested objects become records of the field's element record type when
 * the descriptor names one, mappings when the field is declared as a
 * mapping, and anonymous records otherwise. Strings of DATE fields are
 * parsed as dates.
 *
 * @throws json::parse_error on malformed JSON, a non-object root, a bad date
 *         or an integer field beyond 2^53
 */
[[nodiscard]] NodePtr decode(std::string_view text, const ISchemaProvider& schemas,
                             const std::string& root_type);

/// Render a graph as JSON (records and mappings become objects, dates ISO strings)
/// @throws json::encode_error for an integer beyond 2^53 in magnitude
[[nodiscard]] std::string encode(const Node& node);

/// {"substitutions": {...}, "total": n, "records_visited": n, "cache_hits": n}
[[nodiscard]] std::string encode_audit(const AuditSummary& audit);

// ===== glz::json_t conversions =====

[[nodiscard]] glz::json_t to_json_value(const Node& node);
[[nodiscard]] glz::json_t scalar_to_json_value(const Scalar& value);
[[nodiscard]] Scalar scalar_from_json_value(const glz::json_t& value);

[[nodiscard]] std::string write(const glz::json_t& value);
[[nodiscard]] glz::json_t read(std::string_view text);

} // namespace json

} // namespace doubleblind
