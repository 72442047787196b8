#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/node.hpp"
#include "core/types.hpp"

#include <stdexcept>
#include <type_traits>
#include <string>

using namespace doubleblind;

// ============================================================================
// Date
// ============================================================================

TEST_CASE("Date parses ISO dates and rejects invalid ones", "[types]") {
    const auto d = Date::parse("1984-02-29");
    REQUIRE(d.has_value());
    CHECK(d->year == 1984);
    CHECK(d->month == 2);
    CHECK(d->day == 29);
    CHECK(d->to_string() == "1984-02-29");

    CHECK_FALSE(Date::parse("1983-02-29").has_value());  // Not a leap year
    CHECK_FALSE(Date::parse("1900-02-29").has_value());
    CHECK(Date::parse("2000-02-29").has_value());
    CHECK_FALSE(Date::parse("2020-13-01").has_value());
    CHECK_FALSE(Date::parse("2020-04-31").has_value());
    CHECK_FALSE(Date::parse("2020-4-1").has_value());
    CHECK_FALSE(Date::parse("not-a-date").has_value());
}

// ============================================================================
// Scalars and value types
// ============================================================================

TEST_CASE("Primitive type of each scalar alternative", "[types]") {
    CHECK(primitive_type_of(Scalar{}) == PrimitiveType::NULL_VALUE);
    CHECK(primitive_type_of(Scalar{true}) == PrimitiveType::BOOLEAN);
    CHECK(primitive_type_of(Scalar{int64_t{7}}) == PrimitiveType::INTEGER);
    CHECK(primitive_type_of(Scalar{1.5}) == PrimitiveType::FLOAT);
    CHECK(primitive_type_of(Scalar{std::string("x")}) == PrimitiveType::STRING);
    CHECK(primitive_type_of(Scalar{Date{2001, 9, 3}}) == PrimitiveType::DATE);
}

TEST_CASE("Canonical scalar text", "[types]") {
    CHECK(scalar_to_string(Scalar{}) == "null");
    CHECK(scalar_to_string(Scalar{false}) == "false");
    CHECK(scalar_to_string(Scalar{int64_t{-42}}) == "-42");
    CHECK(scalar_to_string(Scalar{std::string("a b")}) == "a b");
    CHECK(scalar_to_string(Scalar{Date{2001, 9, 3}}) == "2001-09-03");
}

TEST_CASE("Value type names and aliases", "[types]") {
    CHECK(parse_value_type("string") == ValueType::STRING);
    CHECK(parse_value_type("STR") == ValueType::STRING);
    CHECK(parse_value_type("int") == ValueType::INTEGER);
    CHECK(parse_value_type("list") == ValueType::SEQUENCE);
    CHECK(parse_value_type("map") == ValueType::MAPPING);
    CHECK(parse_value_type("struct") == ValueType::RECORD);
    CHECK_FALSE(parse_value_type("uuid").has_value());

    for (const auto t : {ValueType::ANY, ValueType::DATE, ValueType::RECORD}) {
        CHECK(parse_value_type(value_type_to_string(t)) == t);
    }
}

TEST_CASE("RecordSchema field lookup", "[types]") {
    RecordSchema schema;
    schema.name = "User";
    schema.fields.emplace_back("email", ValueType::STRING, "email");
    schema.fields.emplace_back("note", ValueType::STRING);

    const auto* email = schema.find("email");
    REQUIRE(email != nullptr);
    CHECK(email->category == "email");
    CHECK_FALSE(schema.find("note")->category.has_value());
    CHECK(schema.find("missing") == nullptr);
}

TEST_CASE("AuditSummary merge adds counts", "[types]") {
    AuditSummary a;
    a.substitutions["email"] = 2;
    a.records_visited = 3;
    a.cache_hits = 1;

    AuditSummary b;
    b.substitutions["email"] = 1;
    b.substitutions["ssn"] = 4;
    b.records_visited = 2;

    a.merge(b);
    CHECK(a.substitutions["email"] == 3);
    CHECK(a.substitutions["ssn"] == 4);
    CHECK(a.total_substitutions() == 7);
    CHECK(a.records_visited == 5);
    CHECK(a.cache_hits == 1);
}

// ============================================================================
// Node
// ============================================================================

TEST_CASE("Node builders and accessors", "[node]") {
    auto user = Node::record("User");
    user->set("email", Node::scalar(std::string("a@b.com")));
    user->set("age", Node::scalar(int64_t{30}));
    user->set("email", Node::scalar(std::string("c@d.com")));  // Replaces in place

    CHECK(user->is_record());
    CHECK(user->record_type() == "User");
    REQUIRE(user->size() == 2);
    CHECK(user->entries()[0].first == "email");
    CHECK(std::get<std::string>(user->get("email")->value()) == "c@d.com");
    CHECK(user->get("missing") == nullptr);

    auto list = Node::sequence();
    list->append(user);
    list->append(Node::scalar(Scalar{}));
    CHECK(list->size() == 2);

    CHECK_THROWS_AS(list->set("x", Node::scalar(true)), std::logic_error);
    CHECK_THROWS_AS(user->append(Node::scalar(true)), std::logic_error);
    CHECK_THROWS_AS(Node::scalar(true)->append(list), std::logic_error);
}

TEST_CASE("Nodes are only built through the factories", "[node]") {
    static_assert(!std::is_constructible_v<Node, Node::Kind>);
    static_assert(!std::is_default_constructible_v<Node>);

    const auto node = Node::record("User", {{"f", Node::scalar(int64_t{1})}});
    CHECK(node.use_count() == 1);
    CHECK(node->get("f").use_count() == 2);     // Entry plus the returned copy
}

TEST_CASE("deep_equal compares structure and values", "[node]") {
    const auto make = [](const std::string& email) {
        return Node::sequence({
            Node::record("User", {
                {"email", Node::scalar(email)},
                {"tags", Node::mapping({{"k", Node::scalar(int64_t{1})}})},
            }),
        });
    };

    CHECK(deep_equal(*make("a@b.com"), *make("a@b.com")));
    CHECK_FALSE(deep_equal(*make("a@b.com"), *make("x@b.com")));

    // Same entries, different record type
    const auto a = Node::record("A", {{"f", Node::scalar(true)}});
    const auto b = Node::record("B", {{"f", Node::scalar(true)}});
    CHECK_FALSE(deep_equal(*a, *b));

    // Record vs mapping with identical entries
    const auto m = Node::mapping({{"f", Node::scalar(true)}});
    CHECK_FALSE(deep_equal(*a, *m));
}

// ============================================================================
// Errors
// ============================================================================

namespace {

template<typename E>
void check_error(ErrorCode code, std::string_view name) {
    try {
        throw E("boom");
    } catch (const ScrubError& e) {
        CHECK(e.code() == code);
        CHECK(std::string(e.what()) == "boom");
        CHECK(error_code_to_string(e.code()) == name);
    }
}

} // namespace

TEST_CASE("Each scrub error carries its code", "[error]") {
    check_error<UnknownCategoryError>(ErrorCode::UNKNOWN_CATEGORY, "unknown_category");
    check_error<DuplicateCategoryError>(ErrorCode::DUPLICATE_CATEGORY, "duplicate_category");
    check_error<TypeMismatchError>(ErrorCode::TYPE_MISMATCH, "type_mismatch");
    check_error<SchemaMismatchError>(ErrorCode::SCHEMA_MISMATCH, "schema_mismatch");
    check_error<SynthesisExhaustedError>(ErrorCode::SYNTHESIS_EXHAUSTED, "synthesis_exhausted");
    check_error<MaxDepthExceededError>(ErrorCode::MAX_DEPTH_EXCEEDED, "max_depth_exceeded");
    check_error<CyclicGraphError>(ErrorCode::CYCLIC_GRAPH, "cyclic_graph");
    check_error<ScrubCancelledError>(ErrorCode::CANCELLED, "cancelled");
    check_error<SnapshotError>(ErrorCode::SNAPSHOT_ERROR, "snapshot_error");

    // Still catchable as the standard base
    CHECK_THROWS_AS(throw SnapshotError("disk full"), std::runtime_error);
}
