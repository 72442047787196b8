#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "synth/builtin_categories.hpp"
#include "synth/fake_value_synthesizer.hpp"

#include <cctype>
#include <memory>
#include <string>

using namespace doubleblind;

namespace {

FakeValueSynthesizer seeded(uint64_t seed) {
    FakeValueSynthesizer::Config cfg;
    cfg.seed = seed;
    return FakeValueSynthesizer(make_default_registry(), cfg);
}

size_t count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (const char c : text) {
        const bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !in_word) ++words;
        in_word = !space;
    }
    return words;
}

} // namespace

TEST_CASE("Synthesizer returns the category's output type", "[synth]") {
    const auto synth = seeded(42);
    const Scalar original = std::string("ada@example.com");

    const Scalar email = synth.synthesize("email", "", &original);
    CHECK(std::holds_alternative<std::string>(email));
    CHECK(email != original);

    CHECK(std::holds_alternative<Date>(synth.synthesize("date_of_birth", "")));
    CHECK(std::holds_alternative<int64_t>(synth.synthesize("numeric_id", "")));
    CHECK(synth.output_type("name") == PrimitiveType::STRING);
}

TEST_CASE("Synthesizer is deterministic for a fixed seed", "[synth]") {
    const auto a = seeded(1234);
    const auto b = seeded(1234);
    const auto c = seeded(4321);
    const Scalar original = std::string("123-45-6789");

    CHECK(a.synthesize("ssn", "en_US", &original) == b.synthesize("ssn", "en_US", &original));
    CHECK(a.synthesize("ssn", "en_US", &original) == a.synthesize("ssn", "en_US", &original));

    // Another attempt, original or seed changes the candidate
    CHECK(a.synthesize("email", "", &original, 0) != a.synthesize("email", "", &original, 1));
    const Scalar other = std::string("987-65-4321");
    CHECK(a.synthesize("email", "", &original) != a.synthesize("email", "", &other));
    CHECK(a.synthesize("email", "", &original) != c.synthesize("email", "", &original));

    CHECK(a.seeded_explicitly());
    CHECK(a.seed() == 1234);
}

TEST_CASE("Synthesizer without a seed draws one per instance", "[synth]") {
    const FakeValueSynthesizer synth(make_default_registry());
    CHECK_FALSE(synth.seeded_explicitly());
    CHECK(synth.default_locale() == "en_US");
}

TEST_CASE("Synthesizer uses the default locale when none is given", "[synth]") {
    FakeValueSynthesizer::Config cfg;
    cfg.seed = 3;
    cfg.default_locale = "de_DE";
    const FakeValueSynthesizer synth(make_default_registry(), cfg);

    CHECK(std::get<std::string>(synth.synthesize("phone", "")).starts_with("+49 "));
    CHECK(std::get<std::string>(synth.synthesize("phone", "fr_FR")).starts_with("+33 "));
}

TEST_CASE("Synthesizer unknown category throws", "[synth]") {
    const auto synth = seeded(1);
    CHECK_THROWS_AS((void)synth.synthesize("passport", ""), UnknownCategoryError);
    CHECK_THROWS_AS((void)synth.output_type("passport"), UnknownCategoryError);
}

TEST_CASE("Synthesizer rejects a strategy returning the wrong type", "[synth]") {
    auto registry = std::make_shared<CategoryRegistry>();
    registry->register_category("badge", PrimitiveType::STRING,
        [](SynthesisContext&) -> Scalar { return int64_t{5}; });

    FakeValueSynthesizer::Config cfg;
    cfg.seed = 1;
    const FakeValueSynthesizer synth(registry, cfg);
    CHECK_THROWS_AS((void)synth.synthesize("badge", ""), TypeMismatchError);
}

TEST_CASE("Format-preserving categories keep the original's shape", "[synth]") {
    const auto synth = seeded(77);

    const Scalar note = std::string("call me back tomorrow  please");
    const Scalar fake_note = synth.synthesize("free_text", "", &note);
    CHECK(count_words(std::get<std::string>(fake_note)) == 5);

    const Scalar id = int64_t{4815162342};
    const Scalar fake_id = synth.synthesize("numeric_id", "", &id);
    CHECK(std::to_string(std::get<int64_t>(fake_id)).size() == 10);

    const Scalar negative_id = int64_t{-123};
    CHECK(std::to_string(std::get<int64_t>(synth.synthesize("numeric_id", "", &negative_id))).size() == 3);

    // No original: free text falls back to a sentence, ids to eight digits
    CHECK(std::get<std::string>(synth.synthesize("free_text", "")).ends_with("."));
    CHECK(std::to_string(std::get<int64_t>(synth.synthesize("numeric_id", ""))).size() == 8);
}

TEST_CASE("Retries widen small-vocabulary categories", "[synth]") {
    const auto synth = seeded(21);
    const auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    const Scalar original = std::string("Margaret");

    // First attempt: a bare vocabulary word; later attempts carry a number
    const auto bare = std::get<std::string>(synth.synthesize("first_name", "", &original, 0));
    CHECK_FALSE(is_digit(bare.back()));
    const auto widened = std::get<std::string>(synth.synthesize("first_name", "", &original, 1));
    CHECK(is_digit(widened.back()));
    CHECK_FALSE(is_digit(widened.front()));

    const Scalar town = std::string("Springfield");
    const auto city = std::get<std::string>(synth.synthesize("city", "de_DE", &town, 2));
    REQUIRE(city.find_last_of(' ') != std::string::npos);
    CHECK(is_digit(city.back()));

    // Word count survives the widening
    const Scalar word = std::string("confidential");
    const auto text = std::get<std::string>(synth.synthesize("free_text", "", &word, 3));
    CHECK(count_words(text) == 1);
    CHECK(is_digit(text.back()));
}

TEST_CASE("Numeric ids grow a digit per retry from the second retry", "[synth]") {
    const auto synth = seeded(8);
    const auto digits_of = [&](const Scalar& original, uint32_t attempt) {
        return std::to_string(std::get<int64_t>(synth.synthesize("numeric_id", "", &original, attempt))).size();
    };

    const Scalar id = int64_t{7};
    CHECK(digits_of(id, 0) == 1);
    CHECK(digits_of(id, 1) == 1);
    CHECK(digits_of(id, 2) == 2);
    CHECK(digits_of(id, 5) == 5);

    // Capped at fifteen digits, which a JSON number still holds exactly
    const Scalar long_id = int64_t{12345678901234567};
    CHECK(digits_of(long_id, 0) == 15);
    CHECK(digits_of(long_id, 4) == 15);
}
