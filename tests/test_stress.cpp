#include <catch2/catch_test_macros.hpp>

#include "cache/consistency_cache.hpp"
#include "core/error.hpp"
#include "synth/builtin_categories.hpp"
#include "session/scrub_session_builder.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace doubleblind;

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::shared_ptr<SchemaRegistry> make_stress_schemas() {
    auto schemas = std::make_shared<SchemaRegistry>();
    schemas->add(SchemaBuilder("Customer")
        .field("email", ValueType::STRING, "email")
        .field("ssn", ValueType::STRING, "ssn")
        .field("name", ValueType::STRING, "full_name")
        .field("tier", ValueType::STRING)
        .nested("orders", ValueType::SEQUENCE, "Order")
        .build());
    schemas->add(SchemaBuilder("Order")
        .field("card", ValueType::STRING, "credit_card")
        .field("amount", ValueType::FLOAT)
        .build());
    return schemas;
}

std::string email_of(int i) { return "customer" + std::to_string(i) + "@example.com"; }
std::string ssn_of(int i) { return std::to_string(100 + i % 800) + "-11-" + std::to_string(1000 + i); }

NodePtr make_customer(int i) {
    return Node::record("Customer", {
        {"email", Node::scalar(email_of(i))},
        {"ssn", Node::scalar(ssn_of(i))},
        {"name", Node::scalar(std::string("Name ") + std::to_string(i % 50))},
        {"tier", Node::scalar(std::string(i % 2 ? "gold" : "silver"))},
        {"orders", Node::sequence({
            Node::record("Order", {
                {"card", Node::scalar(std::string("4111111111111111"))},
                {"amount", Node::scalar(12.5 * i)},
            }),
        })},
    });
}

const std::string& str_field(const NodePtr& record, std::string_view name) {
    return std::get<std::string>(record->get(name)->value());
}

std::shared_ptr<ScrubSession> make_persistent_session(uint64_t seed = 1234) {
    return ScrubSessionBuilder()
        .with_schemas(make_stress_schemas())
        .with_seed(seed)
        .with_mode(ScrubSession::Mode::PERSISTENT)
        .build();
}

} // namespace

// ============================================================================
// Concurrent sessions
// ============================================================================

TEST_CASE("Stress: 8 threads scrubbing overlapping customers stay consistent", "[stress][concurrency]") {
    auto session = make_persistent_session();

    constexpr int num_threads = 8;
    constexpr int num_customers = 300;

    // Per thread: original email index -> substitute seen
    std::vector<std::map<int, std::string>> seen(num_threads);
    std::atomic<int> failures{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            std::mt19937 rng(static_cast<uint32_t>(t));
            std::uniform_int_distribution<int> pick(0, num_customers - 1);
            for (int n = 0; n < 400; ++n) {
                const int i = pick(rng);
                try {
                    const auto result = session->scrub(make_customer(i));
                    seen[t][i] = str_field(result.output, "email");
                } catch (const std::exception&) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();

    REQUIRE(failures.load() == 0);

    // Same original -> same substitute across threads; distinct originals -> distinct substitutes
    std::map<int, std::string> merged;
    int mismatches = 0;
    for (const auto& per_thread : seen) {
        for (const auto& [i, email] : per_thread) {
            const auto [it, inserted] = merged.emplace(i, email);
            if (!inserted && it->second != email) ++mismatches;
        }
    }
    CHECK(mismatches == 0);

    std::set<std::string> distinct;
    for (const auto& [i, email] : merged) distinct.insert(email);
    CHECK(distinct.size() == merged.size());

    const auto totals = session->audit_totals();
    CHECK(totals.records_visited == static_cast<uint64_t>(num_threads * 400 * 2));
    CHECK(session->cache()->stats().categories == 4);
}

TEST_CASE("Stress: batch of 2000 records across workers", "[stress][batch]") {
    auto session = ScrubSessionBuilder().with_schemas(make_stress_schemas()).with_seed(77).build();

    std::vector<NodePtr> inputs;
    inputs.reserve(2000);
    for (int i = 0; i < 2000; ++i) inputs.push_back(make_customer(i % 500));

    const auto start = std::chrono::steady_clock::now();
    const auto batch = session->scrub_batch(inputs, {}, 8);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(batch.outputs.size() == inputs.size());
    std::set<std::string> ssns;
    for (size_t i = 0; i < inputs.size(); ++i) {
        const auto& out = batch.outputs[i];
        REQUIRE(out->is_record());
        CHECK(str_field(out, "ssn") == str_field(batch.outputs[i % 500], "ssn"));
        CHECK(str_field(out, "tier") == str_field(inputs[i], "tier"));
        ssns.insert(str_field(out, "ssn"));
    }
    CHECK(ssns.size() == 500);

    // Every order card collapses to one substitute
    const auto& card = str_field(batch.outputs[0]->get("orders")->items()[0], "card");
    CHECK(card != "4111111111111111");
    CHECK(str_field(batch.outputs[1999]->get("orders")->items()[0], "card") == card);

    CHECK(batch.audit.records_visited == 4000);
    CHECK(batch.audit.substitutions.at("credit_card") == 2000);
    CHECK(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count() < 60);
}

TEST_CASE("Stress: 1000 distinct originals per built-in category in one session", "[stress][synth]") {
    const auto registry = make_default_registry();

    // One field per canonical category; aliases would only repeat them
    std::vector<std::shared_ptr<const CategorySpec>> specs;
    for (const auto& tag : registry->tags()) {
        auto spec = registry->resolve(tag);
        if (spec->tag == tag) specs.push_back(std::move(spec));
    }
    REQUIRE(specs.size() == 16);

    const auto field_type = [](PrimitiveType type) {
        switch (type) {
            case PrimitiveType::DATE:    return ValueType::DATE;
            case PrimitiveType::INTEGER: return ValueType::INTEGER;
            default:                     return ValueType::STRING;
        }
    };
    auto schemas = std::make_shared<SchemaRegistry>();
    SchemaBuilder everything("Everything");
    for (const auto& spec : specs) everything.field(spec->tag, field_type(spec->output_type), spec->tag);
    schemas->add(everything.build());

    // 100..1099: the three-digit ids alone nearly fill their digit range
    const auto original_of = [](const CategorySpec& spec, int i) -> Scalar {
        switch (spec.output_type) {
            case PrimitiveType::DATE:    return Date{1900 + i % 100, 1 + i / 100, 1};
            case PrimitiveType::INTEGER: return int64_t{100 + i};
            default:                     return std::format("{} {}", spec.tag, i);
        }
    };

    constexpr int num_records = 1000;
    for (const std::string locale : {"en_US", "de_DE", "fr_FR"}) {
        FakeValueSynthesizer::Config synth_cfg;
        synth_cfg.seed = 2024;
        synth_cfg.default_locale = locale;
        auto session = ScrubSessionBuilder()
            .with_schemas(schemas)
            .with_synthesizer_config(synth_cfg)
            .with_mode(ScrubSession::Mode::PERSISTENT)
            .build();

        std::map<std::string, std::set<std::string>> outputs;
        int failures = 0;
        for (int i = 0; i < num_records; ++i) {
            std::vector<Node::Entry> fields;
            for (const auto& spec : specs) fields.emplace_back(spec->tag, Node::scalar(original_of(*spec, i)));
            try {
                const auto out = session->scrub(Node::record("Everything", std::move(fields))).output;
                for (const auto& spec : specs) {
                    outputs[spec->tag].insert(scalar_to_string(out->get(spec->tag)->value()));
                }
            } catch (const SynthesisExhaustedError&) {
                ++failures;
            }
        }

        INFO("locale " << locale);
        REQUIRE(failures == 0);
        for (const auto& spec : specs) {
            INFO("category " << spec->tag);
            CHECK(outputs[spec->tag].size() == static_cast<size_t>(num_records));
        }
    }
}

TEST_CASE("Stress: shared cache across sessions with different seeds", "[stress][concurrency]") {
    auto cache = std::make_shared<ConsistencyCache>();
    constexpr int num_sessions = 4;

    std::vector<std::shared_ptr<ScrubSession>> sessions;
    for (int s = 0; s < num_sessions; ++s) {
        sessions.push_back(ScrubSessionBuilder()
            .with_schemas(make_stress_schemas())
            .with_seed(static_cast<uint64_t>(s))
            .with_cache(cache)
            .build());
    }

    std::vector<std::vector<std::string>> seen(num_sessions, std::vector<std::string>(100));
    std::vector<std::thread> threads;
    for (int s = 0; s < num_sessions; ++s) {
        threads.emplace_back([&, s] {
            for (int i = 0; i < 100; ++i) {
                seen[s][i] = str_field(sessions[s]->scrub(make_customer(i)).output, "ssn");
            }
        });
    }
    for (auto& th : threads) th.join();

    int mismatches = 0;
    for (int s = 1; s < num_sessions; ++s) {
        for (int i = 0; i < 100; ++i) {
            if (seen[s][i] != seen[0][i]) ++mismatches;
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE("Stress: cancelling a running batch", "[stress][batch]") {
    auto session = ScrubSessionBuilder().with_schemas(make_stress_schemas()).build();

    std::vector<NodePtr> inputs;
    for (int i = 0; i < 20000; ++i) inputs.push_back(make_customer(i));

    std::stop_source source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        source.request_stop();
    });

    bool cancelled = false;
    try {
        (void)session->scrub_batch(inputs, {}, 4, source.get_token());
    } catch (const ScrubCancelledError&) {
        cancelled = true;
    }
    canceller.join();

    // A fast machine may finish first; either way nothing is half-recorded
    if (cancelled) {
        CHECK(session->audit_totals().records_visited == 0);
    } else {
        CHECK(session->audit_totals().records_visited == 40000);
    }
}

// ============================================================================
// Edge cases
// ============================================================================

TEST_CASE("Edge: deeply nested graph within the bound", "[edge][engine]") {
    auto session = ScrubSessionBuilder()
        .with_schemas(make_stress_schemas())
        .with_traversal_config(TraversalEngine::Config{.max_depth = 600})
        .build();

    NodePtr node = make_customer(1);
    for (int i = 0; i < 500; ++i) node = Node::mapping({{"wrap", node}});

    const auto result = session->scrub(node);
    NodePtr inner = result.output;
    for (int i = 0; i < 500; ++i) inner = inner->get("wrap");
    CHECK(str_field(inner, "email") != email_of(1));

    for (int i = 0; i < 200; ++i) node = Node::sequence({node});
    CHECK_THROWS_AS(session->scrub(node), MaxDepthExceededError);
}

TEST_CASE("Edge: wide schema-less record", "[edge][engine]") {
    auto session = ScrubSessionBuilder().with_seed(5).build();

    std::vector<Node::Entry> fields;
    for (int i = 0; i < 5000; ++i) {
        fields.emplace_back("field_" + std::to_string(i), Node::scalar(int64_t{i}));
    }
    fields.emplace_back("email", Node::scalar(std::string("wide@example.com")));
    const auto input = Node::record("", std::move(fields));

    const auto result = session->scrub(input);
    CHECK(result.audit.total_substitutions() == 1);
    CHECK(result.output->get("field_4999") == input->get("field_4999"));
}

TEST_CASE("Edge: unicode originals", "[edge][engine]") {
    auto session = make_persistent_session();
    const auto input = Node::record("Customer", {
        {"email", Node::scalar(std::string("\xc3\xa9milie@exemple.fr"))},
        {"name", Node::scalar(std::string("\xe5\xbc\xa0\xe4\xbc\x9f"))},
    });
    const auto first = session->scrub(input).output;
    const auto second = session->scrub(input).output;
    CHECK(deep_equal(*first, *second));
    CHECK(str_field(first, "name") != "\xe5\xbc\xa0\xe4\xbc\x9f");
}
