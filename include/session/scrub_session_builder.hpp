#pragma once

#include "cache/consistency_cache.hpp"
#include "classifier/field_classifier.hpp"
#include "config/config_loader.hpp"
#include "engine/traversal_engine.hpp"
#include "registry/category_registry.hpp"
#include "schema/schema_registry.hpp"
#include "session/scrub_session.hpp"
#include "synth/fake_data_provider.hpp"
#include "synth/fake_value_synthesizer.hpp"

#include <memory>
#include <optional>

namespace doubleblind {

/**
 * @brief Everything a ScrubSession is assembled from.
 *
 * Optional members (nullptr) are defaulted by the builder.
 */
struct ScrubSessionComponents {
    std::shared_ptr<const CategoryRegistry> registry;           // default: built-in categories
    std::shared_ptr<const IFakeDataProvider> fake_data;         // only used for the default registry
    std::shared_ptr<const ISchemaProvider> schemas;             // default: empty SchemaRegistry
    std::shared_ptr<const FieldClassifier> classifier;          // default: built from schemas
    std::shared_ptr<ConsistencyCache> shared_cache;             // forces a persistent session

    FieldClassifier::Config classifier_config;
    FakeValueSynthesizer::Config synthesizer_config;
    TraversalEngine::Config traversal_config;
    ScrubSession::Config session_config;
};

/**
 * @brief Builder pattern for ScrubSession construction.
 *
 * Usage:
 *   auto session = ScrubSessionBuilder()
 *       .with_schemas(schemas)
 *       .with_seed(42)
 *       .build();
 *
 *   auto loaded = ConfigLoader::load_from_file("doubleblind.toml");
 *   auto session = ScrubSessionBuilder::from_config(loaded.config).build();
 */
class ScrubSessionBuilder {
public:
    ScrubSessionBuilder& with_registry(std::shared_ptr<const CategoryRegistry> p)       { c_.registry = std::move(p); return *this; }
    ScrubSessionBuilder& with_fake_data_provider(std::shared_ptr<const IFakeDataProvider> p) { c_.fake_data = std::move(p); return *this; }
    ScrubSessionBuilder& with_schemas(std::shared_ptr<const ISchemaProvider> p)         { c_.schemas = std::move(p); return *this; }
    ScrubSessionBuilder& with_classifier(std::shared_ptr<const FieldClassifier> p)      { c_.classifier = std::move(p); return *this; }
    ScrubSessionBuilder& with_cache(std::shared_ptr<ConsistencyCache> p)                { c_.shared_cache = std::move(p); return *this; }
    ScrubSessionBuilder& with_classifier_config(FieldClassifier::Config cfg)            { c_.classifier_config = std::move(cfg); return *this; }
    ScrubSessionBuilder& with_synthesizer_config(FakeValueSynthesizer::Config cfg)      { c_.synthesizer_config = std::move(cfg); return *this; }
    ScrubSessionBuilder& with_traversal_config(TraversalEngine::Config cfg)             { c_.traversal_config = cfg; return *this; }
    ScrubSessionBuilder& with_config(ScrubSession::Config cfg)                          { c_.session_config = std::move(cfg); return *this; }
    ScrubSessionBuilder& with_seed(uint64_t seed)                                       { c_.synthesizer_config.seed = seed; return *this; }
    ScrubSessionBuilder& with_mode(ScrubSession::Mode mode)                             { c_.session_config.mode = mode; return *this; }

    /**
     * @brief Builder preloaded from a validated configuration
     *
     * Applies the configured log level as a side effect.
     * @throws std::invalid_argument if the config does not pass validation
     */
    [[nodiscard]] static ScrubSessionBuilder from_config(const DoubleblindConfig& config);

    /**
     * @brief Build the session from accumulated components.
     * @throws std::invalid_argument on inconsistent components
     */
    [[nodiscard]] std::shared_ptr<ScrubSession> build();

    [[nodiscard]] const ScrubSessionComponents& components() const { return c_; }

private:
    ScrubSessionComponents c_;
};

} // namespace doubleblind
