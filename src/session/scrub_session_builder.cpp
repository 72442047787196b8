#include "session/scrub_session_builder.hpp"
#include "core/utils.hpp"
#include "synth/builtin_categories.hpp"

#include <format>
#include <stdexcept>

namespace doubleblind {

namespace {

RecordSchema to_record_schema(const SchemaConfig& schema) {
    RecordSchema out;
    out.name = schema.name;
    out.fields.reserve(schema.fields.size());
    for (const auto& field : schema.fields) {
        FieldDescriptor fd(field.name, parse_value_type(field.type).value_or(ValueType::ANY),
                           field.category, field.locale);
        fd.record_type = field.record;
        out.fields.push_back(std::move(fd));
    }
    return out;
}

} // anonymous namespace

ScrubSessionBuilder ScrubSessionBuilder::from_config(const DoubleblindConfig& config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        throw std::invalid_argument(std::format(
            "Invalid configuration ({} problems), first: {}", errors.size(), errors.front()));
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    ScrubSessionBuilder builder;
    auto& c = builder.c_;

    auto schemas = std::make_shared<SchemaRegistry>();
    for (const auto& schema : config.schemas) {
        schemas->add(to_record_schema(schema));
    }
    c.schemas = std::move(schemas);

    c.classifier_config.heuristics_enabled = config.classifier.heuristics;
    if (!config.classifier.default_patterns) {
        c.classifier_config.patterns.clear();
    }
    for (const auto& p : config.classifier.patterns) {
        c.classifier_config.patterns.push_back(
            {parse_match_kind(p.match).value_or(MatchKind::EXACT), p.pattern, p.category});
    }

    if (config.session.seed) {
        c.synthesizer_config.seed = static_cast<uint64_t>(*config.session.seed);
    }
    c.synthesizer_config.default_locale = config.session.locale;
    c.traversal_config.max_depth = static_cast<size_t>(config.session.max_depth);

    c.session_config.mode = config.session.mode == "persistent"
        ? ScrubSession::Mode::PERSISTENT : ScrubSession::Mode::EPHEMERAL;
    c.session_config.cache.max_retries = static_cast<uint32_t>(config.session.max_retries);
    c.session_config.snapshot_path = config.cache.snapshot_path;

    utils::log::debug(std::format("Session config loaded: {} schemas, {} extra name patterns",
        config.schemas.size(), config.classifier.patterns.size()));
    return builder;
}

std::shared_ptr<ScrubSession> ScrubSessionBuilder::build() {
    auto registry = c_.registry;
    if (!registry) {
        auto fresh = std::make_shared<CategoryRegistry>();
        register_builtin_categories(*fresh, c_.fake_data
            ? c_.fake_data : std::make_shared<BuiltinFakeDataProvider>());
        registry = std::move(fresh);
    }

    auto classifier = c_.classifier;
    if (!classifier) {
        auto schemas = c_.schemas ? c_.schemas : std::make_shared<SchemaRegistry>();
        classifier = std::make_shared<FieldClassifier>(std::move(schemas), c_.classifier_config);
    } else if (c_.schemas && &classifier->schemas() != c_.schemas.get()) {
        throw std::invalid_argument(
            "ScrubSessionBuilder: classifier and schemas refer to different schema providers");
    }

    auto synthesizer = std::make_shared<FakeValueSynthesizer>(std::move(registry),
                                                              c_.synthesizer_config);
    auto engine = std::make_shared<TraversalEngine>(std::move(classifier), std::move(synthesizer),
                                                    c_.traversal_config);
    return std::make_shared<ScrubSession>(std::move(engine), c_.session_config, c_.shared_cache);
}

} // namespace doubleblind
