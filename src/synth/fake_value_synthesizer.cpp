#include "synth/fake_value_synthesizer.hpp"
#include "core/digest.hpp"
#include "core/error.hpp"

#include <format>
#include <random>
#include <stdexcept>

namespace doubleblind {

namespace {

uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // anonymous namespace

FakeValueSynthesizer::FakeValueSynthesizer(std::shared_ptr<const CategoryRegistry> registry)
    : FakeValueSynthesizer(std::move(registry), Config{}) {}

FakeValueSynthesizer::FakeValueSynthesizer(std::shared_ptr<const CategoryRegistry> registry,
                                           Config config)
    : registry_(std::move(registry)),
      seed_(config.seed.value_or(0)),
      seeded_explicitly_(config.seed.has_value()),
      default_locale_(std::move(config.default_locale)) {
    if (!registry_) {
        throw std::invalid_argument("FakeValueSynthesizer requires a category registry");
    }
    if (!seeded_explicitly_) {
        seed_ = random_seed();
    }
    if (default_locale_.empty()) {
        default_locale_ = "en_US";
    }
}

Scalar FakeValueSynthesizer::synthesize(std::string_view category, std::string_view locale,
                                        const Scalar* original, uint32_t attempt) const {
    const auto spec = registry_->resolve(category);
    const std::string_view effective_locale = locale.empty()
        ? std::string_view(default_locale_) : locale;

    const std::string original_key = original
        ? Digest::value_key(spec->tag, *original)
        : std::string("-");
    const uint64_t engine_seed = Digest::seed_from(std::format(
        "{}|{}|{}|{}|{}", seed_, spec->tag, effective_locale, original_key, attempt));

    Rng rng(engine_seed);
    SynthesisContext ctx{spec->tag, effective_locale, original, rng, attempt};
    Scalar value = spec->strategy(ctx);

    const PrimitiveType actual = primitive_type_of(value);
    if (actual != spec->output_type) {
        throw TypeMismatchError(std::format(
            "Category '{}' must synthesize {} but strategy returned {}",
            category, primitive_type_to_string(spec->output_type),
            primitive_type_to_string(actual)));
    }
    return value;
}

PrimitiveType FakeValueSynthesizer::output_type(std::string_view category) const {
    return registry_->resolve(category)->output_type;
}

} // namespace doubleblind
