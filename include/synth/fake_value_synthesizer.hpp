#pragma once

#include "core/types.hpp"
#include "registry/category_registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace doubleblind {

/**
 * @brief Runs registry strategies with a reproducible random engine.
 *
 * Every call seeds a fresh engine from SHA-256(run seed, category, locale,
 * original, attempt), so a (category, original) pair synthesizes the same
 * candidate regardless of thread or visiting order. Without a configured
 * seed, one is drawn from std::random_device at construction (one per run).
 */
class FakeValueSynthesizer {
public:
    struct Config {
        std::optional<uint64_t> seed;
        std::string default_locale = "en_US";
    };

    explicit FakeValueSynthesizer(std::shared_ptr<const CategoryRegistry> registry);
    FakeValueSynthesizer(std::shared_ptr<const CategoryRegistry> registry, Config config);

    /**
     * @brief Produce a synthetic value for a category
     * @param locale Empty selects the default locale
     * @param original Only consulted by format-preserving strategies
     * @param attempt Collision retry counter (changes the candidate)
     * @throws UnknownCategoryError if the category is not registered
     * @throws TypeMismatchError if the strategy returns the wrong primitive type
     */
    [[nodiscard]] Scalar synthesize(std::string_view category, std::string_view locale,
                                    const Scalar* original = nullptr,
                                    uint32_t attempt = 0) const;

    /// @throws UnknownCategoryError
    [[nodiscard]] PrimitiveType output_type(std::string_view category) const;

    [[nodiscard]] uint64_t seed() const { return seed_; }
    [[nodiscard]] bool seeded_explicitly() const { return seeded_explicitly_; }
    [[nodiscard]] const std::string& default_locale() const { return default_locale_; }
    [[nodiscard]] const CategoryRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const CategoryRegistry> registry_;
    uint64_t seed_;
    bool seeded_explicitly_;
    std::string default_locale_;
};

} // namespace doubleblind
