#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace doubleblind {

using Rng = std::mt19937_64;

/**
 * @brief Inputs handed to a synthesis strategy.
 *
 * `original` is only set for format-preserving use; strategies must not
 * echo it back. `rng` is seeded per (run, category, original, attempt).
 * `attempt` > 0 means every earlier candidate for this original collided
 * with a value already issued; strategies with small vocabularies widen
 * their output space from then on.
 */
struct SynthesisContext {
    std::string_view category;
    std::string_view locale;
    const Scalar* original = nullptr;
    Rng& rng;
    uint32_t attempt = 0;
};

using SynthesisStrategy = std::function<Scalar(SynthesisContext&)>;

struct CategorySpec {
    std::string tag;                    // Canonical tag (aliases resolve to it)
    PrimitiveType output_type = PrimitiveType::STRING;
    SynthesisStrategy strategy;
};

/**
 * @brief Category tag -> synthesis strategy and expected output type.
 *
 * Populated at startup and read concurrently by scrub sessions.
 * Registration while sessions are traversing is unsupported.
 */
class CategoryRegistry {
public:
    CategoryRegistry() = default;

    CategoryRegistry(const CategoryRegistry&) = delete;
    CategoryRegistry& operator=(const CategoryRegistry&) = delete;

    /**
     * @brief Register a category
     * @throws DuplicateCategoryError if the tag (or an alias of that name)
     *         exists and overwrite is false
     * @throws std::invalid_argument on an empty tag or missing strategy
     */
    void register_category(const std::string& tag, PrimitiveType output_type,
                           SynthesisStrategy strategy, bool overwrite = false);

    /**
     * @brief Make `alias` resolve to the category registered as `target`
     * @throws UnknownCategoryError if target is not registered
     * @throws DuplicateCategoryError if alias is taken and overwrite is false
     */
    void register_alias(const std::string& alias, const std::string& target,
                        bool overwrite = false);

    /**
     * @brief Resolve a tag (or alias) to its category spec
     * @throws UnknownCategoryError if unregistered
     */
    [[nodiscard]] std::shared_ptr<const CategorySpec> resolve(std::string_view tag) const;

    [[nodiscard]] bool contains(std::string_view tag) const;
    [[nodiscard]] size_t size() const;

    /// Registered tags and aliases, sorted
    [[nodiscard]] std::vector<std::string> tags() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const CategorySpec>> categories_;
    std::unordered_map<std::string, std::string> aliases_;
};

} // namespace doubleblind
