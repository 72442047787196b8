#include "registry/category_registry.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

namespace doubleblind {

void CategoryRegistry::register_category(const std::string& tag, PrimitiveType output_type,
                                         SynthesisStrategy strategy, bool overwrite) {
    if (tag.empty()) {
        throw std::invalid_argument("Category tag must not be empty");
    }
    if (!strategy) {
        throw std::invalid_argument(std::format("Category '{}' has no strategy", tag));
    }

    auto spec = std::make_shared<CategorySpec>();
    spec->tag = tag;
    spec->output_type = output_type;
    spec->strategy = std::move(strategy);

    std::unique_lock lock(mutex_);
    const bool taken = categories_.contains(tag) || aliases_.contains(tag);
    if (taken && !overwrite) {
        throw DuplicateCategoryError(std::format("Category '{}' is already registered", tag));
    }
    aliases_.erase(tag);
    categories_[tag] = std::move(spec);
}

void CategoryRegistry::register_alias(const std::string& alias, const std::string& target,
                                      bool overwrite) {
    if (alias.empty()) {
        throw std::invalid_argument("Category alias must not be empty");
    }

    std::unique_lock lock(mutex_);

    // Chase target aliases so every alias points at a canonical tag
    std::string canonical = target;
    if (const auto it = aliases_.find(target); it != aliases_.end()) {
        canonical = it->second;
    }
    if (!categories_.contains(canonical)) {
        throw UnknownCategoryError(
            std::format("Cannot alias '{}' to unknown category '{}'", alias, target));
    }

    const bool taken = categories_.contains(alias) || aliases_.contains(alias);
    if (taken && !overwrite) {
        throw DuplicateCategoryError(std::format("Category '{}' is already registered", alias));
    }
    if (alias == canonical) {
        return;
    }
    categories_.erase(alias);
    aliases_[alias] = std::move(canonical);
}

std::shared_ptr<const CategorySpec> CategoryRegistry::resolve(std::string_view tag) const {
    std::shared_lock lock(mutex_);
    std::string key(tag);
    if (const auto alias = aliases_.find(key); alias != aliases_.end()) {
        key = alias->second;
    }
    const auto it = categories_.find(key);
    if (it == categories_.end()) {
        throw UnknownCategoryError(std::format("Unknown PII category '{}'", tag));
    }
    return it->second;
}

bool CategoryRegistry::contains(std::string_view tag) const {
    std::shared_lock lock(mutex_);
    const std::string key(tag);
    return categories_.contains(key) || aliases_.contains(key);
}

size_t CategoryRegistry::size() const {
    std::shared_lock lock(mutex_);
    return categories_.size() + aliases_.size();
}

std::vector<std::string> CategoryRegistry::tags() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(categories_.size() + aliases_.size());
        for (const auto& [tag, spec] : categories_) result.push_back(tag);
        for (const auto& [alias, target] : aliases_) result.push_back(alias);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace doubleblind
