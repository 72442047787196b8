#include "schema/schema_registry.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace doubleblind {

void SchemaRegistry::add(RecordSchema schema) {
    if (schema.name.empty()) {
        throw std::invalid_argument("Record schema name must not be empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto& field : schema.fields) {
        if (field.name.empty()) {
            throw std::invalid_argument(
                std::format("Record schema '{}' has a field with an empty name", schema.name));
        }
        if (!seen.insert(field.name).second) {
            throw std::invalid_argument(
                std::format("Record schema '{}' declares field '{}' twice", schema.name, field.name));
        }
    }

    auto name = schema.name;
    auto shared = std::make_shared<const RecordSchema>(std::move(schema));

    std::unique_lock lock(mutex_);
    if (!schemas_.emplace(name, std::move(shared)).second) {
        throw std::invalid_argument(std::format("Record schema '{}' is already registered", name));
    }
}

std::shared_ptr<const RecordSchema> SchemaRegistry::describe(std::string_view record_type) const {
    std::shared_lock lock(mutex_);
    const auto it = schemas_.find(std::string(record_type));
    if (it == schemas_.end()) return nullptr;
    return it->second;
}

bool SchemaRegistry::contains(std::string_view record_type) const {
    std::shared_lock lock(mutex_);
    return schemas_.contains(std::string(record_type));
}

size_t SchemaRegistry::size() const {
    std::shared_lock lock(mutex_);
    return schemas_.size();
}

std::vector<std::string> SchemaRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(schemas_.size());
        for (const auto& [name, schema] : schemas_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace doubleblind
