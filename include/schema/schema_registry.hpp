#pragma once

#include "core/types.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace doubleblind {

/**
 * @brief Schema collaborator: describe(record_type) -> ordered field descriptors.
 *
 * Returns nullptr for record types it does not know; such records are
 * scrubbed as schema-less (overrides and heuristics only).
 */
class ISchemaProvider {
public:
    virtual ~ISchemaProvider() = default;

    [[nodiscard]] virtual std::shared_ptr<const RecordSchema> describe(
        std::string_view record_type) const = 0;
};

/**
 * @brief In-memory schema provider.
 *
 * Schemas are immutable once added; lookups may run concurrently with
 * additions.
 */
class SchemaRegistry : public ISchemaProvider {
public:
    SchemaRegistry() = default;

    /**
     * @brief Register a record schema
     * @throws std::invalid_argument on empty/duplicate type name or
     *         empty/duplicate field names
     */
    void add(RecordSchema schema);

    [[nodiscard]] std::shared_ptr<const RecordSchema> describe(
        std::string_view record_type) const override;

    [[nodiscard]] bool contains(std::string_view record_type) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const RecordSchema>> schemas_;
};

/**
 * @brief Fluent helper for declaring a record schema in code.
 *
 *   auto user = SchemaBuilder("User")
 *       .field("email", ValueType::STRING, "email")
 *       .field("note", ValueType::STRING)
 *       .build();
 */
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string name) { schema_.name = std::move(name); }

    SchemaBuilder& field(std::string name, ValueType type) {
        schema_.fields.emplace_back(std::move(name), type);
        return *this;
    }

    SchemaBuilder& field(std::string name, ValueType type, std::string category) {
        schema_.fields.emplace_back(std::move(name), type, std::move(category));
        return *this;
    }

    SchemaBuilder& localized_field(std::string name, ValueType type,
                                   std::string category, std::string locale) {
        schema_.fields.emplace_back(std::move(name), type, std::move(category), std::move(locale));
        return *this;
    }

    SchemaBuilder& nested(std::string name, ValueType type, std::string record_type) {
        FieldDescriptor fd(std::move(name), type);
        fd.record_type = std::move(record_type);
        schema_.fields.push_back(std::move(fd));
        return *this;
    }

    [[nodiscard]] RecordSchema build() const { return schema_; }

private:
    RecordSchema schema_;
};

} // namespace doubleblind
