#include "core/json.hpp"
#include "schema/schema_registry.hpp"

#include <cmath>
#include <format>
#include <vector>

namespace doubleblind::json {

namespace {

// 2^53: beyond this a double no longer represents every integer
constexpr double kMaxExactInteger = 9007199254740992.0;
constexpr size_t kMaxEncodeDepth = 512;

bool exact_in_double(int64_t n) {
    constexpr int64_t kLimit = int64_t{1} << 53;
    return n >= -kLimit && n <= kLimit;
}

bool integral_number(const glz::json_t& value) {
    if (!value.is_number()) return false;
    const double d = value.get<double>();
    return std::isfinite(d) && d == std::floor(d);
}

NodePtr decode_untyped(const glz::json_t& value, const DecodeOptions& options) {
    if (value.is_object()) {
        std::vector<Node::Entry> entries;
        const auto& obj = value.get_object();
        entries.reserve(obj.size());
        for (const auto& [key, child] : obj) {
            entries.emplace_back(key, decode_untyped(child, options));
        }
        if (options.objects_as_records) {
            return Node::record(options.record_type, std::move(entries));
        }
        return Node::mapping(std::move(entries));
    }
    if (value.is_array()) {
        std::vector<NodePtr> items;
        const auto& arr = value.get_array();
        items.reserve(arr.size());
        for (const auto& child : arr) {
            items.push_back(decode_untyped(child, options));
        }
        return Node::sequence(std::move(items));
    }
    return Node::scalar(scalar_from_json_value(value));
}

class TypedDecoder {
public:
    explicit TypedDecoder(const ISchemaProvider& schemas) : schemas_(schemas) {}

    NodePtr decode_record(const glz::json_t& value, const std::string& record_type) {
        if (!value.is_object()) {
            throw parse_error(std::format("Expected object for record '{}'", record_type));
        }
        const auto schema = schemas_.describe(record_type);

        std::vector<Node::Entry> fields;
        const auto& obj = value.get_object();
        fields.reserve(obj.size());
        for (const auto& [key, child] : obj) {
            const FieldDescriptor* fd = schema ? schema->find(key) : nullptr;
            fields.emplace_back(key, decode_field(child, fd, record_type));
        }
        return Node::record(record_type, std::move(fields));
    }

private:
    NodePtr decode_field(const glz::json_t& value, const FieldDescriptor* fd,
                         const std::string& owner) {
        if (value.is_object()) {
            if (fd && fd->type == ValueType::MAPPING) {
                std::vector<Node::Entry> entries;
                const auto& obj = value.get_object();
                entries.reserve(obj.size());
                for (const auto& [key, child] : obj) {
                    entries.emplace_back(key, decode_element(child, fd, owner));
                }
                return Node::mapping(std::move(entries));
            }
            return decode_record(value, fd && fd->record_type ? *fd->record_type : std::string{});
        }
        if (value.is_array()) {
            std::vector<NodePtr> items;
            const auto& arr = value.get_array();
            items.reserve(arr.size());
            for (const auto& child : arr) {
                items.push_back(decode_element(child, fd, owner));
            }
            return Node::sequence(std::move(items));
        }
        if (fd && fd->type == ValueType::DATE && value.is_string()) {
            const auto& text = value.get<std::string>();
            const auto date = Date::parse(text);
            if (!date) {
                throw parse_error(std::format("Field '{}.{}' is not a valid date", owner, fd->name));
            }
            return Node::scalar(*date);
        }
        if (fd && fd->type == ValueType::INTEGER && integral_number(value) &&
            std::fabs(value.get<double>()) > kMaxExactInteger) {
            throw parse_error(std::format(
                "Field '{}.{}' holds an integer beyond 2^53, which JSON numbers do not carry exactly",
                owner, fd->name));
        }
        return Node::scalar(scalar_from_json_value(value));
    }

    // Elements of sequences and mapping values share the field's descriptor
    NodePtr decode_element(const glz::json_t& value, const FieldDescriptor* fd,
                           const std::string& owner) {
        if (value.is_object()) {
            return decode_record(value, fd && fd->record_type ? *fd->record_type : std::string{});
        }
        return decode_field(value, fd, owner);
    }

    const ISchemaProvider& schemas_;
};

glz::json_t to_json_value_impl(const Node& node, size_t depth) {
    if (depth > kMaxEncodeDepth) {
        throw std::runtime_error("Graph too deep to encode as JSON");
    }

    glz::json_t j;
    switch (node.kind()) {
        case Node::Kind::SCALAR:
            return scalar_to_json_value(node.value());

        case Node::Kind::SEQUENCE: {
            glz::json_t::array_t arr;
            arr.reserve(node.items().size());
            for (const auto& child : node.items()) {
                arr.push_back(child ? to_json_value_impl(*child, depth + 1) : glz::json_t{});
            }
            j = std::move(arr);
            return j;
        }

        case Node::Kind::MAPPING:
        case Node::Kind::RECORD: {
            glz::json_t::object_t obj;
            for (const auto& [key, child] : node.entries()) {
                obj[key] = child ? to_json_value_impl(*child, depth + 1) : glz::json_t{};
            }
            j = std::move(obj);
            return j;
        }
    }
    return j;
}

} // anonymous namespace

// ============================================================================
// Scalars
// ============================================================================

glz::json_t scalar_to_json_value(const Scalar& value) {
    glz::json_t j;
    switch (primitive_type_of(value)) {
        case PrimitiveType::NULL_VALUE:
            break;
        case PrimitiveType::BOOLEAN:
            j = std::get<bool>(value);
            break;
        case PrimitiveType::INTEGER: {
            const int64_t n = std::get<int64_t>(value);
            if (!exact_in_double(n)) {
                throw encode_error(std::format("Integer {} has no exact JSON number form", n));
            }
            j = static_cast<double>(n);
            break;
        }
        case PrimitiveType::FLOAT:
            j = std::get<double>(value);
            break;
        case PrimitiveType::STRING:
            j = std::get<std::string>(value);
            break;
        case PrimitiveType::DATE:
            j = std::get<Date>(value).to_string();
            break;
    }
    return j;
}

Scalar scalar_from_json_value(const glz::json_t& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) {
        const double d = value.get<double>();
        if (integral_number(value) && std::fabs(d) <= kMaxExactInteger) {
            return static_cast<int64_t>(d);
        }
        return d;
    }
    return std::monostate{};
}

// ============================================================================
// Decode / Encode
// ============================================================================

glz::json_t read(std::string_view text) {
    // glaze expects a null-terminated buffer
    const std::string buffer(text);
    glz::json_t result;
    const auto ec = glz::read_json(result, buffer);
    if (ec) {
        throw parse_error("JSON parse error");
    }
    return result;
}

std::string write(const glz::json_t& value) {
    auto result = glz::write_json(value);
    if (!result) {
        throw std::runtime_error("JSON write error");
    }
    return std::move(*result);
}

NodePtr decode(std::string_view text, const DecodeOptions& options) {
    return decode_untyped(read(text), options);
}

NodePtr decode(std::string_view text, const ISchemaProvider& schemas,
               const std::string& root_type) {
    const auto value = read(text);
    if (!value.is_object()) {
        throw parse_error(std::format("Expected a JSON object for record '{}'", root_type));
    }
    TypedDecoder decoder(schemas);
    return decoder.decode_record(value, root_type);
}

glz::json_t to_json_value(const Node& node) {
    return to_json_value_impl(node, 0);
}

std::string encode(const Node& node) {
    return write(to_json_value(node));
}

std::string encode_audit(const AuditSummary& audit) {
    glz::json_t::object_t substitutions;
    for (const auto& [category, count] : audit.substitutions) {
        substitutions[category] = static_cast<double>(count);
    }

    glz::json_t::object_t root;
    root["substitutions"] = std::move(substitutions);
    root["total"] = static_cast<double>(audit.total_substitutions());
    root["records_visited"] = static_cast<double>(audit.records_visited);
    root["cache_hits"] = static_cast<double>(audit.cache_hits);

    glz::json_t j;
    j = std::move(root);
    return write(j);
}

} // namespace doubleblind::json
