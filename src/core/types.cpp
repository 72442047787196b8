#include "core/types.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace doubleblind {

// ============================================================================
// Date
// ============================================================================

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

} // anonymous namespace

std::string Date::to_string() const {
    return std::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::optional<Date> Date::parse(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto year = utils::try_parse_int<int>(text.substr(0, 4));
    const auto month = utils::try_parse_int<int>(text.substr(5, 2));
    const auto day = utils::try_parse_int<int>(text.substr(8, 2));
    if (!year || !month || !day) return std::nullopt;
    if (*month < 1 || *month > 12) return std::nullopt;
    if (*day < 1 || *day > days_in_month(*year, *month)) return std::nullopt;
    return Date{*year, *month, *day};
}

// ============================================================================
// Scalars
// ============================================================================

PrimitiveType primitive_type_of(const Scalar& value) {
    switch (value.index()) {
        case 0: return PrimitiveType::NULL_VALUE;
        case 1: return PrimitiveType::BOOLEAN;
        case 2: return PrimitiveType::INTEGER;
        case 3: return PrimitiveType::FLOAT;
        case 4: return PrimitiveType::STRING;
        case 5: return PrimitiveType::DATE;
        default: break;
    }
    return PrimitiveType::NULL_VALUE;
}

std::string_view primitive_type_to_string(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::NULL_VALUE: return "null";
        case PrimitiveType::BOOLEAN:    return "boolean";
        case PrimitiveType::INTEGER:    return "integer";
        case PrimitiveType::FLOAT:      return "float";
        case PrimitiveType::STRING:     return "string";
        case PrimitiveType::DATE:       return "date";
    }
    return "null";
}

std::string scalar_to_string(const Scalar& value) {
    switch (primitive_type_of(value)) {
        case PrimitiveType::NULL_VALUE:
            return "null";
        case PrimitiveType::BOOLEAN:
            return utils::booltostr(std::get<bool>(value));
        case PrimitiveType::INTEGER:
            return std::to_string(std::get<int64_t>(value));
        case PrimitiveType::FLOAT:
            return std::format("{}", std::get<double>(value));
        case PrimitiveType::STRING:
            return std::get<std::string>(value);
        case PrimitiveType::DATE:
            return std::get<Date>(value).to_string();
    }
    return "null";
}

// ============================================================================
// Value types
// ============================================================================

std::string_view value_type_to_string(ValueType type) {
    switch (type) {
        case ValueType::ANY:        return "any";
        case ValueType::NULL_VALUE: return "null";
        case ValueType::BOOLEAN:    return "boolean";
        case ValueType::INTEGER:    return "integer";
        case ValueType::FLOAT:      return "float";
        case ValueType::STRING:     return "string";
        case ValueType::DATE:       return "date";
        case ValueType::SEQUENCE:   return "sequence";
        case ValueType::MAPPING:    return "mapping";
        case ValueType::RECORD:     return "record";
    }
    return "any";
}

std::optional<ValueType> parse_value_type(std::string_view text) {
    static const std::unordered_map<std::string, ValueType> lookup = {
        {"any",      ValueType::ANY},
        {"null",     ValueType::NULL_VALUE},
        {"boolean",  ValueType::BOOLEAN},
        {"bool",     ValueType::BOOLEAN},
        {"integer",  ValueType::INTEGER},
        {"int",      ValueType::INTEGER},
        {"float",    ValueType::FLOAT},
        {"number",   ValueType::FLOAT},
        {"string",   ValueType::STRING},
        {"str",      ValueType::STRING},
        {"date",     ValueType::DATE},
        {"sequence", ValueType::SEQUENCE},
        {"list",     ValueType::SEQUENCE},
        {"array",    ValueType::SEQUENCE},
        {"mapping",  ValueType::MAPPING},
        {"map",      ValueType::MAPPING},
        {"record",   ValueType::RECORD},
        {"struct",   ValueType::RECORD},
    };
    const auto it = lookup.find(utils::to_lower(std::string(text)));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// RecordSchema
// ============================================================================

const FieldDescriptor* RecordSchema::find(std::string_view field_name) const {
    for (const auto& field : fields) {
        if (field.name == field_name) return &field;
    }
    return nullptr;
}

} // namespace doubleblind
