#include "config/config_loader.hpp"
#include "classifier/field_classifier.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace doubleblind {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} references with environment variables (unset = empty).
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* t = node.as_table()) {
        for (auto& [key, val] : *t) expand_env_vars_in_node(val);
    } else if (auto* a = node.as_array()) {
        expand_env_vars_in_array(*a);
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) expand_env_vars_in_node(elem);
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) expand_env_vars_in_node(val);
}

/**
 * @brief Deep-merge overlay into base. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Replace `include = "a.toml"` / `include = ["a.toml", ...]` with the
 * merged content of those files (the including file wins).
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            } else {
                throw std::runtime_error("Config include entries must be strings");
            }
        }
    } else {
        throw std::runtime_error("Config include must be a string or an array of strings");
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

/// Array of tables under `key`; non-table elements are reported by index
template<typename Fn>
void for_each_table(const toml::table& tbl, const std::string_view key, Fn&& fn) {
    const auto* arr = tbl[key].as_array();
    if (!arr) {
        if (tbl.contains(key)) {
            throw std::runtime_error(std::format("'{}' must be an array of tables", key));
        }
        return;
    }
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* entry = (*arr)[i].as_table();
        if (!entry) {
            throw std::runtime_error(std::format("{}[{}] must be a table", key, i));
        }
        fn(*entry);
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

SessionConfig ConfigLoader::extract_session(const toml::table& root) {
    SessionConfig cfg;
    const auto* session = root["session"].as_table();
    if (!session) return cfg;
    const auto& s = *session;

    cfg.mode        = s["mode"].value_or(cfg.mode);
    cfg.seed        = s["seed"].value<int64_t>();
    cfg.locale      = s["locale"].value_or(cfg.locale);
    cfg.max_depth   = s["max_depth"].value_or(cfg.max_depth);
    cfg.max_retries = s["max_retries"].value_or(cfg.max_retries);
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;

    cfg.snapshot_path = (*cache)["snapshot_path"].value_or(""s);
    return cfg;
}

ClassifierConfig ConfigLoader::extract_classifier(const toml::table& root) {
    ClassifierConfig cfg;
    const auto* classifier = root["classifier"].as_table();
    if (!classifier) return cfg;
    const auto& c = *classifier;

    cfg.heuristics       = c["heuristics"].value_or(cfg.heuristics);
    cfg.default_patterns = c["default_patterns"].value_or(cfg.default_patterns);

    for_each_table(c, "patterns", [&](const toml::table& p) {
        PatternConfig pattern;
        pattern.match    = p["match"].value_or(pattern.match);
        pattern.pattern  = p["pattern"].value_or(""s);
        pattern.category = p["category"].value_or(""s);
        cfg.patterns.push_back(std::move(pattern));
    });
    return cfg;
}

std::vector<SchemaConfig> ConfigLoader::extract_schemas(const toml::table& root) {
    std::vector<SchemaConfig> schemas;
    for_each_table(root, "schemas", [&](const toml::table& s) {
        SchemaConfig schema;
        schema.name = s["name"].value_or(""s);
        for_each_table(s, "fields", [&](const toml::table& f) {
            FieldConfig field;
            field.name     = f["name"].value_or(""s);
            field.type     = f["type"].value_or(field.type);
            field.category = toml_optional_string(f, "category");
            field.locale   = toml_optional_string(f, "locale");
            field.record   = toml_optional_string(f, "record");
            schema.fields.push_back(std::move(field));
        });
        schemas.push_back(std::move(schema));
    });
    return schemas;
}

// ---- Shared extraction + validation ----------------------------------------

DoubleblindConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    DoubleblindConfig config;
    config.logging = extract_logging(tbl);
    config.session = extract_session(tbl);
    config.cache = extract_cache(tbl);
    config.classifier = extract_classifier(tbl);
    config.schemas = extract_schemas(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(DoubleblindConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DoubleblindConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    const auto& session = config.session;
    const bool persistent = session.mode == "persistent";
    if (!persistent && session.mode != "ephemeral") {
        errors.push_back(std::format(
            "session.mode must be 'ephemeral' or 'persistent', got '{}'", session.mode));
    }
    if (session.seed && *session.seed < 0) {
        errors.push_back(std::format("session.seed must be >= 0, got {}", *session.seed));
    }
    if (session.locale.empty()) {
        errors.push_back("session.locale must not be empty");
    }
    if (session.max_depth <= 0) {
        errors.push_back(std::format("session.max_depth must be > 0, got {}", session.max_depth));
    }
    if (!utils::in_range<0, 1000>(session.max_retries)) {
        errors.push_back(std::format(
            "session.max_retries must be 0-1000, got {}", session.max_retries));
    }

    if (!config.cache.snapshot_path.empty() && !persistent) {
        errors.push_back("cache.snapshot_path requires session.mode = 'persistent'");
    }

    for (size_t i = 0; i < config.classifier.patterns.size(); ++i) {
        const auto& p = config.classifier.patterns[i];
        if (!parse_match_kind(p.match)) {
            errors.push_back(std::format(
                "classifier.patterns[{}].match must be exact, prefix, suffix or contains, got '{}'",
                i, p.match));
        }
        if (p.pattern.empty()) {
            errors.push_back(std::format("classifier.patterns[{}].pattern must not be empty", i));
        }
        if (p.category.empty()) {
            errors.push_back(std::format("classifier.patterns[{}].category must not be empty", i));
        }
    }

    std::unordered_set<std::string> schema_names;
    for (size_t i = 0; i < config.schemas.size(); ++i) {
        const auto& schema = config.schemas[i];
        if (schema.name.empty()) {
            errors.push_back(std::format("schemas[{}].name must not be empty", i));
        } else if (!schema_names.insert(schema.name).second) {
            errors.push_back(std::format("schemas[{}]: duplicate schema '{}'", i, schema.name));
        }

        std::unordered_set<std::string> field_names;
        for (size_t j = 0; j < schema.fields.size(); ++j) {
            const auto& field = schema.fields[j];
            if (field.name.empty()) {
                errors.push_back(std::format("schemas[{}].fields[{}].name must not be empty", i, j));
            } else if (!field_names.insert(field.name).second) {
                errors.push_back(std::format(
                    "schemas[{}].fields[{}]: duplicate field '{}'", i, j, field.name));
            }
            if (!parse_value_type(field.type)) {
                errors.push_back(std::format(
                    "schemas[{}].fields[{}].type '{}' is not a known type", i, j, field.type));
            }
            if (field.category && field.category->empty()) {
                errors.push_back(std::format(
                    "schemas[{}].fields[{}].category must not be empty", i, j));
            }
        }
    }

    return errors;
}

} // namespace doubleblind
