#pragma once

#include <toml++/toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace doubleblind {

// ============================================================================
// Config sections (mirror the TOML hierarchy; enum-like values stay strings
// until validation)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct SessionConfig {
    std::string mode = "ephemeral";
    std::optional<int64_t> seed;            // Random per run when absent
    std::string locale = "en_US";
    int64_t max_depth = 64;
    int64_t max_retries = 5;
};

struct CacheConfig {
    std::string snapshot_path;
};

struct PatternConfig {
    std::string match = "exact";
    std::string pattern;
    std::string category;
};

struct ClassifierConfig {
    bool heuristics = true;
    bool default_patterns = true;           // Keep the built-in name table
    std::vector<PatternConfig> patterns;    // Checked after the built-in ones
};

struct FieldConfig {
    std::string name;
    std::string type = "any";
    std::optional<std::string> category;
    std::optional<std::string> locale;
    std::optional<std::string> record;
};

struct SchemaConfig {
    std::string name;
    std::vector<FieldConfig> fields;
};

struct DoubleblindConfig {
    LoggingConfig logging;
    SessionConfig session;
    CacheConfig cache;
    ClassifierConfig classifier;
    std::vector<SchemaConfig> schemas;
};

// ============================================================================
// Loader
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        DoubleblindConfig config;

        static LoadResult ok(DoubleblindConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file (includes resolved relative to it)
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text (includes are not resolved)
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const DoubleblindConfig& config);

private:
    static DoubleblindConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(DoubleblindConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static SessionConfig extract_session(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static ClassifierConfig extract_classifier(const toml::table& root);
    static std::vector<SchemaConfig> extract_schemas(const toml::table& root);
};

} // namespace doubleblind
