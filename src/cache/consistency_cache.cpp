#include "cache/consistency_cache.hpp"
#include "core/digest.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <vector>

namespace doubleblind {

namespace {

constexpr double kSnapshotVersion = 1.0;

glz::json_t encode_snapshot_value(const Scalar& value) {
    glz::json_t::object_t obj;
    obj["t"] = std::string(primitive_type_to_string(primitive_type_of(value)));
    obj["v"] = scalar_to_string(value);
    glz::json_t j;
    j = std::move(obj);
    return j;
}

Scalar decode_snapshot_value(const glz::json_t& node) {
    if (!node.is_object()) {
        throw SnapshotError("Snapshot entry must be an object");
    }
    const auto& obj = node.get_object();
    const auto t = obj.find("t");
    const auto v = obj.find("v");
    if (t == obj.end() || v == obj.end() || !t->second.is_string() || !v->second.is_string()) {
        throw SnapshotError("Snapshot entry needs string fields 't' and 'v'");
    }
    const auto& type = t->second.get<std::string>();
    const auto& text = v->second.get<std::string>();

    if (type == "string") return text;
    if (type == "integer") {
        if (const auto parsed = utils::try_parse_int<int64_t>(text)) return *parsed;
    } else if (type == "float") {
        try {
            size_t consumed = 0;
            const double d = std::stod(text, &consumed);
            if (consumed == text.size()) return d;
        } catch (const std::exception&) {
            // reported below
        }
    } else if (type == "boolean") {
        if (text == "true") return true;
        if (text == "false") return false;
    } else if (type == "date") {
        if (const auto date = Date::parse(text)) return *date;
    } else if (type == "null") {
        return std::monostate{};
    }
    throw SnapshotError(std::format("Invalid snapshot value of type '{}'", type));
}

} // anonymous namespace

ConsistencyCache::ConsistencyCache() : ConsistencyCache(Config{}) {}

ConsistencyCache::ConsistencyCache(Config config)
    : config_(config) {}

// ============================================================================
// Shards
// ============================================================================

ConsistencyCache::Shard& ConsistencyCache::shard_for(std::string_view category) {
    const std::string key(category);
    {
        std::shared_lock lock(shards_mutex_);
        const auto it = shards_.find(key);
        if (it != shards_.end()) return *it->second;
    }
    std::unique_lock lock(shards_mutex_);
    auto& slot = shards_[key];
    if (!slot) slot = std::make_unique<Shard>();
    return *slot;
}

const ConsistencyCache::Shard* ConsistencyCache::find_shard(std::string_view category) const {
    std::shared_lock lock(shards_mutex_);
    const auto it = shards_.find(std::string(category));
    return it == shards_.end() ? nullptr : it->second.get();
}

// ============================================================================
// Lookup / create
// ============================================================================

Scalar ConsistencyCache::get_or_create(std::string_view category, const Scalar& original,
                                       const Factory& factory) {
    return lookup_or_create(category, original, factory).value;
}

ConsistencyCache::Lookup ConsistencyCache::lookup_or_create(
    std::string_view category, const Scalar& original, const Factory& factory) {

    const std::string key = Digest::value_key(category, original);
    auto& shard = shard_for(category);

    std::lock_guard lock(shard.mutex);
    if (const auto it = shard.forward.find(key); it != shard.forward.end()) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return {it->second, true};
    }
    misses_.fetch_add(1, std::memory_order_relaxed);

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        Scalar candidate = factory(attempt);
        const std::string issued_key = Digest::value_key(category, candidate);

        // Issued before, or the original echoed back
        if (shard.issued.contains(issued_key) || issued_key == key) {
            collisions_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        shard.issued.insert(issued_key);
        auto [it, inserted] = shard.forward.emplace(key, std::move(candidate));
        return {it->second, false};
    }

    throw SynthesisExhaustedError(std::format(
        "Could not synthesize a unique '{}' value after {} attempts",
        category, config_.max_retries + 1));
}

std::optional<Scalar> ConsistencyCache::find(std::string_view category,
                                             const Scalar& original) const {
    const Shard* shard = find_shard(category);
    if (!shard) return std::nullopt;

    const std::string key = Digest::value_key(category, original);
    std::lock_guard lock(shard->mutex);
    const auto it = shard->forward.find(key);
    if (it == shard->forward.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// Stats / maintenance
// ============================================================================

ConsistencyCache::Stats ConsistencyCache::stats() const {
    size_t entries = 0;
    size_t categories = 0;
    {
        std::shared_lock lock(shards_mutex_);
        categories = shards_.size();
        for (const auto& [category, shard] : shards_) {
            std::lock_guard shard_lock(shard->mutex);
            entries += shard->forward.size();
        }
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .collisions = collisions_.load(std::memory_order_relaxed),
        .entries = entries,
        .categories = categories,
    };
}

size_t ConsistencyCache::size() const {
    return stats().entries;
}

void ConsistencyCache::clear() {
    std::unique_lock lock(shards_mutex_);
    shards_.clear();
}

// ============================================================================
// Snapshots
// ============================================================================

std::string ConsistencyCache::export_snapshot() const {
    glz::json_t::object_t categories;
    {
        std::shared_lock lock(shards_mutex_);
        for (const auto& [category, shard] : shards_) {
            glz::json_t::object_t entries;
            std::lock_guard shard_lock(shard->mutex);
            for (const auto& [digest, value] : shard->forward) {
                entries[digest] = encode_snapshot_value(value);
            }
            categories[category] = std::move(entries);
        }
    }

    glz::json_t::object_t root;
    root["version"] = kSnapshotVersion;
    root["categories"] = std::move(categories);
    glz::json_t j;
    j = std::move(root);
    return json::write(j);
}

void ConsistencyCache::import_snapshot(std::string_view json_text) {
    glz::json_t root;
    try {
        root = json::read(json_text);
    } catch (const json::parse_error& e) {
        throw SnapshotError(std::format("Malformed cache snapshot: {}", e.what()));
    }
    if (!root.is_object()) {
        throw SnapshotError("Cache snapshot must be a JSON object");
    }
    const auto& obj = root.get_object();
    const auto version = obj.find("version");
    if (version == obj.end() || !version->second.is_number() ||
        version->second.get<double>() != kSnapshotVersion) {
        throw SnapshotError("Unsupported cache snapshot version");
    }
    const auto cats = obj.find("categories");
    if (cats == obj.end() || !cats->second.is_object()) {
        throw SnapshotError("Cache snapshot has no 'categories' object");
    }

    // Decode everything before touching the shards
    struct Pending {
        std::string category;
        std::vector<std::pair<std::string, Scalar>> entries;
    };
    std::vector<Pending> pending;
    for (const auto& [category, entries] : cats->second.get_object()) {
        if (!entries.is_object()) {
            throw SnapshotError(std::format("Snapshot category '{}' must be an object", category));
        }
        Pending p;
        p.category = category;
        for (const auto& [digest, value] : entries.get_object()) {
            p.entries.emplace_back(digest, decode_snapshot_value(value));
        }
        pending.push_back(std::move(p));
    }

    // Reject conflicts with existing mappings
    for (const auto& p : pending) {
        const Shard* shard = find_shard(p.category);
        if (!shard) continue;
        std::lock_guard lock(shard->mutex);
        for (const auto& [digest, value] : p.entries) {
            const auto it = shard->forward.find(digest);
            if (it != shard->forward.end() && it->second != value) {
                throw SnapshotError(std::format(
                    "Snapshot entry for category '{}' conflicts with an existing mapping",
                    p.category));
            }
        }
    }

    for (auto& p : pending) {
        auto& shard = shard_for(p.category);
        std::lock_guard lock(shard.mutex);
        for (auto& [digest, value] : p.entries) {
            if (shard.forward.contains(digest)) continue;
            shard.issued.insert(Digest::value_key(p.category, value));
            shard.forward.emplace(std::move(digest), std::move(value));
        }
    }
}

void ConsistencyCache::save_snapshot(const std::string& path) const {
    const std::string content = export_snapshot();
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw SnapshotError(std::format("Cannot open cache snapshot for writing: {}", path));
    }
    file << content;
    if (!file.good()) {
        throw SnapshotError(std::format("Failed to write cache snapshot: {}", path));
    }
}

void ConsistencyCache::load_snapshot(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SnapshotError(std::format("Cannot open cache snapshot: {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    import_snapshot(buffer.str());
}

} // namespace doubleblind
