#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace doubleblind {

/**
 * @brief Session-scoped (category, original) -> synthetic value store.
 *
 * Entries are keyed by a SHA-256 digest of the category and the original
 * value, so the cache never holds originals. A per-category reverse index
 * of issued synthetic values keeps the mapping injective: a candidate that
 * was already issued, or that equals the original, is a collision and the
 * factory is asked again with the next attempt number.
 *
 * One shard per category. The shard mutex is held across the whole
 * check-then-insert sequence, factory call included, so concurrent workers
 * asking for the same pair get the same value and unrelated categories do
 * not contend.
 */
class ConsistencyCache {
public:
    struct Config {
        uint32_t max_retries = 5;
    };

    using Factory = std::function<Scalar(uint32_t attempt)>;

    struct Lookup {
        Scalar value;
        bool hit = false;
    };

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t collisions;
        size_t entries;
        size_t categories;
    };

    ConsistencyCache();
    explicit ConsistencyCache(Config config);

    ConsistencyCache(const ConsistencyCache&) = delete;
    ConsistencyCache& operator=(const ConsistencyCache&) = delete;

    /**
     * @brief Return the synthetic value for (category, original), creating it on miss
     *
     * On a hit the factory is not called. On a miss the factory is called
     * with attempt 0, then re-invoked up to max_retries times while the
     * candidate collides.
     *
     * @throws SynthesisExhaustedError when every attempt collided (nothing is inserted)
     * @throws whatever the factory throws (nothing is inserted)
     */
    [[nodiscard]] Scalar get_or_create(std::string_view category, const Scalar& original,
                                       const Factory& factory);

    /// get_or_create that also reports whether the value came from the cache
    [[nodiscard]] Lookup lookup_or_create(std::string_view category, const Scalar& original,
                                          const Factory& factory);

    /// Existing mapping, without creating one
    [[nodiscard]] std::optional<Scalar> find(std::string_view category, const Scalar& original) const;

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint32_t max_retries() const { return config_.max_retries; }

    /// Drop every entry (counters are kept). Must not race with lookups.
    void clear();

    // ===== Snapshot persistence (explicit opt-in) =====

    /**
     * @brief Serialize all mappings as JSON: digests and synthetic values only
     */
    [[nodiscard]] std::string export_snapshot() const;

    /**
     * @brief Merge a snapshot produced by export_snapshot()
     *
     * Entries already present with the same value are ignored.
     * @throws SnapshotError on malformed input or when a snapshot entry
     *         conflicts with an existing mapping (nothing is merged then)
     */
    void import_snapshot(std::string_view json_text);

    /// @throws SnapshotError on I/O failure
    void save_snapshot(const std::string& path) const;

    /// @throws SnapshotError on I/O failure or malformed content
    void load_snapshot(const std::string& path);

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Scalar> forward;    // digest(original) -> synthetic
        std::unordered_set<std::string> issued;             // digest(synthetic)
    };

    Shard& shard_for(std::string_view category);
    const Shard* find_shard(std::string_view category) const;

    Config config_;
    mutable std::shared_mutex shards_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> collisions_{0};
};

} // namespace doubleblind
