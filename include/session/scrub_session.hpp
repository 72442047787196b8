#pragma once

#include "cache/consistency_cache.hpp"
#include "core/error.hpp"
#include "core/node.hpp"
#include "core/types.hpp"
#include "engine/traversal_engine.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace doubleblind {

struct ScrubResult {
    NodePtr output;
    AuditSummary audit;
};

struct BatchResult {
    std::vector<NodePtr> outputs;   // Same order as the inputs
    AuditSummary audit;
};

/**
 * @brief End-to-end scrub invocation context.
 *
 * EPHEMERAL: every scrub() / scrub_batch() call gets a fresh cache that is
 * dropped with the call, so mappings do not outlive it.
 * PERSISTENT: one cache spans all calls of the session, giving consistent
 * substitutions across calls. A caller-supplied cache implies PERSISTENT and
 * may be shared between sessions.
 *
 * scrub() may be called concurrently.
 */
class ScrubSession {
public:
    enum class Mode { EPHEMERAL, PERSISTENT };

    struct Config {
        Mode mode = Mode::EPHEMERAL;
        ConsistencyCache::Config cache;
        std::string snapshot_path;      // Persistent mode only; empty = none
    };

    /**
     * @param shared_cache Optional externally owned cache (forces PERSISTENT)
     * @throws std::invalid_argument without an engine, or with a snapshot
     *         path in ephemeral mode
     */
    ScrubSession(std::shared_ptr<const TraversalEngine> engine, Config config,
                 std::shared_ptr<ConsistencyCache> shared_cache = nullptr);

    ScrubSession(const ScrubSession&) = delete;
    ScrubSession& operator=(const ScrubSession&) = delete;

    /**
     * @brief Scrub one graph. The input is never modified.
     * @throws ScrubError subclasses; no partial output on failure
     */
    [[nodiscard]] ScrubResult scrub(const NodePtr& input,
                                    const ClassificationOverrides& overrides = {},
                                    std::stop_token stop = {});

    /// Non-throwing scrub(): taxonomy errors become error codes
    [[nodiscard]] Result<ScrubResult> try_scrub(const NodePtr& input,
                                                const ClassificationOverrides& overrides = {},
                                                std::stop_token stop = {});

    /**
     * @brief Scrub independent graphs in parallel with one shared cache
     *
     * @param workers Worker threads (0 = hardware concurrency, capped at input count)
     * @throws the first failure; the whole batch fails and remaining
     *         workers stop at their next record boundary
     */
    [[nodiscard]] BatchResult scrub_batch(const std::vector<NodePtr>& inputs,
                                          const ClassificationOverrides& overrides = {},
                                          unsigned workers = 0,
                                          std::stop_token stop = {});

    [[nodiscard]] Mode mode() const { return config_.mode; }

    /// Persistent cache (nullptr in ephemeral mode)
    [[nodiscard]] std::shared_ptr<ConsistencyCache> cache() const { return cache_; }

    /// Forget every mapping of the persistent cache (no-op when ephemeral)
    void reset();

    /// Cumulative audit of all successful calls
    [[nodiscard]] AuditSummary audit_totals() const;

    /**
     * @brief Merge the configured snapshot file into the persistent cache
     * @return false when no snapshot path is configured or the file does not exist yet
     * @throws SnapshotError on unreadable or malformed snapshots
     */
    bool load_cache_snapshot();

    /**
     * @brief Write the persistent cache to the configured snapshot file
     * @return false when no snapshot path is configured
     * @throws SnapshotError on I/O failure
     */
    bool save_cache_snapshot() const;

    [[nodiscard]] const TraversalEngine& engine() const { return *engine_; }

private:
    std::shared_ptr<ConsistencyCache> call_cache() const;
    void record_audit(const AuditSummary& audit);

    std::shared_ptr<const TraversalEngine> engine_;
    Config config_;
    std::shared_ptr<ConsistencyCache> cache_;

    mutable std::mutex audit_mutex_;
    AuditSummary totals_;
};

[[nodiscard]] std::string_view session_mode_to_string(ScrubSession::Mode mode);

} // namespace doubleblind
