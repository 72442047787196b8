#include "session/scrub_session.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <format>
#include <future>
#include <stdexcept>
#include <thread>

namespace doubleblind {

std::string_view session_mode_to_string(ScrubSession::Mode mode) {
    switch (mode) {
        case ScrubSession::Mode::EPHEMERAL:  return "ephemeral";
        case ScrubSession::Mode::PERSISTENT: return "persistent";
    }
    return "ephemeral";
}

ScrubSession::ScrubSession(std::shared_ptr<const TraversalEngine> engine, Config config,
                           std::shared_ptr<ConsistencyCache> shared_cache)
    : engine_(std::move(engine)), config_(std::move(config)), cache_(std::move(shared_cache)) {
    if (!engine_) {
        throw std::invalid_argument("ScrubSession requires a traversal engine");
    }
    if (cache_) {
        config_.mode = Mode::PERSISTENT;
    } else if (config_.mode == Mode::PERSISTENT) {
        cache_ = std::make_shared<ConsistencyCache>(config_.cache);
    }
    if (config_.mode == Mode::EPHEMERAL && !config_.snapshot_path.empty()) {
        throw std::invalid_argument("Cache snapshots require a persistent session");
    }

    const auto& synth = engine_->synthesizer();
    utils::log::debug(std::format(
        "Scrub session created: mode={}, seed={}, max_depth={}",
        session_mode_to_string(config_.mode),
        synth.seeded_explicitly() ? "fixed" : "random",
        engine_->max_depth()));
}

std::shared_ptr<ConsistencyCache> ScrubSession::call_cache() const {
    if (cache_) return cache_;
    return std::make_shared<ConsistencyCache>(config_.cache);
}

void ScrubSession::record_audit(const AuditSummary& audit) {
    std::lock_guard lock(audit_mutex_);
    totals_.merge(audit);
}

// ============================================================================
// Single graph
// ============================================================================

ScrubResult ScrubSession::scrub(const NodePtr& input,
                                const ClassificationOverrides& overrides,
                                std::stop_token stop) {
    const auto cache = call_cache();
    ScrubResult result;
    try {
        result.output = engine_->traverse(input, *cache, result.audit, &overrides, std::move(stop));
    } catch (const ScrubError& e) {
        utils::log::warn(std::format("Scrub failed [{}]: {}",
            error_code_to_string(e.code()), e.what()));
        throw;
    }
    record_audit(result.audit);
    return result;
}

Result<ScrubResult> ScrubSession::try_scrub(const NodePtr& input,
                                            const ClassificationOverrides& overrides,
                                            std::stop_token stop) {
    try {
        return Result<ScrubResult>::ok(scrub(input, overrides, std::move(stop)));
    } catch (const ScrubError& e) {
        return Result<ScrubResult>::error(e.code(), e.what());
    } catch (const std::exception& e) {
        return Result<ScrubResult>::error(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

// ============================================================================
// Batch
// ============================================================================

BatchResult ScrubSession::scrub_batch(const std::vector<NodePtr>& inputs,
                                      const ClassificationOverrides& overrides,
                                      unsigned workers,
                                      std::stop_token stop) {
    BatchResult batch;
    batch.outputs.resize(inputs.size());
    if (inputs.empty()) return batch;

    const auto cache = call_cache();
    const utils::Timer timer;

    // Internal stop: first failure (or the caller's stop) halts the other workers
    std::stop_source halt;
    std::stop_callback forward(stop, [&halt] { halt.request_stop(); });

    std::mutex state_mutex;
    std::exception_ptr first_error;

    auto scrub_range = [&](size_t start, size_t end) {
        AuditSummary local;
        try {
            for (size_t i = start; i < end; ++i) {
                batch.outputs[i] = engine_->traverse(inputs[i], *cache, local,
                                                     &overrides, halt.get_token());
            }
        } catch (...) {
            std::lock_guard lock(state_mutex);
            if (!first_error) first_error = std::current_exception();
            halt.request_stop();
            return;
        }
        std::lock_guard lock(state_mutex);
        batch.audit.merge(local);
    };

    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    const size_t num_workers = std::min<size_t>(workers, inputs.size());

    if (num_workers > 1) {
        // Parallel path: partition inputs among worker threads
        const size_t chunk = (inputs.size() + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, inputs.size());
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, scrub_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        scrub_range(0, inputs.size());
    }

    if (first_error) {
        try {
            std::rethrow_exception(first_error);
        } catch (const ScrubError& e) {
            utils::log::warn(std::format("Batch scrub failed [{}]: {}",
                error_code_to_string(e.code()), e.what()));
            throw;
        }
    }

    record_audit(batch.audit);
    utils::log::debug(std::format(
        "Batch scrubbed: {} inputs, {} workers, {} substitutions in {}us",
        inputs.size(), num_workers, batch.audit.total_substitutions(),
        timer.elapsed_us().count()));
    return batch;
}

// ============================================================================
// Persistent cache
// ============================================================================

void ScrubSession::reset() {
    if (cache_) cache_->clear();
}

AuditSummary ScrubSession::audit_totals() const {
    std::lock_guard lock(audit_mutex_);
    return totals_;
}

bool ScrubSession::load_cache_snapshot() {
    if (!cache_ || config_.snapshot_path.empty()) return false;

    std::error_code ec;
    if (!std::filesystem::exists(config_.snapshot_path, ec)) {
        utils::log::debug(std::format("No cache snapshot at {} yet", config_.snapshot_path));
        return false;
    }
    cache_->load_snapshot(config_.snapshot_path);
    utils::log::info(std::format("Loaded cache snapshot {} ({} entries)",
        config_.snapshot_path, cache_->size()));
    return true;
}

bool ScrubSession::save_cache_snapshot() const {
    if (!cache_ || config_.snapshot_path.empty()) return false;
    cache_->save_snapshot(config_.snapshot_path);
    utils::log::info(std::format("Saved cache snapshot {}", config_.snapshot_path));
    return true;
}

} // namespace doubleblind
