#pragma once

#include "cache/consistency_cache.hpp"
#include "classifier/field_classifier.hpp"
#include "core/node.hpp"
#include "core/types.hpp"
#include "synth/fake_value_synthesizer.hpp"

#include <cstddef>
#include <memory>
#include <stop_token>

namespace doubleblind {

/**
 * @brief Walks an object graph and rebuilds it with classified scalars replaced.
 *
 * Output has the same shape as the input: same node kinds, sequence
 * lengths, mapping keys and record fields, in the same order. Subtrees
 * without substitutions are shared with the input, never copied or mutated.
 *
 * Stateless between calls; one engine can serve concurrent traversals as
 * long as each call gets its own AuditSummary.
 */
class TraversalEngine {
public:
    struct Config {
        size_t max_depth = 64;     // Root is depth 0; scalar leaves count like containers
    };

    TraversalEngine(std::shared_ptr<const FieldClassifier> classifier,
                    std::shared_ptr<const FakeValueSynthesizer> synthesizer);
    TraversalEngine(std::shared_ptr<const FieldClassifier> classifier,
                    std::shared_ptr<const FakeValueSynthesizer> synthesizer,
                    Config config);

    /**
     * @brief Scrub one graph
     *
     * @param cache Mapping store shared by every substitution of this call
     * @param audit Receives substitution counts, records visited, cache hits
     * @throws SchemaMismatchError when a classified field is not a scalar of
     *         the category's output type
     * @throws UnknownCategoryError, SynthesisExhaustedError, TypeMismatchError
     * @throws MaxDepthExceededError, CyclicGraphError
     * @throws ScrubCancelledError when stop is requested (checked per record)
     */
    [[nodiscard]] NodePtr traverse(const NodePtr& root,
                                   ConsistencyCache& cache,
                                   AuditSummary& audit,
                                   const ClassificationOverrides* overrides = nullptr,
                                   std::stop_token stop = {}) const;

    [[nodiscard]] size_t max_depth() const { return config_.max_depth; }
    [[nodiscard]] const FieldClassifier& classifier() const { return *classifier_; }
    [[nodiscard]] const FakeValueSynthesizer& synthesizer() const { return *synthesizer_; }

private:
    std::shared_ptr<const FieldClassifier> classifier_;
    std::shared_ptr<const FakeValueSynthesizer> synthesizer_;
    Config config_;
};

} // namespace doubleblind
