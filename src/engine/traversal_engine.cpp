#include "engine/traversal_engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace doubleblind {

namespace {

/// Per-call traversal state
class Walk {
public:
    Walk(const FieldClassifier& classifier, const FakeValueSynthesizer& synthesizer,
         ConsistencyCache& cache, AuditSummary& audit,
         const ClassificationOverrides* overrides, std::stop_token stop, size_t max_depth)
        : classifier_(classifier), synthesizer_(synthesizer), cache_(cache), audit_(audit),
          overrides_(overrides), stop_(std::move(stop)), max_depth_(max_depth) {}

    NodePtr visit(const NodePtr& node, size_t depth) {
        if (!node) return node;

        // Cycle before depth: a cycle would otherwise surface as a depth error
        if (on_path_.contains(node.get())) {
            throw CyclicGraphError(std::format(
                "Cycle detected at depth {}: a {} node contains itself",
                depth, node_kind_to_string(node->kind())));
        }
        check_depth(depth);

        switch (node->kind()) {
            case Node::Kind::SCALAR:
                return node;
            case Node::Kind::SEQUENCE:
                return guarded(node, [&] { return visit_sequence(node, depth); });
            case Node::Kind::MAPPING:
                return guarded(node, [&] { return visit_mapping(node, depth); });
            case Node::Kind::RECORD:
                return guarded(node, [&] { return visit_record(node, depth); });
        }
        return node;
    }

private:
    // Every node counts, scalar leaves included
    void check_depth(size_t depth) const {
        if (depth > max_depth_) {
            throw MaxDepthExceededError(std::format(
                "Graph deeper than max depth {}", max_depth_));
        }
    }

    template<typename Fn>
    NodePtr guarded(const NodePtr& node, Fn&& fn) {
        on_path_.insert(node.get());
        NodePtr out = fn();
        on_path_.erase(node.get());
        return out;
    }

    NodePtr visit_sequence(const NodePtr& node, size_t depth) {
        const auto& items = node->items();
        std::vector<NodePtr> out;
        out.reserve(items.size());
        bool changed = false;
        for (const auto& item : items) {
            out.push_back(visit(item, depth + 1));
            changed = changed || out.back() != item;
        }
        return changed ? Node::sequence(std::move(out)) : node;
    }

    NodePtr visit_mapping(const NodePtr& node, size_t depth) {
        std::vector<Node::Entry> out;
        const bool changed = visit_entries(node, out, [&](const Node::Entry& entry) {
            return visit(entry.second, depth + 1);
        });
        return changed ? Node::mapping(std::move(out)) : node;
    }

    NodePtr visit_record(const NodePtr& node, size_t depth) {
        if (stop_.stop_requested()) {
            throw ScrubCancelledError("Scrub cancelled");
        }
        ++audit_.records_visited;

        const std::string& type = node->record_type();
        std::shared_ptr<const RecordSchema> schema;
        if (!type.empty()) {
            schema = classifier_.schemas().describe(type);
        }

        std::vector<Node::Entry> out;
        const bool changed = visit_entries(node, out, [&](const Node::Entry& entry) {
            const FieldDescriptor* descriptor = schema ? schema->find(entry.first) : nullptr;
            const Classification c = classifier_.classify(type, entry.first, descriptor, overrides_);
            if (!c.sensitive()) {
                return visit(entry.second, depth + 1);
            }
            check_depth(depth + 1);
            return substitute(type, entry.first, entry.second, c);
        });
        return changed ? Node::record(type, std::move(out)) : node;
    }

    template<typename Fn>
    bool visit_entries(const NodePtr& node, std::vector<Node::Entry>& out, Fn&& child_fn) {
        const auto& entries = node->entries();
        out.reserve(entries.size());
        bool changed = false;
        for (const auto& entry : entries) {
            NodePtr child = child_fn(entry);
            changed = changed || child != entry.second;
            out.emplace_back(entry.first, std::move(child));
        }
        return changed;
    }

    NodePtr substitute(const std::string& type, const std::string& field,
                       const NodePtr& child, const Classification& c) {
        const auto spec = synthesizer_.registry().resolve(*c.category);

        if (!child || !child->is_scalar()) {
            throw SchemaMismatchError(std::format(
                "Field '{}' is classified as '{}' but holds a {}, expected a {} scalar",
                qualified(type, field), *c.category,
                child ? node_kind_to_string(child->kind()) : std::string_view("missing value"),
                primitive_type_to_string(spec->output_type)));
        }

        const Scalar& original = child->value();
        if (std::holds_alternative<std::monostate>(original)) {
            return child;
        }

        const PrimitiveType actual = primitive_type_of(original);
        if (actual != spec->output_type) {
            throw SchemaMismatchError(std::format(
                "Field '{}' is classified as '{}' and must hold a {}, not a {}",
                qualified(type, field), *c.category,
                primitive_type_to_string(spec->output_type),
                primitive_type_to_string(actual)));
        }

        const std::string locale = c.locale.value_or("");
        const auto lookup = cache_.lookup_or_create(spec->tag, original,
            [&](uint32_t attempt) {
                return synthesizer_.synthesize(spec->tag, locale, &original, attempt);
            });

        ++audit_.substitutions[spec->tag];
        if (lookup.hit) ++audit_.cache_hits;
        return Node::scalar(lookup.value);
    }

    static std::string qualified(const std::string& type, const std::string& field) {
        return type.empty() ? field : std::format("{}.{}", type, field);
    }

    const FieldClassifier& classifier_;
    const FakeValueSynthesizer& synthesizer_;
    ConsistencyCache& cache_;
    AuditSummary& audit_;
    const ClassificationOverrides* overrides_;
    std::stop_token stop_;
    size_t max_depth_;
    std::unordered_set<const Node*> on_path_;
};

} // anonymous namespace

TraversalEngine::TraversalEngine(std::shared_ptr<const FieldClassifier> classifier,
                                 std::shared_ptr<const FakeValueSynthesizer> synthesizer)
    : TraversalEngine(std::move(classifier), std::move(synthesizer), Config{}) {}

TraversalEngine::TraversalEngine(std::shared_ptr<const FieldClassifier> classifier,
                                 std::shared_ptr<const FakeValueSynthesizer> synthesizer,
                                 Config config)
    : classifier_(std::move(classifier)),
      synthesizer_(std::move(synthesizer)),
      config_(config) {
    if (!classifier_ || !synthesizer_) {
        throw std::invalid_argument("TraversalEngine requires a classifier and a synthesizer");
    }
}

NodePtr TraversalEngine::traverse(const NodePtr& root,
                                  ConsistencyCache& cache,
                                  AuditSummary& audit,
                                  const ClassificationOverrides* overrides,
                                  std::stop_token stop) const {
    // Counts only land in the caller's summary if the whole walk succeeds
    AuditSummary local;
    Walk walk(*classifier_, *synthesizer_, cache, local, overrides,
              std::move(stop), config_.max_depth);
    NodePtr out = walk.visit(root, 0);

    utils::log::debug(std::format(
        "Traversal done: {} records, {} substitutions, {} cache hits",
        local.records_visited, local.total_substitutions(), local.cache_hits));
    audit.merge(local);
    return out;
}

} // namespace doubleblind
