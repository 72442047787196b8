#pragma once

#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace doubleblind {

class Node;
using NodePtr = std::shared_ptr<Node>;

/**
 * @brief Object graph node: Scalar, Sequence, Mapping or Record.
 *
 * Sequences hold ordered children. Mappings and records hold ordered
 * (name, child) entries; mapping keys are plain data, record entries are
 * fields described by the schema of the record type.
 *
 * Scrubbing never mutates a node. Unchanged subtrees are shared between
 * the input and output graphs.
 */
class Node {
    // Restricts construction to the factories while still allowing make_shared
    struct Token {
        explicit Token() = default;
    };

public:
    enum class Kind { SCALAR, SEQUENCE, MAPPING, RECORD };

    Node(Token, Kind kind) : kind_(kind) {}

    using Entry = std::pair<std::string, NodePtr>;

    // ===== Factories =====

    [[nodiscard]] static NodePtr scalar(Scalar value);
    [[nodiscard]] static NodePtr sequence(std::vector<NodePtr> items = {});
    [[nodiscard]] static NodePtr mapping(std::vector<Entry> entries = {});
    [[nodiscard]] static NodePtr record(std::string record_type, std::vector<Entry> fields = {});

    // ===== Builders =====
    //
    // For building a graph before it is scrubbed. Nodes are shared: an
    // output graph reuses every unchanged subtree of its input, so mutating
    // an input node after a scrub also changes the outputs that share it.
    // Treat both graphs as immutable once a scrub has returned.

    /// @throws std::logic_error unless this is a sequence
    void append(NodePtr child);

    /// Replace the entry named `name` in place, or add it at the end
    /// @throws std::logic_error unless this is a mapping or record
    void set(std::string name, NodePtr child);

    // ===== Accessors =====

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_scalar() const { return kind_ == Kind::SCALAR; }
    [[nodiscard]] bool is_sequence() const { return kind_ == Kind::SEQUENCE; }
    [[nodiscard]] bool is_mapping() const { return kind_ == Kind::MAPPING; }
    [[nodiscard]] bool is_record() const { return kind_ == Kind::RECORD; }

    [[nodiscard]] const Scalar& value() const { return value_; }
    [[nodiscard]] const std::vector<NodePtr>& items() const { return items_; }
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] const std::string& record_type() const { return record_type_; }

    /// Child lookup by mapping key or field name (nullptr if absent)
    [[nodiscard]] NodePtr get(std::string_view name) const;

    /// Number of children (0 for scalars)
    [[nodiscard]] size_t size() const;

private:
    Kind kind_;
    Scalar value_;
    std::vector<NodePtr> items_;
    std::vector<Entry> entries_;
    std::string record_type_;
};

[[nodiscard]] std::string_view node_kind_to_string(Node::Kind kind);

/// Deep structural equality (kinds, order, keys, scalar values)
[[nodiscard]] bool deep_equal(const Node& lhs, const Node& rhs);

} // namespace doubleblind
