#include "core/node.hpp"

#include <memory>
#include <stdexcept>

namespace doubleblind {

NodePtr Node::scalar(Scalar value) {
    auto node = std::make_shared<Node>(Token{}, Kind::SCALAR);
    node->value_ = std::move(value);
    return node;
}

NodePtr Node::sequence(std::vector<NodePtr> items) {
    auto node = std::make_shared<Node>(Token{}, Kind::SEQUENCE);
    node->items_ = std::move(items);
    return node;
}

NodePtr Node::mapping(std::vector<Entry> entries) {
    auto node = std::make_shared<Node>(Token{}, Kind::MAPPING);
    node->entries_ = std::move(entries);
    return node;
}

NodePtr Node::record(std::string record_type, std::vector<Entry> fields) {
    auto node = std::make_shared<Node>(Token{}, Kind::RECORD);
    node->record_type_ = std::move(record_type);
    node->entries_ = std::move(fields);
    return node;
}

void Node::append(NodePtr child) {
    if (kind_ != Kind::SEQUENCE) {
        throw std::logic_error("Node::append requires a sequence node");
    }
    items_.push_back(std::move(child));
}

void Node::set(std::string name, NodePtr child) {
    if (kind_ != Kind::MAPPING && kind_ != Kind::RECORD) {
        throw std::logic_error("Node::set requires a mapping or record node");
    }
    for (auto& [key, existing] : entries_) {
        if (key == name) {
            existing = std::move(child);
            return;
        }
    }
    entries_.emplace_back(std::move(name), std::move(child));
}

NodePtr Node::get(std::string_view name) const {
    for (const auto& [key, child] : entries_) {
        if (key == name) return child;
    }
    return nullptr;
}

size_t Node::size() const {
    switch (kind_) {
        case Kind::SCALAR:   return 0;
        case Kind::SEQUENCE: return items_.size();
        case Kind::MAPPING:
        case Kind::RECORD:   return entries_.size();
    }
    return 0;
}

std::string_view node_kind_to_string(Node::Kind kind) {
    switch (kind) {
        case Node::Kind::SCALAR:   return "scalar";
        case Node::Kind::SEQUENCE: return "sequence";
        case Node::Kind::MAPPING:  return "mapping";
        case Node::Kind::RECORD:   return "record";
    }
    return "scalar";
}

bool deep_equal(const Node& lhs, const Node& rhs) {
    if (&lhs == &rhs) return true;
    if (lhs.kind() != rhs.kind()) return false;

    switch (lhs.kind()) {
        case Node::Kind::SCALAR:
            return lhs.value() == rhs.value();

        case Node::Kind::SEQUENCE: {
            if (lhs.items().size() != rhs.items().size()) return false;
            for (size_t i = 0; i < lhs.items().size(); ++i) {
                const auto& a = lhs.items()[i];
                const auto& b = rhs.items()[i];
                if (!a || !b) {
                    if (a != b) return false;
                    continue;
                }
                if (!deep_equal(*a, *b)) return false;
            }
            return true;
        }

        case Node::Kind::RECORD:
            if (lhs.record_type() != rhs.record_type()) return false;
            [[fallthrough]];
        case Node::Kind::MAPPING: {
            if (lhs.entries().size() != rhs.entries().size()) return false;
            for (size_t i = 0; i < lhs.entries().size(); ++i) {
                const auto& [ka, a] = lhs.entries()[i];
                const auto& [kb, b] = rhs.entries()[i];
                if (ka != kb) return false;
                if (!a || !b) {
                    if (a != b) return false;
                    continue;
                }
                if (!deep_equal(*a, *b)) return false;
            }
            return true;
        }
    }
    return false;
}

} // namespace doubleblind
