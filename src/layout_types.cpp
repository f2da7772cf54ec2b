/// @file layout_types.cpp
/// @brief Layout tree types and record helpers

#include <typesizes/layout_types.hpp>

#include <algorithm>

namespace typesizes {

namespace {

std::size_t subtree_depth(const std::vector<Node>& nodes) noexcept {
    std::size_t deepest = 0;
    for (const auto& node : nodes) {
        std::size_t d = 1;
        if (const auto* variant = node.get_if<Variant>(); variant && variant->children) {
            d += subtree_depth(*variant->children);
        }
        deepest = std::max(deepest, d);
    }
    return deepest;
}

} // anonymous namespace

Variant Variant::with_children(std::vector<Node> members) const {
    Variant completed;
    completed.name = name;
    completed.size = size;
    completed.children = std::move(members);
    return completed;
}

bool Variant::operator==(const Variant& other) const {
    return name == other.name && size == other.size && children == other.children;
}

std::uint64_t Node::size() const noexcept {
    return std::visit([](const auto& element) { return element.size; }, value);
}

std::size_t TypeRecord::node_count() const noexcept {
    return count_nodes(children);
}

std::size_t TypeRecord::depth() const noexcept {
    return subtree_depth(children);
}

std::uint64_t TypeRecord::padding_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& node : children) {
        if (node.is<Padding>() || node.is<EndPadding>()) {
            total += node.size();
        }
    }
    return total;
}

bool TypeRecord::operator==(const TypeRecord& other) const {
    return name == other.name &&
           size == other.size &&
           alignment == other.alignment &&
           children == other.children;
}

const char* node_kind_name(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Discriminant: return "discriminant";
        case NodeKind::Padding:      return "padding";
        case NodeKind::EndPadding:   return "end padding";
        case NodeKind::Field:        return "field";
        case NodeKind::Variant:      return "variant";
        default:                     return "???";
    }
}

std::size_t count_nodes(const std::vector<Node>& nodes) noexcept {
    std::size_t count = 0;
    for (const auto& node : nodes) {
        ++count;
        if (const auto* variant = node.get_if<Variant>(); variant && variant->children) {
            count += count_nodes(*variant->children);
        }
    }
    return count;
}

void sort_by_size(std::vector<TypeRecord>& types, bool descending) {
    std::stable_sort(types.begin(), types.end(),
        [descending](const TypeRecord& a, const TypeRecord& b) {
            return descending ? a.size > b.size : a.size < b.size;
        });
}

void filter_types(std::vector<TypeRecord>& types, const TypeFilter& keep) {
    if (!keep) return;
    types.erase(std::remove_if(types.begin(), types.end(),
                               [&keep](const TypeRecord& t) { return !keep(t); }),
                types.end());
}

} // namespace typesizes
