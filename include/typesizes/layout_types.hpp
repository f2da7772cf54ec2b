#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace typesizes {

struct Node;

// ============================================================================
// Layout Elements
// ============================================================================

/// Tag bytes selecting the active variant of a sum type
struct Discriminant {
    std::uint64_t size = 0;

    bool operator==(const Discriminant&) const = default;
};

/// Alignment bytes inserted between two fields
struct Padding {
    std::uint64_t size = 0;

    bool operator==(const Padding&) const = default;
};

/// Alignment bytes after the last field
struct EndPadding {
    std::uint64_t size = 0;

    bool operator==(const EndPadding&) const = default;
};

/// Named field. Offset and alignment are only set when the compiler reported them.
struct Field {
    std::string                  name;
    std::uint64_t                size = 0;
    std::optional<std::uint64_t> offset;
    std::optional<std::uint64_t> alignment;

    [[nodiscard]] bool has_offset() const noexcept { return offset.has_value(); }
    [[nodiscard]] bool has_alignment() const noexcept { return alignment.has_value(); }

    bool operator==(const Field&) const = default;
};

/// Variant of a sum type.
///
/// `children` is std::nullopt until a deeper-indented block is seen right
/// after the variant line. An engaged but empty vector is a different state
/// ("members observed, none listed") and is preserved as such.
struct Variant {
    std::string                      name;
    std::uint64_t                    size = 0;
    std::optional<std::vector<Node>> children;

    [[nodiscard]] bool has_children() const noexcept { return children.has_value(); }

    /// Completed copy of this variant carrying `members`
    [[nodiscard]] Variant with_children(std::vector<Node> members) const;

    bool operator==(const Variant& other) const;
};

/// Node kinds, in the same order as the alternatives of Node::value
enum class NodeKind {
    Discriminant,
    Padding,
    EndPadding,
    Field,
    Variant
};

/// One element of a type layout
struct Node {
    std::variant<Discriminant, Padding, EndPadding, Field, Variant> value;

    Node() = default;
    Node(Discriminant d) : value(std::move(d)) {}
    Node(Padding p) : value(std::move(p)) {}
    Node(EndPadding p) : value(std::move(p)) {}
    Node(Field f) : value(std::move(f)) {}
    Node(Variant v) : value(std::move(v)) {}

    [[nodiscard]] NodeKind kind() const noexcept {
        return static_cast<NodeKind>(value.index());
    }

    /// Size in bytes reported for this element
    [[nodiscard]] std::uint64_t size() const noexcept;

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(value);
    }

    template<typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(value);
    }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&value);
    }

    bool operator==(const Node& other) const { return value == other.value; }
};

/// One `type:` block of the diagnostics with its layout tree
struct TypeRecord {
    std::string       name;
    std::uint64_t     size = 0;
    std::uint64_t     alignment = 0;
    std::vector<Node> children;
    std::size_t       line = 0;     // 1-based position of the header in the raw input

    /// Number of nodes in the whole tree
    [[nodiscard]] std::size_t node_count() const noexcept;

    /// Deepest nesting level below the header (0 for an empty body)
    [[nodiscard]] std::size_t depth() const noexcept;

    /// Padding and end padding bytes listed directly under the type
    [[nodiscard]] std::uint64_t padding_bytes() const noexcept;

    /// Structural equality; the source position is not compared
    bool operator==(const TypeRecord& other) const;
};

/// Predicate deciding whether a type record is kept
using TypeFilter = std::function<bool(const TypeRecord&)>;

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] const char* node_kind_name(NodeKind kind) noexcept;

/// Count nodes recursively, including variant members
[[nodiscard]] std::size_t count_nodes(const std::vector<Node>& nodes) noexcept;

/// Stable sort by type size; equal sizes keep source order
void sort_by_size(std::vector<TypeRecord>& types, bool descending = false);

/// Remove records the filter rejects, preserving order
void filter_types(std::vector<TypeRecord>& types, const TypeFilter& keep);

} // namespace typesizes
