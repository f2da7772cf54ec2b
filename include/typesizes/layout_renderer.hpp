#pragma once

#include "layout_types.hpp"
#include "config.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace typesizes {

/// Renders parsed type layouts as an indented text tree or an HTML page
class LayoutRenderer {
public:
    explicit LayoutRenderer(const OutputOptions& opts = Config::instance().options().output)
        : options_(opts) {}

    /// Render in the configured format
    [[nodiscard]] std::string render(const std::vector<TypeRecord>& types) const;

    /// One line per element, two spaces per nesting level
    [[nodiscard]] std::string render_text(const std::vector<TypeRecord>& types) const;

    /// Standalone page with collapsible types and variants
    [[nodiscard]] std::string render_html(const std::vector<TypeRecord>& types) const;

    /// Write render() output to a stream
    void write(std::ostream& out, const std::vector<TypeRecord>& types) const;

    /// Single-line description, e.g. "Field a: 8 bytes, offset: 0 bytes"
    [[nodiscard]] static std::string describe(const Node& node);
    [[nodiscard]] static std::string describe(const TypeRecord& type);

    [[nodiscard]] const OutputOptions& options() const noexcept { return options_; }

private:
    void text_nodes(std::string& out, const std::vector<Node>& nodes, std::size_t depth) const;
    void html_nodes(std::string& out, const std::vector<Node>& nodes, std::size_t depth) const;

    OutputOptions options_;
};

/// Escape &, <, >, " and ' for HTML text and attributes
[[nodiscard]] std::string html_escape(std::string_view text);

} // namespace typesizes
