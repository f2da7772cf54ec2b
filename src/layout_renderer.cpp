/// @file layout_renderer.cpp
/// @brief Text and HTML rendering of type layouts

#include <typesizes/layout_renderer.hpp>
#include <typesizes/utils.hpp>

namespace typesizes {

namespace {

    constexpr const char* HTML_HEAD = R"html(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>%s</title>
<style>
body { font-family: monospace; }
ul, #types { list-style-type: none; }
#types { margin: 0; padding: 0; }
.caret { cursor: pointer; user-select: none; }
.caret::before { content: "\25B6"; display: inline-block; margin-right: 6px; }
.caret-down::before { transform: rotate(90deg); }
.nested { display: none; }
.active { display: block; }
</style>
<script>
document.addEventListener("DOMContentLoaded", function() {
    var toggler = document.getElementsByClassName("caret");
    for (var i = 0; i < toggler.length; i++) {
        toggler[i].addEventListener("click", function() {
            this.parentElement.querySelector(".nested").classList.toggle("active");
            this.classList.toggle("caret-down");
        });
    }
});
</script>
</head>
<body>
<h1>%s</h1>
<p>%zu types</p>
<ul id="types">
)html";

    constexpr const char* HTML_TAIL = "</ul>\n</body>\n</html>\n";

    unsigned long long ull(std::uint64_t v) {
        return static_cast<unsigned long long>(v);
    }

    std::string pad(std::size_t depth) {
        return std::string(depth * 4, ' ');
    }

    // <li> with a caret and nested list when children are given
    void html_item(std::string& out, const std::string& label, std::size_t depth, bool open) {
        if (open) {
            out += pad(depth) + "<li>\n";
            out += pad(depth + 1) + "<span class=\"caret\">" + html_escape(label) + "</span>\n";
            out += pad(depth + 1) + "<ul class=\"nested\">\n";
        } else {
            out += pad(depth) + "<li>" + html_escape(label) + "</li>\n";
        }
    }

    void html_close(std::string& out, std::size_t depth) {
        out += pad(depth + 1) + "</ul>\n";
        out += pad(depth) + "</li>\n";
    }

} // anonymous namespace

std::string html_escape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  escaped += "&amp;";  break;
            case '<':  escaped += "&lt;";   break;
            case '>':  escaped += "&gt;";   break;
            case '"':  escaped += "&quot;"; break;
            case '\'': escaped += "&#39;";  break;
            default:   escaped += c;        break;
        }
    }
    return escaped;
}

std::string LayoutRenderer::describe(const Node& node) {
    switch (node.kind()) {
        case NodeKind::Discriminant:
            return format_string("Discriminant: %llu bytes", ull(node.size()));
        case NodeKind::Padding:
            return format_string("Padding: %llu bytes", ull(node.size()));
        case NodeKind::EndPadding:
            return format_string("End padding: %llu bytes", ull(node.size()));
        case NodeKind::Field: {
            const Field& f = node.as<Field>();
            std::string line = format_string("Field %s: %llu bytes", f.name.c_str(), ull(f.size));
            if (f.offset) {
                line += format_string(", offset: %llu bytes", ull(*f.offset));
            }
            if (f.alignment) {
                line += format_string(", alignment: %llu bytes", ull(*f.alignment));
            }
            return line;
        }
        case NodeKind::Variant: {
            const Variant& v = node.as<Variant>();
            return format_string("Variant %s: %llu bytes", v.name.c_str(), ull(v.size));
        }
    }
    return "???";
}

std::string LayoutRenderer::describe(const TypeRecord& type) {
    return format_string("Type %s: %llu bytes, alignment %llu bytes",
                         type.name.c_str(), ull(type.size), ull(type.alignment));
}

std::string LayoutRenderer::render(const std::vector<TypeRecord>& types) const {
    switch (options_.format) {
        case OutputFormat::Html: return render_html(types);
        case OutputFormat::Text:
        default:                 return render_text(types);
    }
}

std::string LayoutRenderer::render_text(const std::vector<TypeRecord>& types) const {
    std::string out;
    for (const auto& type : types) {
        out += describe(type);
        out += '\n';
        text_nodes(out, type.children, 1);
    }
    return out;
}

void LayoutRenderer::text_nodes(std::string& out, const std::vector<Node>& nodes, std::size_t depth) const {
    for (const auto& node : nodes) {
        out.append(depth * 2, ' ');
        out += describe(node);
        out += '\n';
        if (const auto* variant = node.get_if<Variant>(); variant && variant->children) {
            text_nodes(out, *variant->children, depth + 1);
        }
    }
}

std::string LayoutRenderer::render_html(const std::vector<TypeRecord>& types) const {
    const std::string title = html_escape(options_.html_title);
    std::string out = format_string(HTML_HEAD, title.c_str(), title.c_str(), types.size());

    for (const auto& type : types) {
        const bool open = !type.children.empty();
        html_item(out, describe(type), 0, open);
        if (open) {
            html_nodes(out, type.children, 2);
            html_close(out, 0);
        }
    }

    out += HTML_TAIL;
    return out;
}

void LayoutRenderer::html_nodes(std::string& out, const std::vector<Node>& nodes, std::size_t depth) const {
    for (const auto& node : nodes) {
        const auto* variant = node.get_if<Variant>();
        const bool open = variant && variant->children;
        html_item(out, describe(node), depth, open);
        if (open) {
            html_nodes(out, *variant->children, depth + 2);
            html_close(out, depth);
        }
    }
}

void LayoutRenderer::write(std::ostream& out, const std::vector<TypeRecord>& types) const {
    out << render(types);
}

} // namespace typesizes
