/// @file gumbo_adapter.cpp
/// @brief Gumbo HTML5 parser backend implementation
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "gumbo_adapter.h"
#include "parse_error.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <gumbo.h>

namespace blankline_cpp::gumbo {

namespace {

struct OutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

std::string_view to_string_view(GumboStringPiece const& piece) {
    if (!piece.data || piece.length == 0) {
        return {};
    }
    return std::string_view(piece.data, piece.length);
}

std::string lookup_tag_name(GumboNode const* node) {
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN) {
        char const* normalized = gumbo_normalized_tagname(node->v.element.tag);
        return normalized ? std::string(normalized) : "";
    }
    auto view = to_string_view(node->v.element.original_tag);
    std::size_t start = view.find_first_not_of("< /");
    if (start == std::string_view::npos) return "";
    std::size_t end = start;
    while (end < view.size()) {
        char c = view[end];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '>') break;
        ++end;
    }
    std::string name(view.substr(start, end - start));
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name;
}

void copy_children(GumboVector const& children, dom::HtmlNode& out);

// Comments and other node types are dropped.
bool copy_node(GumboNode const* node, dom::HtmlNode& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out.type = dom::NodeType::Text;
            out.text = node->v.text.text ? node->v.text.text : "";
            return true;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            out.type = dom::NodeType::Element;
            out.tag = lookup_tag_name(node);
            GumboVector const& attributes = node->v.element.attributes;
            for (unsigned i = 0; i < attributes.length; ++i) {
                auto const* attr = static_cast<GumboAttribute const*>(attributes.data[i]);
                std::string name = attr->name ? attr->name : "";
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
                    return static_cast<char>(std::tolower(c));
                });
                out.attributes.emplace_back(std::move(name), attr->value ? attr->value : "");
            }
            copy_children(node->v.element.children, out);
            return true;
        }
        default:
            return false;
    }
}

void copy_children(GumboVector const& children, dom::HtmlNode& out) {
    for (unsigned i = 0; i < children.length; ++i) {
        dom::HtmlNode child;
        if (copy_node(static_cast<GumboNode const*>(children.data[i]), child)) {
            out.children.push_back(std::move(child));
        }
    }
}

} // namespace

dom::HtmlNode parse(std::string const& html) {
    std::unique_ptr<GumboOutput, OutputDeleter> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output || !output->document) {
        throw ParseError("gumbo could not parse the HTML input");
    }

    dom::HtmlNode root;
    root.type = dom::NodeType::Document;
    copy_children(output->document->v.document.children, root);
    return root;
}

} // namespace blankline_cpp::gumbo
