/// @file libxml2_adapter.cpp
/// @brief libxml2 HTML parser backend implementation
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "libxml2_adapter.h"
#include "parse_error.h"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace blankline_cpp::libxml2 {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// libxml2's HTML parser can mis-handle a literal '<' in text (e.g. "< 1")
// by treating it as markup. Escape '<' when it does not open a tag.
std::string escape_non_tag_angle_brackets(std::string const& html) {
    auto is_ascii_alpha = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    };

    std::string out;
    out.reserve(html.size());
    for (std::size_t i = 0; i < html.size(); ++i) {
        char c = html[i];
        if (c == '<') {
            unsigned char next = (i + 1 < html.size())
                ? static_cast<unsigned char>(html[i + 1])
                : 0;
            bool tag_open = is_ascii_alpha(next) || next == '/' || next == '!' || next == '?';
            if (!tag_open) {
                out += "&lt;";
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

void copy_children(xmlNodePtr parent, dom::HtmlNode& out);

bool copy_node(xmlNodePtr node, dom::HtmlNode& out) {
    switch (node->type) {
        case XML_TEXT_NODE:
        case XML_CDATA_SECTION_NODE:
            out.type = dom::NodeType::Text;
            out.text = node->content ? reinterpret_cast<char const*>(node->content) : "";
            return true;
        case XML_ELEMENT_NODE: {
            out.type = dom::NodeType::Element;
            out.tag = node->name ? lowercase(reinterpret_cast<char const*>(node->name)) : "";
            for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
                if (!attr->name) continue;
                xmlChar* value = xmlNodeListGetString(attr->doc, attr->children, 1 /*inLine*/);
                out.attributes.emplace_back(lowercase(reinterpret_cast<char const*>(attr->name)),
                                            value ? reinterpret_cast<char const*>(value) : "");
                if (value) xmlFree(value);
            }
            copy_children(node, out);
            return true;
        }
        default:
            return false;
    }
}

void copy_children(xmlNodePtr parent, dom::HtmlNode& out) {
    for (xmlNodePtr child = parent->children; child; child = child->next) {
        dom::HtmlNode copy;
        if (copy_node(child, copy)) {
            out.children.push_back(std::move(copy));
        }
    }
}

} // namespace

dom::HtmlNode parse(std::string const& html) {
    dom::HtmlNode root;
    root.type = dom::NodeType::Document;
    if (html.empty()) return root;

    xmlInitParser();

    // Parse as HTML (tolerant), suppress errors/warnings, and forbid network fetches.
    int const options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

    std::string sanitized = escape_non_tag_angle_brackets(html);
    std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc(
        htmlReadMemory(sanitized.c_str(), static_cast<int>(sanitized.size()), nullptr, "UTF-8", options),
        &xmlFreeDoc);
    if (!doc) {
        throw ParseError("libxml2 could not parse the HTML input");
    }

    copy_children(reinterpret_cast<xmlNodePtr>(doc.get()), root);
    return root;
}

} // namespace blankline_cpp::libxml2
