/// @file html_node.h
/// @brief Parser-independent, owning HTML node tree
///
/// Each HTML backend converts its own DOM into this tree so that the HTML
/// reader never touches parser types.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_HTML_NODE_H
#define BLANKLINE_CPP_HTML_NODE_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blankline_cpp::dom {

/// @brief Node type enumeration (parser-agnostic)
enum class NodeType {
    Document,
    Element,
    Text
};

/// @struct HtmlNode
struct HtmlNode {
    NodeType type = NodeType::Element;
    std::string tag;    ///< Lowercase tag name for elements
    std::string text;   ///< Text of text nodes
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<HtmlNode> children;

    bool isElement() const { return type == NodeType::Element; }
    bool isText() const { return type == NodeType::Text; }
    bool hasTag(std::string_view name) const { return isElement() && tag == name; }

    /// @brief Attribute value by (lowercase) name, empty when absent
    std::string_view attribute(std::string_view name) const {
        for (auto const& [key, value] : attributes) {
            if (key == name) return value;
        }
        return {};
    }

    /// @brief First descendant element with tag @p name, depth-first
    HtmlNode const* find(std::string_view name) const {
        for (auto const& child : children) {
            if (child.hasTag(name)) return &child;
            if (auto const* found = child.find(name)) return found;
        }
        return nullptr;
    }
};

} // namespace blankline_cpp::dom

#endif // BLANKLINE_CPP_HTML_NODE_H
