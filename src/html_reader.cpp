/// @file html_reader.cpp
/// @brief Build a Document from a parsed HTML tree
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "html_reader.h"
#include "dom_adapter.h"
#include "image_checks.h"
#include "log.h"
#include "text_utils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace blankline_cpp::html {

namespace {

constexpr int kTwipsPerPixel = 15;
constexpr int kTwipsPerPoint = 20;
constexpr int kTwipsPerInch = 1440;

bool isOneOf(std::string_view tag, std::initializer_list<std::string_view> names) {
    return std::find(names.begin(), names.end(), tag) != names.end();
}

bool isBlockTag(std::string_view tag) {
    return isOneOf(tag, {"p", "div", "h1", "h2", "h3", "h4", "h5", "h6", "ul", "ol", "li", "table",
                         "blockquote", "section", "article", "header", "footer", "main", "nav",
                         "center", "hr", "pre", "body", "html", "thead", "tbody", "tfoot", "tr"});
}

bool hasBlockChildren(dom::HtmlNode const& node) {
    return std::any_of(node.children.begin(), node.children.end(), [](dom::HtmlNode const& child) {
        return child.isElement() && isBlockTag(child.tag);
    });
}

// Collapses runs of ASCII whitespace to one space, as HTML rendering does.
std::string collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool inSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!inSpace) out.push_back(' ');
            inSpace = true;
        } else {
            out.push_back(c);
            inSpace = false;
        }
    }
    return out;
}

std::string textContent(dom::HtmlNode const& node) {
    if (node.isText()) return node.text;
    std::string text;
    for (auto const& child : node.children) {
        text += textContent(child);
    }
    return text;
}

std::optional<std::string_view> cssValue(std::string_view style, std::string_view property) {
    std::size_t pos = 0;
    while (pos < style.size()) {
        std::size_t end = style.find(';', pos);
        std::string_view declaration = style.substr(pos, end == std::string_view::npos ? std::string_view::npos
                                                                                        : end - pos);
        std::size_t colon = declaration.find(':');
        if (colon != std::string_view::npos) {
            std::string name = toLower(trimStr(declaration.substr(0, colon)));
            if (name == property) {
                std::string_view value = declaration.substr(colon + 1);
                while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
                while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
                return value;
            }
        }
        if (end == std::string_view::npos) break;
        pos = end + 1;
    }
    return std::nullopt;
}

std::optional<std::int64_t> pixelAttribute(dom::HtmlNode const& node, std::string_view name) {
    std::string value(node.attribute(name));
    if (value.empty()) return std::nullopt;
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || parsed < 0) return std::nullopt;
    return static_cast<std::int64_t>(std::llround(parsed));
}

Alignment alignmentOf(dom::HtmlNode const& node) {
    std::string align = toLower(node.attribute("align"));
    if (auto textAlign = cssValue(node.attribute("style"), "text-align")) {
        align = toLower(*textAlign);
    }
    if (align == "center") return Alignment::Center;
    if (align == "right") return Alignment::Right;
    if (align == "justify") return Alignment::Both;
    return Alignment::Left;
}

class Builder {
public:
    Document build(dom::HtmlNode const& root);

private:
    template<typename Container>
    void readBlocks(dom::HtmlNode const& parent, Container& container);

    template<typename Container>
    void readList(dom::HtmlNode const& list, Container& container, int numId, int level);

    Table readTable(dom::HtmlNode const& table);
    void readRows(dom::HtmlNode const& parent, Table& table);

    Paragraph paragraphFor(dom::HtmlNode const& element);
    void readInline(dom::HtmlNode const& node, Paragraph& paragraph, RunFormatting formatting);

    int nextNumId_ = 1;
};

Document Builder::build(dom::HtmlNode const& root) {
    Document document;
    dom::HtmlNode const* body = root.find("body");
    readBlocks(body ? *body : root, document);
    return document;
}

// Inline content between blocks is gathered into an anonymous paragraph.
template<typename Container>
void Builder::readBlocks(dom::HtmlNode const& parent, Container& container) {
    Paragraph pending;
    bool hasPending = false;

    auto flush = [&] {
        if (hasPending && !pending.content().empty()) {
            container.addParagraph(std::move(pending));
        }
        pending = Paragraph{};
        hasPending = false;
    };

    for (auto const& child : parent.children) {
        if (child.isText() || !isBlockTag(child.tag)) {
            if (child.isText() && isBlankText(child.text) && !hasPending) continue;
            readInline(child, pending, RunFormatting{});
            hasPending = true;
            continue;
        }

        flush();
        std::string_view tag = child.tag;
        if (tag == "ul" || tag == "ol") {
            readList(child, container, nextNumId_++, 0);
        } else if (tag == "table") {
            container.addTable(readTable(child));
        } else if (tag == "hr") {
            continue;
        } else if ((tag == "div" || tag == "center" || tag == "blockquote" || tag == "section"
                    || tag == "article" || tag == "header" || tag == "footer" || tag == "main"
                    || tag == "nav" || tag == "body" || tag == "html" || tag == "li")
                   && hasBlockChildren(child)) {
            readBlocks(child, container);
        } else {
            container.addParagraph(paragraphFor(child));
        }
    }
    flush();
}

template<typename Container>
void Builder::readList(dom::HtmlNode const& list, Container& container, int numId, int level) {
    for (auto const& item : list.children) {
        if (!item.hasTag("li")) continue;

        Paragraph paragraph = paragraphFor(item);
        paragraph.setStyle("ListParagraph");
        paragraph.setNumbering(Numbering{numId, level});
        container.addParagraph(std::move(paragraph));

        for (auto const& nested : item.children) {
            if (nested.hasTag("ul") || nested.hasTag("ol")) {
                readList(nested, container, numId, level + 1);
            }
        }
    }
}

Table Builder::readTable(dom::HtmlNode const& table) {
    Table result;
    readRows(table, result);
    return result;
}

void Builder::readRows(dom::HtmlNode const& parent, Table& table) {
    for (auto const& child : parent.children) {
        if (child.hasTag("thead") || child.hasTag("tbody") || child.hasTag("tfoot")) {
            readRows(child, table);
            continue;
        }
        if (!child.hasTag("tr")) continue;

        TableRow row;
        for (auto const& cellNode : child.children) {
            if (!cellNode.hasTag("td") && !cellNode.hasTag("th")) continue;
            TableCell cell;
            readBlocks(cellNode, cell);
            if (cell.paragraphCount() == 0) cell.addParagraph(Paragraph{});
            row.addCell(std::move(cell));
        }
        table.addRow(std::move(row));
    }
}

Paragraph Builder::paragraphFor(dom::HtmlNode const& element) {
    Paragraph paragraph;

    std::string_view tag = element.tag;
    if (tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6') {
        paragraph.setStyle("Heading" + std::string(1, tag[1]));
    }
    paragraph.setAlignment(alignmentOf(element));
    if (auto indent = cssLeftIndent(element.attribute("style"))) {
        paragraph.setLeftIndent(*indent);
    }

    for (auto const& child : element.children) {
        if (child.hasTag("ul") || child.hasTag("ol")) continue;   // nested lists follow as items
        if (child.isText() && isBlankText(child.text) && paragraph.content().empty()) continue;
        readInline(child, paragraph, RunFormatting{});
    }
    return paragraph;
}

void Builder::readInline(dom::HtmlNode const& node, Paragraph& paragraph, RunFormatting formatting) {
    if (node.isText()) {
        std::string text = collapseWhitespace(node.text);
        if (!text.empty()) paragraph.addContent(ContentItem::run(std::move(text), formatting));
        return;
    }

    std::string_view tag = node.tag;
    if (tag == "b" || tag == "strong") {
        formatting.bold = true;
    } else if (tag == "i" || tag == "em") {
        formatting.italic = true;
    } else if (tag == "br") {
        paragraph.addContent(ContentItem::run("\n", formatting));
        return;
    } else if (tag == "img") {
        ContentItem image = ContentItem::imageRun(pixelAttribute(node, "width").value_or(0) * kEmuPerPixel,
                                                  pixelAttribute(node, "height").value_or(0) * kEmuPerPixel);
        image.image.name = std::string(node.attribute("alt"));
        image.image.relationshipId = std::string(node.attribute("src"));
        paragraph.addContent(std::move(image));
        return;
    } else if (tag == "a" && !node.attribute("href").empty()) {
        paragraph.addContent(ContentItem::hyperlink(trimStr(collapseWhitespace(textContent(node))),
                                                    std::string(node.attribute("href"))));
        return;
    } else if (tag == "script" || tag == "style" || tag == "head" || tag == "title") {
        return;
    }

    for (auto const& child : node.children) {
        readInline(child, paragraph, formatting);
    }
}

} // namespace

std::optional<int> cssLeftIndent(std::string_view style) {
    static constexpr auto kProperties = std::to_array<std::string_view>({"margin-left", "padding-left"});

    for (std::string_view property : kProperties) {
        auto value = cssValue(style, property);
        if (!value || value->empty()) continue;

        std::string text(*value);
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (end == text.c_str()) continue;

        std::string unit = toLower(trimStr(std::string_view(end)));
        double twips = 0.0;
        if (unit.empty() || unit == "px") {
            twips = number * kTwipsPerPixel;
        } else if (unit == "pt") {
            twips = number * kTwipsPerPoint;
        } else if (unit == "in") {
            twips = number * kTwipsPerInch;
        } else {
            continue;
        }
        return static_cast<int>(std::lround(twips));
    }
    return std::nullopt;
}

Document build(dom::HtmlNode const& root) {
    Builder builder;
    return builder.build(root);
}

Document read(std::string const& html) {
    dom::HtmlNode root = dom::parse(html);
    Document document = build(root);
    logger("HtmlReader")->debug("Read {} body elements with the {} backend",
                                document.bodyElementCount(), dom::backendName());
    return document;
}

} // namespace blankline_cpp::html
