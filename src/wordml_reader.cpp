/// @file wordml_reader.cpp
/// @brief libxml2-based WordprocessingML reader
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "wordml.h"
#include "log.h"
#include "text_utils.h"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blankline_cpp::wordml {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

std::string_view localName(xmlNodePtr node) {
    if (!node || node->type != XML_ELEMENT_NODE || !node->name) return {};
    return reinterpret_cast<char const*>(node->name);
}

bool is(xmlNodePtr node, std::string_view name) {
    return localName(node) == name;
}

// Attribute by local name, ignoring its prefix (w:val, r:id, ...).
std::optional<std::string> attribute(xmlNodePtr node, std::string_view name) {
    if (!node || node->type != XML_ELEMENT_NODE) return std::nullopt;
    for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
        if (!attr->name || std::string_view(reinterpret_cast<char const*>(attr->name)) != name) continue;
        xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
        std::string result = value ? reinterpret_cast<char const*>(value) : "";
        if (value) xmlFree(value);
        return result;
    }
    return std::nullopt;
}

std::optional<long long> integerAttribute(xmlNodePtr node, std::string_view name) {
    auto value = attribute(node, name);
    if (!value || value->empty()) return std::nullopt;
    char* end = nullptr;
    long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (end == value->c_str()) return std::nullopt;
    return parsed;
}

// Twips, list ids and levels are ints; a wider value is malformed input.
std::optional<int> intAttribute(xmlNodePtr node, std::string_view name) {
    auto value = integerAttribute(node, name);
    if (!value) return std::nullopt;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        throw ParseError("attribute " + std::string(name) + " out of range: " + std::to_string(*value));
    }
    return static_cast<int>(*value);
}

// On/off properties (w:b, w:i): present means on unless w:val says otherwise.
bool toggle(xmlNodePtr node) {
    auto value = attribute(node, "val");
    return !value || (*value != "0" && *value != "false" && *value != "off");
}

xmlNodePtr firstChild(xmlNodePtr node, std::string_view name) {
    for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
        if (is(child, name)) return child;
    }
    return nullptr;
}

xmlNodePtr firstDescendant(xmlNodePtr node, std::string_view name) {
    for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
        if (is(child, name)) return child;
        if (xmlNodePtr found = firstDescendant(child, name)) return found;
    }
    return nullptr;
}

std::string nodeText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    std::string text = content ? reinterpret_cast<char const*>(content) : "";
    if (content) xmlFree(content);
    return text;
}

// Text of the w:t / w:delText / w:tab descendants, in order. Field
// instructions (w:instrText) are skipped.
void collectRunText(xmlNodePtr node, std::ostringstream& out) {
    for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
        if (is(child, "t") || is(child, "delText")) {
            out << nodeText(child);
        } else if (is(child, "tab")) {
            out << '\t';
        } else if (child->type == XML_ELEMENT_NODE) {
            collectRunText(child, out);
        }
    }
}

std::string runText(xmlNodePtr node) {
    std::ostringstream out;
    collectRunText(node, out);
    return out.str();
}

XmlDocPtr parseXml(std::string const& xml, char const* part) {
    xmlInitParser();
    xmlDocPtr doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, "UTF-8",
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!doc) {
        std::string message = std::string("malformed ") + part;
        if (xmlError const* error = xmlGetLastError(); error && error->message) {
            message += ": ";
            message += trimStr(error->message);
        }
        throw ParseError(message);
    }
    return XmlDocPtr(doc, &xmlFreeDoc);
}

Alignment toAlignment(std::string const& value) {
    if (value == "center") return Alignment::Center;
    if (value == "right" || value == "end") return Alignment::Right;
    if (value == "both" || value == "distribute") return Alignment::Both;
    return Alignment::Left;
}

RunFormatting readRunProperties(xmlNodePtr rPr) {
    RunFormatting formatting;
    if (!rPr) return formatting;
    if (xmlNodePtr b = firstChild(rPr, "b")) formatting.bold = toggle(b);
    if (xmlNodePtr i = firstChild(rPr, "i")) formatting.italic = toggle(i);
    if (auto halfPoints = integerAttribute(firstChild(rPr, "sz"), "val")) {
        formatting.fontSize = static_cast<double>(*halfPoints) / 2.0;
    }
    if (xmlNodePtr fonts = firstChild(rPr, "rFonts")) {
        if (auto ascii = attribute(fonts, "ascii")) formatting.fontFamily = *ascii;
    }
    return formatting;
}

/// Reads one body, cell or text-box block sequence into a Document or cell.
class Reader {
public:
    template<typename Container>
    void readBlocks(xmlNodePtr parent, Container& container);

private:
    Paragraph readParagraph(xmlNodePtr p);
    Table readTable(xmlNodePtr tbl);

    void readParagraphProperties(xmlNodePtr pPr, Paragraph& paragraph);
    void readInline(xmlNodePtr node, std::vector<ContentItem>& items, Paragraph& paragraph);
    void readRun(xmlNodePtr r, std::vector<ContentItem>& items, Paragraph& paragraph);
    void flushField(std::vector<ContentItem>& items, Paragraph& paragraph);

    // Complex field (w:fldChar) state of the paragraph being read.
    enum class FieldState { None, Instruction, Result };
    FieldState fieldState_ = FieldState::None;
    std::string fieldInstruction_;
    std::string fieldResult_;
};

template<typename Container>
void Reader::readBlocks(xmlNodePtr parent, Container& container) {
    for (xmlNodePtr child = parent ? parent->children : nullptr; child; child = child->next) {
        if (is(child, "p")) {
            container.addParagraph(readParagraph(child));
        } else if (is(child, "tbl")) {
            container.addTable(readTable(child));
        } else if (is(child, "sdt")) {
            readBlocks(firstChild(child, "sdtContent"), container);
        } else if (is(child, "customXml") || is(child, "ins")) {
            readBlocks(child, container);
        }
    }
}

void Reader::readParagraphProperties(xmlNodePtr pPr, Paragraph& paragraph) {
    if (!pPr) return;

    if (auto style = attribute(firstChild(pPr, "pStyle"), "val")) {
        paragraph.setStyle(*style);
    }

    if (xmlNodePtr numPr = firstChild(pPr, "numPr")) {
        auto numId = intAttribute(firstChild(numPr, "numId"), "val");
        auto level = intAttribute(firstChild(numPr, "ilvl"), "val");
        if (numId) {
            paragraph.setNumbering(Numbering{*numId, level.value_or(0)});
        }
    }

    if (xmlNodePtr ind = firstChild(pPr, "ind")) {
        auto left = intAttribute(ind, "left");
        if (!left) left = intAttribute(ind, "start");
        if (left) paragraph.setLeftIndent(*left);
    }

    if (xmlNodePtr spacing = firstChild(pPr, "spacing")) {
        if (auto before = intAttribute(spacing, "before")) paragraph.setSpaceBefore(*before);
        if (auto after = intAttribute(spacing, "after")) paragraph.setSpaceAfter(*after);
        if (auto line = intAttribute(spacing, "line")) paragraph.setLineSpacing(*line);
    }

    if (auto jc = attribute(firstChild(pPr, "jc"), "val")) {
        paragraph.setAlignment(toAlignment(*jc));
    }

    if (xmlNodePtr rPr = firstChild(pPr, "rPr")) {
        paragraph.markFormatting() = readRunProperties(rPr);
    }
}

void Reader::flushField(std::vector<ContentItem>& items, Paragraph& paragraph) {
    std::string instruction = trimStr(fieldInstruction_);
    if (startsWith(instruction, "TOC")) paragraph.setPreserved(true);
    items.push_back(ContentItem::field(std::move(instruction), std::move(fieldResult_)));
    fieldInstruction_.clear();
    fieldResult_.clear();
    fieldState_ = FieldState::None;
}

void Reader::readRun(xmlNodePtr r, std::vector<ContentItem>& items, Paragraph& paragraph) {
    RunFormatting formatting = readRunProperties(firstChild(r, "rPr"));
    std::string text;

    auto flushText = [&] {
        if (text.empty()) return;
        if (fieldState_ == FieldState::Result) {
            fieldResult_ += text;
        } else if (fieldState_ == FieldState::None) {
            items.push_back(ContentItem::run(std::move(text), formatting));
        }
        text.clear();
    };

    for (xmlNodePtr child = r->children; child; child = child->next) {
        if (is(child, "t") || is(child, "delText")) {
            text += nodeText(child);
        } else if (is(child, "tab")) {
            text += '\t';
        } else if (is(child, "br") || is(child, "cr")) {
            text += '\n';
        } else if (is(child, "instrText")) {
            if (fieldState_ == FieldState::Instruction) fieldInstruction_ += nodeText(child);
        } else if (is(child, "fldChar")) {
            flushText();
            auto type = attribute(child, "fldCharType").value_or("");
            if (type == "begin") {
                fieldState_ = FieldState::Instruction;
                fieldInstruction_.clear();
                fieldResult_.clear();
            } else if (type == "separate" && fieldState_ != FieldState::None) {
                fieldState_ = FieldState::Result;
            } else if (type == "end" && fieldState_ != FieldState::None) {
                flushField(items, paragraph);
            }
        } else if (is(child, "drawing") || is(child, "pict") || is(child, "object")
                   || is(child, "AlternateContent")) {
            flushText();
            if (xmlNodePtr textBox = firstDescendant(child, "txbxContent")) {
                items.push_back(ContentItem::textBox(runText(textBox)));
            } else if (xmlNodePtr extent = firstDescendant(child, "extent")) {
                ContentItem image = ContentItem::imageRun(integerAttribute(extent, "cx").value_or(0),
                                                          integerAttribute(extent, "cy").value_or(0));
                image.formatting = formatting;
                if (auto name = attribute(firstDescendant(child, "docPr"), "name")) image.image.name = *name;
                if (auto embed = attribute(firstDescendant(child, "blip"), "embed")) {
                    image.image.relationshipId = *embed;
                }
                items.push_back(std::move(image));
            } else {
                items.push_back(ContentItem::shape());
            }
        }
    }
    flushText();
}

void Reader::readInline(xmlNodePtr node, std::vector<ContentItem>& items, Paragraph& paragraph) {
    if (is(node, "r")) {
        readRun(node, items, paragraph);
    } else if (is(node, "hyperlink")) {
        std::string target;
        if (auto id = attribute(node, "id")) {
            target = *id;
        } else if (auto anchor = attribute(node, "anchor")) {
            target = "#" + *anchor;
        }
        items.push_back(ContentItem::hyperlink(runText(node), std::move(target)));
    } else if (is(node, "fldSimple")) {
        std::string instruction = trimStr(attribute(node, "instr").value_or(""));
        if (startsWith(instruction, "TOC")) paragraph.setPreserved(true);
        items.push_back(ContentItem::field(std::move(instruction), runText(node)));
    } else if (is(node, "ins") || is(node, "del")) {
        std::vector<ContentItem> children;
        for (xmlNodePtr child = node->children; child; child = child->next) {
            readInline(child, children, paragraph);
        }
        ContentItem revision = ContentItem::revision(is(node, "ins") ? RevisionType::Insert : RevisionType::Delete,
                                                     std::move(children));
        revision.author = attribute(node, "author").value_or("");
        items.push_back(std::move(revision));
    } else if (is(node, "bookmarkStart")) {
        paragraph.addBookmarkStart(attribute(node, "name").value_or(""));
    } else if (is(node, "bookmarkEnd")) {
        paragraph.addBookmarkEnd(attribute(node, "id").value_or(""));
    } else if (is(node, "sdt")) {
        if (xmlNodePtr content = firstChild(node, "sdtContent")) {
            for (xmlNodePtr child = content->children; child; child = child->next) {
                readInline(child, items, paragraph);
            }
        }
    } else if (is(node, "smartTag") || is(node, "customXml")) {
        for (xmlNodePtr child = node->children; child; child = child->next) {
            readInline(child, items, paragraph);
        }
    }
}

Paragraph Reader::readParagraph(xmlNodePtr p) {
    Paragraph paragraph;
    readParagraphProperties(firstChild(p, "pPr"), paragraph);

    fieldState_ = FieldState::None;
    std::vector<ContentItem> items;
    for (xmlNodePtr child = p->children; child; child = child->next) {
        readInline(child, items, paragraph);
    }
    // A field may continue into later paragraphs (a TOC usually does).
    if (fieldState_ != FieldState::None) flushField(items, paragraph);

    for (auto& item : items) {
        paragraph.addContent(std::move(item));
    }
    return paragraph;
}

Table Reader::readTable(xmlNodePtr tbl) {
    Table table;
    for (xmlNodePtr tr = tbl->children; tr; tr = tr->next) {
        if (!is(tr, "tr")) continue;
        TableRow row;
        for (xmlNodePtr tc = tr->children; tc; tc = tc->next) {
            if (!is(tc, "tc")) continue;
            TableCell cell;
            readBlocks(tc, cell);
            // Every cell holds at least one paragraph.
            if (cell.paragraphCount() == 0) cell.addParagraph(Paragraph{});
            row.addCell(std::move(cell));
        }
        table.addRow(std::move(row));
    }
    return table;
}

} // namespace

Document read(std::string const& documentXml, std::string const& stylesXml) {
    XmlDocPtr xml = parseXml(documentXml, "document part");

    xmlNodePtr root = xmlDocGetRootElement(xml.get());
    xmlNodePtr body = is(root, "document") ? firstChild(root, "body") : nullptr;
    if (!body) {
        throw ParseError("document part has no w:body");
    }

    Document document;
    Reader reader;
    reader.readBlocks(body, document);

    if (!stylesXml.empty()) {
        readStyles(document, stylesXml);
    }

    logger("WordmlReader")->debug("Read {} body elements, {} tables, {} styles",
                                  document.bodyElementCount(), document.allTables().size(),
                                  document.styles().size());
    return document;
}

void readStyles(Document& document, std::string const& stylesXml) {
    XmlDocPtr xml = parseXml(stylesXml, "styles part");

    xmlNodePtr root = xmlDocGetRootElement(xml.get());
    if (!is(root, "styles")) {
        throw ParseError("styles part has no w:styles root");
    }

    for (xmlNodePtr node = root->children; node; node = node->next) {
        if (!is(node, "style")) continue;
        if (attribute(node, "type").value_or("paragraph") != "paragraph") continue;

        StyleDefinition style;
        style.id = attribute(node, "styleId").value_or("");
        if (style.id.empty()) continue;
        style.name = attribute(firstChild(node, "name"), "val").value_or(style.id);

        if (xmlNodePtr ind = firstChild(firstChild(node, "pPr"), "ind")) {
            style.hasIndentation = true;
            auto left = intAttribute(ind, "left");
            if (!left) left = intAttribute(ind, "start");
            if (left) style.leftIndent = *left;
        }
        document.addStyle(std::move(style));
    }
}

} // namespace blankline_cpp::wordml
