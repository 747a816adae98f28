/// @file wordml_writer.cpp
/// @brief libxml2-based WordprocessingML writer
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "wordml.h"

#include <libxml/tree.h>
#include <libxml/xmlmemory.h>

#include <cmath>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace blankline_cpp::wordml {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

constexpr char const* kRelationshipsNamespace =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr char const* kDrawingNamespace =
    "http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing";
constexpr char const* kDrawingMainNamespace =
    "http://schemas.openxmlformats.org/drawingml/2006/main";
constexpr char const* kPictureNamespace =
    "http://schemas.openxmlformats.org/drawingml/2006/picture";
constexpr char const* kVmlNamespace = "urn:schemas-microsoft-com:vml";

xmlChar const* x(char const* s) {
    return reinterpret_cast<xmlChar const*>(s);
}

class Writer {
public:
    Writer();

    std::string serialize(Document const& document);

private:
    xmlNodePtr element(xmlNodePtr parent, xmlNsPtr ns, char const* name);
    void set(xmlNodePtr node, xmlNsPtr ns, char const* name, std::string const& value);

    void writeBlock(xmlNodePtr parent, Element const& block);
    void writeParagraph(xmlNodePtr parent, Paragraph const& paragraph);
    void writeParagraphProperties(xmlNodePtr p, Paragraph const& paragraph);
    void writeRunProperties(xmlNodePtr parent, RunFormatting const& formatting);
    void writeTable(xmlNodePtr parent, Table const& table);
    void writeItem(xmlNodePtr parent, ContentItem const& item, bool deleted);
    void writeText(xmlNodePtr run, std::string_view text, bool deleted);
    void writeImage(xmlNodePtr run, Image const& image);

    XmlDocPtr doc_;
    xmlNsPtr w_ = nullptr;
    xmlNsPtr r_ = nullptr;
    xmlNsPtr wp_ = nullptr;
    xmlNsPtr a_ = nullptr;
    xmlNsPtr pic_ = nullptr;
    xmlNsPtr v_ = nullptr;
    int drawingId_ = 0;
};

Writer::Writer()
    : doc_(xmlNewDoc(x("1.0")), &xmlFreeDoc) {}

xmlNodePtr Writer::element(xmlNodePtr parent, xmlNsPtr ns, char const* name) {
    return xmlNewChild(parent, ns, x(name), nullptr);
}

void Writer::set(xmlNodePtr node, xmlNsPtr ns, char const* name, std::string const& value) {
    xmlNewNsProp(node, ns, x(name), x(value.c_str()));
}

std::string Writer::serialize(Document const& document) {
    xmlNodePtr root = xmlNewDocNode(doc_.get(), nullptr, x("document"), nullptr);
    xmlDocSetRootElement(doc_.get(), root);

    w_ = xmlNewNs(root, x(kMainNamespace), x("w"));
    r_ = xmlNewNs(root, x(kRelationshipsNamespace), x("r"));
    wp_ = xmlNewNs(root, x(kDrawingNamespace), x("wp"));
    a_ = xmlNewNs(root, x(kDrawingMainNamespace), x("a"));
    pic_ = xmlNewNs(root, x(kPictureNamespace), x("pic"));
    v_ = xmlNewNs(root, x(kVmlNamespace), x("v"));
    xmlSetNs(root, w_);

    xmlNodePtr body = element(root, w_, "body");
    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        writeBlock(body, *document.bodyElementAt(i));
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc_.get(), &buffer, &size, "UTF-8", 1);
    std::string xml = buffer ? std::string(reinterpret_cast<char const*>(buffer), static_cast<std::size_t>(size)) : "";
    if (buffer) xmlFree(buffer);
    return xml;
}

void Writer::writeBlock(xmlNodePtr parent, Element const& block) {
    if (auto const* paragraph = block.asParagraph()) {
        writeParagraph(parent, *paragraph);
    } else if (auto const* table = block.asTable()) {
        writeTable(parent, *table);
    }
}

void Writer::writeParagraphProperties(xmlNodePtr p, Paragraph const& paragraph) {
    auto const& formatting = paragraph.formatting();
    RunFormatting const& mark = paragraph.markFormatting();
    bool hasMark = mark.bold || mark.italic || mark.fontSize || mark.fontFamily;

    bool empty = paragraph.style().empty() && !paragraph.numbering() && !formatting.leftIndent
        && !formatting.spaceBefore && !formatting.spaceAfter && !formatting.lineSpacing
        && formatting.alignment == Alignment::Left && !hasMark;
    if (empty) return;

    xmlNodePtr pPr = element(p, w_, "pPr");
    if (!paragraph.style().empty()) {
        set(element(pPr, w_, "pStyle"), w_, "val", paragraph.style());
    }
    if (auto const& numbering = paragraph.numbering()) {
        xmlNodePtr numPr = element(pPr, w_, "numPr");
        set(element(numPr, w_, "ilvl"), w_, "val", std::to_string(numbering->level));
        set(element(numPr, w_, "numId"), w_, "val", std::to_string(numbering->numId));
    }
    if (formatting.spaceBefore || formatting.spaceAfter || formatting.lineSpacing) {
        xmlNodePtr spacing = element(pPr, w_, "spacing");
        if (formatting.spaceBefore) set(spacing, w_, "before", std::to_string(*formatting.spaceBefore));
        if (formatting.spaceAfter) set(spacing, w_, "after", std::to_string(*formatting.spaceAfter));
        if (formatting.lineSpacing) set(spacing, w_, "line", std::to_string(*formatting.lineSpacing));
    }
    if (formatting.leftIndent) {
        set(element(pPr, w_, "ind"), w_, "left", std::to_string(*formatting.leftIndent));
    }
    if (formatting.alignment != Alignment::Left) {
        char const* jc = formatting.alignment == Alignment::Center ? "center"
                       : formatting.alignment == Alignment::Right  ? "right"
                                                                   : "both";
        set(element(pPr, w_, "jc"), w_, "val", jc);
    }
    if (hasMark) writeRunProperties(pPr, mark);
}

void Writer::writeRunProperties(xmlNodePtr parent, RunFormatting const& formatting) {
    if (!formatting.bold && !formatting.italic && !formatting.fontSize && !formatting.fontFamily) return;

    xmlNodePtr rPr = element(parent, w_, "rPr");
    if (formatting.fontFamily) {
        xmlNodePtr fonts = element(rPr, w_, "rFonts");
        set(fonts, w_, "ascii", *formatting.fontFamily);
        set(fonts, w_, "hAnsi", *formatting.fontFamily);
    }
    if (formatting.bold) element(rPr, w_, "b");
    if (formatting.italic) element(rPr, w_, "i");
    if (formatting.fontSize) {
        auto halfPoints = std::lround(*formatting.fontSize * 2.0);
        set(element(rPr, w_, "sz"), w_, "val", std::to_string(halfPoints));
    }
}

void Writer::writeText(xmlNodePtr run, std::string_view text, bool deleted) {
    char const* textElement = deleted ? "delText" : "t";
    std::string pending;

    auto flush = [&] {
        if (pending.empty()) return;
        xmlNodePtr t = xmlNewTextChild(run, w_, x(textElement), x(pending.c_str()));
        xmlNodeSetSpacePreserve(t, 1);
        pending.clear();
    };

    for (char c : text) {
        if (c == '\t') {
            flush();
            element(run, w_, "tab");
        } else if (c == '\n') {
            flush();
            element(run, w_, "br");
        } else {
            pending.push_back(c);
        }
    }
    flush();
}

void Writer::writeImage(xmlNodePtr run, Image const& image) {
    xmlNodePtr inlineNode = element(element(run, w_, "drawing"), wp_, "inline");

    xmlNodePtr extent = element(inlineNode, wp_, "extent");
    xmlNewProp(extent, x("cx"), x(std::to_string(image.widthEmu).c_str()));
    xmlNewProp(extent, x("cy"), x(std::to_string(image.heightEmu).c_str()));

    xmlNodePtr docPr = element(inlineNode, wp_, "docPr");
    xmlNewProp(docPr, x("id"), x(std::to_string(++drawingId_).c_str()));
    xmlNewProp(docPr, x("name"), x(image.name.c_str()));

    xmlNodePtr graphicData = element(element(inlineNode, a_, "graphic"), a_, "graphicData");
    xmlNewProp(graphicData, x("uri"), x(kPictureNamespace));
    xmlNodePtr blipFill = element(element(graphicData, pic_, "pic"), pic_, "blipFill");
    xmlNodePtr blip = element(blipFill, a_, "blip");
    if (!image.relationshipId.empty()) set(blip, r_, "embed", image.relationshipId);
}

void Writer::writeItem(xmlNodePtr parent, ContentItem const& item, bool deleted) {
    switch (item.kind) {
        case ContentKind::Run: {
            xmlNodePtr run = element(parent, w_, "r");
            writeRunProperties(run, item.formatting);
            writeText(run, item.text, deleted);
            break;
        }
        case ContentKind::ImageRun: {
            xmlNodePtr run = element(parent, w_, "r");
            writeRunProperties(run, item.formatting);
            writeImage(run, item.image);
            break;
        }
        case ContentKind::Hyperlink: {
            xmlNodePtr link = element(parent, w_, "hyperlink");
            if (!item.target.empty() && item.target.front() == '#') {
                set(link, w_, "anchor", item.target.substr(1));
            } else if (!item.target.empty()) {
                set(link, r_, "id", item.target);
            }
            writeText(element(link, w_, "r"), item.text, deleted);
            break;
        }
        case ContentKind::Field: {
            xmlNodePtr field = element(parent, w_, "fldSimple");
            set(field, w_, "instr", item.target);
            if (!item.text.empty()) writeText(element(field, w_, "r"), item.text, deleted);
            break;
        }
        case ContentKind::Shape:
            element(element(element(parent, w_, "r"), w_, "pict"), v_, "rect");
            break;
        case ContentKind::TextBox: {
            xmlNodePtr shape = element(element(element(parent, w_, "r"), w_, "pict"), v_, "shape");
            xmlNodePtr content = element(element(shape, v_, "textbox"), w_, "txbxContent");
            writeText(element(element(content, w_, "p"), w_, "r"), item.text, false);
            break;
        }
        case ContentKind::Revision: {
            bool isDelete = item.revisionType == RevisionType::Delete;
            xmlNodePtr revision = element(parent, w_, isDelete ? "del" : "ins");
            set(revision, w_, "id", std::to_string(++drawingId_));
            if (!item.author.empty()) set(revision, w_, "author", item.author);
            for (auto const& child : item.children) {
                writeItem(revision, child, isDelete);
            }
            break;
        }
    }
}

void Writer::writeParagraph(xmlNodePtr parent, Paragraph const& paragraph) {
    xmlNodePtr p = element(parent, w_, "p");
    writeParagraphProperties(p, paragraph);

    for (auto const& name : paragraph.bookmarksStart()) {
        set(element(p, w_, "bookmarkStart"), w_, "name", name);
    }
    for (auto const& item : paragraph.content()) {
        writeItem(p, item, false);
    }
    for (auto const& id : paragraph.bookmarksEnd()) {
        set(element(p, w_, "bookmarkEnd"), w_, "id", id);
    }
}

void Writer::writeTable(xmlNodePtr parent, Table const& table) {
    xmlNodePtr tbl = element(parent, w_, "tbl");
    element(tbl, w_, "tblPr");
    for (auto const& row : table.rows()) {
        xmlNodePtr tr = element(tbl, w_, "tr");
        for (auto const& cell : row.cells()) {
            xmlNodePtr tc = element(tr, w_, "tc");
            for (auto const& block : cell.blocks()) {
                writeBlock(tc, *block);
            }
        }
    }
}

} // namespace

std::string write(Document const& document) {
    Writer writer;
    return writer.serialize(document);
}

} // namespace blankline_cpp::wordml
