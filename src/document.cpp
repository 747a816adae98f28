/// @file document.cpp
/// @brief In-memory document tree implementation
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "document.h"
#include "image_checks.h"
#include "paragraph_checks.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace blankline_cpp {

namespace {

std::vector<std::unique_ptr<Element>> cloneBlocks(std::vector<std::unique_ptr<Element>> const& blocks) {
    std::vector<std::unique_ptr<Element>> copy;
    copy.reserve(blocks.size());
    for (auto const& block : blocks) {
        copy.push_back(block->clone());
    }
    return copy;
}

void collectTables(Table& table, std::vector<Table*>& out) {
    out.push_back(&table);
    for (auto& row : table.rows()) {
        for (auto& cell : row.cells()) {
            for (auto const& block : cell.blocks()) {
                if (auto* nested = block->asTable()) {
                    collectTables(*nested, out);
                }
            }
        }
    }
}

} // namespace

// --- ContentItem factories ---

ContentItem ContentItem::run(std::string text, RunFormatting formatting) {
    ContentItem item;
    item.kind = ContentKind::Run;
    item.text = std::move(text);
    item.formatting = std::move(formatting);
    return item;
}

ContentItem ContentItem::boldRun(std::string text) {
    RunFormatting formatting;
    formatting.bold = true;
    return run(std::move(text), std::move(formatting));
}

ContentItem ContentItem::imageRun(std::int64_t widthEmu, std::int64_t heightEmu) {
    ContentItem item;
    item.kind = ContentKind::ImageRun;
    item.image.widthEmu = widthEmu;
    item.image.heightEmu = heightEmu;
    return item;
}

ContentItem ContentItem::hyperlink(std::string text, std::string target) {
    ContentItem item;
    item.kind = ContentKind::Hyperlink;
    item.text = std::move(text);
    item.target = std::move(target);
    return item;
}

ContentItem ContentItem::field(std::string instruction, std::string result) {
    ContentItem item;
    item.kind = ContentKind::Field;
    item.target = std::move(instruction);
    item.text = std::move(result);
    return item;
}

ContentItem ContentItem::shape() {
    ContentItem item;
    item.kind = ContentKind::Shape;
    return item;
}

ContentItem ContentItem::textBox(std::string text) {
    ContentItem item;
    item.kind = ContentKind::TextBox;
    item.text = std::move(text);
    return item;
}

ContentItem ContentItem::revision(RevisionType type, std::vector<ContentItem> children) {
    ContentItem item;
    item.kind = ContentKind::Revision;
    item.revisionType = type;
    item.children = std::move(children);
    return item;
}

std::string ContentItem::plainText() const {
    switch (kind) {
        case ContentKind::Run:
        case ContentKind::Hyperlink:
        case ContentKind::Field:
            return text;
        case ContentKind::Revision: {
            std::string out;
            for (auto const& child : children) {
                out += child.plainText();
            }
            return out;
        }
        default:
            return "";
    }
}

// --- Element ---

Paragraph* Element::asParagraph() {
    return isParagraph() ? static_cast<Paragraph*>(this) : nullptr;
}

Paragraph const* Element::asParagraph() const {
    return isParagraph() ? static_cast<Paragraph const*>(this) : nullptr;
}

Table* Element::asTable() {
    return isTable() ? static_cast<Table*>(this) : nullptr;
}

Table const* Element::asTable() const {
    return isTable() ? static_cast<Table const*>(this) : nullptr;
}

// --- Paragraph ---

Paragraph::Paragraph(std::string text) {
    content_.push_back(ContentItem::run(std::move(text)));
}

std::unique_ptr<Element> Paragraph::clone() const {
    return std::make_unique<Paragraph>(*this);
}

Paragraph& Paragraph::addContent(ContentItem item) {
    content_.push_back(std::move(item));
    return *this;
}

std::string Paragraph::text() const {
    std::string out;
    for (auto const& item : content_) {
        if (item.kind == ContentKind::Run
            || item.kind == ContentKind::Hyperlink
            || item.kind == ContentKind::Field) {
            out += item.text;
        }
    }
    return out;
}

Paragraph& Paragraph::setStyle(std::string style) {
    style_ = std::move(style);
    return *this;
}

Paragraph& Paragraph::setNumbering(std::optional<Numbering> numbering) {
    numbering_ = numbering;
    return *this;
}

Paragraph& Paragraph::setAlignment(Alignment alignment) {
    formatting_.alignment = alignment;
    return *this;
}

Paragraph& Paragraph::setLeftIndent(int twips) {
    formatting_.leftIndent = twips;
    return *this;
}

Paragraph& Paragraph::setSpaceBefore(int twips) {
    formatting_.spaceBefore = twips;
    return *this;
}

Paragraph& Paragraph::setSpaceAfter(int twips) {
    formatting_.spaceAfter = twips;
    return *this;
}

Paragraph& Paragraph::setLineSpacing(int twips) {
    formatting_.lineSpacing = twips;
    return *this;
}

Paragraph& Paragraph::addBookmarkStart(std::string name) {
    bookmarksStart_.push_back(std::move(name));
    return *this;
}

Paragraph& Paragraph::addBookmarkEnd(std::string name) {
    bookmarksEnd_.push_back(std::move(name));
    return *this;
}

Paragraph& Paragraph::setPreserved(bool preserved) {
    preserved_ = preserved;
    return *this;
}

// --- TableCell ---

TableCell::TableCell(TableCell const& other)
    : blocks_(cloneBlocks(other.blocks_)) {}

TableCell& TableCell::operator=(TableCell const& other) {
    if (this != &other) {
        blocks_ = cloneBlocks(other.blocks_);
    }
    return *this;
}

std::size_t TableCell::paragraphCount() const {
    return static_cast<std::size_t>(std::count_if(blocks_.begin(), blocks_.end(), [](auto const& block) {
        return block->isParagraph();
    }));
}

// Maps a paragraph index onto the block list; returns blocks_.size() when
// index equals the paragraph count.
std::size_t TableCell::blockIndexOfParagraph(std::size_t index) const {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        if (!blocks_[i]->isParagraph()) continue;
        if (seen == index) return i;
        ++seen;
    }
    return blocks_.size();
}

Paragraph* TableCell::paragraphAt(std::size_t index) {
    std::size_t blockIndex = blockIndexOfParagraph(index);
    if (blockIndex >= blocks_.size()) return nullptr;
    return blocks_[blockIndex]->asParagraph();
}

Paragraph const* TableCell::paragraphAt(std::size_t index) const {
    std::size_t blockIndex = blockIndexOfParagraph(index);
    if (blockIndex >= blocks_.size()) return nullptr;
    return blocks_[blockIndex]->asParagraph();
}

std::vector<Paragraph*> TableCell::paragraphs() {
    std::vector<Paragraph*> out;
    for (auto& block : blocks_) {
        if (auto* p = block->asParagraph()) out.push_back(p);
    }
    return out;
}

std::vector<Paragraph const*> TableCell::paragraphs() const {
    std::vector<Paragraph const*> out;
    for (auto const& block : blocks_) {
        if (auto const* p = block->asParagraph()) out.push_back(p);
    }
    return out;
}

TableCell& TableCell::addParagraph(Paragraph paragraph) {
    blocks_.push_back(std::make_unique<Paragraph>(std::move(paragraph)));
    return *this;
}

TableCell& TableCell::addTable(Table table) {
    blocks_.push_back(std::make_unique<Table>(std::move(table)));
    return *this;
}

void TableCell::insertParagraphAt(std::size_t index, Paragraph paragraph) {
    if (index > paragraphCount()) {
        throw std::out_of_range("TableCell::insertParagraphAt: index " + std::to_string(index));
    }
    std::size_t blockIndex = blockIndexOfParagraph(index);
    blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(blockIndex),
                   std::make_unique<Paragraph>(std::move(paragraph)));
}

void TableCell::removeParagraphAt(std::size_t index) {
    std::size_t blockIndex = blockIndexOfParagraph(index);
    if (blockIndex >= blocks_.size()) {
        throw std::out_of_range("TableCell::removeParagraphAt: index " + std::to_string(index));
    }
    blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(blockIndex));
}

bool TableCell::hasNestedTables() const {
    return std::any_of(blocks_.begin(), blocks_.end(), [](auto const& block) {
        return block->isTable();
    });
}

std::string TableCell::text() const {
    std::string out;
    bool first = true;
    for (auto const* p : paragraphs()) {
        if (!first) out += ' ';
        out += p->text();
        first = false;
    }
    return out;
}

// --- TableRow / Table ---

TableRow& TableRow::addCell(TableCell cell) {
    cells_.push_back(std::move(cell));
    return *this;
}

std::unique_ptr<Element> Table::clone() const {
    return std::make_unique<Table>(*this);
}

Table& Table::addRow(TableRow row) {
    rows_.push_back(std::move(row));
    return *this;
}

std::size_t Table::columnCount() const {
    std::size_t columns = 0;
    for (auto const& row : rows_) {
        columns = std::max(columns, row.cellCount());
    }
    return columns;
}

TableCell* Table::cellAt(std::size_t row, std::size_t column) noexcept {
    if (row >= rows_.size()) return nullptr;
    auto& cells = rows_[row].cells();
    if (column >= cells.size()) return nullptr;
    return &cells[column];
}

TableCell const* Table::cellAt(std::size_t row, std::size_t column) const noexcept {
    if (row >= rows_.size()) return nullptr;
    auto const& cells = rows_[row].cells();
    if (column >= cells.size()) return nullptr;
    return &cells[column];
}

// --- Document ---

Document::Document(Document const& other)
    : body_(cloneBlocks(other.body_)),
      styles_(other.styles_) {}

Document& Document::operator=(Document const& other) {
    if (this != &other) {
        body_ = cloneBlocks(other.body_);
        styles_ = other.styles_;
    }
    return *this;
}

Element* Document::bodyElementAt(std::size_t index) {
    return body_.at(index).get();
}

Element const* Document::bodyElementAt(std::size_t index) const {
    return body_.at(index).get();
}

void Document::insertBodyElementAt(std::size_t index, std::unique_ptr<Element> element) {
    if (index > body_.size()) {
        throw std::out_of_range("Document::insertBodyElementAt: index " + std::to_string(index));
    }
    body_.insert(body_.begin() + static_cast<std::ptrdiff_t>(index), std::move(element));
}

void Document::removeBodyElementAt(std::size_t index) {
    if (index >= body_.size()) {
        throw std::out_of_range("Document::removeBodyElementAt: index " + std::to_string(index));
    }
    body_.erase(body_.begin() + static_cast<std::ptrdiff_t>(index));
}

Paragraph& Document::addParagraph(Paragraph paragraph) {
    body_.push_back(std::make_unique<Paragraph>(std::move(paragraph)));
    return *body_.back()->asParagraph();
}

Table& Document::addTable(Table table) {
    body_.push_back(std::make_unique<Table>(std::move(table)));
    return *body_.back()->asTable();
}

std::vector<Table*> Document::allTables() {
    std::vector<Table*> out;
    for (auto& element : body_) {
        if (auto* table = element->asTable()) {
            collectTables(*table, out);
        }
    }
    return out;
}

std::vector<Table const*> Document::allTables() const {
    std::vector<Table const*> out;
    for (auto* table : const_cast<Document*>(this)->allTables()) {
        out.push_back(table);
    }
    return out;
}

void Document::addStyle(StyleDefinition style) {
    std::string id = style.id;
    styles_[id] = std::move(style);
}

StyleDefinition const* Document::style(std::string const& id) const {
    auto it = styles_.find(id);
    return it == styles_.end() ? nullptr : &it->second;
}

// --- describe ---

namespace {

void describeParagraph(Paragraph const& p, std::string const& indent, std::ostringstream& out) {
    out << indent;
    if (isParagraphBlank(p)) {
        out << "(blank)\n";
        return;
    }
    out << 'P';
    if (!p.style().empty()) out << '[' << p.style() << ']';
    if (p.numbering()) out << " #" << p.numbering()->numId << '.' << p.numbering()->level;
    if (p.formatting().leftIndent && *p.formatting().leftIndent > 0) {
        out << " >" << *p.formatting().leftIndent;
    }
    if (firstImageIn(p)) out << " [img]";
    out << " \"" << p.text() << "\"\n";
}

void describeElement(Element const& element, std::string const& indent, std::ostringstream& out);

void describeTable(Table const& table, std::string const& indent, std::ostringstream& out) {
    out << indent << "T " << table.rowCount() << 'x' << table.columnCount() << '\n';
    auto const& rows = table.rows();
    for (std::size_t r = 0; r < rows.size(); ++r) {
        auto const& cells = rows[r].cells();
        for (std::size_t c = 0; c < cells.size(); ++c) {
            out << indent << "  cell " << r << ',' << c << '\n';
            for (auto const& block : cells[c].blocks()) {
                describeElement(*block, indent + "    ", out);
            }
        }
    }
}

void describeElement(Element const& element, std::string const& indent, std::ostringstream& out) {
    if (auto const* p = element.asParagraph()) {
        describeParagraph(*p, indent, out);
    } else if (auto const* t = element.asTable()) {
        describeTable(*t, indent, out);
    }
}

} // namespace

std::string describe(Document const& document) {
    std::ostringstream out;
    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        describeElement(*document.bodyElementAt(i), "", out);
    }
    return out.str();
}

} // namespace blankline_cpp
