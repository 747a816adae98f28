/// @file snapshot.cpp
/// @brief Blank position snapshot and neighbour fingerprints
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "snapshot.h"
#include "paragraph_checks.h"
#include "text_utils.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace blankline_cpp {

namespace {

std::string paragraphHashText(Paragraph const& paragraph) {
    std::string text = paragraph.text();
    if (!text.empty()) return text;

    for (auto const& item : paragraph.content()) {
        if (item.kind != ContentKind::Revision) continue;
        std::string revisionText = item.plainText();
        if (!revisionText.empty()) return revisionText;
    }
    return "";
}

ElementHash hashParagraph(Paragraph const* paragraph) {
    if (!paragraph) return {};
    ElementHash hash;
    hash.kind = HashKind::Paragraph;
    hash.textPrefix = utf8Prefix(paragraphHashText(*paragraph), kHashTextPrefix);
    hash.style = paragraph->style();
    hash.hasNumbering = isListItem(*paragraph);
    return hash;
}

// Paragraphs on either side of a blank (or insertion slot) inside a cell.
Paragraph const* cellParagraphOrNull(TableCell const& cell, std::size_t index) {
    return index < cell.paragraphCount() ? cell.paragraphAt(index) : nullptr;
}

bool matchesAny(std::vector<BodyBlankPosition> const& blanks,
                ElementHash const& before, ElementHash const& after) {
    return std::any_of(blanks.begin(), blanks.end(), [&](BodyBlankPosition const& b) {
        return hashesMatch(b.beforeHash, before) && hashesMatch(b.afterHash, after);
    });
}

} // namespace

ElementHash hashElement(Element const* element) {
    if (!element) return {};
    if (auto const* paragraph = element->asParagraph()) {
        return hashParagraph(paragraph);
    }
    ElementHash hash;
    hash.kind = HashKind::Table;
    hash.textPrefix = utf8Prefix(firstCellText(*element->asTable()), kHashTextPrefix);
    return hash;
}

bool hashesMatch(ElementHash const& a, ElementHash const& b) {
    if (a.kind != b.kind) return false;
    if (a.kind == HashKind::None) return true;
    return a.textPrefix == b.textPrefix && a.hasNumbering == b.hasNumbering;
}

std::string makeCellId(std::size_t tableIndex, std::size_t rowIndex,
                       std::size_t columnIndex, std::string const& firstCellText) {
    return "t" + std::to_string(tableIndex)
        + "_r" + std::to_string(rowIndex)
        + "_c" + std::to_string(columnIndex)
        + "_" + utf8Prefix(firstCellText, kCellIdTextPrefix);
}

BlankLineSnapshot captureBlankLineSnapshot(Document const& document) {
    BlankLineSnapshot snapshot;

    std::size_t count = document.bodyElementCount();
    for (std::size_t i = 0; i < count; ++i) {
        if (!isBlankParagraph(document.bodyElementAt(i))) continue;
        Element const* prev = i > 0 ? document.bodyElementAt(i - 1) : nullptr;
        Element const* next = i + 1 < count ? document.bodyElementAt(i + 1) : nullptr;
        snapshot.bodyBlanks.push_back({hashElement(prev), hashElement(next)});
    }

    auto tables = document.allTables();
    for (std::size_t ti = 0; ti < tables.size(); ++ti) {
        Table const& table = *tables[ti];
        std::string tableText = firstCellText(table);
        snapshot.tableKeys.push_back(tableText);

        auto const& rows = table.rows();
        for (std::size_t ri = 0; ri < rows.size(); ++ri) {
            auto const& cells = rows[ri].cells();
            for (std::size_t ci = 0; ci < cells.size(); ++ci) {
                TableCell const& cell = cells[ci];
                std::string cellId = makeCellId(ti, ri, ci, tableText);
                std::size_t paragraphs = cell.paragraphCount();

                for (std::size_t pi = 0; pi < paragraphs; ++pi) {
                    if (!isParagraphBlank(*cell.paragraphAt(pi))) continue;
                    CellBlankPosition position;
                    position.cellId = cellId;
                    position.paraIndexInCell = pi;
                    position.beforeHash = hashParagraph(pi > 0 ? cell.paragraphAt(pi - 1) : nullptr);
                    position.afterHash = hashParagraph(cellParagraphOrNull(cell, pi + 1));
                    snapshot.cellBlanks.push_back(std::move(position));
                }
            }
        }
    }
    return snapshot;
}

bool wasOriginallyBlankAtBody(BlankLineSnapshot const& snapshot,
                              Document const& document, std::size_t index) {
    std::size_t count = document.bodyElementCount();
    Element const* prev = index > 0 && index - 1 < count ? document.bodyElementAt(index - 1) : nullptr;

    Element const* next = nullptr;
    if (index < count) {
        bool occupiedByBlank = isBlankParagraph(document.bodyElementAt(index));
        std::size_t nextIndex = occupiedByBlank ? index + 1 : index;
        next = nextIndex < count ? document.bodyElementAt(nextIndex) : nullptr;
    }
    return matchesAny(snapshot.bodyBlanks, hashElement(prev), hashElement(next));
}

bool wasOriginallyBlankInCell(BlankLineSnapshot const& snapshot,
                              TableCell const& cell, std::size_t paraIndex,
                              std::string const& cellId) {
    Paragraph const* prev = paraIndex > 0 ? cellParagraphOrNull(cell, paraIndex - 1) : nullptr;

    Paragraph const* current = cellParagraphOrNull(cell, paraIndex);
    bool occupiedByBlank = current && isParagraphBlank(*current);
    Paragraph const* next = cellParagraphOrNull(cell, occupiedByBlank ? paraIndex + 1 : paraIndex);

    ElementHash before = hashParagraph(prev);
    ElementHash after = hashParagraph(next);
    return std::any_of(snapshot.cellBlanks.begin(), snapshot.cellBlanks.end(),
        [&](CellBlankPosition const& b) {
            return b.cellId == cellId
                && hashesMatch(b.beforeHash, before)
                && hashesMatch(b.afterHash, after);
        });
}

} // namespace blankline_cpp
