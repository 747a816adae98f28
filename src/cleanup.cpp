/// @file cleanup.cpp
/// @brief Standalone blank-paragraph helpers
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "cleanup.h"
#include "log.h"
#include "paragraph_checks.h"

#include <cstddef>
#include <memory>
#include <stdexcept>

namespace blankline_cpp {

namespace {

InsertOutcome markExistingBlank(Paragraph& blank, BlankLineOptions const& options) {
    blank.setStyle(options.blankStyle);
    if (!options.markAsPreserved || blank.isPreserved()) return InsertOutcome::Skipped;
    blank.setPreserved(true);
    return InsertOutcome::Marked;
}

bool isNumbered(Paragraph const* paragraph) {
    return paragraph && isListItem(*paragraph);
}

bool isIndented(Paragraph const* paragraph) {
    return paragraph && hasDirectIndent(*paragraph);
}

bool blankBetweenListItems(Paragraph const* prev, Paragraph const* blank, Paragraph const* next) {
    if (!blank || !isParagraphBlank(*blank) || !isNumbered(prev)) return false;
    return isNumbered(next) || isIndented(next);
}

} // namespace

Paragraph createBlankParagraph(BlankLineOptions const& options) {
    auto const& formatting = options.normalStyleFormatting;

    Paragraph blank;
    blank.setStyle(options.blankStyle);
    blank.setSpaceAfter(formatting.spaceAfter);
    if (formatting.spaceBefore) blank.setSpaceBefore(*formatting.spaceBefore);
    if (formatting.lineSpacing) blank.setLineSpacing(*formatting.lineSpacing);
    blank.setPreserved(options.markAsPreserved);
    return blank;
}

InsertOutcome insertOrMarkBlankAfter(Document& document, std::size_t index,
                                     BlankLineOptions const& options) {
    if (index >= document.bodyElementCount()) {
        throw std::out_of_range("insertOrMarkBlankAfter: index out of range");
    }

    if (index + 1 < document.bodyElementCount()) {
        if (auto* next = document.bodyElementAt(index + 1)->asParagraph(); next && isParagraphBlank(*next)) {
            return markExistingBlank(*next, options);
        }
    }

    document.insertBodyElementAt(index + 1, std::make_unique<Paragraph>(createBlankParagraph(options)));
    return InsertOutcome::Added;
}

InsertOutcome insertOrMarkBlankBefore(Document& document, std::size_t index,
                                      BlankLineOptions const& options) {
    if (index >= document.bodyElementCount()) {
        throw std::out_of_range("insertOrMarkBlankBefore: index out of range");
    }
    if (index == 0) return InsertOutcome::Skipped;

    if (auto* prev = document.bodyElementAt(index - 1)->asParagraph(); prev && isParagraphBlank(*prev)) {
        return markExistingBlank(*prev, options);
    }

    document.insertBodyElementAt(index, std::make_unique<Paragraph>(createBlankParagraph(options)));
    return InsertOutcome::Added;
}

std::size_t removeBlanksBetweenListItems(Document& document) {
    std::size_t removed = 0;

    for (Table* table : document.allTables()) {
        if (tableHasNestedContent(*table)) continue;
        for (auto& row : table->rows()) {
            for (auto& cell : row.cells()) {
                if (cell.paragraphCount() < 3) continue;
                for (std::size_t i = cell.paragraphCount() - 1; i-- > 1;) {
                    if (blankBetweenListItems(cell.paragraphAt(i - 1), cell.paragraphAt(i),
                                              cell.paragraphAt(i + 1))) {
                        cell.removeParagraphAt(i);
                        ++removed;
                    }
                }
            }
        }
    }

    for (std::size_t i = document.bodyElementCount() > 0 ? document.bodyElementCount() - 1 : 0; i-- > 1;) {
        Paragraph const* prev = document.bodyElementAt(i - 1)->asParagraph();
        Paragraph const* next = document.bodyElementAt(i + 1)->asParagraph();
        if (!prev || !next) continue;   // tables end a list
        if (blankBetweenListItems(prev, document.bodyElementAt(i)->asParagraph(), next)) {
            document.removeBodyElementAt(i);
            ++removed;
        }
    }

    if (removed > 0) {
        logger("BlankLineCleanup")->info("Removed {} blank paragraphs between list items", removed);
    }
    return removed;
}

std::size_t removeTrailingBlanksInTableCells(Document& document, bool ignorePreserveFlag) {
    std::size_t removed = 0;

    for (Table* table : document.allTables()) {
        // Cells around a nested table keep their paragraph structure.
        if (tableHasNestedContent(*table)) continue;
        for (auto& row : table->rows()) {
            for (auto& cell : row.cells()) {
                while (cell.paragraphCount() > 1) {
                    Paragraph const* last = cell.paragraphAt(cell.paragraphCount() - 1);
                    if (!isParagraphBlank(*last)) break;
                    if (!ignorePreserveFlag && last->isPreserved()) break;
                    cell.removeParagraphAt(cell.paragraphCount() - 1);
                    ++removed;
                }
            }
        }
    }

    if (removed > 0) {
        logger("BlankLineCleanup")->info("Removed {} trailing blank paragraphs from table cells", removed);
    }
    return removed;
}

} // namespace blankline_cpp
