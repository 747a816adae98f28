/// @file cleanup.h
/// @brief Standalone blank-paragraph helpers
///
/// These operations sit outside the rule engine. Host pipelines call them
/// directly, and the engine uses createBlankParagraph() for every blank it
/// inserts.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_CLEANUP_H
#define BLANKLINE_CPP_CLEANUP_H

#include "blank_lines.h"
#include "document.h"

#include <cstddef>

namespace blankline_cpp {

/// @enum InsertOutcome
enum class InsertOutcome {
    Added,     ///< A new blank paragraph was inserted
    Marked,    ///< An existing blank was restyled and marked preserved
    Skipped    ///< Nothing to do
};

/// @brief A blank paragraph carrying the configured style and spacing
Paragraph createBlankParagraph(BlankLineOptions const& options);

/// @brief Make sure a blank follows body element @p index
///
/// An existing blank after it is restyled instead, and marked preserved
/// when BlankLineOptions::markAsPreserved is set.
/// @throws std::out_of_range when index >= bodyElementCount()
InsertOutcome insertOrMarkBlankAfter(Document& document, std::size_t index,
                                     BlankLineOptions const& options);

/// @brief Make sure a blank precedes body element @p index
///
/// Returns InsertOutcome::Skipped at the top of the document.
/// @throws std::out_of_range when index >= bodyElementCount()
InsertOutcome insertOrMarkBlankBefore(Document& document, std::size_t index,
                                      BlankLineOptions const& options);

/// @brief Remove blanks sitting between list items
///
/// A blank goes when both neighbours are numbered, or when the one above
/// is numbered and the one below has direct left indentation. Cells of
/// tables with nested tables are left alone. Preserved blanks are removed
/// as well.
///
/// @return Number of blanks removed
std::size_t removeBlanksBetweenListItems(Document& document);

/// @brief Strip blank paragraphs at the end of every table cell
///
/// A cell always keeps at least one paragraph. Cells of tables with nested
/// tables are left alone.
/// @param[in] ignorePreserveFlag When false, a preserved trailing blank
///            stops the stripping of its cell
/// @return Number of blanks removed
std::size_t removeTrailingBlanksInTableCells(Document& document, bool ignorePreserveFlag = true);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_CLEANUP_H
