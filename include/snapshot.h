/// @file snapshot.h
/// @brief Pre-mutation record of blank paragraph positions
///
/// The engine inserts and removes paragraphs while it walks the tree, so a
/// blank's original index means nothing once the first phase has run.
/// Instead, each blank is remembered by fingerprints of its two neighbours
/// and later re-located by comparing fingerprints of the neighbours around
/// a candidate position.
///
/// Matching is deliberately approximate: two blanks with identical
/// neighbour fingerprints are indistinguishable.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_SNAPSHOT_H
#define BLANKLINE_CPP_SNAPSHOT_H

#include "document.h"

#include <cstddef>
#include <string>
#include <vector>

namespace blankline_cpp {

/// Characters of element text kept in a fingerprint.
inline constexpr std::size_t kHashTextPrefix = 50;

/// Characters of a table's first-cell text kept in a cell id.
inline constexpr std::size_t kCellIdTextPrefix = 20;

/// @enum HashKind
enum class HashKind {
    None,
    Paragraph,
    Table
};

/// @struct ElementHash
/// @brief Fingerprint of a paragraph or table
///
/// @ref style is recorded but not compared by hashesMatch().
struct ElementHash {
    HashKind kind = HashKind::None;
    std::string textPrefix;
    std::string style;
    bool hasNumbering = false;
};

struct BodyBlankPosition {
    ElementHash beforeHash;
    ElementHash afterHash;
};

struct CellBlankPosition {
    std::string cellId;
    std::size_t paraIndexInCell = 0;
    ElementHash beforeHash;
    ElementHash afterHash;
};

/// @struct BlankLineSnapshot
/// @brief Blank positions of the unmodified document
struct BlankLineSnapshot {
    std::vector<BodyBlankPosition> bodyBlanks;
    std::vector<CellBlankPosition> cellBlanks;
    /// First-cell text of every table, in Document::allTables() order
    std::vector<std::string> tableKeys;
};

/// @brief Fingerprint an element; null yields HashKind::None
///
/// Paragraph text falls back to revision text when the direct text is
/// empty. Tables use their first cell's text.
ElementHash hashElement(Element const* element);

/// @brief Compare two fingerprints on kind, text prefix and numbering
bool hashesMatch(ElementHash const& a, ElementHash const& b);

/// @brief Stable identifier of a cell: `t{table}_r{row}_c{col}_{text}`
///
/// @param[in] tableIndex     Position of the table in Document::allTables()
/// @param[in] firstCellText  Text of the table's first cell (truncated here)
std::string makeCellId(std::size_t tableIndex, std::size_t rowIndex,
                       std::size_t columnIndex, std::string const& firstCellText);

/// @brief Record every blank paragraph of the body and of every cell
///
/// Must run before any phase mutates the document.
BlankLineSnapshot captureBlankLineSnapshot(Document const& document);

/// @brief Check whether the body originally had a blank at @p index
///
/// When the element at @p index is itself a blank paragraph its two
/// neighbours are compared. Otherwise @p index is treated as an insertion
/// slot, and the elements at index - 1 and index are compared.
bool wasOriginallyBlankAtBody(BlankLineSnapshot const& snapshot,
                              Document const& document, std::size_t index);

/// @brief Cell counterpart of wasOriginallyBlankAtBody(), keyed by @p cellId
bool wasOriginallyBlankInCell(BlankLineSnapshot const& snapshot,
                              TableCell const& cell, std::size_t paraIndex,
                              std::string const& cellId);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_SNAPSHOT_H
