/// @file paragraph_checks.h
/// @brief Read-only predicates over paragraphs, tables and cells
///
/// Every function here is total: it answers for any well-formed node and
/// never throws or mutates. Most take a paragraph alone; the indentation
/// helper also needs the document to resolve style-inherited indentation.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_PARAGRAPH_CHECKS_H
#define BLANKLINE_CPP_PARAGRAPH_CHECKS_H

#include "document.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace blankline_cpp {

/// Characters of paragraph text searched for the colon of a bold label.
inline constexpr std::size_t kBoldColonWindow = 55;

/// Paragraph style that Word defines with a 720 twip left indent.
inline constexpr std::string_view kListParagraphStyle = "ListParagraph";

/// Indent assumed for kListParagraphStyle when the style table records an
/// indentation element but no resolvable value.
inline constexpr int kListParagraphFallbackIndent = 720;

/// @defgroup paragraph_predicates Paragraph Predicates
/// @{

/// @brief Check if a paragraph carries no visible content
///
/// Hyperlinks, images, shapes, text boxes and fields always count as
/// content, as do bookmarks. Runs count when their text is not all
/// whitespace. Revisions count when their text is not blank or when they
/// wrap a hyperlink.
///
/// @param[in] paragraph The paragraph to inspect
/// @retval true if the paragraph is blank
/// @retval false otherwise
bool isParagraphBlank(Paragraph const& paragraph);

/// @brief Check if a paragraph opens with a bold label such as "Note:"
///
/// The first run must be bold and a colon must appear within the first
/// kBoldColonWindow characters of the paragraph text.
bool startsWithBoldColon(Paragraph const& paragraph);

/// @brief Check if a paragraph is centered and every non-empty run is bold
bool isCenteredBoldText(Paragraph const& paragraph);

/// @brief Check if a paragraph holds text but no images, shapes or text boxes
bool isTextOnlyParagraph(Paragraph const& paragraph);

/// @brief Check if a paragraph is a table-of-contents entry (style "TOC1", "toc 2", ...)
bool isTocParagraph(Paragraph const& paragraph);

/// @brief Check if the paragraph has the "Heading1" style and non-blank text
bool isHeading1(Paragraph const& paragraph);

/// @brief Check if the paragraph belongs to a numbered or bulleted list
bool isListItem(Paragraph const& paragraph);

/// @brief Direct left indentation in twips, 0 when unset
int directLeftIndent(Paragraph const& paragraph);

/// @brief True when the paragraph's direct left indentation is positive
bool hasDirectIndent(Paragraph const& paragraph);

/// @brief Left indentation including the style-inherited value
///
/// Direct indentation wins when positive; otherwise the paragraph style's
/// indentation is used. The ListParagraph style resolves to
/// kListParagraphFallbackIndent when the style records indentation without
/// a value.
///
/// @param[in] paragraph The paragraph to inspect
/// @param[in] document  Owner of the style table
/// @return Indentation in twips, 0 when none applies
int effectiveLeftIndent(Paragraph const& paragraph, Document const& document);

/// @brief Check for a hyperlink whose text starts with "Top of" or "Return to"
bool hasNavigationHyperlink(Paragraph const& paragraph);

/// @brief Check for a hyperlink reading exactly "Top of Document" or
///        "Top of the Document" (case-insensitive)
bool hasTopOfDocumentHyperlink(Paragraph const& paragraph);

/// @brief Check if the paragraph is the end-of-document reproduction disclaimer
bool isDisclaimerParagraph(Paragraph const& paragraph);

/// @} // end of paragraph_predicates

/// @defgroup element_predicates Element Predicates
/// @brief Null-tolerant wrappers used by the rule contexts
/// @{

/// True when @p element is a blank paragraph (false for null or tables).
bool isBlankParagraph(Element const* element);

/// True when @p element is a list paragraph.
bool isListParagraph(Element const* element);

/// @brief Check if the table has a cell containing a nested table
bool tableHasNestedContent(Table const& table);

/// @brief Text of a table's first cell, paragraphs joined with a space
/// @return Empty string for a table without cells
std::string firstCellText(Table const& table);

/// @brief Check if a non-list body paragraph sits inside one list
///
/// True when the nearest list items before and after @p index share a
/// numId. Tables end the search in either direction.
bool isWithinListContext(Document const& document, std::size_t index);

/// @brief Cell counterpart of isWithinListContext() over cell paragraphs
bool isWithinListContextInCell(TableCell const& cell, std::size_t paraIndex);

/// @} // end of element_predicates

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_PARAGRAPH_CHECKS_H
