/// @file blank_line_rules.h
/// @brief The built-in removal and addition rule lists
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_BLANK_LINE_RULES_H
#define BLANKLINE_CPP_BLANK_LINE_RULES_H

#include "rules.h"

#include <cstddef>
#include <string_view>

namespace blankline_cpp {

namespace rule_ids {

// Removal
inline constexpr std::string_view kRemoveAboveHeading1 = "remove-above-heading1";
inline constexpr std::string_view kRemoveFirstLineMultiRowCell = "remove-first-line-multi-row-cell";
inline constexpr std::string_view kRemoveAboveLargeTable = "remove-above-large-table";
inline constexpr std::string_view kRemoveBetweenListItems = "remove-between-list-items";
inline constexpr std::string_view kRemoveListToIndented = "remove-list-to-indented";
inline constexpr std::string_view kRemoveBeforeFirstListItem = "remove-before-first-list-item";
inline constexpr std::string_view kRemoveBoldColonToIndented = "remove-bold-colon-to-indented";
inline constexpr std::string_view kRemoveAfterTopOfDocHyperlink = "remove-after-top-of-doc-hyperlink";
inline constexpr std::string_view kRemoveLastLineInCell = "remove-last-line-in-cell";
inline constexpr std::string_view kRemoveLargeImageLastInCell = "remove-large-image-last-in-cell";

// Addition
inline constexpr std::string_view kAddAfterHeading1 = "add-after-heading1";
inline constexpr std::string_view kAddAfterToc = "add-after-toc";
inline constexpr std::string_view kAddBeforeFirst1x1Table = "add-before-first-1x1-table";
inline constexpr std::string_view kAddAfter1x1Tables = "add-after-1x1-tables";
inline constexpr std::string_view kAddAfterLargeTables = "add-after-large-tables";
inline constexpr std::string_view kAddAboveBoldColonNoIndent = "add-above-bold-colon-no-indent";
inline constexpr std::string_view kAddAfterBoldColonNoIndent = "add-after-bold-colon-no-indent";
inline constexpr std::string_view kAddAboveTopOfDocHyperlink = "add-above-top-of-doc-hyperlink";
inline constexpr std::string_view kAddAfterListItems = "add-after-list-items";
inline constexpr std::string_view kAddAroundLargeImages = "add-around-large-images";
inline constexpr std::string_view kAddAboveWarning = "add-above-warning";

} // namespace rule_ids

/// Body positions searched backwards for a "Related Document" 1x1 table.
inline constexpr std::size_t kRelatedDocumentLookback = 15;

/// @brief Removal rules in precedence order
Rules builtinRemovalRules();

/// @brief Addition rules in precedence order
Rules builtinAdditionRules();

/// @brief True for addition rules that want the blank above the next
///        element rather than below the current one
bool insertsBeforeNext(Rule const& rule);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_BLANK_LINE_RULES_H
